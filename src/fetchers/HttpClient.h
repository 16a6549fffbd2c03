#pragma once
#include "../core/Errors.h"
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace daily_dash {

class CancellationToken;

struct HttpRequest {
    std::string url;
    std::chrono::milliseconds timeout{30000};
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string content_type;
};

// Blocking GET. Implementations return success only for a complete 2xx/3xx
// response; transport failures, HTTP error statuses and cancellation come back
// as Error (Timeout, ConnectionError, RateLimited, HttpError, Cancelled).
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> get(const HttpRequest& request, const CancellationToken& cancel) = 0;
};

// Maps a final HTTP status onto the error taxonomy; nullopt for success.
std::optional<Error> status_error(int status, const std::string& url);

}
