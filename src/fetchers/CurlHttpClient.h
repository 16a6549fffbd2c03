#pragma once
#include "HttpClient.h"
#include <cstddef>
#include <string>

namespace daily_dash {

// libcurl easy-handle client. One handle per request, so a single instance is
// safe to share between fetch threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent, std::size_t max_body_bytes = 8 * 1024 * 1024);

    Result<HttpResponse> get(const HttpRequest& request, const CancellationToken& cancel) override;

private:
    std::string user_agent_;
    std::size_t max_body_bytes_;
};

}
