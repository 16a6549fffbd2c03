#include "HttpClient.h"

namespace daily_dash {

std::optional<Error> status_error(int status, const std::string& url){
    if(status >= 200 && status < 400) return std::nullopt;
    if(status == 429) return make_error(ErrorKind::RateLimited, "rate limited by " + url, status);
    return make_error(ErrorKind::HttpError, "HTTP " + std::to_string(status) + " from " + url, status);
}

}
