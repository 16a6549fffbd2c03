#include "Errors.h"

namespace daily_dash {

const char* error_kind_name(ErrorKind kind){
    switch(kind){
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ConnectionError: return "connection_error";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::HttpError: return "http_error";
        case ErrorKind::ParseError: return "parse_error";
        case ErrorKind::StorageError: return "storage_error";
        case ErrorKind::Unprivileged: return "unprivileged";
        case ErrorKind::ConfigError: return "config_error";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

std::string Error::describe() const {
    std::string out = error_kind_name(kind);
    if(status != 0) out += " (" + std::to_string(status) + ")";
    if(!message.empty()) out += ": " + message;
    return out;
}

}
