#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace daily_dash {

class ConfigValidator {
public:
    // Normalizes cfg in place and collects every problem found. Returns true
    // when nothing was wrong.
    bool validate(Config& cfg);
    const std::vector<std::string>& errors() const { return errors_; }

    static bool is_http_url(const std::string& url);
    static bool balanced_brackets(const std::string& path);

private:
    void fail(const std::string& msg) { errors_.push_back(msg); }
    std::vector<std::string> errors_;
    const std::vector<std::string> allowed_log_levels_ = {"DEBUG", "INFO", "WARNING", "ERROR"};
};

}
