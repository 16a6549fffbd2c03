#pragma once
#include "Config.h"
#include <string>
#include <nlohmann/json.hpp>

namespace daily_dash {

class ConfigLoader {
public:
    // Missing file -> default Config. Malformed JSON or wrongly typed fields
    // throw ConfigError naming the offending key.
    Config load(const std::string& path) const;
    Config from_json(const nlohmann::json& j) const;
    Config parse(const std::string& text) const;
};

}
