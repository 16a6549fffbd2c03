#pragma once
#include "../core/Config.h"
#include "../core/Errors.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace daily_dash {

struct FeedItem {
    std::string title;
    std::string link;
    std::optional<std::chrono::system_clock::time_point> published_at;
    std::string source_name;
    std::string summary;
};

namespace feed_parser {

// Dispatches on source.kind. Any malformed body, or a json_path that does not
// lead to an array, is a ParseError.
Result<std::vector<FeedItem>> parse(const FeedSource& source, const std::string& body);

// RSS 2.0, RSS 1.0 (RDF) and Atom.
Result<std::vector<FeedItem>> parse_xml(const std::string& body, const std::string& source_name);
Result<std::vector<FeedItem>> parse_json(const std::string& body, const std::string& json_path,
                                         const std::string& source_name);

// Dotted path with [index] segments and an optional leading "$", e.g.
// "$.data.children" or "results[0].items". nullptr if any segment is missing.
const nlohmann::json* resolve_path(const nlohmann::json& root, const std::string& path, std::string* err = nullptr);

// Cache payload form of an item list.
nlohmann::json to_json(const std::vector<FeedItem>& items);
std::vector<FeedItem> from_json(const nlohmann::json& payload);

}
}
