#include "FeedParser.h"
#include "../core/JsonUtil.h"
#include "../core/Utils.h"
#include <cmath>
#include <cstring>
#include <initializer_list>
#include <pugixml.hpp>

using nlohmann::json;

namespace daily_dash {
namespace feed_parser {

namespace {

// Element name without namespace prefix ("atom:link" -> "link").
const char* local_name(const pugi::xml_node& n){
    const char* name = n.name();
    const char* colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

pugi::xml_node child_local(const pugi::xml_node& parent, const char* name){
    for(pugi::xml_node c : parent.children())
        if(c.type() == pugi::node_element && std::strcmp(local_name(c), name) == 0) return c;
    return pugi::xml_node();
}

std::string collapse_ws(const std::string& s){
    std::string out;
    out.reserve(s.size());
    bool space = false;
    for(char ch : s){
        if(ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t'){
            space = true;
            continue;
        }
        if(space && !out.empty()) out.push_back(' ');
        space = false;
        out.push_back(ch);
    }
    return out;
}

std::string node_text(const pugi::xml_node& n){
    if(!n) return {};
    return collapse_ws(n.text().get());
}

std::string atom_link(const pugi::xml_node& entry){
    std::string fallback;
    for(pugi::xml_node c : entry.children()){
        if(c.type() != pugi::node_element || std::strcmp(local_name(c), "link") != 0) continue;
        std::string href = c.attribute("href").value();
        if(href.empty()) href = utils::trim(c.text().get());
        std::string rel = c.attribute("rel").value();
        if(rel.empty() || rel == "alternate") return href;
        if(fallback.empty()) fallback = href;
    }
    return fallback;
}

std::optional<jsonutil::TimePoint> first_date(const pugi::xml_node& item, std::initializer_list<const char*> names){
    for(const char* n : names){
        std::string raw = node_text(child_local(item, n));
        if(raw.empty()) continue;
        if(auto tp = jsonutil::parse_any_date(raw)) return tp;
    }
    return std::nullopt;
}

void add_item(std::vector<FeedItem>& out, FeedItem item){
    if(item.title.empty()) return;
    out.push_back(std::move(item));
}

void parse_rss_items(const pugi::xml_node& container, const std::string& source_name, std::vector<FeedItem>& out){
    for(pugi::xml_node n : container.children()){
        if(n.type() != pugi::node_element || std::strcmp(local_name(n), "item") != 0) continue;
        FeedItem item;
        item.title = node_text(child_local(n, "title"));
        item.link = utils::trim(child_local(n, "link").text().get());
        if(item.link.empty()) item.link = utils::trim(child_local(n, "guid").text().get());
        item.summary = node_text(child_local(n, "description"));
        item.published_at = first_date(n, {"pubDate", "date", "published", "updated"});
        item.source_name = source_name;
        add_item(out, std::move(item));
    }
}

std::string json_string(const json& obj, std::initializer_list<const char*> keys){
    for(const char* k : keys){
        auto it = obj.find(k);
        if(it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
            return it->get<std::string>();
    }
    return {};
}

// 2^33 s (year 2242) keeps the nanosecond system_clock from overflowing.
constexpr double kMaxEpochSeconds = 8589934592.0;

std::optional<jsonutil::TimePoint> json_date(const json& obj){
    for(const char* k : {"published", "date", "created_at", "pubDate"}){
        auto it = obj.find(k);
        if(it == obj.end() || !it->is_string()) continue;
        if(auto tp = jsonutil::parse_any_date(it->get<std::string>())) return tp;
    }
    for(const char* k : {"created_utc", "time"}){
        auto it = obj.find(k);
        if(it == obj.end() || !it->is_number()) continue;
        double secs = it->get<double>();
        if(!std::isfinite(secs)) continue;
        if(std::fabs(secs) > kMaxEpochSeconds) secs /= 1000.0; // epoch milliseconds
        if(std::fabs(secs) > kMaxEpochSeconds) continue;
        return jsonutil::from_epoch_ms(static_cast<int64_t>(secs * 1000.0));
    }
    return std::nullopt;
}

}

const json* resolve_path(const json& root, const std::string& path, std::string* err){
    auto fail = [err](const std::string& m) -> const json* { if(err) *err = m; return nullptr; };
    std::string p = utils::trim(path);
    if(!p.empty() && p[0] == '$') p.erase(0, 1);
    const json* cur = &root;
    size_t i = 0;
    while(i < p.size()){
        if(p[i] == '.'){ ++i; continue; }
        if(p[i] == '['){
            size_t close = p.find(']', i);
            if(close == std::string::npos) return fail("unbalanced '[' in path " + path);
            std::string idx = p.substr(i + 1, close - i - 1);
            if(idx.empty() || idx.size() > 9 || idx.find_first_not_of("0123456789") != std::string::npos)
                return fail("bad index [" + idx + "] in path " + path);
            size_t n = std::stoul(idx);
            if(!cur->is_array() || n >= cur->size())
                return fail("index [" + idx + "] not found in path " + path);
            cur = &(*cur)[n];
            i = close + 1;
            continue;
        }
        size_t end = p.find_first_of(".[", i);
        std::string key = p.substr(i, end == std::string::npos ? std::string::npos : end - i);
        if(!cur->is_object()) return fail("'" + key + "' is not reachable in path " + path);
        auto it = cur->find(key);
        if(it == cur->end()) return fail("field '" + key + "' not found for path " + path);
        cur = &*it;
        i = end == std::string::npos ? p.size() : end;
    }
    return cur;
}

Result<std::vector<FeedItem>> parse_xml(const std::string& body, const std::string& source_name){
    using R = Result<std::vector<FeedItem>>;
    pugi::xml_document doc;
    pugi::xml_parse_result pr = doc.load_buffer(body.data(), body.size());
    if(!pr) return R::failure(make_error(ErrorKind::ParseError,
        source_name + ": XML parse error: " + pr.description() + " at offset " + std::to_string(pr.offset)));

    std::vector<FeedItem> out;
    pugi::xml_node root = doc.document_element();
    std::string root_name = local_name(root);
    if(root_name == "rss"){
        pugi::xml_node channel = child_local(root, "channel");
        if(!channel) return R::failure(make_error(ErrorKind::ParseError, source_name + ": RSS document without channel"));
        parse_rss_items(channel, source_name, out);
    } else if(root_name == "RDF"){
        parse_rss_items(root, source_name, out);
    } else if(root_name == "feed"){
        for(pugi::xml_node e : root.children()){
            if(e.type() != pugi::node_element || std::strcmp(local_name(e), "entry") != 0) continue;
            FeedItem item;
            item.title = node_text(child_local(e, "title"));
            item.link = atom_link(e);
            item.summary = node_text(child_local(e, "summary"));
            item.published_at = first_date(e, {"published", "updated"});
            item.source_name = source_name;
            add_item(out, std::move(item));
        }
    } else {
        return R::failure(make_error(ErrorKind::ParseError, source_name + ": not an RSS or Atom document (root <" + root_name + ">)"));
    }
    return R::success(std::move(out));
}

Result<std::vector<FeedItem>> parse_json(const std::string& body, const std::string& json_path,
                                         const std::string& source_name){
    using R = Result<std::vector<FeedItem>>;
    json doc;
    try {
        doc = json::parse(body);
    } catch(const json::parse_error& ex){
        return R::failure(make_error(ErrorKind::ParseError, source_name + ": invalid JSON: " + ex.what()));
    }
    std::string err;
    const json* arr = resolve_path(doc, json_path, &err);
    if(!arr) return R::failure(make_error(ErrorKind::ParseError, source_name + ": " + err));
    if(!arr->is_array())
        return R::failure(make_error(ErrorKind::ParseError, source_name + ": path '" + json_path + "' is not an array"));

    std::vector<FeedItem> out;
    for(const json& raw : *arr){
        if(!raw.is_object()) continue;
        // Reddit-style listings wrap each item in {"kind":..., "data":{...}}
        const json& obj = (raw.contains("data") && raw["data"].is_object() && !raw.contains("title")) ? raw["data"] : raw;
        FeedItem item;
        item.title = collapse_ws(json_string(obj, {"title"}));
        item.link = json_string(obj, {"url", "link"});
        item.summary = collapse_ws(json_string(obj, {"summary", "description"}));
        item.published_at = json_date(obj);
        item.source_name = source_name;
        add_item(out, std::move(item));
    }
    return R::success(std::move(out));
}

Result<std::vector<FeedItem>> parse(const FeedSource& source, const std::string& body){
    if(source.kind == FeedKind::Json) return parse_json(body, source.json_path.value_or(""), source.name);
    return parse_xml(body, source.name);
}

json to_json(const std::vector<FeedItem>& items){
    json arr = json::array();
    for(const auto& it : items){
        json o = {{"title", it.title}, {"link", it.link}, {"source", it.source_name}};
        o["published_at"] = it.published_at ? json(jsonutil::time_to_iso(*it.published_at)) : json(nullptr);
        if(!it.summary.empty()) o["summary"] = it.summary;
        arr.push_back(std::move(o));
    }
    return arr;
}

std::vector<FeedItem> from_json(const json& payload){
    std::vector<FeedItem> out;
    if(!payload.is_array()) return out;
    for(const json& o : payload){
        if(!o.is_object()) continue;
        FeedItem it;
        it.title = o.value("title", std::string());
        it.link = o.value("link", std::string());
        it.source_name = o.value("source", std::string());
        it.summary = o.value("summary", std::string());
        auto p = o.find("published_at");
        if(p != o.end() && p->is_string()) it.published_at = jsonutil::parse_iso8601(p->get<std::string>());
        out.push_back(std::move(it));
    }
    return out;
}

}
}
