#include "ConfigLoader.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <filesystem>
#include <cmath>

namespace fs = std::filesystem;

namespace daily_dash {

namespace {

using nlohmann::json;

template<typename T>
void read_opt(const json& obj, const char* key, T& out, const std::string& ctx){
    auto it = obj.find(key);
    if(it == obj.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch(const json::exception& ex){
        throw ConfigError(ctx + "." + key + ": " + ex.what());
    }
}

std::chrono::milliseconds seconds_to_ms(double secs){
    return std::chrono::milliseconds(static_cast<long long>(std::llround(secs * 1000.0)));
}

const json& object_at(const json& parent, const char* key, const std::string& ctx){
    static const json empty = json::object();
    auto it = parent.find(key);
    if(it == parent.end() || it->is_null()) return empty;
    if(!it->is_object()) throw ConfigError(ctx + "." + key + ": expected object");
    return *it;
}

FeedSource parse_feed(const json& f, size_t idx){
    std::string ctx = "feeds[" + std::to_string(idx) + "]";
    if(!f.is_object()) throw ConfigError(ctx + ": expected object");
    FeedSource src;
    read_opt(f, "name", src.name, ctx);
    read_opt(f, "url", src.url, ctx);
    read_opt(f, "enabled", src.enabled, ctx);
    std::string type = "rss";
    read_opt(f, "type", type, ctx);
    type = utils::to_lower(type);
    if(type == "rss") src.kind = FeedKind::Rss;
    else if(type == "json") src.kind = FeedKind::Json;
    else throw ConfigError(ctx + ".type: must be \"rss\" or \"json\", got \"" + type + "\"");
    std::string path;
    read_opt(f, "json_path", path, ctx);
    if(!path.empty()) src.json_path = path;
    return src;
}

NetworkTarget parse_target(const json& t, size_t idx){
    std::string ctx = "network.targets[" + std::to_string(idx) + "]";
    if(!t.is_object()) throw ConfigError(ctx + ": expected object");
    NetworkTarget target;
    read_opt(t, "name", target.name, ctx);
    read_opt(t, "range", target.range, ctx);
    read_opt(t, "expected_hosts", target.expected_hosts, ctx);
    return target;
}

}

Config ConfigLoader::from_json(const json& j) const {
    if(!j.is_object()) throw ConfigError("config: top level must be an object");
    Config cfg;

    auto fit = j.find("feeds");
    if(fit != j.end() && !fit->is_null()){
        if(!fit->is_array()) throw ConfigError("feeds: expected array");
        for(size_t i = 0; i < fit->size(); ++i) cfg.feeds.push_back(parse_feed((*fit)[i], i));
    }

    const json& net = object_at(j, "network", "config");
    auto tit = net.find("targets");
    if(tit != net.end() && !tit->is_null()){
        if(!tit->is_array()) throw ConfigError("network.targets: expected array");
        for(size_t i = 0; i < tit->size(); ++i) cfg.network.targets.push_back(parse_target((*tit)[i], i));
    }
    int scan_minutes = static_cast<int>(cfg.network.scan_interval.count() / 60);
    read_opt(net, "scan_interval_minutes", scan_minutes, "network");
    cfg.network.scan_interval = std::chrono::seconds(static_cast<long long>(scan_minutes) * 60);
    double dns_s = cfg.network.dns_timeout.count() / 1000.0;
    double arp_s = cfg.network.arp_timeout.count() / 1000.0;
    read_opt(net, "dns_timeout_seconds", dns_s, "network");
    read_opt(net, "arp_timeout_seconds", arp_s, "network");
    cfg.network.dns_timeout = seconds_to_ms(dns_s);
    cfg.network.arp_timeout = seconds_to_ms(arp_s);
    read_opt(net, "interface", cfg.network.interface_name, "network");
    read_opt(net, "vendor_file", cfg.network.vendor_file, "network");
    read_opt(net, "mdns", cfg.network.mdns, "network");
    read_opt(net, "info", cfg.network.info, "network");

    const json& w = object_at(j, "weather", "config");
    read_opt(w, "enabled", cfg.weather.enabled, "weather");
    read_opt(w, "location_name", cfg.weather.location_name, "weather");
    read_opt(w, "latitude", cfg.weather.latitude, "weather");
    read_opt(w, "longitude", cfg.weather.longitude, "weather");
    read_opt(w, "url", cfg.weather.url, "weather");

    const json& s = object_at(j, "settings", "config");
    read_opt(s, "user_name", cfg.settings.user_name, "settings");
    int refresh_minutes = static_cast<int>(cfg.settings.refresh_interval.count() / 60);
    int ttl_minutes = static_cast<int>(cfg.settings.cache_ttl.count() / 60);
    read_opt(s, "refresh_interval_minutes", refresh_minutes, "settings");
    read_opt(s, "cache_ttl_minutes", ttl_minutes, "settings");
    cfg.settings.refresh_interval = std::chrono::seconds(static_cast<long long>(refresh_minutes) * 60);
    cfg.settings.cache_ttl = std::chrono::seconds(static_cast<long long>(ttl_minutes) * 60);
    read_opt(s, "log_level", cfg.settings.log_level, "settings");
    read_opt(s, "max_concurrent_fetches", cfg.settings.max_concurrent_fetches, "settings");
    double http_s = cfg.settings.http_timeout.count() / 1000.0;
    read_opt(s, "http_timeout_seconds", http_s, "settings");
    cfg.settings.http_timeout = seconds_to_ms(http_s);
    read_opt(s, "serve_fresh_from_cache", cfg.settings.serve_fresh_from_cache, "settings");
    double grace_s = cfg.settings.shutdown_grace.count() / 1000.0;
    read_opt(s, "shutdown_grace_seconds", grace_s, "settings");
    cfg.settings.shutdown_grace = seconds_to_ms(grace_s);

    const json& r = object_at(s, "retry", "settings");
    read_opt(r, "max_retries", cfg.settings.retry.max_retries, "settings.retry");
    double init_s = cfg.settings.retry.initial_backoff.count() / 1000.0;
    double max_s = cfg.settings.retry.max_backoff.count() / 1000.0;
    read_opt(r, "initial_backoff_seconds", init_s, "settings.retry");
    read_opt(r, "max_backoff_seconds", max_s, "settings.retry");
    read_opt(r, "multiplier", cfg.settings.retry.multiplier, "settings.retry");
    cfg.settings.retry.initial_backoff = seconds_to_ms(init_s);
    cfg.settings.retry.max_backoff = seconds_to_ms(max_s);

    const json& paths = object_at(j, "paths", "config");
    read_opt(paths, "cache_dir", cfg.cache_dir, "paths");
    read_opt(paths, "known_hosts_file", cfg.known_hosts_file, "paths");
    read_opt(paths, "log_file", cfg.log_file, "paths");
    return cfg;
}

Config ConfigLoader::parse(const std::string& text) const {
    json j;
    try {
        j = json::parse(text);
    } catch(const json::parse_error& ex){
        throw ConfigError(std::string("invalid JSON: ") + ex.what());
    }
    return from_json(j);
}

Config ConfigLoader::load(const std::string& path) const {
    std::error_code ec;
    if(!fs::exists(path, ec)){
        Logger::instance().info("Config file not found: " + path + ", using defaults");
        return Config{};
    }
    auto text = utils::read_file(path);
    if(!text) throw ConfigError("cannot read config file " + path);
    return parse(*text);
}

}
