#include "ConfigValidator.h"
#include "Utils.h"
#include "../scanners/Cidr.h"
#include <algorithm>
#include <set>

namespace daily_dash {

bool ConfigValidator::is_http_url(const std::string& url){
    auto scheme_end = url.find("://");
    if(scheme_end == std::string::npos) return false;
    std::string scheme = utils::to_lower(url.substr(0, scheme_end));
    if(scheme != "http" && scheme != "https") return false;
    std::string rest = url.substr(scheme_end + 3);
    auto host_end = rest.find_first_of("/?#");
    std::string host = rest.substr(0, host_end);
    auto at = host.rfind('@');
    if(at != std::string::npos) host = host.substr(at + 1);
    return !host.empty() && host[0] != ':';
}

bool ConfigValidator::balanced_brackets(const std::string& path){
    int depth = 0;
    for(char c : path){
        if(c == '[') ++depth;
        else if(c == ']'){ if(--depth < 0) return false; }
    }
    return depth == 0;
}

bool ConfigValidator::validate(Config& cfg){
    errors_.clear();

    std::set<std::string> feed_names;
    for(size_t i = 0; i < cfg.feeds.size(); ++i){
        auto& f = cfg.feeds[i];
        std::string ctx = "feeds[" + std::to_string(i) + "]";
        f.name = utils::trim(f.name);
        if(f.name.empty()) fail(ctx + ": name must not be empty");
        else if(!feed_names.insert(f.name).second) fail(ctx + ": duplicate feed name '" + f.name + "'");
        if(!is_http_url(f.url)) fail(ctx + ": URL must use http or https with a host, got '" + f.url + "'");
        if(f.json_path){
            if(!balanced_brackets(*f.json_path)) fail(ctx + ": invalid json_path (unbalanced brackets): " + *f.json_path);
        }
        if(f.kind == FeedKind::Rss && f.json_path){
            // ignored for RSS feeds
            f.json_path.reset();
        }
    }

    for(size_t i = 0; i < cfg.network.targets.size(); ++i){
        const auto& t = cfg.network.targets[i];
        std::string ctx = "network.targets[" + std::to_string(i) + "]";
        if(utils::trim(t.name).empty()) fail(ctx + ": name must not be empty");
        std::string err;
        auto net = parse_cidr(t.range, &err);
        if(!net) fail(ctx + ": invalid CIDR range '" + t.range + "': " + err);
        else if(net->prefix < kMinScanPrefix) fail(ctx + ": range " + t.range + " is larger than /" + std::to_string(kMinScanPrefix));
    }
    if(cfg.network.dns_timeout.count() <= 0) fail("network.dns_timeout_seconds must be positive");
    if(cfg.network.arp_timeout.count() <= 0) fail("network.arp_timeout_seconds must be positive");
    if(cfg.network.scan_interval.count() <= 0) fail("network.scan_interval_minutes must be positive");

    if(cfg.weather.latitude < -90.0 || cfg.weather.latitude > 90.0)
        fail("weather.latitude must be between -90 and 90, got " + std::to_string(cfg.weather.latitude));
    if(cfg.weather.longitude < -180.0 || cfg.weather.longitude > 180.0)
        fail("weather.longitude must be between -180 and 180, got " + std::to_string(cfg.weather.longitude));
    if(cfg.weather.enabled && !is_http_url(cfg.weather.url))
        fail("weather.url must use http or https with a host");

    std::string lvl = cfg.settings.log_level;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    if(std::find(allowed_log_levels_.begin(), allowed_log_levels_.end(), lvl) == allowed_log_levels_.end())
        fail("settings.log_level must be one of DEBUG, INFO, WARNING, ERROR, got '" + cfg.settings.log_level + "'");
    else cfg.settings.log_level = lvl;
    if(cfg.settings.refresh_interval.count() <= 0) fail("settings.refresh_interval_minutes must be positive");
    if(cfg.settings.cache_ttl.count() <= 0) fail("settings.cache_ttl_minutes must be positive");
    if(cfg.settings.max_concurrent_fetches < 1) fail("settings.max_concurrent_fetches must be at least 1");
    if(cfg.settings.http_timeout.count() <= 0) fail("settings.http_timeout_seconds must be positive");
    if(cfg.settings.shutdown_grace.count() < 0) fail("settings.shutdown_grace_seconds must not be negative");
    const auto& r = cfg.settings.retry;
    if(r.max_retries < 0) fail("settings.retry.max_retries must not be negative");
    if(r.multiplier < 1.0) fail("settings.retry.multiplier must be >= 1");
    if(r.initial_backoff.count() < 0 || r.max_backoff < r.initial_backoff) fail("settings.retry backoff bounds are inconsistent");

    if(cfg.cache_dir.empty()) fail("paths.cache_dir must not be empty");
    if(cfg.known_hosts_file.empty()) fail("paths.known_hosts_file must not be empty");

    return errors_.empty();
}

}
