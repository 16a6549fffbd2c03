#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace daily_dash {

enum class FeedKind { Rss, Json };

const char* feed_kind_name(FeedKind k);

struct FeedSource {
    std::string name;
    std::string url;
    FeedKind kind = FeedKind::Rss;
    bool enabled = true;
    std::optional<std::string> json_path; // JSON feeds only
};

struct NetworkTarget {
    std::string name;
    std::string range; // CIDR, e.g. 192.168.1.0/24
    std::vector<std::string> expected_hosts; // MAC, IP or hostname
};

struct NetworkConfig {
    std::vector<NetworkTarget> targets;
    std::chrono::seconds scan_interval{15 * 60};
    std::chrono::milliseconds dns_timeout{1000};
    std::chrono::milliseconds arp_timeout{3000};
    std::string interface_name; // empty = pick the interface whose subnet holds the target
    std::string vendor_file;    // optional OUI table
    bool mdns = true;
    bool info = true;           // local/gateway/DNS/public address summary
};

struct WeatherConfig {
    bool enabled = true;
    std::string location_name = "Berlin";
    double latitude = 52.52;
    double longitude = 13.41;
    std::string url = "https://api.open-meteo.com/v1/forecast?latitude={lat}&longitude={lon}"
                      "&current=temperature_2m,wind_speed_10m"
                      "&daily=temperature_2m_min,temperature_2m_max,precipitation_sum,precipitation_probability_max"
                      "&forecast_days=5&timezone=auto";
};

struct RetryConfig {
    int max_retries = 3;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{10000};
    double multiplier = 2.0;
};

struct Settings {
    std::string user_name;
    std::chrono::seconds refresh_interval{15 * 60};
    std::chrono::seconds cache_ttl{5 * 60};
    std::string log_level = "INFO";
    int max_concurrent_fetches = 3;
    std::chrono::milliseconds http_timeout{30000};
    bool serve_fresh_from_cache = true;
    std::chrono::milliseconds shutdown_grace{5000};
    RetryConfig retry;
};

// Validated configuration handed to the core. Only ConfigLoader builds it from
// disk; ConfigValidator must accept it before anything else sees it.
struct Config {
    std::vector<FeedSource> feeds;
    NetworkConfig network;
    WeatherConfig weather;
    Settings settings;
    std::string cache_dir = ".cache";
    std::string known_hosts_file = "known_hosts.json";
    std::string log_file;
};

}
