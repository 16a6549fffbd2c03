#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace daily_dash {

struct FeedSource;

// One cached fetch result. Entries are replaced wholesale, never edited.
struct CacheEntry {
    std::string key;
    nlohmann::json payload;
    std::chrono::system_clock::time_point fetched_at;
    std::chrono::seconds ttl{0};
};

struct CacheHit {
    nlohmann::json payload;
    std::chrono::system_clock::time_point fetched_at;
    std::chrono::milliseconds age{0};
    bool is_fresh = false;
};

// On-disk TTL cache, one JSON document per key under dir. Stale entries stay
// retrievable; only put() replaces them.
class CacheStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit CacheStore(std::string dir, Clock clock = &std::chrono::system_clock::now);

    // std::nullopt means NotFound (no entry, unreadable entry, or cache disabled).
    std::optional<CacheHit> get(const std::string& key) const;

    // Durable before returning. Throws StorageError on any write failure,
    // including a disabled cache directory.
    void put(const std::string& key, const nlohmann::json& payload, std::chrono::seconds ttl);

    void clear(const std::string& key);
    void clear_all();

    bool enabled() const { return enabled_; }
    const std::string& dir() const { return dir_; }
    std::string path_for(const std::string& key) const;

    static std::string feed_key(const FeedSource& source);
    static std::string weather_key(double latitude, double longitude);

private:
    std::optional<CacheEntry> read_entry(const std::string& key) const;

    std::string dir_;
    Clock clock_;
    bool enabled_ = true;
    mutable std::mutex mutex_;
};

}
