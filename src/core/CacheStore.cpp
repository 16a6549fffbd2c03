#include "CacheStore.h"
#include "Config.h"
#include "Errors.h"
#include "JsonUtil.h"
#include "Logging.h"
#include "Utils.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;
using nlohmann::json;

namespace daily_dash {

CacheStore::CacheStore(std::string dir, Clock clock)
    : dir_(std::move(dir)), clock_(std::move(clock)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    fs::path probe = fs::path(dir_) / ".write_test";
    std::ofstream out(probe);
    if(ec || !out){
        Logger::instance().warn("Cache disabled - cannot write to " + dir_ + (ec ? ": " + ec.message() : std::string()));
        enabled_ = false;
        return;
    }
    out.close();
    fs::remove(probe, ec);
}

std::string CacheStore::feed_key(const FeedSource& source){
    return "feed:" + source.url;
}

std::string CacheStore::weather_key(double latitude, double longitude){
    char buf[64];
    std::snprintf(buf, sizeof(buf), "weather:%.4f,%.4f", latitude, longitude);
    return buf;
}

std::string CacheStore::path_for(const std::string& key) const {
    return (fs::path(dir_) / (utils::sha256_hex(key) + ".json")).string();
}

std::optional<CacheEntry> CacheStore::read_entry(const std::string& key) const {
    auto path = path_for(key);
    auto text = utils::read_file(path);
    if(!text) return std::nullopt;
    try {
        json doc = json::parse(*text);
        if(doc.value("key", std::string()) != key){
            Logger::instance().warn("Cache entry " + path + " belongs to another key, ignoring");
            return std::nullopt;
        }
        CacheEntry e;
        e.key = key;
        e.payload = doc.at("payload");
        e.fetched_at = jsonutil::from_epoch_ms(doc.at("fetched_at_ms").get<int64_t>());
        e.ttl = std::chrono::seconds(doc.at("ttl_seconds").get<int64_t>());
        return e;
    } catch(const json::exception& ex){
        Logger::instance().warn("Failed to read cache for " + key + ": " + ex.what());
        return std::nullopt;
    }
}

std::optional<CacheHit> CacheStore::get(const std::string& key) const {
    if(!enabled_) return std::nullopt;
    std::optional<CacheEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = read_entry(key);
    }
    if(!entry) return std::nullopt;
    auto now = clock_();
    CacheHit hit;
    hit.payload = std::move(entry->payload);
    hit.fetched_at = entry->fetched_at;
    hit.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry->fetched_at);
    hit.is_fresh = (now - entry->fetched_at) < entry->ttl;
    if(!hit.is_fresh) Logger::instance().debug("Cache expired for " + key);
    return hit;
}

void CacheStore::put(const std::string& key, const json& payload, std::chrono::seconds ttl){
    if(!enabled_) throw StorageError("cache disabled (" + dir_ + " not writable)");
    auto now = clock_();
    json doc = {
        {"key", key},
        {"fetched_at", jsonutil::time_to_iso(now)},
        {"fetched_at_ms", jsonutil::to_epoch_ms(now)},
        {"ttl_seconds", static_cast<int64_t>(ttl.count())},
        {"payload", payload}
    };
    std::string text;
    try {
        text = doc.dump();
    } catch(const json::exception& ex){
        throw StorageError("cannot serialize cache entry for " + key + ": " + ex.what());
    }
    std::string err;
    std::lock_guard<std::mutex> lock(mutex_);
    if(!utils::write_file_atomic(path_for(key), text, err))
        throw StorageError("failed to cache " + key + ": " + err);
    Logger::instance().debug("Cached " + key);
}

void CacheStore::clear(const std::string& key){
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(key), ec);
}

void CacheStore::clear_all(){
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::vector<fs::path> doomed;
    for(auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)){
        if(it->path().extension() == ".json") doomed.push_back(it->path());
    }
    for(const auto& p : doomed){
        std::error_code rm_ec;
        fs::remove(p, rm_ec);
    }
}

}
