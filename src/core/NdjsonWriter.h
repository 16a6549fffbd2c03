#pragma once
#include "AcquisitionCoordinator.h"
#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace daily_dash {

// Listener that prints every outcome as one JSON line.
class NdjsonWriter : public AcquisitionListener {
public:
    explicit NdjsonWriter(std::ostream& out, bool pretty = false);

    // First line of a run: version, host and user.
    void write_meta(const std::string& version);

    void on_feed_cached(const FeedSource& source, const std::vector<FeedItem>& items, const CacheHit& hit) override;
    void on_feeds(const Result<std::vector<FeedOutcome>>& outcome) override;
    void on_weather_cached(const std::string& location, const nlohmann::json& data, const CacheHit& hit) override;
    void on_weather(const Result<WeatherOutcome>& outcome) override;
    void on_network(const Result<std::vector<TargetScan>>& outcome) override;
    void on_network_info(const Result<NetworkInfo>& outcome) override;

    static nlohmann::json error_json(const Error& err);
    static nlohmann::json feed_json(const FeedOutcome& outcome);
    static nlohmann::json weather_json(const WeatherOutcome& outcome);
    static nlohmann::json scan_json(const TargetScan& scan);

private:
    void emit(const nlohmann::json& line);

    std::ostream& out_;
    bool pretty_;
    std::mutex mutex_;
};

}
