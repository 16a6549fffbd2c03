#pragma once
#include "HttpClient.h"
#include "RetryPolicy.h"
#include "../core/CacheStore.h"
#include "../core/Config.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace daily_dash {

class CancellationToken;

// Opaque weather source; the payload is passed through untouched.
class WeatherClient {
public:
    virtual ~WeatherClient() = default;
    virtual Result<nlohmann::json> fetch(double latitude, double longitude, const CancellationToken& cancel) = 0;
};

// GETs the configured URL template ({lat} and {lon} substituted) with retries.
class HttpWeatherClient : public WeatherClient {
public:
    HttpWeatherClient(HttpClient& http, std::string url_template, std::chrono::milliseconds timeout, RetryPolicy retry);

    Result<nlohmann::json> fetch(double latitude, double longitude, const CancellationToken& cancel) override;

    std::string url_for(double latitude, double longitude) const;

private:
    HttpClient& http_;
    std::string url_template_;
    std::chrono::milliseconds timeout_;
    RetryPolicy retry_;
};

struct WeatherOutcome {
    std::string location_name;
    Result<nlohmann::json> result;
    bool stale = false;
    std::optional<std::chrono::system_clock::time_point> fetched_at;
    std::optional<Error> refresh_error;

    WeatherOutcome(std::string name, Result<nlohmann::json> r) : location_name(std::move(name)), result(std::move(r)) {}
};

// Same cache contract as feeds: fresh entries short-circuit, failures fall
// back to whatever is stored, successes are written with the cache TTL.
class WeatherService {
public:
    // Invoked before the network attempt when a stored entry is not served
    // directly, so it can be shown while the refresh runs.
    using CachedCallback = std::function<void(const std::string& location, const nlohmann::json& payload, const CacheHit&)>;

    WeatherService(WeatherClient& client, CacheStore& cache, WeatherConfig weather, const Settings& settings);

    WeatherOutcome refresh(const CancellationToken& cancel, const CachedCallback& on_cached = CachedCallback());

private:
    WeatherClient& client_;
    CacheStore& cache_;
    WeatherConfig weather_;
    std::chrono::seconds ttl_;
    bool serve_fresh_;
};

}
