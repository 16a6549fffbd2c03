#include "WeatherService.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include <cstdio>
#include <functional>

using nlohmann::json;

namespace daily_dash {

static void replace_all(std::string& s, const std::string& from, const std::string& to){
    for(size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
        s.replace(pos, from.size(), to);
}

HttpWeatherClient::HttpWeatherClient(HttpClient& http, std::string url_template, std::chrono::milliseconds timeout,
                                     RetryPolicy retry)
    : http_(http), url_template_(std::move(url_template)), timeout_(timeout), retry_(std::move(retry)) {}

std::string HttpWeatherClient::url_for(double latitude, double longitude) const {
    char lat[32], lon[32];
    std::snprintf(lat, sizeof(lat), "%.4f", latitude);
    std::snprintf(lon, sizeof(lon), "%.4f", longitude);
    std::string url = url_template_;
    replace_all(url, "{lat}", lat);
    replace_all(url, "{lon}", lon);
    return url;
}

Result<json> HttpWeatherClient::fetch(double latitude, double longitude, const CancellationToken& cancel){
    HttpRequest req;
    req.url = url_for(latitude, longitude);
    req.timeout = timeout_;
    req.headers.emplace_back("Accept", "application/json");

    std::function<Result<HttpResponse>()> attempt = [&]{ return http_.get(req, cancel); };
    Result<HttpResponse> resp = retry_.run(attempt, cancel, "weather");
    if(!resp.ok()) return Result<json>::failure(resp.error());
    try {
        json doc = json::parse(resp.value().body);
        if(!doc.is_object())
            return Result<json>::failure(make_error(ErrorKind::ParseError, "weather response is not a JSON object"));
        return Result<json>::success(std::move(doc));
    } catch(const json::parse_error& ex){
        return Result<json>::failure(make_error(ErrorKind::ParseError, std::string("weather response: ") + ex.what()));
    }
}

WeatherService::WeatherService(WeatherClient& client, CacheStore& cache, WeatherConfig weather, const Settings& settings)
    : client_(client), cache_(cache), weather_(std::move(weather)), ttl_(settings.cache_ttl),
      serve_fresh_(settings.serve_fresh_from_cache) {}

WeatherOutcome WeatherService::refresh(const CancellationToken& cancel, const CachedCallback& on_cached){
    const std::string key = CacheStore::weather_key(weather_.latitude, weather_.longitude);
    std::optional<CacheHit> cached = cache_.get(key);
    if(cached && cached->is_fresh && serve_fresh_){
        WeatherOutcome out(weather_.location_name, Result<json>::success(cached->payload));
        out.fetched_at = cached->fetched_at;
        return out;
    }
    if(cached && on_cached) on_cached(weather_.location_name, cached->payload, *cached);

    Result<json> r = client_.fetch(weather_.latitude, weather_.longitude, cancel);
    if(r.ok() && !cancel.cancelled()){
        try {
            cache_.put(key, r.value(), ttl_);
        } catch(const StorageError& ex){
            Logger::instance().warn(std::string("Weather cache write failed: ") + ex.what());
        }
        WeatherOutcome out(weather_.location_name, std::move(r));
        out.fetched_at = std::chrono::system_clock::now();
        return out;
    }

    Error err = r.ok() ? make_error(ErrorKind::Cancelled, "weather refresh cancelled") : r.error();
    if(err.kind == ErrorKind::ParseError || !cached){
        if(err.kind != ErrorKind::Cancelled) Logger::instance().warn("Weather: " + err.describe());
        return WeatherOutcome(weather_.location_name, Result<json>::failure(std::move(err)));
    }
    Logger::instance().info("Weather: " + err.describe() + ", using cached data");
    WeatherOutcome out(weather_.location_name, Result<json>::success(cached->payload));
    out.stale = !cached->is_fresh;
    out.fetched_at = cached->fetched_at;
    out.refresh_error = std::move(err);
    return out;
}

}
