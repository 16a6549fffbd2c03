#include "NdjsonWriter.h"
#include "JsonUtil.h"
#include "../fetchers/FeedParser.h"
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

using nlohmann::json;

namespace daily_dash {

NdjsonWriter::NdjsonWriter(std::ostream& out, bool pretty) : out_(out), pretty_(pretty) {}

void NdjsonWriter::emit(const json& line){
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << (pretty_ ? line.dump(2) : line.dump()) << '\n';
    out_.flush();
}

void NdjsonWriter::write_meta(const std::string& version){
    json meta = {{"kind", "meta"}, {"version", version}, {"started_at", jsonutil::time_to_iso(std::chrono::system_clock::now())}};
    struct utsname u{};
    if(uname(&u) == 0){
        meta["hostname"] = u.nodename;
        meta["kernel"] = u.release;
    }
    if(struct passwd* pw = getpwuid(geteuid())) meta["user"] = pw->pw_name;
    emit(meta);
}

json NdjsonWriter::error_json(const Error& err){
    json e = {{"kind", error_kind_name(err.kind)}, {"message", err.message}};
    if(err.status != 0) e["status"] = err.status;
    return e;
}

json NdjsonWriter::feed_json(const FeedOutcome& o){
    json j = {{"source", o.source.name}, {"url", o.source.url}, {"type", feed_kind_name(o.source.kind)}, {"stale", o.stale}};
    if(o.fetched_at) j["fetched_at"] = jsonutil::time_to_iso(*o.fetched_at);
    if(o.result.ok()) j["items"] = feed_parser::to_json(o.result.value());
    else j["error"] = error_json(o.result.error());
    if(o.refresh_error) j["refresh_error"] = error_json(*o.refresh_error);
    return j;
}

json NdjsonWriter::weather_json(const WeatherOutcome& o){
    json j = {{"location", o.location_name}, {"stale", o.stale}};
    if(o.fetched_at) j["fetched_at"] = jsonutil::time_to_iso(*o.fetched_at);
    if(o.result.ok()) j["data"] = o.result.value();
    else j["error"] = error_json(o.result.error());
    if(o.refresh_error) j["refresh_error"] = error_json(*o.refresh_error);
    return j;
}

json NdjsonWriter::scan_json(const TargetScan& s){
    json hosts = json::array();
    for(const auto& h : s.hosts){
        hosts.push_back({
            {"ip", h.ip},
            {"mac", h.mac},
            {"hostname", h.hostname ? json(*h.hostname) : json(nullptr)},
            {"vendor", h.vendor ? json(*h.vendor) : json(nullptr)},
            {"status", host_status_name(h.status)},
            {"is_new", h.is_new},
            {"is_expected", h.is_expected}
        });
    }
    json j = {
        {"target", s.target_name},
        {"range", s.range},
        {"scan_time", jsonutil::time_to_iso(s.scan_time)},
        {"duration_ms", s.duration.count()},
        {"hosts", hosts}
    };
    if(s.error) j["error"] = error_json(*s.error);
    return j;
}

void NdjsonWriter::on_feed_cached(const FeedSource& source, const std::vector<FeedItem>& items, const CacheHit& hit){
    emit({
        {"kind", "feed_cached"},
        {"source", source.name},
        {"stale", !hit.is_fresh},
        {"fetched_at", jsonutil::time_to_iso(hit.fetched_at)},
        {"age_ms", hit.age.count()},
        {"items", feed_parser::to_json(items)}
    });
}

void NdjsonWriter::on_feeds(const Result<std::vector<FeedOutcome>>& outcome){
    if(!outcome.ok()){
        emit({{"kind", "feeds"}, {"error", error_json(outcome.error())}});
        return;
    }
    for(const auto& o : outcome.value()){
        json j = feed_json(o);
        j["kind"] = "feeds";
        emit(j);
    }
}

void NdjsonWriter::on_weather_cached(const std::string& location, const json& data, const CacheHit& hit){
    emit({
        {"kind", "weather_cached"},
        {"location", location},
        {"stale", !hit.is_fresh},
        {"fetched_at", jsonutil::time_to_iso(hit.fetched_at)},
        {"age_ms", hit.age.count()},
        {"data", data}
    });
}

void NdjsonWriter::on_weather(const Result<WeatherOutcome>& outcome){
    json j = outcome.ok() ? weather_json(outcome.value()) : json{{"error", error_json(outcome.error())}};
    j["kind"] = "weather";
    emit(j);
}

void NdjsonWriter::on_network(const Result<std::vector<TargetScan>>& outcome){
    if(!outcome.ok()){
        emit({{"kind", "network"}, {"error", error_json(outcome.error())}});
        return;
    }
    for(const auto& s : outcome.value()){
        json j = scan_json(s);
        j["kind"] = "network";
        emit(j);
    }
}

void NdjsonWriter::on_network_info(const Result<NetworkInfo>& outcome){
    if(!outcome.ok()){
        emit({{"kind", "netinfo"}, {"error", error_json(outcome.error())}});
        return;
    }
    const NetworkInfo& info = outcome.value();
    auto opt = [](const std::optional<std::string>& v) -> json { return v ? json(*v) : json(nullptr); };
    json j = {{"kind", "netinfo"},
              {"local_ip", opt(info.local_ip)},
              {"gateway_ip", opt(info.gateway_ip)},
              {"dns_servers", info.dns_servers},
              {"public_ip", opt(info.public_ip)}};
    if(info.public_ip_error) j["public_ip_error"] = error_json(*info.public_ip_error);
    emit(j);
}

}
