#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/NdjsonWriter.h"
#include "../src/core/JsonUtil.h"
#include <sstream>
#include <string>
#include <vector>

using nlohmann::json;

namespace daily_dash {

class NdjsonWriterTest : public ::testing::Test {
protected:
    std::vector<json> lines() const {
        std::vector<json> out;
        std::istringstream in(buffer.str());
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) out.push_back(json::parse(line));
        }
        return out;
    }

    static FeedSource source(const std::string& name) {
        FeedSource s;
        s.name = name;
        s.url = "https://example.org/" + name;
        return s;
    }

    std::ostringstream buffer;
};

TEST_F(NdjsonWriterTest, MetaLine) {
    NdjsonWriter w(buffer);
    w.write_meta("1.2.3");
    auto l = lines();
    ASSERT_EQ(l.size(), 1u);
    EXPECT_EQ(l[0]["kind"], "meta");
    EXPECT_EQ(l[0]["version"], "1.2.3");
    EXPECT_TRUE(l[0].contains("started_at"));
}

TEST_F(NdjsonWriterTest, FeedOutcomesOneLineEach) {
    FeedItem item;
    item.title = "Hello";
    item.link = "https://example.org/hello";
    item.source_name = "a";
    FeedOutcome ok(source("a"), Result<std::vector<FeedItem>>::success({item}));
    ok.fetched_at = jsonutil::from_epoch_ms(1714552200000);
    FeedOutcome stale(source("b"), Result<std::vector<FeedItem>>::success({}));
    stale.stale = true;
    stale.refresh_error = make_error(ErrorKind::RateLimited, "slow down", 429);
    FeedOutcome failed(source("c"), Result<std::vector<FeedItem>>::failure(make_error(ErrorKind::ParseError, "bad xml")));

    NdjsonWriter w(buffer);
    w.on_feeds(Result<std::vector<FeedOutcome>>::success({ok, stale, failed}));
    auto l = lines();
    ASSERT_EQ(l.size(), 3u);
    EXPECT_EQ(l[0]["kind"], "feeds");
    EXPECT_EQ(l[0]["source"], "a");
    EXPECT_EQ(l[0]["type"], "rss");
    EXPECT_EQ(l[0]["fetched_at"], "2024-05-01T08:30:00.000Z");
    EXPECT_EQ(l[0]["items"][0]["title"], "Hello");
    EXPECT_TRUE(l[1]["stale"].get<bool>());
    EXPECT_EQ(l[1]["refresh_error"]["kind"], error_kind_name(ErrorKind::RateLimited));
    EXPECT_EQ(l[1]["refresh_error"]["status"], 429);
    EXPECT_FALSE(l[2].contains("items"));
    EXPECT_EQ(l[2]["error"]["message"], "bad xml");
}

TEST_F(NdjsonWriterTest, CycleFailureLine) {
    NdjsonWriter w(buffer);
    w.on_network(Result<std::vector<TargetScan>>::failure(make_error(ErrorKind::Internal, "pool gone")));
    w.on_weather(Result<WeatherOutcome>::failure(make_error(ErrorKind::Internal, "boom")));
    auto l = lines();
    ASSERT_EQ(l.size(), 2u);
    EXPECT_EQ(l[0]["kind"], "network");
    EXPECT_EQ(l[0]["error"]["message"], "pool gone");
    EXPECT_EQ(l[1]["kind"], "weather");
    EXPECT_EQ(l[1]["error"]["message"], "boom");
    EXPECT_FALSE(l[1].contains("data"));
}

TEST_F(NdjsonWriterTest, WeatherPayloadPassedThrough) {
    WeatherOutcome o("Oslo", Result<json>::success(json{{"current", {{"temperature_2m", 3.5}}}}));
    NdjsonWriter w(buffer);
    w.on_weather(Result<WeatherOutcome>::success(o));
    auto l = lines();
    ASSERT_EQ(l.size(), 1u);
    EXPECT_EQ(l[0]["location"], "Oslo");
    EXPECT_DOUBLE_EQ(l[0]["data"]["current"]["temperature_2m"].get<double>(), 3.5);
    EXPECT_FALSE(l[0]["stale"].get<bool>());
}

TEST_F(NdjsonWriterTest, ScanLines) {
    TargetScan ts;
    ts.target_name = "Home";
    ts.range = "192.168.1.0/24";
    ts.scan_time = jsonutil::from_epoch_ms(1714552200000);
    ScanResult up;
    up.ip = "192.168.1.2";
    up.mac = "aa:bb:cc:00:00:02";
    up.vendor = std::string("Apple");
    up.status = HostStatus::Up;
    up.is_new = true;
    ScanResult down;
    down.hostname = std::string("printer");
    down.status = HostStatus::Down;
    down.is_expected = true;
    ts.hosts = {up, down};

    TargetScan blocked;
    blocked.target_name = "Lab";
    blocked.error = make_error(ErrorKind::Unprivileged, "need root");

    NdjsonWriter w(buffer);
    w.on_network(Result<std::vector<TargetScan>>::success({ts, blocked}));
    auto l = lines();
    ASSERT_EQ(l.size(), 2u);
    EXPECT_EQ(l[0]["target"], "Home");
    ASSERT_EQ(l[0]["hosts"].size(), 2u);
    EXPECT_EQ(l[0]["hosts"][0]["status"], "UP");
    EXPECT_TRUE(l[0]["hosts"][0]["is_new"].get<bool>());
    EXPECT_TRUE(l[0]["hosts"][0]["hostname"].is_null());
    EXPECT_EQ(l[0]["hosts"][0]["vendor"], "Apple");
    EXPECT_EQ(l[0]["hosts"][1]["status"], "DOWN");
    EXPECT_EQ(l[0]["hosts"][1]["hostname"], "printer");
    EXPECT_FALSE(l[0].contains("error"));
    EXPECT_EQ(l[1]["error"]["kind"], error_kind_name(ErrorKind::Unprivileged));
}

TEST_F(NdjsonWriterTest, FeedCachedLine) {
    CacheHit hit;
    hit.fetched_at = jsonutil::from_epoch_ms(1714552200000);
    hit.age = std::chrono::milliseconds(90000);
    hit.is_fresh = false;
    FeedItem item;
    item.title = "cached";
    NdjsonWriter w(buffer);
    w.on_feed_cached(source("a"), {item}, hit);
    auto l = lines();
    ASSERT_EQ(l.size(), 1u);
    EXPECT_EQ(l[0]["kind"], "feed_cached");
    EXPECT_TRUE(l[0]["stale"].get<bool>());
    EXPECT_EQ(l[0]["age_ms"], 90000);
    EXPECT_EQ(l[0]["items"][0]["title"], "cached");
}

TEST_F(NdjsonWriterTest, WeatherCachedLine) {
    CacheHit hit;
    hit.payload = json{{"temp", 3}};
    hit.fetched_at = jsonutil::from_epoch_ms(1714552200000);
    hit.age = std::chrono::milliseconds(600000);
    hit.is_fresh = false;
    NdjsonWriter w(buffer);
    w.on_weather_cached("Oslo", hit.payload, hit);
    auto l = lines();
    ASSERT_EQ(l.size(), 1u);
    EXPECT_EQ(l[0]["kind"], "weather_cached");
    EXPECT_EQ(l[0]["location"], "Oslo");
    EXPECT_TRUE(l[0]["stale"].get<bool>());
    EXPECT_EQ(l[0]["fetched_at"], "2024-05-01T08:30:00.000Z");
    EXPECT_EQ(l[0]["data"]["temp"], 3);
}

TEST_F(NdjsonWriterTest, NetworkInfoLine) {
    NetworkInfo info;
    info.local_ip = "192.168.1.20";
    info.gateway_ip = "192.168.1.1";
    info.dns_servers = {"192.168.1.1", "9.9.9.9"};
    info.public_ip_error = make_error(ErrorKind::Timeout, "all services timed out");
    NdjsonWriter w(buffer);
    w.on_network_info(Result<NetworkInfo>::success(info));
    auto l = lines();
    ASSERT_EQ(l.size(), 1u);
    EXPECT_EQ(l[0]["kind"], "netinfo");
    EXPECT_EQ(l[0]["local_ip"], "192.168.1.20");
    EXPECT_EQ(l[0]["gateway_ip"], "192.168.1.1");
    EXPECT_EQ(l[0]["dns_servers"], json::array({"192.168.1.1", "9.9.9.9"}));
    EXPECT_TRUE(l[0]["public_ip"].is_null());
    EXPECT_EQ(l[0]["public_ip_error"]["kind"], "timeout");
}

TEST_F(NdjsonWriterTest, PrettyOutputIsIndented) {
    NdjsonWriter w(buffer, true);
    w.write_meta("0.0.1");
    EXPECT_THAT(buffer.str(), ::testing::HasSubstr("\n  \"kind\": \"meta\""));
}

} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
