#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ConfigLoader.h"
#include "../src/core/Errors.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace daily_dash {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("dd_config_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    std::string write(const std::string& text) {
        auto p = dir_ / "config.json";
        std::ofstream(p) << text;
        return p.string();
    }
    fs::path dir_;
    ConfigLoader loader_;
};

TEST_F(ConfigLoaderTest, MissingFileGivesDefaults) {
    Config cfg = loader_.load((dir_ / "absent.json").string());
    EXPECT_TRUE(cfg.feeds.empty());
    EXPECT_TRUE(cfg.network.targets.empty());
    EXPECT_EQ(cfg.settings.max_concurrent_fetches, 3);
    EXPECT_EQ(cfg.settings.refresh_interval, std::chrono::minutes(15));
    EXPECT_EQ(cfg.settings.cache_ttl, std::chrono::minutes(5));
    EXPECT_EQ(cfg.network.scan_interval, std::chrono::minutes(15));
    EXPECT_EQ(cfg.network.dns_timeout, std::chrono::seconds(1));
    EXPECT_TRUE(cfg.network.info);
    EXPECT_EQ(cfg.cache_dir, ".cache");
    EXPECT_EQ(cfg.known_hosts_file, "known_hosts.json");
}

TEST_F(ConfigLoaderTest, FullDocument) {
    std::string path = write(R"({
        "feeds": [
            {"name": "Hacker News", "url": "https://news.ycombinator.com/rss"},
            {"name": "Reddit", "url": "https://www.reddit.com/r/cpp.json", "type": "JSON",
             "json_path": "data.children", "enabled": false}
        ],
        "network": {
            "targets": [{"name": "Home", "range": "192.168.1.0/24", "expected_hosts": ["aa:bb:cc:dd:ee:ff", "nas"]}],
            "scan_interval_minutes": 30,
            "dns_timeout_seconds": 0.5,
            "arp_timeout_seconds": 2,
            "interface": "eth0",
            "mdns": false,
            "info": false
        },
        "weather": {"location_name": "Oslo", "latitude": 59.91, "longitude": 10.75},
        "settings": {
            "user_name": "sam",
            "refresh_interval_minutes": 10,
            "cache_ttl_minutes": 3,
            "log_level": "debug",
            "max_concurrent_fetches": 5,
            "http_timeout_seconds": 12.5,
            "serve_fresh_from_cache": false,
            "retry": {"max_retries": 1, "initial_backoff_seconds": 0.25, "multiplier": 3}
        },
        "paths": {"cache_dir": "/var/cache/dash", "known_hosts_file": "/var/lib/dash/hosts.json"}
    })");
    Config cfg = loader_.load(path);

    ASSERT_EQ(cfg.feeds.size(), 2u);
    EXPECT_EQ(cfg.feeds[0].kind, FeedKind::Rss);
    EXPECT_TRUE(cfg.feeds[0].enabled);
    EXPECT_FALSE(cfg.feeds[0].json_path.has_value());
    EXPECT_EQ(cfg.feeds[1].kind, FeedKind::Json);
    EXPECT_FALSE(cfg.feeds[1].enabled);
    EXPECT_EQ(cfg.feeds[1].json_path.value_or(""), "data.children");

    ASSERT_EQ(cfg.network.targets.size(), 1u);
    EXPECT_EQ(cfg.network.targets[0].range, "192.168.1.0/24");
    EXPECT_THAT(cfg.network.targets[0].expected_hosts, ::testing::ElementsAre("aa:bb:cc:dd:ee:ff", "nas"));
    EXPECT_EQ(cfg.network.scan_interval, std::chrono::minutes(30));
    EXPECT_EQ(cfg.network.dns_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.network.arp_timeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.network.interface_name, "eth0");
    EXPECT_FALSE(cfg.network.mdns);
    EXPECT_FALSE(cfg.network.info);

    EXPECT_EQ(cfg.weather.location_name, "Oslo");
    EXPECT_DOUBLE_EQ(cfg.weather.latitude, 59.91);

    EXPECT_EQ(cfg.settings.user_name, "sam");
    EXPECT_EQ(cfg.settings.refresh_interval, std::chrono::minutes(10));
    EXPECT_EQ(cfg.settings.cache_ttl, std::chrono::minutes(3));
    EXPECT_EQ(cfg.settings.log_level, "debug");
    EXPECT_EQ(cfg.settings.max_concurrent_fetches, 5);
    EXPECT_EQ(cfg.settings.http_timeout, std::chrono::milliseconds(12500));
    EXPECT_FALSE(cfg.settings.serve_fresh_from_cache);
    EXPECT_EQ(cfg.settings.retry.max_retries, 1);
    EXPECT_EQ(cfg.settings.retry.initial_backoff, std::chrono::milliseconds(250));
    EXPECT_DOUBLE_EQ(cfg.settings.retry.multiplier, 3.0);

    EXPECT_EQ(cfg.cache_dir, "/var/cache/dash");
    EXPECT_EQ(cfg.known_hosts_file, "/var/lib/dash/hosts.json");
}

TEST_F(ConfigLoaderTest, NullSectionsKeepDefaults) {
    Config cfg = loader_.parse(R"({"feeds": null, "network": null, "settings": {"retry": null}})");
    EXPECT_TRUE(cfg.feeds.empty());
    EXPECT_EQ(cfg.settings.retry.max_retries, 3);
}

TEST_F(ConfigLoaderTest, MalformedJsonThrows) {
    EXPECT_THROW(loader_.load(write("{ \"feeds\": [ ")), ConfigError);
    EXPECT_THROW(loader_.parse("[]"), ConfigError);
}

TEST_F(ConfigLoaderTest, WrongTypesNameTheKey) {
    try {
        loader_.parse(R"({"settings": {"max_concurrent_fetches": "three"}})");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("settings.max_concurrent_fetches"));
    }
    EXPECT_THROW(loader_.parse(R"({"feeds": {}})"), ConfigError);
    EXPECT_THROW(loader_.parse(R"({"feeds": [42]})"), ConfigError);
    EXPECT_THROW(loader_.parse(R"({"network": []})"), ConfigError);
    EXPECT_THROW(loader_.parse(R"({"network": {"targets": [{"expected_hosts": "nas"}]}})"), ConfigError);
}

TEST_F(ConfigLoaderTest, UnknownFeedTypeRejected) {
    try {
        loader_.parse(R"({"feeds": [{"name": "x", "url": "https://x", "type": "atom"}]})");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("feeds[0].type"));
    }
}

} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
