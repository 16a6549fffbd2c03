#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/KnownHostsStore.h"
#include "../src/core/Errors.h"
#include "../src/core/JsonUtil.h"
#include "../src/core/Utils.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace daily_dash {

class KnownHostsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("dd_hosts_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
        path_ = (dir_ / "known_hosts.json").string();
        now_ = std::chrono::system_clock::time_point(std::chrono::seconds(1714550000));
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    KnownHostsStore::Clock clock() { return [this]{ return now_; }; }

    static HostRecord rec(const std::string& mac, const std::string& ip,
                          std::optional<std::string> host = std::nullopt,
                          std::optional<std::string> vendor = std::nullopt) {
        HostRecord r;
        r.mac = mac;
        r.ip = ip;
        r.hostname = std::move(host);
        r.vendor = std::move(vendor);
        return r;
    }

    fs::path dir_;
    std::string path_;
    std::chrono::system_clock::time_point now_;
};

TEST_F(KnownHostsStoreTest, MissingFileIsEmpty) {
    KnownHostsStore store(path_, clock());
    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(store.count(), 0u);
    EXPECT_FALSE(store.dirty());
}

TEST_F(KnownHostsStoreTest, InsertThenUpdate) {
    KnownHostsStore store(path_, clock());
    EXPECT_TRUE(store.upsert(rec("AA-BB-CC-DD-EE-01", "192.168.1.10", std::string("nas"), std::string("Synology"))));
    EXPECT_TRUE(store.is_known("aa:bb:cc:dd:ee:01"));
    auto first = store.get("AA:BB:CC:DD:EE:01");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->mac, "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(first->first_seen, now_);
    EXPECT_EQ(first->last_seen, now_);

    now_ += 1h;
    EXPECT_FALSE(store.upsert(rec("aa:bb:cc:dd:ee:01", "192.168.1.11")));
    auto second = store.get("aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->ip, "192.168.1.11");
    // absent fields do not erase known ones
    EXPECT_EQ(second->hostname.value_or(""), "nas");
    EXPECT_EQ(second->vendor.value_or(""), "Synology");
    EXPECT_EQ(second->first_seen, now_ - 1h);
    EXPECT_EQ(second->last_seen, now_);
    EXPECT_EQ(store.count(), 1u);
}

TEST_F(KnownHostsStoreTest, LastSeenNeverMovesBackwards) {
    KnownHostsStore store(path_, clock());
    store.upsert(rec("aa:bb:cc:dd:ee:02", "10.0.0.2"));
    auto before = store.get("aa:bb:cc:dd:ee:02")->last_seen;
    now_ -= 10min;
    store.upsert(rec("aa:bb:cc:dd:ee:02", "10.0.0.2"));
    EXPECT_EQ(store.get("aa:bb:cc:dd:ee:02")->last_seen, before);
}

TEST_F(KnownHostsStoreTest, EmptyMacIgnored) {
    KnownHostsStore store(path_, clock());
    EXPECT_FALSE(store.upsert(rec("  ", "10.0.0.9")));
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(KnownHostsStoreTest, SaveAndReload) {
    {
        KnownHostsStore store(path_, clock());
        store.upsert(rec("aa:bb:cc:dd:ee:03", "192.168.1.3", std::string("printer")));
        store.upsert(rec("aa:bb:cc:dd:ee:04", "192.168.1.4"));
        EXPECT_TRUE(store.dirty());
        store.save();
        EXPECT_FALSE(store.dirty());
    }
    KnownHostsStore reloaded(path_, clock());
    auto hosts = reloaded.load();
    ASSERT_EQ(hosts.size(), 2u);
    const auto& printer = hosts.at("aa:bb:cc:dd:ee:03");
    EXPECT_EQ(printer.ip, "192.168.1.3");
    EXPECT_EQ(printer.hostname.value_or(""), "printer");
    EXPECT_FALSE(printer.vendor.has_value());
    EXPECT_EQ(printer.first_seen, now_);
    EXPECT_FALSE(hosts.at("aa:bb:cc:dd:ee:04").hostname.has_value());

    auto doc = nlohmann::json::parse(utils::read_file(path_).value());
    EXPECT_TRUE(doc["hosts"].contains("aa:bb:cc:dd:ee:03"));
    EXPECT_EQ(doc["hosts"]["aa:bb:cc:dd:ee:03"]["first_seen"], "2024-05-01T07:53:20.000Z");
}

TEST_F(KnownHostsStoreTest, LazyLoadOnFirstQuery) {
    std::ofstream(path_) << R"({"hosts": {"AA:BB:CC:DD:EE:05": {"ip": "10.1.1.5", "hostname": "",
        "first_seen": "2024-01-01T00:00:00Z", "last_seen": "2024-02-01T00:00:00Z"}}})";
    KnownHostsStore store(path_, clock());
    EXPECT_TRUE(store.is_known("aa:bb:cc:dd:ee:05"));
    auto h = store.get("aa:bb:cc:dd:ee:05");
    ASSERT_TRUE(h.has_value());
    EXPECT_FALSE(h->hostname.has_value());
    EXPECT_LT(h->first_seen, h->last_seen);
}

TEST_F(KnownHostsStoreTest, CorruptFileMovedAside) {
    std::ofstream(path_) << "{ not json";
    KnownHostsStore store(path_, clock());
    EXPECT_THROW(store.load(), StorageError);
    EXPECT_TRUE(fs::exists(path_ + ".corrupt"));
    EXPECT_FALSE(fs::exists(path_));
    EXPECT_EQ(store.count(), 0u);

    store.upsert(rec("aa:bb:cc:dd:ee:06", "10.0.0.6"));
    EXPECT_TRUE(store.flush());
    EXPECT_TRUE(fs::exists(path_));
    EXPECT_TRUE(fs::exists(path_ + ".corrupt"));
}

TEST_F(KnownHostsStoreTest, MistypedFieldsAreTolerated) {
    std::ofstream(path_) << R"({"hosts":{
        "aa:bb:cc:00:00:01":{"ip":5,"hostname":7,"vendor":null,"first_seen":17,"last_seen":[]},
        "aa:bb:cc:00:00:02":{"ip":"10.0.0.2","first_seen":"2020-01-01T00:00:00Z"}}})";
    KnownHostsStore store(path_, clock());
    std::map<std::string, HostRecord> hosts;
    ASSERT_NO_THROW(hosts = store.load());
    ASSERT_EQ(hosts.size(), 2u);
    const HostRecord& odd = hosts.at("aa:bb:cc:00:00:01");
    EXPECT_EQ(odd.ip, "");
    EXPECT_FALSE(odd.hostname.has_value());
    EXPECT_EQ(odd.first_seen, now_);
    EXPECT_EQ(odd.last_seen, now_);
    EXPECT_EQ(hosts.at("aa:bb:cc:00:00:02").ip, "10.0.0.2");
}

TEST_F(KnownHostsStoreTest, UnreadableFileIsNeverOverwritten) {
    if (::geteuid() == 0) GTEST_SKIP() << "root ignores file permissions";
    std::string original = R"({"hosts":{"aa:bb:cc:00:00:09":{"ip":"10.0.0.9",)"
                           R"("first_seen":"2020-01-01T00:00:00.000Z","last_seen":"2020-01-02T00:00:00.000Z"}}})";
    std::ofstream(path_) << original;
    fs::permissions(path_, fs::perms::owner_write);

    KnownHostsStore store(path_, clock());
    EXPECT_THROW(store.load(), StorageError);
    EXPECT_TRUE(store.upsert(rec("aa:bb:cc:00:00:09", "10.0.0.9")));
    EXPECT_THROW(store.save(), StorageError);
    EXPECT_FALSE(store.flush());

    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(utils::read_file(path_).value_or(""), original);

    // once readable again the history is picked up and saving works
    auto hosts = store.load();
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(jsonutil::time_to_iso(hosts.begin()->second.first_seen), "2020-01-01T00:00:00.000Z");
    EXPECT_FALSE(store.upsert(rec("aa:bb:cc:00:00:09", "10.0.0.9")));
    EXPECT_NO_THROW(store.save());
}

TEST_F(KnownHostsStoreTest, FlushWithoutChangesWritesNothing) {
    KnownHostsStore store(path_, clock());
    EXPECT_TRUE(store.flush());
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(KnownHostsStoreTest, SaveToUnwritablePathThrows) {
    KnownHostsStore store("/proc/daily_dash/known_hosts.json", clock());
    store.upsert(rec("aa:bb:cc:dd:ee:07", "10.0.0.7"));
    EXPECT_THROW(store.save(), StorageError);
    EXPECT_FALSE(store.flush());
    EXPECT_TRUE(store.dirty());
}

TEST_F(KnownHostsStoreTest, NormalizeMac) {
    EXPECT_EQ(KnownHostsStore::normalize_mac(" AA-BB-CC-0D-0E-0F "), "aa:bb:cc:0d:0e:0f");
    EXPECT_EQ(KnownHostsStore::normalize_mac("aa:bb:cc:dd:ee:ff"), "aa:bb:cc:dd:ee:ff");
}

} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
