#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/Cidr.h"

namespace daily_dash {

class CidrTest : public ::testing::Test {};

TEST_F(CidrTest, ParsesNetworkAndMasksHostBits) {
    auto net = parse_cidr("192.168.1.77/24");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->prefix, 24);
    EXPECT_EQ(net->to_string(), "192.168.1.0/24");
    EXPECT_EQ(ipv4_to_string(net->broadcast()), "192.168.1.255");
    EXPECT_EQ(net->netmask(), 0xFFFFFF00u);
}

TEST_F(CidrTest, BareAddressIsSlash32) {
    auto net = parse_cidr("10.0.0.5");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->prefix, 32);
    EXPECT_EQ(net->host_count(), 1u);
    EXPECT_THAT(net->hosts(), ::testing::ElementsAre(parse_ipv4("10.0.0.5").value()));
}

TEST_F(CidrTest, RejectsMalformedInput) {
    std::string err;
    EXPECT_FALSE(parse_cidr("192.168.1.0/33", &err).has_value());
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(parse_cidr("192.168.1.0/", &err).has_value());
    EXPECT_FALSE(parse_cidr("192.168.1.0/2a", &err).has_value());
    EXPECT_FALSE(parse_cidr("300.1.1.1/24", &err).has_value());
    EXPECT_FALSE(parse_cidr("not-an-ip/24", &err).has_value());
    EXPECT_FALSE(parse_cidr("", &err).has_value());
    EXPECT_FALSE(parse_cidr("10.0.0.0/-1").has_value());
}

TEST_F(CidrTest, HostsExcludeNetworkAndBroadcast) {
    auto net = parse_cidr("192.168.5.0/30");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->host_count(), 2u);
    auto hosts = net->hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(ipv4_to_string(hosts[0]), "192.168.5.1");
    EXPECT_EQ(ipv4_to_string(hosts[1]), "192.168.5.2");

    auto slash24 = parse_cidr("192.168.1.0/24");
    EXPECT_EQ(slash24->host_count(), 254u);
    EXPECT_EQ(slash24->hosts().size(), 254u);
}

TEST_F(CidrTest, PointToPointKeepsBothAddresses) {
    auto net = parse_cidr("10.1.1.0/31");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->host_count(), 2u);
    EXPECT_EQ(net->hosts().size(), 2u);
}

TEST_F(CidrTest, Contains) {
    auto net = parse_cidr("192.168.1.0/24").value();
    EXPECT_TRUE(net.contains("192.168.1.1"));
    EXPECT_TRUE(net.contains("192.168.1.254"));
    EXPECT_FALSE(net.contains("192.168.2.1"));
    EXPECT_FALSE(net.contains("garbage"));

    auto all = parse_cidr("0.0.0.0/0").value();
    EXPECT_TRUE(all.contains("8.8.8.8"));
}

TEST_F(CidrTest, Ipv4RoundTrip) {
    auto a = parse_ipv4("172.16.254.3");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, (172u << 24) | (16u << 16) | (254u << 8) | 3u);
    EXPECT_EQ(ipv4_to_string(*a), "172.16.254.3");
    EXPECT_FALSE(parse_ipv4("1.2.3").has_value());
}

TEST_F(CidrTest, ScanPrefixLimit) {
    EXPECT_EQ(kMinScanPrefix, 16);
    EXPECT_LT(parse_cidr("10.0.0.0/8")->prefix, kMinScanPrefix);
    EXPECT_GE(parse_cidr("10.0.0.0/16")->prefix, kMinScanPrefix);
}

} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
