#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include <unistd.h>
#include <sys/types.h>

namespace daily_dash {

class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(PrivilegeTest, LogCapabilitiesDoesNotThrow) {
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_NO_THROW(log_capabilities("unit test"));
    EXPECT_NO_THROW(log_capabilities(""));
}

TEST_F(PrivilegeTest, RootAlwaysHasRawSocketPrivilege) {
    if (geteuid() != 0) GTEST_SKIP() << "needs root";
    EXPECT_TRUE(has_raw_socket_privilege());
}

TEST_F(PrivilegeTest, PrivilegeCheckIsStable) {
    bool first = has_raw_socket_privilege();
    EXPECT_EQ(first, has_raw_socket_privilege());
}

#ifndef DAILY_DASH_HAVE_LIBCAP
TEST_F(PrivilegeTest, WithoutLibcapFollowsEuid) {
    EXPECT_FALSE(is_libcap_available());
    EXPECT_EQ(has_raw_socket_privilege(), geteuid() == 0);
    EXPECT_EQ(privilege_hint(), "Run with sudo for network scanning");
}
#else
TEST_F(PrivilegeTest, WithLibcapMentionsCapability) {
    EXPECT_TRUE(is_libcap_available());
    EXPECT_NE(privilege_hint().find("CAP_NET_RAW"), std::string::npos);
}
#endif

TEST_F(PrivilegeTest, PrivilegeCheckAcceptsLambdas) {
    PrivilegeCheck denied = []{ return false; };
    PrivilegeCheck real = &has_raw_socket_privilege;
    EXPECT_FALSE(denied());
    EXPECT_EQ(real(), has_raw_socket_privilege());
}

} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
