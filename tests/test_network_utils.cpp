#include <gtest/gtest.h>
#include "network_utils.h"
#include "socket.h"
#include <string>

using namespace filepunch;

class NetworkUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize socket library for Windows
        init_socket_library();
    }

    void TearDown() override {
        cleanup_socket_library();
    }
};

// Test IPv4 address validation
TEST_F(NetworkUtilsTest, IPv4ValidationTest) {
    // Valid IPv4 addresses
    EXPECT_TRUE(network_utils::is_valid_ipv4("127.0.0.1"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("192.168.1.1"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("0.0.0.0"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("255.255.255.255"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("203.0.113.9"));

    // Invalid IPv4 addresses
    EXPECT_FALSE(network_utils::is_valid_ipv4("256.0.0.1"));       // Out of range
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1"));       // Missing octet
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1.1.1"));   // Extra octet
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1.a"));     // Non-numeric
    EXPECT_FALSE(network_utils::is_valid_ipv4(""));                // Empty string
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1."));      // Trailing dot
    EXPECT_FALSE(network_utils::is_valid_ipv4("192..168.1.1"));    // Double dot
    EXPECT_FALSE(network_utils::is_valid_ipv4(" 1.2.3.4"));        // Leading space
    EXPECT_FALSE(network_utils::is_valid_ipv4("localhost"));       // Hostname
    EXPECT_FALSE(network_utils::is_valid_ipv4("::1"));             // IPv6
}

// Test IPv6 address validation
TEST_F(NetworkUtilsTest, IPv6ValidationTest) {
    // Valid IPv6 addresses
    EXPECT_TRUE(network_utils::is_valid_ipv6("::1"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("::"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("2001:db8::1"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("2001:DB8::1"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("2001:0db8:0000:0000:0000:ff00:0042:8329"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("::ffff:192.0.2.1"));  // IPv4-mapped
    EXPECT_TRUE(network_utils::is_valid_ipv6("fe80::1"));

    // Invalid IPv6 addresses
    EXPECT_FALSE(network_utils::is_valid_ipv6(""));                       // Empty string
    EXPECT_FALSE(network_utils::is_valid_ipv6("1::2::3"));                // Multiple double colons
    EXPECT_FALSE(network_utils::is_valid_ipv6(":::"));                    // Triple colon
    EXPECT_FALSE(network_utils::is_valid_ipv6("2001:db8:0:0:1:0:0:1:1")); // Too many groups
    EXPECT_FALSE(network_utils::is_valid_ipv6("2001:db8:0:0:1:0:0"));     // Too few groups
    EXPECT_FALSE(network_utils::is_valid_ipv6("2001:db8::g"));            // Invalid hex
    EXPECT_FALSE(network_utils::is_valid_ipv6("192.168.1.1"));            // IPv4 address
}

// Numeric addresses are returned as-is
TEST_F(NetworkUtilsTest, NumericResolutionTest) {
    EXPECT_EQ(network_utils::resolve_hostname("127.0.0.1"), "127.0.0.1");
    EXPECT_EQ(network_utils::resolve_hostname("203.0.113.9"), "203.0.113.9");
    EXPECT_EQ(network_utils::resolve_hostname("2001:db8::1"), "2001:db8::1");
    EXPECT_TRUE(network_utils::resolve_hostname("").empty());
}

// Test hostname resolution
TEST_F(NetworkUtilsTest, HostnameResolutionTest) {
    std::string localhost_ip = network_utils::resolve_hostname("localhost");
    if (localhost_ip.empty()) {
        GTEST_SKIP() << "localhost does not resolve here";
    }
    // IPv4 is preferred when both families are available
    EXPECT_TRUE(network_utils::is_valid_ipv4(localhost_ip) || network_utils::is_valid_ipv6(localhost_ip));

    EXPECT_TRUE(network_utils::resolve_hostname("invalid.hostname.that.does.not.exist.invalid").empty());
}

// The route toward loopback leaves from loopback
TEST_F(NetworkUtilsTest, LocalAddressTowardTest) {
    EXPECT_EQ(network_utils::get_local_address_toward("127.0.0.1"), "127.0.0.1");
    EXPECT_TRUE(network_utils::get_local_address_toward("not-an-ip").empty());
    EXPECT_TRUE(network_utils::get_local_address_toward("").empty());
}

// Interface enumeration reports usable IPv4 addresses only
TEST_F(NetworkUtilsTest, LocalInterfacesTest) {
    std::vector<network_utils::NetworkInterface> interfaces = network_utils::get_local_interfaces_v4();
    for (const auto& iface : interfaces) {
        EXPECT_FALSE(iface.name.empty());
        EXPECT_TRUE(network_utils::is_valid_ipv4(iface.ip)) << iface.ip;
        EXPECT_NE(iface.ip, "127.0.0.1");
        if (!iface.gateway.empty()) {
            EXPECT_TRUE(network_utils::is_valid_ipv4(iface.gateway)) << iface.gateway;
        }
    }

    std::string gateway = network_utils::get_default_gateway_v4();
    if (!gateway.empty()) {
        EXPECT_TRUE(network_utils::is_valid_ipv4(gateway));
    }
}
