#include <gtest/gtest.h>
#include "socket.h"
#include <sstream>
#include <vector>

using namespace filepunch;

class SocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
    }

    void TearDown() override {
        cleanup_socket_library();
    }
};

// Test SocketAddress structure
TEST_F(SocketTest, SocketAddressTest) {
    SocketAddress a("127.0.0.1", 8080);
    EXPECT_EQ(a.ip, "127.0.0.1");
    EXPECT_EQ(a.port, 8080);
    EXPECT_TRUE(a.is_specified());
    EXPECT_FALSE(a.is_ipv6());
    EXPECT_EQ(a.to_string(), "127.0.0.1:8080");

    EXPECT_EQ(a, SocketAddress("127.0.0.1", 8080));
    EXPECT_NE(a, SocketAddress("127.0.0.1", 8081));
    EXPECT_LT(a, SocketAddress("127.0.0.1", 8081));

    SocketAddress v6("::1", 9000);
    EXPECT_TRUE(v6.is_ipv6());
    EXPECT_EQ(v6.to_string(), "[::1]:9000");

    std::ostringstream os;
    os << a;
    EXPECT_EQ(os.str(), "127.0.0.1:8080");

    EXPECT_FALSE(SocketAddress().is_specified());
}

// Test address parsing
TEST_F(SocketTest, ParseTest) {
    SocketAddress out;
    ASSERT_TRUE(SocketAddress::parse("203.0.113.9:40000", out));
    EXPECT_EQ(out, SocketAddress("203.0.113.9", 40000));

    ASSERT_TRUE(SocketAddress::parse("[2001:db8::1]:443", out));
    EXPECT_EQ(out, SocketAddress("2001:db8::1", 443));

    EXPECT_FALSE(SocketAddress::parse("203.0.113.9", out));         // No port
    EXPECT_FALSE(SocketAddress::parse("203.0.113.9:", out));        // Empty port
    EXPECT_FALSE(SocketAddress::parse("203.0.113.9:65536", out));   // Out of range
    EXPECT_FALSE(SocketAddress::parse("203.0.113.9:-1", out));      // Negative
    EXPECT_FALSE(SocketAddress::parse("example.org:80", out));      // Hostname
    EXPECT_FALSE(SocketAddress::parse("[2001:db8::1]443", out));    // Missing colon
    EXPECT_FALSE(SocketAddress::parse("[::1:80", out));             // Unclosed bracket
}

// Test socket validity check
TEST_F(SocketTest, SocketValidityTest) {
    socket_t valid_socket = create_udp_socket("127.0.0.1", 0);
    EXPECT_TRUE(is_valid_socket(valid_socket));
    close_socket(valid_socket);

    EXPECT_FALSE(is_valid_socket(INVALID_SOCKET_VALUE));
}

// Test UDP socket creation
TEST_F(SocketTest, UDPSocketCreationTest) {
    socket_t any_v4 = create_udp_socket("0.0.0.0", 0);
    EXPECT_TRUE(is_valid_socket(any_v4));
    close_socket(any_v4);

    socket_t loopback = create_udp_socket("127.0.0.1", 0);
    ASSERT_TRUE(is_valid_socket(loopback));
    SocketAddress bound = get_bound_address(loopback);
    EXPECT_EQ(bound.ip, "127.0.0.1");
    EXPECT_NE(bound.port, 0);
    close_socket(loopback);

    // Not a local address
    socket_t foreign = create_udp_socket("192.0.2.55", 0);
    EXPECT_FALSE(is_valid_socket(foreign));
}

// Test UDP datagram exchange
TEST_F(SocketTest, UDPCommunicationTest) {
    socket_t a = create_udp_socket("127.0.0.1", 0);
    socket_t b = create_udp_socket("127.0.0.1", 0);
    ASSERT_TRUE(is_valid_socket(a));
    ASSERT_TRUE(is_valid_socket(b));

    SocketAddress address_a = get_bound_address(a);
    SocketAddress address_b = get_bound_address(b);

    std::vector<uint8_t> payload = {'p', 'u', 'n', 'c', 'h'};
    EXPECT_EQ(send_udp_data(a, payload, address_b), static_cast<int>(payload.size()));

    SocketAddress sender;
    std::vector<uint8_t> received = receive_udp_data_with_timeout(b, 1500, 1000, sender);
    EXPECT_EQ(received, payload);
    EXPECT_EQ(sender, address_a);

    close_socket(a);
    close_socket(b);
}

// Receive with nothing pending times out with an empty result
TEST_F(SocketTest, ReceiveTimeoutTest) {
    socket_t sock = create_udp_socket("127.0.0.1", 0);
    ASSERT_TRUE(is_valid_socket(sock));

    SocketAddress sender;
    EXPECT_TRUE(receive_udp_data_with_timeout(sock, 1500, 50, sender).empty());
    EXPECT_TRUE(receive_udp_data_with_timeout(sock, 1500, 0, sender).empty());

    close_socket(sock);
}

// Test invalid operations
TEST_F(SocketTest, InvalidOperationsTest) {
    std::vector<uint8_t> payload = {1, 2, 3};
    EXPECT_EQ(send_udp_data(INVALID_SOCKET_VALUE, payload, SocketAddress("127.0.0.1", 9)), -1);

    socket_t sock = create_udp_socket("127.0.0.1", 0);
    ASSERT_TRUE(is_valid_socket(sock));
    EXPECT_EQ(send_udp_data(sock, payload, SocketAddress("not an address", 9)), -1);
    close_socket(sock);

    EXPECT_FALSE(get_bound_address(INVALID_SOCKET_VALUE).is_specified());
}
