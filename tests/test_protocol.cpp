#include <gtest/gtest.h>
#include "protocol.h"
#include "wire_format.h"
#include <vector>

using namespace filepunch;

class ControlProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        content_id_ = compute_content_id(std::vector<uint8_t>{'f', 'i', 'l', 'e'});
    }

    std::unique_ptr<ControlMessage> round_trip(const ControlMessage& message) {
        std::vector<uint8_t> encoded;
        if (!ControlProtocol::encode_message(message, encoded)) {
            return nullptr;
        }
        return ControlProtocol::decode_message(encoded);
    }

    ContentId content_id_;
};

TEST_F(ControlProtocolTest, IntroductionLayoutIsExact) {
    Introduction intro;
    intro.content_id = content_id_;
    intro.role = PeerRole::PUBLISHER;
    intro.file_size = 4096;
    intro.peer = PeerAddress(SocketAddress("10.0.0.5", 40000), SocketAddress("203.0.113.9", 40000));
    intro.server_observed = SocketAddress("198.51.100.7", 50000);

    std::vector<uint8_t> encoded;
    ASSERT_TRUE(ControlProtocol::encode_message(ControlProtocol::create_introduction(42, intro), encoded));

    // header 5 + id 32 + role 1 + size 8 + three IPv4 addresses of 7
    ASSERT_EQ(encoded.size(), 5u + 32u + 1u + 8u + 21u);
    EXPECT_EQ(encoded[0], 0x84);
    EXPECT_EQ(encoded[4], 42);
    EXPECT_EQ(encoded[37], static_cast<uint8_t>(PeerRole::PUBLISHER));
    EXPECT_EQ(encoded[46], wire::FAMILY_IPV4);
    EXPECT_EQ(encoded[47], 10);

    auto decoded = ControlProtocol::decode_message(encoded);
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->type, ControlMessageType::INTRODUCTION);
    EXPECT_EQ(decoded->request_id, 42u);
    EXPECT_EQ(decoded->content_id, content_id_);
    EXPECT_EQ(decoded->introduction.role, PeerRole::PUBLISHER);
    EXPECT_EQ(decoded->introduction.file_size, 4096u);
    EXPECT_EQ(decoded->introduction.peer, intro.peer);
    EXPECT_EQ(decoded->introduction.server_observed, intro.server_observed);
}

TEST_F(ControlProtocolTest, IntroductionWithoutExternalAddress) {
    Introduction intro;
    intro.content_id = content_id_;
    intro.peer = PeerAddress(SocketAddress("192.168.1.20", 6000), SocketAddress());
    intro.server_observed = SocketAddress("192.168.1.20", 6000);

    auto decoded = round_trip(ControlProtocol::create_introduction(1, intro));
    ASSERT_NE(decoded, nullptr);
    EXPECT_FALSE(decoded->introduction.peer.external.is_specified());
    EXPECT_EQ(decoded->introduction.role, PeerRole::SUBSCRIBER);
}

TEST_F(ControlProtocolTest, RequestsCarryTheirFields) {
    auto publish = round_trip(ControlProtocol::create_publish(7, content_id_, 123456789,
                                                              SocketAddress("10.0.0.5", 40000)));
    ASSERT_NE(publish, nullptr);
    EXPECT_EQ(publish->type, ControlMessageType::PUBLISH);
    EXPECT_EQ(publish->content_id, content_id_);
    EXPECT_EQ(publish->file_size, 123456789u);
    EXPECT_EQ(publish->address, SocketAddress("10.0.0.5", 40000));

    auto subscribe = round_trip(ControlProtocol::create_subscribe(8, content_id_, SocketAddress("::1", 9)));
    ASSERT_NE(subscribe, nullptr);
    EXPECT_EQ(subscribe->address, SocketAddress("::1", 9));

    auto override_port = round_trip(ControlProtocol::create_port_override(9, 61000));
    ASSERT_NE(override_port, nullptr);
    EXPECT_EQ(override_port->port, 61000);

    auto ping = round_trip(ControlProtocol::create_socket_ping(10));
    ASSERT_NE(ping, nullptr);
    EXPECT_EQ(ping->type, ControlMessageType::SOCKET_PING);
    EXPECT_TRUE(ControlProtocol::is_request(ping->type));
}

TEST_F(ControlProtocolTest, RepliesCarryTheirFields) {
    auto ack = round_trip(ControlProtocol::create_socket_ping_ack(3, SocketAddress("203.0.113.9", 40000)));
    ASSERT_NE(ack, nullptr);
    EXPECT_EQ(ack->address, SocketAddress("203.0.113.9", 40000));
    EXPECT_FALSE(ControlProtocol::is_request(ack->type));

    auto not_found = round_trip(ControlProtocol::create_not_found(4, content_id_));
    ASSERT_NE(not_found, nullptr);
    EXPECT_EQ(not_found->type, ControlMessageType::NOT_FOUND);
    EXPECT_EQ(not_found->content_id, content_id_);

    auto error = round_trip(ControlProtocol::create_error(5, ControlErrorCode::INVALID_STATE, "already subscribed"));
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->error_code, ControlErrorCode::INVALID_STATE);
    EXPECT_EQ(error->error_message, "already subscribed");
}

TEST_F(ControlProtocolTest, MalformedInputRejected) {
    std::vector<uint8_t> encoded;
    ASSERT_TRUE(ControlProtocol::encode_message(
        ControlProtocol::create_publish(7, content_id_, 1, SocketAddress("10.0.0.5", 40000)), encoded));

    // Truncated
    std::vector<uint8_t> truncated(encoded.begin(), encoded.end() - 1);
    EXPECT_EQ(ControlProtocol::decode_message(truncated), nullptr);

    // Trailing bytes
    std::vector<uint8_t> trailing = encoded;
    trailing.push_back(0);
    EXPECT_EQ(ControlProtocol::decode_message(trailing), nullptr);

    // Unknown type
    std::vector<uint8_t> unknown = {0x42, 0, 0, 0, 1};
    EXPECT_EQ(ControlProtocol::decode_message(unknown), nullptr);

    // Shorter than the header
    EXPECT_EQ(ControlProtocol::decode_message(std::vector<uint8_t>{0x01, 0}), nullptr);
    EXPECT_EQ(ControlProtocol::decode_message(std::vector<uint8_t>()), nullptr);
}

TEST_F(ControlProtocolTest, InvalidRoleRejected) {
    Introduction intro;
    intro.content_id = content_id_;
    intro.peer = PeerAddress(SocketAddress("10.0.0.5", 1), SocketAddress());
    intro.server_observed = SocketAddress("10.0.0.5", 1);

    std::vector<uint8_t> encoded;
    ASSERT_TRUE(ControlProtocol::encode_message(ControlProtocol::create_introduction(1, intro), encoded));
    encoded[37] = 7;
    EXPECT_EQ(ControlProtocol::decode_message(encoded), nullptr);
}

TEST_F(ControlProtocolTest, HeaderReadableWhenBodyIsNot) {
    std::vector<uint8_t> data = {0x03, 0x00, 0x00, 0x01, 0x00, 0xde, 0xad};
    uint8_t type = 0;
    uint32_t request_id = 0;
    ASSERT_TRUE(ControlProtocol::decode_header(data, type, request_id));
    EXPECT_EQ(type, 0x03);
    EXPECT_EQ(request_id, 256u);
    EXPECT_EQ(ControlProtocol::decode_message(data), nullptr);
}

TEST_F(ControlProtocolTest, NonNumericAddressCannotBeEncoded) {
    std::vector<uint8_t> encoded;
    EXPECT_FALSE(ControlProtocol::encode_message(
        ControlProtocol::create_subscribe(1, content_id_, SocketAddress("example.org", 80)), encoded));
    EXPECT_TRUE(encoded.empty());
}
