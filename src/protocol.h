#pragma once

#include "content_id.h"
#include "socket.h"
#include "types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace filepunch {

/**
 * Control message types. Requests flow client -> server, responses and
 * notifications server -> client (high bit set).
 */
enum class ControlMessageType : uint8_t {
    SOCKET_PING = 0x01,
    PORT_OVERRIDE = 0x02,
    PUBLISH = 0x03,
    SUBSCRIBE = 0x04,
    SOCKET_PING_ACK = 0x81,
    PORT_OVERRIDE_ACK = 0x82,
    PUBLISH_ACK = 0x83,
    INTRODUCTION = 0x84,
    NOT_FOUND = 0x85,
    ERROR = 0xFF
};

const char* control_message_type_to_string(ControlMessageType type);

/**
 * Error codes carried by ERROR replies
 */
enum class ControlErrorCode : uint8_t {
    MALFORMED = 1,      // truncated or trailing bytes, bad address
    UNKNOWN_TYPE = 2,
    INVALID_STATE = 3,  // request not allowed on this connection now
    INTERNAL = 4
};

// type u8 + request_id u32
constexpr size_t CONTROL_HEADER_SIZE = 5;

/**
 * Sent once to each side of a match. Addresses describe the other side;
 * role is the recipient's role in the exchange.
 */
struct Introduction {
    ContentId content_id;
    PeerRole role;
    uint64_t file_size;
    PeerAddress peer;
    SocketAddress server_observed;

    Introduction() : role(PeerRole::SUBSCRIBER), file_size(0) {}
};

/**
 * Control message structure. Only the fields of the given type are meaningful.
 */
struct ControlMessage {
    ControlMessageType type;
    uint32_t request_id;

    ContentId content_id;           // PUBLISH, SUBSCRIBE, NOT_FOUND
    uint64_t file_size;             // PUBLISH
    SocketAddress address;          // local address (PUBLISH, SUBSCRIBE) or observed address (acks)
    uint16_t port;                  // PORT_OVERRIDE, PORT_OVERRIDE_ACK
    Introduction introduction;      // INTRODUCTION
    ControlErrorCode error_code;    // ERROR
    std::string error_message;      // ERROR

    ControlMessage()
        : type(ControlMessageType::SOCKET_PING), request_id(0), file_size(0), port(0),
          error_code(ControlErrorCode::MALFORMED) {}
};

/**
 * Rendezvous control protocol. All integers are big-endian.
 */
class ControlProtocol {
public:
    // Requests
    static ControlMessage create_socket_ping(uint32_t request_id);
    static ControlMessage create_port_override(uint32_t request_id, uint16_t port);
    static ControlMessage create_publish(uint32_t request_id, const ContentId& content_id, uint64_t file_size,
                                         const SocketAddress& local_address);
    static ControlMessage create_subscribe(uint32_t request_id, const ContentId& content_id,
                                           const SocketAddress& local_address);

    // Responses
    static ControlMessage create_socket_ping_ack(uint32_t request_id, const SocketAddress& observed);
    static ControlMessage create_port_override_ack(uint32_t request_id, uint16_t port);
    static ControlMessage create_publish_ack(uint32_t request_id, const SocketAddress& observed);
    static ControlMessage create_introduction(uint32_t request_id, const Introduction& introduction);
    static ControlMessage create_not_found(uint32_t request_id, const ContentId& content_id);
    static ControlMessage create_error(uint32_t request_id, ControlErrorCode code, const std::string& message);

    /**
     * Encode a message
     * @param message Message to encode
     * @param out Encoded bytes
     * @return false if an address cannot be encoded
     */
    static bool encode_message(const ControlMessage& message, std::vector<uint8_t>& out);

    /**
     * Decode a message. Truncated input, trailing bytes and unknown types are rejected.
     * @return Decoded message, or nullptr
     */
    static std::unique_ptr<ControlMessage> decode_message(const std::vector<uint8_t>& data);

    /**
     * Read only the header, so that a reply can be addressed to a request that fails to decode
     */
    static bool decode_header(const std::vector<uint8_t>& data, uint8_t& type, uint32_t& request_id);

    static bool is_request(ControlMessageType type);
    static bool is_known_type(uint8_t type);
};

} // namespace filepunch
