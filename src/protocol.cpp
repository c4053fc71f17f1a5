#include "protocol.h"
#include "logger.h"
#include "wire_format.h"

#define LOG_PROTOCOL_DEBUG(message) LOG_DEBUG("protocol", message)
#define LOG_PROTOCOL_WARN(message)  LOG_WARN("protocol", message)

namespace filepunch {

const char* control_message_type_to_string(ControlMessageType type) {
    switch (type) {
        case ControlMessageType::SOCKET_PING: return "SocketPing";
        case ControlMessageType::PORT_OVERRIDE: return "PortOverride";
        case ControlMessageType::PUBLISH: return "Publish";
        case ControlMessageType::SUBSCRIBE: return "Subscribe";
        case ControlMessageType::SOCKET_PING_ACK: return "SocketPingAck";
        case ControlMessageType::PORT_OVERRIDE_ACK: return "PortOverrideAck";
        case ControlMessageType::PUBLISH_ACK: return "PublishAck";
        case ControlMessageType::INTRODUCTION: return "Introduction";
        case ControlMessageType::NOT_FOUND: return "NotFound";
        case ControlMessageType::ERROR: return "Error";
    }
    return "Unknown";
}

//=============================================================================
// Message constructors
//=============================================================================

ControlMessage ControlProtocol::create_socket_ping(uint32_t request_id) {
    ControlMessage message;
    message.type = ControlMessageType::SOCKET_PING;
    message.request_id = request_id;
    return message;
}

ControlMessage ControlProtocol::create_port_override(uint32_t request_id, uint16_t port) {
    ControlMessage message;
    message.type = ControlMessageType::PORT_OVERRIDE;
    message.request_id = request_id;
    message.port = port;
    return message;
}

ControlMessage ControlProtocol::create_publish(uint32_t request_id, const ContentId& content_id, uint64_t file_size,
                                               const SocketAddress& local_address) {
    ControlMessage message;
    message.type = ControlMessageType::PUBLISH;
    message.request_id = request_id;
    message.content_id = content_id;
    message.file_size = file_size;
    message.address = local_address;
    return message;
}

ControlMessage ControlProtocol::create_subscribe(uint32_t request_id, const ContentId& content_id,
                                                 const SocketAddress& local_address) {
    ControlMessage message;
    message.type = ControlMessageType::SUBSCRIBE;
    message.request_id = request_id;
    message.content_id = content_id;
    message.address = local_address;
    return message;
}

ControlMessage ControlProtocol::create_socket_ping_ack(uint32_t request_id, const SocketAddress& observed) {
    ControlMessage message;
    message.type = ControlMessageType::SOCKET_PING_ACK;
    message.request_id = request_id;
    message.address = observed;
    return message;
}

ControlMessage ControlProtocol::create_port_override_ack(uint32_t request_id, uint16_t port) {
    ControlMessage message;
    message.type = ControlMessageType::PORT_OVERRIDE_ACK;
    message.request_id = request_id;
    message.port = port;
    return message;
}

ControlMessage ControlProtocol::create_publish_ack(uint32_t request_id, const SocketAddress& observed) {
    ControlMessage message;
    message.type = ControlMessageType::PUBLISH_ACK;
    message.request_id = request_id;
    message.address = observed;
    return message;
}

ControlMessage ControlProtocol::create_introduction(uint32_t request_id, const Introduction& introduction) {
    ControlMessage message;
    message.type = ControlMessageType::INTRODUCTION;
    message.request_id = request_id;
    message.content_id = introduction.content_id;
    message.introduction = introduction;
    return message;
}

ControlMessage ControlProtocol::create_not_found(uint32_t request_id, const ContentId& content_id) {
    ControlMessage message;
    message.type = ControlMessageType::NOT_FOUND;
    message.request_id = request_id;
    message.content_id = content_id;
    return message;
}

ControlMessage ControlProtocol::create_error(uint32_t request_id, ControlErrorCode code, const std::string& text) {
    ControlMessage message;
    message.type = ControlMessageType::ERROR;
    message.request_id = request_id;
    message.error_code = code;
    message.error_message = text;
    return message;
}

//=============================================================================
// Encoding
//=============================================================================

bool ControlProtocol::encode_message(const ControlMessage& message, std::vector<uint8_t>& out) {
    ByteWriter writer(64);
    writer.write_uint8(static_cast<uint8_t>(message.type));
    writer.write_uint32(message.request_id);

    bool ok = true;
    switch (message.type) {
        case ControlMessageType::SOCKET_PING:
            break;

        case ControlMessageType::PORT_OVERRIDE:
        case ControlMessageType::PORT_OVERRIDE_ACK:
            writer.write_uint16(message.port);
            break;

        case ControlMessageType::PUBLISH:
            writer.write_bytes(message.content_id.bytes.data(), CONTENT_ID_SIZE);
            writer.write_uint64(message.file_size);
            ok = writer.write_address(message.address);
            break;

        case ControlMessageType::SUBSCRIBE:
            writer.write_bytes(message.content_id.bytes.data(), CONTENT_ID_SIZE);
            ok = writer.write_address(message.address);
            break;

        case ControlMessageType::SOCKET_PING_ACK:
        case ControlMessageType::PUBLISH_ACK:
            ok = writer.write_address(message.address);
            break;

        case ControlMessageType::INTRODUCTION: {
            const Introduction& intro = message.introduction;
            writer.write_bytes(intro.content_id.bytes.data(), CONTENT_ID_SIZE);
            writer.write_uint8(static_cast<uint8_t>(intro.role));
            writer.write_uint64(intro.file_size);
            ok = writer.write_address(intro.peer.local) &&
                 writer.write_address(intro.peer.external) &&
                 writer.write_address(intro.server_observed);
            break;
        }

        case ControlMessageType::NOT_FOUND:
            writer.write_bytes(message.content_id.bytes.data(), CONTENT_ID_SIZE);
            break;

        case ControlMessageType::ERROR:
            writer.write_uint8(static_cast<uint8_t>(message.error_code));
            writer.write_string(message.error_message);
            break;
    }

    if (!ok) {
        LOG_PROTOCOL_WARN("Cannot encode " << control_message_type_to_string(message.type)
                          << ": address is not numeric");
        return false;
    }

    out = writer.release();
    return true;
}

bool ControlProtocol::decode_header(const std::vector<uint8_t>& data, uint8_t& type, uint32_t& request_id) {
    ByteReader reader(data);
    return reader.read_uint8(type) && reader.read_uint32(request_id);
}

std::unique_ptr<ControlMessage> ControlProtocol::decode_message(const std::vector<uint8_t>& data) {
    ByteReader reader(data);
    uint8_t raw_type = 0;
    auto message = std::make_unique<ControlMessage>();

    if (!reader.read_uint8(raw_type) || !reader.read_uint32(message->request_id)) {
        LOG_PROTOCOL_DEBUG("Control message shorter than its header (" << data.size() << " bytes)");
        return nullptr;
    }

    if (!is_known_type(raw_type)) {
        LOG_PROTOCOL_DEBUG("Unknown control message type 0x" << std::hex << static_cast<int>(raw_type));
        return nullptr;
    }
    message->type = static_cast<ControlMessageType>(raw_type);

    auto read_content_id = [&](ContentId& id) {
        return reader.read_bytes(id.bytes.data(), CONTENT_ID_SIZE);
    };

    bool ok = false;
    switch (message->type) {
        case ControlMessageType::SOCKET_PING:
            ok = true;
            break;

        case ControlMessageType::PORT_OVERRIDE:
        case ControlMessageType::PORT_OVERRIDE_ACK:
            ok = reader.read_uint16(message->port);
            break;

        case ControlMessageType::PUBLISH:
            ok = read_content_id(message->content_id) &&
                 reader.read_uint64(message->file_size) &&
                 reader.read_address(message->address);
            break;

        case ControlMessageType::SUBSCRIBE:
            ok = read_content_id(message->content_id) &&
                 reader.read_address(message->address);
            break;

        case ControlMessageType::SOCKET_PING_ACK:
        case ControlMessageType::PUBLISH_ACK:
            ok = reader.read_address(message->address);
            break;

        case ControlMessageType::INTRODUCTION: {
            Introduction& intro = message->introduction;
            uint8_t role = 0;
            ok = read_content_id(intro.content_id) &&
                 reader.read_uint8(role) &&
                 reader.read_uint64(intro.file_size) &&
                 reader.read_address(intro.peer.local) &&
                 reader.read_address(intro.peer.external) &&
                 reader.read_address(intro.server_observed);
            if (ok && role > static_cast<uint8_t>(PeerRole::SUBSCRIBER)) {
                ok = false;
            }
            intro.role = static_cast<PeerRole>(role);
            message->content_id = intro.content_id;
            break;
        }

        case ControlMessageType::NOT_FOUND:
            ok = read_content_id(message->content_id);
            break;

        case ControlMessageType::ERROR: {
            uint8_t code = 0;
            ok = reader.read_uint8(code) && reader.read_string(message->error_message);
            message->error_code = static_cast<ControlErrorCode>(code);
            break;
        }
    }

    if (!ok || !reader.at_end()) {
        LOG_PROTOCOL_DEBUG("Malformed " << control_message_type_to_string(message->type)
                           << " (" << data.size() << " bytes)");
        return nullptr;
    }

    return message;
}

bool ControlProtocol::is_request(ControlMessageType type) {
    return (static_cast<uint8_t>(type) & 0x80) == 0;
}

bool ControlProtocol::is_known_type(uint8_t type) {
    switch (type) {
        case 0x01: case 0x02: case 0x03: case 0x04:
        case 0x81: case 0x82: case 0x83: case 0x84: case 0x85:
        case 0xFF:
            return true;
        default:
            return false;
    }
}

} // namespace filepunch
