#include "port_mapping.h"
#include "wire_format.h"
#include "logger.h"
#include <openssl/rand.h>
#include <cstring>

#define LOG_PORTMAP_DEBUG(message) LOG_DEBUG("resolver", message)
#define LOG_PORTMAP_INFO(message)  LOG_INFO("resolver", message)
#define LOG_PORTMAP_WARN(message)  LOG_WARN("resolver", message)
#define LOG_PORTMAP_ERROR(message) LOG_ERROR("resolver", message)

namespace filepunch {

namespace {

constexpr uint8_t NATPMP_VERSION = 0;
constexpr uint8_t NATPMP_OP_EXTERNAL_ADDRESS = 0;
constexpr uint8_t NATPMP_OP_MAP_UDP = 1;
constexpr uint8_t NATPMP_RESPONSE_BIT = 0x80;
constexpr size_t NATPMP_EXTERNAL_RESPONSE_SIZE = 12;
constexpr size_t NATPMP_MAP_RESPONSE_SIZE = 16;

constexpr uint8_t PCP_VERSION = 2;
constexpr uint8_t PCP_OP_MAP = 1;
constexpr uint8_t PCP_RESPONSE_BIT = 0x80;
constexpr uint8_t PCP_PROTOCOL_UDP = 17;
constexpr size_t PCP_MAP_PACKET_SIZE = 60;

// ::ffff:a.b.c.d, or the raw address for IPv6
bool to_pcp_address(const std::string& ip, uint8_t out[16]) {
    std::memset(out, 0, 16);
    if (ip.find(':') != std::string::npos) {
        return inet_pton(AF_INET6, ip.c_str(), out) == 1;
    }
    out[10] = 0xff;
    out[11] = 0xff;
    return inet_pton(AF_INET, ip.c_str(), out + 12) == 1;
}

std::string from_pcp_address(const uint8_t raw[16]) {
    static const uint8_t mapped_prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    char text[INET6_ADDRSTRLEN] = {0};
    if (std::memcmp(raw, mapped_prefix, sizeof(mapped_prefix)) == 0) {
        if (inet_ntop(AF_INET, raw + 12, text, sizeof(text)) == nullptr) {
            return "";
        }
    } else if (inet_ntop(AF_INET6, raw, text, sizeof(text)) == nullptr) {
        return "";
    }
    std::string ip(text);
    return ip == "0.0.0.0" || ip == "::" ? "" : ip;
}

const char* natpmp_result_to_string(uint16_t code) {
    switch (code) {
        case 0: return "success";
        case 1: return "unsupported version";
        case 2: return "not authorized";
        case 3: return "network failure";
        case 4: return "out of resources";
        case 5: return "unsupported opcode";
        default: return "unknown result";
    }
}

const char* pcp_result_to_string(uint8_t code) {
    switch (code) {
        case 0: return "success";
        case 1: return "unsupported version";
        case 2: return "not authorized";
        case 3: return "malformed request";
        case 4: return "unsupported opcode";
        case 5: return "unsupported option";
        case 6: return "malformed option";
        case 7: return "network failure";
        case 8: return "no resources";
        case 9: return "unsupported protocol";
        case 10: return "user exceeded quota";
        case 11: return "cannot provide external";
        case 12: return "address mismatch";
        case 13: return "excessive remote peers";
        default: return "unknown result";
    }
}

} // anonymous namespace

bool gateway_request(const std::string& gateway, const std::vector<uint8_t>& request,
                     const GatewayRequestOptions& options,
                     const std::function<bool(const std::vector<uint8_t>&)>& accept) {
    if (gateway.empty() || request.empty()) {
        return false;
    }

    socket_t sock = create_udp_socket(gateway.find(':') != std::string::npos ? "::" : "0.0.0.0", 0);
    if (!is_valid_socket(sock)) {
        LOG_PORTMAP_ERROR("Failed to create socket for gateway request");
        return false;
    }

    SocketAddress destination(gateway, options.port);
    bool accepted = false;

    for (int attempt = 0; attempt < options.attempts && !accepted; ++attempt) {
        if (send_udp_data(sock, request, destination) < 0) {
            LOG_PORTMAP_WARN("Failed to send request to gateway " << destination);
            break;
        }

        TimePoint deadline = Clock::now() + std::chrono::milliseconds(options.timeout_ms);
        while (!accepted) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                break;
            }

            SocketAddress sender;
            std::vector<uint8_t> response = receive_udp_data_with_timeout(sock, 1100,
                                                                          static_cast<int>(remaining.count()),
                                                                          sender);
            if (response.empty()) {
                continue;
            }
            if (sender.ip != gateway) {
                LOG_PORTMAP_DEBUG("Ignoring datagram from " << sender << " while waiting for " << gateway);
                continue;
            }
            accepted = accept(response);
        }
    }

    close_socket(sock);
    return accepted;
}

//=============================================================================
// NatPmpClient
//=============================================================================

NatPmpClient::NatPmpClient(const GatewayRequestOptions& options) : options_(options) {
}

std::vector<uint8_t> NatPmpClient::build_external_address_request() {
    return std::vector<uint8_t>{NATPMP_VERSION, NATPMP_OP_EXTERNAL_ADDRESS};
}

bool NatPmpClient::parse_external_address_response(const std::vector<uint8_t>& data, std::string& external_ip,
                                                   uint32_t& epoch) {
    if (data.size() < NATPMP_EXTERNAL_RESPONSE_SIZE) {
        return false;
    }

    ByteReader reader(data);
    uint8_t version = 0;
    uint8_t opcode = 0;
    uint16_t result_code = 0;
    uint32_t seconds = 0;
    uint8_t raw[4];
    if (!reader.read_uint8(version) || !reader.read_uint8(opcode) || !reader.read_uint16(result_code) ||
        !reader.read_uint32(seconds) || !reader.read_bytes(raw, sizeof(raw))) {
        return false;
    }

    if (version != NATPMP_VERSION || opcode != (NATPMP_RESPONSE_BIT | NATPMP_OP_EXTERNAL_ADDRESS)) {
        return false;
    }
    if (result_code != 0) {
        LOG_PORTMAP_WARN("NAT-PMP external address request failed: " << natpmp_result_to_string(result_code));
        return false;
    }

    char text[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, raw, text, sizeof(text)) == nullptr) {
        return false;
    }
    external_ip = text;
    epoch = seconds;
    return true;
}

std::vector<uint8_t> NatPmpClient::build_map_request(uint16_t internal_port, uint16_t suggested_external,
                                                     uint32_t lifetime) {
    ByteWriter writer(12);
    writer.write_uint8(NATPMP_VERSION);
    writer.write_uint8(NATPMP_OP_MAP_UDP);
    writer.write_uint16(0);
    writer.write_uint16(internal_port);
    writer.write_uint16(suggested_external);
    writer.write_uint32(lifetime);
    return writer.release();
}

bool NatPmpClient::parse_map_response(const std::vector<uint8_t>& data, uint16_t internal_port,
                                      MappingResult& result) {
    if (data.size() < NATPMP_MAP_RESPONSE_SIZE) {
        return false;
    }

    ByteReader reader(data);
    uint8_t version = 0;
    uint8_t opcode = 0;
    uint16_t result_code = 0;
    uint32_t epoch = 0;
    uint16_t iport = 0;
    uint16_t eport = 0;
    uint32_t lifetime = 0;
    if (!reader.read_uint8(version) || !reader.read_uint8(opcode) || !reader.read_uint16(result_code) ||
        !reader.read_uint32(epoch) || !reader.read_uint16(iport) || !reader.read_uint16(eport) ||
        !reader.read_uint32(lifetime)) {
        return false;
    }

    if (version != NATPMP_VERSION || opcode != (NATPMP_RESPONSE_BIT | NATPMP_OP_MAP_UDP)) {
        return false;
    }
    if (iport != internal_port) {
        LOG_PORTMAP_DEBUG("NAT-PMP response for port " << iport << ", expected " << internal_port);
        return false;
    }
    if (result_code != 0) {
        LOG_PORTMAP_WARN("NAT-PMP mapping refused: " << natpmp_result_to_string(result_code));
        return false;
    }

    result.internal_port = iport;
    result.external.port = eport;
    result.lifetime = lifetime;
    result.epoch = epoch;
    result.protocol = "natpmp";
    return true;
}

bool NatPmpClient::request_mapping(const std::string& gateway, const std::string& local_ip,
                                   uint16_t internal_port, uint16_t suggested_external,
                                   uint32_t lifetime, MappingResult& result) {
    (void)local_ip;

    std::string external_ip;
    uint32_t epoch = 0;
    bool have_ip = gateway_request(gateway, build_external_address_request(), options_,
                                   [&external_ip, &epoch](const std::vector<uint8_t>& response) {
                                       return parse_external_address_response(response, external_ip, epoch);
                                   });
    if (!have_ip) {
        LOG_PORTMAP_DEBUG("No NAT-PMP external address from " << gateway);
        return false;
    }

    MappingResult mapping;
    bool mapped = gateway_request(gateway, build_map_request(internal_port, suggested_external, lifetime), options_,
                                  [&mapping, internal_port](const std::vector<uint8_t>& response) {
                                      return parse_map_response(response, internal_port, mapping);
                                  });
    if (!mapped) {
        LOG_PORTMAP_DEBUG("No NAT-PMP mapping from " << gateway);
        return false;
    }

    mapping.external.ip = external_ip;
    mapping.obtained_at = Clock::now();
    result = mapping;

    LOG_PORTMAP_INFO("NAT-PMP mapped " << result.external << " -> :" << internal_port << " for "
                     << result.lifetime << " s");
    return true;
}

bool NatPmpClient::release_mapping(const std::string& gateway, const std::string& local_ip,
                                   const MappingResult& mapping) {
    (void)local_ip;

    MappingResult released;
    uint16_t internal_port = mapping.internal_port;
    bool ok = gateway_request(gateway, build_map_request(internal_port, 0, 0), options_,
                              [&released, internal_port](const std::vector<uint8_t>& response) {
                                  return parse_map_response(response, internal_port, released);
                              });
    if (ok) {
        LOG_PORTMAP_INFO("NAT-PMP mapping for :" << internal_port << " released");
    }
    return ok;
}

//=============================================================================
// PcpClient
//=============================================================================

PcpClient::PcpClient(const GatewayRequestOptions& options) : options_(options) {
    last_nonce_.fill(0);
}

std::vector<uint8_t> PcpClient::build_map_request(const std::string& client_ip, uint16_t internal_port,
                                                  uint16_t suggested_external, uint32_t lifetime,
                                                  const PcpNonce& nonce) {
    uint8_t client[16];
    if (!to_pcp_address(client_ip, client)) {
        return std::vector<uint8_t>();
    }

    // No preference for the external address, in the client's family
    uint8_t suggested_ip[16];
    to_pcp_address(client_ip.find(':') != std::string::npos ? "::" : "0.0.0.0", suggested_ip);

    ByteWriter writer(PCP_MAP_PACKET_SIZE);
    writer.write_uint8(PCP_VERSION);
    writer.write_uint8(PCP_OP_MAP);
    writer.write_uint16(0);
    writer.write_uint32(lifetime);
    writer.write_bytes(client, sizeof(client));

    writer.write_bytes(nonce.data(), nonce.size());
    writer.write_uint8(PCP_PROTOCOL_UDP);
    writer.write_zeros(3);
    writer.write_uint16(internal_port);
    writer.write_uint16(suggested_external);
    writer.write_bytes(suggested_ip, sizeof(suggested_ip));
    return writer.release();
}

bool PcpClient::parse_map_response(const std::vector<uint8_t>& data, const PcpNonce& nonce,
                                   MappingResult& result) {
    if (data.size() < PCP_MAP_PACKET_SIZE) {
        return false;
    }

    ByteReader reader(data);
    uint8_t version = 0;
    uint8_t opcode = 0;
    uint8_t reserved = 0;
    uint8_t result_code = 0;
    uint32_t lifetime = 0;
    uint32_t epoch = 0;
    if (!reader.read_uint8(version) || !reader.read_uint8(opcode) || !reader.read_uint8(reserved) ||
        !reader.read_uint8(result_code) || !reader.read_uint32(lifetime) || !reader.read_uint32(epoch) ||
        !reader.skip(12)) {
        return false;
    }

    if (version != PCP_VERSION || opcode != (PCP_RESPONSE_BIT | PCP_OP_MAP)) {
        return false;
    }

    PcpNonce echoed;
    uint8_t protocol = 0;
    uint16_t internal_port = 0;
    uint16_t external_port = 0;
    uint8_t external_ip[16];
    if (!reader.read_bytes(echoed.data(), echoed.size()) || !reader.read_uint8(protocol) || !reader.skip(3) ||
        !reader.read_uint16(internal_port) || !reader.read_uint16(external_port) ||
        !reader.read_bytes(external_ip, sizeof(external_ip))) {
        return false;
    }

    if (echoed != nonce) {
        LOG_PORTMAP_DEBUG("PCP response nonce mismatch");
        return false;
    }
    if (result_code != 0) {
        LOG_PORTMAP_WARN("PCP mapping refused: " << pcp_result_to_string(result_code));
        return false;
    }
    if (protocol != PCP_PROTOCOL_UDP) {
        return false;
    }

    result.internal_port = internal_port;
    result.external = SocketAddress(from_pcp_address(external_ip), external_port);
    result.lifetime = lifetime;
    result.epoch = epoch;
    result.protocol = "pcp";
    return true;
}

bool PcpClient::request_mapping(const std::string& gateway, const std::string& local_ip,
                                uint16_t internal_port, uint16_t suggested_external,
                                uint32_t lifetime, MappingResult& result) {
    PcpNonce nonce;
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        LOG_PORTMAP_ERROR("Failed to generate PCP nonce");
        return false;
    }

    std::vector<uint8_t> request = build_map_request(local_ip, internal_port, suggested_external, lifetime, nonce);
    if (request.empty()) {
        LOG_PORTMAP_WARN("Cannot build PCP request for client address '" << local_ip << "'");
        return false;
    }

    MappingResult mapping;
    bool mapped = gateway_request(gateway, request, options_,
                                  [&mapping, &nonce](const std::vector<uint8_t>& response) {
                                      return parse_map_response(response, nonce, mapping);
                                  });
    if (!mapped) {
        LOG_PORTMAP_DEBUG("No PCP mapping from " << gateway);
        return false;
    }

    last_nonce_ = nonce;
    mapping.obtained_at = Clock::now();
    result = mapping;

    LOG_PORTMAP_INFO("PCP mapped " << result.external << " -> :" << internal_port << " for "
                     << result.lifetime << " s");
    return true;
}

bool PcpClient::release_mapping(const std::string& gateway, const std::string& local_ip,
                                const MappingResult& mapping) {
    // A delete must carry the nonce that created the mapping
    std::vector<uint8_t> request = build_map_request(local_ip, mapping.internal_port, 0, 0, last_nonce_);
    if (request.empty()) {
        return false;
    }

    MappingResult released;
    const PcpNonce nonce = last_nonce_;
    bool ok = gateway_request(gateway, request, options_,
                              [&released, &nonce](const std::vector<uint8_t>& response) {
                                  return parse_map_response(response, nonce, released);
                              });
    if (ok) {
        LOG_PORTMAP_INFO("PCP mapping for :" << mapping.internal_port << " released");
    }
    return ok;
}

} // namespace filepunch
