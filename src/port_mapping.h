#pragma once

#include "socket.h"
#include "types.h"
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace filepunch {

// Gateway port shared by NAT-PMP and PCP
constexpr uint16_t PORT_MAPPING_SERVER_PORT = 5351;

/**
 * A lease granted by the gateway
 */
struct MappingResult {
    SocketAddress external;     // public ip:port, ip may be empty if the gateway did not report it
    uint16_t internal_port;
    uint32_t lifetime;          // seconds granted, 0 after a release
    uint32_t epoch;             // gateway epoch, seconds since its mapping table was reset
    std::string protocol;       // "pcp" or "natpmp"
    TimePoint obtained_at;

    MappingResult() : internal_port(0), lifetime(0), epoch(0) {}
};

/**
 * One explicit port mapping protocol spoken to the default gateway.
 * A renewal is a new request for the same internal port, a release is a
 * request with lifetime 0.
 */
class PortMappingProtocol {
public:
    virtual ~PortMappingProtocol() = default;

    virtual std::string name() const = 0;

    /**
     * Ask the gateway to forward an external UDP port to our internal port
     * @param gateway Gateway address
     * @param local_ip Address of this host on the gateway's network
     * @param internal_port Local UDP port
     * @param suggested_external Preferred external port (0 for any)
     * @param lifetime Requested lease in seconds
     * @param result Filled on success
     * @return true if the gateway granted a mapping
     */
    virtual bool request_mapping(const std::string& gateway, const std::string& local_ip,
                                 uint16_t internal_port, uint16_t suggested_external,
                                 uint32_t lifetime, MappingResult& result) = 0;

    /**
     * Delete a mapping
     * @return true if the gateway acknowledged the release
     */
    virtual bool release_mapping(const std::string& gateway, const std::string& local_ip,
                                 const MappingResult& mapping) = 0;
};

/**
 * Retry policy for one gateway exchange
 */
struct GatewayRequestOptions {
    uint16_t port;
    int timeout_ms;
    int attempts;

    GatewayRequestOptions() : port(PORT_MAPPING_SERVER_PORT), timeout_ms(250), attempts(3) {}
};

//=============================================================================
// NAT-PMP (RFC 6886)
//=============================================================================

class NatPmpClient : public PortMappingProtocol {
public:
    explicit NatPmpClient(const GatewayRequestOptions& options = GatewayRequestOptions());

    std::string name() const override { return "natpmp"; }

    bool request_mapping(const std::string& gateway, const std::string& local_ip,
                         uint16_t internal_port, uint16_t suggested_external,
                         uint32_t lifetime, MappingResult& result) override;

    bool release_mapping(const std::string& gateway, const std::string& local_ip,
                         const MappingResult& mapping) override;

    // Message layouts, exposed for tests
    static std::vector<uint8_t> build_external_address_request();
    static bool parse_external_address_response(const std::vector<uint8_t>& data, std::string& external_ip,
                                                uint32_t& epoch);
    static std::vector<uint8_t> build_map_request(uint16_t internal_port, uint16_t suggested_external,
                                                  uint32_t lifetime);
    static bool parse_map_response(const std::vector<uint8_t>& data, uint16_t internal_port,
                                   MappingResult& result);

private:
    GatewayRequestOptions options_;
};

//=============================================================================
// PCP (RFC 6887), MAP opcode only
//=============================================================================

using PcpNonce = std::array<uint8_t, 12>;

class PcpClient : public PortMappingProtocol {
public:
    explicit PcpClient(const GatewayRequestOptions& options = GatewayRequestOptions());

    std::string name() const override { return "pcp"; }

    bool request_mapping(const std::string& gateway, const std::string& local_ip,
                         uint16_t internal_port, uint16_t suggested_external,
                         uint32_t lifetime, MappingResult& result) override;

    bool release_mapping(const std::string& gateway, const std::string& local_ip,
                         const MappingResult& mapping) override;

    static std::vector<uint8_t> build_map_request(const std::string& client_ip, uint16_t internal_port,
                                                  uint16_t suggested_external, uint32_t lifetime,
                                                  const PcpNonce& nonce);
    static bool parse_map_response(const std::vector<uint8_t>& data, const PcpNonce& nonce,
                                   MappingResult& result);

private:
    GatewayRequestOptions options_;
    PcpNonce last_nonce_;
};

/**
 * Send a request to the gateway and wait for a response the validator accepts.
 * Responses from any other sender are ignored.
 * @return true if an accepted response arrived within the retry budget
 */
bool gateway_request(const std::string& gateway, const std::vector<uint8_t>& request,
                     const GatewayRequestOptions& options,
                     const std::function<bool(const std::vector<uint8_t>&)>& accept);

} // namespace filepunch
