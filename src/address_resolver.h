#pragma once

#include "config.h"
#include "port_mapping.h"
#include "threadmanager.h"
#include "types.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filepunch {

struct ResolverConfig {
    PortMappingMode mode;
    uint16_t forwarded_port;      // external port in FORWARD mode
    uint32_t requested_lifetime;  // seconds asked of the gateway

    ResolverConfig() : mode(PortMappingMode::PCP_NATPMP), forwarded_port(0), requested_lifetime(7200) {}
};

/**
 * Addresses this client can advertise. The external ip is usually unknown
 * here and comes from the server's observation instead.
 */
struct ResolveResult {
    bool success;              // a usable local address was found
    SocketAddress local;
    SocketAddress external;    // specified only when a gateway reported it
    uint16_t external_port;    // mapped or forwarded port, 0 if none
    bool has_lease;
    MappingResult lease;
    std::string gateway;
    ErrorKind error;           // PORT_MAPPING when a mapping attempt failed; not fatal
    std::string error_message;

    ResolveResult() : success(false), external_port(0), has_lease(false), error(ErrorKind::NONE) {}
};

/**
 * Works out the local candidate address and, depending on the mapping mode,
 * an explicit external port. A granted lease is kept alive by one renewal
 * thread until release() or destruction.
 */
class AddressResolver : public ThreadManager {
public:
    explicit AddressResolver(const ResolverConfig& config);

    /**
     * @param protocols Mapping protocols in the order they are tried
     */
    AddressResolver(const ResolverConfig& config, std::vector<std::unique_ptr<PortMappingProtocol>> protocols);
    ~AddressResolver();

    /**
     * PCP first, then NAT-PMP
     */
    static std::vector<std::unique_ptr<PortMappingProtocol>> default_protocols();

    /**
     * Resolve candidate addresses for a bound socket
     * @param bound Address the endpoint socket is bound to; an unspecified ip
     *              ("", 0.0.0.0, ::) is replaced by the address routed toward
     *              the gateway or probe target
     * @param gateway_hint Gateway to ask; empty for the system default route
     * @param probe_target Address used to find the local ip when there is no gateway
     * @return Result with success=false only when no local address could be found
     */
    ResolveResult resolve(const SocketAddress& bound, const std::string& gateway_hint = "",
                          const std::string& probe_target = "");

    /**
     * Stop renewing and delete the mapping at the gateway
     */
    void release();

    bool has_lease() const;
    MappingResult current_lease() const;
    size_t renewal_count() const;

    /**
     * Delay from grant to renewal: max(lifetime / 3, 120 s) before expiry,
     * or half the lifetime when that margin would eat more than half of it.
     */
    static std::chrono::seconds compute_renewal_delay(uint32_t lifetime);

private:
    void renewal_loop();

    ResolverConfig config_;
    std::vector<std::unique_ptr<PortMappingProtocol>> protocols_;

    mutable std::mutex mutex_;
    PortMappingProtocol* active_protocol_;
    MappingResult lease_;
    bool has_lease_;
    std::string gateway_;
    std::string local_ip_;
    size_t renewals_;
};

} // namespace filepunch
