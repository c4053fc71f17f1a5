#include "address_resolver.h"
#include "network_utils.h"
#include "logger.h"
#include <algorithm>

#define LOG_RESOLVER_DEBUG(message) LOG_DEBUG("resolver", message)
#define LOG_RESOLVER_INFO(message)  LOG_INFO("resolver", message)
#define LOG_RESOLVER_WARN(message)  LOG_WARN("resolver", message)
#define LOG_RESOLVER_ERROR(message) LOG_ERROR("resolver", message)

namespace filepunch {

namespace {

constexpr uint32_t MIN_RENEWAL_MARGIN_SECONDS = 120;
constexpr std::chrono::seconds RENEWAL_RETRY_DELAY(30);

bool is_wildcard(const std::string& ip) {
    return ip.empty() || ip == "0.0.0.0" || ip == "::";
}

} // anonymous namespace

AddressResolver::AddressResolver(const ResolverConfig& config)
    : AddressResolver(config, default_protocols()) {
}

AddressResolver::AddressResolver(const ResolverConfig& config,
                                 std::vector<std::unique_ptr<PortMappingProtocol>> protocols)
    : config_(config),
      protocols_(std::move(protocols)),
      active_protocol_(nullptr),
      has_lease_(false),
      renewals_(0) {
}

AddressResolver::~AddressResolver() {
    release();
}

std::vector<std::unique_ptr<PortMappingProtocol>> AddressResolver::default_protocols() {
    std::vector<std::unique_ptr<PortMappingProtocol>> protocols;
    protocols.push_back(std::make_unique<PcpClient>());
    protocols.push_back(std::make_unique<NatPmpClient>());
    return protocols;
}

std::chrono::seconds AddressResolver::compute_renewal_delay(uint32_t lifetime) {
    uint32_t margin = std::max(lifetime / 3, MIN_RENEWAL_MARGIN_SECONDS);
    uint32_t half = lifetime / 2;
    uint32_t delay = lifetime > margin ? lifetime - margin : 0;
    if (delay < half) {
        delay = half;
    }
    return std::chrono::seconds(std::max<uint32_t>(delay, 1));
}

ResolveResult AddressResolver::resolve(const SocketAddress& bound, const std::string& gateway_hint,
                                       const std::string& probe_target) {
    ResolveResult result;

    // A second resolve replaces the previous lease
    release();

    result.gateway = gateway_hint.empty() ? network_utils::get_default_gateway_v4() : gateway_hint;

    if (!is_wildcard(bound.ip)) {
        result.local = bound;
    } else {
        std::string local_ip;
        if (!result.gateway.empty()) {
            local_ip = network_utils::get_local_address_toward(result.gateway);
        }
        if (local_ip.empty() && !probe_target.empty()) {
            local_ip = network_utils::get_local_address_toward(probe_target);
        }
        if (local_ip.empty()) {
            auto interfaces = network_utils::get_local_interfaces_v4();
            if (!interfaces.empty()) {
                local_ip = interfaces.front().ip;
            }
        }
        if (local_ip.empty()) {
            LOG_RESOLVER_ERROR("Cannot determine a local address for port " << bound.port);
            result.error = ErrorKind::DISCOVERY;
            result.error_message = "No local address";
            return result;
        }
        result.local = SocketAddress(local_ip, bound.port);
    }

    result.success = true;
    LOG_RESOLVER_INFO("Local candidate " << result.local);

    switch (config_.mode) {
        case PortMappingMode::NONE:
            LOG_RESOLVER_DEBUG("Port mapping disabled");
            return result;

        case PortMappingMode::FORWARD:
            if (config_.forwarded_port == 0) {
                LOG_RESOLVER_WARN("Forward mode without an external port, advertising the observed port");
                return result;
            }
            result.external_port = config_.forwarded_port;
            LOG_RESOLVER_INFO("Using manually forwarded external port " << config_.forwarded_port);
            return result;

        case PortMappingMode::PCP_NATPMP:
            break;
    }

    if (result.gateway.empty()) {
        result.error = ErrorKind::PORT_MAPPING;
        result.error_message = "No gateway to request a mapping from";
        LOG_RESOLVER_INFO("No default gateway, skipping port mapping");
        return result;
    }

    for (auto& protocol : protocols_) {
        MappingResult lease;
        bool granted = false;
        try {
            granted = protocol->request_mapping(result.gateway, result.local.ip, result.local.port,
                                                result.local.port, config_.requested_lifetime, lease);
        } catch (const std::exception& e) {
            LOG_RESOLVER_ERROR("Exception in " << protocol->name() << " mapping request: " << e.what());
            granted = false;
        }
        if (!granted) {
            LOG_RESOLVER_DEBUG(protocol->name() << " mapping via " << result.gateway << " failed");
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_protocol_ = protocol.get();
            lease_ = lease;
            has_lease_ = true;
            gateway_ = result.gateway;
            local_ip_ = result.local.ip;
        }

        result.has_lease = true;
        result.lease = lease;
        result.external_port = lease.external.port;
        if (!lease.external.ip.empty()) {
            result.external = lease.external;
        }

        LOG_RESOLVER_INFO("Mapped external port " << lease.external.port << " via " << protocol->name()
                          << ", lease " << lease.lifetime << " s");

        if (!add_managed_thread(std::thread(&AddressResolver::renewal_loop, this), "lease-renewal")) {
            LOG_RESOLVER_WARN("Lease renewal thread not started");
        }
        return result;
    }

    result.error = ErrorKind::PORT_MAPPING;
    result.error_message = "Gateway " + result.gateway + " granted no mapping";
    LOG_RESOLVER_INFO("No port mapping available, continuing with local address only");
    return result;
}

void AddressResolver::renewal_loop() {
    LOG_RESOLVER_DEBUG("Lease renewal loop started");

    while (!is_shutdown_requested()) {
        MappingResult lease;
        PortMappingProtocol* protocol = nullptr;
        std::string gateway;
        std::string local_ip;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!has_lease_ || active_protocol_ == nullptr) {
                break;
            }
            lease = lease_;
            protocol = active_protocol_;
            gateway = gateway_;
            local_ip = local_ip_;
        }

        TimePoint due = lease.obtained_at + compute_renewal_delay(lease.lifetime);
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(due - Clock::now());
        if (wait.count() > 0 && wait_for_shutdown(wait)) {
            break;
        }

        MappingResult renewed;
        bool ok = false;
        try {
            ok = protocol->request_mapping(gateway, local_ip, lease.internal_port, lease.external.port,
                                           config_.requested_lifetime, renewed);
        } catch (const std::exception& e) {
            LOG_RESOLVER_ERROR("Exception while renewing lease: " << e.what());
            ok = false;
        }

        if (ok) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (renewed.external.port != lease.external.port) {
                LOG_RESOLVER_WARN("Gateway moved mapping from port " << lease.external.port << " to "
                                  << renewed.external.port);
            }
            lease_ = renewed;
            renewals_++;
            LOG_RESOLVER_DEBUG("Lease renewed for " << renewed.lifetime << " s");
            continue;
        }

        TimePoint expiry = lease.obtained_at + std::chrono::seconds(lease.lifetime);
        if (Clock::now() >= expiry) {
            LOG_RESOLVER_WARN("Port mapping lease expired, external port " << lease.external.port << " is gone");
            std::lock_guard<std::mutex> lock(mutex_);
            has_lease_ = false;
            break;
        }

        LOG_RESOLVER_WARN("Lease renewal failed, retrying in " << RENEWAL_RETRY_DELAY.count() << " s");
        if (wait_for_shutdown(RENEWAL_RETRY_DELAY)) {
            break;
        }
    }

    LOG_RESOLVER_DEBUG("Lease renewal loop stopped");
}

void AddressResolver::release() {
    shutdown_all_threads();
    join_all_active_threads();
    reset_shutdown();

    MappingResult lease;
    PortMappingProtocol* protocol = nullptr;
    std::string gateway;
    std::string local_ip;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_lease_ || active_protocol_ == nullptr) {
            has_lease_ = false;
            return;
        }
        lease = lease_;
        protocol = active_protocol_;
        gateway = gateway_;
        local_ip = local_ip_;
        has_lease_ = false;
        active_protocol_ = nullptr;
    }

    try {
        if (!protocol->release_mapping(gateway, local_ip, lease)) {
            LOG_RESOLVER_WARN("Gateway did not confirm release of port " << lease.external.port);
        }
    } catch (const std::exception& e) {
        LOG_RESOLVER_ERROR("Exception while releasing lease: " << e.what());
    }
}

bool AddressResolver::has_lease() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_lease_;
}

MappingResult AddressResolver::current_lease() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lease_;
}

size_t AddressResolver::renewal_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return renewals_;
}

} // namespace filepunch
