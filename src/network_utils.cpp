#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <ifaddrs.h>
    #include <net/if.h>
    #include <unistd.h>
#endif

#include "network_utils.h"
#include "socket.h"
#include "logger.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_INFO(message)  LOG_INFO("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace filepunch {
namespace network_utils {

namespace {

struct DefaultRoute {
    std::string interface_name;
    std::string gateway;
};

// /proc/net/route lists destination and gateway as little-endian hex words
bool read_default_route(DefaultRoute& route) {
#ifdef __linux__
    std::ifstream table("/proc/net/route");
    if (!table.is_open()) {
        return false;
    }

    std::string line;
    std::getline(table, line); // header
    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway;
        if (!(fields >> iface >> destination >> gateway)) {
            continue;
        }
        if (destination != "00000000") {
            continue;
        }

        unsigned long raw = std::strtoul(gateway.c_str(), nullptr, 16);
        in_addr addr{};
        addr.s_addr = static_cast<uint32_t>(raw);
        char buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));

        route.interface_name = iface;
        route.gateway = buffer;
        return true;
    }
#else
    (void)route;
#endif
    return false;
}

} // anonymous namespace

std::string resolve_hostname(const std::string& hostname) {
    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    if (is_valid_ipv4(hostname) || is_valid_ipv6(hostname)) {
        return hostname;
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
        return "";
    }

    std::string resolved;
    std::string fallback_v6;
    for (addrinfo* entry = result; entry != nullptr; entry = entry->ai_next) {
        char ip_str[INET6_ADDRSTRLEN] = {0};
        if (entry->ai_family == AF_INET) {
            auto* addr_in = reinterpret_cast<sockaddr_in*>(entry->ai_addr);
            inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, sizeof(ip_str));
            resolved = ip_str;
            break;
        }
        if (entry->ai_family == AF_INET6 && fallback_v6.empty()) {
            auto* addr_in6 = reinterpret_cast<sockaddr_in6*>(entry->ai_addr);
            inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, sizeof(ip_str));
            fallback_v6 = ip_str;
        }
    }
    freeaddrinfo(result);

    if (resolved.empty()) {
        resolved = fallback_v6;
    }

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << resolved);
    return resolved;
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_valid_ipv6(const std::string& ip_str) {
    struct sockaddr_in6 sa;
    return inet_pton(AF_INET6, ip_str.c_str(), &sa.sin6_addr) == 1;
}

std::vector<NetworkInterface> get_local_interfaces_v4() {
    std::vector<NetworkInterface> interfaces;

#ifndef _WIN32
    DefaultRoute route;
    bool has_route = read_default_route(route);

    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        LOG_NETUTILS_ERROR("getifaddrs failed: " << strerror(errno));
        return interfaces;
    }

    for (struct ifaddrs* entry = list; entry != nullptr; entry = entry->ifa_next) {
        if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((entry->ifa_flags & IFF_UP) == 0 || (entry->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        char ip_str[INET_ADDRSTRLEN] = {0};
        auto* addr_in = reinterpret_cast<sockaddr_in*>(entry->ifa_addr);
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, sizeof(ip_str));

        NetworkInterface iface;
        iface.name = entry->ifa_name;
        iface.ip = ip_str;
        if (has_route && route.interface_name == iface.name) {
            iface.gateway = route.gateway;
        }
        interfaces.push_back(iface);
    }

    freeifaddrs(list);
#endif

    LOG_NETUTILS_DEBUG("Found " << interfaces.size() << " IPv4 interfaces");
    return interfaces;
}

std::string get_default_gateway_v4() {
    DefaultRoute route;
    if (!read_default_route(route)) {
        LOG_NETUTILS_DEBUG("No IPv4 default route found");
        return "";
    }
    return route.gateway;
}

std::string get_local_address_toward(const std::string& remote_ip) {
    const bool ipv6 = is_valid_ipv6(remote_ip);
    if (!ipv6 && !is_valid_ipv4(remote_ip)) {
        return "";
    }

    socket_t probe = socket(ipv6 ? AF_INET6 : AF_INET, SOCK_DGRAM, 0);
    if (probe == INVALID_SOCKET_VALUE) {
        return "";
    }

    sockaddr_storage storage{};
    socklen_t length = 0;
    if (ipv6) {
        auto* addr6 = reinterpret_cast<sockaddr_in6*>(&storage);
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(9);
        inet_pton(AF_INET6, remote_ip.c_str(), &addr6->sin6_addr);
        length = sizeof(sockaddr_in6);
    } else {
        auto* addr4 = reinterpret_cast<sockaddr_in*>(&storage);
        addr4->sin_family = AF_INET;
        addr4->sin_port = htons(9);
        inet_pton(AF_INET, remote_ip.c_str(), &addr4->sin_addr);
        length = sizeof(sockaddr_in);
    }

    std::string local;
    if (connect(probe, reinterpret_cast<sockaddr*>(&storage), length) == 0) {
        local = get_bound_address(probe).ip;
    } else {
        LOG_NETUTILS_DEBUG("No route toward " << remote_ip);
    }

    close_socket(probe);
    return local;
}

} // namespace network_utils
} // namespace filepunch
