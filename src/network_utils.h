#pragma once

#include <string>
#include <vector>

namespace filepunch {
namespace network_utils {

/**
 * One local interface as reported to the core: name, address and the
 * gateway reachable through it (empty when it carries no default route).
 */
struct NetworkInterface {
    std::string name;
    std::string ip;
    std::string gateway;
};

/**
 * Resolve hostname to a numeric address, preferring IPv4
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 *
 * Example usage:
 *   std::string ip = network_utils::resolve_hostname("rendezvous.example.org");
 *   std::string ip2 = network_utils::resolve_hostname("192.168.1.1"); // returns same IP
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Check if a string is a valid IPv6 address
 * @param ip_str The string to validate
 * @return true if valid IPv6 address, false otherwise
 */
bool is_valid_ipv6(const std::string& ip_str);

/**
 * Enumerate IPv4 interfaces that are up and not loopback, with the default
 * gateway attached to the interface that owns the default route
 * @return Interfaces in kernel order
 */
std::vector<NetworkInterface> get_local_interfaces_v4();

/**
 * Read the IPv4 default gateway from the routing table
 * @return Gateway address, or empty string if none is configured
 */
std::string get_default_gateway_v4();

/**
 * Find the local address the kernel would use to reach a remote address.
 * Connects a throwaway UDP socket; nothing is sent.
 * @param remote_ip Numeric remote address
 * @return Local address, or empty string on error
 */
std::string get_local_address_toward(const std::string& remote_ip);

} // namespace network_utils
} // namespace filepunch
