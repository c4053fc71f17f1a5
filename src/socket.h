#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <iosfwd>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace filepunch {

/**
 * UDP socket endpoint: a numeric IPv4 or IPv6 address and a port.
 * An empty ip means "unspecified".
 */
struct SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : port(0) {}
    SocketAddress(const std::string& ip, uint16_t port) : ip(ip), port(port) {}

    bool is_specified() const { return !ip.empty(); }
    bool is_ipv6() const;
    std::string to_string() const;

    /**
     * Parse "1.2.3.4:5678" or "[::1]:5678"
     * @param text Address text
     * @param out Parsed address
     * @return true if the text is a numeric address with a port
     */
    static bool parse(const std::string& text, SocketAddress& out);

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }

    bool operator!=(const SocketAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const SocketAddress& other) const {
        return ip < other.ip || (ip == other.ip && port < other.port);
    }
};

struct SocketAddressHash {
    size_t operator()(const SocketAddress& address) const {
        return std::hash<std::string>()(address.ip) ^ (static_cast<size_t>(address.port) << 1);
    }
};

std::ostream& operator<<(std::ostream& os, const SocketAddress& address);

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// UDP Socket Functions
/**
 * Create a UDP socket bound to an address. An IPv6 bind address yields a
 * dual-stack socket, anything else an IPv4 socket.
 * @param bind_ip Local address to bind ("0.0.0.0", "::", or a concrete address)
 * @param port The port to bind to (0 for any available port)
 * @return UDP socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_udp_socket(const std::string& bind_ip, uint16_t port = 0);

/**
 * Send one datagram
 * @param socket The UDP socket handle
 * @param data The data to send
 * @param destination Numeric destination address
 * @return Number of bytes sent, or -1 on error
 */
int send_udp_data(socket_t socket, const std::vector<uint8_t>& data, const SocketAddress& destination);

/**
 * Receive one datagram, waiting at most timeout_ms
 * @param socket The UDP socket handle
 * @param buffer_size Maximum number of bytes to receive
 * @param timeout_ms Timeout in milliseconds (0 for non-blocking, -1 for blocking)
 * @param sender Output parameter for the sender address (IPv4-mapped addresses are unmapped)
 * @return Received data, empty vector on timeout or error
 */
std::vector<uint8_t> receive_udp_data_with_timeout(socket_t socket, size_t buffer_size, int timeout_ms,
                                                   SocketAddress& sender);

/**
 * Get the address a socket is bound to
 * @param socket The socket handle
 * @return Bound address, unspecified on error
 */
SocketAddress get_bound_address(socket_t socket);

// Common Socket Functions
/**
 * Close a socket
 * @param socket The socket handle to close
 */
void close_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

} // namespace filepunch
