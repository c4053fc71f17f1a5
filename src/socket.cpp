#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <ostream>
#ifndef _WIN32
    #include <errno.h>
    #include <poll.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace filepunch {

namespace {

// Fill a sockaddr_storage for a numeric address. A v4 destination on a v6
// socket is written as an IPv4-mapped address.
bool to_sockaddr(const SocketAddress& address, int socket_family,
                 sockaddr_storage& storage, socklen_t& length) {
    memset(&storage, 0, sizeof(storage));

    if (address.is_ipv6()) {
        if (socket_family != AF_INET6) {
            return false;
        }
        auto* addr6 = reinterpret_cast<sockaddr_in6*>(&storage);
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(address.port);
        if (inet_pton(AF_INET6, address.ip.c_str(), &addr6->sin6_addr) != 1) {
            return false;
        }
        length = sizeof(sockaddr_in6);
        return true;
    }

    in_addr ipv4{};
    if (inet_pton(AF_INET, address.ip.c_str(), &ipv4) != 1) {
        return false;
    }

    if (socket_family == AF_INET6) {
        auto* addr6 = reinterpret_cast<sockaddr_in6*>(&storage);
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(address.port);
        addr6->sin6_addr.s6_addr[10] = 0xff;
        addr6->sin6_addr.s6_addr[11] = 0xff;
        memcpy(&addr6->sin6_addr.s6_addr[12], &ipv4, 4);
        length = sizeof(sockaddr_in6);
        return true;
    }

    auto* addr4 = reinterpret_cast<sockaddr_in*>(&storage);
    addr4->sin_family = AF_INET;
    addr4->sin_port = htons(address.port);
    addr4->sin_addr = ipv4;
    length = sizeof(sockaddr_in);
    return true;
}

SocketAddress from_sockaddr(const sockaddr_storage& storage) {
    char buffer[INET6_ADDRSTRLEN] = {0};

    if (storage.ss_family == AF_INET) {
        const auto* addr4 = reinterpret_cast<const sockaddr_in*>(&storage);
        inet_ntop(AF_INET, &addr4->sin_addr, buffer, sizeof(buffer));
        return SocketAddress(buffer, ntohs(addr4->sin_port));
    }

    if (storage.ss_family == AF_INET6) {
        const auto* addr6 = reinterpret_cast<const sockaddr_in6*>(&storage);
        if (IN6_IS_ADDR_V4MAPPED(&addr6->sin6_addr)) {
            inet_ntop(AF_INET, &addr6->sin6_addr.s6_addr[12], buffer, sizeof(buffer));
        } else {
            inet_ntop(AF_INET6, &addr6->sin6_addr, buffer, sizeof(buffer));
        }
        return SocketAddress(buffer, ntohs(addr6->sin6_port));
    }

    return SocketAddress();
}

int socket_family(socket_t socket) {
    sockaddr_storage storage{};
    socklen_t length = sizeof(storage);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&storage), &length) != 0) {
        return AF_UNSPEC;
    }
    return storage.ss_family;
}

} // anonymous namespace

bool SocketAddress::is_ipv6() const {
    return ip.find(':') != std::string::npos;
}

std::string SocketAddress::to_string() const {
    if (is_ipv6()) {
        return "[" + ip + "]:" + std::to_string(port);
    }
    return ip + ":" + std::to_string(port);
}

bool SocketAddress::parse(const std::string& text, SocketAddress& out) {
    std::string host;
    std::string port_text;

    if (!text.empty() && text[0] == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return false;
        }
        host = text.substr(1, close - 1);
        port_text = text.substr(close + 2);
        if (!network_utils::is_valid_ipv6(host)) {
            return false;
        }
    } else {
        size_t colon = text.rfind(':');
        if (colon == std::string::npos) {
            return false;
        }
        host = text.substr(0, colon);
        port_text = text.substr(colon + 1);
        if (!network_utils::is_valid_ipv4(host)) {
            return false;
        }
    }

    if (port_text.empty() || port_text.size() > 5 ||
        port_text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    unsigned long port = std::stoul(port_text);
    if (port > 65535) {
        return false;
    }

    out = SocketAddress(host, static_cast<uint16_t>(port));
    return true;
}

std::ostream& operator<<(std::ostream& os, const SocketAddress& address) {
    return os << address.to_string();
}

// Socket Library Initialization
bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
#endif
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
#endif
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

// UDP Socket Functions
socket_t create_udp_socket(const std::string& bind_ip, uint16_t port) {
    const bool ipv6 = network_utils::is_valid_ipv6(bind_ip);
    LOG_SOCKET_DEBUG("Creating UDP socket on " << (bind_ip.empty() ? "0.0.0.0" : bind_ip) << ":" << port);

    socket_t udp_socket = socket(ipv6 ? AF_INET6 : AF_INET, SOCK_DGRAM, 0);
    if (udp_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create UDP socket");
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(udp_socket, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<char*>(&opt), sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set UDP socket options");
        close_socket(udp_socket);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_storage storage{};
    socklen_t length = 0;
    if (ipv6) {
        int v6only = 0;
        if (setsockopt(udp_socket, IPPROTO_IPV6, IPV6_V6ONLY,
                       reinterpret_cast<char*>(&v6only), sizeof(v6only)) == SOCKET_ERROR_VALUE) {
            LOG_SOCKET_WARN("Failed to enable dual stack on UDP socket");
        }
        auto* addr6 = reinterpret_cast<sockaddr_in6*>(&storage);
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(port);
        inet_pton(AF_INET6, bind_ip.c_str(), &addr6->sin6_addr);
        length = sizeof(sockaddr_in6);
    } else {
        auto* addr4 = reinterpret_cast<sockaddr_in*>(&storage);
        addr4->sin_family = AF_INET;
        addr4->sin_port = htons(port);
        if (bind_ip.empty()) {
            addr4->sin_addr.s_addr = INADDR_ANY;
        } else if (inet_pton(AF_INET, bind_ip.c_str(), &addr4->sin_addr) != 1) {
            LOG_SOCKET_ERROR("Invalid bind address: " << bind_ip);
            close_socket(udp_socket);
            return INVALID_SOCKET_VALUE;
        }
        length = sizeof(sockaddr_in);
    }

    if (bind(udp_socket, reinterpret_cast<sockaddr*>(&storage), length) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind UDP socket to " << bind_ip << ":" << port);
        close_socket(udp_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("UDP socket bound to " << get_bound_address(udp_socket));
    return udp_socket;
}

int send_udp_data(socket_t socket, const std::vector<uint8_t>& data, const SocketAddress& destination) {
    sockaddr_storage storage;
    socklen_t length = 0;
    if (!to_sockaddr(destination, socket_family(socket), storage, length)) {
        LOG_SOCKET_ERROR("Cannot send to " << destination << " from this socket");
        return -1;
    }

    int bytes_sent = static_cast<int>(sendto(socket, reinterpret_cast<const char*>(data.data()), data.size(), 0,
                                             reinterpret_cast<sockaddr*>(&storage), length));
    if (bytes_sent == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_DEBUG("Failed to send UDP data to " << destination << ": " << strerror(errno));
        return -1;
    }

    return bytes_sent;
}

std::vector<uint8_t> receive_udp_data_with_timeout(socket_t socket, size_t buffer_size, int timeout_ms,
                                                   SocketAddress& sender) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = socket;
    pfd.events = POLLRDNORM;
    int ready = WSAPoll(&pfd, 1, timeout_ms);
#else
    pollfd pfd{};
    pfd.fd = socket;
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, timeout_ms);
#endif
    if (ready <= 0) {
        return {};
    }

    std::vector<uint8_t> buffer(buffer_size);
    sockaddr_storage from{};
    socklen_t from_length = sizeof(from);

    int received = static_cast<int>(recvfrom(socket, reinterpret_cast<char*>(buffer.data()), buffer.size(), 0,
                                             reinterpret_cast<sockaddr*>(&from), &from_length));
    if (received <= 0) {
        // ICMP errors surface here on some platforms; treat them as nothing received
        return {};
    }

    buffer.resize(static_cast<size_t>(received));
    sender = from_sockaddr(from);
    return buffer;
}

SocketAddress get_bound_address(socket_t socket) {
    sockaddr_storage storage{};
    socklen_t length = sizeof(storage);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&storage), &length) != 0) {
        return SocketAddress();
    }
    return from_sockaddr(storage);
}

// Common Socket Functions
void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

} // namespace filepunch
