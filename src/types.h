#pragma once

#include "socket.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace filepunch {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Well-known rendezvous port
constexpr uint16_t DEFAULT_SERVER_PORT = 7828;

// Largest application message carried by a secure channel
constexpr size_t MAX_MESSAGE_SIZE = 1024;

/**
 * Terminal failure categories reported to callers
 */
enum class ErrorKind {
    NONE,
    DISCOVERY,               // no publisher, server unreachable, request timeout, cancelled
    TRAVERSAL_TIMEOUT,       // no punch candidate became reachable
    HANDSHAKE,               // path exists but the secure session did not complete
    REGISTRY_INCONSISTENCY,  // server-side invariant violation, fatal to one connection
    HASH_MISMATCH,           // peer asked for content we did not offer
    PORT_MAPPING             // gateway refused or ignored a mapping request
};

const char* error_kind_to_string(ErrorKind kind);

/**
 * Role of a peer in one exchange. The publisher accepts the secure session,
 * the subscriber initiates it.
 */
enum class PeerRole : uint8_t {
    PUBLISHER = 0,
    SUBSCRIBER = 1
};

const char* peer_role_to_string(PeerRole role);

/**
 * Candidate addresses of one peer. The external address is empty until the
 * server (or a port mapping) supplies it.
 */
struct PeerAddress {
    SocketAddress local;
    SocketAddress external;

    PeerAddress() = default;
    PeerAddress(const SocketAddress& local, const SocketAddress& external)
        : local(local), external(external) {}

    bool operator==(const PeerAddress& other) const {
        return local == other.local && external == other.external;
    }

    bool operator!=(const PeerAddress& other) const {
        return !(*this == other);
    }
};

} // namespace filepunch
