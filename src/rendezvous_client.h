#pragma once

#include "protocol.h"
#include "secure_channel.h"
#include "udp_endpoint.h"
#include "types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace filepunch {

/**
 * Outcome of a rendezvous request
 */
struct DiscoveryResult {
    bool success;
    ErrorKind error;
    std::string error_message;
    std::chrono::milliseconds duration;

    SocketAddress observed_address;  // SocketPingAck, PublishAck
    uint16_t port;                   // PortOverrideAck
    Introduction introduction;       // Subscribe
    bool not_found;                  // Subscribe answered with NotFound

    DiscoveryResult() : success(false), error(ErrorKind::NONE), duration(0), port(0), not_found(false) {}
};

struct RendezvousTimeouts {
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds request_timeout;

    RendezvousTimeouts() : connect_timeout(5000), request_timeout(5000) {}
};

/**
 * Client side of the control connection. The client is the Noise initiator
 * toward the server and shares the endpoint's socket with punching and peer
 * sessions.
 *
 * Requests block the caller for at most request_timeout. Introductions for
 * our publications arrive at any time and go to the introduction callback,
 * on the endpoint thread.
 */
class RendezvousClient {
public:
    using IntroductionCallback = std::function<void(const Introduction& introduction)>;

    RendezvousClient(UdpEndpoint& endpoint, const SocketAddress& server,
                     const RendezvousTimeouts& timeouts = RendezvousTimeouts());
    ~RendezvousClient();

    /**
     * Open the secure control channel
     * @return DISCOVERY error if the server does not complete the handshake in connect_timeout
     */
    DiscoveryResult connect();

    DiscoveryResult socket_ping();
    DiscoveryResult port_override(uint16_t port);

    /**
     * Advertise a ContentId. The advertisement lasts until close().
     */
    DiscoveryResult publish(const ContentId& content_id, uint64_t file_size, const SocketAddress& local_address);

    /**
     * Ask for a publisher. Success carries the Introduction; NotFound,
     * timeout and connection loss are DISCOVERY errors.
     */
    DiscoveryResult subscribe(const ContentId& content_id, const SocketAddress& local_address);

    void set_introduction_callback(IntroductionCallback callback);

    /**
     * Tear down the control channel. Blocked requests return DISCOVERY (cancelled).
     */
    void close();

    /**
     * Like close(), and the client refuses any further request
     */
    void cancel();

    bool is_connected() const;
    bool is_cancelled() const { return cancelled_.load(); }
    const SocketAddress& server_address() const { return server_; }

    // Our address as last reported by the server
    SocketAddress observed_address() const;

private:
    struct PendingRequest {
        bool completed;
        std::unique_ptr<ControlMessage> response;

        PendingRequest() : completed(false) {}
    };

    DiscoveryResult request(const ControlMessage& message, ControlMessageType expected);
    void on_message(const std::vector<uint8_t>& data);
    void on_closed(CloseReason reason);

    UdpEndpoint& endpoint_;
    const SocketAddress server_;
    const RendezvousTimeouts timeouts_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<SecureChannel> channel_;
    std::unordered_map<uint32_t, std::shared_ptr<PendingRequest>> pending_;
    IntroductionCallback introduction_callback_;
    SocketAddress observed_;
    bool connected_;

    std::atomic<uint32_t> next_request_id_;
    std::atomic<bool> cancelled_;
};

} // namespace filepunch
