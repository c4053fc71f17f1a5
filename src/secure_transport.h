#pragma once

#include "secure_channel.h"
#include "udp_endpoint.h"
#include "types.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filepunch {

/**
 * Blocking message interface over an established peer channel
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    static std::shared_ptr<PeerConnection> create();
    ~PeerConnection();

    /**
     * Handlers that feed this connection's inbox. Install them on the channel
     * before its handshake can complete.
     */
    ChannelHandlers handlers();
    void attach(std::shared_ptr<SecureChannel> channel);

    bool send(const std::vector<uint8_t>& message);

    /**
     * Wait for the next message
     * @return false on timeout, or once the connection is closed and the inbox drained
     */
    bool receive(std::vector<uint8_t>& message, std::chrono::milliseconds timeout);

    /**
     * Wait until every sent message has been acknowledged
     * @return false on timeout or if the connection closed first
     */
    bool drain(std::chrono::milliseconds timeout);

    void close();
    bool is_open() const;
    CloseReason close_reason() const;
    SocketAddress remote_address() const;
    std::shared_ptr<SecureChannel> channel() const;

private:
    PeerConnection();

    void on_message(const std::vector<uint8_t>& message);
    void on_closed(CloseReason reason);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<SecureChannel> channel_;
    std::deque<std::vector<uint8_t>> inbox_;
    bool closed_;
    CloseReason close_reason_;
};

struct TransportResult {
    bool success;
    ErrorKind error;
    std::string error_message;
    std::chrono::milliseconds duration;
    std::shared_ptr<PeerConnection> connection;

    TransportResult() : success(false), error(ErrorKind::NONE), duration(0) {}
};

/**
 * Opens peer sessions on a client endpoint. The subscriber connects (Noise
 * initiator) to the punched address, the publisher accepts (Noise responder)
 * only from addresses it is expecting. Inbound handshakes from anyone else
 * are dropped.
 */
class SecureTransport {
public:
    explicit SecureTransport(UdpEndpoint& endpoint);
    ~SecureTransport();

    /**
     * Initiate a session
     * @return HANDSHAKE error if the path exists but the session does not come up in time
     */
    TransportResult connect(const SocketAddress& remote, std::chrono::milliseconds timeout);

    /**
     * Wait for one inbound session from any of the expected addresses
     */
    TransportResult accept(const std::vector<SocketAddress>& expected, std::chrono::milliseconds timeout);

    /**
     * Abort pending accepts and connects
     */
    void cancel();

private:
    struct Expectation {
        std::vector<SocketAddress> addresses;
        std::shared_ptr<PeerConnection> connection;
        bool cancelled;

        Expectation() : cancelled(false) {}
    };

    bool on_inbound(const std::shared_ptr<SecureChannel>& channel);

    UdpEndpoint& endpoint_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::shared_ptr<Expectation>> expectations_;
    std::vector<std::weak_ptr<SecureChannel>> connecting_;
};

} // namespace filepunch
