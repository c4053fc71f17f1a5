#pragma once

#include "noise.h"
#include "secure_channel.h"
#include "socket.h"
#include "threadmanager.h"
#include "types.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace filepunch {

struct EndpointConfig {
    std::string bind_ip;
    uint16_t port;                            // 0 for an ephemeral port
    ChannelConfig channel;
    std::chrono::milliseconds tick_interval;  // channel and observer timer resolution

    EndpointConfig() : bind_ip("0.0.0.0"), port(0), tick_interval(20) {}
};

/**
 * Passive listener for endpoint traffic. Hole punching uses it to learn about
 * arrivals and to drive its probe timer from the endpoint thread.
 */
struct DatagramObserver {
    std::function<void(const SocketAddress& from, PacketType type, TimePoint now)> on_datagram;
    std::function<void(TimePoint now)> on_tick;
};

/**
 * One bound UDP socket and the I/O thread serving it.
 *
 * Everything a client or server exchanges goes through this socket: the
 * control channel, punch probes and peer channels. Datagrams are routed by
 * packet type and source address to the matching SecureChannel, and a first
 * handshake message from an unknown address is offered to the accept handler.
 * Non-ack punch probes are always answered with an ack probe.
 *
 * Callbacks (channel handlers, accept handler, observers) run on the I/O
 * thread without any endpoint lock held.
 */
class UdpEndpoint : public ThreadManager {
public:
    /**
     * Decide whether to keep an inbound channel. Install handlers on it before returning true.
     */
    using AcceptHandler = std::function<bool(const std::shared_ptr<SecureChannel>& channel)>;

    UdpEndpoint(const EndpointConfig& config, const NoiseKey& static_private_key);
    ~UdpEndpoint();

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    uint16_t local_port() const { return local_port_.load(); }
    const NoiseKey& static_private_key() const { return static_private_key_; }
    const EndpointConfig& config() const { return config_; }

    /**
     * Open an initiator channel to a remote address, replacing any existing
     * channel with that address.
     * @return The channel (handshake in progress), or nullptr if the endpoint is not running
     */
    std::shared_ptr<SecureChannel> connect(const SocketAddress& remote, ChannelHandlers handlers);

    void set_accept_handler(AcceptHandler handler);

    bool send_datagram(const SocketAddress& to, const std::vector<uint8_t>& data);
    bool send_probe(const SocketAddress& to, bool ack);

    uint64_t add_observer(DatagramObserver observer);

    /**
     * Remove an observer. When called off the I/O thread, returns only after
     * any callback already in progress has finished.
     */
    void remove_observer(uint64_t id);

    /**
     * Wait until the I/O thread is not inside a callback. Owners of handlers
     * that capture `this` call it before they are destroyed.
     */
    void synchronize();

    std::shared_ptr<SecureChannel> find_channel(const SocketAddress& remote) const;
    size_t channel_count() const;

private:
    void io_loop();
    void handle_datagram(const SocketAddress& from, const std::vector<uint8_t>& data, TimePoint now);
    void handle_handshake_init(const SocketAddress& from, const std::vector<uint8_t>& data, TimePoint now);
    void tick(TimePoint now);
    std::shared_ptr<SecureChannel> make_channel(NoiseRole role, const SocketAddress& remote);
    bool on_io_thread() const;

    const EndpointConfig config_;
    const NoiseKey static_private_key_;

    std::atomic<bool> running_;
    std::atomic<socket_t> socket_;
    std::atomic<uint16_t> local_port_;
    std::atomic<std::thread::id> io_thread_id_;

    mutable std::mutex channels_mutex_;
    std::unordered_map<SocketAddress, std::shared_ptr<SecureChannel>, SocketAddressHash> channels_;
    AcceptHandler accept_handler_;

    mutable std::mutex observers_mutex_;
    std::map<uint64_t, DatagramObserver> observers_;
    uint64_t next_observer_id_;

    // Held by the I/O thread while it runs callbacks
    std::mutex dispatch_mutex_;
};

} // namespace filepunch
