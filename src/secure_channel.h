#pragma once

#include "noise.h"
#include "socket.h"
#include "types.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filepunch {

/**
 * First byte of every datagram on a filepunch endpoint
 */
enum class PacketType : uint8_t {
    PUNCH = 0x01,
    HANDSHAKE_INIT = 0x02,      // Noise message 1
    HANDSHAKE_RESPONSE = 0x03,  // Noise message 2
    HANDSHAKE_FINAL = 0x04,     // Noise message 3
    TRANSPORT = 0x05            // nonce + AEAD(frame)
};

bool classify_packet(const std::vector<uint8_t>& datagram, PacketType& type);

enum class ChannelState {
    IDLE,
    HANDSHAKING,
    ESTABLISHED,
    CLOSED
};

enum class CloseReason {
    NONE,
    LOCAL,              // close() called on this side
    REMOTE,             // peer sent CLOSE
    IDLE_TIMEOUT,       // nothing heard from the peer for idle_timeout
    HANDSHAKE_TIMEOUT,  // handshake did not complete in time
    HANDSHAKE_FAILED,   // handshake message rejected
    REPLACED,           // peer restarted its handshake, a new channel took over
    ENDPOINT_STOPPED    // owning endpoint shut down
};

const char* close_reason_to_string(CloseReason reason);
bool is_handshake_failure(CloseReason reason);

struct ChannelConfig {
    std::chrono::milliseconds retransmit_interval;
    std::chrono::milliseconds handshake_timeout;
    std::chrono::milliseconds keepalive_interval;
    std::chrono::milliseconds idle_timeout;
    uint32_t send_window;
    std::vector<uint8_t> prologue;

    ChannelConfig()
        : retransmit_interval(200),
          handshake_timeout(5000),
          keepalive_interval(2000),
          idle_timeout(10000),
          send_window(64),
          prologue({'f', 'i', 'l', 'e', 'p', 'u', 'n', 'c', 'h', '/', '1'}) {}
};

/**
 * Callbacks fired outside the channel lock, in order: established, messages, closed.
 * on_closed fires at most once.
 */
struct ChannelHandlers {
    std::function<void()> on_established;
    std::function<void(const std::vector<uint8_t>&)> on_message;
    std::function<void(CloseReason)> on_closed;
};

/**
 * One Noise_XX secured session with a single remote address, carried over
 * datagrams. After the handshake it provides reliable, ordered, exactly-once
 * message delivery with cumulative acks, fixed-interval retransmission,
 * keepalive pings and an idle timeout.
 *
 * The channel never touches a socket: outgoing datagrams go through the send
 * function and incoming ones are fed with on_datagram(). Timers advance only
 * through on_tick(), so tests can drive a pair of channels with synthetic time.
 */
class SecureChannel {
public:
    using SendFunction = std::function<void(const std::vector<uint8_t>&)>;

    SecureChannel(NoiseRole role, const NoiseKey& static_private_key, const SocketAddress& remote,
                  const ChannelConfig& config, SendFunction send);
    ~SecureChannel();

    void set_handlers(ChannelHandlers handlers);

    /**
     * Begin the handshake. The initiator sends message 1 immediately, the
     * responder arms its handshake deadline and waits for message 1.
     */
    bool start(TimePoint now);

    void on_datagram(const std::vector<uint8_t>& datagram, TimePoint now);
    void on_tick(TimePoint now);

    /**
     * Queue a message for reliable delivery. Messages queued during the
     * handshake are sent once it completes.
     * @return false if the channel is closed or the payload exceeds MAX_MESSAGE_SIZE
     */
    bool send_message(const std::vector<uint8_t>& payload, TimePoint now);
    bool send_message(const std::vector<uint8_t>& payload) { return send_message(payload, Clock::now()); }

    /**
     * Send CLOSE to the peer and close locally
     */
    void close();

    /**
     * Close locally without notifying the peer
     */
    void abort(CloseReason reason);

    /**
     * Drop the send function. Called by the endpoint before its socket goes away.
     */
    void detach();

    bool wait_established(std::chrono::milliseconds timeout);

    ChannelState state() const;
    bool is_established() const;
    bool is_closed() const;
    CloseReason close_reason() const;
    size_t unacknowledged_count() const;

    NoiseRole role() const { return role_; }
    const SocketAddress& remote_address() const { return remote_; }

    /**
     * True if a responder channel already answered exactly this message 1
     */
    bool matches_first_message(const std::vector<uint8_t>& datagram) const;

private:
    enum class FrameKind : uint8_t {
        DATA = 0,
        ACK = 1,
        PING = 2,
        CLOSE = 3
    };

    struct OutgoingMessage {
        uint32_t seq;
        std::vector<uint8_t> payload;
        TimePoint last_sent;
        bool sent;
    };

    struct PendingEvents {
        bool established = false;
        std::vector<std::vector<uint8_t>> messages;
        bool closed = false;
        CloseReason reason = CloseReason::NONE;
    };

    void handle_handshake_locked(PacketType type, const std::vector<uint8_t>& datagram,
                                 TimePoint now, PendingEvents& events);
    void handle_transport_locked(const std::vector<uint8_t>& datagram, TimePoint now, PendingEvents& events);
    void complete_handshake_locked(TimePoint now, PendingEvents& events);
    void process_ack_locked(uint32_t ack);
    void flush_locked(TimePoint now);
    bool send_frame_locked(FrameKind kind, uint32_t seq, const std::vector<uint8_t>& payload, TimePoint now);
    void send_raw_locked(const std::vector<uint8_t>& datagram, TimePoint now);
    void close_locked(CloseReason reason, PendingEvents& events);
    void dispatch(PendingEvents& events);

    const NoiseRole role_;
    const SocketAddress remote_;
    const ChannelConfig config_;
    const NoiseKey static_private_key_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    SendFunction send_;
    ChannelHandlers handlers_;

    ChannelState state_;
    CloseReason close_reason_;
    bool closed_notified_;

    // Handshake
    NoiseHandshake handshake_;
    std::vector<uint8_t> first_message_;     // message 1 as received (responder)
    std::vector<uint8_t> cached_handshake_;  // last handshake datagram we sent
    TimePoint handshake_started_;
    TimePoint last_handshake_send_;

    // Transport
    NoiseCipherState send_cipher_;
    NoiseCipherState receive_cipher_;
    uint32_t next_send_seq_;
    uint32_t next_receive_seq_;
    std::deque<OutgoingMessage> outgoing_;
    std::map<uint32_t, std::vector<uint8_t>> reorder_buffer_;
    TimePoint last_send_;
    TimePoint last_receive_;
};

} // namespace filepunch
