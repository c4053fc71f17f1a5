#include "secure_channel.h"
#include "logger.h"
#include "wire_format.h"
#include <algorithm>

#define LOG_CHANNEL_DEBUG(message) LOG_DEBUG("channel", message)
#define LOG_CHANNEL_INFO(message)  LOG_INFO("channel", message)
#define LOG_CHANNEL_WARN(message)  LOG_WARN("channel", message)
#define LOG_CHANNEL_ERROR(message) LOG_ERROR("channel", message)

namespace filepunch {

namespace {

constexpr size_t TRANSPORT_HEADER_SIZE = 1 + 8;  // type + nonce
constexpr size_t FRAME_HEADER_SIZE = 1 + 4 + 4;  // kind + seq + ack

} // anonymous namespace

bool classify_packet(const std::vector<uint8_t>& datagram, PacketType& type) {
    if (datagram.empty()) {
        return false;
    }

    switch (datagram[0]) {
        case static_cast<uint8_t>(PacketType::PUNCH):
        case static_cast<uint8_t>(PacketType::HANDSHAKE_INIT):
        case static_cast<uint8_t>(PacketType::HANDSHAKE_RESPONSE):
        case static_cast<uint8_t>(PacketType::HANDSHAKE_FINAL):
        case static_cast<uint8_t>(PacketType::TRANSPORT):
            type = static_cast<PacketType>(datagram[0]);
            return true;
        default:
            return false;
    }
}

const char* close_reason_to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::NONE: return "none";
        case CloseReason::LOCAL: return "local";
        case CloseReason::REMOTE: return "remote";
        case CloseReason::IDLE_TIMEOUT: return "idle timeout";
        case CloseReason::HANDSHAKE_TIMEOUT: return "handshake timeout";
        case CloseReason::HANDSHAKE_FAILED: return "handshake failed";
        case CloseReason::REPLACED: return "replaced";
        case CloseReason::ENDPOINT_STOPPED: return "endpoint stopped";
    }
    return "unknown";
}

bool is_handshake_failure(CloseReason reason) {
    return reason == CloseReason::HANDSHAKE_TIMEOUT || reason == CloseReason::HANDSHAKE_FAILED;
}

//=============================================================================
// SecureChannel Implementation
//=============================================================================

SecureChannel::SecureChannel(NoiseRole role, const NoiseKey& static_private_key, const SocketAddress& remote,
                             const ChannelConfig& config, SendFunction send)
    : role_(role),
      remote_(remote),
      config_(config),
      static_private_key_(static_private_key),
      send_(std::move(send)),
      state_(ChannelState::IDLE),
      close_reason_(CloseReason::NONE),
      closed_notified_(false),
      next_send_seq_(0),
      next_receive_seq_(0) {
}

SecureChannel::~SecureChannel() = default;

void SecureChannel::set_handlers(ChannelHandlers handlers) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_ = std::move(handlers);
}

bool SecureChannel::start(TimePoint now) {
    PendingEvents events;
    bool ok = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ChannelState::IDLE) {
            return state_ != ChannelState::CLOSED;
        }

        if (!handshake_.initialize(role_, static_private_key_, config_.prologue)) {
            LOG_CHANNEL_ERROR("Failed to initialize handshake with " << remote_);
            close_locked(CloseReason::HANDSHAKE_FAILED, events);
            ok = false;
        } else {
            state_ = ChannelState::HANDSHAKING;
            handshake_started_ = now;
            last_receive_ = now;

            if (role_ == NoiseRole::INITIATOR) {
                std::vector<uint8_t> message;
                if (!handshake_.write_message({}, message)) {
                    LOG_CHANNEL_ERROR("Failed to create handshake message 1 for " << remote_);
                    close_locked(CloseReason::HANDSHAKE_FAILED, events);
                    ok = false;
                } else {
                    cached_handshake_.clear();
                    cached_handshake_.push_back(static_cast<uint8_t>(PacketType::HANDSHAKE_INIT));
                    cached_handshake_.insert(cached_handshake_.end(), message.begin(), message.end());
                    last_handshake_send_ = now;
                    send_raw_locked(cached_handshake_, now);
                    LOG_CHANNEL_DEBUG("Sent handshake message 1 to " << remote_);
                }
            }
        }
    }
    dispatch(events);
    return ok;
}

void SecureChannel::on_datagram(const std::vector<uint8_t>& datagram, TimePoint now) {
    PacketType type;
    if (!classify_packet(datagram, type)) {
        return;
    }

    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::CLOSED || state_ == ChannelState::IDLE) {
            return;
        }

        switch (type) {
            case PacketType::HANDSHAKE_INIT:
            case PacketType::HANDSHAKE_RESPONSE:
            case PacketType::HANDSHAKE_FINAL:
                handle_handshake_locked(type, datagram, now, events);
                break;
            case PacketType::TRANSPORT:
                handle_transport_locked(datagram, now, events);
                break;
            case PacketType::PUNCH:
                break;
        }
    }
    dispatch(events);
}

void SecureChannel::handle_handshake_locked(PacketType type, const std::vector<uint8_t>& datagram,
                                            TimePoint now, PendingEvents& events) {
    const std::vector<uint8_t> message(datagram.begin() + 1, datagram.end());
    std::vector<uint8_t> payload;

    if (role_ == NoiseRole::RESPONDER) {
        if (type == PacketType::HANDSHAKE_INIT) {
            if (!first_message_.empty()) {
                // Retransmitted message 1: our message 2 was lost
                if (datagram == first_message_ && !cached_handshake_.empty()) {
                    send_raw_locked(cached_handshake_, now);
                }
                return;
            }

            if (!handshake_.read_message(message, payload)) {
                LOG_CHANNEL_WARN("Rejected handshake message 1 from " << remote_);
                close_locked(CloseReason::HANDSHAKE_FAILED, events);
                return;
            }
            first_message_ = datagram;

            std::vector<uint8_t> reply;
            if (!handshake_.write_message({}, reply)) {
                LOG_CHANNEL_ERROR("Failed to create handshake message 2 for " << remote_);
                close_locked(CloseReason::HANDSHAKE_FAILED, events);
                return;
            }
            cached_handshake_.clear();
            cached_handshake_.push_back(static_cast<uint8_t>(PacketType::HANDSHAKE_RESPONSE));
            cached_handshake_.insert(cached_handshake_.end(), reply.begin(), reply.end());
            last_handshake_send_ = now;
            last_receive_ = now;
            send_raw_locked(cached_handshake_, now);
            LOG_CHANNEL_DEBUG("Sent handshake message 2 to " << remote_);
            return;
        }

        if (type == PacketType::HANDSHAKE_FINAL) {
            if (state_ != ChannelState::HANDSHAKING ||
                handshake_.get_state() != NoiseHandshakeState::READ_MESSAGE_3) {
                return;
            }
            if (!handshake_.read_message(message, payload)) {
                LOG_CHANNEL_WARN("Rejected handshake message 3 from " << remote_);
                close_locked(CloseReason::HANDSHAKE_FAILED, events);
                return;
            }
            last_receive_ = now;
            complete_handshake_locked(now, events);
        }
        return;
    }

    // Initiator
    if (type != PacketType::HANDSHAKE_RESPONSE) {
        return;
    }

    if (state_ == ChannelState::ESTABLISHED) {
        // Our message 3 was lost, the responder is still retransmitting message 2
        if (!cached_handshake_.empty()) {
            send_raw_locked(cached_handshake_, now);
        }
        return;
    }

    if (handshake_.get_state() != NoiseHandshakeState::READ_MESSAGE_2) {
        return;
    }

    if (!handshake_.read_message(message, payload)) {
        LOG_CHANNEL_WARN("Rejected handshake message 2 from " << remote_);
        close_locked(CloseReason::HANDSHAKE_FAILED, events);
        return;
    }

    std::vector<uint8_t> final_message;
    if (!handshake_.write_message({}, final_message)) {
        LOG_CHANNEL_ERROR("Failed to create handshake message 3 for " << remote_);
        close_locked(CloseReason::HANDSHAKE_FAILED, events);
        return;
    }
    cached_handshake_.clear();
    cached_handshake_.push_back(static_cast<uint8_t>(PacketType::HANDSHAKE_FINAL));
    cached_handshake_.insert(cached_handshake_.end(), final_message.begin(), final_message.end());
    last_receive_ = now;
    send_raw_locked(cached_handshake_, now);
    complete_handshake_locked(now, events);
}

void SecureChannel::complete_handshake_locked(TimePoint now, PendingEvents& events) {
    if (!handshake_.is_completed()) {
        LOG_CHANNEL_ERROR("Handshake with " << remote_ << " is not complete");
        close_locked(CloseReason::HANDSHAKE_FAILED, events);
        return;
    }

    auto ciphers = handshake_.get_cipher_states();
    send_cipher_ = ciphers.first;
    receive_cipher_ = ciphers.second;
    state_ = ChannelState::ESTABLISHED;
    events.established = true;

    LOG_CHANNEL_INFO("Secure channel with " << remote_ << " established as "
                     << (role_ == NoiseRole::INITIATOR ? "initiator" : "responder"));

    state_cv_.notify_all();
    flush_locked(now);
}

void SecureChannel::handle_transport_locked(const std::vector<uint8_t>& datagram, TimePoint now,
                                            PendingEvents& events) {
    if (state_ != ChannelState::ESTABLISHED) {
        // Data can overtake message 3; the initiator retransmits it
        return;
    }

    ByteReader reader(datagram);
    uint8_t type = 0;
    uint64_t nonce = 0;
    if (!reader.read_uint8(type) || !reader.read_uint64(nonce)) {
        return;
    }

    const std::vector<uint8_t> header(datagram.begin(), datagram.begin() + TRANSPORT_HEADER_SIZE);
    const std::vector<uint8_t> ciphertext(datagram.begin() + TRANSPORT_HEADER_SIZE, datagram.end());
    std::vector<uint8_t> frame;

    receive_cipher_.set_nonce(nonce);
    if (!receive_cipher_.decrypt_with_ad(ciphertext, header, frame)) {
        LOG_CHANNEL_DEBUG("Dropping unauthenticated transport packet from " << remote_);
        return;
    }

    ByteReader frame_reader(frame);
    uint8_t kind = 0;
    uint32_t seq = 0;
    uint32_t ack = 0;
    if (!frame_reader.read_uint8(kind) || !frame_reader.read_uint32(seq) || !frame_reader.read_uint32(ack)) {
        LOG_CHANNEL_WARN("Truncated frame from " << remote_);
        return;
    }

    last_receive_ = now;
    process_ack_locked(ack);

    switch (static_cast<FrameKind>(kind)) {
        case FrameKind::DATA: {
            std::vector<uint8_t> payload(frame.begin() + FRAME_HEADER_SIZE, frame.end());
            if (seq == next_receive_seq_) {
                events.messages.push_back(std::move(payload));
                ++next_receive_seq_;
                auto it = reorder_buffer_.find(next_receive_seq_);
                while (it != reorder_buffer_.end()) {
                    events.messages.push_back(std::move(it->second));
                    reorder_buffer_.erase(it);
                    ++next_receive_seq_;
                    it = reorder_buffer_.find(next_receive_seq_);
                }
            } else if (seq > next_receive_seq_ && seq - next_receive_seq_ < config_.send_window) {
                reorder_buffer_.emplace(seq, std::move(payload));
            }
            // Acknowledge every DATA frame, duplicates included
            send_frame_locked(FrameKind::ACK, 0, {}, now);
            flush_locked(now);
            break;
        }
        case FrameKind::ACK:
            flush_locked(now);
            break;
        case FrameKind::PING:
            send_frame_locked(FrameKind::ACK, 0, {}, now);
            break;
        case FrameKind::CLOSE:
            LOG_CHANNEL_INFO("Peer " << remote_ << " closed the channel");
            close_locked(CloseReason::REMOTE, events);
            break;
        default:
            LOG_CHANNEL_WARN("Unknown frame kind " << static_cast<int>(kind) << " from " << remote_);
            break;
    }
}

void SecureChannel::process_ack_locked(uint32_t ack) {
    while (!outgoing_.empty() && outgoing_.front().sent && outgoing_.front().seq < ack) {
        outgoing_.pop_front();
    }
}

void SecureChannel::flush_locked(TimePoint now) {
    if (state_ != ChannelState::ESTABLISHED) {
        return;
    }

    size_t in_flight = 0;
    for (auto& message : outgoing_) {
        if (in_flight >= config_.send_window) {
            break;
        }
        ++in_flight;

        if (!message.sent) {
            message.sent = true;
            message.last_sent = now;
            send_frame_locked(FrameKind::DATA, message.seq, message.payload, now);
        } else if (now - message.last_sent >= config_.retransmit_interval) {
            message.last_sent = now;
            send_frame_locked(FrameKind::DATA, message.seq, message.payload, now);
        }
    }
}

bool SecureChannel::send_frame_locked(FrameKind kind, uint32_t seq, const std::vector<uint8_t>& payload,
                                      TimePoint now) {
    ByteWriter frame(FRAME_HEADER_SIZE + payload.size());
    frame.write_uint8(static_cast<uint8_t>(kind));
    frame.write_uint32(seq);
    frame.write_uint32(next_receive_seq_);
    frame.write_bytes(payload);

    ByteWriter header(TRANSPORT_HEADER_SIZE);
    header.write_uint8(static_cast<uint8_t>(PacketType::TRANSPORT));
    header.write_uint64(send_cipher_.get_nonce());

    std::vector<uint8_t> ciphertext;
    if (!send_cipher_.encrypt_with_ad(frame.data(), header.data(), ciphertext)) {
        LOG_CHANNEL_ERROR("Failed to encrypt frame for " << remote_);
        return false;
    }

    std::vector<uint8_t> datagram = header.release();
    datagram.insert(datagram.end(), ciphertext.begin(), ciphertext.end());
    send_raw_locked(datagram, now);
    return true;
}

void SecureChannel::send_raw_locked(const std::vector<uint8_t>& datagram, TimePoint now) {
    last_send_ = now;
    if (send_) {
        send_(datagram);
    }
}

void SecureChannel::on_tick(TimePoint now) {
    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case ChannelState::HANDSHAKING:
                if (now - handshake_started_ >= config_.handshake_timeout) {
                    LOG_CHANNEL_WARN("Handshake with " << remote_ << " timed out");
                    close_locked(CloseReason::HANDSHAKE_TIMEOUT, events);
                } else if (!cached_handshake_.empty() &&
                           now - last_handshake_send_ >= config_.retransmit_interval) {
                    last_handshake_send_ = now;
                    send_raw_locked(cached_handshake_, now);
                }
                break;

            case ChannelState::ESTABLISHED:
                if (now - last_receive_ >= config_.idle_timeout) {
                    LOG_CHANNEL_WARN("Channel with " << remote_ << " idle for too long");
                    close_locked(CloseReason::IDLE_TIMEOUT, events);
                    break;
                }
                flush_locked(now);
                if (now - last_send_ >= config_.keepalive_interval) {
                    send_frame_locked(FrameKind::PING, 0, {}, now);
                }
                break;

            default:
                break;
        }
    }
    dispatch(events);
}

bool SecureChannel::send_message(const std::vector<uint8_t>& payload, TimePoint now) {
    if (payload.size() > MAX_MESSAGE_SIZE) {
        LOG_CHANNEL_ERROR("Refusing to send " << payload.size() << " byte message, limit is " << MAX_MESSAGE_SIZE);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ChannelState::CLOSED) {
        return false;
    }

    OutgoingMessage message;
    message.seq = next_send_seq_++;
    message.payload = payload;
    message.sent = false;
    outgoing_.push_back(std::move(message));

    flush_locked(now);
    return true;
}

void SecureChannel::close() {
    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::CLOSED) {
            return;
        }
        if (state_ == ChannelState::ESTABLISHED) {
            send_frame_locked(FrameKind::CLOSE, 0, {}, Clock::now());
        }
        close_locked(CloseReason::LOCAL, events);
    }
    dispatch(events);
}

void SecureChannel::abort(CloseReason reason) {
    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        close_locked(reason, events);
    }
    dispatch(events);
}

void SecureChannel::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    send_ = nullptr;
}

void SecureChannel::close_locked(CloseReason reason, PendingEvents& events) {
    if (state_ == ChannelState::CLOSED) {
        return;
    }

    state_ = ChannelState::CLOSED;
    close_reason_ = reason;
    outgoing_.clear();
    reorder_buffer_.clear();
    cached_handshake_.clear();

    LOG_CHANNEL_DEBUG("Channel with " << remote_ << " closed: " << close_reason_to_string(reason));

    events.closed = true;
    events.reason = reason;
    state_cv_.notify_all();
}

void SecureChannel::dispatch(PendingEvents& events) {
    ChannelHandlers handlers;
    bool notify_closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
        if (events.closed && !closed_notified_) {
            closed_notified_ = true;
            notify_closed = true;
        }
    }

    try {
        if (events.established && handlers.on_established) {
            handlers.on_established();
        }
        if (handlers.on_message) {
            for (const auto& message : events.messages) {
                handlers.on_message(message);
            }
        }
        if (notify_closed && handlers.on_closed) {
            handlers.on_closed(events.reason);
        }
    } catch (const std::exception& e) {
        LOG_CHANNEL_ERROR("Channel handler for " << remote_ << " threw: " << e.what());
    }
}

bool SecureChannel::wait_established(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait_for(lock, timeout, [this] {
        return state_ == ChannelState::ESTABLISHED || state_ == ChannelState::CLOSED;
    });
    return state_ == ChannelState::ESTABLISHED;
}

ChannelState SecureChannel::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SecureChannel::is_established() const {
    return state() == ChannelState::ESTABLISHED;
}

bool SecureChannel::is_closed() const {
    return state() == ChannelState::CLOSED;
}

CloseReason SecureChannel::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

size_t SecureChannel::unacknowledged_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outgoing_.size();
}

bool SecureChannel::matches_first_message(const std::vector<uint8_t>& datagram) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return role_ == NoiseRole::RESPONDER && !first_message_.empty() && datagram == first_message_;
}

} // namespace filepunch
