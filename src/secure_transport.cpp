#include "secure_transport.h"
#include "logger.h"
#include <algorithm>
#include <thread>

#define LOG_TRANSPORT_DEBUG(message) LOG_DEBUG("transport", message)
#define LOG_TRANSPORT_INFO(message)  LOG_INFO("transport", message)
#define LOG_TRANSPORT_WARN(message)  LOG_WARN("transport", message)
#define LOG_TRANSPORT_ERROR(message) LOG_ERROR("transport", message)

namespace filepunch {

namespace {

std::chrono::milliseconds elapsed_since(TimePoint start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

TransportResult transport_error(ErrorKind kind, const std::string& message, TimePoint start) {
    TransportResult result;
    result.error = kind;
    result.error_message = message;
    result.duration = elapsed_since(start);
    return result;
}

} // anonymous namespace

//=============================================================================
// PeerConnection Implementation
//=============================================================================

PeerConnection::PeerConnection() : closed_(false), close_reason_(CloseReason::NONE) {
}

std::shared_ptr<PeerConnection> PeerConnection::create() {
    return std::shared_ptr<PeerConnection>(new PeerConnection());
}

PeerConnection::~PeerConnection() {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = std::move(channel_);
    }
    if (channel) {
        channel->close();
    }
}

ChannelHandlers PeerConnection::handlers() {
    std::weak_ptr<PeerConnection> weak_self = shared_from_this();

    ChannelHandlers handlers;
    handlers.on_message = [weak_self](const std::vector<uint8_t>& message) {
        if (auto self = weak_self.lock()) {
            self->on_message(message);
        }
    };
    handlers.on_closed = [weak_self](CloseReason reason) {
        if (auto self = weak_self.lock()) {
            self->on_closed(reason);
        }
    };
    return handlers;
}

void PeerConnection::attach(std::shared_ptr<SecureChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::move(channel);
}

bool PeerConnection::send(const std::vector<uint8_t>& message) {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !channel_) {
            return false;
        }
        channel = channel_;
    }
    return channel->send_message(message);
}

bool PeerConnection::receive(std::vector<uint8_t>& message, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !inbox_.empty() || closed_; });
    if (inbox_.empty()) {
        return false;
    }
    message = std::move(inbox_.front());
    inbox_.pop_front();
    return true;
}

bool PeerConnection::drain(std::chrono::milliseconds timeout) {
    auto channel = this->channel();
    if (!channel) {
        return false;
    }

    TimePoint deadline = Clock::now() + timeout;
    while (channel->is_established() && channel->unacknowledged_count() > 0) {
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return channel->is_established();
}

void PeerConnection::close() {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (channel) {
        channel->close();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        closed_ = true;
        close_reason_ = CloseReason::LOCAL;
    }
    cv_.notify_all();
}

bool PeerConnection::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && channel_ && channel_->is_established();
}

CloseReason PeerConnection::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

SocketAddress PeerConnection::remote_address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ ? channel_->remote_address() : SocketAddress();
}

std::shared_ptr<SecureChannel> PeerConnection::channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

void PeerConnection::on_message(const std::vector<uint8_t>& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbox_.push_back(message);
    cv_.notify_all();
}

void PeerConnection::on_closed(CloseReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        closed_ = true;
        close_reason_ = reason;
    }
    cv_.notify_all();
}

//=============================================================================
// SecureTransport Implementation
//=============================================================================

SecureTransport::SecureTransport(UdpEndpoint& endpoint) : endpoint_(endpoint) {
    endpoint_.set_accept_handler([this](const std::shared_ptr<SecureChannel>& channel) {
        return on_inbound(channel);
    });
}

SecureTransport::~SecureTransport() {
    cancel();
    endpoint_.set_accept_handler(nullptr);
    endpoint_.synchronize();
}

TransportResult SecureTransport::connect(const SocketAddress& remote, std::chrono::milliseconds timeout) {
    TimePoint start = Clock::now();

    auto connection = PeerConnection::create();
    auto channel = endpoint_.connect(remote, connection->handlers());
    if (!channel) {
        return transport_error(ErrorKind::HANDSHAKE, "Endpoint is not running", start);
    }
    connection->attach(channel);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.push_back(channel);
    }

    bool established = channel->wait_established(timeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.erase(std::remove_if(connecting_.begin(), connecting_.end(),
                                         [&channel](const std::weak_ptr<SecureChannel>& entry) {
                                             auto locked = entry.lock();
                                             return !locked || locked == channel;
                                         }),
                          connecting_.end());
    }

    if (!established) {
        CloseReason reason = channel->close_reason();
        channel->close();
        std::string detail = reason == CloseReason::NONE ? "timed out" : close_reason_to_string(reason);
        LOG_TRANSPORT_WARN("Secure session with " << remote << " failed: " << detail);
        if (reason == CloseReason::LOCAL) {
            return transport_error(ErrorKind::DISCOVERY, "Cancelled", start);
        }
        return transport_error(ErrorKind::HANDSHAKE, "Handshake with " + remote.to_string() + " failed (" +
                               detail + ")", start);
    }

    LOG_TRANSPORT_INFO("Secure session with " << remote << " established in " << elapsed_since(start).count()
                       << " ms");

    TransportResult result;
    result.success = true;
    result.duration = elapsed_since(start);
    result.connection = connection;
    return result;
}

TransportResult SecureTransport::accept(const std::vector<SocketAddress>& expected,
                                        std::chrono::milliseconds timeout) {
    TimePoint start = Clock::now();
    TimePoint deadline = start + timeout;

    auto expectation = std::make_shared<Expectation>();
    expectation->addresses = expected;

    std::shared_ptr<PeerConnection> connection;
    bool cancelled = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        expectations_.push_back(expectation);
        cv_.wait_until(lock, deadline, [&expectation] {
            return expectation->connection || expectation->cancelled;
        });
        expectations_.erase(std::remove(expectations_.begin(), expectations_.end(), expectation),
                            expectations_.end());
        connection = expectation->connection;
        cancelled = expectation->cancelled;
    }

    if (cancelled && !connection) {
        return transport_error(ErrorKind::DISCOVERY, "Cancelled", start);
    }

    if (!connection) {
        LOG_TRANSPORT_WARN("No handshake from any of " << expected.size() << " expected addresses");
        return transport_error(ErrorKind::HANDSHAKE, "No inbound handshake before the deadline", start);
    }

    auto channel = connection->channel();
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }

    if (!channel || !channel->wait_established(remaining)) {
        CloseReason reason = channel ? channel->close_reason() : CloseReason::NONE;
        connection->close();
        std::string detail = reason == CloseReason::NONE ? "timed out" : close_reason_to_string(reason);
        return transport_error(ErrorKind::HANDSHAKE, "Inbound handshake failed (" + detail + ")", start);
    }

    LOG_TRANSPORT_INFO("Accepted secure session from " << channel->remote_address());

    TransportResult result;
    result.success = true;
    result.duration = elapsed_since(start);
    result.connection = connection;
    return result;
}

void SecureTransport::cancel() {
    std::vector<std::shared_ptr<SecureChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& expectation : expectations_) {
            expectation->cancelled = true;
        }
        for (auto& entry : connecting_) {
            if (auto channel = entry.lock()) {
                channels.push_back(channel);
            }
        }
        cv_.notify_all();
    }

    for (auto& channel : channels) {
        channel->close();
    }
}

bool SecureTransport::on_inbound(const std::shared_ptr<SecureChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& expectation : expectations_) {
        if (expectation->connection || expectation->cancelled) {
            continue;
        }
        const auto& addresses = expectation->addresses;
        if (std::find(addresses.begin(), addresses.end(), channel->remote_address()) == addresses.end()) {
            continue;
        }

        auto connection = PeerConnection::create();
        channel->set_handlers(connection->handlers());
        connection->attach(channel);
        expectation->connection = connection;
        cv_.notify_all();

        LOG_TRANSPORT_DEBUG("Accepting handshake from " << channel->remote_address());
        return true;
    }

    LOG_TRANSPORT_DEBUG("Unexpected handshake from " << channel->remote_address());
    return false;
}

} // namespace filepunch
