#include "rendezvous_client.h"
#include "filepunch_log_macros.h"
#include <random>

namespace filepunch {

namespace {

std::chrono::milliseconds elapsed_since(TimePoint start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

DiscoveryResult discovery_error(const std::string& message, TimePoint start) {
    DiscoveryResult result;
    result.error = ErrorKind::DISCOVERY;
    result.error_message = message;
    result.duration = elapsed_since(start);
    return result;
}

} // anonymous namespace

RendezvousClient::RendezvousClient(UdpEndpoint& endpoint, const SocketAddress& server,
                                   const RendezvousTimeouts& timeouts)
    : endpoint_(endpoint),
      server_(server),
      timeouts_(timeouts),
      connected_(false),
      next_request_id_(std::random_device{}()),
      cancelled_(false) {
}

RendezvousClient::~RendezvousClient() {
    close();
    endpoint_.synchronize();
}

DiscoveryResult RendezvousClient::connect() {
    TimePoint start = Clock::now();

    if (cancelled_.load()) {
        return discovery_error("Cancelled", start);
    }

    ChannelHandlers handlers;
    handlers.on_message = [this](const std::vector<uint8_t>& data) {
        on_message(data);
    };
    handlers.on_closed = [this](CloseReason reason) {
        on_closed(reason);
    };

    LOG_CLIENT_INFO("Connecting to rendezvous server " << server_);
    auto channel = endpoint_.connect(server_, std::move(handlers));
    if (!channel) {
        return discovery_error("Endpoint is not running", start);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_ = channel;
    }

    if (cancelled_.load()) {
        channel->close();
        return discovery_error("Cancelled", start);
    }

    if (!channel->wait_established(timeouts_.connect_timeout)) {
        CloseReason reason = channel->close_reason();
        channel->close();
        if (cancelled_.load()) {
            return discovery_error("Cancelled", start);
        }
        std::string detail = reason == CloseReason::NONE ? "timed out" : close_reason_to_string(reason);
        LOG_CLIENT_ERROR("Rendezvous server " << server_ << " unreachable: " << detail);
        return discovery_error("Server unreachable (" + detail + ")", start);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = true;
    }

    LOG_CLIENT_INFO("Connected to rendezvous server " << server_ << " in " << elapsed_since(start).count() << " ms");

    DiscoveryResult result;
    result.success = true;
    result.duration = elapsed_since(start);
    return result;
}

DiscoveryResult RendezvousClient::socket_ping() {
    uint32_t id = next_request_id_.fetch_add(1);
    return request(ControlProtocol::create_socket_ping(id), ControlMessageType::SOCKET_PING_ACK);
}

DiscoveryResult RendezvousClient::port_override(uint16_t port) {
    uint32_t id = next_request_id_.fetch_add(1);
    return request(ControlProtocol::create_port_override(id, port), ControlMessageType::PORT_OVERRIDE_ACK);
}

DiscoveryResult RendezvousClient::publish(const ContentId& content_id, uint64_t file_size,
                                          const SocketAddress& local_address) {
    uint32_t id = next_request_id_.fetch_add(1);
    LOG_CLIENT_INFO("Publishing " << content_id.to_hex() << " (" << file_size << " bytes)");
    return request(ControlProtocol::create_publish(id, content_id, file_size, local_address),
                   ControlMessageType::PUBLISH_ACK);
}

DiscoveryResult RendezvousClient::subscribe(const ContentId& content_id, const SocketAddress& local_address) {
    uint32_t id = next_request_id_.fetch_add(1);
    LOG_CLIENT_INFO("Subscribing to " << content_id.to_hex());
    return request(ControlProtocol::create_subscribe(id, content_id, local_address),
                   ControlMessageType::INTRODUCTION);
}

DiscoveryResult RendezvousClient::request(const ControlMessage& message, ControlMessageType expected) {
    TimePoint start = Clock::now();

    std::vector<uint8_t> data;
    if (!ControlProtocol::encode_message(message, data)) {
        return discovery_error("Cannot encode request", start);
    }

    auto pending = std::make_shared<PendingRequest>();
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            return discovery_error("Cancelled", start);
        }
        if (!connected_ || !channel_) {
            return discovery_error("Not connected to the rendezvous server", start);
        }
        channel = channel_;
        pending_[message.request_id] = pending;
    }

    if (!channel->send_message(data)) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(message.request_id);
        return discovery_error("Server unreachable", start);
    }

    std::unique_ptr<ControlMessage> response;
    bool was_connected = true;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeouts_.request_timeout, [this, &pending] {
            return pending->completed || !connected_ || cancelled_.load();
        });
        pending_.erase(message.request_id);
        response = std::move(pending->response);
        was_connected = connected_;
    }

    if (!response) {
        if (cancelled_.load()) {
            return discovery_error("Cancelled", start);
        }
        if (!was_connected) {
            return discovery_error("Server unreachable", start);
        }
        LOG_CLIENT_WARN(control_message_type_to_string(message.type) << " #" << message.request_id
                        << " timed out after " << timeouts_.request_timeout.count() << " ms");
        return discovery_error("Request timed out", start);
    }

    if (response->type == ControlMessageType::ERROR) {
        LOG_CLIENT_WARN("Server rejected " << control_message_type_to_string(message.type) << ": "
                        << response->error_message);
        return discovery_error("Server error: " + response->error_message, start);
    }

    if (response->type == ControlMessageType::NOT_FOUND) {
        DiscoveryResult result = discovery_error("No publisher for " + response->content_id.to_hex(), start);
        result.not_found = true;
        return result;
    }

    if (response->type != expected) {
        return discovery_error(std::string("Unexpected response ") + control_message_type_to_string(response->type),
                               start);
    }

    DiscoveryResult result;
    result.success = true;
    result.duration = elapsed_since(start);
    result.observed_address = response->address;
    result.port = response->port;
    result.introduction = response->introduction;

    if (response->type == ControlMessageType::SOCKET_PING_ACK || response->type == ControlMessageType::PUBLISH_ACK) {
        std::lock_guard<std::mutex> lock(mutex_);
        observed_ = response->address;
    }

    return result;
}

void RendezvousClient::on_message(const std::vector<uint8_t>& data) {
    auto message = ControlProtocol::decode_message(data);
    if (!message) {
        LOG_CLIENT_WARN("Malformed control message from server (" << data.size() << " bytes)");
        return;
    }

    if (message->type == ControlMessageType::INTRODUCTION &&
        message->introduction.role == PeerRole::PUBLISHER) {
        IntroductionCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = introduction_callback_;
        }

        LOG_CLIENT_INFO("Introduced to subscriber " << message->introduction.peer.external << " for "
                        << message->introduction.content_id.to_hex());
        if (callback) {
            callback(message->introduction);
        } else {
            LOG_CLIENT_WARN("No introduction callback, dropping introduction");
        }
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(message->request_id);
    if (it == pending_.end()) {
        LOG_CLIENT_DEBUG("Unsolicited " << control_message_type_to_string(message->type)
                         << " #" << message->request_id);
        return;
    }

    it->second->response = std::move(message);
    it->second->completed = true;
    cv_.notify_all();
}

void RendezvousClient::on_closed(CloseReason reason) {
    LOG_CLIENT_INFO("Control connection to " << server_ << " closed: " << close_reason_to_string(reason));
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    cv_.notify_all();
}

void RendezvousClient::set_introduction_callback(IntroductionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    introduction_callback_ = std::move(callback);
}

void RendezvousClient::close() {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = std::move(channel_);
        channel_.reset();
        connected_ = false;
        cv_.notify_all();
    }

    if (channel) {
        channel->set_handlers(ChannelHandlers());
        channel->close();
        LOG_CLIENT_DEBUG("Closed control connection to " << server_);
    }
}

void RendezvousClient::cancel() {
    cancelled_.store(true);
    close();
}

bool RendezvousClient::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

SocketAddress RendezvousClient::observed_address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observed_;
}

} // namespace filepunch
