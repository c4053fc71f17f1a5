#include "udp_endpoint.h"
#include "logger.h"
#include "punch_session.h"

#define LOG_ENDPOINT_DEBUG(message) LOG_DEBUG("endpoint", message)
#define LOG_ENDPOINT_INFO(message)  LOG_INFO("endpoint", message)
#define LOG_ENDPOINT_WARN(message)  LOG_WARN("endpoint", message)
#define LOG_ENDPOINT_ERROR(message) LOG_ERROR("endpoint", message)

namespace filepunch {

namespace {

// Largest datagram we expect: transport header + frame header + payload + tag, with headroom
constexpr size_t RECEIVE_BUFFER_SIZE = 2048;

} // anonymous namespace

UdpEndpoint::UdpEndpoint(const EndpointConfig& config, const NoiseKey& static_private_key)
    : config_(config),
      static_private_key_(static_private_key),
      running_(false),
      socket_(INVALID_SOCKET_VALUE),
      local_port_(0),
      io_thread_id_(std::thread::id()),
      next_observer_id_(1) {
}

UdpEndpoint::~UdpEndpoint() {
    stop();
}

bool UdpEndpoint::start() {
    if (running_.load()) {
        LOG_ENDPOINT_WARN("Endpoint is already running");
        return true;
    }

    if (!init_socket_library()) {
        LOG_ENDPOINT_ERROR("Failed to initialize socket library");
        return false;
    }

    socket_t socket = create_udp_socket(config_.bind_ip, config_.port);
    if (!is_valid_socket(socket)) {
        LOG_ENDPOINT_ERROR("Failed to bind UDP socket on " << config_.bind_ip << ":" << config_.port);
        return false;
    }

    SocketAddress bound = get_bound_address(socket);
    local_port_.store(bound.port);
    socket_.store(socket);

    reset_shutdown();
    running_.store(true);
    if (!add_managed_thread(std::thread(&UdpEndpoint::io_loop, this), "endpoint-io")) {
        LOG_ENDPOINT_ERROR("Failed to start endpoint I/O thread");
        running_.store(false);
        socket_.store(INVALID_SOCKET_VALUE);
        close_socket(socket);
        return false;
    }

    LOG_ENDPOINT_INFO("Endpoint listening on " << config_.bind_ip << ":" << local_port_.load());
    return true;
}

void UdpEndpoint::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_ENDPOINT_INFO("Stopping endpoint on port " << local_port_.load());

    shutdown_all_threads();
    join_all_active_threads();

    std::vector<std::shared_ptr<SecureChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto& entry : channels_) {
            channels.push_back(entry.second);
        }
        channels_.clear();
    }

    for (auto& channel : channels) {
        channel->detach();
        channel->abort(CloseReason::ENDPOINT_STOPPED);
    }

    socket_t socket = socket_.exchange(INVALID_SOCKET_VALUE);
    if (is_valid_socket(socket)) {
        close_socket(socket);
    }

    io_thread_id_.store(std::thread::id());
    LOG_ENDPOINT_DEBUG("Endpoint stopped");
}

std::shared_ptr<SecureChannel> UdpEndpoint::connect(const SocketAddress& remote, ChannelHandlers handlers) {
    if (!running_.load()) {
        LOG_ENDPOINT_ERROR("Cannot connect to " << remote << ": endpoint is not running");
        return nullptr;
    }

    auto channel = make_channel(NoiseRole::INITIATOR, remote);
    channel->set_handlers(std::move(handlers));

    std::shared_ptr<SecureChannel> replaced;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(remote);
        if (it != channels_.end()) {
            replaced = it->second;
        }
        channels_[remote] = channel;
    }

    if (replaced) {
        LOG_ENDPOINT_DEBUG("Replacing existing channel with " << remote);
        replaced->abort(CloseReason::REPLACED);
    }

    LOG_ENDPOINT_DEBUG("Connecting to " << remote);
    channel->start(Clock::now());
    return channel;
}

void UdpEndpoint::set_accept_handler(AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    accept_handler_ = std::move(handler);
}

bool UdpEndpoint::send_datagram(const SocketAddress& to, const std::vector<uint8_t>& data) {
    socket_t socket = socket_.load();
    if (!is_valid_socket(socket)) {
        return false;
    }
    return send_udp_data(socket, data, to) == static_cast<int>(data.size());
}

bool UdpEndpoint::send_probe(const SocketAddress& to, bool ack) {
    return send_datagram(to, make_punch_probe(ack));
}

uint64_t UdpEndpoint::add_observer(DatagramObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    uint64_t id = next_observer_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void UdpEndpoint::remove_observer(uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers_.erase(id);
    }
    synchronize();
}

void UdpEndpoint::synchronize() {
    if (on_io_thread()) {
        return;
    }
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
}

std::shared_ptr<SecureChannel> UdpEndpoint::find_channel(const SocketAddress& remote) const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    auto it = channels_.find(remote);
    return it != channels_.end() ? it->second : nullptr;
}

size_t UdpEndpoint::channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

bool UdpEndpoint::on_io_thread() const {
    return io_thread_id_.load() == std::this_thread::get_id();
}

std::shared_ptr<SecureChannel> UdpEndpoint::make_channel(NoiseRole role, const SocketAddress& remote) {
    return std::make_shared<SecureChannel>(
        role, static_private_key_, remote, config_.channel,
        [this, remote](const std::vector<uint8_t>& datagram) {
            if (!send_datagram(remote, datagram)) {
                LOG_ENDPOINT_DEBUG("Failed to send " << datagram.size() << " bytes to " << remote);
            }
        });
}

void UdpEndpoint::io_loop() {
    io_thread_id_.store(std::this_thread::get_id());
    LOG_ENDPOINT_DEBUG("I/O loop started");

    const int timeout_ms = static_cast<int>(config_.tick_interval.count());
    TimePoint last_tick = Clock::now();

    while (running_.load()) {
        SocketAddress sender;
        auto data = receive_udp_data_with_timeout(socket_.load(), RECEIVE_BUFFER_SIZE, timeout_ms, sender);
        TimePoint now = Clock::now();

        std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
        try {
            if (!data.empty()) {
                handle_datagram(sender, data, now);
            }
            if (now - last_tick >= config_.tick_interval) {
                last_tick = now;
                tick(now);
            }
        } catch (const std::exception& e) {
            LOG_ENDPOINT_ERROR("Exception in endpoint I/O loop: " << e.what());
        }
    }

    LOG_ENDPOINT_DEBUG("I/O loop stopped");
}

void UdpEndpoint::handle_datagram(const SocketAddress& from, const std::vector<uint8_t>& data, TimePoint now) {
    PacketType type;
    if (!classify_packet(data, type)) {
        LOG_ENDPOINT_DEBUG("Ignoring unknown " << data.size() << " byte datagram from " << from);
        return;
    }

    switch (type) {
        case PacketType::PUNCH: {
            bool ack = false;
            if (!parse_punch_probe(data, ack)) {
                LOG_ENDPOINT_DEBUG("Malformed probe from " << from);
                return;
            }
            if (!ack) {
                send_probe(from, true);
            }
            break;
        }
        case PacketType::HANDSHAKE_INIT:
            handle_handshake_init(from, data, now);
            break;
        default: {
            auto channel = find_channel(from);
            if (channel) {
                channel->on_datagram(data, now);
            }
            break;
        }
    }

    std::vector<DatagramObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        if (observer.on_datagram) {
            observer.on_datagram(from, type, now);
        }
    }
}

void UdpEndpoint::handle_handshake_init(const SocketAddress& from, const std::vector<uint8_t>& data,
                                        TimePoint now) {
    auto existing = find_channel(from);
    if (existing && !existing->is_closed()) {
        if (existing->role() == NoiseRole::INITIATOR || existing->matches_first_message(data)) {
            existing->on_datagram(data, now);
            return;
        }
        LOG_ENDPOINT_INFO("Peer " << from << " restarted its handshake, replacing channel");
        existing->abort(CloseReason::REPLACED);
    }

    AcceptHandler handler;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        handler = accept_handler_;
    }
    if (!handler) {
        LOG_ENDPOINT_DEBUG("No accept handler, dropping handshake from " << from);
        return;
    }

    auto channel = make_channel(NoiseRole::RESPONDER, from);
    bool accepted = false;
    try {
        accepted = handler(channel);
    } catch (const std::exception& e) {
        LOG_ENDPOINT_ERROR("Accept handler threw for " << from << ": " << e.what());
    }

    if (!accepted) {
        LOG_ENDPOINT_DEBUG("Handshake from " << from << " not accepted");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels_[from] = channel;
    }

    channel->start(now);
    channel->on_datagram(data, now);
}

void UdpEndpoint::tick(TimePoint now) {
    std::vector<std::shared_ptr<SecureChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto it = channels_.begin(); it != channels_.end();) {
            if (it->second->is_closed()) {
                it = channels_.erase(it);
            } else {
                channels.push_back(it->second);
                ++it;
            }
        }
    }

    for (auto& channel : channels) {
        channel->on_tick(now);
    }

    std::vector<DatagramObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        if (observer.on_tick) {
            observer.on_tick(now);
        }
    }
}

} // namespace filepunch
