#include "rendezvous_server.h"
#include "filepunch_log_macros.h"
#include <algorithm>

namespace filepunch {

namespace {

// Upper bound on stale records skipped in one subscribe
constexpr int MAX_SELECTION_RETRIES = 16;

} // anonymous namespace

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::IDLE: return "idle";
        case ConnectionState::PUBLISHING: return "publishing";
        case ConnectionState::SUBSCRIBING: return "subscribing";
        case ConnectionState::CLOSED: return "closed";
    }
    return "unknown";
}

//=============================================================================
// ControlHandler Implementation
//=============================================================================

ControlHandler::ControlHandler(Registry& registry)
    : registry_(registry), next_connection_id_(1) {
}

ConnectionId ControlHandler::on_connected(const SocketAddress& observed, ConnectionSink sink) {
    auto connection = std::make_shared<Connection>();
    connection->id = next_connection_id_.fetch_add(1);
    connection->observed = observed;
    connection->port_override = 0;
    connection->state = ConnectionState::CONNECTED;
    connection->publications = 0;
    connection->sink = std::move(sink);

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[connection->id] = connection;
    }

    LOG_SERVER_INFO("Control connection " << connection->id << " from " << observed);
    return connection->id;
}

void ControlHandler::on_message(ConnectionId connection_id, const std::vector<uint8_t>& data) {
    auto connection = find_connection(connection_id);
    if (!connection) {
        LOG_SERVER_ERROR("RegistryInconsistency: message for unknown connection " << connection_id);
        return;
    }

    uint8_t raw_type = 0;
    uint32_t request_id = 0;
    if (!ControlProtocol::decode_header(data, raw_type, request_id)) {
        send_error(*connection, 0, ControlErrorCode::MALFORMED, "Truncated header");
        return;
    }

    if (!ControlProtocol::is_known_type(raw_type)) {
        send_error(*connection, request_id, ControlErrorCode::UNKNOWN_TYPE, "Unknown message type");
        return;
    }

    auto message = ControlProtocol::decode_message(data);
    if (!message) {
        send_error(*connection, request_id, ControlErrorCode::MALFORMED, "Malformed message");
        return;
    }

    if (!ControlProtocol::is_request(message->type)) {
        send_error(*connection, request_id, ControlErrorCode::INVALID_STATE, "Not a request");
        return;
    }

    ConnectionState state;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        state = connection->state;
    }
    if (state == ConnectionState::CLOSED) {
        registry_inconsistency(connection_id, std::string(control_message_type_to_string(message->type)) +
                               " on a closed connection");
        return;
    }

    LOG_SERVER_DEBUG("Connection " << connection_id << " sent " << control_message_type_to_string(message->type)
                     << " #" << message->request_id);

    switch (message->type) {
        case ControlMessageType::SOCKET_PING:
            handle_socket_ping(connection, *message);
            break;
        case ControlMessageType::PORT_OVERRIDE:
            handle_port_override(connection, *message);
            break;
        case ControlMessageType::PUBLISH:
            handle_publish(connection, *message);
            break;
        case ControlMessageType::SUBSCRIBE:
            handle_subscribe(connection, *message);
            break;
        default:
            break;
    }
}

void ControlHandler::on_closed(ConnectionId connection_id) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            return;
        }
        connection = it->second;
        connection->state = ConnectionState::CLOSED;
        connections_.erase(it);
    }

    size_t removed = registry_.remove_connection(connection_id);
    LOG_SERVER_INFO("Control connection " << connection_id << " closed, " << removed << " records removed");
}

size_t ControlHandler::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

ConnectionState ControlHandler::connection_state(ConnectionId connection_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(connection_id);
    return it == connections_.end() ? ConnectionState::CLOSED : it->second->state;
}

void ControlHandler::handle_socket_ping(const std::shared_ptr<Connection>& connection,
                                        const ControlMessage& request) {
    send_message(*connection, ControlProtocol::create_socket_ping_ack(request.request_id, connection->observed));
    set_state(*connection, resting_state(*connection));
}

void ControlHandler::handle_port_override(const std::shared_ptr<Connection>& connection,
                                          const ControlMessage& request) {
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connection->port_override = request.port;
    }

    if (request.port == 0) {
        LOG_SERVER_DEBUG("Connection " << connection->id << " cleared its port override");
    } else {
        LOG_SERVER_DEBUG("Connection " << connection->id << " advertises port " << request.port);
    }

    send_message(*connection, ControlProtocol::create_port_override_ack(request.request_id, request.port));
    set_state(*connection, resting_state(*connection));
}

void ControlHandler::handle_publish(const std::shared_ptr<Connection>& connection, const ControlMessage& request) {
    PublisherRecord record;
    record.content_id = request.content_id;
    record.address = PeerAddress(request.address, advertised_external(*connection));
    record.observed_address = connection->observed;
    record.file_size = request.file_size;
    record.connection_id = connection->id;
    record.request_id = request.request_id;
    record.registered_at = Clock::now();

    if (registry_.insert(record)) {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connection->publications++;
        connection->state = ConnectionState::PUBLISHING;
    }

    // The connection may have closed while the record was being inserted
    if (!find_connection(connection->id)) {
        registry_.remove(record.content_id, connection->id);
        return;
    }

    LOG_SERVER_INFO("Connection " << connection->id << " publishes " << record.content_id.to_hex()
                    << " (" << record.file_size << " bytes) at " << record.address.external);

    send_message(*connection, ControlProtocol::create_publish_ack(request.request_id, connection->observed));
}

void ControlHandler::handle_subscribe(const std::shared_ptr<Connection>& connection,
                                      const ControlMessage& request) {
    set_state(*connection, ConnectionState::SUBSCRIBING);

    PublisherRecord record;
    std::shared_ptr<Connection> publisher;
    for (int attempt = 0; attempt < MAX_SELECTION_RETRIES; ++attempt) {
        if (!registry_.select(request.content_id, record)) {
            break;
        }
        publisher = find_connection(record.connection_id);
        if (publisher) {
            break;
        }
        registry_inconsistency(record.connection_id, "record for " + record.content_id.to_hex() +
                               " points at an unknown connection");
    }

    if (!publisher) {
        LOG_SERVER_INFO("No publisher for " << request.content_id.to_hex());
        send_message(*connection, ControlProtocol::create_not_found(request.request_id, request.content_id));
        set_state(*connection, resting_state(*connection));
        return;
    }

    Introduction to_publisher;
    to_publisher.content_id = request.content_id;
    to_publisher.role = PeerRole::PUBLISHER;
    to_publisher.file_size = record.file_size;
    to_publisher.peer = PeerAddress(request.address, advertised_external(*connection));
    to_publisher.server_observed = connection->observed;

    Introduction to_subscriber;
    to_subscriber.content_id = request.content_id;
    to_subscriber.role = PeerRole::SUBSCRIBER;
    to_subscriber.file_size = record.file_size;
    to_subscriber.peer = record.address;
    to_subscriber.server_observed = record.observed_address;

    LOG_SERVER_INFO("Introducing " << to_subscriber.peer.external << " (publisher) and "
                    << to_publisher.peer.external << " (subscriber) for " << request.content_id.to_hex());

    // Both halves are queued before this handler returns
    if (!send_message(*publisher, ControlProtocol::create_introduction(record.request_id, to_publisher))) {
        LOG_SERVER_WARN("Dropped introduction to publisher connection " << publisher->id);
    }
    if (!send_message(*connection, ControlProtocol::create_introduction(request.request_id, to_subscriber))) {
        LOG_SERVER_WARN("Dropped introduction to subscriber connection " << connection->id);
    }

    set_state(*connection, resting_state(*connection));
}

std::shared_ptr<ControlHandler::Connection> ControlHandler::find_connection(ConnectionId connection_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(connection_id);
    return it == connections_.end() ? nullptr : it->second;
}

SocketAddress ControlHandler::advertised_external(const Connection& connection) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (connection.port_override != 0) {
        return SocketAddress(connection.observed.ip, connection.port_override);
    }
    return connection.observed;
}

ConnectionState ControlHandler::resting_state(const Connection& connection) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connection.publications > 0 ? ConnectionState::PUBLISHING : ConnectionState::IDLE;
}

void ControlHandler::set_state(Connection& connection, ConnectionState state) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (connection.state != ConnectionState::CLOSED) {
        connection.state = state;
    }
}

bool ControlHandler::send_message(Connection& connection, const ControlMessage& message) {
    std::vector<uint8_t> data;
    if (!ControlProtocol::encode_message(message, data)) {
        LOG_SERVER_ERROR("Failed to encode " << control_message_type_to_string(message.type));
        return false;
    }
    if (!connection.sink.send || !connection.sink.send(data)) {
        LOG_SERVER_DEBUG("Connection " << connection.id << " did not accept "
                         << control_message_type_to_string(message.type));
        return false;
    }
    return true;
}

void ControlHandler::send_error(Connection& connection, uint32_t request_id, ControlErrorCode code,
                                const std::string& reason) {
    LOG_SERVER_WARN("Connection " << connection.id << ": " << reason);
    send_message(connection, ControlProtocol::create_error(request_id, code, reason));
}

void ControlHandler::registry_inconsistency(ConnectionId connection_id, const std::string& detail) {
    LOG_SERVER_ERROR("RegistryInconsistency on connection " << connection_id << ": " << detail);

    auto connection = find_connection(connection_id);
    registry_.remove_connection(connection_id);

    if (connection && connection->sink.close) {
        connection->sink.close();
    }
    on_closed(connection_id);
}

//=============================================================================
// RendezvousServer Implementation
//=============================================================================

RendezvousServer::RendezvousServer(const ServerConfig& config)
    : config_(config) {
    static_key_ = noise_utils::generate_static_keypair();

    auto policy = create_selection_policy(config_.selection_policy);
    if (!policy) {
        LOG_SERVER_WARN("Unknown selection policy '" << config_.selection_policy << "', using first registered");
    }
    registry_ = std::make_unique<Registry>(std::move(policy));
    handler_ = std::make_unique<ControlHandler>(*registry_);

    EndpointConfig endpoint_config;
    endpoint_config.bind_ip = config_.bind_ip;
    endpoint_config.port = config_.bind_port;
    endpoint_config.channel.idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);
    endpoint_ = std::make_unique<UdpEndpoint>(endpoint_config, static_key_);
}

RendezvousServer::~RendezvousServer() {
    stop();
}

bool RendezvousServer::start() {
    endpoint_->set_accept_handler([this](const std::shared_ptr<SecureChannel>& channel) {
        return accept_connection(channel);
    });

    if (!endpoint_->start()) {
        LOG_SERVER_ERROR("Failed to start rendezvous server on " << config_.bind_ip << ":" << config_.bind_port);
        return false;
    }

    LOG_SERVER_INFO("Rendezvous server listening on " << config_.bind_ip << ":" << endpoint_->local_port()
                    << ", policy " << registry_->policy().name());
    LOG_SERVER_INFO("Server key fingerprint: " << fingerprint());
    return true;
}

void RendezvousServer::stop() {
    if (!endpoint_->is_running()) {
        return;
    }
    endpoint_->stop();
    LOG_SERVER_INFO("Rendezvous server stopped, " << registry_->size() << " records left");
}

bool RendezvousServer::is_running() const {
    return endpoint_->is_running();
}

uint16_t RendezvousServer::port() const {
    return endpoint_->local_port();
}

std::string RendezvousServer::fingerprint() const {
    return noise_utils::fingerprint(static_key_);
}

bool RendezvousServer::accept_connection(const std::shared_ptr<SecureChannel>& channel) {
    std::weak_ptr<SecureChannel> weak_channel = channel;

    ConnectionSink sink;
    sink.send = [weak_channel](const std::vector<uint8_t>& data) {
        auto locked = weak_channel.lock();
        return locked && locked->send_message(data);
    };
    sink.close = [weak_channel]() {
        if (auto locked = weak_channel.lock()) {
            locked->close();
        }
    };

    ConnectionId connection_id = handler_->on_connected(channel->remote_address(), std::move(sink));

    ChannelHandlers handlers;
    handlers.on_message = [this, connection_id](const std::vector<uint8_t>& data) {
        handler_->on_message(connection_id, data);
    };
    handlers.on_closed = [this, connection_id](CloseReason reason) {
        LOG_SERVER_DEBUG("Channel of connection " << connection_id << " closed: " << close_reason_to_string(reason));
        handler_->on_closed(connection_id);
    };
    channel->set_handlers(std::move(handlers));
    return true;
}

} // namespace filepunch
