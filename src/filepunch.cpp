#include "filepunch.h"
#include "filepunch_log_macros.h"
#include "network_utils.h"
#include "noise.h"
#include "punch_session.h"
#include "transfer_protocol.h"

namespace filepunch {

namespace {

std::chrono::milliseconds elapsed_since(TimePoint start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

PeerSessionResult session_error(ErrorKind kind, const std::string& message, TimePoint start) {
    PeerSessionResult result;
    result.error = kind;
    result.error_message = message;
    result.duration = elapsed_since(start);
    return result;
}

ResolverConfig make_resolver_config(const ClientSettings& settings) {
    ResolverConfig config;
    config.mode = settings.port_mapping;
    config.forwarded_port = settings.external_port;
    return config;
}

} // anonymous namespace

FilePunchClient::FilePunchClient(const ClientSettings& settings)
    : FilePunchClient(settings, std::make_unique<AddressResolver>(make_resolver_config(settings))) {
}

FilePunchClient::FilePunchClient(const ClientSettings& settings, std::unique_ptr<AddressResolver> resolver)
    : settings_(settings),
      resolver_(std::move(resolver)),
      running_(false),
      cancelled_(false),
      last_error_(ErrorKind::NONE) {
}

FilePunchClient::~FilePunchClient() {
    stop();
}

bool FilePunchClient::fail_start(ErrorKind kind, const std::string& message) {
    last_error_ = kind;
    last_error_message_ = message;
    LOG_CLIENT_ERROR("Start failed: " << message);
    stop();
    return false;
}

bool FilePunchClient::start() {
    if (running_.load()) {
        LOG_CLIENT_WARN("FilePunchClient is already running");
        return false;
    }
    if (cancelled_.load()) {
        LOG_CLIENT_ERROR("FilePunchClient was cancelled and cannot be restarted");
        return false;
    }

    init_socket_library();

    std::string server_ip = network_utils::resolve_hostname(settings_.server_address);
    if (server_ip.empty()) {
        last_error_ = ErrorKind::DISCOVERY;
        last_error_message_ = "Cannot resolve server address " + settings_.server_address;
        LOG_CLIENT_ERROR(last_error_message_);
        return false;
    }
    SocketAddress server(server_ip, settings_.server_port);

    EndpointConfig endpoint_config;
    endpoint_config.bind_ip = settings_.bind_ip;
    endpoint_config.port = settings_.local_port;
    endpoint_config.channel.handshake_timeout = std::chrono::milliseconds(settings_.handshake_timeout_ms);

    endpoint_ = std::make_unique<UdpEndpoint>(endpoint_config, noise_utils::generate_static_keypair());
    if (!endpoint_->start()) {
        last_error_ = ErrorKind::DISCOVERY;
        last_error_message_ = "Cannot bind UDP port " + std::to_string(settings_.local_port);
        LOG_CLIENT_ERROR(last_error_message_);
        endpoint_.reset();
        return false;
    }
    running_.store(true);

    LOG_CLIENT_INFO("Starting client on UDP port " << endpoint_->local_port());

    resolved_ = resolver_->resolve(SocketAddress(settings_.bind_ip, endpoint_->local_port()), settings_.gateway,
                                   server_ip);
    if (!resolved_.success) {
        return fail_start(ErrorKind::DISCOVERY, resolved_.error_message);
    }
    if (resolved_.error == ErrorKind::PORT_MAPPING) {
        LOG_CLIENT_INFO("Port mapping unavailable (" << resolved_.error_message << "), relying on hole punching");
    }

    PunchConfig punch_config(std::chrono::milliseconds(settings_.punch_interval_ms),
                             std::chrono::milliseconds(settings_.punch_deadline_ms));
    punch_ = std::make_unique<HolePunchCoordinator>(*endpoint_, punch_config);
    transport_ = std::make_unique<SecureTransport>(*endpoint_);

    RendezvousTimeouts timeouts;
    timeouts.connect_timeout = std::chrono::milliseconds(settings_.handshake_timeout_ms);
    timeouts.request_timeout = std::chrono::milliseconds(settings_.request_timeout_ms);
    rendezvous_ = std::make_unique<RendezvousClient>(*endpoint_, server, timeouts);
    rendezvous_->set_introduction_callback([this](const Introduction& introduction) {
        on_introduction(introduction);
    });

    DiscoveryResult connected = rendezvous_->connect();
    if (!connected.success) {
        return fail_start(connected.error, connected.error_message);
    }

    DiscoveryResult ping = rendezvous_->socket_ping();
    if (!ping.success) {
        return fail_start(ping.error, ping.error_message);
    }
    LOG_CLIENT_INFO("Server observes us at " << ping.observed_address);

    // A mapped or forwarded port only matters if the NAT did not already preserve it
    if (resolved_.external_port != 0 && resolved_.external_port != ping.observed_address.port) {
        DiscoveryResult override_result = rendezvous_->port_override(resolved_.external_port);
        if (!override_result.success) {
            return fail_start(override_result.error, override_result.error_message);
        }
        LOG_CLIENT_INFO("Advertising external port " << resolved_.external_port << " instead of "
                        << ping.observed_address.port);
    }

    last_error_ = ErrorKind::NONE;
    last_error_message_.clear();
    LOG_CLIENT_INFO("Client ready, local " << resolved_.local);
    return true;
}

void FilePunchClient::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_CLIENT_INFO("Stopping client");

    shutdown_all_threads();
    if (punch_) {
        punch_->cancel();
    }
    if (transport_) {
        transport_->cancel();
    }
    if (rendezvous_) {
        rendezvous_->close();
    }
    join_all_active_threads();

    rendezvous_.reset();
    transport_.reset();
    punch_.reset();
    if (endpoint_) {
        endpoint_->stop();
        endpoint_.reset();
    }
    resolver_->release();

    {
        std::lock_guard<std::mutex> lock(publications_mutex_);
        publications_.clear();
    }

    reset_shutdown();
    LOG_CLIENT_INFO("Client stopped");
}

void FilePunchClient::cancel() {
    cancelled_.store(true);
    LOG_CLIENT_INFO("Cancelling all pending operations");

    shutdown_all_threads();
    if (rendezvous_) {
        rendezvous_->cancel();
    }
    if (punch_) {
        punch_->cancel();
    }
    if (transport_) {
        transport_->cancel();
    }
}

bool FilePunchClient::publish(const ContentId& content_id, uint64_t file_size, PeerSessionCallback callback) {
    if (!running_.load() || !rendezvous_) {
        LOG_CLIENT_ERROR("Cannot publish, client is not running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(publications_mutex_);
        publications_[content_id] = Publication{file_size, std::move(callback)};
    }

    DiscoveryResult result = rendezvous_->publish(content_id, file_size, resolved_.local);
    if (!result.success) {
        std::lock_guard<std::mutex> lock(publications_mutex_);
        publications_.erase(content_id);
        last_error_ = result.error;
        last_error_message_ = result.error_message;
        LOG_CLIENT_ERROR("Publish of " << content_id.to_hex() << " failed: " << result.error_message);
        return false;
    }

    LOG_CLIENT_INFO("Published " << content_id.to_hex() << ", server sees us at " << result.observed_address);
    return true;
}

void FilePunchClient::on_introduction(const Introduction& introduction) {
    if (is_shutdown_requested()) {
        LOG_CLIENT_DEBUG("Ignoring introduction during shutdown");
        return;
    }

    std::string name = "peer-" + introduction.peer.external.to_string();
    if (!run_managed_thread([this, introduction]() { serve_introduction(introduction); }, name)) {
        LOG_CLIENT_WARN("Dropped introduction from " << introduction.peer.external);
    }
}

void FilePunchClient::serve_introduction(Introduction introduction) {
    TimePoint start = Clock::now();
    if (is_shutdown_requested()) {
        return;
    }

    Publication publication;
    {
        std::lock_guard<std::mutex> lock(publications_mutex_);
        auto it = publications_.find(introduction.content_id);
        if (it == publications_.end()) {
            LOG_CLIENT_WARN("Introduction for unpublished content " << introduction.content_id.to_hex());
            return;
        }
        publication = it->second;
    }

    auto report = [this, &publication](const PeerSessionResult& result) {
        if (!publication.callback) {
            return;
        }
        try {
            publication.callback(result);
        } catch (const std::exception& e) {
            LOG_CLIENT_ERROR("Exception in peer session callback: " << e.what());
        }
    };

    std::vector<SocketAddress> candidates = order_candidates(introduction.peer, introduction.server_observed);
    LOG_CLIENT_INFO("Serving " << introduction.content_id.to_hex() << " to subscriber with "
                    << candidates.size() << " candidates");

    PunchResult punched = punch_->punch(candidates);
    if (!punched.success) {
        PeerSessionResult result = session_error(punched.error, punched.error_message, start);
        result.introduction = introduction;
        report(result);
        return;
    }
    if (is_shutdown_requested()) {
        return;
    }

    TransportResult accepted = transport_->accept(candidates,
                                                  std::chrono::milliseconds(settings_.handshake_timeout_ms));
    if (!accepted.success) {
        PeerSessionResult result = session_error(accepted.error, accepted.error_message, start);
        result.introduction = introduction;
        result.peer = punched.winner;
        report(result);
        return;
    }

    auto connection = accepted.connection;
    std::vector<uint8_t> message;
    ContentId requested;
    if (!connection->receive(message, std::chrono::milliseconds(settings_.handshake_timeout_ms)) ||
        !decode_content_request(message, requested)) {
        connection->close();
        PeerSessionResult result = session_error(ErrorKind::HANDSHAKE, "Subscriber sent no content request", start);
        result.introduction = introduction;
        result.peer = connection->remote_address();
        report(result);
        return;
    }

    if (requested != introduction.content_id) {
        LOG_CLIENT_WARN("Subscriber " << connection->remote_address() << " asked for " << requested.to_hex()
                        << ", introduced for " << introduction.content_id.to_hex());
        connection->close();
        PeerSessionResult result = session_error(ErrorKind::HASH_MISMATCH, "Requested content does not match", start);
        result.introduction = introduction;
        result.peer = connection->remote_address();
        report(result);
        return;
    }

    if (!connection->send(encode_hash_ok(publication.file_size))) {
        connection->close();
        PeerSessionResult result = session_error(ErrorKind::HANDSHAKE, "Peer session closed before HashOk", start);
        result.introduction = introduction;
        report(result);
        return;
    }

    PeerSessionResult result;
    result.success = true;
    result.duration = elapsed_since(start);
    result.connection = connection;
    result.peer = connection->remote_address();
    result.file_size = publication.file_size;
    result.introduction = introduction;

    LOG_CLIENT_INFO("Peer session with " << result.peer << " ready in " << result.duration.count() << " ms");
    report(result);

    if (!connection->drain(std::chrono::milliseconds(settings_.handshake_timeout_ms))) {
        LOG_CLIENT_DEBUG("Closing session with " << result.peer << " before all data was acknowledged");
    }
    connection->close();
}

PeerSessionResult FilePunchClient::fetch(const ContentId& content_id) {
    TimePoint start = Clock::now();

    if (!running_.load() || !rendezvous_) {
        return session_error(ErrorKind::DISCOVERY, "Client is not running", start);
    }
    if (cancelled_.load()) {
        return session_error(ErrorKind::DISCOVERY, "Cancelled", start);
    }

    DiscoveryResult discovered = rendezvous_->subscribe(content_id, resolved_.local);
    if (!discovered.success) {
        LOG_CLIENT_WARN("Discovery of " << content_id.to_hex() << " failed: " << discovered.error_message);
        return session_error(discovered.error, discovered.error_message, start);
    }

    const Introduction& introduction = discovered.introduction;
    std::vector<SocketAddress> candidates = order_candidates(introduction.peer, introduction.server_observed);
    LOG_CLIENT_INFO("Introduced to publisher " << introduction.peer.external << " (local "
                    << introduction.peer.local << "), " << introduction.file_size << " bytes");

    PunchResult punched = punch_->punch(candidates);
    if (!punched.success) {
        PeerSessionResult result = session_error(punched.error, punched.error_message, start);
        result.introduction = introduction;
        return result;
    }

    TransportResult connected = transport_->connect(punched.winner,
                                                    std::chrono::milliseconds(settings_.handshake_timeout_ms));
    if (!connected.success) {
        PeerSessionResult result = session_error(connected.error, connected.error_message, start);
        result.introduction = introduction;
        result.peer = punched.winner;
        return result;
    }

    auto connection = connected.connection;
    if (!connection->send(encode_content_request(content_id))) {
        connection->close();
        return session_error(ErrorKind::HANDSHAKE, "Peer session closed before content request", start);
    }

    std::vector<uint8_t> reply;
    uint64_t file_size = 0;
    if (!connection->receive(reply, std::chrono::milliseconds(settings_.handshake_timeout_ms)) ||
        !decode_hash_ok(reply, file_size)) {
        CloseReason reason = connection->close_reason();
        connection->close();
        if (cancelled_.load()) {
            return session_error(ErrorKind::DISCOVERY, "Cancelled", start);
        }
        if (reason == CloseReason::REMOTE) {
            LOG_CLIENT_WARN("Publisher " << punched.winner << " refused " << content_id.to_hex());
            return session_error(ErrorKind::HASH_MISMATCH, "Publisher does not serve this content", start);
        }
        return session_error(ErrorKind::HANDSHAKE, "No HashOk from publisher", start);
    }

    PeerSessionResult result;
    result.success = true;
    result.duration = elapsed_since(start);
    result.connection = connection;
    result.peer = punched.winner;
    result.file_size = file_size;
    result.introduction = introduction;

    LOG_CLIENT_INFO("Session with publisher " << result.peer << " ready in " << result.duration.count()
                    << " ms, " << file_size << " bytes offered");
    return result;
}

uint16_t FilePunchClient::local_port() const {
    return endpoint_ ? endpoint_->local_port() : 0;
}

SocketAddress FilePunchClient::local_address() const {
    return resolved_.local;
}

SocketAddress FilePunchClient::observed_address() const {
    return rendezvous_ ? rendezvous_->observed_address() : SocketAddress();
}

} // namespace filepunch
