#pragma once

#include "config.h"
#include "noise.h"
#include "protocol.h"
#include "registry.h"
#include "udp_endpoint.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace filepunch {

/**
 * Lifecycle of one control connection on the server
 */
enum class ConnectionState {
    CONNECTED,    // secure channel up, no request yet
    IDLE,
    PUBLISHING,   // owns at least one record
    SUBSCRIBING,  // inside a subscribe request
    CLOSED
};

const char* connection_state_to_string(ConnectionState state);

/**
 * How the handler talks back to one connection
 */
struct ConnectionSink {
    std::function<bool(const std::vector<uint8_t>&)> send;  // queue one reliable message
    std::function<void()> close;
};

/**
 * Rendezvous logic for all control connections, independent of the
 * transport. The server binds it to secure channels; tests can bind it to
 * in-memory sinks.
 *
 * Records live exactly as long as their connection: on_closed() removes
 * them from the registry before returning.
 */
class ControlHandler {
public:
    explicit ControlHandler(Registry& registry);

    ConnectionId on_connected(const SocketAddress& observed, ConnectionSink sink);
    void on_message(ConnectionId connection_id, const std::vector<uint8_t>& data);
    void on_closed(ConnectionId connection_id);

    size_t connection_count() const;
    ConnectionState connection_state(ConnectionId connection_id) const;
    Registry& registry() { return registry_; }

private:
    struct Connection {
        ConnectionId id;
        SocketAddress observed;
        uint16_t port_override;
        ConnectionState state;
        size_t publications;
        ConnectionSink sink;
    };

    void handle_socket_ping(const std::shared_ptr<Connection>& connection, const ControlMessage& request);
    void handle_port_override(const std::shared_ptr<Connection>& connection, const ControlMessage& request);
    void handle_publish(const std::shared_ptr<Connection>& connection, const ControlMessage& request);
    void handle_subscribe(const std::shared_ptr<Connection>& connection, const ControlMessage& request);

    std::shared_ptr<Connection> find_connection(ConnectionId connection_id) const;
    SocketAddress advertised_external(const Connection& connection) const;
    ConnectionState resting_state(const Connection& connection) const;
    void set_state(Connection& connection, ConnectionState state);
    bool send_message(Connection& connection, const ControlMessage& message);
    void send_error(Connection& connection, uint32_t request_id, ControlErrorCode code, const std::string& reason);

    /**
     * Registry invariant violated: log it and drop the offending connection only
     */
    void registry_inconsistency(ConnectionId connection_id, const std::string& detail);

    Registry& registry_;

    mutable std::mutex connections_mutex_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;
    std::atomic<ConnectionId> next_connection_id_;
};

/**
 * Rendezvous server: one UDP endpoint accepting secure control connections,
 * a registry, and the control handler between them. Holds no state beyond
 * its process lifetime.
 */
class RendezvousServer {
public:
    explicit RendezvousServer(const ServerConfig& config);
    ~RendezvousServer();

    bool start();
    void stop();
    bool is_running() const;

    uint16_t port() const;
    std::string fingerprint() const;

    Registry& registry() { return *registry_; }
    ControlHandler& handler() { return *handler_; }

private:
    bool accept_connection(const std::shared_ptr<SecureChannel>& channel);

    ServerConfig config_;
    NoiseKey static_key_;
    std::unique_ptr<Registry> registry_;
    std::unique_ptr<ControlHandler> handler_;
    std::unique_ptr<UdpEndpoint> endpoint_;
};

} // namespace filepunch
