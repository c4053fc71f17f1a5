#pragma once

/**
 * @file filepunch.h
 * @brief Client pipeline: resolve addresses, register with the rendezvous
 * server, punch through both NATs and bring up a secure peer session.
 *
 * One FilePunchClient owns one UDP socket for its whole lifetime. The control
 * connection, every punch and every peer session share it.
 */

#include "address_resolver.h"
#include "config.h"
#include "content_id.h"
#include "hole_punch.h"
#include "protocol.h"
#include "rendezvous_client.h"
#include "secure_transport.h"
#include "threadmanager.h"
#include "udp_endpoint.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace filepunch {

/**
 * Outcome of one pipeline run, publisher or subscriber side
 */
struct PeerSessionResult {
    bool success;
    ErrorKind error;
    std::string error_message;
    std::chrono::milliseconds duration;
    std::shared_ptr<PeerConnection> connection;  // established, HashOk exchanged
    SocketAddress peer;                          // address the punch settled on
    uint64_t file_size;
    Introduction introduction;

    PeerSessionResult() : success(false), error(ErrorKind::NONE), duration(0), file_size(0) {}
};

class FilePunchClient : public ThreadManager {
public:
    /**
     * Called on a per-peer thread once a subscriber has been introduced, or
     * with the error that ended its pipeline. The connection is closed when
     * the callback returns.
     */
    using PeerSessionCallback = std::function<void(const PeerSessionResult& result)>;

    explicit FilePunchClient(const ClientSettings& settings);

    /**
     * @param resolver Resolver to use instead of one built from the settings
     */
    FilePunchClient(const ClientSettings& settings, std::unique_ptr<AddressResolver> resolver);
    ~FilePunchClient();

    /**
     * Bind the socket, resolve addresses, connect to the rendezvous server and
     * learn the observed address. Sends a port override when a mapped or
     * forwarded port differs from the observed one.
     * @return true on success, see last_error() otherwise
     */
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    /**
     * Advertise content. Each introduced subscriber is served on its own thread.
     * @return true once the server acknowledged the record
     */
    bool publish(const ContentId& content_id, uint64_t file_size, PeerSessionCallback callback);

    /**
     * Find a publisher and open a verified session to it. Blocks the caller
     * for at most the discovery, punch and handshake deadlines combined.
     */
    PeerSessionResult fetch(const ContentId& content_id);

    /**
     * Abort every blocked operation. A cancelled client must be stopped and
     * cannot be reused.
     */
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    uint16_t local_port() const;
    SocketAddress local_address() const;
    SocketAddress observed_address() const;
    const ResolveResult& resolved() const { return resolved_; }
    ErrorKind last_error() const { return last_error_; }
    const std::string& last_error_message() const { return last_error_message_; }
    const ClientSettings& settings() const { return settings_; }

private:
    struct Publication {
        uint64_t file_size;
        PeerSessionCallback callback;
    };

    void on_introduction(const Introduction& introduction);
    void serve_introduction(Introduction introduction);
    bool fail_start(ErrorKind kind, const std::string& message);

    ClientSettings settings_;
    std::unique_ptr<AddressResolver> resolver_;
    std::unique_ptr<UdpEndpoint> endpoint_;
    std::unique_ptr<RendezvousClient> rendezvous_;
    std::unique_ptr<HolePunchCoordinator> punch_;
    std::unique_ptr<SecureTransport> transport_;

    std::atomic<bool> running_;
    std::atomic<bool> cancelled_;
    ResolveResult resolved_;
    ErrorKind last_error_;
    std::string last_error_message_;

    mutable std::mutex publications_mutex_;
    std::map<ContentId, Publication> publications_;
};

} // namespace filepunch
