#pragma once

#include "punch_session.h"
#include "udp_endpoint.h"
#include "types.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filepunch {

/**
 * Outcome of one hole punch
 */
struct PunchResult {
    bool success;
    ErrorKind error;
    SocketAddress winner;
    std::string error_message;
    std::chrono::milliseconds duration;
    uint32_t attempts;

    PunchResult() : success(false), error(ErrorKind::NONE), duration(0), attempts(0) {}
};

/**
 * Runs PunchSessions on an endpoint. Probes go out from the endpoint's single
 * socket, the endpoint's timer drives the probe schedule and every inbound
 * datagram is reported to the sessions.
 */
class HolePunchCoordinator {
public:
    HolePunchCoordinator(UdpEndpoint& endpoint, const PunchConfig& config = PunchConfig());
    ~HolePunchCoordinator();

    /**
     * Probe the candidates until one answers or the deadline passes.
     * Blocks the calling thread.
     * @param candidates Ordered candidates, see order_candidates()
     * @return Winning address, or TRAVERSAL_TIMEOUT / DISCOVERY (cancelled)
     */
    PunchResult punch(const std::vector<SocketAddress>& candidates);

    /**
     * Resolve every running punch as cancelled
     */
    void cancel();

    size_t active_sessions() const;
    const PunchConfig& config() const { return config_; }

private:
    void on_datagram(const SocketAddress& from, TimePoint now);
    void on_tick(TimePoint now);
    void send_probes(const std::vector<SocketAddress>& targets);

    UdpEndpoint& endpoint_;
    const PunchConfig config_;
    uint64_t observer_id_;

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::vector<std::shared_ptr<PunchSession>> sessions_;
};

} // namespace filepunch
