#pragma once

#include "socket.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <vector>

namespace filepunch {

// Punch probe: type 0x01, "FPNH", flags (bit 0 = ack), two reserved bytes
constexpr size_t PUNCH_PROBE_SIZE = 8;
constexpr uint8_t PUNCH_FLAG_ACK = 0x01;

std::vector<uint8_t> make_punch_probe(bool ack);

/**
 * Validate a probe datagram
 * @param datagram Received bytes
 * @param ack Set to the ack flag of the probe
 * @return true if the datagram is a well-formed probe
 */
bool parse_punch_probe(const std::vector<uint8_t>& datagram, bool& ack);

/**
 * Order a peer's candidates for probing: advertised external address, the
 * server's observation of the peer, then the peer's local address. Empty
 * addresses are skipped and duplicates keep their first position.
 */
std::vector<SocketAddress> order_candidates(const PeerAddress& peer,
                                            const SocketAddress& server_observed = SocketAddress());

enum class PunchState {
    IDLE,
    PROBING,
    REACHABLE,
    TIMED_OUT,
    CANCELLED
};

const char* punch_state_to_string(PunchState state);

struct PunchConfig {
    std::chrono::milliseconds interval;
    std::chrono::milliseconds deadline;

    PunchConfig() : interval(250), deadline(8000) {}
    PunchConfig(std::chrono::milliseconds interval, std::chrono::milliseconds deadline)
        : interval(interval), deadline(deadline) {}
};

/**
 * Simultaneous-probe state machine for one peer.
 *
 * IDLE -> PROBING -> REACHABLE | TIMED_OUT | CANCELLED
 *
 * The session never sends anything itself: start() and on_tick() return the
 * candidates that are due for a probe, on_datagram() reports an arrival.
 * The first candidate heard from wins. Not thread safe.
 */
class PunchSession {
public:
    PunchSession(std::vector<SocketAddress> candidates, const PunchConfig& config);

    /**
     * Enter PROBING and return the first round of probe targets.
     * A session without candidates times out immediately.
     */
    std::vector<SocketAddress> start(TimePoint now);

    /**
     * Advance time
     * @return Probe targets due at this instant (empty when not due or finished)
     */
    std::vector<SocketAddress> on_tick(TimePoint now);

    /**
     * Report any datagram (probe, probe ack, handshake) from an address
     * @return true if this arrival resolved the session
     */
    bool on_datagram(const SocketAddress& from, TimePoint now);

    void cancel();

    PunchState state() const { return state_; }
    bool is_finished() const;
    const SocketAddress& winner() const { return winner_; }
    const std::vector<SocketAddress>& candidates() const { return candidates_; }

    // Number of probe rounds sent
    uint32_t attempts() const { return attempts_; }

    std::chrono::milliseconds elapsed() const;

private:
    std::vector<SocketAddress> candidates_;
    PunchConfig config_;
    PunchState state_;
    SocketAddress winner_;
    uint32_t attempts_;
    TimePoint started_at_;
    TimePoint finished_at_;
    TimePoint next_probe_at_;

    std::vector<SocketAddress> probe_round(TimePoint now);
    void finish(PunchState state, TimePoint now);
};

} // namespace filepunch
