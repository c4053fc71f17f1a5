#include "punch_session.h"
#include "logger.h"
#include "secure_channel.h"
#include <algorithm>

#define LOG_PUNCH_DEBUG(message) LOG_DEBUG("punch", message)
#define LOG_PUNCH_INFO(message)  LOG_INFO("punch", message)
#define LOG_PUNCH_WARN(message)  LOG_WARN("punch", message)

namespace filepunch {

namespace {

const uint8_t PROBE_MAGIC[4] = {'F', 'P', 'N', 'H'};

} // anonymous namespace

std::vector<uint8_t> make_punch_probe(bool ack) {
    std::vector<uint8_t> probe(PUNCH_PROBE_SIZE, 0);
    probe[0] = static_cast<uint8_t>(PacketType::PUNCH);
    std::copy(PROBE_MAGIC, PROBE_MAGIC + 4, probe.begin() + 1);
    probe[5] = ack ? PUNCH_FLAG_ACK : 0;
    return probe;
}

bool parse_punch_probe(const std::vector<uint8_t>& datagram, bool& ack) {
    if (datagram.size() != PUNCH_PROBE_SIZE || datagram[0] != static_cast<uint8_t>(PacketType::PUNCH)) {
        return false;
    }
    if (!std::equal(PROBE_MAGIC, PROBE_MAGIC + 4, datagram.begin() + 1)) {
        return false;
    }
    ack = (datagram[5] & PUNCH_FLAG_ACK) != 0;
    return true;
}

std::vector<SocketAddress> order_candidates(const PeerAddress& peer, const SocketAddress& server_observed) {
    std::vector<SocketAddress> ordered;
    for (const auto* address : {&peer.external, &server_observed, &peer.local}) {
        if (!address->is_specified() || address->port == 0) {
            continue;
        }
        if (std::find(ordered.begin(), ordered.end(), *address) == ordered.end()) {
            ordered.push_back(*address);
        }
    }
    return ordered;
}

const char* punch_state_to_string(PunchState state) {
    switch (state) {
        case PunchState::IDLE: return "idle";
        case PunchState::PROBING: return "probing";
        case PunchState::REACHABLE: return "reachable";
        case PunchState::TIMED_OUT: return "timed out";
        case PunchState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

//=============================================================================
// PunchSession Implementation
//=============================================================================

PunchSession::PunchSession(std::vector<SocketAddress> candidates, const PunchConfig& config)
    : candidates_(std::move(candidates)),
      config_(config),
      state_(PunchState::IDLE),
      attempts_(0) {
}

std::vector<SocketAddress> PunchSession::start(TimePoint now) {
    if (state_ != PunchState::IDLE) {
        return {};
    }

    started_at_ = now;
    state_ = PunchState::PROBING;

    if (candidates_.empty()) {
        LOG_PUNCH_WARN("No candidates to punch");
        finish(PunchState::TIMED_OUT, now);
        return {};
    }

    LOG_PUNCH_DEBUG("Punching " << candidates_.size() << " candidates, first " << candidates_.front());
    return probe_round(now);
}

std::vector<SocketAddress> PunchSession::on_tick(TimePoint now) {
    if (state_ != PunchState::PROBING) {
        return {};
    }

    if (now - started_at_ >= config_.deadline) {
        LOG_PUNCH_INFO("No candidate answered after " << attempts_ << " rounds");
        finish(PunchState::TIMED_OUT, now);
        return {};
    }

    if (now < next_probe_at_) {
        return {};
    }

    return probe_round(now);
}

bool PunchSession::on_datagram(const SocketAddress& from, TimePoint now) {
    if (state_ != PunchState::PROBING) {
        return false;
    }

    if (std::find(candidates_.begin(), candidates_.end(), from) == candidates_.end()) {
        return false;
    }

    winner_ = from;
    finish(PunchState::REACHABLE, now);
    LOG_PUNCH_INFO("Candidate " << from << " reachable after " << elapsed().count() << " ms");
    return true;
}

void PunchSession::cancel() {
    TimePoint now = Clock::now();
    if (state_ == PunchState::IDLE) {
        started_at_ = now;
    }
    if (state_ == PunchState::IDLE || state_ == PunchState::PROBING) {
        finish(PunchState::CANCELLED, now);
    }
}

bool PunchSession::is_finished() const {
    return state_ == PunchState::REACHABLE || state_ == PunchState::TIMED_OUT ||
           state_ == PunchState::CANCELLED;
}

std::chrono::milliseconds PunchSession::elapsed() const {
    if (state_ == PunchState::IDLE) {
        return std::chrono::milliseconds(0);
    }
    TimePoint end = is_finished() ? finished_at_ : Clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at_);
}

std::vector<SocketAddress> PunchSession::probe_round(TimePoint now) {
    ++attempts_;
    next_probe_at_ = now + config_.interval;
    return candidates_;
}

void PunchSession::finish(PunchState state, TimePoint now) {
    state_ = state;
    finished_at_ = now;
}

} // namespace filepunch
