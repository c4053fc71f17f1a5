#include "hole_punch.h"
#include "logger.h"
#include <algorithm>

#define LOG_PUNCH_DEBUG(message) LOG_DEBUG("punch", message)
#define LOG_PUNCH_INFO(message)  LOG_INFO("punch", message)
#define LOG_PUNCH_WARN(message)  LOG_WARN("punch", message)

namespace filepunch {

namespace {

// Extra time granted to the endpoint timer before a stalled punch is abandoned
constexpr std::chrono::milliseconds STALL_GRACE(1000);

} // anonymous namespace

HolePunchCoordinator::HolePunchCoordinator(UdpEndpoint& endpoint, const PunchConfig& config)
    : endpoint_(endpoint), config_(config), observer_id_(0) {
    DatagramObserver observer;
    observer.on_datagram = [this](const SocketAddress& from, PacketType, TimePoint now) {
        on_datagram(from, now);
    };
    observer.on_tick = [this](TimePoint now) {
        on_tick(now);
    };
    observer_id_ = endpoint_.add_observer(std::move(observer));
}

HolePunchCoordinator::~HolePunchCoordinator() {
    cancel();
    endpoint_.remove_observer(observer_id_);
}

PunchResult HolePunchCoordinator::punch(const std::vector<SocketAddress>& candidates) {
    PunchResult result;
    auto session = std::make_shared<PunchSession>(candidates, config_);

    std::vector<SocketAddress> first_round;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        first_round = session->start(Clock::now());
        if (!session->is_finished()) {
            sessions_.push_back(session);
        }
    }
    send_probes(first_round);

    {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        bool finished = sessions_cv_.wait_for(lock, config_.deadline + STALL_GRACE, [&session] {
            return session->is_finished();
        });
        if (!finished) {
            LOG_PUNCH_WARN("Punch session stalled, endpoint timer not running");
            session->cancel();
        }
        sessions_.erase(std::remove(sessions_.begin(), sessions_.end(), session), sessions_.end());
    }

    result.duration = session->elapsed();
    result.attempts = session->attempts();

    switch (session->state()) {
        case PunchState::REACHABLE:
            result.success = true;
            result.winner = session->winner();
            LOG_PUNCH_INFO("Punched through to " << result.winner << " in " << result.duration.count()
                           << " ms (" << result.attempts << " rounds)");
            break;
        case PunchState::CANCELLED:
            result.error = ErrorKind::DISCOVERY;
            result.error_message = "Hole punch cancelled";
            break;
        default:
            result.error = ErrorKind::TRAVERSAL_TIMEOUT;
            result.error_message = candidates.empty()
                ? "No candidate addresses to punch"
                : "No candidate reachable within " + std::to_string(config_.deadline.count()) + " ms";
            LOG_PUNCH_WARN(result.error_message);
            break;
    }

    return result;
}

void HolePunchCoordinator::cancel() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& session : sessions_) {
        session->cancel();
    }
    sessions_cv_.notify_all();
}

size_t HolePunchCoordinator::active_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void HolePunchCoordinator::on_datagram(const SocketAddress& from, TimePoint now) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    bool resolved = false;
    for (auto& session : sessions_) {
        if (session->on_datagram(from, now)) {
            resolved = true;
        }
    }
    if (resolved) {
        sessions_cv_.notify_all();
    }
}

void HolePunchCoordinator::on_tick(TimePoint now) {
    std::vector<SocketAddress> targets;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        bool finished = false;
        for (auto& session : sessions_) {
            auto due = session->on_tick(now);
            targets.insert(targets.end(), due.begin(), due.end());
            finished = finished || session->is_finished();
        }
        if (finished) {
            sessions_cv_.notify_all();
        }
    }
    send_probes(targets);
}

void HolePunchCoordinator::send_probes(const std::vector<SocketAddress>& targets) {
    for (const auto& target : targets) {
        if (!endpoint_.send_probe(target, false)) {
            LOG_PUNCH_DEBUG("Probe to " << target << " failed");
        }
    }
}

} // namespace filepunch
