#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace filepunch {

/**
 * ThreadManager owns the background threads of a component (an endpoint I/O
 * loop, a lease renewal timer, per-peer pipelines) and coordinates their
 * shutdown through one condition variable.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Add a managed thread with a descriptive name
     * @param t Thread to be managed (moved)
     * @param name Descriptive name for logging purposes
     * @return false if shutdown was already requested (the thread is joined before returning)
     */
    bool add_managed_thread(std::thread&& t, const std::string& name);

    /**
     * Run body on a new managed thread that is reaped once it returns,
     * so short-lived threads do not accumulate while the component runs
     * @param body Work to run; exceptions are logged and dropped
     * @param name Descriptive name for logging purposes
     * @return false if shutdown was already requested (body does not run)
     */
    bool run_managed_thread(std::function<void()> body, const std::string& name);

    /**
     * Join and forget threads started by run_managed_thread() that have finished
     * @return Number of threads reaped
     */
    size_t cleanup_finished_threads();

    /**
     * Signal all threads to shutdown and wake any waiting in wait_for_shutdown()
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish.
     * Must not be called from one of the managed threads.
     */
    void join_all_active_threads();

    /**
     * Clear the shutdown flag so that a stopped component can be started again.
     * Call only after join_all_active_threads().
     */
    void reset_shutdown();

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

    /**
     * Get the current number of active threads
     * @return Number of active threads
     */
    size_t get_active_thread_count() const;

protected:
    /**
     * Sleep for up to timeout, waking early on shutdown
     * @return true if shutdown was requested
     */
    bool wait_for_shutdown(std::chrono::milliseconds timeout);

    std::condition_variable shutdown_cv_;
    std::mutex shutdown_mutex_;

private:
    struct NamedThread {
        std::thread thread;
        std::string name;
        std::shared_ptr<std::atomic<bool>> finished;  // null for threads added by the caller
    };

    std::vector<NamedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace filepunch
