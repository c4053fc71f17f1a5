#include "threadmanager.h"
#include <algorithm>
#include <iterator>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace filepunch {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    shutdown_all_threads();
    join_all_active_threads();
}

bool ThreadManager::add_managed_thread(std::thread&& t, const std::string& name) {
    std::unique_lock<std::mutex> lock(active_threads_mutex_);

    if (shutdown_requested_.load()) {
        lock.unlock();
        LOG_THREAD_WARN("Refusing new thread during shutdown: " << name);
        if (t.joinable()) {
            t.join();
        }
        return false;
    }

    active_threads_.push_back(NamedThread{std::move(t), name, nullptr});
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

bool ThreadManager::run_managed_thread(std::function<void()> body, const std::string& name) {
    cleanup_finished_threads();

    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Refusing new thread during shutdown: " << name);
        return false;
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread t([body, finished, name]() {
        try {
            body();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Exception in thread " << name << ": " << e.what());
        }
        finished->store(true);
    });

    active_threads_.push_back(NamedThread{std::move(t), name, finished});
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

size_t ThreadManager::cleanup_finished_threads() {
    std::vector<NamedThread> finished_threads;
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        auto done = std::stable_partition(active_threads_.begin(), active_threads_.end(),
                                          [](const NamedThread& entry) {
                                              return !entry.finished || !entry.finished->load();
                                          });
        std::move(done, active_threads_.end(), std::back_inserter(finished_threads));
        active_threads_.erase(done, active_threads_.end());
    }

    const std::thread::id self = std::this_thread::get_id();
    for (auto& entry : finished_threads) {
        if (!entry.thread.joinable()) {
            continue;
        }
        if (entry.thread.get_id() == self) {
            entry.thread.detach();
            continue;
        }
        entry.thread.join();
        LOG_THREAD_DEBUG("Reaped finished thread: " << entry.name);
    }
    return finished_threads.size();
}

void ThreadManager::shutdown_all_threads() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }
    LOG_THREAD_DEBUG("Shutdown requested");
    shutdown_cv_.notify_all();
}

void ThreadManager::join_all_active_threads() {
    std::vector<NamedThread> threads_to_join;
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    const std::thread::id self = std::this_thread::get_id();
    for (auto& entry : threads_to_join) {
        if (!entry.thread.joinable()) {
            continue;
        }
        if (entry.thread.get_id() == self) {
            LOG_THREAD_WARN("Thread " << entry.name << " cannot join itself, detaching");
            entry.thread.detach();
            continue;
        }
        try {
            entry.thread.join();
            LOG_THREAD_DEBUG("Joined thread: " << entry.name);
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Exception while joining thread " << entry.name << ": " << e.what());
        }
    }
}

void ThreadManager::reset_shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_requested_.store(false);
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

bool ThreadManager::wait_for_shutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    return shutdown_cv_.wait_for(lock, timeout, [this] { return shutdown_requested_.load(); });
}

} // namespace filepunch
