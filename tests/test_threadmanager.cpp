#include <gtest/gtest.h>
#include "threadmanager.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace filepunch;

namespace {

// Reap until nothing is left or the deadline passes
bool reap_until_empty(ThreadManager& manager, std::chrono::milliseconds deadline) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        manager.cleanup_finished_threads();
        if (manager.get_active_thread_count() == 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // anonymous namespace

TEST(ThreadManagerTest, FinishedTasksAreReaped) {
    ThreadManager manager;
    std::atomic<int> ran{0};

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(manager.run_managed_thread([&ran]() { ran++; }, "task-" + std::to_string(i)));
    }

    EXPECT_TRUE(reap_until_empty(manager, std::chrono::milliseconds(5000)));
    EXPECT_EQ(ran.load(), 4);
}

TEST(ThreadManagerTest, StartingATaskReapsEarlierOnes) {
    ThreadManager manager;
    std::atomic<int> ran{0};

    // Sequential short tasks, like one session per incoming peer
    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(manager.run_managed_thread([&ran]() { ran++; }, "session"));
        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (ran.load() <= i && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_EQ(ran.load(), i + 1);
    }

    // Each task returns right after bumping the counter, so at most the
    // last one or two can still be running
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(manager.run_managed_thread([]() {}, "last"));
    EXPECT_LE(manager.get_active_thread_count(), 2u);
}

TEST(ThreadManagerTest, ExceptionInTaskStillMarksItFinished) {
    ThreadManager manager;
    ASSERT_TRUE(manager.run_managed_thread([]() { throw std::runtime_error("boom"); }, "thrower"));
    EXPECT_TRUE(reap_until_empty(manager, std::chrono::milliseconds(5000)));
}

TEST(ThreadManagerTest, PlainThreadsAreNotReaped) {
    ThreadManager manager;
    std::atomic<bool> done{false};

    ASSERT_TRUE(manager.add_managed_thread(std::thread([&done]() { done = true; }), "plain"));
    while (!done.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(manager.cleanup_finished_threads(), 0u);
    EXPECT_EQ(manager.get_active_thread_count(), 1u);

    manager.shutdown_all_threads();
    manager.join_all_active_threads();
    EXPECT_EQ(manager.get_active_thread_count(), 0u);
}

TEST(ThreadManagerTest, RefusesTasksAfterShutdown) {
    ThreadManager manager;
    manager.shutdown_all_threads();

    bool ran = false;
    EXPECT_FALSE(manager.run_managed_thread([&ran]() { ran = true; }, "late"));
    EXPECT_FALSE(ran);
    EXPECT_EQ(manager.get_active_thread_count(), 0u);
}
