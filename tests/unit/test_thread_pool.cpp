#include <gtest/gtest.h>
#include "switchyard/engine/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace switchyard;
using namespace switchyard::engine;

TEST(ThreadPoolTest, RunsPostedJobs) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            EXPECT_TRUE(pool.post([&counter]() { counter.fetch_add(1); }));
        }
        pool.shutdown();
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, ZeroMeansAtLeastTwoWorkers) {
    ThreadPool pool(0);
    EXPECT_GE(pool.size(), 2u);
}

TEST(ThreadPoolTest, ShutdownDrainsBacklog) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    for (int i = 0; i < 10; ++i) {
        pool.post([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            counter.fetch_add(1);
        });
    }
    pool.shutdown();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.backlog(), 0u);
}

TEST(ThreadPoolTest, RejectsAfterShutdown) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.post([]() {}));
    pool.shutdown();  // second call is a no-op
}

TEST(ThreadPoolTest, ThrowingJobDoesNotKillWorker) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    pool.post([]() { throw std::runtime_error("boom"); });
    pool.post([&counter]() { counter.fetch_add(1); });
    pool.shutdown();
    EXPECT_EQ(counter.load(), 1);
}
