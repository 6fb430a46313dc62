#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "docchunk/worker_pool.hpp"

using namespace docchunk;

TEST(WorkerPoolTest, ReturnsResultsThroughFutures) {
    WorkerPool pool(3, 8);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) EXPECT_EQ(results[i].get(), i * i);
}

TEST(WorkerPoolTest, ExceptionsTravelToCaller) {
    WorkerPool pool(1, 4);
    auto fut = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(fut.get(), std::runtime_error);

    auto done = pool.submit([]() {});
    done.get();

    pool.shutdown();
    auto stats = pool.get_stats();
    EXPECT_EQ(stats.completed_tasks, 1u);
    EXPECT_EQ(stats.failed_tasks, 1u);
    EXPECT_EQ(stats.active_workers, 0u);
}

TEST(WorkerPoolTest, TrySubmitThrowsWhenQueueIsFull) {
    WorkerPool pool(1, 1);
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto first = pool.submit([&started, gate]() {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    auto second = pool.try_submit([]() { return 2; });
    EXPECT_EQ(pool.get_stats().queue_size, 1u);
    EXPECT_THROW(pool.try_submit([]() { return 3; }), QueueFull);

    release.set_value();
    first.get();
    EXPECT_EQ(second.get(), 2);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    WorkerPool pool(2, 16);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.submit([i]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return i;
        }));
    }
    pool.shutdown();
    pool.shutdown();
    for (int i = 0; i < 10; ++i) EXPECT_EQ(results[i].get(), i);
    EXPECT_EQ(pool.get_stats().completed_tasks, 10u);

    EXPECT_THROW(pool.submit([]() { return 0; }), Error);
}

TEST(WorkerPoolTest, RejectsEmptyConfiguration) {
    EXPECT_THROW(WorkerPool(0, 4), ConfigError);
    EXPECT_THROW(WorkerPool(2, 0), ConfigError);

    Config cfg;
    cfg.worker_threads = 2;
    cfg.queue_capacity = 5;
    WorkerPool pool(cfg);
    EXPECT_EQ(pool.capacity(), 5u);
    EXPECT_EQ(pool.get_stats().active_workers, 2u);
}
