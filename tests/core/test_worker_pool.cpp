#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "test_base.hpp"
#include "tcrimer/core/worker_pool.hpp"

using namespace tcrimer;
using namespace tcrimer::testing;

class WorkerPoolTest : public TestBase {};

TEST_F(WorkerPoolTest, ReturnsResultsThroughFutures) {
    WorkerPool pool(3, "test");
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
    EXPECT_EQ(pool.size(), 3u);
}

TEST_F(WorkerPoolTest, RunsTasksConcurrently) {
    WorkerPool pool(2, "test");
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    auto task = [&]() {
        int now = ++running;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        --running;
    };
    auto a = pool.submit(task);
    auto b = pool.submit(task);
    a.get();
    b.get();
    EXPECT_EQ(peak.load(), 2);
}

TEST_F(WorkerPoolTest, ShutdownDrainsQueueThenRejects) {
    WorkerPool pool(1, "test");
    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i) {
        pool.submit([&done]() { ++done; });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 5);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}

TEST_F(WorkerPoolTest, ExceptionsTravelThroughFuture) {
    WorkerPool pool(1, "test");
    auto failing = pool.submit([]() -> int { throw std::logic_error("bad task"); });
    EXPECT_THROW(failing.get(), std::logic_error);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}
