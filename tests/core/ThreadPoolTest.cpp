#include "rctx/rt/ThreadPool.hpp"
#include "rctx/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rctx;
using namespace rctx::rt;

TEST(ThreadPoolTest, ExecutesTasks) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    const int tasks = 100;
    for (int i = 0; i < tasks; ++i) {
        pool.post([&counter](){ counter++; });
    }
    pool.drain();
    EXPECT_EQ(counter.load(), tasks);
}

TEST(ThreadPoolTest, ZeroThreadsPromotedToOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 5; }).get(), 5);
}

TEST(ThreadPoolTest, NoDeadlockOnImmediateShutdown) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_TRUE(pool.awaitTermination(std::chrono::seconds(5)));
}

TEST(ThreadPoolTest, PostAfterShutdownDoesNothing) {
    std::atomic<int> counter{0};
    ThreadPool pool(2);
    pool.shutdown();
    pool.post([&counter](){ counter++; });
    EXPECT_FALSE(pool.tryPost([&counter](){ counter++; }));
    // Allow brief window for any incorrectly executed tasks
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(counter.load(), 0);
}

TEST(ThreadPoolTest, DestructorShutsDownAndExecutesTasks) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(3);
        for (int i = 0; i < 50; ++i) {
            pool.post([&counter](){ counter++; });
        }
        // Destructor should call shutdown and complete tasks
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, ConcurrentPost) {
    std::atomic<int> counter{0};
    ThreadPool pool(4);
    const int threads = 4, tasksPerThread = 25;
    std::vector<std::thread> posters;
    for (int t = 0; t < threads; ++t) {
        posters.emplace_back([&pool, &counter, tasksPerThread](){
            for (int i = 0; i < tasksPerThread; ++i) {
                pool.post([&counter](){ counter++; });
            }
        });
    }
    for (auto& p : posters) p.join();
    pool.shutdown();
    ASSERT_TRUE(pool.awaitTermination(std::chrono::seconds(5)));
    EXPECT_EQ(counter.load(), threads * tasksPerThread);
}

TEST(ThreadPoolTest, ThrowingTaskIsCountedAndWorkerSurvives) {
    ThreadPool pool(1);
    const double before = util::MetricRegistry::instance().counter("pool.task_failed");
    pool.post([] { throw std::runtime_error("boom"); });
    auto after = pool.submit([] { return 1; });
    EXPECT_EQ(after.get(), 1);
    EXPECT_EQ(util::MetricRegistry::instance().counter("pool.task_failed"), before + 1);
}

TEST(ThreadPoolTest, DrainWaitsForNestedWork) {
    std::atomic<int> counter{0};
    ThreadPool pool(2);
    pool.post([&pool, &counter] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        pool.post([&counter] { counter++; });
        counter++;
    });
    pool.drain();
    EXPECT_EQ(counter.load(), 2);
}

TEST(ThreadPoolTest, ShutdownNowHandsBackQueuedTasks) {
    ThreadPool pool(1);
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::promise<void> started;
    pool.post([gate, &started] { started.set_value(); gate.wait(); });
    started.get_future().wait();

    std::atomic<int> counter{0};
    for (int i = 0; i < 3; ++i) pool.post([&counter] { counter++; });

    auto pending = pool.shutdownNow();
    EXPECT_EQ(pending.size(), 3u);
    EXPECT_TRUE(pool.isShutdown());
    release.set_value();
    ASSERT_TRUE(pool.awaitTermination(std::chrono::seconds(5)));
    EXPECT_TRUE(pool.isTerminated());
    EXPECT_EQ(counter.load(), 0);

    for (auto& task : pending) task();
    EXPECT_EQ(counter.load(), 3);
}

TEST(ThreadPoolTest, SubmitWithFixedResult) {
    ThreadPool pool(1);
    bool ran = false;
    auto fut = pool.submit([&ran] { ran = true; }, 99);
    EXPECT_EQ(fut.get(), 99);
    EXPECT_TRUE(ran);
}
