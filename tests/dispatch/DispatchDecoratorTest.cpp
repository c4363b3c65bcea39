#include "rctx/DispatchDecorator.hpp"
#include "rctx/rt/ThreadPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rctx;

namespace {

// Collects whatever is posted so the test decides when and where it runs.
struct RecordingExecutor {
    std::vector<std::function<void()>> posted;
    bool accept = true;

    void post(std::function<void()> task) { posted.push_back(std::move(task)); }

    bool tryPost(std::function<void()> task) {
        if (!accept) return false;
        posted.push_back(std::move(task));
        return true;
    }
};

struct CountingAugment {
    int* calls;

    template <typename F>
    auto operator()(F&& task) const {
        ++*calls;
        return std::forward<F>(task);
    }
};

class DispatchDecoratorTest : public ::testing::Test {
protected:
    void SetUp() override { ContextRegistry::clear(); }
    void TearDown() override { ContextRegistry::clear(); }
};

} // namespace

TEST_F(DispatchDecoratorTest, NullTargetIsRejected) {
    std::shared_ptr<RecordingExecutor> none;
    EXPECT_THROW(DispatchDecorator<RecordingExecutor>(none, std::make_shared<RetryContext>()),
                 std::invalid_argument);
    EXPECT_THROW(DispatchDecorator<RecordingExecutor>{none}, std::invalid_argument);
}

TEST_F(DispatchDecoratorTest, PostedTaskRunsUnderExplicitContext) {
    auto exec = std::make_shared<RecordingExecutor>();
    auto ctx = std::make_shared<RetryContext>("explicit");
    DispatchDecorator<RecordingExecutor> dispatch(exec, ctx);

    ContextRef seen;
    dispatch.post([&seen] { seen = ContextRegistry::getCurrent(); });
    ASSERT_EQ(exec->posted.size(), 1u);

    std::thread runner([&] { exec->posted[0](); });
    runner.join();
    EXPECT_EQ(seen, ctx);
}

TEST_F(DispatchDecoratorTest, InheritAmbientIsReadAtConstruction) {
    auto exec = std::make_shared<RecordingExecutor>();
    auto atConstruction = std::make_shared<RetryContext>("construction");
    ContextRegistry::setCurrent(atConstruction);
    DispatchDecorator<RecordingExecutor> dispatch(exec);
    ContextRegistry::setCurrent(std::make_shared<RetryContext>("later"));

    ContextRef seen;
    dispatch.post([&seen] { seen = ContextRegistry::getCurrent(); });
    ContextRegistry::clear();
    exec->posted[0]();

    EXPECT_EQ(seen, atConstruction);
    EXPECT_EQ(dispatch.augment().context(), atConstruction);
    EXPECT_EQ(ContextRegistry::getCurrent(), nullptr);
}

TEST_F(DispatchDecoratorTest, TryPostReportsRefusal) {
    auto exec = std::make_shared<RecordingExecutor>();
    DispatchDecorator<RecordingExecutor> dispatch(exec, std::make_shared<RetryContext>());

    EXPECT_TRUE(dispatch.tryPost([] {}));
    exec->accept = false;
    EXPECT_FALSE(dispatch.tryPost([] {}));
    EXPECT_EQ(exec->posted.size(), 1u);
}

TEST_F(DispatchDecoratorTest, CustomAugmentIsAppliedToEveryTask) {
    auto exec = std::make_shared<RecordingExecutor>();
    int calls = 0;
    DispatchDecorator<RecordingExecutor, CountingAugment> dispatch(exec, CountingAugment{&calls});

    dispatch.post([] {});
    dispatch.post([] {});
    EXPECT_TRUE(dispatch.tryPost([] {}));
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(exec->posted.size(), 3u);
}

TEST_F(DispatchDecoratorTest, WorksOverThreadPool) {
    auto pool = std::make_shared<rt::ThreadPool>(2);
    auto ctx = std::make_shared<RetryContext>("pool");
    DispatchDecorator<rt::ThreadPool> dispatch(pool, ctx);

    std::atomic<int> matched{0};
    for (int i = 0; i < 20; ++i) {
        dispatch.post([&matched, ctx] {
            if (ContextRegistry::getCurrent() == ctx) matched++;
        });
    }
    pool->drain();
    EXPECT_EQ(matched.load(), 20);
    EXPECT_EQ(&dispatch.target(), pool.get());
}

TEST_F(DispatchDecoratorTest, AmbientAugmentReadsSubmitterContextPerPost) {
    auto exec = std::make_shared<RecordingExecutor>();
    DispatchDecorator<RecordingExecutor, AmbientAugment> dispatch(exec);

    auto first = std::make_shared<RetryContext>("first");
    auto second = std::make_shared<RetryContext>("second");
    std::vector<ContextRef> seen;
    auto record = [&seen] { seen.push_back(ContextRegistry::getCurrent()); };

    {
        ContextScope scope(first);
        dispatch.post(record);
    }
    {
        ContextScope scope(second);
        dispatch.post(record);
    }
    dispatch.post(record);

    for (auto& task : exec->posted) task();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], first);
    EXPECT_EQ(seen[1], second);
    EXPECT_EQ(seen[2], nullptr);
    EXPECT_EQ(ContextRegistry::getCurrent(), nullptr);
}
