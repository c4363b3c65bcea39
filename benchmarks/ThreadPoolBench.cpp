#include <benchmark/benchmark.h>
#include "rctx/PoolDecorator.hpp"
#include "rctx/rt/ThreadPool.hpp"
#include <atomic>
#include <memory>

static void BM_ThreadPoolPost(benchmark::State& state) {
    rctx::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.drain();
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolPost)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kNanosecond);

static void BM_DecoratedPoolPost(benchmark::State& state) {
    auto pool = std::make_shared<rctx::rt::ThreadPool>(static_cast<unsigned>(state.range(0)));
    rctx::PoolDecorator<rctx::rt::ThreadPool> decorated(pool, std::make_shared<rctx::RetryContext>("bench"));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        decorated.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
    }
    pool->drain();
    pool->shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_DecoratedPoolPost)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kNanosecond);

static void BM_ThreadPoolPostAndDrain(benchmark::State& state) {
    rctx::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        for (int i = 0; i < 100; ++i) {
            pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
        }
        pool.drain();
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_ThreadPoolPostAndDrain)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

static void BM_SubmitAndGet(benchmark::State& state) {
    rctx::rt::ThreadPool pool(2);
    for (auto _ : state) {
        benchmark::DoNotOptimize(pool.submit([] { return 1; }).get());
    }
    pool.shutdown();
}

BENCHMARK(BM_SubmitAndGet)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
