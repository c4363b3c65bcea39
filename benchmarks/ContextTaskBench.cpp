#include <benchmark/benchmark.h>
#include "rctx/ContextTask.hpp"
#include <functional>
#include <memory>

static void BM_PlainCall(benchmark::State& state) {
    int x = 0;
    auto fn = [&x] { return ++x; };
    for (auto _ : state) {
        benchmark::DoNotOptimize(fn());
    }
}

BENCHMARK(BM_PlainCall);

static void BM_ContextTaskCall(benchmark::State& state) {
    int x = 0;
    auto task = rctx::wrapTask([&x] { return ++x; }, std::make_shared<rctx::RetryContext>("bench"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(task());
    }
}

BENCHMARK(BM_ContextTaskCall);

static void BM_ContextTaskCallWithAmbient(benchmark::State& state) {
    int x = 0;
    rctx::ContextScope outer(std::make_shared<rctx::RetryContext>("ambient"));
    auto task = rctx::wrapTask([&x] { return ++x; }, std::make_shared<rctx::RetryContext>("bench"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(task());
    }
}

BENCHMARK(BM_ContextTaskCallWithAmbient);

static void BM_WrapStdFunction(benchmark::State& state) {
    auto ctx = std::make_shared<rctx::RetryContext>("bench");
    std::function<void()> fn = [] {};
    for (auto _ : state) {
        std::function<void()> wrapped = rctx::wrapTask(fn, ctx);
        benchmark::DoNotOptimize(wrapped);
    }
}

BENCHMARK(BM_WrapStdFunction);
