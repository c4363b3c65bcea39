// File: include/rctx/rt/Bulk.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "rctx/Errors.hpp"
#include "rctx/rt/Job.hpp"

// Bulk submission shared by ThreadPool and ScheduledThreadPool. Exec needs
// `bool tryPost(Task)`.
namespace rctx::rt::bulk {

namespace detail {

// First success wins; failures are remembered so the last one can be rethrown.
template <typename R>
class AnyState {
  static_assert(!std::is_void_v<R> && !std::is_reference_v<R>,
                "invokeAny needs value-returning tasks");

public:
  explicit AnyState(std::size_t pending) : pending_(pending) {}

  template <typename Fn>
  void attempt(Fn& fn) {
    std::optional<R> value;
    std::exception_ptr error;
    try {
      value.emplace(std::invoke(fn));
    } catch (...) {
      error = std::current_exception();
    }
    std::lock_guard<std::mutex> lk(mx_);
    if (value && !value_) value_ = std::move(value);
    if (error) lastError_ = error;
    --pending_;
    cv_.notify_all();
  }

  void fail(std::exception_ptr error) {
    std::lock_guard<std::mutex> lk(mx_);
    lastError_ = error;
    --pending_;
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait(lk, [this] { return settled(); });
  }

  bool waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mx_);
    return cv_.wait_until(lk, deadline, [this] { return settled(); });
  }

  // Only valid once settled.
  R take() {
    std::lock_guard<std::mutex> lk(mx_);
    if (value_) return std::move(*value_);
    std::rethrow_exception(lastError_);
  }

private:
  bool settled() const { return value_.has_value() || pending_ == 0; }

  std::mutex              mx_;
  std::condition_variable cv_;
  std::optional<R>        value_;
  std::exception_ptr      lastError_;
  std::size_t             pending_;
};

} // namespace detail

// Runs every task and waits for all of them. Futures come back in input order.
template <typename Exec, typename F>
std::vector<std::future<ResultOf<F>>> invokeAll(Exec& exec, std::vector<F> tasks) {
  std::vector<std::future<ResultOf<F>>> futures;
  futures.reserve(tasks.size());
  for (auto& task : tasks) {
    futures.push_back(submitTo(exec, std::move(task)));
  }
  for (auto& f : futures) f.wait();
  return futures;
}

// Like invokeAll, but stops waiting at the deadline and cancels whatever has not
// started yet. Tasks already running are left to finish.
template <typename Exec, typename F, typename Rep, typename Period>
std::vector<std::future<ResultOf<F>>> invokeAll(Exec& exec, std::vector<F> tasks,
                                                std::chrono::duration<Rep, Period> timeout) {
  using R = ResultOf<F>;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::vector<std::shared_ptr<Job<R>>> jobs;
  std::vector<std::future<R>> futures;
  jobs.reserve(tasks.size());
  futures.reserve(tasks.size());
  for (auto& task : tasks) {
    auto job = makeJob(std::move(task));
    futures.push_back(job->future());
    dispatchJob(exec, job);
    jobs.push_back(std::move(job));
  }

  for (std::size_t i = 0; i < futures.size(); ++i) {
    if (futures[i].wait_until(deadline) != std::future_status::ready) {
      for (std::size_t j = i; j < jobs.size(); ++j) jobs[j]->cancel();
      break;
    }
  }
  return futures;
}

namespace detail {

template <typename Exec, typename F>
std::pair<std::shared_ptr<AnyState<ResultOf<F>>>, std::vector<std::shared_ptr<Job<void>>>>
launchAny(Exec& exec, std::vector<F>& tasks) {
  if (tasks.empty()) {
    throw std::invalid_argument("invokeAny: no tasks given");
  }
  auto state = std::make_shared<AnyState<ResultOf<F>>>(tasks.size());
  std::vector<std::shared_ptr<Job<void>>> jobs;
  jobs.reserve(tasks.size());
  for (auto& task : tasks) {
    std::shared_ptr<Job<void>> job =
      makeJob([state, fn = std::move(task)]() mutable { state->attempt(fn); });
    if (!exec.tryPost([job] { job->run(); })) {
      job->reject();
      state->fail(std::make_exception_ptr(RejectedExecutionError("invokeAny: executor is shut down")));
    }
    jobs.push_back(std::move(job));
  }
  return {std::move(state), std::move(jobs)};
}

} // namespace detail

// Returns the result of the first task to succeed and cancels the ones not yet
// started. When every task fails, the last failure is rethrown.
template <typename Exec, typename F>
ResultOf<F> invokeAny(Exec& exec, std::vector<F> tasks) {
  auto [state, jobs] = detail::launchAny(exec, tasks);
  state->wait();
  for (auto& job : jobs) job->cancel();
  return state->take();
}

template <typename Exec, typename F, typename Rep, typename Period>
ResultOf<F> invokeAny(Exec& exec, std::vector<F> tasks, std::chrono::duration<Rep, Period> timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto [state, jobs] = detail::launchAny(exec, tasks);
  const bool settled = state->waitUntil(deadline);
  for (auto& job : jobs) job->cancel();
  if (!settled) {
    throw TimeoutError("invokeAny: no task completed before the deadline");
  }
  return state->take();
}

} // namespace rctx::rt::bulk
