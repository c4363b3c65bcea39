// File: include/rctx/rt/Job.hpp
#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include "rctx/Errors.hpp"

namespace rctx::rt {

using Task = std::function<void()>;

// Runs fire-and-forget work; a throwing task is logged under `event` and counted.
void runLogged(Task& fn, const char* event) noexcept;

template <typename F>
using ResultOf = std::invoke_result_t<std::decay_t<F>&>;

// Promise-backed unit of work. Exactly one of run(), withdraw(), cancel() or reject() wins;
// the others become no-ops.
template <typename R>
class Job {
public:
  virtual ~Job() = default;

  Job(const Job&)            = delete;
  Job& operator=(const Job&) = delete;

  // May be called once.
  std::future<R> future() { return promise_.get_future(); }

  void run() {
    if (claim()) execute();
  }

  // Claims the job without running it. The winner completes it later through
  // runWithdrawn(); false if run, cancel or reject got there first.
  bool withdraw() noexcept {
    if (!claim()) return false;
    withdrawn_.store(true, std::memory_order_release);
    return true;
  }

  // Runs a withdrawn job once; later calls do nothing.
  void runWithdrawn() {
    if (withdrawn_.exchange(false, std::memory_order_acq_rel)) execute();
  }

  bool cancel() { return failUnstarted(CancelledError("task cancelled before it started")); }
  bool reject() { return failUnstarted(RejectedExecutionError("executor is shut down")); }

  bool claimed() const noexcept { return claimed_.load(std::memory_order_acquire); }

protected:
  Job() = default;

  // Runs the body and settles the promise; the caller holds the claim.
  virtual void execute() = 0;

  bool claim() noexcept { return !claimed_.exchange(true, std::memory_order_acq_rel); }

  std::promise<R> promise_;

private:
  template <typename E>
  bool failUnstarted(E err) {
    if (!claim()) return false;
    promise_.set_exception(std::make_exception_ptr(std::move(err)));
    return true;
  }

  std::atomic<bool> claimed_{false};
  std::atomic<bool> withdrawn_{false};
};

template <typename R, typename Fn>
class CallableJob final : public Job<R> {
public:
  explicit CallableJob(Fn fn) : fn_(std::move(fn)) {}

protected:
  void execute() override {
    try {
      if constexpr (std::is_void_v<R>) {
        std::invoke(fn_);
        this->promise_.set_value();
      } else {
        this->promise_.set_value(std::invoke(fn_));
      }
    } catch (...) {
      // Surfaced to whoever holds the future.
      this->promise_.set_exception(std::current_exception());
    }
  }

private:
  Fn fn_;
};

template <typename F>
std::shared_ptr<Job<ResultOf<F>>> makeJob(F&& fn) {
  return std::make_shared<CallableJob<ResultOf<F>, std::decay_t<F>>>(std::forward<F>(fn));
}

// Hands a job to anything with `bool tryPost(Task)`; a refused job is rejected.
template <typename Exec, typename R>
void dispatchJob(Exec& exec, const std::shared_ptr<Job<R>>& job) {
  if (!exec.tryPost([job] { job->run(); })) {
    job->reject();
  }
}

template <typename Exec, typename F>
std::future<ResultOf<F>> submitTo(Exec& exec, F&& fn) {
  auto job = makeJob(std::forward<F>(fn));
  auto fut = job->future();
  dispatchJob(exec, job);
  return fut;
}

template <typename Exec, typename F, typename T>
std::future<T> submitTo(Exec& exec, F&& fn, T result) {
  return submitTo(exec, [fn = std::forward<F>(fn), result = std::move(result)]() mutable -> T {
    std::invoke(fn);
    return result;
  });
}

} // namespace rctx::rt
