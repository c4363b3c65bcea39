// File: include/rctx/rt/ScheduledThreadPool.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "rctx/rt/Bulk.hpp"
#include "rctx/rt/Job.hpp"
#include "rctx/rt/ScheduledFuture.hpp"

namespace rctx::rt {

namespace detail {

using Clock = std::chrono::steady_clock;

// One armed timer. All timer operations happen on the entry's own strand, so a
// cancel from a user thread never races the firing handler.
class TimedEntry : public ScheduledEntry, public std::enable_shared_from_this<TimedEntry> {
public:
  TimedEntry(std::shared_ptr<boost::asio::io_context> ioc, Clock::time_point first);
  ~TimedEntry() override = default;

  void start();

  bool cancel() override;
  bool isCancelled() const override { return cancelled_.load(std::memory_order_acquire); }
  Clock::time_point nextFireTime() const override;

  virtual bool periodic() const noexcept = 0;

  // Pulls pending one-shot work off the timer and hands it back, or returns an
  // empty task when there is nothing left to run.
  Task withdraw();

  // Only safe once no thread runs the io_context.
  void abandon();

protected:
  virtual void fire() = 0;
  virtual bool settleCancelled() = 0;   // false if the outcome is already decided
  virtual Task takePending() = 0;

  void rearm(Clock::time_point next);   // on the strand, from fire()
  void disarm();

private:
  void arm();

  std::shared_ptr<boost::asio::io_context>                    ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer                                   timer_;
  std::atomic<Clock::rep>                                     next_;
  std::atomic<bool>                                           cancelled_{false};
  std::atomic<bool>                                           withdrawn_{false};
};

template <typename R>
class DelayedEntry final : public TimedEntry {
public:
  DelayedEntry(std::shared_ptr<boost::asio::io_context> ioc, Clock::time_point when,
               std::shared_ptr<Job<R>> job)
    : TimedEntry(std::move(ioc), when), job_(std::move(job)) {}

  bool periodic() const noexcept override { return false; }

protected:
  void fire() override { job_->run(); }
  bool settleCancelled() override { return job_->cancel(); }

  // The job is claimed here, so a timer firing afterwards finds nothing to run and
  // the returned task is the only way left to complete it.
  Task takePending() override {
    if (!job_->withdraw()) return {};
    auto job = job_;
    return [job] { job->runWithdrawn(); };
  }

private:
  std::shared_ptr<Job<R>> job_;
};

class PeriodicEntry final : public TimedEntry {
public:
  enum class Mode { FixedRate, FixedDelay };

  PeriodicEntry(std::shared_ptr<boost::asio::io_context> ioc, Clock::time_point first,
                Task fn, Clock::duration period, Mode mode);

  bool periodic() const noexcept override { return true; }

  std::future<void> future() { return promise_.get_future(); }
  std::size_t runs() const noexcept { return runs_.load(std::memory_order_acquire); }

protected:
  void fire() override;
  bool settleCancelled() override;
  Task takePending() override { return {}; }

private:
  Task                     fn_;
  Clock::duration          period_;
  Mode                     mode_;
  Clock::time_point        scheduled_;
  std::promise<void>       promise_;
  std::atomic<bool>        settled_{false};
  std::atomic<std::size_t> runs_{0};
};

} // namespace detail

/// Delayed and periodic execution on a Boost.Asio io_context run by a fixed set of
/// threads. Also accepts immediate work like ThreadPool.
class ScheduledThreadPool {
public:
  using Clock = detail::Clock;

  explicit ScheduledThreadPool(unsigned nThreads = 1);
  ~ScheduledThreadPool();

  ScheduledThreadPool(const ScheduledThreadPool&)            = delete;
  ScheduledThreadPool& operator=(const ScheduledThreadPool&) = delete;

  void post(Task fn);
  bool tryPost(Task fn);

  template <typename F>
  std::future<ResultOf<F>> submit(F&& fn) {
    return submitTo(*this, std::forward<F>(fn));
  }

  template <typename F, typename T>
  std::future<T> submit(F&& fn, T result) {
    return submitTo(*this, std::forward<F>(fn), std::move(result));
  }

  template <typename F>
  std::vector<std::future<ResultOf<F>>> invokeAll(std::vector<F> tasks) {
    return bulk::invokeAll(*this, std::move(tasks));
  }

  template <typename F, typename Rep, typename Period>
  std::vector<std::future<ResultOf<F>>> invokeAll(std::vector<F> tasks,
                                                  std::chrono::duration<Rep, Period> timeout) {
    return bulk::invokeAll(*this, std::move(tasks), timeout);
  }

  template <typename F>
  ResultOf<F> invokeAny(std::vector<F> tasks) {
    return bulk::invokeAny(*this, std::move(tasks));
  }

  template <typename F, typename Rep, typename Period>
  ResultOf<F> invokeAny(std::vector<F> tasks, std::chrono::duration<Rep, Period> timeout) {
    return bulk::invokeAny(*this, std::move(tasks), timeout);
  }

  // Runs fn once after the delay.
  template <typename F>
  ScheduledFuture<ResultOf<F>> schedule(F&& fn, Clock::duration delay) {
    using R = ResultOf<F>;
    auto job = makeJob(std::forward<F>(fn));
    auto fut = job->future();
    auto entry = std::make_shared<detail::DelayedEntry<R>>(ioc_, Clock::now() + delay, job);
    if (!admit(entry)) {
      job->reject();
      return ScheduledFuture<R>(std::move(fut), nullptr);
    }
    return ScheduledFuture<R>(std::move(fut), std::move(entry));
  }

  // Firings at initialDelay, initialDelay + period, initialDelay + 2 * period, ...
  // A late run is followed immediately by the next one; runs never overlap.
  ScheduledFuture<void> scheduleAtFixedRate(Task fn, Clock::duration initialDelay,
                                            Clock::duration period);

  // First firing after initialDelay, then `delay` after each run finishes.
  ScheduledFuture<void> scheduleWithFixedDelay(Task fn, Clock::duration initialDelay,
                                               Clock::duration delay);

  // Stops intake and cancels periodic schedules; pending one-shot work still runs.
  void shutdown();

  // Also withdraws pending one-shot work (returned as tasks) and drops queued posts.
  std::vector<Task> shutdownNow();

  bool isShutdown() const;
  bool isTerminated() const;
  bool awaitTermination(std::chrono::milliseconds timeout);

  std::size_t size() const noexcept { return threads_.size(); }

private:
  bool admit(const std::shared_ptr<detail::TimedEntry>& entry);
  ScheduledFuture<void> schedulePeriodic(Task fn, Clock::duration initialDelay,
                                         Clock::duration period,
                                         detail::PeriodicEntry::Mode mode);
  std::vector<std::shared_ptr<detail::TimedEntry>> liveEntries();
  void workerLoop();

private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  std::shared_ptr<boost::asio::io_context>       ioc_;
  std::optional<WorkGuard>                       work_;
  std::vector<std::thread>                       threads_;
  mutable std::mutex                             mx_;
  std::condition_variable                        doneCv_;
  std::vector<std::weak_ptr<detail::TimedEntry>> entries_;
  std::atomic<bool>                              discard_{false};
  bool                                           stopping_ = false;
  unsigned                                       live_     = 0;
};

} // namespace rctx::rt
