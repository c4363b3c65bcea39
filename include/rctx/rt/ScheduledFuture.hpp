// File: include/rctx/rt/ScheduledFuture.hpp
#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <utility>

namespace rctx::rt {

namespace detail {

// The part of a scheduled entry a handle is allowed to steer.
class ScheduledEntry {
public:
  virtual ~ScheduledEntry() = default;

  virtual bool cancel() = 0;
  virtual bool isCancelled() const = 0;
  virtual std::chrono::steady_clock::time_point nextFireTime() const = 0;
};

} // namespace detail

/// Result handle for delayed and periodic work. A periodic handle only becomes ready
/// when the schedule ends: cancelled (CancelledError) or stopped by a throwing run.
template <typename R>
class ScheduledFuture {
public:
  ScheduledFuture() = default;
  ScheduledFuture(std::future<R> future, std::shared_ptr<detail::ScheduledEntry> entry)
    : future_(std::move(future)), entry_(std::move(entry)) {}

  R get() { return future_.get(); }
  void wait() const { future_.wait(); }

  template <typename Rep, typename Period>
  std::future_status waitFor(std::chrono::duration<Rep, Period> timeout) const {
    return future_.wait_for(timeout);
  }

  // False if the work already ran, already failed or was already cancelled.
  bool cancel() { return entry_ && entry_->cancel(); }
  bool isCancelled() const { return entry_ && entry_->isCancelled(); }

  // Valid until get() is called.
  bool isDone() const {
    return future_.valid() && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }

  // Time left until the next firing; zero or negative once it is due.
  std::chrono::steady_clock::duration delay() const {
    if (!entry_) return std::chrono::steady_clock::duration::zero();
    return entry_->nextFireTime() - std::chrono::steady_clock::now();
  }

  bool valid() const noexcept { return future_.valid(); }

private:
  std::future<R>                          future_;
  std::shared_ptr<detail::ScheduledEntry> entry_;
};

} // namespace rctx::rt
