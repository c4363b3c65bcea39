#include "rctx/rt/ScheduledThreadPool.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "rctx/util/Logger.hpp"
#include "rctx/util/Metrics.hpp"

namespace rctx::rt {

namespace detail {

// ---------------------- TimedEntry ----------------------

TimedEntry::TimedEntry(std::shared_ptr<boost::asio::io_context> ioc, Clock::time_point first)
  : ioc_(std::move(ioc)),
    strand_(boost::asio::make_strand(*ioc_)),
    timer_(strand_),
    next_(first.time_since_epoch().count())
{}

void TimedEntry::start() {
  boost::asio::post(strand_, [self = shared_from_this()] { self->arm(); });
}

Clock::time_point TimedEntry::nextFireTime() const {
  return Clock::time_point(Clock::duration(next_.load(std::memory_order_acquire)));
}

bool TimedEntry::cancel() {
  if (!settleCancelled()) return false;
  cancelled_.store(true, std::memory_order_release);
  disarm();
  return true;
}

Task TimedEntry::withdraw() {
  if (periodic()) return {};
  Task pending = takePending();
  if (!pending) return {};
  withdrawn_.store(true, std::memory_order_release);
  disarm();
  return pending;
}

void TimedEntry::abandon() {
  withdrawn_.store(true, std::memory_order_release);
  timer_.cancel();
}

void TimedEntry::rearm(Clock::time_point next) {
  next_.store(next.time_since_epoch().count(), std::memory_order_release);
  arm();
}

void TimedEntry::disarm() {
  if (ioc_->stopped()) return;
  boost::asio::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
}

void TimedEntry::arm() {
  if (isCancelled() || withdrawn_.load(std::memory_order_acquire)) return;
  timer_.expires_at(nextFireTime());
  timer_.async_wait(boost::asio::bind_executor(strand_,
    [self = shared_from_this()](const boost::system::error_code& ec) {
      if (ec == boost::asio::error::operation_aborted) return;
      if (self->isCancelled() || self->withdrawn_.load(std::memory_order_acquire)) return;
      RCTX_METRIC_HIT("scheduler.fired");
      self->fire();
    }));
}

// ---------------------- PeriodicEntry ----------------------

PeriodicEntry::PeriodicEntry(std::shared_ptr<boost::asio::io_context> ioc, Clock::time_point first,
                             Task fn, Clock::duration period, Mode mode)
  : TimedEntry(std::move(ioc), first),
    fn_(std::move(fn)),
    period_(period),
    mode_(mode),
    scheduled_(first)
{}

void PeriodicEntry::fire() {
  try {
    fn_();
  } catch (const std::exception& e) {
    if (!settled_.exchange(true, std::memory_order_acq_rel)) {
      RCTX_METRIC_HIT("scheduler.periodic_failed");
      util::logger().log(util::LogLevel::Warn, "scheduler.periodic_failed", {{"what", e.what()}});
      promise_.set_exception(std::current_exception());
    }
    return;
  } catch (...) {
    if (!settled_.exchange(true, std::memory_order_acq_rel)) {
      RCTX_METRIC_HIT("scheduler.periodic_failed");
      util::logger().log(util::LogLevel::Warn, "scheduler.periodic_failed",
                         {{"what", "non-standard exception"}});
      promise_.set_exception(std::current_exception());
    }
    return;
  }
  runs_.fetch_add(1, std::memory_order_acq_rel);

  if (settled_.load(std::memory_order_acquire)) return;
  scheduled_ = (mode_ == Mode::FixedRate) ? scheduled_ + period_ : Clock::now() + period_;
  rearm(scheduled_);
}

bool PeriodicEntry::settleCancelled() {
  if (settled_.exchange(true, std::memory_order_acq_rel)) return false;
  promise_.set_exception(std::make_exception_ptr(CancelledError("periodic task cancelled")));
  return true;
}

} // namespace detail

// ---------------------- ScheduledThreadPool ----------------------

ScheduledThreadPool::ScheduledThreadPool(unsigned nThreads)
  : ioc_(std::make_shared<boost::asio::io_context>()),
    work_(boost::asio::make_work_guard(*ioc_))
{
  if (nThreads == 0) nThreads = 1;
  live_ = nThreads;
  threads_.reserve(nThreads);
  for (unsigned i = 0; i < nThreads; ++i) {
    threads_.emplace_back([this] { workerLoop(); });
  }
}

ScheduledThreadPool::~ScheduledThreadPool() {
  shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }

  // Nobody runs the io_context now. Cancel what is still armed and let the handlers
  // run as no-ops so they release their entries.
  discard_.store(true, std::memory_order_release);
  for (auto& e : liveEntries()) e->abandon();
  ioc_->restart();
  ioc_->poll();
  ioc_->stop();
}

void ScheduledThreadPool::post(Task fn) {
  if (!tryPost(std::move(fn))) {
    RCTX_METRIC_HIT("pool.rejected");
    util::logger().log(util::LogLevel::Warn, "pool.rejected", {{"reason", "shutdown"}});
  }
}

bool ScheduledThreadPool::tryPost(Task fn) {
  std::lock_guard<std::mutex> lk(mx_);
  if (stopping_) return false;
  boost::asio::post(*ioc_, [this, fn = std::move(fn)]() mutable {
    if (discard_.load(std::memory_order_acquire)) return;
    runLogged(fn, "pool.task_failed");
  });
  return true;
}

ScheduledFuture<void> ScheduledThreadPool::scheduleAtFixedRate(Task fn, Clock::duration initialDelay,
                                                               Clock::duration period) {
  return schedulePeriodic(std::move(fn), initialDelay, period, detail::PeriodicEntry::Mode::FixedRate);
}

ScheduledFuture<void> ScheduledThreadPool::scheduleWithFixedDelay(Task fn, Clock::duration initialDelay,
                                                                  Clock::duration delay) {
  return schedulePeriodic(std::move(fn), initialDelay, delay, detail::PeriodicEntry::Mode::FixedDelay);
}

ScheduledFuture<void> ScheduledThreadPool::schedulePeriodic(Task fn, Clock::duration initialDelay,
                                                            Clock::duration period,
                                                            detail::PeriodicEntry::Mode mode) {
  if (!fn) throw std::invalid_argument("ScheduledThreadPool: periodic task cannot be empty");
  if (period <= Clock::duration::zero()) {
    throw std::invalid_argument("ScheduledThreadPool: period must be positive");
  }

  auto entry = std::make_shared<detail::PeriodicEntry>(ioc_, Clock::now() + initialDelay,
                                                       std::move(fn), period, mode);
  auto fut = entry->future();
  if (!admit(entry)) {
    std::promise<void> rejected;
    rejected.set_exception(std::make_exception_ptr(
      RejectedExecutionError("executor is shut down")));
    return ScheduledFuture<void>(rejected.get_future(), nullptr);
  }
  return ScheduledFuture<void>(std::move(fut), std::move(entry));
}

bool ScheduledThreadPool::admit(const std::shared_ptr<detail::TimedEntry>& entry) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (!stopping_) {
      entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                    [](const std::weak_ptr<detail::TimedEntry>& w) { return w.expired(); }),
                     entries_.end());
      entries_.push_back(entry);
      entry->start();
      return true;
    }
  }
  RCTX_METRIC_HIT("pool.rejected");
  util::logger().log(util::LogLevel::Warn, "pool.rejected", {{"reason", "shutdown"}});
  return false;
}

std::vector<std::shared_ptr<detail::TimedEntry>> ScheduledThreadPool::liveEntries() {
  std::vector<std::shared_ptr<detail::TimedEntry>> out;
  std::lock_guard<std::mutex> lk(mx_);
  out.reserve(entries_.size());
  for (auto& w : entries_) {
    if (auto e = w.lock()) out.push_back(std::move(e));
  }
  return out;
}

void ScheduledThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
    work_.reset();
  }
  for (auto& e : liveEntries()) {
    if (e->periodic()) e->cancel();
  }
}

std::vector<Task> ScheduledThreadPool::shutdownNow() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
    work_.reset();
  }
  std::vector<Task> pending;
  for (auto& e : liveEntries()) {
    if (e->periodic()) {
      e->cancel();
    } else if (auto task = e->withdraw()) {
      pending.push_back(std::move(task));
    }
  }
  discard_.store(true, std::memory_order_release);
  ioc_->stop();
  return pending;
}

bool ScheduledThreadPool::isShutdown() const {
  std::lock_guard<std::mutex> lk(mx_);
  return stopping_;
}

bool ScheduledThreadPool::isTerminated() const {
  std::lock_guard<std::mutex> lk(mx_);
  return stopping_ && live_ == 0;
}

bool ScheduledThreadPool::awaitTermination(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mx_);
  return doneCv_.wait_for(lk, timeout, [this] { return stopping_ && live_ == 0; });
}

void ScheduledThreadPool::workerLoop() {
  for (;;) {
    try {
      ioc_->run();
      break;
    } catch (const std::exception& e) {
      util::logger().log(util::LogLevel::Error, "scheduler.handler_failed", {{"what", e.what()}});
    }
  }
  std::lock_guard<std::mutex> lk(mx_);
  if (--live_ == 0) doneCv_.notify_all();
}

} // namespace rctx::rt
