#include "rctx/rt/ThreadPool.hpp"

#include "rctx/util/Logger.hpp"
#include "rctx/util/Metrics.hpp"

namespace rctx::rt {

ThreadPool::ThreadPool(unsigned nThreads) {
  if (nThreads == 0) nThreads = 1;
  live_ = nThreads;
  threads_.reserve(nThreads);
  for (unsigned i = 0; i < nThreads; ++i) {
    threads_.emplace_back([this] { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void ThreadPool::post(Task fn) {
  if (!tryPost(std::move(fn))) {
    RCTX_METRIC_HIT("pool.rejected");
    util::logger().log(util::LogLevel::Warn, "pool.rejected", {{"reason", "shutdown"}});
  }
}

bool ThreadPool::tryPost(Task fn) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_) return false;
    q_.push_back(std::move(fn));
  }
  cv_.notify_one();
  return true;
}

void ThreadPool::drain() {
  std::unique_lock<std::mutex> lk(mx_);
  idleCv_.wait(lk, [this] { return q_.empty() && busy_ == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
  }
  cv_.notify_all();
}

std::vector<Task> ThreadPool::shutdownNow() {
  std::vector<Task> pending;
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
    pending.reserve(q_.size());
    for (auto& fn : q_) pending.push_back(std::move(fn));
    q_.clear();
  }
  cv_.notify_all();
  idleCv_.notify_all();
  return pending;
}

bool ThreadPool::isShutdown() const {
  std::lock_guard<std::mutex> lk(mx_);
  return stopping_;
}

bool ThreadPool::isTerminated() const {
  std::lock_guard<std::mutex> lk(mx_);
  return stopping_ && live_ == 0;
}

bool ThreadPool::awaitTermination(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mx_);
  return doneCv_.wait_for(lk, timeout, [this] { return stopping_ && live_ == 0; });
}

void ThreadPool::workerLoop() {
  for (;;) {
    Task fn;
    {
      std::unique_lock<std::mutex> lk(mx_);
      cv_.wait(lk, [this] { return stopping_ || !q_.empty(); });
      if (q_.empty()) {
        if (--live_ == 0) doneCv_.notify_all();
        idleCv_.notify_all();
        return;
      }
      fn = std::move(q_.front());
      q_.pop_front();
      ++busy_;
    }

    runLogged(fn, "pool.task_failed");
    fn = nullptr;

    {
      std::lock_guard<std::mutex> lk(mx_);
      --busy_;
      if (q_.empty() && busy_ == 0) idleCv_.notify_all();
    }
  }
}

} // namespace rctx::rt
