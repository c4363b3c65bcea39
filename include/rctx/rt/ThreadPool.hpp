// File: include/rctx/rt/ThreadPool.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "rctx/rt/Bulk.hpp"
#include "rctx/rt/Job.hpp"

namespace rctx::rt {

class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue fire-and-forget work. Dropped (and logged) once the pool is shut down.
  void post(Task fn);

  // Same as post, but reports refusal instead of logging it.
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

  // Waits until the queue is empty and no worker is running a task. Tasks that
  // enqueue more tasks keep it waiting.
  void drain();

  // Stops intake; queued work still runs. Does not block.
  void shutdown();

  // Stops intake and hands back the queued tasks that never started.
  std::vector<Task> shutdownNow();

  bool isShutdown() const;
  bool isTerminated() const;

  // True if every worker exited within the timeout.
  bool awaitTermination(std::chrono::milliseconds timeout);

  std::size_t size() const noexcept { return threads_.size(); }

private:
  void workerLoop();

private:
  std::vector<std::thread> threads_;
  mutable std::mutex       mx_;
  std::condition_variable  cv_;      // work available / stopping
  std::condition_variable  idleCv_;  // queue empty and nobody busy
  std::condition_variable  doneCv_;  // all workers exited
  std::deque<Task>         q_;
  bool                     stopping_ = false;
  unsigned                 busy_     = 0;
  unsigned                 live_     = 0;
};

} // namespace rctx::rt
