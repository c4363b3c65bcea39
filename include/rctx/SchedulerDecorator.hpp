#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "rctx/PoolDecorator.hpp"

namespace rctx {

/// Decorates a scheduler: everything PoolDecorator does, plus delayed and periodic
/// scheduling. A periodic task is wrapped once at schedule time, so every firing runs
/// under the same context whatever the scheduler thread had installed before.
template <typename Scheduler, typename Augment = ContextAugment>
class SchedulerDecorator {
public:
  using scheduler_type = Scheduler;
  using augment_type   = Augment;

  SchedulerDecorator(std::shared_ptr<Scheduler> scheduler, ContextRef context)
    : pool_(std::move(scheduler), std::move(context)) {}

  explicit SchedulerDecorator(std::shared_ptr<Scheduler> scheduler, InheritAmbient tag = inheritAmbient)
    : pool_(std::move(scheduler), tag) {}

  SchedulerDecorator(std::shared_ptr<Scheduler> scheduler, Augment augment)
    : pool_(std::move(scheduler), std::move(augment)) {}

  template <typename F, typename Delay>
  auto schedule(F&& task, Delay delay) {
    return scheduler().schedule(pool_.wrap(std::forward<F>(task)), delay);
  }

  template <typename F, typename Delay, typename Period>
  auto scheduleAtFixedRate(F&& task, Delay initialDelay, Period period) {
    return scheduler().scheduleAtFixedRate(pool_.wrap(std::forward<F>(task)), initialDelay, period);
  }

  template <typename F, typename Delay, typename Period>
  auto scheduleWithFixedDelay(F&& task, Delay initialDelay, Period delay) {
    return scheduler().scheduleWithFixedDelay(pool_.wrap(std::forward<F>(task)), initialDelay, delay);
  }

  // Pool-level surface, forwarded to the contained PoolDecorator.

  template <typename F>
  void post(F&& task) { pool_.post(std::forward<F>(task)); }

  template <typename F>
  bool tryPost(F&& task) { return pool_.tryPost(std::forward<F>(task)); }

  template <typename F>
  auto submit(F&& task) { return pool_.submit(std::forward<F>(task)); }

  template <typename F, typename T>
  auto submit(F&& task, T result) { return pool_.submit(std::forward<F>(task), std::move(result)); }

  template <typename F>
  auto invokeAll(std::vector<F> tasks) { return pool_.invokeAll(std::move(tasks)); }

  template <typename F, typename Timeout>
  auto invokeAll(std::vector<F> tasks, Timeout timeout) { return pool_.invokeAll(std::move(tasks), timeout); }

  template <typename F>
  auto invokeAny(std::vector<F> tasks) { return pool_.invokeAny(std::move(tasks)); }

  template <typename F, typename Timeout>
  auto invokeAny(std::vector<F> tasks, Timeout timeout) { return pool_.invokeAny(std::move(tasks), timeout); }

  void shutdown() { pool_.shutdown(); }
  decltype(auto) shutdownNow() { return pool_.shutdownNow(); }
  bool isShutdown() const { return pool_.isShutdown(); }
  bool isTerminated() const { return pool_.isTerminated(); }

  template <typename Timeout>
  bool awaitTermination(Timeout timeout) { return pool_.awaitTermination(timeout); }

  template <typename F>
  auto wrap(F&& task) const { return pool_.wrap(std::forward<F>(task)); }

  Scheduler& scheduler() const noexcept { return pool_.pool(); }
  const std::shared_ptr<Scheduler>& schedulerPtr() const noexcept { return pool_.poolPtr(); }
  const Augment& augment() const noexcept { return pool_.augment(); }

private:
  PoolDecorator<Scheduler, Augment> pool_;
};

} // namespace rctx
