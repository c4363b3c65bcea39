#pragma once

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "rctx/DispatchDecorator.hpp"

namespace rctx {

/// Decorates a pool-level service: result-bearing submission, bulk submission and
/// lifecycle control. Submissions are augmented and forwarded; whatever handle the
/// pool returns comes back untouched. Lifecycle calls carry no task and pass straight
/// through.
template <typename Pool, typename Augment = ContextAugment>
class PoolDecorator {
public:
  using pool_type    = Pool;
  using augment_type = Augment;

  PoolDecorator(std::shared_ptr<Pool> pool, ContextRef context)
    : dispatch_(std::move(pool), std::move(context)) {}

  explicit PoolDecorator(std::shared_ptr<Pool> pool, InheritAmbient tag = inheritAmbient)
    : dispatch_(std::move(pool), tag) {}

  PoolDecorator(std::shared_ptr<Pool> pool, Augment augment)
    : dispatch_(std::move(pool), std::move(augment)) {}

  // --- single task ---

  template <typename F>
  void post(F&& task) { dispatch_.post(std::forward<F>(task)); }

  template <typename F>
  bool tryPost(F&& task) { return dispatch_.tryPost(std::forward<F>(task)); }

  template <typename F>
  auto submit(F&& task) {
    return pool().submit(dispatch_.wrap(std::forward<F>(task)));
  }

  template <typename F, typename T>
  auto submit(F&& task, T result) {
    return pool().submit(dispatch_.wrap(std::forward<F>(task)), std::move(result));
  }

  // --- bulk ---
  // Each element is augmented on its own; order and size are kept. An empty vector
  // goes to the pool as it came.

  template <typename F>
  auto wrapAll(std::vector<F> tasks) const {
    using Wrapped = std::invoke_result_t<const Augment&, F&&>;
    std::vector<Wrapped> wrapped;
    wrapped.reserve(tasks.size());
    for (auto& task : tasks) {
      wrapped.push_back(dispatch_.wrap(std::move(task)));
    }
    return wrapped;
  }

  template <typename F>
  auto invokeAll(std::vector<F> tasks) {
    if (tasks.empty()) return pool().invokeAll(std::move(tasks));
    return pool().invokeAll(wrapAll(std::move(tasks)));
  }

  template <typename F, typename Timeout>
  auto invokeAll(std::vector<F> tasks, Timeout timeout) {
    if (tasks.empty()) return pool().invokeAll(std::move(tasks), timeout);
    return pool().invokeAll(wrapAll(std::move(tasks)), timeout);
  }

  template <typename F>
  auto invokeAny(std::vector<F> tasks) {
    if (tasks.empty()) return pool().invokeAny(std::move(tasks));
    return pool().invokeAny(wrapAll(std::move(tasks)));
  }

  template <typename F, typename Timeout>
  auto invokeAny(std::vector<F> tasks, Timeout timeout) {
    if (tasks.empty()) return pool().invokeAny(std::move(tasks), timeout);
    return pool().invokeAny(wrapAll(std::move(tasks)), timeout);
  }

  // --- lifecycle ---

  void shutdown() { pool().shutdown(); }
  decltype(auto) shutdownNow() { return pool().shutdownNow(); }
  bool isShutdown() const { return pool().isShutdown(); }
  bool isTerminated() const { return pool().isTerminated(); }

  template <typename Timeout>
  bool awaitTermination(Timeout timeout) { return pool().awaitTermination(timeout); }

  // --- access ---

  template <typename F>
  auto wrap(F&& task) const { return dispatch_.wrap(std::forward<F>(task)); }

  Pool& pool() const noexcept { return dispatch_.target(); }
  const std::shared_ptr<Pool>& poolPtr() const noexcept { return dispatch_.targetPtr(); }
  const Augment& augment() const noexcept { return dispatch_.augment(); }

private:
  DispatchDecorator<Pool, Augment> dispatch_;
};

} // namespace rctx
