#pragma once

#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "rctx/ContextRegistry.hpp"
#include "rctx/Describe.hpp"

namespace rctx {

namespace detail {

template <typename F>
bool isEmptyTask(const F& f) noexcept {
  if constexpr (std::is_pointer_v<F> || std::is_member_pointer_v<F> || IsStdFunction<F>::value) {
    return !f;
  } else {
    return false;
  }
}

} // namespace detail

/// Runs a delegate with a fixed retry context installed on the executing thread.
///
/// The context is bound when the task is constructed (wrap time). Each invocation
/// remembers the executing thread's current context, installs the bound one, runs the
/// delegate and puts the remembered value back, on normal return and on exceptions
/// alike. The delegate's result or exception passes through untouched.
///
/// The remembered value lives in a ContextScope on the executing thread's stack, so it
/// only exists while one invocation is in flight. Reentrant calls on the same thread
/// and concurrent calls on different threads each keep their own.
template <typename F>
class ContextTask {
public:
  using delegate_type = F;

  ContextTask(F delegate, ContextRef context)
    : delegate_(std::move(delegate)), context_(std::move(context)) {
    if (detail::isEmptyTask(delegate_)) {
      throw std::invalid_argument("ContextTask: delegate cannot be empty");
    }
  }

  // Binds whatever is current on the constructing thread; later changes are not seen.
  ContextTask(F delegate, InheritAmbient)
    : ContextTask(std::move(delegate), ContextRegistry::getCurrent()) {}

  decltype(auto) operator()() {
    ContextScope scope(context_);
    return std::invoke(delegate_);
  }

  const ContextRef& context() const noexcept { return context_; }
  const F& delegate() const noexcept { return delegate_; }

  std::string describe() const { return rctx::describe(delegate_); }

private:
  F          delegate_;
  ContextRef context_;
};

template <typename F>
std::ostream& operator<<(std::ostream& os, const ContextTask<F>& task) {
  return os << task.describe();
}

template <typename F>
ContextTask<std::decay_t<F>> wrapTask(F&& delegate, ContextRef context) {
  return ContextTask<std::decay_t<F>>(std::forward<F>(delegate), std::move(context));
}

template <typename F>
ContextTask<std::decay_t<F>> wrapTask(F&& delegate, InheritAmbient tag = inheritAmbient) {
  return ContextTask<std::decay_t<F>>(std::forward<F>(delegate), tag);
}

/// The "augment this task" step every decorator applies before forwarding work.
/// The context is fixed when the augment is built; inheritAmbient reads the
/// constructing thread's slot once.
class ContextAugment {
public:
  explicit ContextAugment(ContextRef context) noexcept : context_(std::move(context)) {}
  explicit ContextAugment(InheritAmbient) noexcept : context_(ContextRegistry::getCurrent()) {}

  template <typename F>
  ContextTask<std::decay_t<F>> operator()(F&& task) const {
    return ContextTask<std::decay_t<F>>(std::forward<F>(task), context_);
  }

  const ContextRef& context() const noexcept { return context_; }

private:
  ContextRef context_;
};

/// Augment that reads the submitting thread's slot on every wrap, so one long-lived
/// decorator hands each submitter's own context to the work it submits.
/// Pass it as the decorator's Augment: `PoolDecorator<Pool, AmbientAugment>`.
class AmbientAugment {
public:
  AmbientAugment() noexcept = default;
  explicit AmbientAugment(InheritAmbient) noexcept {}

  template <typename F>
  ContextTask<std::decay_t<F>> operator()(F&& task) const {
    return ContextTask<std::decay_t<F>>(std::forward<F>(task), ContextRegistry::getCurrent());
  }
};

} // namespace rctx
