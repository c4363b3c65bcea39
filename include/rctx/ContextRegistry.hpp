#pragma once

#include "rctx/RetryContext.hpp"

namespace rctx {

// Per-thread slot holding "the current retry context on this thread".
// Every call reads or writes the calling thread's slot only, so nothing here locks.
class ContextRegistry {
public:
  static ContextRef getCurrent() noexcept;
  static void setCurrent(ContextRef ctx) noexcept;
  static void clear() noexcept;

private:
  static thread_local ContextRef current_;
};

// Tag requesting that a context be resolved from the calling thread's slot at wrap time.
struct InheritAmbient {
  explicit constexpr InheritAmbient() = default;
};

inline constexpr InheritAmbient inheritAmbient{};

inline ContextRef resolveContext(ContextRef ctx) noexcept { return ctx; }
inline ContextRef resolveContext(InheritAmbient) noexcept { return ContextRegistry::getCurrent(); }

// Installs a context on the current thread for the lifetime of the scope and puts the
// previous value back on destruction, whichever way the scope is left.
class ContextScope {
public:
  explicit ContextScope(ContextRef ctx) noexcept
    : prior_(ContextRegistry::getCurrent()) {
    ContextRegistry::setCurrent(std::move(ctx));
  }

  ~ContextScope() { ContextRegistry::setCurrent(std::move(prior_)); }

  ContextScope(const ContextScope&)            = delete;
  ContextScope& operator=(const ContextScope&) = delete;
  ContextScope(ContextScope&&)                 = delete;
  ContextScope& operator=(ContextScope&&)      = delete;

  const ContextRef& prior() const noexcept { return prior_; }

private:
  ContextRef prior_;
};

} // namespace rctx
