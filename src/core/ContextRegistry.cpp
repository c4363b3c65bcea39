#include "rctx/ContextRegistry.hpp"

#include <utility>

namespace rctx {

thread_local ContextRef ContextRegistry::current_;

ContextRef ContextRegistry::getCurrent() noexcept {
  return current_;
}

void ContextRegistry::setCurrent(ContextRef ctx) noexcept {
  current_ = std::move(ctx);
}

void ContextRegistry::clear() noexcept {
  current_.reset();
}

} // namespace rctx
