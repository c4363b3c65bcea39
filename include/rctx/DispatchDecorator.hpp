#pragma once

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "rctx/ContextTask.hpp"

namespace rctx {

/// Decorates a single-task submission surface (anything with `post(task)`).
/// Every task is passed through the Augment before it is forwarded; with the default
/// ContextAugment that means it runs under the context fixed at construction, with
/// AmbientAugment under whatever the submitting thread has installed.
template <typename Target, typename Augment = ContextAugment>
class DispatchDecorator {
public:
  using target_type  = Target;
  using augment_type = Augment;

  DispatchDecorator(std::shared_ptr<Target> target, ContextRef context)
    : DispatchDecorator(std::move(target), Augment(std::move(context))) {}

  // Captures the constructing thread's current context.
  explicit DispatchDecorator(std::shared_ptr<Target> target, InheritAmbient tag = inheritAmbient)
    : DispatchDecorator(std::move(target), Augment(tag)) {}

  DispatchDecorator(std::shared_ptr<Target> target, Augment augment)
    : target_(std::move(target)), augment_(std::move(augment)) {
    if (!target_) {
      throw std::invalid_argument("DispatchDecorator: target cannot be null");
    }
  }

  template <typename F>
  void post(F&& task) {
    target_->post(augment_(std::forward<F>(task)));
  }

  template <typename F>
  bool tryPost(F&& task) {
    return target_->tryPost(augment_(std::forward<F>(task)));
  }

  template <typename F>
  auto wrap(F&& task) const {
    return augment_(std::forward<F>(task));
  }

  Target& target() const noexcept { return *target_; }
  const std::shared_ptr<Target>& targetPtr() const noexcept { return target_; }
  const Augment& augment() const noexcept { return augment_; }

private:
  std::shared_ptr<Target> target_;
  Augment                 augment_;
};

} // namespace rctx
