#pragma once

#include <atomic>
#include <memory>
#include <ostream>
#include <string>

namespace rctx {

/// State of one retry attempt. The propagation layer only stores and hands out
/// references to it; the retry machinery that creates contexts owns the contents.
class RetryContext {
public:
  explicit RetryContext(std::string label = {},
                        std::shared_ptr<const RetryContext> parent = nullptr);

  RetryContext(const RetryContext&)            = delete;
  RetryContext& operator=(const RetryContext&) = delete;

  const std::string& label() const noexcept { return label_; }
  const RetryContext* parent() const noexcept { return parent_.get(); }

  int retryCount() const noexcept { return retryCount_.load(std::memory_order_acquire); }
  void registerAttempt() noexcept { retryCount_.fetch_add(1, std::memory_order_acq_rel); }

  std::string describe() const;

private:
  std::string                         label_;
  std::shared_ptr<const RetryContext> parent_;
  std::atomic<int>                    retryCount_{0};
};

using ContextRef = std::shared_ptr<RetryContext>;

std::ostream& operator<<(std::ostream& os, const RetryContext& ctx);

} // namespace rctx
