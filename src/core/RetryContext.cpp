#include "rctx/RetryContext.hpp"

#include <sstream>

namespace rctx {

RetryContext::RetryContext(std::string label, std::shared_ptr<const RetryContext> parent)
  : label_(std::move(label)), parent_(std::move(parent)) {}

std::string RetryContext::describe() const {
  std::ostringstream oss;
  oss << "RetryContext[";
  if (!label_.empty()) oss << label_ << ", ";
  oss << "count=" << retryCount();
  if (parent_) oss << ", parent=" << parent_->describe();
  oss << "]";
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const RetryContext& ctx) {
  return os << ctx.describe();
}

} // namespace rctx
