#include "rctx/rt/Job.hpp"

#include <exception>

#include "rctx/util/Logger.hpp"
#include "rctx/util/Metrics.hpp"

namespace rctx::rt {

void runLogged(Task& fn, const char* event) noexcept {
  try {
    fn();
  } catch (const std::exception& e) {
    RCTX_METRIC_HIT(event);
    util::logger().log(util::LogLevel::Error, event, {{"what", e.what()}});
  } catch (...) {
    RCTX_METRIC_HIT(event);
    util::logger().log(util::LogLevel::Error, event, {{"what", "non-standard exception"}});
  }
}

} // namespace rctx::rt
