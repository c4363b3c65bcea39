#include "rctx/runtime/ShutdownCoordinator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "rctx/util/Logger.hpp"
#include "rctx/util/Metrics.hpp"

namespace rctx::rt {

void ShutdownCoordinator::registerStep(std::string name, int order, std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mx_);
  steps_.push_back({std::move(name), order, std::move(fn)});
}

std::size_t ShutdownCoordinator::steps() const {
  std::lock_guard<std::mutex> lk(mx_);
  return steps_.size();
}

std::size_t ShutdownCoordinator::stop() {
  bool expected = false;
  if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return 0; // already stopping
  }

  std::vector<Step> run;
  {
    std::lock_guard<std::mutex> lk(mx_);
    run = steps_;
  }
  std::stable_sort(run.begin(), run.end(), [](const Step& a, const Step& b) {
    return a.order < b.order;
  });

  std::size_t failed = 0;
  for (auto& s : run) {
    std::string what;
    try {
      util::logger().log(util::LogLevel::Debug, "shutdown.step", {{"step", s.name}});
      s.fn();
      continue;
    } catch (const std::exception& e) {
      what = e.what();
    } catch (...) {
      what = "non-standard exception";
    }
    ++failed;
    RCTX_METRIC_HIT("shutdown.step_failed");
    util::logger().log(util::LogLevel::Error, "shutdown.step_failed", {{"step", s.name}, {"what", what}});
  }
  return failed;
}

} // namespace rctx::rt
