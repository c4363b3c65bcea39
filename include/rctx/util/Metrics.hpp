#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace rctx {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  // 0 when the counter was never touched.
  double counter(const std::string& name) const;

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util
} // namespace rctx

#define RCTX_METRIC_INC(name, d) ::rctx::util::MetricRegistry::instance().increment((name), (d))
#define RCTX_METRIC_HIT(name)    ::rctx::util::MetricRegistry::instance().increment((name), 1.0)
#define RCTX_METRIC_SET(name, v) ::rctx::util::MetricRegistry::instance().setGauge((name), (v))
