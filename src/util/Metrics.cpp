#include "rctx/util/Metrics.hpp"

namespace rctx {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

} // namespace util
} // namespace rctx
