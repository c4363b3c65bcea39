#include "rctx/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace rctx::util;

TEST(MetricsTest, CountersAccumulate) {
    MetricRegistry reg;
    reg.increment("a");
    reg.increment("a", 2.5);
    EXPECT_DOUBLE_EQ(reg.counter("a"), 3.5);
    EXPECT_DOUBLE_EQ(reg.counter("never"), 0.0);
}

TEST(MetricsTest, GaugesOverwrite) {
    MetricRegistry reg;
    reg.setGauge("queue", 4);
    reg.setGauge("queue", 2);
    auto gauges = reg.snapshotGauges();
    ASSERT_EQ(gauges.count("queue"), 1u);
    EXPECT_DOUBLE_EQ(gauges["queue"], 2.0);
}

TEST(MetricsTest, ResetClearsEverything) {
    MetricRegistry reg;
    reg.increment("a");
    reg.setGauge("g", 1);
    reg.reset();
    EXPECT_TRUE(reg.snapshotCounters().empty());
    EXPECT_TRUE(reg.snapshotGauges().empty());
}

TEST(MetricsTest, ConcurrentIncrements) {
    MetricRegistry reg;
    std::vector<std::thread> ths;
    for (int t = 0; t < 4; ++t) {
        ths.emplace_back([&reg] {
            for (int i = 0; i < 1000; ++i) reg.increment("hits");
        });
    }
    for (auto& th : ths) th.join();
    EXPECT_DOUBLE_EQ(reg.counter("hits"), 4000.0);
}

TEST(MetricsTest, MacrosUseProcessRegistry) {
    const double before = MetricRegistry::instance().counter("metrics_test.hit");
    RCTX_METRIC_HIT("metrics_test.hit");
    RCTX_METRIC_INC("metrics_test.hit", 2.0);
    RCTX_METRIC_SET("metrics_test.gauge", 9.0);
    EXPECT_DOUBLE_EQ(MetricRegistry::instance().counter("metrics_test.hit"), before + 3.0);
    EXPECT_DOUBLE_EQ(MetricRegistry::instance().snapshotGauges()["metrics_test.gauge"], 9.0);
}
