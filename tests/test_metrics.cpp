#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace keypub;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    reg.increment_counter(metric::keys_published);
    reg.increment_counter(metric::keys_published, 2.0);
    EXPECT_EQ(reg.get_counter(metric::keys_published), 3.0);
    EXPECT_EQ(reg.get_counter("never_touched"), 0.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("# TYPE keys_published_total counter"), std::string::npos);
    EXPECT_NE(prometheus.find("keys_published_total 3"), std::string::npos);
}

TEST(MetricsTest, Gauge) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge(metric::active_sessions, 4.0);
    reg.increment_gauge(metric::active_sessions);
    reg.decrement_gauge(metric::active_sessions, 2.0);
    EXPECT_EQ(reg.get_gauge(metric::active_sessions), 3.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("# TYPE active_sessions gauge"), std::string::npos);
    EXPECT_NE(prometheus.find("active_sessions 3"), std::string::npos);
}

TEST(MetricsTest, Reset) {
    auto& reg = MetricsRegistry::instance();
    reg.increment_counter(metric::store_errors);
    reg.reset();
    EXPECT_EQ(reg.get_counter(metric::store_errors), 0.0);
    EXPECT_TRUE(reg.collect_prometheus().empty());
}
