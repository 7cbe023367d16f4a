#include <gtest/gtest.h>

#include "metrics.hpp"

using namespace horizon;

TEST(InMemoryMetrics, CountersAndGaugesByLabelSet) {
	InMemoryMetrics m;
	m.increment("requests_total", {{"outcome", "hit"}});
	m.increment("requests_total", {{"outcome", "hit"}}, 2.0);
	m.increment("requests_total", {{"outcome", "miss"}});
	m.gauge("queue_depth", {}, 4.0);
	m.gauge("queue_depth", {}, 2.0);

	EXPECT_EQ(m.counter("requests_total", {{"outcome", "hit"}}), 3.0);
	EXPECT_EQ(m.counter("requests_total", {{"outcome", "miss"}}), 1.0);
	EXPECT_EQ(m.counter("requests_total"), 0.0);
	EXPECT_EQ(m.counter("unknown"), 0.0);
	EXPECT_EQ(m.gaugeValue("queue_depth"), 2.0);
}

TEST(InMemoryMetrics, LabelOrderDoesNotSplitSeries) {
	InMemoryMetrics m;
	m.increment("x", {{"a", "1"}, {"b", "2"}});
	m.increment("x", {{"b", "2"}, {"a", "1"}});
	EXPECT_EQ(m.counter("x", {{"a", "1"}, {"b", "2"}}), 2.0);
}

TEST(InMemoryMetrics, PrometheusRendering) {
	InMemoryMetrics m({10, 100});
	m.increment("horizon_requests_total", {{"outcome", "hit"}});
	m.observe("horizon_latency_ms", {{"horizon", "3"}}, 5.0);
	m.observe("horizon_latency_ms", {{"horizon", "3"}}, 50.0);
	m.observe("horizon_latency_ms", {{"horizon", "3"}}, 500.0);
	auto text = m.renderPrometheus();

	EXPECT_NE(text.find("# TYPE horizon_requests_total counter\n"), std::string::npos);
	EXPECT_NE(text.find("horizon_requests_total{outcome=\"hit\"} 1\n"), std::string::npos);
	EXPECT_NE(text.find("# TYPE horizon_latency_ms histogram\n"), std::string::npos);
	EXPECT_NE(text.find("horizon_latency_ms_bucket{horizon=\"3\",le=\"10\"} 1\n"), std::string::npos);
	EXPECT_NE(text.find("horizon_latency_ms_bucket{horizon=\"3\",le=\"100\"} 2\n"), std::string::npos);
	EXPECT_NE(text.find("horizon_latency_ms_bucket{horizon=\"3\",le=\"+Inf\"} 3\n"), std::string::npos);
	EXPECT_NE(text.find("horizon_latency_ms_count{horizon=\"3\"} 3\n"), std::string::npos);
	EXPECT_EQ(m.observations("horizon_latency_ms", {{"horizon", "3"}}), 3u);
}

TEST(InMemoryMetrics, LabelValuesAreEscaped) {
	InMemoryMetrics m;
	m.increment("errors_total", {{"msg", "say \"hi\""}});
	EXPECT_NE(m.renderPrometheus().find("errors_total{msg=\"say \\\"hi\\\"\"} 1"), std::string::npos);
	auto snap = m.snapshot();
	EXPECT_EQ(snap["counters"].size(), 1u);
}
