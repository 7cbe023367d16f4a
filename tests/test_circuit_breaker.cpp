#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "circuit_breaker.hpp"
#include "metrics.hpp"

using namespace horizon;
using namespace std::chrono_literals;

namespace {

BreakerOptions fastOptions() {
	BreakerOptions o;
	o.failureThreshold = 3;
	o.recoveryTimeout = Millis(40);
	o.halfOpenMaxCalls = 2;
	return o;
}

void trip(CircuitBreaker &b, int failures) {
	for (int i = 0; i < failures; i++) {
		ASSERT_TRUE(b.allowRequest());
		b.recordFailure();
	}
}

} // namespace

TEST(CircuitBreaker, OpensAtThreshold) {
	auto metrics = std::make_shared<InMemoryMetrics>();
	CircuitBreaker b("test", fastOptions(), metrics);
	trip(b, 2);
	EXPECT_EQ(b.state(), BreakerState::Closed);
	trip(b, 1);
	EXPECT_EQ(b.state(), BreakerState::Open);
	EXPECT_FALSE(b.allowRequest());
	EXPECT_TRUE(b.rejecting());
	EXPECT_EQ(metrics->counter("horizon_breaker_transitions_total", {{"to", "open"}}), 1.0);
}

TEST(CircuitBreaker, SuccessResetsConsecutiveFailures) {
	CircuitBreaker b("test", fastOptions());
	trip(b, 2);
	ASSERT_TRUE(b.allowRequest());
	b.recordSuccess();
	trip(b, 2);
	EXPECT_EQ(b.state(), BreakerState::Closed);
}

TEST(CircuitBreaker, HalfOpenAdmitsExactlyMaxProbes) {
	CircuitBreaker b("test", fastOptions());
	trip(b, 3);
	std::this_thread::sleep_for(60ms);
	EXPECT_TRUE(b.allowRequest());
	EXPECT_EQ(b.state(), BreakerState::HalfOpen);
	EXPECT_TRUE(b.allowRequest());
	EXPECT_FALSE(b.allowRequest());
	b.recordSuccess();
	EXPECT_EQ(b.state(), BreakerState::HalfOpen);
	b.recordSuccess();
	EXPECT_EQ(b.state(), BreakerState::Closed);
	EXPECT_TRUE(b.allowRequest());
}

TEST(CircuitBreaker, ProbeFailureReopensAndRestartsTimer) {
	CircuitBreaker b("test", fastOptions());
	trip(b, 3);
	std::this_thread::sleep_for(60ms);
	ASSERT_TRUE(b.allowRequest());
	b.recordFailure();
	EXPECT_EQ(b.state(), BreakerState::Open);
	EXPECT_FALSE(b.allowRequest());
	std::this_thread::sleep_for(60ms);
	EXPECT_TRUE(b.allowRequest());
	EXPECT_EQ(b.state(), BreakerState::HalfOpen);
}

TEST(CircuitBreaker, ReleasedProbeDoesNotCountEitherWay) {
	CircuitBreaker b("test", fastOptions());
	trip(b, 3);
	std::this_thread::sleep_for(60ms);
	ASSERT_TRUE(b.allowRequest());
	ASSERT_TRUE(b.allowRequest());
	EXPECT_FALSE(b.allowRequest());
	b.releaseProbe();
	EXPECT_EQ(b.state(), BreakerState::HalfOpen);
	EXPECT_TRUE(b.allowRequest());
}

TEST(CircuitBreaker, StatsReportState) {
	CircuitBreaker b("router", fastOptions());
	trip(b, 3);
	auto s = b.stats();
	EXPECT_EQ(s["state"], "open");
	EXPECT_EQ(s["failures"], 3);
	EXPECT_EQ(s["name"], "router");
	b.reset();
	EXPECT_EQ(b.state(), BreakerState::Closed);
}
