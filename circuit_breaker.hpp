#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "metrics.hpp"

namespace horizon {

enum class BreakerState { Closed, Open, HalfOpen };

const char *breakerStateName(BreakerState state);

// Closed counts consecutive failures; at failureThreshold it opens and
// rejects until recoveryTimeout elapses. HalfOpen then admits at most
// halfOpenMaxCalls probes: all succeeding closes it, any failure reopens.
class CircuitBreaker {
public:
	using Clock = std::chrono::steady_clock;

	CircuitBreaker(std::string name, BreakerOptions options, MetricsPtr metrics = nullptr);

	// Admits or rejects a call. Every admitted call must be followed by exactly
	// one of recordSuccess, recordFailure or releaseProbe.
	bool allowRequest();
	void recordSuccess();
	void recordFailure();
	// Gives back an admitted slot without judging the downstream (cancellation).
	void releaseProbe();

	BreakerState state() const;
	// True while calls would be rejected right now.
	bool rejecting() const;
	void reset();

	json stats() const;

private:
	void transitionTo(BreakerState next);
	bool recoveryElapsed() const;

	std::string name_;
	BreakerOptions options_;
	MetricsPtr metrics_;

	mutable std::mutex mu_;
	BreakerState state_{BreakerState::Closed};
	int consecutiveFailures_{0};
	int probesAdmitted_{0};
	int probeSuccesses_{0};
	Clock::time_point openedAt_{};
	int64_t lastFailureMs_{0};
	uint64_t transitions_{0};
	uint64_t rejected_{0};
	uint64_t successes_{0};
	uint64_t failures_{0};
};

} // namespace horizon
