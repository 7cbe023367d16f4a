#include "circuit_breaker.hpp"

#include <iostream>

namespace horizon {

namespace {

int64_t wallMs() {
	return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
			   std::chrono::system_clock::now().time_since_epoch())
		.count();
}

} // namespace

const char *breakerStateName(BreakerState state) {
	switch (state) {
	case BreakerState::Closed: return "closed";
	case BreakerState::Open: return "open";
	case BreakerState::HalfOpen: return "half_open";
	}
	return "closed";
}

CircuitBreaker::CircuitBreaker(std::string name, BreakerOptions options, MetricsPtr metrics)
	: name_(std::move(name)), options_(options), metrics_(std::move(metrics)) {
	if (options_.failureThreshold < 1) options_.failureThreshold = 1;
	if (options_.halfOpenMaxCalls < 1) options_.halfOpenMaxCalls = 1;
}

bool CircuitBreaker::recoveryElapsed() const {
	return Clock::now() - openedAt_ >= options_.recoveryTimeout;
}

void CircuitBreaker::transitionTo(BreakerState next) {
	if (state_ == next) return;
	BreakerState prev = state_;
	state_ = next;
	transitions_++;
	probesAdmitted_ = 0;
	probeSuccesses_ = 0;
	if (next == BreakerState::Open) openedAt_ = Clock::now();
	if (next == BreakerState::Closed) consecutiveFailures_ = 0;
	std::cerr << "[CircuitBreaker] " << name_ << " " << breakerStateName(prev) << " -> " << breakerStateName(next)
			  << " (failures=" << consecutiveFailures_ << ")" << std::endl;
	if (metrics_) metrics_->increment("horizon_breaker_transitions_total", {{"to", breakerStateName(next)}});
}

bool CircuitBreaker::allowRequest() {
	std::lock_guard<std::mutex> lock(mu_);
	switch (state_) {
	case BreakerState::Closed:
		return true;
	case BreakerState::Open:
		if (!recoveryElapsed()) {
			rejected_++;
			return false;
		}
		transitionTo(BreakerState::HalfOpen);
		probesAdmitted_ = 1;
		return true;
	case BreakerState::HalfOpen:
		if (probesAdmitted_ < options_.halfOpenMaxCalls) {
			probesAdmitted_++;
			return true;
		}
		rejected_++;
		return false;
	}
	return false;
}

void CircuitBreaker::recordSuccess() {
	std::lock_guard<std::mutex> lock(mu_);
	successes_++;
	if (state_ == BreakerState::HalfOpen) {
		probeSuccesses_++;
		if (probeSuccesses_ >= options_.halfOpenMaxCalls) transitionTo(BreakerState::Closed);
		return;
	}
	consecutiveFailures_ = 0;
}

void CircuitBreaker::recordFailure() {
	std::lock_guard<std::mutex> lock(mu_);
	failures_++;
	lastFailureMs_ = wallMs();
	if (state_ == BreakerState::HalfOpen) {
		transitionTo(BreakerState::Open);
		return;
	}
	if (state_ == BreakerState::Open) {
		// late result of a call admitted before the breaker opened
		openedAt_ = Clock::now();
		return;
	}
	consecutiveFailures_++;
	if (consecutiveFailures_ >= options_.failureThreshold) transitionTo(BreakerState::Open);
}

void CircuitBreaker::releaseProbe() {
	std::lock_guard<std::mutex> lock(mu_);
	if (state_ == BreakerState::HalfOpen && probesAdmitted_ > probeSuccesses_) probesAdmitted_--;
}

BreakerState CircuitBreaker::state() const {
	std::lock_guard<std::mutex> lock(mu_);
	return state_;
}

bool CircuitBreaker::rejecting() const {
	std::lock_guard<std::mutex> lock(mu_);
	if (state_ == BreakerState::Open) return !recoveryElapsed();
	if (state_ == BreakerState::HalfOpen) return probesAdmitted_ >= options_.halfOpenMaxCalls;
	return false;
}

void CircuitBreaker::reset() {
	std::lock_guard<std::mutex> lock(mu_);
	transitionTo(BreakerState::Closed);
	consecutiveFailures_ = 0;
}

json CircuitBreaker::stats() const {
	std::lock_guard<std::mutex> lock(mu_);
	return json{
		{"name", name_},
		{"state", breakerStateName(state_)},
		{"consecutiveFailures", consecutiveFailures_},
		{"failureThreshold", options_.failureThreshold},
		{"recoveryTimeoutMs", options_.recoveryTimeout.count()},
		{"halfOpenMaxCalls", options_.halfOpenMaxCalls},
		{"probesAdmitted", probesAdmitted_},
		{"transitions", transitions_},
		{"rejected", rejected_},
		{"successes", successes_},
		{"failures", failures_},
		{"lastFailureMs", lastFailureMs_}
	};
}

} // namespace horizon
