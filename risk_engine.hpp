#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "circuit_breaker.hpp"
#include "config.hpp"
#include "context.hpp"
#include "ensemble_router.hpp"
#include "metrics.hpp"
#include "prefetcher.hpp"
#include "result_cache.hpp"
#include "single_flight.hpp"
#include "types.hpp"

namespace horizon {

// Non-blocking counting semaphore. A Permit gives its slot back on destruction.
class AdmissionGate {
public:
	class Permit {
	public:
		explicit Permit(AdmissionGate *gate) : gate_(gate) {}
		Permit(Permit &&other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
		Permit(const Permit &) = delete;
		Permit &operator=(const Permit &) = delete;
		Permit &operator=(Permit &&) = delete;
		~Permit() {
			if (gate_) gate_->inUse_.fetch_sub(1);
		}

	private:
		AdmissionGate *gate_;
	};

	explicit AdmissionGate(int capacity) : capacity_(capacity < 1 ? 1 : capacity) {}

	std::optional<Permit> tryAcquire();
	int inUse() const { return inUse_.load(); }
	int capacity() const { return capacity_; }

private:
	int capacity_;
	std::atomic<int> inUse_{0};
};

class RiskEngine {
public:
	RiskEngine(std::shared_ptr<EnsembleRouter> router, std::shared_ptr<ResultCache> cache, EngineOptions options,
			   BreakerOptions breakerOptions, MetricsPtr metrics = nullptr);
	~RiskEngine();

	RiskEngine(const RiskEngine &) = delete;
	RiskEngine &operator=(const RiskEngine &) = delete;

	// Throws RiskError tagged with the stage that failed.
	EnsembleResult assess(const ContextPtr &ctx, const RiskAssessmentRequest &request);

	std::string cacheKeyFor(const RiskAssessmentRequest &normalized) const;

	// Recomputes the entry described by origin (a normalized request) and stores it.
	void refresh(const std::string &key, const json &origin, Millis timeout);
	void installPrefetch(const PrefetchOptions &options);

	// Publishes new router weights and drops results cached under the old version.
	void applyWeights(std::shared_ptr<const RouterWeights> weights);

	void stop();

	CircuitBreaker &breaker() { return breaker_; }
	const std::shared_ptr<EnsembleRouter> &router() const { return router_; }
	const std::shared_ptr<ResultCache> &cache() const { return cache_; }
	uint64_t routerInvocations() const { return routerInvocations_.load(); }

	json stats() const;

private:
	EnsembleResult compute(const ContextPtr &flightCtx, const RiskAssessmentRequest &normalized, const std::string &key);
	void countOutcome(const std::string &outcome);

	std::shared_ptr<EnsembleRouter> router_;
	std::shared_ptr<ResultCache> cache_;
	EngineOptions options_;
	MetricsPtr metrics_;
	CircuitBreaker breaker_;
	AdmissionGate admission_;

	std::atomic<uint64_t> requests_{0};
	std::atomic<uint64_t> cacheHits_{0};
	std::atomic<uint64_t> cacheMisses_{0};
	std::atomic<uint64_t> routerInvocations_{0};
	std::atomic<uint64_t> cacheWrites_{0};
	mutable std::mutex outcomeMu_;
	std::map<std::string, uint64_t> outcomes_;

	std::unique_ptr<Prefetcher> prefetcher_;
	SingleFlight<EnsembleResult> flights_;
};

} // namespace horizon
