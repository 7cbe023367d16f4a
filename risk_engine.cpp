#include "risk_engine.hpp"

#include <chrono>
#include <iostream>

namespace horizon {

std::optional<AdmissionGate::Permit> AdmissionGate::tryAcquire() {
	int current = inUse_.load();
	while (current < capacity_) {
		if (inUse_.compare_exchange_weak(current, current + 1)) return Permit(this);
	}
	return std::nullopt;
}

RiskEngine::RiskEngine(std::shared_ptr<EnsembleRouter> router, std::shared_ptr<ResultCache> cache, EngineOptions options,
					   BreakerOptions breakerOptions, MetricsPtr metrics)
	: router_(std::move(router)), cache_(std::move(cache)), options_(options),
	  metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetrics>()),
	  breaker_("router", breakerOptions, metrics_), admission_(options.maxConcurrentRequests) {
	if (!router_) throw std::runtime_error("risk-engine-requires-router");
	std::cout << "[RiskEngine] ready maxConcurrent=" << admission_.capacity() << " timeout=" << options_.requestTimeout.count()
			  << "ms cache=" << (cache_ && options_.enableCaching ? "on" : "off")
			  << " l2=" << (cache_ && cache_->hasL2() ? "on" : "off") << std::endl;
}

RiskEngine::~RiskEngine() {
	stop();
}

void RiskEngine::stop() {
	if (prefetcher_) prefetcher_->stop();
	flights_.shutdown();
}

std::string RiskEngine::cacheKeyFor(const RiskAssessmentRequest &normalized) const {
	return "risk:v1:" + requestFingerprint(normalized, router_->versionTag());
}

void RiskEngine::countOutcome(const std::string &outcome) {
	{
		std::lock_guard<std::mutex> lock(outcomeMu_);
		outcomes_[outcome]++;
	}
	metrics_->increment("horizon_engine_requests_total", {{"outcome", outcome}});
}

EnsembleResult RiskEngine::compute(const ContextPtr &flightCtx, const RiskAssessmentRequest &normalized, const std::string &key) {
	// a flight that starts with no time left never reaches the breaker
	flightCtx->check(Stage::Router);
	if (!breaker_.allowRequest()) {
		throw RiskError(ErrorCode::CircuitOpen, Stage::Breaker, "circuit-open");
	}
	routerInvocations_++;
	EnsembleResult result;
	try {
		result = router_->predict(flightCtx, normalized);
	} catch (const RiskError &e) {
		if (e.countsAsBreakerFailure()) breaker_.recordFailure();
		else breaker_.releaseProbe();
		throw;
	} catch (const std::exception &e) {
		breaker_.releaseProbe();
		throw RiskError(ErrorCode::Internal, Stage::Router, e.what());
	}
	breaker_.recordSuccess();

	if (cache_ && options_.enableCaching && !result.hasFailures()) {
		Millis ttl = result.degraded ? options_.degradedCacheTtl : options_.cacheTtl;
		if (ttl.count() > 0) {
			std::vector<std::string> tags{"model:" + result.modelVersion, "business:" + normalized.businessName};
			cache_->set(key, result.toJson().dump(), ttl, tags, normalized.toJson());
			cacheWrites_++;
		}
	}
	return result;
}

EnsembleResult RiskEngine::assess(const ContextPtr &ctx, const RiskAssessmentRequest &request) {
	requests_++;
	auto started = std::chrono::steady_clock::now();
	auto parent = ctx ? ctx : Context::background();
	try {
		validateRequest(request, router_->options().supportedHorizons);
		auto permit = admission_.tryAcquire();
		if (!permit) {
			throw RiskError(ErrorCode::ResourceExhausted, Stage::Admission,
							"max-concurrent-requests:" + std::to_string(admission_.capacity()));
		}
		auto reqCtx = Context::withTimeout(parent, options_.requestTimeout);
		reqCtx->check(Stage::Admission);

		auto normalized = normalizeRequest(request);
		const std::string key = cacheKeyFor(normalized);

		if (cache_ && options_.enableCaching && !normalized.bypassCache) {
			auto cached = cache_->get(key, reqCtx);
			if (cached) {
				try {
					auto result = EnsembleResult::fromJson(json::parse(*cached));
					cacheHits_++;
					countOutcome("hit");
					return result;
				} catch (const json::exception &e) {
					std::cerr << "[RiskEngine] dropping unreadable cache entry " << key << ": " << e.what() << std::endl;
					cache_->invalidate(key);
				}
			}
		}
		cacheMisses_++;
		reqCtx->check(Stage::Cache);

		auto deadline = reqCtx->deadline().value_or(std::chrono::steady_clock::now() + options_.requestTimeout);
		auto result = flights_.run(key, reqCtx, deadline, Stage::Router,
								   [this, normalized, key](const ContextPtr &flightCtx) {
									   return compute(flightCtx, normalized, key);
								   });
		countOutcome(result.degraded ? "degraded" : "miss");
		double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
		metrics_->observe("horizon_engine_latency_ms", {}, ms);
		return result;
	} catch (const RiskError &e) {
		countOutcome(errorCodeName(e.code()));
		throw;
	}
}

void RiskEngine::refresh(const std::string &key, const json &origin, Millis timeout) {
	if (breaker_.rejecting()) return;
	auto normalized = normalizeRequest(RiskAssessmentRequest::fromJson(origin));
	auto currentKey = cacheKeyFor(normalized);
	if (currentKey != key) {
		// model version moved on; the stale entry ages out on its own
		return;
	}
	auto ctx = Context::withTimeout(Context::background(), timeout);
	auto deadline = ctx->deadline().value_or(std::chrono::steady_clock::now() + timeout);
	flights_.run(key, ctx, deadline, Stage::Router, [this, normalized, key](const ContextPtr &flightCtx) {
		return compute(flightCtx, normalized, key);
	});
}

void RiskEngine::installPrefetch(const PrefetchOptions &options) {
	if (!cache_ || !options.enabled) return;
	if (prefetcher_) prefetcher_->stop();
	Millis timeout = options.refreshTimeout;
	prefetcher_ = std::make_unique<Prefetcher>(
		cache_, options,
		[this, timeout](const std::string &key, const json &origin) { refresh(key, origin, timeout); },
		[this]() { return breaker_.rejecting(); });
	prefetcher_->start();
}

void RiskEngine::applyWeights(std::shared_ptr<const RouterWeights> weights) {
	if (!weights) return;
	const std::string previous = router_->versionTag();
	router_->applyWeights(std::move(weights));
	if (cache_) cache_->invalidateTag("model:" + previous);
}

json RiskEngine::stats() const {
	json outcomes = json::object();
	{
		std::lock_guard<std::mutex> lock(outcomeMu_);
		for (auto &kv : outcomes_) outcomes[kv.first] = kv.second;
	}
	return json{
		{"requests", requests_.load()},
		{"cacheHits", cacheHits_.load()},
		{"cacheMisses", cacheMisses_.load()},
		{"cacheWrites", cacheWrites_.load()},
		{"routerInvocations", routerInvocations_.load()},
		{"joinedFlights", flights_.joinedCount()},
		{"inFlight", flights_.inFlight()},
		{"admission", json{{"inUse", admission_.inUse()}, {"capacity", admission_.capacity()}}},
		{"outcomes", outcomes},
		{"breaker", breaker_.stats()},
		{"cache", cache_ ? cache_->stats() : json()},
		{"prefetch", prefetcher_ ? prefetcher_->stats() : json()},
		{"router", router_->describe()}
	};
}

} // namespace horizon
