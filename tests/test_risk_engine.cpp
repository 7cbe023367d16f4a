#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "metrics.hpp"
#include "risk_engine.hpp"
#include "test_support.hpp"

using namespace horizon;
using namespace std::chrono_literals;

namespace {

class RiskEngineTest : public ::testing::Test {
protected:
	void SetUp() override {
		shortModel = std::make_shared<fakes::FakeModel>("short", 0.35, 0.9);
		longModel = std::make_shared<fakes::FakeModel>("long", 0.55, 0.8);
		metrics = std::make_shared<InMemoryMetrics>();
		cache = std::make_shared<ResultCache>(CacheOptions{}, nullptr, metrics);
		engineOptions.requestTimeout = 2000ms;
		breakerOptions.failureThreshold = 2;
		breakerOptions.recoveryTimeout = 50ms;
		breakerOptions.halfOpenMaxCalls = 1;
	}

	std::unique_ptr<RiskEngine> build() {
		auto router = std::make_shared<EnsembleRouter>(shortModel, longModel, RouterOptions{}, metrics);
		return std::make_unique<RiskEngine>(router, cache, engineOptions, breakerOptions, metrics);
	}

	std::shared_ptr<fakes::FakeModel> shortModel;
	std::shared_ptr<fakes::FakeModel> longModel;
	std::shared_ptr<InMemoryMetrics> metrics;
	std::shared_ptr<ResultCache> cache;
	EngineOptions engineOptions;
	BreakerOptions breakerOptions;
};

ErrorCode codeOf(RiskEngine &engine, const ContextPtr &ctx, const RiskAssessmentRequest &r) {
	try {
		engine.assess(ctx, r);
	} catch (const RiskError &e) {
		return e.code();
	}
	return ErrorCode::Internal;
}

} // namespace

TEST_F(RiskEngineTest, RepeatedRequestIsServedFromCacheByteForByte) {
	auto engine = build();
	auto first = engine->assess(Context::background(), fakes::sampleRequest({3, 6}));
	auto cosmetic = fakes::sampleRequest({6, 3});
	cosmetic.businessName = "ACME widgets  llc";
	auto second = engine->assess(Context::background(), cosmetic);

	EXPECT_EQ(first.toJson().dump(), second.toJson().dump());
	EXPECT_EQ(engine->routerInvocations(), 1u);
	EXPECT_EQ(engine->stats()["cacheHits"], 1);
	EXPECT_EQ(metrics->counter("horizon_engine_requests_total", {{"outcome", "hit"}}), 1.0);
}

TEST_F(RiskEngineTest, BypassCacheRecomputes) {
	auto engine = build();
	auto r = fakes::sampleRequest({3});
	engine->assess(Context::background(), r);
	r.bypassCache = true;
	engine->assess(Context::background(), r);
	EXPECT_EQ(engine->routerInvocations(), 2u);
}

TEST_F(RiskEngineTest, ConcurrentIdenticalRequestsShareOneComputation) {
	shortModel->latencyMs = 80;
	longModel->latencyMs = 80;
	auto engine = build();

	const int callers = 8;
	std::vector<std::string> bodies(callers);
	std::vector<std::thread> threads;
	for (int i = 0; i < callers; i++) {
		threads.emplace_back([&, i]() {
			bodies[i] = engine->assess(Context::background(), fakes::sampleRequest({6})).toJson().dump();
		});
	}
	for (auto &t : threads) t.join();

	EXPECT_EQ(engine->routerInvocations(), 1u);
	EXPECT_EQ(shortModel->calls.load(), 1);
	EXPECT_EQ(longModel->calls.load(), 1);
	for (auto &b : bodies) EXPECT_EQ(b, bodies[0]);
}

TEST_F(RiskEngineTest, BreakerOpensAndShortCircuits) {
	shortModel->fail = true;
	longModel->fail = true;
	auto engine = build();
	auto r = fakes::sampleRequest({3});

	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::ModelInvocation);
	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::ModelInvocation);
	EXPECT_EQ(engine->breaker().state(), BreakerState::Open);

	auto invocations = engine->routerInvocations();
	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::CircuitOpen);
	EXPECT_EQ(engine->routerInvocations(), invocations);
	EXPECT_EQ(shortModel->calls.load(), 2);

	std::this_thread::sleep_for(80ms);
	shortModel->fail = false;
	auto result = engine->assess(Context::background(), r);
	EXPECT_TRUE(result.horizons.at(0).ok);
	EXPECT_EQ(engine->breaker().state(), BreakerState::Closed);
}

TEST_F(RiskEngineTest, FailedProbeReopens) {
	shortModel->fail = true;
	auto engine = build();
	auto r = fakes::sampleRequest({3});
	codeOf(*engine, Context::background(), r);
	codeOf(*engine, Context::background(), r);
	std::this_thread::sleep_for(80ms);
	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::ModelInvocation);
	EXPECT_EQ(engine->breaker().state(), BreakerState::Open);
	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::CircuitOpen);
}

TEST_F(RiskEngineTest, SlowModelTimesOut) {
	shortModel->latencyMs = 500;
	engineOptions.requestTimeout = 30ms;
	auto engine = build();
	auto started = std::chrono::steady_clock::now();
	EXPECT_EQ(codeOf(*engine, Context::background(), fakes::sampleRequest({3})), ErrorCode::Timeout);
	EXPECT_LT(std::chrono::steady_clock::now() - started, 400ms);
}

TEST_F(RiskEngineTest, SlowSharedCacheTimeoutLeavesBreakerClosed) {
	auto l2 = std::make_shared<fakes::FakeSharedCache>();
	l2->latencyMs = 80;
	cache = std::make_shared<ResultCache>(CacheOptions{}, l2, metrics);
	engineOptions.requestTimeout = 30ms;
	auto engine = build();

	for (int i = 0; i < 3; i++) {
		auto r = fakes::sampleRequest({3});
		r.businessName = "Slow Lookup " + std::to_string(i);
		EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::Timeout);
	}
	EXPECT_EQ(engine->breaker().state(), BreakerState::Closed);
	EXPECT_EQ(engine->routerInvocations(), 0u);
	EXPECT_EQ(shortModel->calls.load(), 0);
	EXPECT_EQ(longModel->calls.load(), 0);

	l2->latencyMs = 0;
	auto r = fakes::sampleRequest({3});
	r.businessName = "Fast Lookup";
	EXPECT_TRUE(engine->assess(Context::background(), r).horizons.at(0).ok);
}

TEST_F(RiskEngineTest, AdmissionLimitRejectsExcessRequests) {
	shortModel->latencyMs = 200;
	engineOptions.maxConcurrentRequests = 1;
	auto engine = build();

	std::thread busy([&]() { engine->assess(Context::background(), fakes::sampleRequest({3})); });
	std::this_thread::sleep_for(40ms);
	auto other = fakes::sampleRequest({3});
	other.businessName = "Other Business";
	EXPECT_EQ(codeOf(*engine, Context::background(), other), ErrorCode::ResourceExhausted);
	busy.join();
	EXPECT_NO_THROW(engine->assess(Context::background(), other));
}

TEST_F(RiskEngineTest, CancellationDoesNotTripBreaker) {
	shortModel->latencyMs = 300;
	breakerOptions.failureThreshold = 1;
	auto engine = build();
	auto ctx = Context::withCancel(Context::background());
	std::thread canceller([ctx]() {
		std::this_thread::sleep_for(20ms);
		ctx->cancel();
	});
	EXPECT_EQ(codeOf(*engine, ctx, fakes::sampleRequest({3})), ErrorCode::Cancelled);
	canceller.join();
	// let the abandoned flight observe its cancellation
	std::this_thread::sleep_for(50ms);
	EXPECT_EQ(engine->breaker().state(), BreakerState::Closed);
}

TEST_F(RiskEngineTest, InvalidRequestNeverReachesModels) {
	auto engine = build();
	auto r = fakes::sampleRequest({5});
	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::ValidationInput);
	EXPECT_EQ(engine->routerInvocations(), 0u);
	EXPECT_EQ(engine->breaker().state(), BreakerState::Closed);
}

TEST_F(RiskEngineTest, FailedHorizonsAreNotCached) {
	auto engine = build();
	longModel->fail = true;
	shortModel->fail = true;
	auto r = fakes::sampleRequest({3, 12}, ModelType::ModelB);
	EXPECT_EQ(codeOf(*engine, Context::background(), r), ErrorCode::ModelInvocation);
	EXPECT_EQ(cache->size(), 0u);
}

TEST_F(RiskEngineTest, DegradedResultsUseShorterTtl) {
	engineOptions.degradedCacheTtl = Millis(0);
	longModel->fail = true;
	auto engine = build();
	auto result = engine->assess(Context::background(), fakes::sampleRequest({12}));
	EXPECT_TRUE(result.degraded);
	EXPECT_EQ(cache->size(), 0u);
}

TEST_F(RiskEngineTest, ApplyingWeightsInvalidatesCachedResults) {
	auto engine = build();
	auto r = fakes::sampleRequest({6});
	auto before = engine->assess(Context::background(), r);
	EXPECT_EQ(cache->size(), 1u);

	auto w = std::make_shared<RouterWeights>();
	w->version = 1;
	w->perHorizon[6] = HorizonWeights{0.0, 1.0};
	engine->applyWeights(w);
	EXPECT_EQ(cache->size(), 0u);

	auto after = engine->assess(Context::background(), r);
	EXPECT_EQ(engine->routerInvocations(), 2u);
	EXPECT_NE(after.modelVersion, before.modelVersion);
	EXPECT_NEAR(after.horizons.at(0).score, 0.55, 1e-12);
}

TEST_F(RiskEngineTest, RefreshRecomputesPopularEntry) {
	auto engine = build();
	auto r = fakes::sampleRequest({3});
	engine->assess(Context::background(), r);
	auto key = engine->cacheKeyFor(normalizeRequest(r));
	engine->refresh(key, normalizeRequest(r).toJson(), 500ms);
	EXPECT_EQ(engine->routerInvocations(), 2u);

	engine->refresh("risk:v1:stale", normalizeRequest(r).toJson(), 500ms);
	EXPECT_EQ(engine->routerInvocations(), 2u);
}
