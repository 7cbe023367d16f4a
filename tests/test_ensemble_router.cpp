#include <gtest/gtest.h>

#include "ensemble_router.hpp"
#include "metrics.hpp"
#include "test_support.hpp"

using namespace horizon;

namespace {

struct RouterFixture {
	std::shared_ptr<fakes::FakeModel> shortModel = std::make_shared<fakes::FakeModel>("short", 0.30, 0.90);
	std::shared_ptr<fakes::FakeModel> longModel = std::make_shared<fakes::FakeModel>("long", 0.50, 0.70);
	RouterOptions options;
	std::shared_ptr<InMemoryMetrics> metrics = std::make_shared<InMemoryMetrics>();

	EnsembleRouter router() { return EnsembleRouter(shortModel, longModel, options, metrics); }
};

ModelPrediction prediction(double score, double confidence) {
	ModelPrediction p;
	p.score = score;
	p.confidence = confidence;
	return p;
}

} // namespace

TEST(EnsembleRouter, ShortHorizonUsesOnlyShortModel) {
	RouterFixture f;
	auto router = f.router();
	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({3})));
	ASSERT_EQ(result.horizons.size(), 1u);
	const auto &h = result.horizons[0];
	EXPECT_TRUE(h.ok);
	EXPECT_EQ(h.modelUsed, "short");
	EXPECT_FALSE(h.degraded);
	EXPECT_DOUBLE_EQ(h.score, 0.30);
	EXPECT_EQ(h.level, RiskLevel::Medium);
	EXPECT_EQ(f.shortModel->calls.load(), 1);
	EXPECT_EQ(f.longModel->calls.load(), 0);
	EXPECT_FALSE(result.degraded);
}

TEST(EnsembleRouter, LongHorizonFallsBackToShortWithPenalty) {
	RouterFixture f;
	f.longModel->fail = true;
	auto router = f.router();
	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({12})));
	const auto &h = result.horizons.at(0);
	ASSERT_TRUE(h.ok);
	EXPECT_EQ(h.modelUsed, "short_fallback");
	EXPECT_TRUE(h.degraded);
	EXPECT_TRUE(result.degraded);
	EXPECT_NEAR(h.confidence, 0.90 * 0.8, 1e-12);
	EXPECT_DOUBLE_EQ(h.score, 0.30);
	EXPECT_GE(f.longModel->calls.load(), 1);
}

TEST(EnsembleRouter, BlendStaysBetweenMembers) {
	RouterFixture f;
	auto router = f.router();
	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({6})));
	const auto &h = result.horizons.at(0);
	ASSERT_TRUE(h.ok);
	EXPECT_EQ(h.modelUsed, "ensemble");
	EXPECT_NEAR(h.score, 0.40, 1e-12);
	// disagreement 0.2 costs 0.1 of the mean confidence
	EXPECT_NEAR(h.confidence, 0.80 * 0.9, 1e-12);
	EXPECT_LE(h.lowerBound, h.score);
	EXPECT_GE(h.upperBound, h.score);
	ASSERT_EQ(h.members.size(), 2u);
	EXPECT_DOUBLE_EQ(h.members[0].weight + h.members[1].weight, 1.0);
	ASSERT_TRUE(h.comparison.has_value());
	EXPECT_EQ(h.comparison->betterModel, "short");
	EXPECT_NEAR(h.comparison->agreement, 0.8, 1e-12);
}

TEST(EnsembleRouter, BlendMath) {
	RouterOptions o;
	auto b = EnsembleRouter::blend(prediction(0.2, 0.8), 3.0, prediction(0.6, 0.6), 1.0, o);
	EXPECT_NEAR(b.score, 0.3, 1e-12);
	EXPECT_NEAR(b.disagreementPenalty, 0.2, 1e-12);
	EXPECT_NEAR(b.confidence, 0.7 * 0.8, 1e-12);

	auto zero = EnsembleRouter::blend(prediction(0.0, 1.0), 0.0, prediction(1.0, 1.0), 0.0, o);
	EXPECT_NEAR(zero.score, 0.5, 1e-12);
	EXPECT_NEAR(zero.disagreementPenalty, o.maxDisagreementPenalty, 1e-12);

	auto bounds = EnsembleRouter::uncertaintyBounds(0.95, 0.2, 0.3, 0.25);
	EXPECT_DOUBLE_EQ(bounds.second, 1.0);
	EXPECT_NEAR(bounds.first, 0.95 - (0.8 * 0.25 + 0.15), 1e-12);
}

TEST(EnsembleRouter, ExplicitModelTypeOverridesHorizonRouting) {
	RouterFixture f;
	auto router = f.router();
	EXPECT_EQ(router.planFor(ModelType::ModelB, 3), PredictorPlan::LongOnly);
	EXPECT_EQ(router.planFor(ModelType::ModelA, 12), PredictorPlan::ShortOnly);
	EXPECT_EQ(router.planFor(ModelType::Ensemble, 3), PredictorPlan::Blend);
	EXPECT_EQ(router.planFor(ModelType::Auto, 3), PredictorPlan::ShortOnly);
	EXPECT_EQ(router.planFor(ModelType::Auto, 9), PredictorPlan::Blend);

	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({3}, ModelType::ModelB)));
	EXPECT_EQ(result.horizons.at(0).modelUsed, "long");
	EXPECT_EQ(f.shortModel->calls.load(), 0);
}

TEST(EnsembleRouter, PartialFailureKeepsHealthyHorizons) {
	RouterFixture f;
	f.longModel->fail = true;
	auto router = f.router();
	auto req = normalizeRequest(fakes::sampleRequest({3, 12}, ModelType::ModelB));
	f.shortModel->fail = true;
	EXPECT_THROW(router.predict(Context::background(), req), RiskError);

	f.shortModel->fail = false;
	auto mixed = normalizeRequest(fakes::sampleRequest({3, 12}));
	f.longModel->fail = false;
	auto shortFailing = std::make_shared<fakes::FakeModel>("short", [](const FeatureVector &fv) {
		if (fv[kHorizon] * 24.0 < 6.0) throw std::runtime_error("short-broken");
		return ModelOutput{0.2, 0.9};
	});
	EnsembleRouter partial(shortFailing, f.longModel, f.options);
	auto result = partial.predict(Context::background(), mixed);
	ASSERT_EQ(result.horizons.size(), 2u);
	EXPECT_TRUE(result.degraded);
	ASSERT_NE(result.find(3), nullptr);
	EXPECT_FALSE(result.find(3)->ok);
	ASSERT_TRUE(result.find(3)->error.has_value());
	EXPECT_EQ(result.find(3)->error->code, ErrorCode::ModelInvocation);
	EXPECT_TRUE(result.find(12)->ok);
	EXPECT_EQ(result.find(12)->modelUsed, "ensemble");
}

TEST(EnsembleRouter, AllHorizonsFailingRaises) {
	RouterFixture f;
	f.shortModel->fail = true;
	f.longModel->fail = true;
	auto router = f.router();
	try {
		router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({3, 6})));
		FAIL() << "expected failure";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::ModelInvocation);
		EXPECT_TRUE(e.countsAsBreakerFailure());
	}
}

TEST(EnsembleRouter, UnavailableModelIsReportedNotCalled) {
	RouterFixture f;
	f.shortModel->unload();
	auto router = f.router();
	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({9})));
	EXPECT_EQ(result.horizons.at(0).modelUsed, "long_fallback");
	EXPECT_EQ(f.shortModel->calls.load(), 0);
}

TEST(EnsembleRouter, TimeoutPropagates) {
	RouterFixture f;
	f.shortModel->latencyMs = 200;
	auto router = f.router();
	auto ctx = Context::withTimeout(Context::background(), std::chrono::milliseconds(20));
	try {
		router.predict(ctx, normalizeRequest(fakes::sampleRequest({3})));
		FAIL() << "expected timeout";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::Timeout);
	}
}

TEST(EnsembleRouter, WeightsChangeVersionTagAndBlend) {
	RouterFixture f;
	auto router = f.router();
	auto before = router.versionTag();
	EXPECT_EQ(before, "short@test-1+long@test-1#w0");

	auto w = std::make_shared<RouterWeights>();
	w->version = 4;
	w->perHorizon[6] = HorizonWeights{1.0, 0.0};
	router.applyWeights(w);
	EXPECT_NE(router.versionTag(), before);
	EXPECT_EQ(router.weights()->version, 4u);

	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({6})));
	EXPECT_NEAR(result.horizons.at(0).score, 0.30, 1e-12);
	EXPECT_EQ(result.modelVersion, router.versionTag());
	EXPECT_EQ(RouterWeights::fromJson(w->toJson()).forHorizon(6).longWeight, 0.0);
}

TEST(EnsembleRouter, MemberPredictionsRunBothModels) {
	RouterFixture f;
	auto router = f.router();
	auto out = router.memberPredictions(Context::background(), normalizeRequest(fakes::sampleRequest({3})), 3);
	ASSERT_TRUE(out.shortPrediction.has_value());
	ASSERT_TRUE(out.longPrediction.has_value());
	EXPECT_EQ(out.shortPrediction->role, "short");
	EXPECT_EQ(out.longPrediction->modelId, "long");
}

TEST(EnsembleRouter, HorizonsCarryTopRiskFactors) {
	RouterFixture f;
	f.options.maxRiskFactors = 3;
	auto router = f.router();
	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({3, 12})));
	for (auto &h : result.horizons) {
		ASSERT_TRUE(h.ok);
		ASSERT_EQ(h.factors.size(), 3u);
		EXPECT_EQ(h.factors[0].name, "industry_risk");
	}
}

TEST(EnsembleRouter, AgreementAnalysisCoversBlendedHorizons) {
	RouterFixture f;
	f.options.disagreementThreshold = 0.1;
	auto router = f.router();
	auto result = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({3, 6, 12})));
	ASSERT_TRUE(result.agreement.has_value());
	const auto &a = *result.agreement;
	// the short-only horizon has no comparison
	EXPECT_EQ(a.byHorizon.count(3), 0u);
	ASSERT_EQ(a.byHorizon.size(), 2u);
	EXPECT_NEAR(a.byHorizon.at(6), 0.8, 1e-12);
	EXPECT_NEAR(a.overall, 0.8, 1e-12);
	EXPECT_EQ(a.highDisagreementHorizons, (std::vector<int>{6, 12}));

	f.options.disagreementThreshold = 0.5;
	auto relaxed = f.router().predict(Context::background(), normalizeRequest(fakes::sampleRequest({6})));
	ASSERT_TRUE(relaxed.agreement.has_value());
	EXPECT_TRUE(relaxed.agreement->highDisagreementHorizons.empty());

	auto shortOnly = router.predict(Context::background(), normalizeRequest(fakes::sampleRequest({3})));
	EXPECT_FALSE(shortOnly.agreement.has_value());
}

TEST(EnsembleRouter, AgreementAveragesPerHorizonValues) {
	std::vector<HorizonResult> hs(3);
	for (int i = 0; i < 3; i++) {
		hs[i].horizon = 3 * (i + 2);
		hs[i].ok = true;
		hs[i].comparison = ModelComparison{};
	}
	hs[0].comparison->agreement = 0.9;
	hs[0].comparison->scoreDifference = 0.1;
	hs[1].comparison->agreement = 0.6;
	hs[1].comparison->scoreDifference = 0.4;
	hs[2].ok = false;
	auto a = EnsembleRouter::analyzeAgreement(hs, 0.2);
	ASSERT_TRUE(a.has_value());
	EXPECT_NEAR(a->overall, 0.75, 1e-12);
	EXPECT_EQ(a->highDisagreementHorizons, (std::vector<int>{9}));
	EXPECT_FALSE(EnsembleRouter::analyzeAgreement({}, 0.2).has_value());
}
