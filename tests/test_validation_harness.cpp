#include <unistd.h>

#include <gtest/gtest.h>

#include "kv_store.hpp"
#include "test_support.hpp"
#include "validation_harness.hpp"

using namespace horizon;

namespace {

std::shared_ptr<EnsembleRouter> curveRouter(double shortBias, double longBias) {
	auto shortModel = std::make_shared<fakes::FakeModel>(
		"short", [shortBias](const FeatureVector &f) { return fakes::curveOutput(f, shortBias, 0.85); });
	auto longModel = std::make_shared<fakes::FakeModel>(
		"long", [longBias](const FeatureVector &f) { return fakes::curveOutput(f, longBias, 0.75); });
	return std::make_shared<EnsembleRouter>(shortModel, longModel, RouterOptions{});
}

std::vector<LabeledSample> dataset(int businesses, std::vector<int> horizons) {
	SyntheticDatasetOptions o;
	o.businesses = businesses;
	o.horizons = std::move(horizons);
	o.seed = 7;
	return generateSyntheticDataset(o);
}

ValidationOptions sixMonthOptions() {
	ValidationOptions o;
	o.horizons = {6};
	o.folds = 5;
	o.randomSeed = 42;
	o.defaultAccuracyThreshold = 0.0;
	o.maxCalibrationError = 0.0;
	return o;
}

} // namespace

TEST(Dataset, FilterHorizonKeepsOnlyMatchingSamplesInOrder) {
	auto data = dataset(50, {3, 6, 12});
	ASSERT_EQ(data.size(), 150u);
	auto six = filterHorizon(data, 6);
	ASSERT_EQ(six.size(), 50u);
	for (auto &s : six) EXPECT_EQ(s.horizon, 6);
	std::vector<std::string> expected;
	for (auto &s : data) {
		if (s.horizon == 6) expected.push_back(s.request.businessName);
	}
	for (size_t i = 0; i < six.size(); i++) EXPECT_EQ(six[i].request.businessName, expected[i]);
	EXPECT_TRUE(filterHorizon(data, 9).empty());
}

TEST(ValidationHarness, MixedHorizonDatasetScoresEachHorizonSeparately) {
	auto data = dataset(200, {3, 6});
	ValidationHarness harness(curveRouter(0.0, 0.03));
	auto options = sixMonthOptions();
	options.horizons = {3, 6};
	auto result = harness.validateModel(Context::background(), options, data);
	EXPECT_EQ(result.horizons.at(3).samples, 200u);
	EXPECT_EQ(result.horizons.at(6).samples, 200u);
}

TEST(ValidationHarness, FixedSeedGivesIdenticalReruns) {
	auto data = dataset(1000, {6});
	ASSERT_EQ(data.size(), 1000u);
	ValidationHarness harness(curveRouter(0.0, 0.03));
	auto first = harness.validateModel(Context::background(), sixMonthOptions(), data);
	auto second = harness.validateModel(Context::background(), sixMonthOptions(), data);

	ASSERT_EQ(first.horizons.count(6), 1u);
	const auto &m = first.horizons.at(6);
	EXPECT_EQ(m.samples, 1000u);
	EXPECT_EQ(m.failedPredictions, 0u);
	EXPECT_EQ(m.plan, "blend");
	EXPECT_GT(m.accuracy, 0.5);
	EXPECT_LE(m.accuracy, 1.0);
	EXPECT_GE(m.mae, 0.0);
	EXPECT_GE(m.rmse, m.mae);

	EXPECT_EQ(m.accuracy, second.horizons.at(6).accuracy);
	EXPECT_EQ(m.mae, second.horizons.at(6).mae);
	ASSERT_EQ(first.foldResults.size(), 5u);
	for (size_t i = 0; i < first.foldResults.size(); i++) {
		EXPECT_EQ(first.foldResults[i].shortWeight, second.foldResults[i].shortWeight);
		EXPECT_EQ(first.foldResults[i].testSize, second.foldResults[i].testSize);
	}
	EXPECT_TRUE(first.targetAchieved);
	EXPECT_NO_THROW(ValidationHarness::enforceTargets(first));
}

TEST(ValidationHarness, WeightFitFavoursTheAccurateMember) {
	auto data = dataset(400, {9});
	auto router = curveRouter(0.0, 0.2);
	ValidationHarness harness(router);
	auto options = sixMonthOptions();
	options.horizons = {9};
	auto result = harness.validateModel(Context::background(), options, data);
	auto w = result.recommendedWeights.forHorizon(9);
	EXPECT_GT(w.shortWeight, w.longWeight);
	ASSERT_EQ(result.comparisons.size(), 1u);
	EXPECT_LT(result.comparisons[0].shortMae, result.comparisons[0].longMae);
}

TEST(ValidationHarness, MissedTargetsProduceRankedRecommendations) {
	auto data = dataset(200, {6});
	ValidationHarness harness(curveRouter(0.25, 0.3));
	auto options = sixMonthOptions();
	options.accuracyThresholds[6] = 0.99;
	options.maxMae = 0.01;
	auto result = harness.validateModel(Context::background(), options, data);

	EXPECT_FALSE(result.targetAchieved);
	ASSERT_GE(result.recommendations.size(), 2u);
	for (size_t i = 0; i < result.recommendations.size(); i++) {
		EXPECT_EQ(result.recommendations[i].rank, (int)i + 1);
		if (i > 0) EXPECT_GE(result.recommendations[i - 1].gap, result.recommendations[i].gap);
	}
	try {
		ValidationHarness::enforceTargets(result);
		FAIL() << "expected target failure";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::ValidationTargetNotMet);
		EXPECT_EQ(e.stage(), Stage::Harness);
	}
}

TEST(ValidationHarness, EmptyHorizonSetNeverPasses) {
	ValidationHarness harness(curveRouter(0.0, 0.0));
	auto options = sixMonthOptions();
	options.horizons.clear();
	auto result = harness.validateModel(Context::background(), options, {});
	EXPECT_FALSE(result.targetAchieved);
	EXPECT_THROW(ValidationHarness::enforceTargets(result), RiskError);
}

TEST(ValidationHarness, CancelledRunStops) {
	ValidationHarness harness(curveRouter(0.0, 0.0));
	auto ctx = Context::withCancel(Context::background());
	ctx->cancel();
	EXPECT_THROW(harness.validateModel(ctx, sixMonthOptions(), dataset(50, {6})), RiskError);
}

TEST(ValidationHarness, CalibrationIsCountWeighted) {
	double ece = -1.0;
	auto buckets = ValidationHarness::calibrate({{0.9, true}, {0.8, false}, {0.5, true}, {0.6, false}}, {0.7}, ece);
	ASSERT_EQ(buckets.size(), 2u);
	EXPECT_EQ(buckets[0].label, "low");
	EXPECT_EQ(buckets[1].label, "high");
	EXPECT_EQ(buckets[0].count, 2u);
	EXPECT_NEAR(buckets[0].meanConfidence, 0.55, 1e-12);
	EXPECT_NEAR(buckets[1].meanConfidence, 0.85, 1e-12);
	EXPECT_NEAR(buckets[1].realizedAccuracy, 0.5, 1e-12);
	EXPECT_NEAR(ece, (2 * 0.05 + 2 * 0.35) / 4.0, 1e-12);

	auto none = ValidationHarness::calibrate({}, {0.7}, ece);
	EXPECT_EQ(none.size(), 2u);
	EXPECT_EQ(ece, 0.0);
}

TEST(ValidationHarness, ApplyingRecommendationsBumpsVersion) {
	auto router = curveRouter(0.0, 0.1);
	ValidationHarness harness(router);
	auto result = harness.validateModel(Context::background(), sixMonthOptions(), dataset(100, {6}));
	auto before = router->versionTag();
	harness.applyRecommendations(result);
	EXPECT_EQ(router->weights()->version, 1u);
	EXPECT_NE(router->versionTag(), before);

	std::shared_ptr<const RouterWeights> received;
	harness.setWeightsSink([&](std::shared_ptr<const RouterWeights> w) { received = w; });
	harness.applyRecommendations(result);
	ASSERT_NE(received, nullptr);
	EXPECT_EQ(received->version, 2u);
	EXPECT_EQ(router->weights()->version, 1u);
}

TEST(ValidationHarness, RunsAreAppendedToHistory) {
	auto dir = fs::temp_directory_path() / ("horizon_history_harness_" + std::to_string(::getpid()));
	fs::create_directories(dir);
	{
		auto store = std::make_shared<JsonFileStore>("validation_history", dir);
		auto history = std::make_shared<ValidationHistoryStore>(store);
		ValidationHarness harness(curveRouter(0.0, 0.0), history);
		harness.validateModel(Context::background(), sixMonthOptions(), dataset(50, {6}));
		harness.validateModel(Context::background(), sixMonthOptions(), dataset(50, {6}));
		EXPECT_EQ(history->size(), 2u);
		auto recent = history->recent(1);
		ASSERT_EQ(recent.size(), 1u);
		EXPECT_EQ(recent[0]["seq"], 2);
		EXPECT_TRUE(recent[0].contains("horizons"));
	}
	std::error_code ec;
	fs::remove_all(dir, ec);
}

TEST(ValidationScheduler, RunOnceRecordsStatus) {
	auto harness = std::make_shared<ValidationHarness>(curveRouter(0.0, 0.0));
	auto options = sixMonthOptions();
	options.applyRecommendedWeights = true;
	ValidationScheduler scheduler(harness, options, []() { return dataset(50, {6}); }, Millis(0));
	auto result = scheduler.runOnce();
	EXPECT_TRUE(result.targetAchieved);
	auto status = scheduler.status();
	EXPECT_EQ(status["runs"], 1);
	EXPECT_EQ(status["last"]["targetAchieved"], true);
	scheduler.start();
	EXPECT_FALSE(scheduler.running());
}
