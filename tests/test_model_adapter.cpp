#include <cmath>
#include <fstream>

#include <unistd.h>

#include <gtest/gtest.h>

#include "config.hpp"
#include "features.hpp"
#include "model_adapter.hpp"

using namespace horizon;

namespace {

class ModelAdapterTest : public ::testing::Test {
protected:
	void SetUp() override {
		dir_ = fs::temp_directory_path() / ("horizon_model_" + std::to_string(::getpid()) + "_" +
											::testing::UnitTest::GetInstance()->current_test_info()->name());
		fs::create_directories(dir_);
	}
	void TearDown() override {
		std::error_code ec;
		fs::remove_all(dir_, ec);
	}

	fs::path write(const std::string &name, const json &j) {
		auto p = dir_ / name;
		std::ofstream out(p);
		out << j.dump(2);
		return p;
	}

	static json treeArtifact(const std::string &version) {
		return json{
			{"id", "tree"},
			{"version", version},
			{"base_score", 0.0},
			{"learning_rate", 1.0},
			{"feature_count", (int)kFeatureCount},
			{"confidence_floor", 0.5},
			{"confidence_span", 0.4},
			{"trees", json::array({
				json{{"nodes", json::array({
					json{{"feature", (int)kIndustryRisk}, {"threshold", 0.5}, {"left", 1}, {"right", 2}},
					json{{"leaf", -1.0}},
					json{{"leaf", 1.0}}
				})}},
				json{{"nodes", json::array({json{{"leaf", 0.5}}})}}
			})}
		};
	}

	fs::path dir_;
};

FeatureVector features(double industry, int horizon) {
	FeatureVector f((size_t)kFeatureCount, 0.0);
	f[kIndustryRisk] = industry;
	f[kHorizon] = horizon / 24.0;
	return f;
}

} // namespace

TEST_F(ModelAdapterTest, TreeEnsembleScoresThroughSigmoid) {
	TreeEnsembleAdapter tree;
	EXPECT_FALSE(tree.available());
	tree.loadModel(Context::background(), write("tree.json", treeArtifact("7")));
	ASSERT_TRUE(tree.available());
	EXPECT_EQ(tree.id(), "tree");
	EXPECT_EQ(tree.version(), "7");

	auto low = tree.predict(Context::background(), features(0.2, 3));
	EXPECT_NEAR(low.score, sigmoid(-0.5), 1e-12);
	// one tree votes each way
	EXPECT_NEAR(low.confidence, 0.5 + 0.4 * 0.5, 1e-12);

	auto high = tree.predict(Context::background(), features(0.9, 3));
	EXPECT_NEAR(high.score, sigmoid(1.5), 1e-12);
	EXPECT_NEAR(high.confidence, 0.9, 1e-12);
}

TEST_F(ModelAdapterTest, FailedReloadKeepsPreviousModel) {
	TreeEnsembleAdapter tree;
	tree.loadModel(Context::background(), write("tree.json", treeArtifact("1")));

	auto broken = treeArtifact("2");
	broken["trees"][0]["nodes"][0]["left"] = 0;
	EXPECT_THROW(tree.loadModel(Context::background(), write("broken.json", broken)), std::runtime_error);
	EXPECT_THROW(tree.loadModel(Context::background(), dir_ / "missing.json"), std::runtime_error);
	EXPECT_EQ(tree.version(), "1");
	EXPECT_TRUE(tree.available());
}

TEST_F(ModelAdapterTest, UnloadedAdapterRaisesModelInvocation) {
	SequenceModelAdapter seq;
	try {
		seq.predict(Context::background(), features(0.5, 6));
		FAIL() << "expected failure";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::ModelInvocation);
		EXPECT_TRUE(e.countsAsBreakerFailure());
	}
}

TEST_F(ModelAdapterTest, RejectsWrongFeatureWidth) {
	TreeEnsembleAdapter tree;
	tree.loadModel(Context::background(), write("tree.json", treeArtifact("1")));
	EXPECT_THROW(tree.predict(Context::background(), FeatureVector(3, 0.0)), RiskError);
	auto f = features(0.5, 3);
	f[kRevenue] = std::nan("");
	EXPECT_THROW(tree.predict(Context::background(), f), RiskError);
}

TEST_F(ModelAdapterTest, SequenceConfidencePeaksAtConfiguredHorizon) {
	std::vector<std::vector<double>> wx(2, std::vector<double>((size_t)kFeatureCount, 0.1));
	json artifact{
		{"id", "seq"},
		{"version", "3"},
		{"input_size", (int)kFeatureCount},
		{"hidden_size", 2},
		{"wx", wx},
		{"wh", {{0.1, 0.0}, {0.0, 0.1}}},
		{"b", {0.0, 0.0}},
		{"wo", {1.0, -0.5}},
		{"bo", 0.0},
		{"confidence_base", 0.9},
		{"confidence_decay", 0.02},
		{"peak_horizon", 12}
	};
	SequenceModelAdapter seq;
	seq.loadModel(Context::background(), write("seq.json", artifact));

	auto at12 = seq.predict(Context::background(), features(0.5, 12));
	auto at3 = seq.predict(Context::background(), features(0.5, 3));
	EXPECT_NEAR(at12.confidence, 0.9, 1e-12);
	EXPECT_NEAR(at3.confidence, 0.9 - 0.02 * 9, 1e-12);
	EXPECT_GE(at12.score, 0.0);
	EXPECT_LE(at12.score, 1.0);
	EXPECT_NE(at12.score, at3.score);
}

TEST_F(ModelAdapterTest, SequenceRejectsShapeMismatch) {
	json artifact{{"input_size", (int)kFeatureCount}, {"hidden_size", 2}, {"wx", {{0.1}}}, {"wh", {{0.1, 0.0}, {0.0, 0.1}}},
				  {"b", {0.0, 0.0}}, {"wo", {1.0, 1.0}}};
	SequenceModelAdapter seq;
	EXPECT_THROW(seq.loadModel(Context::background(), write("bad.json", artifact)), std::runtime_error);
	EXPECT_FALSE(seq.available());
}

TEST_F(ModelAdapterTest, CancelledContextStopsPrediction) {
	TreeEnsembleAdapter tree;
	tree.loadModel(Context::background(), write("tree.json", treeArtifact("1")));
	auto ctx = Context::withCancel(Context::background());
	ctx->cancel();
	try {
		tree.predict(ctx, features(0.5, 3));
		FAIL() << "expected cancellation";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::Cancelled);
	}
}

TEST(ShippedModels, BothArtifactsLoadAndScoreEverySupportedHorizon) {
	const fs::path models = fs::path(HORIZON_SOURCE_DIR) / "models";
	TreeEnsembleAdapter tree;
	SequenceModelAdapter seq;
	ASSERT_NO_THROW(tree.loadModel(Context::background(), models / "short_tree.json"));
	ASSERT_NO_THROW(seq.loadModel(Context::background(), models / "long_sequence.json"));
	ASSERT_TRUE(tree.available());
	ASSERT_TRUE(seq.available());

	RiskAssessmentRequest request;
	request.businessName = "Harbor Freight Logistics";
	request.businessAddress = "200 Dock Road";
	request.industry = "transportation";
	request.country = "BR";
	request.metadata = json{{"years_in_business", 3}, {"prior_incidents", 2}};
	request = normalizeRequest(request);

	for (int horizon : RouterOptions{}.supportedHorizons) {
		auto features = extractFeatures(request, horizon);
		for (ModelAdapter *model : {(ModelAdapter *)&tree, (ModelAdapter *)&seq}) {
			auto out = model->predict(Context::background(), features);
			EXPECT_TRUE(std::isfinite(out.score)) << model->id() << " h=" << horizon;
			EXPECT_GE(out.score, 0.0) << model->id() << " h=" << horizon;
			EXPECT_LE(out.score, 1.0) << model->id() << " h=" << horizon;
			EXPECT_GE(out.confidence, 0.0) << model->id() << " h=" << horizon;
			EXPECT_LE(out.confidence, 1.0) << model->id() << " h=" << horizon;
		}
	}
}
