#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "context.hpp"
#include "features.hpp"

namespace horizon {

using json = nlohmann::json;
namespace fs = std::filesystem;

struct ModelOutput {
	double score{0.0};
	double confidence{0.0};
};

// A loaded, versioned model. predict() throws RiskError(ModelInvocation)
// when the model is unavailable or the input is unusable, and
// Cancelled/Timeout when the context finishes first.
class ModelAdapter {
public:
	virtual ~ModelAdapter() = default;

	// Throws std::runtime_error with a kebab-case message; a failed load keeps
	// whatever model was loaded before (none at startup).
	virtual void loadModel(const ContextPtr &ctx, const fs::path &path) = 0;
	virtual ModelOutput predict(const ContextPtr &ctx, const FeatureVector &features) = 0;

	virtual bool available() const = 0;
	virtual std::string id() const = 0;
	virtual std::string version() const = 0;
	virtual json describe() const {
		return json{{"id", id()}, {"version", version()}, {"available", available()}};
	}
};

using ModelAdapterPtr = std::shared_ptr<ModelAdapter>;

json readArtifact(const fs::path &path);
double sigmoid(double z);

// Gradient-boosted tree ensemble. Margin = base_score + learning_rate * sum(leaf),
// score = sigmoid(margin). Confidence grows with how many trees push the
// margin in the same direction.
class TreeEnsembleAdapter : public ModelAdapter {
public:
	struct Node {
		int feature{-1};
		double threshold{0.0};
		int left{-1};
		int right{-1};
		double value{0.0};
		bool leaf() const { return left < 0 && right < 0; }
	};
	struct Tree {
		std::vector<Node> nodes;
	};
	struct Model {
		std::string id;
		std::string version;
		double baseScore{0.0};
		double learningRate{1.0};
		int featureCount{kFeatureCount};
		double confidenceFloor{0.5};
		double confidenceSpan{0.45};
		std::vector<Tree> trees;
	};

	explicit TreeEnsembleAdapter(std::string fallbackId = "short_tree");

	void loadModel(const ContextPtr &ctx, const fs::path &path) override;
	ModelOutput predict(const ContextPtr &ctx, const FeatureVector &features) override;
	bool available() const override;
	std::string id() const override;
	std::string version() const override;

	static Model parseModel(const json &artifact);

private:
	static double evalTree(const Tree &tree, const FeatureVector &x);

	std::string fallbackId_;
	std::shared_ptr<const Model> model_;
};

// Elman recurrent network unrolled once per month of the horizon:
// h_t = tanh(Wx x_t + Wh h_{t-1} + b), score = sigmoid(wo . h_T + bo).
class SequenceModelAdapter : public ModelAdapter {
public:
	struct Dense {
		int rows{0};
		int cols{0};
		std::vector<double> w;
		std::vector<double> forward(const std::vector<double> &x) const;
	};
	struct Model {
		std::string id;
		std::string version;
		int inputSize{kFeatureCount};
		int hiddenSize{0};
		Dense wx;
		Dense wh;
		std::vector<double> b;
		std::vector<double> wo;
		double bo{0.0};
		double confidenceBase{0.85};
		double confidenceDecay{0.01};
		int peakHorizon{12};
		int maxSteps{24};
	};

	explicit SequenceModelAdapter(std::string fallbackId = "long_sequence");

	void loadModel(const ContextPtr &ctx, const fs::path &path) override;
	ModelOutput predict(const ContextPtr &ctx, const FeatureVector &features) override;
	bool available() const override;
	std::string id() const override;
	std::string version() const override;

	static Model parseModel(const json &artifact);

private:
	std::string fallbackId_;
	std::shared_ptr<const Model> model_;
};

} // namespace horizon
