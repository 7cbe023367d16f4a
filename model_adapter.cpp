#include "model_adapter.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

namespace horizon {

namespace {

double clamp01(double v) {
	if (!std::isfinite(v)) return 0.0;
	return std::clamp(v, 0.0, 1.0);
}

std::vector<double> numberArray(const json &j, const std::string &what) {
	if (!j.is_array()) throw std::runtime_error("model-artifact-invalid:" + what);
	std::vector<double> out;
	out.reserve(j.size());
	for (auto &v : j) {
		if (!v.is_number()) throw std::runtime_error("model-artifact-invalid:" + what);
		out.push_back(v.get<double>());
	}
	return out;
}

SequenceModelAdapter::Dense denseFrom(const json &j, int rows, int cols, const std::string &what) {
	if (!j.is_array() || (int)j.size() != rows) throw std::runtime_error("model-artifact-shape:" + what);
	SequenceModelAdapter::Dense d;
	d.rows = rows;
	d.cols = cols;
	d.w.reserve((size_t)rows * (size_t)cols);
	for (auto &row : j) {
		auto values = numberArray(row, what);
		if ((int)values.size() != cols) throw std::runtime_error("model-artifact-shape:" + what);
		d.w.insert(d.w.end(), values.begin(), values.end());
	}
	return d;
}

void checkFeatures(const FeatureVector &features, int expected, const std::string &id) {
	if ((int)features.size() != expected) {
		throw RiskError(ErrorCode::ModelInvocation, Stage::Model,
						"feature-size-mismatch:" + id + ":" + std::to_string(features.size()));
	}
	for (double v : features) {
		if (!std::isfinite(v)) throw RiskError(ErrorCode::ModelInvocation, Stage::Model, "non-finite-feature:" + id);
	}
}

} // namespace

json readArtifact(const fs::path &path) {
	if (!fs::exists(path)) throw std::runtime_error("model-artifact-missing:" + path.string());
	std::ifstream in(path);
	if (!in) throw std::runtime_error("model-artifact-unreadable:" + path.string());
	try {
		json j;
		in >> j;
		return j;
	} catch (const json::exception &e) {
		throw std::runtime_error("model-artifact-parse:" + path.string() + ":" + e.what());
	}
}

double sigmoid(double z) {
	return 1.0 / (1.0 + std::exp(-z));
}

// ------------------ Tree ensemble ------------------

TreeEnsembleAdapter::TreeEnsembleAdapter(std::string fallbackId) : fallbackId_(std::move(fallbackId)) {}

TreeEnsembleAdapter::Model TreeEnsembleAdapter::parseModel(const json &artifact) {
	if (!artifact.is_object()) throw std::runtime_error("model-artifact-invalid:root");
	Model m;
	try {
		m.id = artifact.value("id", std::string("short_tree"));
		m.version = artifact.value("version", std::string("0"));
		m.baseScore = artifact.value("base_score", 0.0);
		m.learningRate = artifact.value("learning_rate", 1.0);
		m.featureCount = artifact.value("feature_count", (int)kFeatureCount);
		m.confidenceFloor = clamp01(artifact.value("confidence_floor", 0.5));
		m.confidenceSpan = clamp01(artifact.value("confidence_span", 0.45));
	} catch (const json::exception &e) {
		throw std::runtime_error(std::string("model-artifact-invalid:header:") + e.what());
	}
	if (!artifact.contains("trees") || !artifact["trees"].is_array() || artifact["trees"].empty()) {
		throw std::runtime_error("model-artifact-invalid:trees");
	}
	for (auto &t : artifact["trees"]) {
		if (!t.contains("nodes") || !t["nodes"].is_array() || t["nodes"].empty()) {
			throw std::runtime_error("model-artifact-invalid:nodes");
		}
		Tree tree;
		const int count = (int)t["nodes"].size();
		for (int i = 0; i < count; i++) {
			const auto &n = t["nodes"][i];
			Node node;
			if (n.contains("leaf")) {
				if (!n["leaf"].is_number()) throw std::runtime_error("model-artifact-invalid:leaf");
				node.value = n["leaf"].get<double>();
			} else {
				node.feature = n.value("feature", -1);
				node.threshold = n.value("threshold", 0.0);
				node.left = n.value("left", -1);
				node.right = n.value("right", -1);
				// children must point forward so traversal always terminates
				if (node.feature < 0 || node.feature >= m.featureCount || node.left <= i || node.right <= i ||
					node.left >= count || node.right >= count) {
					throw std::runtime_error("model-artifact-invalid:split:" + std::to_string(i));
				}
			}
			tree.nodes.push_back(node);
		}
		m.trees.push_back(std::move(tree));
	}
	return m;
}

void TreeEnsembleAdapter::loadModel(const ContextPtr &ctx, const fs::path &path) {
	if (ctx) ctx->check(Stage::Model);
	auto parsed = std::make_shared<const Model>(parseModel(readArtifact(path)));
	std::atomic_store(&model_, parsed);
	std::cout << "[ModelAdapter] loaded " << parsed->id << "@" << parsed->version << " (" << parsed->trees.size()
			  << " trees) from " << path.string() << std::endl;
}

double TreeEnsembleAdapter::evalTree(const Tree &tree, const FeatureVector &x) {
	int i = 0;
	while (!tree.nodes[(size_t)i].leaf()) {
		const auto &n = tree.nodes[(size_t)i];
		i = (x[(size_t)n.feature] <= n.threshold) ? n.left : n.right;
	}
	return tree.nodes[(size_t)i].value;
}

ModelOutput TreeEnsembleAdapter::predict(const ContextPtr &ctx, const FeatureVector &features) {
	if (ctx) ctx->check(Stage::Model);
	auto m = std::atomic_load(&model_);
	if (!m) throw RiskError(ErrorCode::ModelInvocation, Stage::Model, "model-unavailable:" + fallbackId_);
	checkFeatures(features, m->featureCount, m->id);

	double sum = 0.0;
	int positive = 0;
	int negative = 0;
	for (auto &t : m->trees) {
		double leaf = evalTree(t, features);
		sum += leaf;
		if (leaf > 0) positive++;
		else if (leaf < 0) negative++;
	}
	double margin = m->baseScore + m->learningRate * sum;
	int total = std::max(1, positive + negative);
	double agree = (double)(margin >= 0 ? positive : negative) / total;

	ModelOutput out;
	out.score = clamp01(sigmoid(margin));
	out.confidence = clamp01(m->confidenceFloor + m->confidenceSpan * agree);
	return out;
}

bool TreeEnsembleAdapter::available() const {
	return std::atomic_load(&model_) != nullptr;
}

std::string TreeEnsembleAdapter::id() const {
	auto m = std::atomic_load(&model_);
	return m ? m->id : fallbackId_;
}

std::string TreeEnsembleAdapter::version() const {
	auto m = std::atomic_load(&model_);
	return m ? m->version : "none";
}

// ------------------ Sequence model ------------------

std::vector<double> SequenceModelAdapter::Dense::forward(const std::vector<double> &x) const {
	std::vector<double> out((size_t)rows, 0.0);
	for (int r = 0; r < rows; r++) {
		double acc = 0.0;
		for (int c = 0; c < cols; c++) acc += w[(size_t)r * (size_t)cols + (size_t)c] * x[(size_t)c];
		out[(size_t)r] = acc;
	}
	return out;
}

SequenceModelAdapter::SequenceModelAdapter(std::string fallbackId) : fallbackId_(std::move(fallbackId)) {}

SequenceModelAdapter::Model SequenceModelAdapter::parseModel(const json &artifact) {
	if (!artifact.is_object()) throw std::runtime_error("model-artifact-invalid:root");
	Model m;
	try {
		m.id = artifact.value("id", std::string("long_sequence"));
		m.version = artifact.value("version", std::string("0"));
		m.inputSize = artifact.value("input_size", (int)kFeatureCount);
		m.hiddenSize = artifact.value("hidden_size", 0);
		m.bo = artifact.value("bo", 0.0);
		m.confidenceBase = clamp01(artifact.value("confidence_base", 0.85));
		m.confidenceDecay = std::max(0.0, artifact.value("confidence_decay", 0.01));
		m.peakHorizon = std::max(1, artifact.value("peak_horizon", 12));
		m.maxSteps = std::max(1, artifact.value("max_steps", 24));
	} catch (const json::exception &e) {
		throw std::runtime_error(std::string("model-artifact-invalid:header:") + e.what());
	}
	if (m.inputSize <= 0 || m.hiddenSize <= 0) throw std::runtime_error("model-artifact-shape:sizes");
	m.wx = denseFrom(artifact.value("wx", json()), m.hiddenSize, m.inputSize, "wx");
	m.wh = denseFrom(artifact.value("wh", json()), m.hiddenSize, m.hiddenSize, "wh");
	m.b = numberArray(artifact.value("b", json()), "b");
	m.wo = numberArray(artifact.value("wo", json()), "wo");
	if ((int)m.b.size() != m.hiddenSize || (int)m.wo.size() != m.hiddenSize) {
		throw std::runtime_error("model-artifact-shape:bias");
	}
	return m;
}

void SequenceModelAdapter::loadModel(const ContextPtr &ctx, const fs::path &path) {
	if (ctx) ctx->check(Stage::Model);
	auto parsed = std::make_shared<const Model>(parseModel(readArtifact(path)));
	std::atomic_store(&model_, parsed);
	std::cout << "[ModelAdapter] loaded " << parsed->id << "@" << parsed->version << " (hidden=" << parsed->hiddenSize
			  << ") from " << path.string() << std::endl;
}

ModelOutput SequenceModelAdapter::predict(const ContextPtr &ctx, const FeatureVector &features) {
	if (ctx) ctx->check(Stage::Model);
	auto m = std::atomic_load(&model_);
	if (!m) throw RiskError(ErrorCode::ModelInvocation, Stage::Model, "model-unavailable:" + fallbackId_);
	checkFeatures(features, m->inputSize, m->id);

	int steps = m->inputSize > kHorizon ? (int)std::lround(features[kHorizon] * 24.0) : m->peakHorizon;
	steps = std::clamp(steps, 1, m->maxSteps);

	std::vector<double> h((size_t)m->hiddenSize, 0.0);
	std::vector<double> x = features;
	for (int t = 1; t <= steps; t++) {
		if (ctx && (t % 8) == 0) ctx->check(Stage::Model);
		if (m->inputSize > kHorizon) x[kHorizon] = t / 24.0;
		auto a = m->wx.forward(x);
		auto r = m->wh.forward(h);
		for (int i = 0; i < m->hiddenSize; i++) {
			h[(size_t)i] = std::tanh(a[(size_t)i] + r[(size_t)i] + m->b[(size_t)i]);
		}
	}
	double z = m->bo;
	for (int i = 0; i < m->hiddenSize; i++) z += m->wo[(size_t)i] * h[(size_t)i];

	ModelOutput out;
	out.score = clamp01(sigmoid(z));
	out.confidence = clamp01(m->confidenceBase - m->confidenceDecay * std::abs(steps - m->peakHorizon));
	return out;
}

bool SequenceModelAdapter::available() const {
	return std::atomic_load(&model_) != nullptr;
}

std::string SequenceModelAdapter::id() const {
	auto m = std::atomic_load(&model_);
	return m ? m->id : fallbackId_;
}

std::string SequenceModelAdapter::version() const {
	auto m = std::atomic_load(&model_);
	return m ? m->version : "none";
}

} // namespace horizon
