#include "validation_harness.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <numeric>
#include <optional>
#include <random>
#include <sstream>

namespace horizon {

namespace {

int64_t wallMs() {
	return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
			   std::chrono::system_clock::now().time_since_epoch())
		.count();
}

struct Scored {
	double actual{0.0};
	std::optional<ModelPrediction> shortPrediction;
	std::optional<ModelPrediction> longPrediction;
};

struct Served {
	double score{0.0};
	double confidence{0.0};
};

std::optional<Served> serve(PredictorPlan plan, const Scored &s, double shortWeight, const RouterOptions &options) {
	const auto penalized = [&](const ModelPrediction &p) {
		return Served{p.score, p.confidence * (1.0 - options.fallbackConfidencePenalty)};
	};
	switch (plan) {
	case PredictorPlan::ShortOnly:
		if (s.shortPrediction) return Served{s.shortPrediction->score, s.shortPrediction->confidence};
		return std::nullopt;
	case PredictorPlan::LongOnly:
		if (s.longPrediction) return Served{s.longPrediction->score, s.longPrediction->confidence};
		if (s.shortPrediction) return penalized(*s.shortPrediction);
		return std::nullopt;
	case PredictorPlan::Blend:
		if (s.shortPrediction && s.longPrediction) {
			auto b = EnsembleRouter::blend(*s.shortPrediction, shortWeight, *s.longPrediction, 1.0 - shortWeight, options);
			return Served{b.score, b.confidence};
		}
		if (s.shortPrediction) return penalized(*s.shortPrediction);
		if (s.longPrediction) return penalized(*s.longPrediction);
		return std::nullopt;
	}
	return std::nullopt;
}

double blendMae(const std::vector<const Scored *> &rows, double shortWeight, const RouterOptions &options) {
	double sum = 0.0;
	std::size_t n = 0;
	for (auto *r : rows) {
		if (!r->shortPrediction || !r->longPrediction) continue;
		auto b = EnsembleRouter::blend(*r->shortPrediction, shortWeight, *r->longPrediction, 1.0 - shortWeight, options);
		sum += std::abs(b.score - r->actual);
		n++;
	}
	return n ? sum / n : 0.0;
}

// Grid search over the short-model weight; ties go to the weight nearest 0.5.
double fitShortWeight(const std::vector<const Scored *> &train, double step, const RouterOptions &options, double &bestMae) {
	step = std::clamp(step, 0.01, 0.5);
	const int steps = (int)std::lround(1.0 / step);
	double best = 0.5;
	bestMae = blendMae(train, best, options);
	for (int i = 0; i <= steps; i++) {
		double w = std::min(1.0, i * step);
		double mae = blendMae(train, w, options);
		if (mae < bestMae - 1e-12 || (std::abs(mae - bestMae) <= 1e-12 && std::abs(w - 0.5) < std::abs(best - 0.5))) {
			best = w;
			bestMae = mae;
		}
	}
	return best;
}

struct Accumulator {
	std::size_t n{0};
	std::size_t correct{0};
	double absErr{0.0};
	double sqErr{0.0};

	void add(double predicted, double actual) {
		n++;
		if (levelForScore(predicted) == levelForScore(actual)) correct++;
		absErr += std::abs(predicted - actual);
		sqErr += (predicted - actual) * (predicted - actual);
	}
	double accuracy() const { return n ? (double)correct / n : 0.0; }
	double mae() const { return n ? absErr / n : 0.0; }
	double rmse() const { return n ? std::sqrt(sqErr / n) : 0.0; }
};

std::string fmt(double v) {
	std::ostringstream oss;
	oss.precision(3);
	oss << std::fixed << v;
	return oss.str();
}

} // namespace

json HorizonMetrics::toJson() const {
	return json{{"horizon", horizon}, {"samples", samples}, {"failedPredictions", failedPredictions}, {"accuracy", accuracy},
				{"mae", mae}, {"rmse", rmse}, {"r2", r2}, {"plan", plan}};
}

json CalibrationBucket::toJson() const {
	return json{{"label", label}, {"lower", lower}, {"upper", upper}, {"count", count},
				{"meanConfidence", meanConfidence}, {"realizedAccuracy", realizedAccuracy}};
}

json FoldResult::toJson() const {
	return json{{"horizon", horizon}, {"fold", fold}, {"trainSize", trainSize}, {"testSize", testSize},
				{"shortWeight", shortWeight}, {"trainMae", trainMae}, {"accuracy", accuracy}, {"mae", mae}};
}

json ModelComparisonReport::toJson() const {
	return json{{"horizon", horizon},
				{"short", json{{"accuracy", shortAccuracy}, {"mae", shortMae}}},
				{"long", json{{"accuracy", longAccuracy}, {"mae", longMae}}},
				{"ensemble", json{{"accuracy", ensembleAccuracy}, {"mae", ensembleMae}}},
				{"outperformsShort", outperformsShort},
				{"outperformsLong", outperformsLong},
				{"accuracyGain", accuracyGain}};
}

json Recommendation::toJson() const {
	return json{{"rank", rank}, {"metric", metric}, {"horizon", horizon}, {"observed", observed},
				{"target", target}, {"gap", gap}, {"action", action}};
}

json ValidationResult::toJson() const {
	json hs = json::object();
	for (auto &kv : horizons) hs[std::to_string(kv.first)] = kv.second.toJson();
	json buckets = json::array();
	for (auto &b : calibration) buckets.push_back(b.toJson());
	json folds_ = json::array();
	for (auto &f : foldResults) folds_.push_back(f.toJson());
	json cmp = json::array();
	for (auto &c : comparisons) cmp.push_back(c.toJson());
	json recs = json::array();
	for (auto &r : recommendations) recs.push_back(r.toJson());
	return json{
		{"startedAtMs", startedAtMs},
		{"durationMs", durationMs},
		{"modelVersion", modelVersion},
		{"folds", folds},
		{"seed", seed},
		{"horizons", hs},
		{"calibration", buckets},
		{"calibrationError", calibrationError},
		{"foldResults", folds_},
		{"comparisons", cmp},
		{"recommendedWeights", recommendedWeights.toJson()},
		{"recommendations", recs},
		{"targetAchieved", targetAchieved}
	};
}

ValidationHarness::ValidationHarness(std::shared_ptr<EnsembleRouter> router, std::shared_ptr<ValidationHistoryStore> history,
									 MetricsPtr metrics)
	: router_(std::move(router)), history_(std::move(history)), metrics_(std::move(metrics)) {
	if (!router_) throw std::runtime_error("validation-requires-router");
}

std::vector<CalibrationBucket> ValidationHarness::calibrate(const std::vector<std::pair<double, bool>> &confidenceHits,
															const std::vector<double> &boundaries, double &calibrationError) {
	std::vector<double> edges{0.0};
	for (double b : boundaries) {
		if (b > edges.back() && b < 1.0) edges.push_back(b);
	}
	edges.push_back(1.0);

	std::vector<CalibrationBucket> buckets;
	for (size_t i = 0; i + 1 < edges.size(); i++) {
		CalibrationBucket b;
		b.lower = edges[i];
		b.upper = edges[i + 1];
		if (edges.size() == 3) b.label = i == 0 ? "low" : "high";
		else b.label = "b" + std::to_string(i);
		buckets.push_back(b);
	}
	std::vector<double> confSum(buckets.size(), 0.0);
	std::vector<std::size_t> hits(buckets.size(), 0);
	for (auto &ch : confidenceHits) {
		size_t idx = buckets.size() - 1;
		for (size_t i = 0; i < buckets.size(); i++) {
			if (ch.first < buckets[i].upper) {
				idx = i;
				break;
			}
		}
		buckets[idx].count++;
		confSum[idx] += ch.first;
		if (ch.second) hits[idx]++;
	}
	double weighted = 0.0;
	std::size_t total = 0;
	for (size_t i = 0; i < buckets.size(); i++) {
		auto &b = buckets[i];
		if (b.count == 0) continue;
		b.meanConfidence = confSum[i] / b.count;
		b.realizedAccuracy = (double)hits[i] / b.count;
		weighted += b.count * std::abs(b.meanConfidence - b.realizedAccuracy);
		total += b.count;
	}
	calibrationError = total ? weighted / total : 0.0;
	return buckets;
}

ValidationResult ValidationHarness::validateModel(const ContextPtr &ctx, const ValidationOptions &options,
												  const std::vector<LabeledSample> &dataset) {
	auto started = std::chrono::steady_clock::now();
	ValidationResult result;
	result.startedAtMs = wallMs();
	result.modelVersion = router_->versionTag();
	result.folds = std::max(2, options.folds);
	result.seed = options.randomSeed;
	result.recommendedWeights.version = router_->weights()->version + 1;
	const auto &routerOptions = router_->options();

	std::vector<std::pair<double, bool>> confidenceHits;

	for (int h : options.horizons) {
		if (ctx) ctx->check(Stage::Harness);
		std::vector<Scored> rows;
		HorizonMetrics hm;
		hm.horizon = h;
		const auto plan = router_->planFor(ModelType::Auto, h);
		hm.plan = planName(plan);

		std::size_t seen = 0;
		for (auto &sample : filterHorizon(dataset, h)) {
			if (ctx && (++seen % 64) == 0) ctx->check(Stage::Harness);
			auto members = router_->memberPredictions(ctx, sample.request, h);
			Scored s;
			s.actual = sample.actualScore;
			s.shortPrediction = members.shortPrediction;
			s.longPrediction = members.longPrediction;
			rows.push_back(std::move(s));
		}
		hm.samples = rows.size();

		// deterministic shuffle, then round-robin fold assignment
		std::vector<size_t> order(rows.size());
		std::iota(order.begin(), order.end(), 0);
		std::mt19937 rng(options.randomSeed + (uint32_t)h);
		std::shuffle(order.begin(), order.end(), rng);

		Accumulator served;
		Accumulator ensemble;
		double weightSum = 0.0;
		int weightFolds = 0;
		double actualSum = 0.0;
		std::vector<double> actuals;
		std::vector<double> predictions;

		const int k = std::min<int>(result.folds, std::max<int>(1, (int)rows.size()));
		for (int fold = 0; fold < k && rows.size() >= 2; fold++) {
			std::vector<const Scored *> train;
			std::vector<const Scored *> test;
			for (size_t pos = 0; pos < order.size(); pos++) {
				((int)(pos % (size_t)k) == fold ? test : train).push_back(&rows[order[pos]]);
			}
			FoldResult fr;
			fr.horizon = h;
			fr.fold = fold;
			fr.trainSize = train.size();
			fr.testSize = test.size();
			fr.shortWeight = fitShortWeight(train, options.weightGridStep, routerOptions, fr.trainMae);
			weightSum += fr.shortWeight;
			weightFolds++;

			Accumulator foldAcc;
			for (auto *row : test) {
				auto p = serve(plan, *row, fr.shortWeight, routerOptions);
				if (!p) {
					hm.failedPredictions++;
					continue;
				}
				foldAcc.add(p->score, row->actual);
				served.add(p->score, row->actual);
				actuals.push_back(row->actual);
				predictions.push_back(p->score);
				actualSum += row->actual;
				confidenceHits.push_back({p->confidence, levelForScore(p->score) == levelForScore(row->actual)});
				if (row->shortPrediction && row->longPrediction) {
					auto b = EnsembleRouter::blend(*row->shortPrediction, fr.shortWeight, *row->longPrediction,
												   1.0 - fr.shortWeight, routerOptions);
					ensemble.add(b.score, row->actual);
				}
			}
			fr.accuracy = foldAcc.accuracy();
			fr.mae = foldAcc.mae();
			result.foldResults.push_back(fr);
		}

		hm.accuracy = served.accuracy();
		hm.mae = served.mae();
		hm.rmse = served.rmse();
		if (!actuals.empty()) {
			double mean = actualSum / actuals.size();
			double ssRes = 0.0;
			double ssTot = 0.0;
			for (size_t i = 0; i < actuals.size(); i++) {
				ssRes += (actuals[i] - predictions[i]) * (actuals[i] - predictions[i]);
				ssTot += (actuals[i] - mean) * (actuals[i] - mean);
			}
			hm.r2 = ssTot > 0 ? 1.0 - ssRes / ssTot : (ssRes == 0 ? 1.0 : 0.0);
		}
		result.horizons[h] = hm;

		HorizonWeights hw;
		hw.shortWeight = weightFolds ? weightSum / weightFolds : 0.5;
		hw.longWeight = 1.0 - hw.shortWeight;
		result.recommendedWeights.perHorizon[h] = hw;

		ModelComparisonReport cmp;
		cmp.horizon = h;
		Accumulator shortAcc;
		Accumulator longAcc;
		for (auto &row : rows) {
			if (row.shortPrediction) shortAcc.add(row.shortPrediction->score, row.actual);
			if (row.longPrediction) longAcc.add(row.longPrediction->score, row.actual);
		}
		cmp.shortAccuracy = shortAcc.accuracy();
		cmp.shortMae = shortAcc.mae();
		cmp.longAccuracy = longAcc.accuracy();
		cmp.longMae = longAcc.mae();
		cmp.ensembleAccuracy = ensemble.accuracy();
		cmp.ensembleMae = ensemble.mae();
		cmp.outperformsShort = ensemble.n > 0 && cmp.ensembleAccuracy > cmp.shortAccuracy;
		cmp.outperformsLong = ensemble.n > 0 && cmp.ensembleAccuracy > cmp.longAccuracy;
		cmp.accuracyGain = cmp.ensembleAccuracy - std::max(cmp.shortAccuracy, cmp.longAccuracy);
		result.comparisons.push_back(cmp);
	}

	result.calibration = calibrate(confidenceHits, options.calibrationBoundaries, result.calibrationError);

	std::vector<Recommendation> recs;
	for (auto &kv : result.horizons) {
		const auto &hm = kv.second;
		double target = options.thresholdFor(kv.first);
		if (hm.samples == 0) {
			recs.push_back(Recommendation{0, "samples", kv.first, 0.0, 1.0, 1.0,
										  "no labeled samples for horizon " + std::to_string(kv.first) + "; extend the dataset"});
			continue;
		}
		if (hm.accuracy < target) {
			const ModelComparisonReport *cmp = nullptr;
			for (auto &c : result.comparisons) {
				if (c.horizon == kv.first) cmp = &c;
			}
			std::string best = "ensemble";
			if (cmp && cmp->accuracyGain < 0) best = cmp->shortAccuracy >= cmp->longAccuracy ? "short" : "long";
			recs.push_back(Recommendation{0, "accuracy", kv.first, hm.accuracy, target, target - hm.accuracy,
										  "horizon " + std::to_string(kv.first) + " accuracy " + fmt(hm.accuracy) + " below " +
											  fmt(target) + "; retrain or route to the " + best + " model"});
		}
		if (options.maxMae > 0 && hm.mae > options.maxMae) {
			recs.push_back(Recommendation{0, "mae", kv.first, hm.mae, options.maxMae, hm.mae - options.maxMae,
										  "horizon " + std::to_string(kv.first) + " mae " + fmt(hm.mae) + " above " +
											  fmt(options.maxMae) + "; apply recommended blend weights"});
		}
	}
	if (options.maxCalibrationError > 0 && result.calibrationError > options.maxCalibrationError) {
		std::string worst;
		double worstGap = -1.0;
		for (auto &b : result.calibration) {
			double gap = std::abs(b.meanConfidence - b.realizedAccuracy);
			if (b.count > 0 && gap > worstGap) {
				worstGap = gap;
				worst = b.label + (b.meanConfidence > b.realizedAccuracy ? " (over-confident)" : " (under-confident)");
			}
		}
		recs.push_back(Recommendation{0, "calibration_error", 0, result.calibrationError, options.maxCalibrationError,
									  result.calibrationError - options.maxCalibrationError,
									  "recalibrate confidence; worst bucket " + worst});
	}
	std::stable_sort(recs.begin(), recs.end(), [](const Recommendation &a, const Recommendation &b) { return a.gap > b.gap; });
	for (size_t i = 0; i < recs.size(); i++) recs[i].rank = (int)i + 1;
	result.recommendations = std::move(recs);
	result.targetAchieved = result.recommendations.empty() && !result.horizons.empty();
	result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

	std::cout << "[ValidationHarness] " << (result.targetAchieved ? "pass" : "fail") << " horizons=" << result.horizons.size()
			  << " ece=" << fmt(result.calibrationError) << " recommendations=" << result.recommendations.size()
			  << " in " << result.durationMs << "ms" << std::endl;
	if (metrics_) {
		metrics_->increment("horizon_validation_runs_total", {{"result", result.targetAchieved ? "pass" : "fail"}});
		for (auto &kv : result.horizons) {
			metrics_->gauge("horizon_validation_accuracy", {{"horizon", std::to_string(kv.first)}}, kv.second.accuracy);
		}
		metrics_->gauge("horizon_validation_calibration_error", {}, result.calibrationError);
	}
	if (history_) {
		try {
			history_->append(result.toJson());
		} catch (const std::exception &e) {
			std::cerr << "[ValidationHarness] history append failed: " << e.what() << std::endl;
		}
	}
	return result;
}

void ValidationHarness::enforceTargets(const ValidationResult &result) {
	if (result.targetAchieved) return;
	std::string detail = "no-horizons-validated";
	if (!result.recommendations.empty()) {
		const auto &top = result.recommendations.front();
		detail = top.metric + (top.horizon ? "@" + std::to_string(top.horizon) : std::string()) + " observed=" +
			fmt(top.observed) + " target=" + fmt(top.target) + " (" + std::to_string(result.recommendations.size()) +
			" failing)";
	}
	throw RiskError(ErrorCode::ValidationTargetNotMet, Stage::Harness, detail);
}

void ValidationHarness::applyRecommendations(const ValidationResult &result) {
	auto weights = std::make_shared<RouterWeights>(result.recommendedWeights);
	weights->version = std::max(weights->version, router_->weights()->version + 1);
	std::shared_ptr<const RouterWeights> published = weights;
	if (sink_) sink_(published);
	else router_->applyWeights(published);
}

ValidationScheduler::ValidationScheduler(std::shared_ptr<ValidationHarness> harness, ValidationOptions options,
										 DatasetProvider provider, Millis interval)
	: harness_(std::move(harness)), options_(std::move(options)), provider_(std::move(provider)), interval_(interval) {}

ValidationScheduler::~ValidationScheduler() {
	stop();
}

void ValidationScheduler::start() {
	if (interval_.count() <= 0 || running_.exchange(true)) return;
	worker_ = std::thread([this]() {
		while (running_.load()) {
			{
				std::unique_lock<std::mutex> lock(waitMu_);
				cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
			}
			if (!running_.load()) break;
			try {
				runOnce();
			} catch (const std::exception &e) {
				std::lock_guard<std::mutex> lock(mu_);
				failures_++;
				last_ = json{{"error", e.what()}};
				std::cerr << "[ValidationScheduler] run failed: " << e.what() << std::endl;
			}
		}
	});
	std::cout << "[ValidationScheduler] every " << interval_.count() << "ms" << std::endl;
}

void ValidationScheduler::stop() {
	{
		std::lock_guard<std::mutex> lock(waitMu_);
		if (!running_.exchange(false)) return;
	}
	cv_.notify_all();
	if (worker_.joinable()) worker_.join();
}

ValidationResult ValidationScheduler::runOnce() {
	auto dataset = provider_();
	auto result = harness_->validateModel(Context::background(), options_, dataset);
	if (options_.applyRecommendedWeights && result.targetAchieved) harness_->applyRecommendations(result);
	std::lock_guard<std::mutex> lock(mu_);
	runs_++;
	last_ = json{{"targetAchieved", result.targetAchieved},
				 {"calibrationError", result.calibrationError},
				 {"recommendations", result.recommendations.size()},
				 {"startedAtMs", result.startedAtMs}};
	return result;
}

json ValidationScheduler::status() const {
	std::lock_guard<std::mutex> lock(mu_);
	return json{{"running", running_.load()}, {"intervalMs", interval_.count()}, {"runs", runs_},
				{"failures", failures_}, {"last", last_}};
}

} // namespace horizon
