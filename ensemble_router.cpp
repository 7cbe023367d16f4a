#include "ensemble_router.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <iostream>

namespace horizon {

namespace {

double clamp01(double v) {
	if (!std::isfinite(v)) return 0.0;
	return std::clamp(v, 0.0, 1.0);
}

int64_t wallMs() {
	return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
			   std::chrono::system_clock::now().time_since_epoch())
		.count();
}

} // namespace

HorizonWeights RouterWeights::forHorizon(int horizon) const {
	auto it = perHorizon.find(horizon);
	return it == perHorizon.end() ? HorizonWeights{} : it->second;
}

json RouterWeights::toJson() const {
	json hs = json::object();
	for (auto &kv : perHorizon) {
		hs[std::to_string(kv.first)] = json{{"short", kv.second.shortWeight}, {"long", kv.second.longWeight}};
	}
	return json{{"version", version}, {"horizons", hs}};
}

RouterWeights RouterWeights::fromJson(const json &j) {
	RouterWeights w;
	w.version = j.value("version", (uint64_t)0);
	if (j.contains("horizons") && j["horizons"].is_object()) {
		for (auto it = j["horizons"].begin(); it != j["horizons"].end(); ++it) {
			HorizonWeights hw;
			hw.shortWeight = std::max(0.0, it.value().value("short", 0.5));
			hw.longWeight = std::max(0.0, it.value().value("long", 0.5));
			w.perHorizon[std::stoi(it.key())] = hw;
		}
	}
	return w;
}

const char *planName(PredictorPlan plan) {
	switch (plan) {
	case PredictorPlan::ShortOnly: return "short";
	case PredictorPlan::LongOnly: return "long";
	case PredictorPlan::Blend: return "blend";
	}
	return "blend";
}

EnsembleRouter::EnsembleRouter(ModelAdapterPtr shortModel, ModelAdapterPtr longModel, RouterOptions options, MetricsPtr metrics)
	: short_(std::move(shortModel)), long_(std::move(longModel)), options_(std::move(options)), metrics_(std::move(metrics)),
	  weights_(std::make_shared<const RouterWeights>()) {}

PredictorPlan EnsembleRouter::planFor(ModelType type, int horizon) const {
	switch (type) {
	case ModelType::ModelA: return PredictorPlan::ShortOnly;
	case ModelType::ModelB: return PredictorPlan::LongOnly;
	case ModelType::Ensemble: return PredictorPlan::Blend;
	case ModelType::Auto: break;
	}
	if (horizon <= options_.shortHorizonMax) return PredictorPlan::ShortOnly;
	if (horizon >= options_.longHorizonMin) return options_.blendLongHorizons ? PredictorPlan::Blend : PredictorPlan::LongOnly;
	return PredictorPlan::Blend;
}

BlendOutcome EnsembleRouter::blend(const ModelPrediction &a, double weightA, const ModelPrediction &b, double weightB,
								   const RouterOptions &options) {
	weightA = std::max(0.0, weightA);
	weightB = std::max(0.0, weightB);
	if (weightA + weightB <= 0.0) weightA = weightB = 1.0;
	BlendOutcome out;
	out.score = clamp01((weightA * a.score + weightB * b.score) / (weightA + weightB));
	out.disagreementPenalty =
		std::min(options.maxDisagreementPenalty, options.disagreementFactor * std::abs(a.score - b.score));
	out.confidence = clamp01((a.confidence + b.confidence) / 2.0 * (1.0 - out.disagreementPenalty));
	return out;
}

std::pair<double, double> EnsembleRouter::uncertaintyBounds(double score, double confidence, double spread, double scale) {
	double halfWidth = (1.0 - clamp01(confidence)) * scale + std::max(0.0, spread) / 2.0;
	return {clamp01(score - halfWidth), clamp01(score + halfWidth)};
}

std::optional<ModelPrediction> EnsembleRouter::invoke(const ContextPtr &ctx, const ModelAdapterPtr &model, const char *role,
													  const FeatureVector &features, int horizon,
													  std::optional<HorizonError> &error) const {
	if (!model || !model->available()) {
		error = HorizonError{ErrorCode::ModelInvocation, Stage::Model, std::string("model-unavailable:") + role};
		return std::nullopt;
	}
	auto started = std::chrono::steady_clock::now();
	ModelOutput out;
	try {
		out = model->predict(ctx, features);
	} catch (const RiskError &e) {
		if (e.code() == ErrorCode::Cancelled || e.code() == ErrorCode::Timeout) throw;
		error = HorizonError{e.code(), e.stage(), e.detail()};
		return std::nullopt;
	} catch (const std::exception &e) {
		error = HorizonError{ErrorCode::ModelInvocation, Stage::Model, e.what()};
		return std::nullopt;
	}
	if (!std::isfinite(out.score) || out.score < 0.0 || out.score > 1.0 || !std::isfinite(out.confidence)) {
		error = HorizonError{ErrorCode::ModelInvocation, Stage::Model, std::string("invalid-model-output:") + role};
		return std::nullopt;
	}
	ModelPrediction p;
	p.horizon = horizon;
	p.score = out.score;
	p.level = levelForScore(out.score);
	p.confidence = clamp01(out.confidence);
	p.modelId = model->id();
	p.modelVersion = model->version();
	p.role = role;
	p.weight = 1.0;
	p.latencyUs = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started).count();
	return p;
}

HorizonResult EnsembleRouter::single(const ModelPrediction &p, const std::string &modelUsed, bool degraded) const {
	HorizonResult r;
	r.horizon = p.horizon;
	r.ok = true;
	r.score = p.score;
	r.level = p.level;
	r.confidence = degraded ? clamp01(p.confidence * (1.0 - options_.fallbackConfidencePenalty)) : p.confidence;
	r.modelUsed = modelUsed;
	r.degraded = degraded;
	r.members.push_back(p);
	auto bounds = uncertaintyBounds(r.score, r.confidence, 0.0, options_.uncertaintyScale);
	r.lowerBound = bounds.first;
	r.upperBound = bounds.second;
	return r;
}

EnsembleRouter::MemberOutputs EnsembleRouter::memberPredictions(const ContextPtr &ctx, const RiskAssessmentRequest &request,
																int horizon) const {
	auto features = extractFeatures(request, horizon);
	MemberOutputs out;
	auto longTask = std::async(std::launch::async, [&]() {
		return invoke(ctx, long_, "long", features, horizon, out.longError);
	});
	out.shortPrediction = invoke(ctx, short_, "short", features, horizon, out.shortError);
	out.longPrediction = longTask.get();
	return out;
}

HorizonResult EnsembleRouter::predictHorizon(const ContextPtr &ctx, const RiskAssessmentRequest &request, int horizon) const {
	if (ctx) ctx->check(Stage::Router);
	const auto plan = planFor(request.modelType, horizon);
	auto features = extractFeatures(request, horizon);
	auto started = std::chrono::steady_clock::now();

	HorizonResult result;
	result.horizon = horizon;
	std::optional<HorizonError> shortError;
	std::optional<HorizonError> longError;

	if (plan == PredictorPlan::ShortOnly) {
		auto s = invoke(ctx, short_, "short", features, horizon, shortError);
		if (s) result = single(*s, "short", false);
		else result.error = shortError;
	} else if (plan == PredictorPlan::LongOnly) {
		auto l = invoke(ctx, long_, "long", features, horizon, longError);
		if (l) {
			result = single(*l, "long", false);
		} else {
			auto s = invoke(ctx, short_, "short", features, horizon, shortError);
			if (s) {
				result = single(*s, "short_fallback", true);
			} else {
				result.error = HorizonError{ErrorCode::ModelInvocation, Stage::Model,
											"all-members-failed: long=" + longError->message + "; short=" + shortError->message};
			}
		}
	} else {
		std::optional<ModelPrediction> s;
		std::optional<ModelPrediction> l;
		{
			auto longTask = std::async(std::launch::async, [&]() {
				return invoke(ctx, long_, "long", features, horizon, longError);
			});
			// an exception here still joins longTask through the future's destructor
			s = invoke(ctx, short_, "short", features, horizon, shortError);
			l = longTask.get();
		}
		if (s && l) {
			auto w = std::atomic_load(&weights_)->forHorizon(horizon);
			auto b = blend(*s, w.shortWeight, *l, w.longWeight, options_);
			double total = std::max(0.0, w.shortWeight) + std::max(0.0, w.longWeight);
			ModelPrediction sm = *s;
			ModelPrediction lm = *l;
			sm.weight = total > 0 ? std::max(0.0, w.shortWeight) / total : 0.5;
			lm.weight = total > 0 ? std::max(0.0, w.longWeight) / total : 0.5;

			result.ok = true;
			result.score = b.score;
			result.level = levelForScore(b.score);
			result.confidence = b.confidence;
			result.modelUsed = "ensemble";
			result.members = {sm, lm};
			auto bounds = uncertaintyBounds(b.score, b.confidence, std::abs(s->score - l->score), options_.uncertaintyScale);
			result.lowerBound = bounds.first;
			result.upperBound = bounds.second;
			if (request.includeComparison) {
				ModelComparison c;
				c.shortScore = s->score;
				c.shortConfidence = s->confidence;
				c.longScore = l->score;
				c.longConfidence = l->confidence;
				c.betterModel = s->confidence >= l->confidence ? "short" : "long";
				c.scoreDifference = std::abs(s->score - l->score);
				c.agreement = clamp01(1.0 - c.scoreDifference);
				c.ensembleMoreConfident = b.confidence > std::max(s->confidence, l->confidence);
				result.comparison = c;
			}
		} else if (s) {
			result = single(*s, "short_fallback", true);
		} else if (l) {
			result = single(*l, "long_fallback", true);
		} else {
			result.error = HorizonError{ErrorCode::ModelInvocation, Stage::Model,
										"all-members-failed: short=" + shortError->message + "; long=" + longError->message};
		}
	}

	result.horizon = horizon;
	if (result.ok) result.factors = topRiskFactors(features, options_.maxRiskFactors);
	if (!result.ok && !result.error) {
		result.error = HorizonError{ErrorCode::Internal, Stage::Router, "no-result"};
	}
	if (metrics_) {
		double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
		metrics_->observe("horizon_predict_latency_ms", {{"horizon", std::to_string(horizon)}}, ms);
	}
	return result;
}

EnsembleResult EnsembleRouter::predict(const ContextPtr &ctx, const RiskAssessmentRequest &request) const {
	if (ctx) ctx->check(Stage::Router);
	if (request.horizons.empty()) throw RiskError(ErrorCode::ValidationInput, Stage::Router, "horizon-required");

	std::vector<std::future<HorizonResult>> tasks;
	tasks.reserve(request.horizons.size());
	for (int h : request.horizons) {
		tasks.push_back(std::async(std::launch::async, [this, &ctx, &request, h]() {
			return predictHorizon(ctx, request, h);
		}));
	}

	EnsembleResult out;
	std::exception_ptr abort;
	for (auto &t : tasks) {
		try {
			out.horizons.push_back(t.get());
		} catch (const std::exception &) {
			if (!abort) abort = std::current_exception();
		}
	}
	if (abort) std::rethrow_exception(abort);

	bool anyOk = false;
	for (auto &h : out.horizons) {
		if (h.ok) anyOk = true;
		if (!h.ok || h.degraded) out.degraded = true;
	}
	if (!anyOk) {
		const auto &first = *out.horizons.front().error;
		throw RiskError(first.code, first.stage, first.message);
	}
	out.agreement = analyzeAgreement(out.horizons, options_.disagreementThreshold);
	out.modelVersion = versionTag();
	out.fingerprint = requestFingerprint(request, out.modelVersion);
	out.createdAtMs = wallMs();
	return out;
}

std::optional<AgreementAnalysis> EnsembleRouter::analyzeAgreement(const std::vector<HorizonResult> &horizons,
																   double threshold) {
	AgreementAnalysis a;
	a.disagreementThreshold = threshold;
	double sum = 0.0;
	for (auto &h : horizons) {
		if (!h.ok || !h.comparison) continue;
		a.byHorizon[h.horizon] = h.comparison->agreement;
		sum += h.comparison->agreement;
		if (h.comparison->scoreDifference > threshold) a.highDisagreementHorizons.push_back(h.horizon);
	}
	if (a.byHorizon.empty()) return std::nullopt;
	a.overall = sum / (double)a.byHorizon.size();
	std::sort(a.highDisagreementHorizons.begin(), a.highDisagreementHorizons.end());
	return a;
}

std::string EnsembleRouter::versionTag() const {
	auto w = std::atomic_load(&weights_);
	std::string s = short_ ? short_->id() + "@" + short_->version() : std::string("none");
	std::string l = long_ ? long_->id() + "@" + long_->version() : std::string("none");
	return s + "+" + l + "#w" + std::to_string(w->version);
}

std::shared_ptr<const RouterWeights> EnsembleRouter::weights() const {
	return std::atomic_load(&weights_);
}

void EnsembleRouter::applyWeights(std::shared_ptr<const RouterWeights> weights) {
	if (!weights) return;
	std::atomic_store(&weights_, std::move(weights));
	auto current = std::atomic_load(&weights_);
	std::cout << "[EnsembleRouter] weights v" << current->version << " applied: " << current->toJson().dump() << std::endl;
}

json EnsembleRouter::describe() const {
	return json{
		{"versionTag", versionTag()},
		{"short", short_ ? short_->describe() : json()},
		{"long", long_ ? long_->describe() : json()},
		{"weights", weights()->toJson()},
		{"shortHorizonMax", options_.shortHorizonMax},
		{"longHorizonMin", options_.longHorizonMin},
		{"blendLongHorizons", options_.blendLongHorizons}
	};
}

} // namespace horizon
