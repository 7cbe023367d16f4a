#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "context.hpp"
#include "metrics.hpp"
#include "model_adapter.hpp"
#include "types.hpp"

namespace horizon {

struct HorizonWeights {
	double shortWeight{0.5};
	double longWeight{0.5};
};

// Immutable once published; replaced wholesale through applyWeights().
struct RouterWeights {
	uint64_t version{0};
	std::map<int, HorizonWeights> perHorizon;

	HorizonWeights forHorizon(int horizon) const;
	json toJson() const;
	static RouterWeights fromJson(const json &j);
};

enum class PredictorPlan { ShortOnly, LongOnly, Blend };

const char *planName(PredictorPlan plan);

struct BlendOutcome {
	double score{0.0};
	double confidence{0.0};
	double disagreementPenalty{0.0};
};

class EnsembleRouter {
public:
	struct MemberOutputs {
		std::optional<ModelPrediction> shortPrediction;
		std::optional<ModelPrediction> longPrediction;
		std::optional<HorizonError> shortError;
		std::optional<HorizonError> longError;
	};

	EnsembleRouter(ModelAdapterPtr shortModel, ModelAdapterPtr longModel, RouterOptions options, MetricsPtr metrics = nullptr);

	// One task per horizon, all joined before returning. Throws only when every
	// horizon failed, or on cancellation/timeout.
	EnsembleResult predict(const ContextPtr &ctx, const RiskAssessmentRequest &request) const;
	HorizonResult predictHorizon(const ContextPtr &ctx, const RiskAssessmentRequest &request, int horizon) const;

	// Runs both members unconditionally; used by validation to score each model alone.
	MemberOutputs memberPredictions(const ContextPtr &ctx, const RiskAssessmentRequest &request, int horizon) const;

	PredictorPlan planFor(ModelType type, int horizon) const;

	static BlendOutcome blend(const ModelPrediction &a, double weightA, const ModelPrediction &b, double weightB,
							  const RouterOptions &options);
	// Mean member agreement over horizons carrying a comparison; nullopt when none do.
	static std::optional<AgreementAnalysis> analyzeAgreement(const std::vector<HorizonResult> &horizons, double threshold);
	// Half-width = (1 - confidence) * scale + spread / 2, clamped into [0,1].
	static std::pair<double, double> uncertaintyBounds(double score, double confidence, double spread, double scale);

	std::string versionTag() const;
	std::shared_ptr<const RouterWeights> weights() const;
	void applyWeights(std::shared_ptr<const RouterWeights> weights);

	const RouterOptions &options() const { return options_; }
	json describe() const;

private:
	std::optional<ModelPrediction> invoke(const ContextPtr &ctx, const ModelAdapterPtr &model, const char *role,
										  const FeatureVector &features, int horizon, std::optional<HorizonError> &error) const;
	HorizonResult single(const ModelPrediction &p, const std::string &modelUsed, bool degraded) const;

	ModelAdapterPtr short_;
	ModelAdapterPtr long_;
	RouterOptions options_;
	MetricsPtr metrics_;
	std::shared_ptr<const RouterWeights> weights_;
};

} // namespace horizon
