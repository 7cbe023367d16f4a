#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace horizon {

using json = nlohmann::json;

enum class ModelType { Auto, ModelA, ModelB, Ensemble };

const char *modelTypeName(ModelType type);
std::optional<ModelType> parseModelType(const std::string &raw);

enum class RiskLevel { Low, Medium, High, Critical };

RiskLevel levelForScore(double score);
const char *riskLevelName(RiskLevel level);

struct RiskAssessmentRequest {
	std::string businessName;
	std::string businessAddress;
	std::string industry;
	std::string country;
	std::string phone;
	std::string email;
	std::string website;
	std::vector<int> horizons;
	ModelType modelType{ModelType::Auto};
	bool includeComparison{true};
	bool bypassCache{false};
	json metadata = json::object();

	json toJson() const;
	// Throws RiskError(ValidationInput) on malformed payloads.
	static RiskAssessmentRequest fromJson(const json &j);
};

RiskAssessmentRequest normalizeRequest(const RiskAssessmentRequest &request);
void validateRequest(const RiskAssessmentRequest &request, const std::vector<int> &supportedHorizons);

// Stable hex key for (normalized request, horizon set, model version).
std::string requestFingerprint(const RiskAssessmentRequest &normalized, const std::string &modelVersion);
uint64_t fnv1a64(const std::string &s);

struct ModelPrediction {
	int horizon{0};
	double score{0.0};
	RiskLevel level{RiskLevel::Low};
	double confidence{0.0};
	std::string modelId;
	std::string modelVersion;
	std::string role;
	double weight{1.0};
	int64_t latencyUs{0};

	json toJson() const;
	static ModelPrediction fromJson(const json &j);
};

struct ModelComparison {
	double shortScore{0.0};
	double shortConfidence{0.0};
	double longScore{0.0};
	double longConfidence{0.0};
	std::string betterModel;
	double scoreDifference{0.0};
	double agreement{1.0};
	bool ensembleMoreConfident{false};

	json toJson() const;
	static ModelComparison fromJson(const json &j);
};

// One input's contribution to a horizon score. Positive impact raises risk.
struct RiskFactor {
	std::string name;
	std::string category;
	double value{0.0};
	double weight{0.0};
	double impact{0.0};

	json toJson() const;
	static RiskFactor fromJson(const json &j);
};

// Cross-horizon agreement between the two members, over horizons that were blended.
struct AgreementAnalysis {
	double overall{1.0};
	std::map<int, double> byHorizon;
	double disagreementThreshold{0.2};
	std::vector<int> highDisagreementHorizons;

	json toJson() const;
	static AgreementAnalysis fromJson(const json &j);
};

struct HorizonError {
	ErrorCode code{ErrorCode::Internal};
	Stage stage{Stage::Router};
	std::string message;
};

struct HorizonResult {
	int horizon{0};
	bool ok{false};
	double score{0.0};
	RiskLevel level{RiskLevel::Low};
	double confidence{0.0};
	std::string modelUsed;
	bool degraded{false};
	std::vector<ModelPrediction> members;
	double lowerBound{0.0};
	double upperBound{1.0};
	std::optional<ModelComparison> comparison;
	std::vector<RiskFactor> factors;
	std::optional<HorizonError> error;

	json toJson() const;
	static HorizonResult fromJson(const json &j);
};

struct EnsembleResult {
	std::string fingerprint;
	std::string modelVersion;
	std::vector<HorizonResult> horizons;
	bool degraded{false};
	int64_t createdAtMs{0};
	std::optional<AgreementAnalysis> agreement;

	bool hasFailures() const;
	const HorizonResult *find(int horizon) const;

	json toJson() const;
	static EnsembleResult fromJson(const json &j);
};

} // namespace horizon
