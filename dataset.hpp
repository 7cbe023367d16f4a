#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace horizon {

using json = nlohmann::json;
namespace fs = std::filesystem;

struct LabeledSample {
	RiskAssessmentRequest request;
	int horizon{0};
	double actualScore{0.0};

	json toJson() const;
};

struct SyntheticDatasetOptions {
	int businesses{1000};
	std::vector<int> horizons{3, 6, 9, 12};
	uint32_t seed{42};
	double noise{0.05};
};

// Deterministic in (options): same seed, same samples, same order.
std::vector<LabeledSample> generateSyntheticDataset(const SyntheticDatasetOptions &options);

// Underlying risk curve the generator samples around.
double syntheticRiskCurve(const RiskAssessmentRequest &request, int horizon);

// One JSON object per line: {"request": {...}, "horizon": 6, "actual_score": 0.4}.
// Also accepts the request fields inline with "actual_scores": {"3": .., "6": ..}.
std::vector<LabeledSample> loadJsonLines(const fs::path &path);

std::vector<LabeledSample> filterHorizon(const std::vector<LabeledSample> &samples, int horizon);

} // namespace horizon
