#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "context.hpp"
#include "dataset.hpp"
#include "ensemble_router.hpp"
#include "history_store.hpp"
#include "metrics.hpp"

namespace horizon {

struct HorizonMetrics {
	int horizon{0};
	std::size_t samples{0};
	std::size_t failedPredictions{0};
	double accuracy{0.0};
	double mae{0.0};
	double rmse{0.0};
	double r2{0.0};
	std::string plan;

	json toJson() const;
};

struct CalibrationBucket {
	std::string label;
	double lower{0.0};
	double upper{1.0};
	std::size_t count{0};
	double meanConfidence{0.0};
	double realizedAccuracy{0.0};

	json toJson() const;
};

struct FoldResult {
	int horizon{0};
	int fold{0};
	std::size_t trainSize{0};
	std::size_t testSize{0};
	double shortWeight{0.5};
	double trainMae{0.0};
	double accuracy{0.0};
	double mae{0.0};

	json toJson() const;
};

struct ModelComparisonReport {
	int horizon{0};
	double shortAccuracy{0.0};
	double longAccuracy{0.0};
	double ensembleAccuracy{0.0};
	double shortMae{0.0};
	double longMae{0.0};
	double ensembleMae{0.0};
	bool outperformsShort{false};
	bool outperformsLong{false};
	// ensemble accuracy minus the better single model's
	double accuracyGain{0.0};

	json toJson() const;
};

struct Recommendation {
	int rank{0};
	std::string metric;
	int horizon{0};
	double observed{0.0};
	double target{0.0};
	double gap{0.0};
	std::string action;

	json toJson() const;
};

struct ValidationResult {
	int64_t startedAtMs{0};
	int64_t durationMs{0};
	std::string modelVersion;
	int folds{0};
	uint32_t seed{0};
	std::map<int, HorizonMetrics> horizons;
	std::vector<CalibrationBucket> calibration;
	double calibrationError{0.0};
	std::vector<FoldResult> foldResults;
	std::vector<ModelComparisonReport> comparisons;
	RouterWeights recommendedWeights;
	std::vector<Recommendation> recommendations;
	bool targetAchieved{false};

	json toJson() const;
};

class ValidationHarness {
public:
	using WeightsSink = std::function<void(std::shared_ptr<const RouterWeights>)>;

	ValidationHarness(std::shared_ptr<EnsembleRouter> router, std::shared_ptr<ValidationHistoryStore> history = nullptr,
					  MetricsPtr metrics = nullptr);

	// Defaults to router->applyWeights; the engine installs one that also
	// invalidates results cached under the previous version.
	void setWeightsSink(WeightsSink sink) { sink_ = std::move(sink); }

	ValidationResult validateModel(const ContextPtr &ctx, const ValidationOptions &options,
								   const std::vector<LabeledSample> &dataset);

	// Throws RiskError(ValidationTargetNotMet) naming the top recommendation.
	static void enforceTargets(const ValidationResult &result);

	// Publishes the recommended weights with a bumped version.
	void applyRecommendations(const ValidationResult &result);

	static std::vector<CalibrationBucket> calibrate(const std::vector<std::pair<double, bool>> &confidenceHits,
													const std::vector<double> &boundaries, double &calibrationError);

private:
	std::shared_ptr<EnsembleRouter> router_;
	std::shared_ptr<ValidationHistoryStore> history_;
	MetricsPtr metrics_;
	WeightsSink sink_;
};

// Periodic validation on its own thread; each run is appended to the history
// store by the harness and optionally promotes the recommended weights.
class ValidationScheduler {
public:
	using DatasetProvider = std::function<std::vector<LabeledSample>()>;

	ValidationScheduler(std::shared_ptr<ValidationHarness> harness, ValidationOptions options, DatasetProvider provider,
						Millis interval);
	~ValidationScheduler();

	void start();
	void stop();
	bool running() const { return running_.load(); }

	ValidationResult runOnce();
	json status() const;

private:
	std::shared_ptr<ValidationHarness> harness_;
	ValidationOptions options_;
	DatasetProvider provider_;
	Millis interval_;

	std::atomic<bool> running_{false};
	std::mutex waitMu_;
	std::condition_variable cv_;
	std::thread worker_;

	mutable std::mutex mu_;
	json last_;
	uint64_t runs_{0};
	uint64_t failures_{0};
};

} // namespace horizon
