#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace horizon {

using json = nlohmann::json;
namespace fs = std::filesystem;
using Millis = std::chrono::milliseconds;

struct BreakerOptions {
	int failureThreshold{5};
	Millis recoveryTimeout{30000};
	int halfOpenMaxCalls{3};
};

struct RouterOptions {
	int shortHorizonMax{3};
	int longHorizonMin{6};
	bool blendLongHorizons{true};
	double fallbackConfidencePenalty{0.2};
	double disagreementFactor{0.5};
	double maxDisagreementPenalty{0.5};
	double uncertaintyScale{0.25};
	int maxRiskFactors{5};
	double disagreementThreshold{0.2};
	std::vector<int> supportedHorizons{3, 6, 9, 12};
};

struct CacheOptions {
	int l1MaxEntries{10000};
	Millis sweepInterval{5000};
	std::string keyPrefix{"horizon:"};
};

struct RedisOptions {
	bool enabled{false};
	std::string url{"tcp://127.0.0.1:6379"};
	int connectTimeoutMs{200};
	int socketTimeoutMs{50};
	int poolSize{8};
};

struct PrefetchOptions {
	bool enabled{true};
	Millis interval{10000};
	int popularityThreshold{5};
	Millis refreshAhead{60000};
	int maxItems{100};
	Millis refreshTimeout{2000};
};

struct EngineOptions {
	int maxConcurrentRequests{1000};
	Millis requestTimeout{500};
	Millis cacheTtl{300000};
	Millis degradedCacheTtl{30000};
	bool enableCaching{true};
};

struct ValidationOptions {
	int folds{5};
	uint32_t randomSeed{42};
	std::vector<int> horizons{3, 6, 9, 12};
	std::map<int, double> accuracyThresholds;
	double defaultAccuracyThreshold{0.8};
	// Values <= 0 disable the corresponding target.
	double maxCalibrationError{0.15};
	double maxMae{0.0};
	std::vector<double> calibrationBoundaries{0.7};
	double weightGridStep{0.1};
	bool applyRecommendedWeights{false};

	double thresholdFor(int horizon) const {
		auto it = accuracyThresholds.find(horizon);
		return it == accuracyThresholds.end() ? defaultAccuracyThreshold : it->second;
	}
};

struct BenchmarkOptions {
	std::string name{"assess"};
	int iterations{1000};
	int warmup{50};
	int concurrency{10};
	double p95TargetMs{500.0};
	double p99TargetMs{1000.0};
	double minThroughput{0.0};
	double maxErrorRate{-1.0};
};

struct Config {
	std::string mode{"serve"};
	fs::path baseDir;
	fs::path storeDir;
	std::size_t lmdbMapSizeBytes{64ull * 1024ull * 1024ull};
	fs::path shortModelPath;
	fs::path longModelPath;
	fs::path datasetPath;
	int syntheticBusinesses{1000};
	Millis validationInterval{0};
	std::string host{"127.0.0.1"};
	int port{5090};
	int serverThreads{4};
	// assessments run off the IO loops on this many workers, bounded queue
	int gatewayWorkers{8};
	int gatewayQueue{1024};

	EngineOptions engine;
	BreakerOptions breaker;
	RouterOptions router;
	CacheOptions cache;
	RedisOptions redis;
	PrefetchOptions prefetch;
	ValidationOptions validation;
	BenchmarkOptions benchmark;

	json toJson() const;
};

std::map<std::string, std::string> parseArgs(int argc, char **argv);
Config loadConfig(int argc, char **argv);

std::vector<int> parseHorizonList(const std::string &raw, const std::vector<int> &fallback);
std::map<int, double> parseThresholdMap(const std::string &raw);

} // namespace horizon
