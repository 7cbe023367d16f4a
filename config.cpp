#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace horizon {

namespace {

std::string getEnv(const std::string &key, const std::string &fallback = "") {
	const char *v = std::getenv(key.c_str());
	if (!v) return fallback;
	return std::string(v);
}

std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

bool boolFrom(const std::string &value, bool fallback) {
	std::string v = trimCopy(value);
	if (v.empty()) return fallback;
	std::transform(v.begin(), v.end(), v.begin(), ::tolower);
	return !(v == "0" || v == "false" || v == "off" || v == "no");
}

bool parseNumber(const std::string &s, double &out) {
	std::string t = trimCopy(s);
	if (t.empty()) return false;
	try {
		size_t idx = 0;
		double v = std::stod(t, &idx);
		if (idx != t.size()) return false;
		out = v;
		return true;
	} catch (const std::exception &) {
		return false;
	}
}

double numberOr(const std::string &s, double fallback) {
	double v = 0.0;
	if (!parseNumber(s, v)) return fallback;
	if (!std::isfinite(v)) return fallback;
	return v;
}

std::vector<std::string> splitCsv(const std::string &raw) {
	std::vector<std::string> out;
	std::stringstream ss(raw);
	std::string item;
	while (std::getline(ss, item, ',')) {
		item = trimCopy(item);
		if (!item.empty()) out.push_back(item);
	}
	return out;
}

} // namespace

std::map<std::string, std::string> parseArgs(int argc, char **argv) {
	std::map<std::string, std::string> out;
	for (int i = 1; i < argc; i++) {
		std::string item = argv[i];
		if (item.rfind("--", 0) != 0) continue;
		auto pos = item.find('=');
		if (pos == std::string::npos) {
			// "--key value"; a bare "--flag" followed by another option means true
			if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
				out[item.substr(2)] = argv[++i];
			} else {
				out[item.substr(2)] = "true";
			}
		} else {
			out[item.substr(2, pos - 2)] = item.substr(pos + 1);
		}
	}
	return out;
}

std::vector<int> parseHorizonList(const std::string &raw, const std::vector<int> &fallback) {
	std::vector<int> out;
	for (auto &item : splitCsv(raw)) {
		double v = 0.0;
		if (!parseNumber(item, v) || v < 1 || v != std::floor(v)) {
			std::cerr << "[Config] ignoring invalid horizon '" << item << "'" << std::endl;
			continue;
		}
		out.push_back((int)v);
	}
	if (out.empty()) return fallback;
	std::sort(out.begin(), out.end());
	out.erase(std::unique(out.begin(), out.end()), out.end());
	return out;
}

std::map<int, double> parseThresholdMap(const std::string &raw) {
	std::map<int, double> out;
	for (auto &item : splitCsv(raw)) {
		auto pos = item.find(':');
		double h = 0.0;
		double t = 0.0;
		if (pos == std::string::npos || !parseNumber(item.substr(0, pos), h) || !parseNumber(item.substr(pos + 1), t)) {
			std::cerr << "[Config] ignoring invalid threshold '" << item << "'" << std::endl;
			continue;
		}
		out[(int)h] = std::clamp(t, 0.0, 1.0);
	}
	return out;
}

Config loadConfig(int argc, char **argv) {
	const auto args = parseArgs(argc, argv);
	auto argOrEnv = [&](const std::string &argKey, const std::string &env, const std::string &def = "") {
		auto it = args.find(argKey);
		if (it != args.end() && !it->second.empty()) return it->second;
		std::string v = getEnv(env);
		if (!v.empty()) return v;
		return def;
	};
	auto intOr = [&](const std::string &argKey, const std::string &env, int def, int minValue) {
		return std::max(minValue, (int)numberOr(argOrEnv(argKey, env), def));
	};
	auto msOr = [&](const std::string &argKey, const std::string &env, Millis def, long long minValue) {
		double v = numberOr(argOrEnv(argKey, env), (double)def.count());
		return Millis(std::max(minValue, (long long)v));
	};

	Config c;
	c.mode = argOrEnv("mode", "HORIZON_MODE", "serve");
	c.baseDir = fs::absolute(argOrEnv("base-dir", "HORIZON_BASE_DIR", (fs::current_path() / "runtime_store").string()));
	c.storeDir = fs::absolute(argOrEnv("store-dir", "HORIZON_STORE_DIR", (c.baseDir / "history").string()));
	c.lmdbMapSizeBytes = (std::size_t)std::max(8, intOr("lmdb-map-mb", "HORIZON_LMDB_MAP_MB", 64, 8)) * 1024ull * 1024ull;
	c.shortModelPath = argOrEnv("short-model", "HORIZON_SHORT_MODEL", (fs::current_path() / "models" / "short_tree.json").string());
	c.longModelPath = argOrEnv("long-model", "HORIZON_LONG_MODEL", (fs::current_path() / "models" / "long_sequence.json").string());
	c.datasetPath = argOrEnv("dataset", "HORIZON_DATASET", "");
	c.syntheticBusinesses = intOr("synthetic-businesses", "HORIZON_SYNTHETIC_BUSINESSES", 1000, 10);
	c.validationInterval = msOr("validation-interval-ms", "HORIZON_VALIDATION_INTERVAL_MS", Millis(0), 0);
	c.host = argOrEnv("host", "HORIZON_HOST", "127.0.0.1");
	c.port = intOr("port", "HORIZON_PORT", 5090, 1);
	c.serverThreads = intOr("server-threads", "HORIZON_SERVER_THREADS", 4, 1);
	c.gatewayWorkers = intOr("gateway-workers", "HORIZON_GATEWAY_WORKERS", 8, 1);
	c.gatewayQueue = intOr("gateway-queue", "HORIZON_GATEWAY_QUEUE", 1024, 1);

	c.engine.maxConcurrentRequests = intOr("max-concurrent", "HORIZON_MAX_CONCURRENT", 1000, 1);
	c.engine.requestTimeout = msOr("request-timeout-ms", "HORIZON_REQUEST_TIMEOUT_MS", Millis(500), 1);
	c.engine.cacheTtl = msOr("cache-ttl-ms", "HORIZON_CACHE_TTL_MS", Millis(300000), 1);
	c.engine.degradedCacheTtl = msOr("degraded-cache-ttl-ms", "HORIZON_DEGRADED_CACHE_TTL_MS", Millis(30000), 0);
	c.engine.enableCaching = boolFrom(argOrEnv("enable-caching", "HORIZON_ENABLE_CACHING"), true);

	c.breaker.failureThreshold = intOr("breaker-threshold", "HORIZON_BREAKER_THRESHOLD", 5, 1);
	c.breaker.recoveryTimeout = msOr("breaker-recovery-ms", "HORIZON_BREAKER_RECOVERY_MS", Millis(30000), 1);
	c.breaker.halfOpenMaxCalls = intOr("breaker-half-open-calls", "HORIZON_BREAKER_HALF_OPEN_CALLS", 3, 1);

	c.router.shortHorizonMax = intOr("short-horizon-max", "HORIZON_SHORT_HORIZON_MAX", 3, 1);
	c.router.longHorizonMin = std::max(c.router.shortHorizonMax + 1, intOr("long-horizon-min", "HORIZON_LONG_HORIZON_MIN", 6, 1));
	c.router.blendLongHorizons = boolFrom(argOrEnv("blend-long", "HORIZON_BLEND_LONG"), true);
	c.router.fallbackConfidencePenalty = std::clamp(numberOr(argOrEnv("fallback-penalty", "HORIZON_FALLBACK_PENALTY"), 0.2), 0.0, 1.0);
	c.router.disagreementFactor = std::max(0.0, numberOr(argOrEnv("disagreement-factor", "HORIZON_DISAGREEMENT_FACTOR"), 0.5));
	c.router.maxDisagreementPenalty = std::clamp(numberOr(argOrEnv("max-disagreement-penalty", "HORIZON_MAX_DISAGREEMENT_PENALTY"), 0.5), 0.0, 1.0);
	c.router.maxRiskFactors = intOr("max-risk-factors", "HORIZON_MAX_RISK_FACTORS", 5, 0);
	c.router.disagreementThreshold = std::clamp(numberOr(argOrEnv("disagreement-threshold", "HORIZON_DISAGREEMENT_THRESHOLD"), 0.2), 0.0, 1.0);
	c.router.supportedHorizons = parseHorizonList(argOrEnv("horizons", "HORIZON_SUPPORTED_HORIZONS"), c.router.supportedHorizons);

	c.cache.l1MaxEntries = intOr("l1-max-entries", "HORIZON_L1_MAX_ENTRIES", 10000, 1);
	c.cache.sweepInterval = msOr("cache-sweep-ms", "HORIZON_CACHE_SWEEP_MS", Millis(5000), 10);
	c.cache.keyPrefix = argOrEnv("cache-prefix", "HORIZON_CACHE_PREFIX", "horizon:");

	c.redis.url = argOrEnv("redis-url", "REDIS_URL", "");
	c.redis.enabled = !c.redis.url.empty() && boolFrom(argOrEnv("redis", "HORIZON_REDIS"), true);
	c.redis.connectTimeoutMs = intOr("redis-connect-timeout-ms", "HORIZON_REDIS_CONNECT_TIMEOUT_MS", 200, 10);
	c.redis.socketTimeoutMs = intOr("redis-socket-timeout-ms", "HORIZON_REDIS_SOCKET_TIMEOUT_MS", 50, 5);
	c.redis.poolSize = intOr("redis-pool", "HORIZON_REDIS_POOL", 8, 1);

	c.prefetch.enabled = boolFrom(argOrEnv("prefetch", "HORIZON_PREFETCH"), true);
	c.prefetch.interval = msOr("prefetch-interval-ms", "HORIZON_PREFETCH_INTERVAL_MS", Millis(10000), 10);
	c.prefetch.popularityThreshold = intOr("prefetch-popularity", "HORIZON_PREFETCH_POPULARITY", 5, 1);
	c.prefetch.refreshAhead = msOr("prefetch-refresh-ahead-ms", "HORIZON_PREFETCH_REFRESH_AHEAD_MS", Millis(60000), 1);
	c.prefetch.maxItems = intOr("prefetch-max-items", "HORIZON_PREFETCH_MAX_ITEMS", 100, 1);

	c.validation.folds = intOr("folds", "HORIZON_VALIDATION_FOLDS", 5, 2);
	c.validation.randomSeed = (uint32_t)numberOr(argOrEnv("seed", "HORIZON_VALIDATION_SEED"), 42);
	c.validation.horizons = parseHorizonList(argOrEnv("validation-horizons", "HORIZON_VALIDATION_HORIZONS"), c.router.supportedHorizons);
	c.validation.defaultAccuracyThreshold = std::clamp(numberOr(argOrEnv("accuracy-threshold", "HORIZON_ACCURACY_THRESHOLD"), 0.8), 0.0, 1.0);
	c.validation.accuracyThresholds = parseThresholdMap(argOrEnv("accuracy-thresholds", "HORIZON_ACCURACY_THRESHOLDS"));
	c.validation.maxCalibrationError = numberOr(argOrEnv("max-calibration-error", "HORIZON_MAX_CALIBRATION_ERROR"), 0.15);
	c.validation.maxMae = numberOr(argOrEnv("max-mae", "HORIZON_MAX_MAE"), 0.0);
	c.validation.applyRecommendedWeights = boolFrom(argOrEnv("apply-weights", "HORIZON_APPLY_WEIGHTS"), false);

	c.benchmark.iterations = intOr("bench-iterations", "HORIZON_BENCH_ITERATIONS", 1000, 1);
	c.benchmark.warmup = intOr("bench-warmup", "HORIZON_BENCH_WARMUP", 50, 0);
	c.benchmark.concurrency = intOr("bench-concurrency", "HORIZON_BENCH_CONCURRENCY", 10, 1);
	c.benchmark.p95TargetMs = numberOr(argOrEnv("bench-p95-ms", "HORIZON_BENCH_P95_MS"), 500.0);
	c.benchmark.p99TargetMs = numberOr(argOrEnv("bench-p99-ms", "HORIZON_BENCH_P99_MS"), 1000.0);
	c.benchmark.minThroughput = numberOr(argOrEnv("bench-min-throughput", "HORIZON_BENCH_MIN_THROUGHPUT"), 0.0);
	c.benchmark.maxErrorRate = numberOr(argOrEnv("bench-max-error-rate", "HORIZON_BENCH_MAX_ERROR_RATE"), -1.0);
	return c;
}

json Config::toJson() const {
	json thresholds = json::object();
	for (auto &kv : validation.accuracyThresholds) thresholds[std::to_string(kv.first)] = kv.second;
	return json{
		{"mode", mode},
		{"baseDir", baseDir.string()},
		{"storeDir", storeDir.string()},
		{"shortModel", shortModelPath.string()},
		{"longModel", longModelPath.string()},
		{"server", json{{"host", host}, {"port", port}, {"threads", serverThreads},
						{"gatewayWorkers", gatewayWorkers}, {"gatewayQueue", gatewayQueue}}},
		{"engine", json{{"maxConcurrentRequests", engine.maxConcurrentRequests},
						{"requestTimeoutMs", engine.requestTimeout.count()},
						{"cacheTtlMs", engine.cacheTtl.count()},
						{"degradedCacheTtlMs", engine.degradedCacheTtl.count()},
						{"enableCaching", engine.enableCaching}}},
		{"breaker", json{{"failureThreshold", breaker.failureThreshold},
						 {"recoveryTimeoutMs", breaker.recoveryTimeout.count()},
						 {"halfOpenMaxCalls", breaker.halfOpenMaxCalls}}},
		{"router", json{{"shortHorizonMax", router.shortHorizonMax},
						{"longHorizonMin", router.longHorizonMin},
						{"blendLongHorizons", router.blendLongHorizons},
						{"fallbackConfidencePenalty", router.fallbackConfidencePenalty},
						{"disagreementFactor", router.disagreementFactor},
						{"maxDisagreementPenalty", router.maxDisagreementPenalty},
						{"maxRiskFactors", router.maxRiskFactors},
						{"disagreementThreshold", router.disagreementThreshold},
						{"supportedHorizons", router.supportedHorizons}}},
		{"cache", json{{"l1MaxEntries", cache.l1MaxEntries},
					   {"sweepIntervalMs", cache.sweepInterval.count()},
					   {"redisEnabled", redis.enabled},
					   {"redisUrl", redis.url}}},
		{"prefetch", json{{"enabled", prefetch.enabled},
						  {"intervalMs", prefetch.interval.count()},
						  {"popularityThreshold", prefetch.popularityThreshold},
						  {"maxItems", prefetch.maxItems}}},
		{"validation", json{{"folds", validation.folds},
							{"randomSeed", validation.randomSeed},
							{"horizons", validation.horizons},
							{"defaultAccuracyThreshold", validation.defaultAccuracyThreshold},
							{"accuracyThresholds", thresholds},
							{"intervalMs", validationInterval.count()}}}
	};
}

} // namespace horizon
