#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "context.hpp"
#include "metrics.hpp"

namespace horizon {

struct SlaCheck {
	std::string metric;
	double observed{0.0};
	double target{0.0};
	bool passed{false};

	json toJson() const;
};

struct LatencySummary {
	double minMs{0.0};
	double maxMs{0.0};
	double avgMs{0.0};
	double p50Ms{0.0};
	double p95Ms{0.0};
	double p99Ms{0.0};

	json toJson() const;
};

struct BenchmarkResult {
	std::string name;
	int iterations{0};
	int warmup{0};
	int concurrency{1};
	uint64_t completed{0};
	uint64_t successCount{0};
	uint64_t errorCount{0};
	std::map<std::string, uint64_t> errorsByCode;
	double errorRate{0.0};
	double totalDurationMs{0.0};
	double throughput{0.0};
	LatencySummary latency;
	std::vector<SlaCheck> sla;
	bool passed{false};
	bool interrupted{false};

	json toJson() const;
};

// Drives an operation N times after a discarded warmup prefix. The operation
// signals failure by throwing; RiskError codes are tallied by name.
class BenchmarkRunner {
public:
	using Operation = std::function<void(const ContextPtr &ctx, int iteration)>;

	explicit BenchmarkRunner(BenchmarkOptions options, MetricsPtr metrics = nullptr);

	BenchmarkResult run(const ContextPtr &ctx, const Operation &op) const;

	// Nearest-rank percentile over an ascending vector; 0 when empty.
	static double percentile(const std::vector<double> &sorted, double p);
	static LatencySummary summarize(std::vector<double> latenciesMs);

	const BenchmarkOptions &options() const { return options_; }

private:
	struct Sample {
		double ms{0.0};
		bool ok{false};
		std::string error;
	};

	std::vector<Sample> drive(const ContextPtr &ctx, const Operation &op, int count, int offset) const;

	BenchmarkOptions options_;
	MetricsPtr metrics_;
};

} // namespace horizon
