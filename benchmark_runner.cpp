#include "benchmark_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

#include "errors.hpp"

namespace horizon {

json SlaCheck::toJson() const {
	return json{{"metric", metric}, {"observed", observed}, {"target", target}, {"passed", passed}};
}

json LatencySummary::toJson() const {
	return json{{"min", minMs}, {"max", maxMs}, {"avg", avgMs}, {"p50", p50Ms}, {"p95", p95Ms}, {"p99", p99Ms}};
}

json BenchmarkResult::toJson() const {
	json sla_ = json::array();
	for (auto &c : sla) sla_.push_back(c.toJson());
	return json{
		{"name", name},
		{"iterations", iterations},
		{"warmup", warmup},
		{"concurrency", concurrency},
		{"completed", completed},
		{"successCount", successCount},
		{"errorCount", errorCount},
		{"errorsByCode", errorsByCode},
		{"errorRate", errorRate},
		{"totalDurationMs", totalDurationMs},
		{"throughput", throughput},
		{"latencyMs", latency.toJson()},
		{"sla", sla_},
		{"passed", passed},
		{"interrupted", interrupted}
	};
}

BenchmarkRunner::BenchmarkRunner(BenchmarkOptions options, MetricsPtr metrics)
	: options_(std::move(options)), metrics_(std::move(metrics)) {
	options_.iterations = std::max(1, options_.iterations);
	options_.warmup = std::max(0, options_.warmup);
	options_.concurrency = std::max(1, options_.concurrency);
}

double BenchmarkRunner::percentile(const std::vector<double> &sorted, double p) {
	if (sorted.empty()) return 0.0;
	double rank = std::ceil(std::clamp(p, 0.0, 100.0) / 100.0 * (double)sorted.size());
	size_t idx = rank < 1.0 ? 0 : (size_t)rank - 1;
	return sorted[std::min(idx, sorted.size() - 1)];
}

LatencySummary BenchmarkRunner::summarize(std::vector<double> latenciesMs) {
	LatencySummary s;
	if (latenciesMs.empty()) return s;
	std::sort(latenciesMs.begin(), latenciesMs.end());
	double sum = 0.0;
	for (double v : latenciesMs) sum += v;
	s.minMs = latenciesMs.front();
	s.maxMs = latenciesMs.back();
	s.avgMs = sum / latenciesMs.size();
	s.p50Ms = percentile(latenciesMs, 50);
	s.p95Ms = percentile(latenciesMs, 95);
	s.p99Ms = percentile(latenciesMs, 99);
	return s;
}

std::vector<BenchmarkRunner::Sample> BenchmarkRunner::drive(const ContextPtr &ctx, const Operation &op, int count, int offset) const {
	std::vector<Sample> samples((size_t)count);
	std::vector<char> ran((size_t)count, 0);
	std::atomic<int> next{0};

	auto work = [&]() {
		while (!(ctx && ctx->done())) {
			int i = next.fetch_add(1);
			if (i >= count) break;
			auto &s = samples[(size_t)i];
			auto t0 = std::chrono::steady_clock::now();
			try {
				op(ctx, offset + i);
				s.ok = true;
			} catch (const RiskError &e) {
				s.error = errorCodeName(e.code());
			} catch (const std::exception &) {
				s.error = "exception";
			}
			s.ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
			ran[(size_t)i] = 1;
		}
	};

	int workers = std::min(options_.concurrency, count);
	if (workers <= 1) {
		work();
	} else {
		std::vector<std::thread> pool;
		pool.reserve((size_t)workers);
		for (int w = 0; w < workers; w++) pool.emplace_back(work);
		for (auto &t : pool) t.join();
	}

	std::vector<Sample> out;
	out.reserve(samples.size());
	for (size_t i = 0; i < samples.size(); i++) {
		if (ran[i]) out.push_back(std::move(samples[i]));
	}
	return out;
}

BenchmarkResult BenchmarkRunner::run(const ContextPtr &ctx, const Operation &op) const {
	BenchmarkResult r;
	r.name = options_.name;
	r.iterations = options_.iterations;
	r.warmup = options_.warmup;
	r.concurrency = options_.concurrency;

	if (r.warmup > 0) drive(ctx, op, r.warmup, 0);

	auto t0 = std::chrono::steady_clock::now();
	auto samples = drive(ctx, op, r.iterations, r.warmup);
	r.totalDurationMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

	std::vector<double> latencies;
	latencies.reserve(samples.size());
	for (auto &s : samples) {
		latencies.push_back(s.ms);
		if (s.ok) {
			r.successCount++;
		} else {
			r.errorCount++;
			r.errorsByCode[s.error]++;
		}
		if (metrics_) metrics_->observe("horizon_benchmark_latency_ms", {{"name", r.name}}, s.ms);
	}
	r.completed = samples.size();
	r.interrupted = r.completed < (uint64_t)r.iterations;
	r.errorRate = r.completed ? (double)r.errorCount / r.completed : 0.0;
	r.throughput = r.totalDurationMs > 0 ? r.successCount / (r.totalDurationMs / 1000.0) : 0.0;
	r.latency = summarize(std::move(latencies));

	r.sla.push_back(SlaCheck{"p95_ms", r.latency.p95Ms, options_.p95TargetMs, r.latency.p95Ms <= options_.p95TargetMs});
	r.sla.push_back(SlaCheck{"p99_ms", r.latency.p99Ms, options_.p99TargetMs, r.latency.p99Ms <= options_.p99TargetMs});
	if (options_.minThroughput > 0) {
		r.sla.push_back(SlaCheck{"throughput", r.throughput, options_.minThroughput, r.throughput >= options_.minThroughput});
	}
	if (options_.maxErrorRate >= 0) {
		r.sla.push_back(SlaCheck{"error_rate", r.errorRate, options_.maxErrorRate, r.errorRate <= options_.maxErrorRate});
	}
	r.passed = !r.interrupted && std::all_of(r.sla.begin(), r.sla.end(), [](const SlaCheck &c) { return c.passed; });

	std::cout << "[Benchmark] " << r.name << " n=" << r.completed << " c=" << r.concurrency << " p50=" << r.latency.p50Ms
			  << "ms p95=" << r.latency.p95Ms << "ms p99=" << r.latency.p99Ms << "ms rps=" << r.throughput
			  << " errors=" << r.errorCount << (r.passed ? " PASS" : " FAIL") << std::endl;
	if (metrics_) metrics_->increment("horizon_benchmark_runs_total", {{"result", r.passed ? "pass" : "fail"}});
	return r;
}

} // namespace horizon
