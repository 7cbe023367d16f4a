#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace horizon {

using json = nlohmann::json;
using Labels = std::map<std::string, std::string>;

class MetricsSink {
public:
	virtual ~MetricsSink() = default;
	virtual void increment(const std::string &name, const Labels &labels = {}, double delta = 1.0) = 0;
	virtual void gauge(const std::string &name, const Labels &labels, double value) = 0;
	virtual void observe(const std::string &name, const Labels &labels, double value) = 0;
};

using MetricsPtr = std::shared_ptr<MetricsSink>;

class NullMetrics : public MetricsSink {
public:
	void increment(const std::string &, const Labels &, double) override {}
	void gauge(const std::string &, const Labels &, double) override {}
	void observe(const std::string &, const Labels &, double) override {}
};

// Thread-safe registry that renders JSON and Prometheus text exposition.
class InMemoryMetrics : public MetricsSink {
public:
	explicit InMemoryMetrics(std::vector<double> bucketBounds = {1, 5, 10, 25, 50, 100, 250, 500, 1000, 2500});

	void increment(const std::string &name, const Labels &labels = {}, double delta = 1.0) override;
	void gauge(const std::string &name, const Labels &labels, double value) override;
	void observe(const std::string &name, const Labels &labels, double value) override;

	double counter(const std::string &name, const Labels &labels = {}) const;
	double gaugeValue(const std::string &name, const Labels &labels = {}) const;
	uint64_t observations(const std::string &name, const Labels &labels = {}) const;

	json snapshot() const;
	std::string renderPrometheus() const;

private:
	struct Histogram {
		uint64_t count{0};
		double sum{0.0};
		std::vector<uint64_t> buckets;
	};

	static std::string labelKey(const Labels &labels);

	std::vector<double> bounds_;
	mutable std::mutex mu_;
	std::map<std::string, std::map<std::string, double>> counters_;
	std::map<std::string, std::map<std::string, double>> gauges_;
	std::map<std::string, std::map<std::string, Histogram>> histograms_;
};

} // namespace horizon
