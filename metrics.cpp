#include "metrics.hpp"

#include <algorithm>
#include <sstream>

namespace horizon {

InMemoryMetrics::InMemoryMetrics(std::vector<double> bucketBounds) : bounds_(std::move(bucketBounds)) {
	std::sort(bounds_.begin(), bounds_.end());
}

// Renders {a="x",b="y"}; std::map keeps label order stable.
std::string InMemoryMetrics::labelKey(const Labels &labels) {
	if (labels.empty()) return "";
	std::ostringstream out;
	out << "{";
	bool first = true;
	for (auto &kv : labels) {
		if (!first) out << ",";
		first = false;
		out << kv.first << "=\"";
		for (char c : kv.second) {
			if (c == '"' || c == '\\') out << '\\';
			if (c == '\n') {
				out << "\\n";
				continue;
			}
			out << c;
		}
		out << "\"";
	}
	out << "}";
	return out.str();
}

void InMemoryMetrics::increment(const std::string &name, const Labels &labels, double delta) {
	std::lock_guard<std::mutex> lock(mu_);
	counters_[name][labelKey(labels)] += delta;
}

void InMemoryMetrics::gauge(const std::string &name, const Labels &labels, double value) {
	std::lock_guard<std::mutex> lock(mu_);
	gauges_[name][labelKey(labels)] = value;
}

void InMemoryMetrics::observe(const std::string &name, const Labels &labels, double value) {
	std::lock_guard<std::mutex> lock(mu_);
	auto &h = histograms_[name][labelKey(labels)];
	if (h.buckets.empty()) h.buckets.assign(bounds_.size(), 0);
	h.count++;
	h.sum += value;
	for (size_t i = 0; i < bounds_.size(); i++) {
		if (value <= bounds_[i]) h.buckets[i]++;
	}
}

double InMemoryMetrics::counter(const std::string &name, const Labels &labels) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = counters_.find(name);
	if (it == counters_.end()) return 0.0;
	auto jt = it->second.find(labelKey(labels));
	return jt == it->second.end() ? 0.0 : jt->second;
}

double InMemoryMetrics::gaugeValue(const std::string &name, const Labels &labels) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = gauges_.find(name);
	if (it == gauges_.end()) return 0.0;
	auto jt = it->second.find(labelKey(labels));
	return jt == it->second.end() ? 0.0 : jt->second;
}

uint64_t InMemoryMetrics::observations(const std::string &name, const Labels &labels) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = histograms_.find(name);
	if (it == histograms_.end()) return 0;
	auto jt = it->second.find(labelKey(labels));
	return jt == it->second.end() ? 0 : jt->second.count;
}

json InMemoryMetrics::snapshot() const {
	std::lock_guard<std::mutex> lock(mu_);
	json out{{"counters", json::object()}, {"gauges", json::object()}, {"histograms", json::object()}};
	for (auto &series : counters_) {
		for (auto &kv : series.second) out["counters"][series.first + kv.first] = kv.second;
	}
	for (auto &series : gauges_) {
		for (auto &kv : series.second) out["gauges"][series.first + kv.first] = kv.second;
	}
	for (auto &series : histograms_) {
		for (auto &kv : series.second) {
			const auto &h = kv.second;
			out["histograms"][series.first + kv.first] =
				json{{"count", h.count}, {"sum", h.sum}, {"avg", h.count ? h.sum / h.count : 0.0}};
		}
	}
	return out;
}

std::string InMemoryMetrics::renderPrometheus() const {
	std::lock_guard<std::mutex> lock(mu_);
	std::ostringstream out;
	for (auto &series : counters_) {
		out << "# TYPE " << series.first << " counter\n";
		for (auto &kv : series.second) out << series.first << kv.first << " " << kv.second << "\n";
	}
	for (auto &series : gauges_) {
		out << "# TYPE " << series.first << " gauge\n";
		for (auto &kv : series.second) out << series.first << kv.first << " " << kv.second << "\n";
	}
	for (auto &series : histograms_) {
		out << "# TYPE " << series.first << " histogram\n";
		for (auto &kv : series.second) {
			const auto &h = kv.second;
			// splice le="..." into the existing label set
			std::string inner = kv.first.empty() ? "" : kv.first.substr(1, kv.first.size() - 2) + ",";
			for (size_t i = 0; i < bounds_.size(); i++) {
				out << series.first << "_bucket{" << inner << "le=\"" << bounds_[i] << "\"} " << h.buckets[i] << "\n";
			}
			out << series.first << "_bucket{" << inner << "le=\"+Inf\"} " << h.count << "\n";
			out << series.first << "_sum" << kv.first << " " << h.sum << "\n";
			out << series.first << "_count" << kv.first << " " << h.count << "\n";
		}
	}
	return out.str();
}

} // namespace horizon
