#include "dataset.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>

#include "features.hpp"

namespace horizon {

namespace {

const std::vector<std::string> kIndustries = {
	"technology", "healthcare", "retail", "manufacturing", "construction", "hospitality",
	"finance", "transportation", "agriculture", "education", "gambling", "cryptocurrency"
};

const std::vector<std::string> kCountries = {"US", "GB", "DE", "CA", "FR", "IN", "BR", "MX", "NG", "RU", "SG", "AU"};

const std::vector<std::string> kNameParts = {
	"acme", "northwind", "globex", "initech", "umbrella", "stark", "wayne", "tyrell", "hooli", "vandelay",
	"soylent", "wonka", "cyberdyne", "gringotts", "oscorp", "pied piper"
};

const std::vector<std::string> kSuffixes = {"llc", "inc", "ltd", "gmbh", "co", "group"};

template <typename T>
const T &pick(std::mt19937 &rng, const std::vector<T> &items) {
	std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
	return items[dist(rng)];
}

} // namespace

json LabeledSample::toJson() const {
	return json{{"request", request.toJson()}, {"horizon", horizon}, {"actual_score", actualScore}};
}

double syntheticRiskCurve(const RiskAssessmentRequest &request, int horizon) {
	auto f = extractFeatures(request, horizon);
	double base = 0.05 + 0.45 * f[kIndustryRisk] + 0.35 * f[kCountryRisk] + 0.25 * f[kPriorIncidents]
		- 0.12 * f[kYearsInBusiness] - 0.05 * f[kHasWebsite] - 0.04 * f[kEmployees];
	// risky profiles drift upward with the horizon, stable ones settle
	double drift = (f[kIndustryRisk] + f[kCountryRisk] - 0.8) * 0.25 * (horizon / 12.0);
	return std::clamp(base + drift, 0.0, 1.0);
}

std::vector<LabeledSample> generateSyntheticDataset(const SyntheticDatasetOptions &options) {
	std::mt19937 rng(options.seed);
	std::uniform_real_distribution<double> unit(0.0, 1.0);
	std::normal_distribution<double> noise(0.0, std::max(0.0, options.noise));
	std::vector<LabeledSample> out;
	out.reserve((size_t)std::max(0, options.businesses) * options.horizons.size());

	for (int i = 0; i < options.businesses; i++) {
		RiskAssessmentRequest r;
		r.businessName = pick(rng, kNameParts) + " " + std::to_string(i) + " " + pick(rng, kSuffixes);
		r.businessAddress = std::to_string(1 + (int)(unit(rng) * 999)) + " market street";
		r.industry = pick(rng, kIndustries);
		r.country = pick(rng, kCountries);
		if (unit(rng) < 0.8) r.website = "https://example-" + std::to_string(i) + ".com";
		if (unit(rng) < 0.85) r.email = "ops@example-" + std::to_string(i) + ".com";
		if (unit(rng) < 0.7) r.phone = "+1555" + std::to_string(1000000 + i);
		r.metadata = json{
			{"years_in_business", std::round(unit(rng) * 40.0)},
			{"annual_revenue", std::round(std::pow(10.0, 4.0 + unit(rng) * 4.0))},
			{"employee_count", std::round(std::pow(10.0, unit(rng) * 3.5))},
			{"prior_incidents", unit(rng) < 0.2 ? std::round(unit(rng) * 6.0) : 0.0}
		};
		r.horizons = options.horizons;
		auto normalized = normalizeRequest(r);
		for (int h : normalized.horizons) {
			LabeledSample s;
			s.request = normalized;
			s.request.horizons = {h};
			s.horizon = h;
			s.actualScore = std::clamp(syntheticRiskCurve(normalized, h) + noise(rng), 0.0, 1.0);
			out.push_back(std::move(s));
		}
	}
	return out;
}

std::vector<LabeledSample> loadJsonLines(const fs::path &path) {
	std::ifstream in(path);
	if (!in) throw std::runtime_error("dataset-unreadable:" + path.string());
	std::vector<LabeledSample> out;
	std::string line;
	int lineNo = 0;
	int skipped = 0;
	while (std::getline(in, line)) {
		lineNo++;
		if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
		try {
			auto j = json::parse(line);
			if (j.contains("request")) {
				LabeledSample s;
				s.request = normalizeRequest(RiskAssessmentRequest::fromJson(j["request"]));
				s.horizon = j.value("horizon", s.request.horizons.empty() ? 0 : s.request.horizons.front());
				s.request.horizons = {s.horizon};
				s.actualScore = std::clamp(j.at("actual_score").get<double>(), 0.0, 1.0);
				out.push_back(std::move(s));
			} else {
				auto scores = j.at("actual_scores");
				json requestJson = j;
				requestJson.erase("actual_scores");
				auto base = normalizeRequest(RiskAssessmentRequest::fromJson(requestJson));
				for (auto it = scores.begin(); it != scores.end(); ++it) {
					LabeledSample s;
					s.request = base;
					s.horizon = std::stoi(it.key());
					s.request.horizons = {s.horizon};
					s.actualScore = std::clamp(it.value().get<double>(), 0.0, 1.0);
					out.push_back(std::move(s));
				}
			}
		} catch (const std::exception &e) {
			skipped++;
			std::cerr << "[Dataset] " << path.filename().string() << ":" << lineNo << " skipped: " << e.what() << std::endl;
		}
	}
	std::cout << "[Dataset] loaded " << out.size() << " samples from " << path.string() << " (" << skipped << " skipped)" << std::endl;
	return out;
}

std::vector<LabeledSample> filterHorizon(const std::vector<LabeledSample> &samples, int horizon) {
	std::vector<LabeledSample> out;
	for (auto &s : samples) {
		if (s.horizon == horizon) out.push_back(s);
	}
	return out;
}

} // namespace horizon
