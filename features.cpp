#include "features.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace horizon {

namespace {

double clamp01(double v) {
	if (!std::isfinite(v)) return 0.0;
	return std::clamp(v, 0.0, 1.0);
}

double metadataNumber(const json &metadata, const char *key) {
	if (!metadata.is_object()) return 0.0;
	auto it = metadata.find(key);
	if (it == metadata.end()) return 0.0;
	if (it->is_number()) return std::max(0.0, it->get<double>());
	if (it->is_string()) {
		try {
			return std::max(0.0, std::stod(it->get<std::string>()));
		} catch (const std::exception &) {
			return 0.0;
		}
	}
	return 0.0;
}

} // namespace

const char *featureName(int index) {
	static const char *names[kFeatureCount] = {
		"industry_risk", "country_risk", "has_website", "has_email", "has_phone", "years_in_business",
		"revenue", "employees", "horizon", "name_hash", "address_completeness", "prior_incidents"
	};
	if (index < 0 || index >= kFeatureCount) return "unknown";
	return names[index];
}

const char *featureCategory(int index) {
	static const char *categories[kFeatureCount] = {
		"operational", "geopolitical", "reputational", "reputational", "operational", "financial",
		"financial", "operational", "temporal", "identity", "compliance", "compliance"
	};
	if (index < 0 || index >= kFeatureCount) return "unknown";
	return categories[index];
}

double featureWeight(int index) {
	static const double weights[kFeatureCount] = {
		0.45, 0.35, -0.05, -0.03, -0.02, -0.12, -0.06, -0.04, 0.0, 0.0, -0.03, 0.25
	};
	if (index < 0 || index >= kFeatureCount) return 0.0;
	return weights[index];
}

std::vector<RiskFactor> topRiskFactors(const FeatureVector &features, int limit) {
	std::vector<RiskFactor> out;
	if (limit <= 0) return out;
	int n = std::min((int)features.size(), (int)kFeatureCount);
	for (int i = 0; i < n; i++) {
		double impact = features[i] * featureWeight(i);
		if (impact == 0.0 || !std::isfinite(impact)) continue;
		out.push_back(RiskFactor{featureName(i), featureCategory(i), features[i], featureWeight(i), impact});
	}
	std::stable_sort(out.begin(), out.end(), [](const RiskFactor &a, const RiskFactor &b) {
		return std::abs(a.impact) > std::abs(b.impact);
	});
	if ((int)out.size() > limit) out.resize(limit);
	return out;
}

double industryPrior(const std::string &industry) {
	static const std::unordered_map<std::string, double> priors = {
		{"technology", 0.35}, {"software", 0.3}, {"healthcare", 0.3}, {"education", 0.25},
		{"finance", 0.45}, {"fintech", 0.5}, {"retail", 0.45}, {"manufacturing", 0.45},
		{"construction", 0.55}, {"hospitality", 0.6}, {"restaurant", 0.6}, {"transportation", 0.5},
		{"agriculture", 0.5}, {"energy", 0.4}, {"real estate", 0.5}, {"gambling", 0.8},
		{"cryptocurrency", 0.85}, {"adult", 0.8}, {"firearms", 0.75}, {"travel", 0.55}
	};
	auto it = priors.find(industry);
	if (it != priors.end()) return it->second;
	for (auto &kv : priors) {
		if (industry.find(kv.first) != std::string::npos) return kv.second;
	}
	return 0.45;
}

double countryPrior(const std::string &country) {
	static const std::unordered_map<std::string, double> priors = {
		{"US", 0.25}, {"CA", 0.2}, {"GB", 0.25}, {"DE", 0.2}, {"FR", 0.25}, {"NL", 0.2},
		{"SE", 0.15}, {"CH", 0.2}, {"JP", 0.2}, {"AU", 0.2}, {"SG", 0.2}, {"NZ", 0.15},
		{"IN", 0.45}, {"CN", 0.5}, {"BR", 0.5}, {"MX", 0.5}, {"ZA", 0.5}, {"TR", 0.55},
		{"NG", 0.7}, {"VE", 0.75}, {"RU", 0.8}, {"IR", 0.9}, {"KP", 0.95}, {"SY", 0.9}
	};
	auto it = priors.find(country);
	return it == priors.end() ? 0.4 : it->second;
}

FeatureVector extractFeatures(const RiskAssessmentRequest &request, int horizon) {
	FeatureVector f((size_t)kFeatureCount, 0.0);
	f[kIndustryRisk] = industryPrior(request.industry);
	f[kCountryRisk] = countryPrior(request.country);
	f[kHasWebsite] = request.website.empty() ? 0.0 : 1.0;
	f[kHasEmail] = request.email.find('@') == std::string::npos ? 0.0 : 1.0;
	f[kHasPhone] = request.phone.size() >= 7 ? 1.0 : 0.0;

	double years = metadataNumber(request.metadata, "years_in_business");
	double revenue = metadataNumber(request.metadata, "annual_revenue");
	double employees = metadataNumber(request.metadata, "employee_count");
	double incidents = metadataNumber(request.metadata, "prior_incidents");
	f[kYearsInBusiness] = clamp01(std::log1p(years) / std::log1p(50.0));
	f[kRevenue] = clamp01(std::log10(1.0 + revenue) / 9.0);
	f[kEmployees] = clamp01(std::log10(1.0 + employees) / 5.0);
	f[kHorizon] = clamp01(horizon / 24.0);
	f[kNameHash] = (double)(fnv1a64(request.businessName) % 10000ull) / 10000.0;
	f[kAddressCompleteness] = clamp01(request.businessAddress.size() / 60.0);
	f[kPriorIncidents] = clamp01(std::min(incidents, 10.0) / 10.0);
	return f;
}

} // namespace horizon
