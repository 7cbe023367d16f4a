#pragma once

#include <array>
#include <string>
#include <vector>

#include "types.hpp"

namespace horizon {

enum FeatureIndex {
	kIndustryRisk = 0,
	kCountryRisk,
	kHasWebsite,
	kHasEmail,
	kHasPhone,
	kYearsInBusiness,
	kRevenue,
	kEmployees,
	kHorizon,
	kNameHash,
	kAddressCompleteness,
	kPriorIncidents,
	kFeatureCount
};

using FeatureVector = std::vector<double>;

const char *featureName(int index);
const char *featureCategory(int index);

// Signed contribution weight of each feature; horizon and name hash carry none.
double featureWeight(int index);

double industryPrior(const std::string &industry);
double countryPrior(const std::string &country);

// All entries are scaled into [0,1]. The request is expected to be normalized.
FeatureVector extractFeatures(const RiskAssessmentRequest &request, int horizon);

// Largest absolute value * weight first, ties by feature order. Zero impacts are dropped.
std::vector<RiskFactor> topRiskFactors(const FeatureVector &features, int limit);

} // namespace horizon
