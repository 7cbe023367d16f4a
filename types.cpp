#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace horizon {

namespace {

std::string trimString(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

std::string lowerAscii(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return s;
}

std::string upperAscii(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::toupper(c); });
	return s;
}

// Collapses internal whitespace runs so "Acme  Corp" and "acme corp" share a key.
std::string collapseSpaces(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	bool space = false;
	for (char c : s) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			space = true;
			continue;
		}
		if (space && !out.empty()) out.push_back(' ');
		space = false;
		out.push_back(c);
	}
	return out;
}

std::string digitsOnly(const std::string &s) {
	std::string out;
	for (char c : s) {
		if (std::isdigit(static_cast<unsigned char>(c)) || (c == '+' && out.empty())) out.push_back(c);
	}
	return out;
}

ErrorCode errorCodeFromName(const std::string &name) {
	static const ErrorCode all[] = {
		ErrorCode::ValidationInput, ErrorCode::ResourceExhausted, ErrorCode::Timeout, ErrorCode::Cancelled,
		ErrorCode::CircuitOpen, ErrorCode::ModelInvocation, ErrorCode::CacheBackend,
		ErrorCode::ValidationTargetNotMet, ErrorCode::Internal
	};
	for (auto c : all) {
		if (name == errorCodeName(c)) return c;
	}
	return ErrorCode::Internal;
}

Stage stageFromName(const std::string &name) {
	static const Stage all[] = {
		Stage::Admission, Stage::Validation, Stage::Cache, Stage::Breaker, Stage::Router, Stage::Model, Stage::Harness
	};
	for (auto s : all) {
		if (name == stageName(s)) return s;
	}
	return Stage::Router;
}

RiskLevel levelFromName(const std::string &name) {
	if (name == "critical") return RiskLevel::Critical;
	if (name == "high") return RiskLevel::High;
	if (name == "medium") return RiskLevel::Medium;
	return RiskLevel::Low;
}

std::string stringField(const json &j, const char *key) {
	auto it = j.find(key);
	if (it == j.end() || it->is_null()) return "";
	if (!it->is_string()) {
		throw RiskError(ErrorCode::ValidationInput, Stage::Validation, std::string("field-not-string:") + key);
	}
	return it->get<std::string>();
}

bool boolField(const json &j, const char *key, bool fallback) {
	auto it = j.find(key);
	if (it == j.end() || it->is_null()) return fallback;
	if (!it->is_boolean()) {
		throw RiskError(ErrorCode::ValidationInput, Stage::Validation, std::string("field-not-bool:") + key);
	}
	return it->get<bool>();
}

int horizonValue(const json &v) {
	if (!v.is_number_integer() && !v.is_number_unsigned()) {
		throw RiskError(ErrorCode::ValidationInput, Stage::Validation, "horizon-not-integer");
	}
	return v.get<int>();
}

} // namespace

const char *modelTypeName(ModelType type) {
	switch (type) {
	case ModelType::Auto: return "auto";
	case ModelType::ModelA: return "model_a";
	case ModelType::ModelB: return "model_b";
	case ModelType::Ensemble: return "ensemble";
	}
	return "auto";
}

std::optional<ModelType> parseModelType(const std::string &raw) {
	std::string v = lowerAscii(trimString(raw));
	if (v.empty() || v == "auto") return ModelType::Auto;
	if (v == "model_a" || v == "xgboost" || v == "short") return ModelType::ModelA;
	if (v == "model_b" || v == "lstm" || v == "long") return ModelType::ModelB;
	if (v == "ensemble") return ModelType::Ensemble;
	return std::nullopt;
}

RiskLevel levelForScore(double score) {
	if (score < 0.3) return RiskLevel::Low;
	if (score < 0.6) return RiskLevel::Medium;
	if (score < 0.8) return RiskLevel::High;
	return RiskLevel::Critical;
}

const char *riskLevelName(RiskLevel level) {
	switch (level) {
	case RiskLevel::Low: return "low";
	case RiskLevel::Medium: return "medium";
	case RiskLevel::High: return "high";
	case RiskLevel::Critical: return "critical";
	}
	return "low";
}

uint64_t fnv1a64(const std::string &s) {
	uint64_t h = 1469598103934665603ull;
	for (unsigned char c : s) {
		h ^= c;
		h *= 1099511628211ull;
	}
	return h;
}

json RiskAssessmentRequest::toJson() const {
	return json{
		{"business_name", businessName},
		{"business_address", businessAddress},
		{"industry", industry},
		{"country", country},
		{"phone", phone},
		{"email", email},
		{"website", website},
		{"horizons", horizons},
		{"model_type", modelTypeName(modelType)},
		{"include_comparison", includeComparison},
		{"bypass_cache", bypassCache},
		{"metadata", metadata}
	};
}

RiskAssessmentRequest RiskAssessmentRequest::fromJson(const json &j) {
	if (!j.is_object()) throw RiskError(ErrorCode::ValidationInput, Stage::Validation, "request-not-object");
	RiskAssessmentRequest r;
	r.businessName = stringField(j, "business_name");
	r.businessAddress = stringField(j, "business_address");
	r.industry = stringField(j, "industry");
	r.country = stringField(j, "country");
	r.phone = stringField(j, "phone");
	r.email = stringField(j, "email");
	r.website = stringField(j, "website");
	if (j.contains("horizons") && !j["horizons"].is_null()) {
		if (!j["horizons"].is_array()) throw RiskError(ErrorCode::ValidationInput, Stage::Validation, "horizons-not-array");
		for (auto &h : j["horizons"]) r.horizons.push_back(horizonValue(h));
	}
	if (j.contains("prediction_horizon") && !j["prediction_horizon"].is_null()) {
		r.horizons.push_back(horizonValue(j["prediction_horizon"]));
	}
	auto type = parseModelType(stringField(j, "model_type"));
	if (!type) throw RiskError(ErrorCode::ValidationInput, Stage::Validation, "unknown-model-type");
	r.modelType = *type;
	r.includeComparison = boolField(j, "include_comparison", true);
	r.bypassCache = boolField(j, "bypass_cache", false);
	if (j.contains("metadata") && !j["metadata"].is_null()) {
		if (!j["metadata"].is_object()) throw RiskError(ErrorCode::ValidationInput, Stage::Validation, "metadata-not-object");
		r.metadata = j["metadata"];
	}
	return r;
}

RiskAssessmentRequest normalizeRequest(const RiskAssessmentRequest &request) {
	RiskAssessmentRequest n = request;
	n.businessName = lowerAscii(collapseSpaces(trimString(request.businessName)));
	n.businessAddress = lowerAscii(collapseSpaces(trimString(request.businessAddress)));
	n.industry = lowerAscii(collapseSpaces(trimString(request.industry)));
	n.country = upperAscii(trimString(request.country));
	n.phone = digitsOnly(request.phone);
	n.email = lowerAscii(trimString(request.email));
	n.website = lowerAscii(trimString(request.website));
	while (!n.website.empty() && n.website.back() == '/') n.website.pop_back();
	std::sort(n.horizons.begin(), n.horizons.end());
	n.horizons.erase(std::unique(n.horizons.begin(), n.horizons.end()), n.horizons.end());
	if (n.metadata.is_null()) n.metadata = json::object();
	return n;
}

void validateRequest(const RiskAssessmentRequest &request, const std::vector<int> &supportedHorizons) {
	auto fail = [](const std::string &msg) {
		throw RiskError(ErrorCode::ValidationInput, Stage::Validation, msg);
	};
	if (trimString(request.businessName).empty()) fail("business-name-required");
	if (request.businessName.size() > 255) fail("business-name-too-long");
	if (request.businessAddress.size() > 500) fail("business-address-too-long");
	if (trimString(request.industry).empty()) fail("industry-required");
	if (request.industry.size() > 100) fail("industry-too-long");
	std::string country = trimString(request.country);
	if (country.size() != 2 || !std::isalpha(static_cast<unsigned char>(country[0])) ||
		!std::isalpha(static_cast<unsigned char>(country[1]))) {
		fail("country-must-be-iso2");
	}
	if (request.horizons.empty()) fail("horizon-required");
	if (request.horizons.size() > 8) fail("too-many-horizons");
	for (int h : request.horizons) {
		if (std::find(supportedHorizons.begin(), supportedHorizons.end(), h) == supportedHorizons.end()) {
			fail("unsupported-horizon:" + std::to_string(h));
		}
	}
	if (!request.metadata.is_null() && !request.metadata.is_object()) fail("metadata-not-object");
}

std::string requestFingerprint(const RiskAssessmentRequest &normalized, const std::string &modelVersion) {
	std::ostringstream oss;
	oss << "v1|" << normalized.businessName << "|" << normalized.businessAddress << "|" << normalized.industry
		<< "|" << normalized.country << "|" << normalized.phone << "|" << normalized.email << "|" << normalized.website
		<< "|";
	for (size_t i = 0; i < normalized.horizons.size(); i++) {
		if (i) oss << ",";
		oss << normalized.horizons[i];
	}
	oss << "|" << modelTypeName(normalized.modelType) << "|" << normalized.includeComparison
		<< "|" << normalized.metadata.dump() << "|" << modelVersion;
	char buf[17];
	std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)fnv1a64(oss.str()));
	return std::string(buf);
}

json ModelPrediction::toJson() const {
	return json{
		{"horizon", horizon},
		{"score", score},
		{"level", riskLevelName(level)},
		{"confidence", confidence},
		{"model_id", modelId},
		{"model_version", modelVersion},
		{"role", role},
		{"weight", weight},
		{"latency_us", latencyUs}
	};
}

ModelPrediction ModelPrediction::fromJson(const json &j) {
	ModelPrediction p;
	p.horizon = j.value("horizon", 0);
	p.score = j.value("score", 0.0);
	p.level = levelFromName(j.value("level", std::string("low")));
	p.confidence = j.value("confidence", 0.0);
	p.modelId = j.value("model_id", std::string());
	p.modelVersion = j.value("model_version", std::string());
	p.role = j.value("role", std::string());
	p.weight = j.value("weight", 1.0);
	p.latencyUs = j.value("latency_us", (int64_t)0);
	return p;
}

json ModelComparison::toJson() const {
	return json{
		{"short_score", shortScore},
		{"short_confidence", shortConfidence},
		{"long_score", longScore},
		{"long_confidence", longConfidence},
		{"better_model", betterModel},
		{"score_difference", scoreDifference},
		{"agreement", agreement},
		{"ensemble_more_confident", ensembleMoreConfident}
	};
}

ModelComparison ModelComparison::fromJson(const json &j) {
	ModelComparison c;
	c.shortScore = j.value("short_score", 0.0);
	c.shortConfidence = j.value("short_confidence", 0.0);
	c.longScore = j.value("long_score", 0.0);
	c.longConfidence = j.value("long_confidence", 0.0);
	c.betterModel = j.value("better_model", std::string());
	c.scoreDifference = j.value("score_difference", 0.0);
	c.agreement = j.value("agreement", 1.0);
	c.ensembleMoreConfident = j.value("ensemble_more_confident", false);
	return c;
}

json RiskFactor::toJson() const {
	return json{{"name", name}, {"category", category}, {"value", value}, {"weight", weight}, {"impact", impact}};
}

RiskFactor RiskFactor::fromJson(const json &j) {
	RiskFactor f;
	f.name = j.value("name", std::string());
	f.category = j.value("category", std::string());
	f.value = j.value("value", 0.0);
	f.weight = j.value("weight", 0.0);
	f.impact = j.value("impact", 0.0);
	return f;
}

json AgreementAnalysis::toJson() const {
	json hs = json::object();
	for (auto &kv : byHorizon) hs[std::to_string(kv.first)] = kv.second;
	return json{
		{"overall", overall},
		{"by_horizon", hs},
		{"disagreement_threshold", disagreementThreshold},
		{"high_disagreement_horizons", highDisagreementHorizons}
	};
}

AgreementAnalysis AgreementAnalysis::fromJson(const json &j) {
	AgreementAnalysis a;
	a.overall = j.value("overall", 1.0);
	a.disagreementThreshold = j.value("disagreement_threshold", 0.2);
	if (j.contains("by_horizon") && j["by_horizon"].is_object()) {
		for (auto it = j["by_horizon"].begin(); it != j["by_horizon"].end(); ++it) {
			a.byHorizon[std::stoi(it.key())] = it.value().get<double>();
		}
	}
	if (j.contains("high_disagreement_horizons")) {
		a.highDisagreementHorizons = j["high_disagreement_horizons"].get<std::vector<int>>();
	}
	return a;
}

json HorizonResult::toJson() const {
	json out{{"horizon", horizon}, {"ok", ok}};
	if (ok) {
		json members_ = json::array();
		for (auto &m : members) members_.push_back(m.toJson());
		out["score"] = score;
		out["level"] = riskLevelName(level);
		out["confidence"] = confidence;
		out["model_used"] = modelUsed;
		out["degraded"] = degraded;
		out["members"] = members_;
		out["lower_bound"] = lowerBound;
		out["upper_bound"] = upperBound;
		if (comparison) out["comparison"] = comparison->toJson();
		if (!factors.empty()) {
			json fs = json::array();
			for (auto &f : factors) fs.push_back(f.toJson());
			out["factors"] = fs;
		}
	}
	if (error) {
		out["error"] = json{{"code", errorCodeName(error->code)}, {"stage", stageName(error->stage)}, {"message", error->message}};
	}
	return out;
}

HorizonResult HorizonResult::fromJson(const json &j) {
	HorizonResult r;
	r.horizon = j.value("horizon", 0);
	r.ok = j.value("ok", false);
	if (r.ok) {
		r.score = j.value("score", 0.0);
		r.level = levelFromName(j.value("level", std::string("low")));
		r.confidence = j.value("confidence", 0.0);
		r.modelUsed = j.value("model_used", std::string());
		r.degraded = j.value("degraded", false);
		if (j.contains("members")) {
			for (auto &m : j["members"]) r.members.push_back(ModelPrediction::fromJson(m));
		}
		r.lowerBound = j.value("lower_bound", 0.0);
		r.upperBound = j.value("upper_bound", 1.0);
		if (j.contains("comparison")) r.comparison = ModelComparison::fromJson(j["comparison"]);
		if (j.contains("factors")) {
			for (auto &f : j["factors"]) r.factors.push_back(RiskFactor::fromJson(f));
		}
	}
	if (j.contains("error")) {
		const auto &e = j["error"];
		r.error = HorizonError{errorCodeFromName(e.value("code", std::string("internal"))),
							   stageFromName(e.value("stage", std::string("router"))),
							   e.value("message", std::string())};
	}
	return r;
}

bool EnsembleResult::hasFailures() const {
	return std::any_of(horizons.begin(), horizons.end(), [](const HorizonResult &h) { return !h.ok; });
}

const HorizonResult *EnsembleResult::find(int horizon) const {
	for (auto &h : horizons) {
		if (h.horizon == horizon) return &h;
	}
	return nullptr;
}

json EnsembleResult::toJson() const {
	json hs = json::array();
	for (auto &h : horizons) hs.push_back(h.toJson());
	json out{
		{"fingerprint", fingerprint},
		{"model_version", modelVersion},
		{"degraded", degraded},
		{"created_at_ms", createdAtMs},
		{"horizons", hs}
	};
	if (agreement) out["agreement"] = agreement->toJson();
	return out;
}

EnsembleResult EnsembleResult::fromJson(const json &j) {
	EnsembleResult r;
	r.fingerprint = j.value("fingerprint", std::string());
	r.modelVersion = j.value("model_version", std::string());
	r.degraded = j.value("degraded", false);
	r.createdAtMs = j.value("created_at_ms", (int64_t)0);
	if (j.contains("horizons")) {
		for (auto &h : j["horizons"]) r.horizons.push_back(HorizonResult::fromJson(h));
	}
	if (j.contains("agreement")) r.agreement = AgreementAnalysis::fromJson(j["agreement"]);
	return r;
}

} // namespace horizon
