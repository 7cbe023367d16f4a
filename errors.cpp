#include "errors.hpp"

namespace horizon {

const char *errorCodeName(ErrorCode code) {
	switch (code) {
	case ErrorCode::ValidationInput: return "validation_input";
	case ErrorCode::ResourceExhausted: return "resource_exhausted";
	case ErrorCode::Timeout: return "timeout";
	case ErrorCode::Cancelled: return "cancelled";
	case ErrorCode::CircuitOpen: return "circuit_open";
	case ErrorCode::ModelInvocation: return "model_invocation";
	case ErrorCode::CacheBackend: return "cache_backend";
	case ErrorCode::ValidationTargetNotMet: return "validation_target_not_met";
	case ErrorCode::Internal: return "internal";
	}
	return "internal";
}

const char *stageName(Stage stage) {
	switch (stage) {
	case Stage::Admission: return "admission";
	case Stage::Validation: return "validation";
	case Stage::Cache: return "cache";
	case Stage::Breaker: return "breaker";
	case Stage::Router: return "router";
	case Stage::Model: return "model";
	case Stage::Harness: return "harness";
	}
	return "router";
}

RiskError::RiskError(ErrorCode code, Stage stage, const std::string &message)
	: std::runtime_error(std::string(errorCodeName(code)) + "@" + stageName(stage) + ": " + message),
	  code_(code), stage_(stage), detail_(message) {}

bool RiskError::countsAsBreakerFailure() const {
	if (code_ == ErrorCode::ModelInvocation) return true;
	if (code_ == ErrorCode::Timeout) return stage_ == Stage::Model;
	return false;
}

} // namespace horizon
