#pragma once

#include <stdexcept>
#include <string>

namespace horizon {

enum class ErrorCode {
	ValidationInput,
	ResourceExhausted,
	Timeout,
	Cancelled,
	CircuitOpen,
	ModelInvocation,
	CacheBackend,
	ValidationTargetNotMet,
	Internal
};

enum class Stage {
	Admission,
	Validation,
	Cache,
	Breaker,
	Router,
	Model,
	Harness
};

const char *errorCodeName(ErrorCode code);
const char *stageName(Stage stage);

class RiskError : public std::runtime_error {
public:
	RiskError(ErrorCode code, Stage stage, const std::string &message);

	ErrorCode code() const { return code_; }
	Stage stage() const { return stage_; }
	// Message without the code@stage prefix.
	const std::string &detail() const { return detail_; }

	// Only genuine invocation errors and deadline expiry inside a model call
	// are counted by the circuit breaker.
	bool countsAsBreakerFailure() const;

private:
	ErrorCode code_;
	Stage stage_;
	std::string detail_;
};

} // namespace horizon
