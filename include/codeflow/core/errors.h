#ifndef CODEFLOW_CORE_ERRORS_H
#define CODEFLOW_CORE_ERRORS_H

#include "codeflow/core/types.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace codeflow {

enum class ServiceErrorKind : uint8_t {
    AUTH,
    NETWORK,
    RATE_LIMIT,
    OTHER
};

// Generation call failed. Never retried by the engine.
class ServiceError : public std::runtime_error {
public:
    ServiceError(ServiceErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ServiceErrorKind kind() const { return kind_; }

private:
    ServiceErrorKind kind_;
};

// A step failed; cause() is set when the failure came from the generation service.
class StepError : public std::runtime_error {
public:
    StepError(StepName step, const std::string& message,
              std::optional<ServiceError> cause = std::nullopt)
        : std::runtime_error("Step '" + step + "' failed: " + message),
          step_(std::move(step)),
          cause_(std::move(cause)) {}

    const StepName& step() const { return step_; }
    const std::optional<ServiceError>& cause() const { return cause_; }

private:
    StepName step_;
    std::optional<ServiceError> cause_;
};

// Malformed topology or a router result outside its declared destinations.
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CheckpointError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown from inside a step that observed cancellation (e.g. the approval wait).
class CancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ErrorKind : uint8_t {
    SERVICE,
    STEP,
    GRAPH,
    CHECKPOINT,
    BUDGET,
    TIMEOUT,
    CANCELLED,
    NOT_FOUND,
    INVALID_INPUT
};

// What a caller gets back from a failed run.
struct RunError {
    ErrorKind kind = ErrorKind::STEP;
    std::string message;
    std::optional<StepName> step;
    std::optional<ServiceErrorKind> service_kind;
};

std::string to_string(ServiceErrorKind kind);
std::string to_string(ErrorKind kind);

nlohmann::json to_json(const RunError& error);

} // namespace codeflow

#endif // CODEFLOW_CORE_ERRORS_H
