// src/core/errors.cpp
#include "codeflow/core/errors.h"

namespace codeflow {

std::string to_string(ServiceErrorKind kind) {
    switch (kind) {
        case ServiceErrorKind::AUTH: return "auth";
        case ServiceErrorKind::NETWORK: return "network";
        case ServiceErrorKind::RATE_LIMIT: return "rateLimit";
        case ServiceErrorKind::OTHER: return "other";
    }
    return "other";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SERVICE: return "service";
        case ErrorKind::STEP: return "step";
        case ErrorKind::GRAPH: return "graph";
        case ErrorKind::CHECKPOINT: return "checkpoint";
        case ErrorKind::BUDGET: return "budget";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CANCELLED: return "cancelled";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::INVALID_INPUT: return "invalid_input";
    }
    return "step";
}

nlohmann::json to_json(const RunError& error) {
    nlohmann::json j;
    j["kind"] = to_string(error.kind);
    j["message"] = error.message;
    j["step"] = error.step.has_value() ? nlohmann::json(*error.step) : nlohmann::json(nullptr);
    if (error.service_kind.has_value()) {
        j["serviceKind"] = to_string(*error.service_kind);
    }
    return j;
}

} // namespace codeflow
