// src/core/types.cpp
#include "codeflow/core/types.h"
#include "codeflow/common/utils.h"
#include <stdexcept>

namespace codeflow {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

} // namespace

std::string to_string(RoutingDecision decision) {
    switch (decision) {
        case RoutingDecision::GENERATE: return "GENERATE";
        case RoutingDecision::REVIEW: return "REVIEW";
        case RoutingDecision::DOCUMENT: return "DOCUMENT";
        case RoutingDecision::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string to_string(ApprovalStatus status) {
    return status == ApprovalStatus::APPROVED ? "approved" : "rejected";
}

WorkflowState make_initial_state(std::string task_description) {
    if (trim(task_description).empty()) {
        throw std::invalid_argument("Task description must not be empty");
    }
    WorkflowState state;
    state.task_description = std::move(task_description);
    return state;
}

void to_json(nlohmann::json& j, const WorkflowState& state) {
    j = nlohmann::json::object();
    j["taskDescription"] = state.task_description;
    put_optional(j, "routingDecision", state.routing_decision);
    put_optional(j, "generatedArtifact", state.generated_artifact);
    put_optional(j, "reviewFeedback", state.review_feedback);
    put_optional(j, "documentedArtifact", state.documented_artifact);
    put_optional(j, "approvalStatus", state.approval_status);
    j["retryCount"] = state.retry_count;
}

void from_json(const nlohmann::json& j, WorkflowState& state) {
    if (!j.is_object()) {
        throw std::runtime_error("WorkflowState record must be a JSON object");
    }
    state.task_description = j.at("taskDescription").get<std::string>();
    get_optional(j, "routingDecision", state.routing_decision);
    get_optional(j, "generatedArtifact", state.generated_artifact);
    get_optional(j, "reviewFeedback", state.review_feedback);
    get_optional(j, "documentedArtifact", state.documented_artifact);
    get_optional(j, "approvalStatus", state.approval_status);
    state.retry_count = j.value("retryCount", 0);
}

} // namespace codeflow
