#ifndef CODEFLOW_CORE_TYPES_H
#define CODEFLOW_CORE_TYPES_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace codeflow {

// 步骤名称, e.g. "code_reviewer"
using StepName = std::string;

// Destination marker that ends a run.
inline constexpr std::string_view kTerminal = "__end__";

enum class RoutingDecision : uint8_t {
    GENERATE,
    REVIEW,
    DOCUMENT,
    UNKNOWN
};

enum class ApprovalStatus : uint8_t {
    APPROVED,
    REJECTED
};

NLOHMANN_JSON_SERIALIZE_ENUM(RoutingDecision, {
    {RoutingDecision::UNKNOWN, "UNKNOWN"},
    {RoutingDecision::GENERATE, "GENERATE"},
    {RoutingDecision::REVIEW, "REVIEW"},
    {RoutingDecision::DOCUMENT, "DOCUMENT"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ApprovalStatus, {
    {ApprovalStatus::REJECTED, "rejected"},
    {ApprovalStatus::APPROVED, "approved"},
})

std::string to_string(RoutingDecision decision);
std::string to_string(ApprovalStatus status);

// The record threaded through every step of a run.
// Each run owns its own copy; steps never see another run's state.
struct WorkflowState {
    std::string task_description;
    std::optional<RoutingDecision> routing_decision;
    std::optional<std::string> generated_artifact;
    std::optional<std::string> review_feedback;
    std::optional<std::string> documented_artifact;
    std::optional<ApprovalStatus> approval_status;
    int retry_count = 0; // 只由引擎修改

    bool operator==(const WorkflowState&) const = default;
};

// Throws std::invalid_argument when the task is empty or whitespace only.
WorkflowState make_initial_state(std::string task_description);

// JSON record uses taskDescription, routingDecision, generatedArtifact,
// reviewFeedback, documentedArtifact, approvalStatus, retryCount.
void to_json(nlohmann::json& j, const WorkflowState& state);
void from_json(const nlohmann::json& j, WorkflowState& state);

} // namespace codeflow

#endif // CODEFLOW_CORE_TYPES_H
