#ifndef CODEFLOW_FLOW_ROUTERS_H
#define CODEFLOW_FLOW_ROUTERS_H

#include "codeflow/core/types.h"
#include <functional>
#include <string_view>
#include <vector>

namespace codeflow {

// Pure function of state; evaluated only at conditional edges.
using Router = std::function<StepName(const WorkflowState&)>;

namespace steps {
inline constexpr std::string_view kOrchestrator = "orchestrator";
inline constexpr std::string_view kGenerator = "code_generator";
inline constexpr std::string_view kReviewer = "code_reviewer";
inline constexpr std::string_view kDocumenter = "documentation_agent";
inline constexpr std::string_view kFallback = "fallback_agent";
inline constexpr std::string_view kApprovalGate = "human_gate";
} // namespace steps

// Keywords that mark review feedback as needing another generation pass.
const std::vector<std::string>& trouble_indicators();

bool contains_trouble_indicator(std::string_view text);

// False when no feedback has been recorded.
bool needs_retry(const WorkflowState& state);

// GENERATE/REVIEW/DOCUMENT -> matching step; UNKNOWN or unset -> fallback.
StepName route_by_decision(const WorkflowState& state);

// needs_retry -> generator, otherwise documentation.
StepName route_after_review(const WorkflowState& state);

} // namespace codeflow

#endif // CODEFLOW_FLOW_ROUTERS_H
