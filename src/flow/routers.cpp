// src/flow/routers.cpp
#include "codeflow/flow/routers.h"
#include "codeflow/common/utils.h"

namespace codeflow {

const std::vector<std::string>& trouble_indicators() {
    static const std::vector<std::string> indicators = {"error", "fix"};
    return indicators;
}

bool contains_trouble_indicator(std::string_view text) {
    for (const auto& keyword : trouble_indicators()) {
        if (contains_ci(text, keyword)) {
            return true;
        }
    }
    return false;
}

bool needs_retry(const WorkflowState& state) {
    return state.review_feedback.has_value() && contains_trouble_indicator(*state.review_feedback);
}

StepName route_by_decision(const WorkflowState& state) {
    if (!state.routing_decision.has_value()) {
        return StepName(steps::kFallback);
    }
    switch (*state.routing_decision) {
        case RoutingDecision::GENERATE: return StepName(steps::kGenerator);
        case RoutingDecision::REVIEW: return StepName(steps::kReviewer);
        case RoutingDecision::DOCUMENT: return StepName(steps::kDocumenter);
        case RoutingDecision::UNKNOWN: break;
    }
    return StepName(steps::kFallback);
}

StepName route_after_review(const WorkflowState& state) {
    return needs_retry(state) ? StepName(steps::kGenerator) : StepName(steps::kDocumenter);
}

} // namespace codeflow
