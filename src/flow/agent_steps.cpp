// src/flow/agent_steps.cpp
#include "codeflow/flow/agent_steps.h"
#include "codeflow/common/template_renderer.h"
#include "codeflow/common/utils.h"
#include "codeflow/core/errors.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace codeflow {

std::string to_string(StepKind kind) {
    switch (kind) {
        case StepKind::ORCHESTRATOR: return "orchestrator";
        case StepKind::GENERATION: return "generation";
        case StepKind::REVIEW: return "review";
        case StepKind::DOCUMENTATION: return "documentation";
        case StepKind::FALLBACK: return "fallback";
        case StepKind::APPROVAL_GATE: return "approval_gate";
    }
    return "unknown";
}

RoutingDecision normalize_decision(std::string_view response) {
    const std::string decision = to_upper(trim(response));
    if (decision == "GENERATE") return RoutingDecision::GENERATE;
    if (decision == "REVIEW") return RoutingDecision::REVIEW;
    if (decision == "DOCUMENT") return RoutingDecision::DOCUMENT;
    return RoutingDecision::UNKNOWN;
}

nlohmann::json template_data(const WorkflowState& state) {
    auto text = [](const std::optional<std::string>& v) { return v.value_or(std::string{}); };
    return {
        {"taskDescription", state.task_description},
        {"routingDecision", state.routing_decision ? to_string(*state.routing_decision) : std::string{}},
        {"generatedArtifact", text(state.generated_artifact)},
        {"reviewFeedback", text(state.review_feedback)},
        {"documentedArtifact", text(state.documented_artifact)},
        {"retryCount", state.retry_count},
    };
}

// ————————————————————————
// AgentStep
// ————————————————————————

AgentStep::AgentStep(StepName name, StepKind kind, PromptTemplate prompt)
    : Step(std::move(name), kind), prompt_(std::move(prompt)) {}

std::string AgentStep::call_service(const WorkflowState& state, StepContext& ctx) const {
    const nlohmann::json data = template_data(state);

    std::string system;
    std::string user;
    try {
        system = InjaTemplateRenderer::render(prompt_.system, data);
        user = InjaTemplateRenderer::render(prompt_.user, data);
    } catch (const std::runtime_error& e) {
        throw StepError(name(), std::string("prompt rendering failed: ") + e.what());
    }

    try {
        return trim(ctx.generation.complete(system, user, ctx.generation_options()));
    } catch (const ServiceError& e) {
        throw StepError(name(), std::string("generation service failed (") + to_string(e.kind()) + "): " + e.what(), e);
    }
}

// ————————————————————————
// OrchestratorStep
// ————————————————————————

OrchestratorStep::OrchestratorStep(PromptTemplate prompt, StepName name)
    : AgentStep(std::move(name), StepKind::ORCHESTRATOR, std::move(prompt)) {}

WorkflowState OrchestratorStep::apply(const WorkflowState& state, StepContext& ctx) const {
    WorkflowState next = state;
    try {
        std::string response = call_service(state, ctx);
        next.routing_decision = normalize_decision(response);
        if (*next.routing_decision == RoutingDecision::UNKNOWN) {
            spdlog::warn("[{}] unrecognized classification '{}', routing to fallback", ctx.run_id, response);
        }
    } catch (const StepError& e) {
        if (!e.cause().has_value() || ctx.config.strict_classification) {
            throw;
        }
        spdlog::warn("[{}] classification call failed, routing to fallback: {}", ctx.run_id, e.cause()->what());
        next.routing_decision = RoutingDecision::UNKNOWN;
    }
    return next;
}

// ————————————————————————
// GenerationStep
// ————————————————————————

GenerationStep::GenerationStep(PromptTemplate prompt, StepName name)
    : AgentStep(std::move(name), StepKind::GENERATION, std::move(prompt)) {}

WorkflowState GenerationStep::apply(const WorkflowState& state, StepContext& ctx) const {
    WorkflowState next = state;
    next.generated_artifact = call_service(state, ctx);
    return next;
}

// ————————————————————————
// ReviewStep
// ————————————————————————

ReviewStep::ReviewStep(PromptTemplate prompt, StepName name)
    : AgentStep(std::move(name), StepKind::REVIEW, std::move(prompt)) {}

WorkflowState ReviewStep::apply(const WorkflowState& state, StepContext& ctx) const {
    WorkflowState next = state;
    next.review_feedback = call_service(state, ctx);
    return next;
}

// ————————————————————————
// DocumentationStep
// ————————————————————————

DocumentationStep::DocumentationStep(PromptTemplate prompt, StepName name)
    : AgentStep(std::move(name), StepKind::DOCUMENTATION, std::move(prompt)) {}

WorkflowState DocumentationStep::apply(const WorkflowState& state, StepContext& ctx) const {
    WorkflowState next = state;
    next.documented_artifact = call_service(state, ctx);
    return next;
}

// ————————————————————————
// FallbackStep
// ————————————————————————

FallbackStep::FallbackStep(PromptTemplate prompt, StepName name)
    : AgentStep(std::move(name), StepKind::FALLBACK, std::move(prompt)) {}

WorkflowState FallbackStep::apply(const WorkflowState& state, StepContext& ctx) const {
    WorkflowState next = state;
    next.documented_artifact = call_service(state, ctx);
    return next;
}

} // namespace codeflow
