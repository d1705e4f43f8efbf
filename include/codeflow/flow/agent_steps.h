#ifndef CODEFLOW_FLOW_AGENT_STEPS_H
#define CODEFLOW_FLOW_AGENT_STEPS_H

#include "codeflow/flow/step.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace codeflow {

// inja templates for one generation call. Both are rendered against
// template_data(state).
struct PromptTemplate {
    std::string system;
    std::string user;
};

// Upper-cased, trimmed response mapped onto the closed decision set;
// anything else (including empty) is UNKNOWN.
RoutingDecision normalize_decision(std::string_view response);

// State fields under their JSON names, unset strings as "".
nlohmann::json template_data(const WorkflowState& state);

// A step that makes exactly one generation call.
class AgentStep : public Step {
public:
    const PromptTemplate& prompt() const { return prompt_; }

protected:
    AgentStep(StepName name, StepKind kind, PromptTemplate prompt);

    // Renders the prompt, calls the service, trims the response.
    // Render failures and ServiceError both surface as StepError.
    std::string call_service(const WorkflowState& state, StepContext& ctx) const;

private:
    PromptTemplate prompt_;
};

class OrchestratorStep : public AgentStep {
public:
    explicit OrchestratorStep(PromptTemplate prompt, StepName name = "orchestrator");
    [[nodiscard]] WorkflowState apply(const WorkflowState& state, StepContext& ctx) const override;
};

class GenerationStep : public AgentStep {
public:
    explicit GenerationStep(PromptTemplate prompt, StepName name = "code_generator");
    [[nodiscard]] WorkflowState apply(const WorkflowState& state, StepContext& ctx) const override;
};

class ReviewStep : public AgentStep {
public:
    explicit ReviewStep(PromptTemplate prompt, StepName name = "code_reviewer");
    [[nodiscard]] WorkflowState apply(const WorkflowState& state, StepContext& ctx) const override;
};

class DocumentationStep : public AgentStep {
public:
    explicit DocumentationStep(PromptTemplate prompt, StepName name = "documentation_agent");
    [[nodiscard]] WorkflowState apply(const WorkflowState& state, StepContext& ctx) const override;
};

// Writes documentedArtifact so every path ends with the same "final text" field.
class FallbackStep : public AgentStep {
public:
    explicit FallbackStep(PromptTemplate prompt, StepName name = "fallback_agent");
    [[nodiscard]] WorkflowState apply(const WorkflowState& state, StepContext& ctx) const override;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_AGENT_STEPS_H
