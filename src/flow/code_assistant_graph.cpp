// src/flow/code_assistant_graph.cpp
#include "codeflow/flow/code_assistant_graph.h"
#include "codeflow/core/errors.h"
#include "codeflow/flow/approval.h"
#include "codeflow/flow/routers.h"

namespace codeflow {

PromptSet PromptSet::defaults() {
    PromptSet p;
    p.orchestrator = {
        .system =
            "You are an orchestrator. Decide which agent to call based on the task:\n"
            "- If the task is \"write code\" or \"generate\", respond with GENERATE.\n"
            "- If the task is \"review\" or \"debug\", respond with REVIEW.\n"
            "- If the task is \"add docs\" or \"explain\", respond with DOCUMENT.\n"
            "Respond ONLY with GENERATE, REVIEW, or DOCUMENT.",
        .user = "{{ taskDescription }}",
    };
    p.generation = {
        .system =
            "Write clean, efficient code for: {{ taskDescription }}.\n"
            "Return ONLY the code, no explanations.\n"
            "{% if reviewFeedback != \"\" %}"
            "Address this review of the previous attempt:\n{{ reviewFeedback }}\n"
            "Previous attempt:\n{{ generatedArtifact }}{% endif %}",
        .user = "{{ taskDescription }}",
    };
    p.review = {
        .system =
            "Review this code for errors, inefficiencies, or security flaws:\n"
            "{% if generatedArtifact != \"\" %}{{ generatedArtifact }}{% else %}{{ taskDescription }}{% endif %}\n\n"
            "Suggest concise fixes and improvements.",
        .user = "Review the code above",
    };
    p.documentation = {
        .system =
            "Add detailed comments and a docstring to this code:\n"
            "{% if generatedArtifact != \"\" %}{{ generatedArtifact }}{% else %}{{ taskDescription }}{% endif %}\n\n"
            "Return the code with inline comments.",
        .user = "Document the code",
    };
    p.fallback = {
        .system = "You are a helpful coding assistant.",
        .user = "Task: {{ taskDescription }}",
    };
    return p;
}

namespace {

void override_template(const nlohmann::json& section, const std::string& name, PromptTemplate& target) {
    if (!section.is_object()) {
        throw ConfigError("prompts." + name + " must be a mapping");
    }
    for (auto it = section.begin(); it != section.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigError("prompts." + name + "." + it.key() + " must be a string");
        }
        if (it.key() == "system") {
            target.system = it.value().get<std::string>();
        } else if (it.key() == "user") {
            target.user = it.value().get<std::string>();
        } else {
            throw ConfigError("Unknown prompt field: prompts." + name + "." + it.key());
        }
    }
}

} // namespace

PromptSet PromptSet::from_json(const nlohmann::json& prompts, PromptSet base) {
    if (prompts.is_null()) {
        return base;
    }
    if (!prompts.is_object()) {
        throw ConfigError("prompts must be a mapping");
    }
    for (auto it = prompts.begin(); it != prompts.end(); ++it) {
        const std::string& key = it.key();
        if (key == "orchestrator") override_template(it.value(), key, base.orchestrator);
        else if (key == "generation") override_template(it.value(), key, base.generation);
        else if (key == "review") override_template(it.value(), key, base.review);
        else if (key == "documentation") override_template(it.value(), key, base.documentation);
        else if (key == "fallback") override_template(it.value(), key, base.fallback);
        else throw ConfigError("Unknown prompt section: prompts." + key);
    }
    return base;
}

std::shared_ptr<const Graph> build_code_assistant_graph(const PromptSet& prompts) {
    const StepName orchestrator(steps::kOrchestrator);
    const StepName generator(steps::kGenerator);
    const StepName reviewer(steps::kReviewer);
    const StepName documenter(steps::kDocumenter);
    const StepName fallback(steps::kFallback);
    const StepName gate(steps::kApprovalGate);
    const StepName end(kTerminal);

    auto graph = std::make_shared<Graph>();
    graph->add_step(std::make_unique<OrchestratorStep>(prompts.orchestrator, orchestrator));
    graph->add_step(std::make_unique<GenerationStep>(prompts.generation, generator));
    graph->add_step(std::make_unique<ReviewStep>(prompts.review, reviewer));
    graph->add_step(std::make_unique<DocumentationStep>(prompts.documentation, documenter));
    graph->add_step(std::make_unique<FallbackStep>(prompts.fallback, fallback));
    graph->add_step(std::make_unique<ApprovalGateStep>(gate));

    graph->set_entry(orchestrator);
    graph->add_conditional_edges(orchestrator, route_by_decision, {generator, reviewer, documenter, fallback});
    graph->add_edge(generator, reviewer);
    graph->add_conditional_edges(reviewer, route_after_review, {generator, documenter});
    graph->bound_loop(reviewer, generator, documenter);
    graph->add_edge(documenter, gate);
    graph->add_edge(gate, end);
    graph->add_edge(fallback, end);

    graph->validate();
    return graph;
}

} // namespace codeflow
