#ifndef CODEFLOW_FLOW_CODE_ASSISTANT_GRAPH_H
#define CODEFLOW_FLOW_CODE_ASSISTANT_GRAPH_H

#include "codeflow/flow/agent_steps.h"
#include "codeflow/flow/graph.h"
#include <nlohmann/json.hpp>
#include <memory>

namespace codeflow {

// Instruction templates of the five agent steps.
struct PromptSet {
    PromptTemplate orchestrator;
    PromptTemplate generation;
    PromptTemplate review;
    PromptTemplate documentation;
    PromptTemplate fallback;

    static PromptSet defaults();

    // Overrides from the `prompts:` config section, e.g.
    //   prompts: { review: { system: "...", user: "..." } }
    // Unknown sections or non-string values throw ConfigError.
    static PromptSet from_json(const nlohmann::json& prompts, PromptSet base = defaults());
};

// orchestrator -> {code_generator | code_reviewer | documentation_agent | fallback_agent}
// code_generator -> code_reviewer -> {code_generator (bounded) | documentation_agent}
// documentation_agent -> human_gate -> end, fallback_agent -> end
std::shared_ptr<const Graph> build_code_assistant_graph(const PromptSet& prompts = PromptSet::defaults());

} // namespace codeflow

#endif // CODEFLOW_FLOW_CODE_ASSISTANT_GRAPH_H
