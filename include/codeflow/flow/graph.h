#ifndef CODEFLOW_FLOW_GRAPH_H
#define CODEFLOW_FLOW_GRAPH_H

#include "codeflow/flow/routers.h"
#include "codeflow/flow/step.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace codeflow {

// Marks a conditional edge as the designed feedback cycle: the engine lets
// the router pick retry_target at most max_retries times, then forces exit_target.
struct LoopBound {
    StepName retry_target;
    StepName exit_target;
};

struct ConditionalEdge {
    Router router;
    std::unordered_set<StepName> destinations;
    std::optional<LoopBound> loop;
};

// Static workflow topology. Built once, validated, then shared read-only as
// std::shared_ptr<const Graph> by every run.
class Graph {
public:
    Graph() = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;

    // --- construction ---
    void add_step(std::unique_ptr<Step> step);
    void set_entry(const StepName& name);
    void add_edge(const StepName& from, const StepName& to);
    void add_conditional_edges(const StepName& from, Router router, std::vector<StepName> destinations);
    void bound_loop(const StepName& from, const StepName& retry_target, const StepName& exit_target);

    // Throws GraphError describing the first structural problem found.
    void validate() const;

    // --- queries (thread-safe on a const Graph) ---
    // Fixed destination, or the router's choice checked against the declared set.
    StepName next(const StepName& current, const WorkflowState& state) const;

    const Step& step(const StepName& name) const;
    bool has_step(const StepName& name) const;
    const StepName& entry() const { return entry_; }
    size_t step_count() const { return steps_.size(); }

    // nullptr when the edge leaving `from` is not a bounded loop
    const LoopBound* loop_bound(const StepName& from) const;

    static bool is_terminal(const StepName& name) { return name == kTerminal; }

private:
    std::unordered_map<StepName, std::unique_ptr<Step>> steps_;
    std::vector<StepName> insertion_order_;
    StepName entry_;
    std::unordered_map<StepName, StepName> edges_;
    std::unordered_map<StepName, ConditionalEdge> conditional_edges_;

    bool is_known_destination(const StepName& name) const;
    void check_acyclic() const;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_GRAPH_H
