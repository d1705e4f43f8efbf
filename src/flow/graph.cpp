// src/flow/graph.cpp
#include "codeflow/flow/graph.h"
#include "codeflow/core/errors.h"
#include <algorithm>
#include <queue>

namespace codeflow {

void Graph::add_step(std::unique_ptr<Step> step) {
    if (!step) {
        throw GraphError("Cannot add a null step");
    }
    const StepName name = step->name();
    if (name.empty() || is_terminal(name)) {
        throw GraphError("Invalid step name: '" + name + "'");
    }
    if (steps_.count(name) > 0) {
        throw GraphError("Duplicate step: " + name);
    }
    insertion_order_.push_back(name);
    steps_.emplace(name, std::move(step));
}

void Graph::set_entry(const StepName& name) {
    entry_ = name;
}

void Graph::add_edge(const StepName& from, const StepName& to) {
    if (edges_.count(from) > 0 || conditional_edges_.count(from) > 0) {
        throw GraphError("Step '" + from + "' already has an outgoing edge");
    }
    edges_.emplace(from, to);
}

void Graph::add_conditional_edges(const StepName& from, Router router, std::vector<StepName> destinations) {
    if (edges_.count(from) > 0 || conditional_edges_.count(from) > 0) {
        throw GraphError("Step '" + from + "' already has an outgoing edge");
    }
    if (!router) {
        throw GraphError("Conditional edge from '" + from + "' has no router");
    }
    if (destinations.empty()) {
        throw GraphError("Conditional edge from '" + from + "' declares no destinations");
    }
    ConditionalEdge edge;
    edge.router = std::move(router);
    edge.destinations.insert(destinations.begin(), destinations.end());
    conditional_edges_.emplace(from, std::move(edge));
}

void Graph::bound_loop(const StepName& from, const StepName& retry_target, const StepName& exit_target) {
    auto it = conditional_edges_.find(from);
    if (it == conditional_edges_.end()) {
        throw GraphError("Loop bound on '" + from + "' requires a conditional edge");
    }
    auto& dests = it->second.destinations;
    if (dests.count(retry_target) == 0 || dests.count(exit_target) == 0) {
        throw GraphError("Loop targets of '" + from + "' must be declared destinations");
    }
    if (retry_target == exit_target) {
        throw GraphError("Loop on '" + from + "' needs distinct retry and exit targets");
    }
    it->second.loop = LoopBound{retry_target, exit_target};
}

bool Graph::is_known_destination(const StepName& name) const {
    return is_terminal(name) || steps_.count(name) > 0;
}

void Graph::validate() const {
    if (entry_.empty()) {
        throw GraphError("Graph has no entry step");
    }
    if (steps_.count(entry_) == 0) {
        throw GraphError("Entry step not found: " + entry_);
    }

    for (const auto& [from, to] : edges_) {
        if (steps_.count(from) == 0) {
            throw GraphError("Edge from unknown step: " + from);
        }
        if (!is_known_destination(to)) {
            throw GraphError("Next step not found: " + to + " (from " + from + ")");
        }
    }
    for (const auto& [from, edge] : conditional_edges_) {
        if (steps_.count(from) == 0) {
            throw GraphError("Conditional edge from unknown step: " + from);
        }
        for (const auto& dest : edge.destinations) {
            if (!is_known_destination(dest)) {
                throw GraphError("Next step not found: " + dest + " (from " + from + ")");
            }
        }
    }

    for (const auto& name : insertion_order_) {
        if (edges_.count(name) == 0 && conditional_edges_.count(name) == 0) {
            throw GraphError("Step '" + name + "' has no outgoing edge");
        }
    }

    check_acyclic();
}

void Graph::check_acyclic() const {
    // Kahn 拓扑排序；有界回环边不计入
    std::unordered_map<StepName, int> in_degree;
    std::unordered_map<StepName, std::vector<StepName>> successors;
    for (const auto& name : insertion_order_) {
        in_degree[name] = 0;
    }

    auto link = [&](const StepName& from, const StepName& to) {
        if (is_terminal(to)) return;
        successors[from].push_back(to);
        in_degree[to]++;
    };

    for (const auto& [from, to] : edges_) {
        link(from, to);
    }
    for (const auto& [from, edge] : conditional_edges_) {
        for (const auto& dest : edge.destinations) {
            if (edge.loop.has_value() && dest == edge.loop->retry_target) continue;
            link(from, dest);
        }
    }

    std::queue<StepName> ready;
    for (const auto& name : insertion_order_) {
        if (in_degree[name] == 0) ready.push(name);
    }
    size_t visited = 0;
    while (!ready.empty()) {
        StepName current = ready.front();
        ready.pop();
        ++visited;
        for (const auto& succ : successors[current]) {
            if (--in_degree[succ] == 0) ready.push(succ);
        }
    }

    if (visited != insertion_order_.size()) {
        std::string members;
        for (const auto& name : insertion_order_) {
            if (in_degree[name] > 0) {
                if (!members.empty()) members += ", ";
                members += name;
            }
        }
        throw GraphError("Unbounded cycle among steps: " + members);
    }
}

StepName Graph::next(const StepName& current, const WorkflowState& state) const {
    if (auto it = edges_.find(current); it != edges_.end()) {
        return it->second;
    }
    auto cit = conditional_edges_.find(current);
    if (cit == conditional_edges_.end()) {
        throw GraphError("No outgoing edge from step: " + current);
    }

    const ConditionalEdge& edge = cit->second;
    StepName chosen = edge.router(state);
    if (edge.destinations.count(chosen) == 0) {
        throw GraphError("Router for '" + current + "' returned undeclared destination '" + chosen + "'");
    }
    return chosen;
}

const Step& Graph::step(const StepName& name) const {
    auto it = steps_.find(name);
    if (it == steps_.end()) {
        throw GraphError("Step not found: " + name);
    }
    return *it->second;
}

bool Graph::has_step(const StepName& name) const {
    return steps_.count(name) > 0;
}

const LoopBound* Graph::loop_bound(const StepName& from) const {
    auto it = conditional_edges_.find(from);
    if (it == conditional_edges_.end() || !it->second.loop.has_value()) {
        return nullptr;
    }
    return &*it->second.loop;
}

} // namespace codeflow
