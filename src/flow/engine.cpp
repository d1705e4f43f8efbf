// src/flow/engine.cpp
#include "codeflow/flow/engine.h"
#include "codeflow/common/utils.h"
#include "codeflow/flow/execution_session.h"
#include "codeflow/flow/retry_bound.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace codeflow {

namespace {

RunResult failed(const std::string& run_id, WorkflowState state, RunError error) {
    RunResult result;
    result.run_id = run_id;
    result.final_state = std::move(state);
    result.message = error.message;
    result.error = std::move(error);
    return result;
}

void abort_run(RunResult& result, RunError error, const StepName& at) {
    spdlog::error("[{}] run aborted at {}: {}", result.run_id, at, error.message);
    result.success = false;
    result.message = error.message;
    result.error = std::move(error);
    result.stopped_at = at;
}

} // namespace

nlohmann::json RunResult::summary() const {
    const nlohmann::json state = final_state;
    return nlohmann::json{
        {"decision", state["routingDecision"]},
        {"generatedArtifact", state["generatedArtifact"]},
        {"reviewFeedback", state["reviewFeedback"]},
        {"documentedArtifact", state["documentedArtifact"]},
        {"approvalStatus", state["approvalStatus"]},
    };
}

nlohmann::json to_json(const RunResult& result) {
    nlohmann::json j;
    j["runId"] = result.run_id;
    j["success"] = result.success;
    j["message"] = result.message;
    j["result"] = result.summary();
    j["retryCount"] = result.final_state.retry_count;
    j["stepsExecuted"] = result.steps_executed;
    j["error"] = result.error.has_value() ? to_json(*result.error) : nlohmann::json(nullptr);
    j["stoppedAt"] = result.stopped_at.has_value() ? nlohmann::json(*result.stopped_at) : nlohmann::json(nullptr);
    nlohmann::json traces = nlohmann::json::array();
    for (const auto& record : result.traces) {
        traces.push_back(to_json(record));
    }
    j["traces"] = std::move(traces);
    return j;
}

WorkflowEngine::WorkflowEngine(std::shared_ptr<const Graph> graph,
                               GenerationService& generation,
                               CheckpointStore* checkpoints,
                               ApprovalChannel* approval)
    : graph_(std::move(graph)), generation_(generation), checkpoints_(checkpoints), approval_(approval) {
    if (!graph_) {
        throw GraphError("WorkflowEngine requires a graph");
    }
    graph_->validate();
}

int WorkflowEngine::iteration_cap(const RunConfig& config) const {
    if (config.max_steps > 0) {
        return config.max_steps;
    }
    const int64_t cap = 2 * static_cast<int64_t>(graph_->step_count()) +
                        2 * static_cast<int64_t>(std::max(config.max_retries, 0));
    return static_cast<int>(std::min<int64_t>(cap, std::numeric_limits<int>::max()));
}

RunResult WorkflowEngine::run(const std::string& task_description,
                              const RunConfig& config,
                              const CancelToken* cancel) {
    return run_as(generate_run_id(), task_description, config, cancel);
}

RunResult WorkflowEngine::run_as(const std::string& run_id,
                                 const std::string& task_description,
                                 const RunConfig& config,
                                 const CancelToken* cancel) {
    WorkflowState state;
    try {
        state = make_initial_state(task_description);
    } catch (const std::invalid_argument& e) {
        return failed(run_id, state, RunError{.kind = ErrorKind::INVALID_INPUT, .message = e.what()});
    }

    if (checkpoints_ != nullptr) {
        try {
            if (checkpoints_->load(run_id).has_value()) {
                return failed(run_id, state, RunError{.kind = ErrorKind::INVALID_INPUT,
                                                      .message = "Run " + run_id + " already exists; resume it instead"});
            }
        } catch (const CheckpointError& e) {
            return failed(run_id, state, RunError{.kind = ErrorKind::CHECKPOINT, .message = e.what()});
        }
    }

    return execute(run_id, graph_->entry(), std::move(state), config, cancel, 0);
}

RunResult WorkflowEngine::resume(const std::string& run_id,
                                 const RunConfig& config,
                                 const CancelToken* cancel) {
    if (checkpoints_ == nullptr) {
        return failed(run_id, {}, RunError{.kind = ErrorKind::NOT_FOUND,
                                           .message = "No checkpoint store configured"});
    }

    std::optional<Checkpoint> checkpoint;
    try {
        checkpoint = checkpoints_->load(run_id);
    } catch (const CheckpointError& e) {
        return failed(run_id, {}, RunError{.kind = ErrorKind::CHECKPOINT, .message = e.what()});
    }
    if (!checkpoint.has_value()) {
        return failed(run_id, {}, RunError{.kind = ErrorKind::NOT_FOUND,
                                           .message = "No checkpoint for run " + run_id});
    }

    if (checkpoint->finished()) {
        spdlog::info("[{}] already finished at {}", run_id, checkpoint->last_step);
        RunResult result;
        result.success = true;
        result.message = "Run already completed";
        result.run_id = run_id;
        result.final_state = std::move(checkpoint->state);
        return result;
    }

    spdlog::info("[{}] resuming at {} (checkpoint #{})", run_id, checkpoint->next_step, checkpoint->sequence);
    return execute(run_id, checkpoint->next_step, std::move(checkpoint->state), config, cancel, checkpoint->sequence);
}

RunResult WorkflowEngine::execute(const std::string& run_id,
                                  const StepName& start_step,
                                  WorkflowState state,
                                  const RunConfig& config,
                                  const CancelToken* cancel,
                                  uint64_t sequence) {
    try {
        validate(config);
    } catch (const ConfigError& e) {
        return failed(run_id, std::move(state), RunError{.kind = ErrorKind::INVALID_INPUT, .message = e.what()});
    }
    if (!Graph::is_terminal(start_step) && !graph_->has_step(start_step)) {
        return failed(run_id, std::move(state), RunError{.kind = ErrorKind::GRAPH,
                                                         .message = "Step not found: " + start_step});
    }

    const ExecutionBudget budget{.max_steps = iteration_cap(config), .max_duration_sec = config.timeout_seconds};
    ExecutionSession session(run_id, budget, generation_, config, approval_, cancel);

    RunResult result;
    result.run_id = run_id;
    result.final_state = std::move(state);

    spdlog::info("[{}] run started at {} (max_retries={}, interactive={})",
                 run_id, start_step, config.max_retries, config.interactive);

    StepName current = start_step;
    while (!Graph::is_terminal(current)) {
        if (session.cancelled()) {
            abort_run(result, RunError{.kind = ErrorKind::CANCELLED, .message = "Run cancelled"}, current);
            break;
        }
        if (session.timed_out()) {
            abort_run(result, RunError{.kind = ErrorKind::TIMEOUT,
                                       .message = "Run exceeded " + std::to_string(config.timeout_seconds) + "s"},
                      current);
            break;
        }
        if (!session.try_consume_step()) {
            abort_run(result, RunError{.kind = ErrorKind::BUDGET,
                                       .message = "Iteration cap of " + std::to_string(budget.max_steps) +
                                                  " steps reached"},
                      current);
            break;
        }

        const Step& step = graph_->step(current);
        spdlog::debug("[{}] step #{} {}", run_id, sequence + 1, current);

        auto exec = session.execute_step(step, result.final_state, sequence + 1);
        if (!exec.success) {
            abort_run(result, std::move(*exec.error), current);
            break;
        }
        result.final_state = std::move(exec.new_state);
        ++result.steps_executed;

        StepName next;
        try {
            next = graph_->next(current, result.final_state);
        } catch (const GraphError& e) {
            abort_run(result, RunError{.kind = ErrorKind::GRAPH, .message = e.what(), .step = current}, current);
            break;
        }

        // review -> generation 回环的上限由引擎负责
        if (const LoopBound* bound = graph_->loop_bound(current)) {
            const RetryResolution resolution =
                resolve_bounded_loop(*bound, next, result.final_state.retry_count, config.max_retries);
            if (resolution.retried) {
                ++result.final_state.retry_count;
                spdlog::info("[{}] retry {}/{} via {}", run_id, result.final_state.retry_count,
                             config.max_retries, resolution.next);
            } else if (resolution.forced) {
                spdlog::warn("[{}] retry limit {} reached, continuing with {}", run_id, config.max_retries,
                             resolution.next);
            }
            next = resolution.next;
        }

        ++sequence;
        if (checkpoints_ != nullptr) {
            try {
                checkpoints_->save(run_id, Checkpoint{sequence, current, next, result.final_state});
            } catch (const CheckpointError& e) {
                abort_run(result, RunError{.kind = ErrorKind::CHECKPOINT, .message = e.what(), .step = current},
                          next);
                break;
            }
        }

        current = next;
    }

    if (approval_ != nullptr) {
        approval_->forget(run_id);
    }

    result.traces = session.get_trace_exporter().get_traces();
    if (!result.error.has_value()) {
        result.success = true;
        result.message = "Run completed";
        spdlog::info("[{}] run completed in {} steps ({} retries)", run_id, result.steps_executed,
                     result.final_state.retry_count);
    }
    return result;
}

} // namespace codeflow
