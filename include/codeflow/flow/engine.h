#ifndef CODEFLOW_FLOW_ENGINE_H
#define CODEFLOW_FLOW_ENGINE_H

#include "codeflow/checkpoint/checkpoint_store.h"
#include "codeflow/core/config.h"
#include "codeflow/core/errors.h"
#include "codeflow/flow/approval.h"
#include "codeflow/flow/graph.h"
#include "codeflow/flow/trace_exporter.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codeflow {

// RunResult structure
struct RunResult {
    bool success = false;
    std::string message;
    std::string run_id;
    WorkflowState final_state;           // partial when the run failed
    std::optional<RunError> error;
    std::optional<StepName> stopped_at;  // step that failed or was not started
    std::vector<TraceRecord> traces;
    int steps_executed = 0;

    // {decision, generatedArtifact, reviewFeedback, documentedArtifact, approvalStatus}
    nlohmann::json summary() const;
};

nlohmann::json to_json(const RunResult& result);

// Drives runs over a shared, validated graph. One engine serves any number of
// concurrent runs; each call owns its state, session and budget.
class WorkflowEngine {
public:
    WorkflowEngine(std::shared_ptr<const Graph> graph,
                   GenerationService& generation,
                   CheckpointStore* checkpoints = nullptr,
                   ApprovalChannel* approval = nullptr);

    // New run with a generated id.
    RunResult run(const std::string& task_description,
                  const RunConfig& config = {},
                  const CancelToken* cancel = nullptr);

    // New run under a caller-chosen id. An id that already has a checkpoint is rejected.
    RunResult run_as(const std::string& run_id,
                     const std::string& task_description,
                     const RunConfig& config = {},
                     const CancelToken* cancel = nullptr);

    // Continues from the last checkpoint of run_id.
    RunResult resume(const std::string& run_id,
                     const RunConfig& config = {},
                     const CancelToken* cancel = nullptr);

    // Runs from start_step with the given state. `sequence` is the number of
    // the last checkpoint already written for this run.
    RunResult execute(const std::string& run_id,
                      const StepName& start_step,
                      WorkflowState state,
                      const RunConfig& config,
                      const CancelToken* cancel = nullptr,
                      uint64_t sequence = 0);

    // Global iteration cap for one execute() call.
    int iteration_cap(const RunConfig& config) const;

    const Graph& graph() const { return *graph_; }

private:
    std::shared_ptr<const Graph> graph_;
    GenerationService& generation_;
    CheckpointStore* checkpoints_;
    ApprovalChannel* approval_;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_ENGINE_H
