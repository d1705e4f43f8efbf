#ifndef CODEFLOW_FLOW_EXECUTION_SESSION_H
#define CODEFLOW_FLOW_EXECUTION_SESSION_H

#include "codeflow/core/errors.h"
#include "codeflow/flow/budget_controller.h"
#include "codeflow/flow/trace_exporter.h"
#include <optional>
#include <string>

namespace codeflow {

// ExecutionSession 封装了单次运行的上下文、预算和 Trace
class ExecutionSession {
public:
    ExecutionSession(std::string run_id,
                     ExecutionBudget budget,
                     GenerationService& generation,
                     const RunConfig& config,
                     ApprovalChannel* approval,
                     const CancelToken* cancel);

    ExecutionSession(const ExecutionSession&) = delete;
    ExecutionSession& operator=(const ExecutionSession&) = delete;

    struct ExecutionResult {
        WorkflowState new_state; // input state when the step failed
        bool success = true;
        std::string message;
        std::optional<RunError> error;
    };

    // Applies one step, records its trace and converts any failure into a RunError.
    ExecutionResult execute_step(const Step& step, const WorkflowState& state, uint64_t sequence);

    bool try_consume_step() { return budget_controller_.try_consume_step(); }
    bool timed_out() const { return budget_controller_.timed_out(); }
    bool cancelled() const { return context_.cancelled(); }

    const TraceExporter& get_trace_exporter() const { return trace_exporter_; }

private:
    StepContext context_;
    BudgetController budget_controller_;
    TraceExporter trace_exporter_;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_EXECUTION_SESSION_H
