// src/flow/execution_session.cpp
#include "codeflow/flow/execution_session.h"
#include <spdlog/spdlog.h>

namespace codeflow {

ExecutionSession::ExecutionSession(std::string run_id,
                                   ExecutionBudget budget,
                                   GenerationService& generation,
                                   const RunConfig& config,
                                   ApprovalChannel* approval,
                                   const CancelToken* cancel)
    : context_{std::move(run_id), generation, config, approval, cancel},
      budget_controller_(budget),
      trace_exporter_(context_.run_id) {}

ExecutionSession::ExecutionResult ExecutionSession::execute_step(const Step& step,
                                                                 const WorkflowState& state,
                                                                 uint64_t sequence) {
    ExecutionResult result;
    result.message = "Step executed successfully";

    const nlohmann::json initial_json = state;
    trace_exporter_.on_step_start(step, sequence, budget_controller_.snapshot());

    std::string status = "success";
    try {
        result.new_state = step.apply(state, context_);
    } catch (const StepError& e) {
        RunError error{.kind = ErrorKind::STEP, .message = e.what(), .step = e.step()};
        if (e.cause().has_value()) {
            error.kind = ErrorKind::SERVICE;
            error.service_kind = e.cause()->kind();
        }
        result.error = std::move(error);
    } catch (const ServiceError& e) {
        result.error = RunError{.kind = ErrorKind::SERVICE,
                                .message = std::string("Step '") + step.name() + "' failed: " + e.what(),
                                .step = step.name(),
                                .service_kind = e.kind()};
    } catch (const CancelledError& e) {
        status = "cancelled";
        result.error = RunError{.kind = ErrorKind::CANCELLED, .message = e.what(), .step = step.name()};
    } catch (const std::exception& e) {
        result.error = RunError{.kind = ErrorKind::STEP,
                                .message = std::string("Step '") + step.name() + "' failed: " + e.what(),
                                .step = step.name()};
    }

    if (result.error.has_value()) {
        if (status == "success") status = "failed";
        result.success = false;
        result.message = result.error->message;
        result.new_state = state; // 失败的步骤不修改状态
    }

    const nlohmann::json final_json = result.new_state;
    trace_exporter_.on_step_end(step.name(),
                                status,
                                result.success ? std::nullopt : std::make_optional(result.message),
                                initial_json,
                                final_json,
                                budget_controller_.snapshot());
    return result;
}

} // namespace codeflow
