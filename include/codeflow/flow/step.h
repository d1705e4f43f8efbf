#ifndef CODEFLOW_FLOW_STEP_H
#define CODEFLOW_FLOW_STEP_H

#include "codeflow/core/config.h"
#include "codeflow/core/types.h"
#include "codeflow/llm/generation_service.h"
#include <atomic>
#include <cstdint>
#include <string>

namespace codeflow {

class ApprovalChannel; // flow/approval.h

// Cooperative cancellation flag for one run. Checked between steps and
// inside blocking waits.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Everything a step may use besides the state. Lives for one run.
struct StepContext {
    std::string run_id;
    GenerationService& generation;
    const RunConfig& config;
    ApprovalChannel* approval = nullptr;
    const CancelToken* cancel = nullptr;

    GenerationOptions generation_options() const {
        return GenerationOptions{config.model, config.temperature};
    }
    bool cancelled() const { return cancel != nullptr && cancel->cancelled(); }
};

enum class StepKind : uint8_t {
    ORCHESTRATOR,
    GENERATION,
    REVIEW,
    DOCUMENTATION,
    FALLBACK,
    APPROVAL_GATE
};

std::string to_string(StepKind kind);

// Base step. Steps are immutable and shared by all runs; apply() returns the
// next state and leaves the input untouched.
class Step {
public:
    Step(StepName name, StepKind kind) : name_(std::move(name)), kind_(kind) {}
    virtual ~Step() = default;

    Step(const Step&) = delete;
    Step& operator=(const Step&) = delete;

    const StepName& name() const { return name_; }
    StepKind kind() const { return kind_; }

    // Throws StepError (or CancelledError from a blocking wait).
    [[nodiscard]] virtual WorkflowState apply(const WorkflowState& state, StepContext& ctx) const = 0;

private:
    StepName name_;
    StepKind kind_;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_STEP_H
