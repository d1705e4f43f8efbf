#ifndef CODEFLOW_FLOW_APPROVAL_H
#define CODEFLOW_FLOW_APPROVAL_H

#include "codeflow/flow/step.h"
#include <chrono>
#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace codeflow {

// Source of out-of-band yes/no decisions for the approval gate.
class ApprovalChannel {
public:
    virtual ~ApprovalChannel() = default;

    // Blocks the calling run only. Returns nullopt on timeout or when the
    // input source failed; throws CancelledError if the run is cancelled.
    virtual std::optional<bool> await_decision(const std::string& run_id,
                                               const WorkflowState& state,
                                               std::chrono::milliseconds timeout,
                                               const CancelToken* cancel) = 0;

    // Called when a run ends, whatever the outcome. Drops anything still held for it.
    virtual void forget(const std::string& /*run_id*/) {}
};

// Console-style channel: writes a prompt, reads one answer line.
// Runs take turns at the console; time spent waiting for a turn counts
// against the run's timeout and is cancellable. With poll_fd >= 0 the read
// is sliced with poll(2) as well; otherwise it blocks on the stream.
class StreamApprovalChannel : public ApprovalChannel {
public:
    StreamApprovalChannel(std::istream& in, std::ostream& out, int poll_fd = -1);

    std::optional<bool> await_decision(const std::string& run_id,
                                       const WorkflowState& state,
                                       std::chrono::milliseconds timeout,
                                       const CancelToken* cancel) override;

    // "y" / "yes", any case, surrounding whitespace ignored.
    static bool is_affirmative(std::string_view answer);

private:
    std::istream& in_;
    std::ostream& out_;
    int poll_fd_;
    std::timed_mutex console_mutex_; // 一次只问一个 run

    bool wait_readable(std::chrono::milliseconds timeout, const CancelToken* cancel) const;
};

// Decisions delivered by another thread (HTTP handler, operator UI, test).
class ApprovalBroker : public ApprovalChannel {
public:
    std::optional<bool> await_decision(const std::string& run_id,
                                       const WorkflowState& state,
                                       std::chrono::milliseconds timeout,
                                       const CancelToken* cancel) override;

    // A decision for a run that is not waiting yet is kept until it arrives
    // or the run ends without reaching the gate.
    void submit(const std::string& run_id, bool approved);

    void forget(const std::string& run_id) override;

    // Runs currently blocked at the gate.
    std::vector<std::string> pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable decided_;
    std::unordered_map<std::string, bool> decisions_;
    std::unordered_set<std::string> waiting_;
};

class ApprovalGateStep : public Step {
public:
    explicit ApprovalGateStep(StepName name = "human_gate");
    [[nodiscard]] WorkflowState apply(const WorkflowState& state, StepContext& ctx) const override;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_APPROVAL_H
