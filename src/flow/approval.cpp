// src/flow/approval.cpp
#include "codeflow/flow/approval.h"
#include "codeflow/common/utils.h"
#include "codeflow/core/errors.h"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <istream>
#include <ostream>

namespace codeflow {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};

} // namespace

// ————————————————————————
// StreamApprovalChannel
// ————————————————————————

StreamApprovalChannel::StreamApprovalChannel(std::istream& in, std::ostream& out, int poll_fd)
    : in_(in), out_(out), poll_fd_(poll_fd) {}

bool StreamApprovalChannel::is_affirmative(std::string_view answer) {
    const std::string a = to_lower(trim(answer));
    return a == "y" || a == "yes";
}

bool StreamApprovalChannel::wait_readable(std::chrono::milliseconds timeout, const CancelToken* cancel) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancel && cancel->cancelled()) {
            throw CancelledError("Cancelled while awaiting approval");
        }
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        pollfd pfd{};
        pfd.fd = poll_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, kPollSlice).count()));
        if (rc > 0) return true; // readable, hung up or error: let the read report it
        if (rc < 0 && errno != EINTR) return true;
    }
}

std::optional<bool> StreamApprovalChannel::await_decision(const std::string& run_id,
                                                          const WorkflowState& state,
                                                          std::chrono::milliseconds timeout,
                                                          const CancelToken* cancel) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // 控制台同一时刻只属于一个 run；排队期间同样受超时和取消约束
    std::unique_lock<std::timed_mutex> lock(console_mutex_, std::defer_lock);
    while (true) {
        if (cancel && cancel->cancelled()) {
            throw CancelledError("Cancelled while awaiting approval");
        }
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            spdlog::warn("[{}] approval timed out after {} ms waiting for the console", run_id, timeout.count());
            return std::nullopt;
        }
        if (lock.try_lock_for(std::min(remaining, kPollSlice))) break;
    }

    out_ << "Awaiting approval for run " << run_id;
    if (state.documented_artifact.has_value()) {
        out_ << " (" << state.documented_artifact->size() << " chars of documented code)";
    }
    out_ << " [y/N]: " << std::flush;

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (poll_fd_ >= 0 && !wait_readable(std::max(remaining, std::chrono::milliseconds(0)), cancel)) {
        out_ << "\n";
        spdlog::warn("[{}] approval timed out after {} ms", run_id, timeout.count());
        return std::nullopt;
    }

    std::string answer;
    if (!std::getline(in_, answer)) {
        spdlog::warn("[{}] approval input closed", run_id);
        return std::nullopt;
    }
    return is_affirmative(answer);
}

// ————————————————————————
// ApprovalBroker
// ————————————————————————

std::optional<bool> ApprovalBroker::await_decision(const std::string& run_id,
                                                   const WorkflowState& /*state*/,
                                                   std::chrono::milliseconds timeout,
                                                   const CancelToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    waiting_.insert(run_id);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::optional<bool> result;
    while (true) {
        if (auto it = decisions_.find(run_id); it != decisions_.end()) {
            result = it->second;
            decisions_.erase(it);
            break;
        }
        if (cancel && cancel->cancelled()) {
            waiting_.erase(run_id);
            throw CancelledError("Cancelled while awaiting approval");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("[{}] approval timed out after {} ms", run_id, timeout.count());
            break;
        }
        // 分片等待，以便观察取消
        decided_.wait_until(lock, std::min(deadline, now + kPollSlice));
    }
    waiting_.erase(run_id);
    return result;
}

void ApprovalBroker::submit(const std::string& run_id, bool approved) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        decisions_[run_id] = approved;
    }
    decided_.notify_all();
}

void ApprovalBroker::forget(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (decisions_.erase(run_id) > 0) {
        spdlog::debug("[{}] dropped unused approval decision", run_id);
    }
}

std::vector<std::string> ApprovalBroker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> runs(waiting_.begin(), waiting_.end());
    std::sort(runs.begin(), runs.end());
    return runs;
}

// ————————————————————————
// ApprovalGateStep
// ————————————————————————

ApprovalGateStep::ApprovalGateStep(StepName name)
    : Step(std::move(name), StepKind::APPROVAL_GATE) {}

WorkflowState ApprovalGateStep::apply(const WorkflowState& state, StepContext& ctx) const {
    WorkflowState next = state;
    if (!ctx.config.interactive) {
        next.approval_status = ApprovalStatus::APPROVED;
        return next;
    }

    if (ctx.approval == nullptr) {
        spdlog::warn("[{}] interactive approval requested but no approval channel is attached", ctx.run_id);
        next.approval_status = ApprovalStatus::REJECTED;
        return next;
    }

    spdlog::info("[{}] suspended at {} awaiting approval", ctx.run_id, name());
    auto decision = ctx.approval->await_decision(
        ctx.run_id, state, std::chrono::seconds(ctx.config.approval_timeout_seconds), ctx.cancel);
    next.approval_status = decision.value_or(false) ? ApprovalStatus::APPROVED : ApprovalStatus::REJECTED;
    spdlog::info("[{}] approval: {}", ctx.run_id, to_string(*next.approval_status));
    return next;
}

} // namespace codeflow
