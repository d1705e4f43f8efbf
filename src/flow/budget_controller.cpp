// src/flow/budget_controller.cpp
#include "codeflow/flow/budget_controller.h"

namespace codeflow {

BudgetController::BudgetController(ExecutionBudget budget)
    : budget_(budget), start_time_(std::chrono::steady_clock::now()) {}

bool BudgetController::try_consume_step() {
    int expected = steps_used_.load();
    do {
        if (budget_.max_steps >= 0 && expected >= budget_.max_steps) return false;
    } while (!steps_used_.compare_exchange_weak(expected, expected + 1));
    return true;
}

std::chrono::milliseconds BudgetController::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
}

bool BudgetController::timed_out() const {
    if (budget_.max_duration_sec < 0) return false;
    return elapsed() >= std::chrono::seconds(budget_.max_duration_sec);
}

nlohmann::json BudgetController::snapshot() const {
    nlohmann::json obj;
    obj["max_steps"] = budget_.max_steps;
    obj["max_duration_sec"] = budget_.max_duration_sec;
    obj["steps_used"] = steps_used_.load();
    obj["elapsed_ms"] = elapsed().count();
    return obj;
}

} // namespace codeflow
