#ifndef CODEFLOW_FLOW_BUDGET_CONTROLLER_H
#define CODEFLOW_FLOW_BUDGET_CONTROLLER_H

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>

namespace codeflow {

// 单次运行的预算
struct ExecutionBudget {
    int max_steps = -1;        // -1 表示无限制
    int max_duration_sec = -1;
};

// Step and wall-clock limits of one run. The clock starts at construction.
class BudgetController {
public:
    explicit BudgetController(ExecutionBudget budget = {});

    // false once max_steps steps have been consumed
    bool try_consume_step();

    bool timed_out() const;

    int steps_used() const { return steps_used_.load(); }
    const ExecutionBudget& budget() const { return budget_; }
    std::chrono::milliseconds elapsed() const;

    nlohmann::json snapshot() const;

private:
    ExecutionBudget budget_;
    std::atomic<int> steps_used_{0};
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_BUDGET_CONTROLLER_H
