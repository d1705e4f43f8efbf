#ifndef CODEFLOW_FLOW_TRACE_EXPORTER_H
#define CODEFLOW_FLOW_TRACE_EXPORTER_H

#include "codeflow/flow/step.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace codeflow {

struct TraceRecord {
    std::string run_id;
    StepName step;
    std::string kind;
    uint64_t sequence = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running", "success", "failed", "cancelled"
    std::optional<std::string> error;
    nlohmann::json state_delta;     // 执行前后状态的变化
    nlohmann::json budget_snapshot;
};

nlohmann::json to_json(const TraceRecord& record);

// Per-run step trace. Not shared between runs.
class TraceExporter {
public:
    explicit TraceExporter(std::string run_id) : run_id_(std::move(run_id)) {}

    void on_step_start(const Step& step, uint64_t sequence, const nlohmann::json& budget);

    void on_step_end(const StepName& step,
                     const std::string& status,
                     const std::optional<std::string>& error,
                     const nlohmann::json& initial_state,
                     const nlohmann::json& final_state,
                     const nlohmann::json& budget);

    const std::vector<TraceRecord>& get_traces() const { return traces_; }

    // Top-level keys whose values differ; removed keys map to null.
    static nlohmann::json calculate_state_delta(const nlohmann::json& initial, const nlohmann::json& final);

private:
    std::string run_id_;
    std::vector<TraceRecord> traces_;
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_TRACE_EXPORTER_H
