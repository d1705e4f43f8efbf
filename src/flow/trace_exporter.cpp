// src/flow/trace_exporter.cpp
#include "codeflow/flow/trace_exporter.h"
#include <algorithm>

namespace codeflow {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

nlohmann::json to_json(const TraceRecord& record) {
    nlohmann::json j;
    j["run_id"] = record.run_id;
    j["step"] = record.step;
    j["kind"] = record.kind;
    j["sequence"] = record.sequence;
    j["start_ms"] = to_millis(record.start_time);
    j["end_ms"] = to_millis(record.end_time);
    j["status"] = record.status;
    j["error"] = record.error.has_value() ? nlohmann::json(*record.error) : nlohmann::json(nullptr);
    j["state_delta"] = record.state_delta;
    j["budget"] = record.budget_snapshot;
    return j;
}

void TraceExporter::on_step_start(const Step& step, uint64_t sequence, const nlohmann::json& budget) {
    TraceRecord record;
    record.run_id = run_id_;
    record.step = step.name();
    record.kind = to_string(step.kind());
    record.sequence = sequence;
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = "running";
    record.state_delta = nlohmann::json::object();
    record.budget_snapshot = budget;
    traces_.push_back(std::move(record));
}

void TraceExporter::on_step_end(const StepName& step,
                                const std::string& status,
                                const std::optional<std::string>& error,
                                const nlohmann::json& initial_state,
                                const nlohmann::json& final_state,
                                const nlohmann::json& budget) {
    auto it = std::find_if(traces_.rbegin(), traces_.rend(), [&step](const TraceRecord& r) {
        return r.step == step && r.status == "running";
    });
    if (it == traces_.rend()) {
        return;
    }
    it->end_time = std::chrono::system_clock::now();
    it->status = status;
    it->error = error;
    it->state_delta = calculate_state_delta(initial_state, final_state);
    it->budget_snapshot = budget;
}

nlohmann::json TraceExporter::calculate_state_delta(const nlohmann::json& initial, const nlohmann::json& final) {
    nlohmann::json delta = nlohmann::json::object();
    if (!initial.is_object() || !final.is_object()) {
        return delta;
    }
    for (auto it = final.begin(); it != final.end(); ++it) {
        auto prev = initial.find(it.key());
        if (prev == initial.end() || *prev != it.value()) {
            delta[it.key()] = it.value();
        }
    }
    for (auto it = initial.begin(); it != initial.end(); ++it) {
        if (!final.contains(it.key())) {
            delta[it.key()] = nullptr;
        }
    }
    return delta;
}

} // namespace codeflow
