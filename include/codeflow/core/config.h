#ifndef CODEFLOW_CORE_CONFIG_H
#define CODEFLOW_CORE_CONFIG_H

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace codeflow {

// Per-run options. Passed explicitly into every run so concurrent runs can
// differ (e.g. one interactive, one not).
struct RunConfig {
    bool interactive = false;
    int max_retries = 3;
    std::string model;                  // override; empty = backend default
    float temperature = 0.1f;
    int timeout_seconds = -1;           // whole run, -1 = unlimited
    int approval_timeout_seconds = 300; // interactive gate; expiry = rejected
    int max_steps = -1;                 // -1 = derived from graph size
    bool strict_classification = false; // abort instead of falling back when classification call fails
};

struct LlmSettings {
    std::string model_path = "models/qwen2.5-coder-1.5b-instruct.gguf";
    int n_ctx = 4096;
    int n_threads = 0;      // 0 = hardware_concurrency
    float min_p = 0.05f;
    int n_predict = 1024;
    int max_concurrency = 1;
};

struct AppConfig {
    LlmSettings llm;
    RunConfig run;
    std::string checkpoint_dir = ".codeflow/checkpoints";
    int worker_threads = 2;
    std::string log_level = "info";
    std::string api_key;              // credential; reported by `status` only
    nlohmann::json prompts = nlohmann::json::object();
};

// Returns nullptr when the variable is unset.
using EnvLookup = std::function<const char*(const char*)>;

// Missing file -> defaults. Malformed YAML or invalid values -> ConfigError.
AppConfig load_app_config(const std::string& config_path = "codeflow.yaml");

// Builds an AppConfig from an already parsed JSON tree (the YAML file's content).
// base_dir resolves a relative llm.model_path.
AppConfig app_config_from_json(const nlohmann::json& j, const std::string& base_dir = ".");

// CODEFLOW_API_KEY, CODEFLOW_MODEL, CODEFLOW_MODEL_PATH, CODEFLOW_INTERACTIVE,
// CODEFLOW_CHECKPOINT_DIR, CODEFLOW_LOG_LEVEL
void apply_env_overrides(AppConfig& config, const EnvLookup& lookup = {});

// Throws ConfigError on out-of-range values.
void validate(const RunConfig& config);

nlohmann::json to_json(const RunConfig& config);

} // namespace codeflow

#endif // CODEFLOW_CORE_CONFIG_H
