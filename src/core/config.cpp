// src/core/config.cpp
#include "codeflow/core/config.h"
#include "codeflow/core/errors.h"
#include "codeflow/common/utils.h"
#include "codeflow/common/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

namespace codeflow {

namespace {

namespace fs = std::filesystem;

void read_int(const nlohmann::json& obj, const char* key, int& out, const std::string& section) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    const auto& value = obj[key];
    if (!value.is_number_integer()) {
        throw ConfigError("'" + section + "." + key + "' must be an integer");
    }
    const bool in_range = value.is_number_unsigned()
        ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
          value.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw ConfigError("'" + section + "." + key + "' is out of range");
    }
    out = value.get<int>();
}

void read_float(const nlohmann::json& obj, const char* key, float& out, const std::string& section) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_number()) {
        throw ConfigError("'" + section + "." + key + "' must be a number");
    }
    out = static_cast<float>(obj[key].get<double>());
}

void read_bool(const nlohmann::json& obj, const char* key, bool& out, const std::string& section) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_boolean()) {
        throw ConfigError("'" + section + "." + key + "' must be true or false");
    }
    out = obj[key].get<bool>();
}

void read_string(const nlohmann::json& obj, const char* key, std::string& out, const std::string& section) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_string()) {
        throw ConfigError("'" + section + "." + key + "' must be a string");
    }
    out = obj[key].get<std::string>();
}

const nlohmann::json& section_of(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name) || j[name].is_null()) return empty;
    if (!j[name].is_object()) {
        throw ConfigError(std::string("'") + name + "' must be a mapping");
    }
    return j[name];
}

bool parse_flag(const std::string& value) {
    const std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

void validate(const RunConfig& config) {
    if (config.max_retries < 0) {
        throw ConfigError("max_retries must be >= 0, got " + std::to_string(config.max_retries));
    }
    if (config.temperature < 0.0f || config.temperature > 2.0f) {
        throw ConfigError("temperature must be within [0, 2]");
    }
    if (config.approval_timeout_seconds <= 0) {
        throw ConfigError("approval_timeout_seconds must be positive");
    }
    if (config.timeout_seconds == 0 || config.timeout_seconds < -1) {
        throw ConfigError("timeout_seconds must be positive or -1");
    }
    if (config.max_steps == 0 || config.max_steps < -1) {
        throw ConfigError("max_steps must be positive or -1");
    }
}

AppConfig app_config_from_json(const nlohmann::json& j, const std::string& base_dir) {
    AppConfig config;
    if (j.is_null()) return config;
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    const auto& llm = section_of(j, "llm");
    std::string model_path;
    read_string(llm, "model_path", model_path, "llm");
    if (!model_path.empty()) {
        fs::path p(model_path);
        config.llm.model_path = p.is_absolute() ? p.string() : fs::absolute(fs::path(base_dir) / p).lexically_normal().string();
    }
    read_int(llm, "n_ctx", config.llm.n_ctx, "llm");
    read_int(llm, "n_threads", config.llm.n_threads, "llm");
    read_float(llm, "min_p", config.llm.min_p, "llm");
    read_int(llm, "n_predict", config.llm.n_predict, "llm");
    read_int(llm, "max_concurrency", config.llm.max_concurrency, "llm");
    read_float(llm, "temperature", config.run.temperature, "llm");
    read_string(llm, "model", config.run.model, "llm");

    const auto& agents = section_of(j, "agents");
    read_int(agents, "max_retries", config.run.max_retries, "agents");
    read_bool(agents, "interactive", config.run.interactive, "agents");
    read_int(agents, "approval_timeout_seconds", config.run.approval_timeout_seconds, "agents");
    read_int(agents, "timeout_seconds", config.run.timeout_seconds, "agents");
    read_int(agents, "max_steps", config.run.max_steps, "agents");
    read_bool(agents, "strict_classification", config.run.strict_classification, "agents");

    read_string(j, "checkpoint_dir", config.checkpoint_dir, "root");
    read_int(j, "worker_threads", config.worker_threads, "root");
    read_string(j, "log_level", config.log_level, "root");

    if (j.contains("prompts") && !j["prompts"].is_null()) {
        if (!j["prompts"].is_object()) {
            throw ConfigError("'prompts' must be a mapping");
        }
        config.prompts = j["prompts"];
    }

    if (config.llm.n_ctx <= 0 || config.llm.n_predict <= 0) {
        throw ConfigError("llm.n_ctx and llm.n_predict must be positive");
    }
    if (config.llm.max_concurrency <= 0) {
        throw ConfigError("llm.max_concurrency must be positive");
    }
    if (config.worker_threads <= 0) {
        throw ConfigError("worker_threads must be positive");
    }
    validate(config.run);
    return config;
}

AppConfig load_app_config(const std::string& config_path) {
    if (!fs::exists(config_path)) {
        spdlog::debug("Config file {} not found, using defaults", config_path);
        return AppConfig{};
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + config_path + ": " + e.what());
    }

    fs::path config_dir = fs::path(config_path).parent_path();
    if (config_dir.empty()) config_dir = ".";
    return app_config_from_json(yaml_to_json(root), config_dir.string());
}

void apply_env_overrides(AppConfig& config, const EnvLookup& lookup) {
    EnvLookup get = lookup ? lookup : EnvLookup([](const char* name) { return std::getenv(name); });

    if (const char* v = get("CODEFLOW_API_KEY"); v && *v) {
        config.api_key = v;
    }
    if (const char* v = get("CODEFLOW_MODEL_PATH"); v && *v) {
        config.llm.model_path = v;
    }
    if (const char* v = get("CODEFLOW_MODEL"); v && *v) {
        config.run.model = v;
    }
    if (const char* v = get("CODEFLOW_INTERACTIVE"); v && *v) {
        config.run.interactive = parse_flag(v);
    }
    if (const char* v = get("CODEFLOW_CHECKPOINT_DIR"); v && *v) {
        config.checkpoint_dir = v;
    }
    if (const char* v = get("CODEFLOW_LOG_LEVEL"); v && *v) {
        config.log_level = v;
    }
}

nlohmann::json to_json(const RunConfig& config) {
    return {
        {"interactive", config.interactive},
        {"maxRetries", config.max_retries},
        {"model", config.model},
        {"temperature", config.temperature},
        {"timeoutSeconds", config.timeout_seconds},
        {"approvalTimeoutSeconds", config.approval_timeout_seconds},
        {"maxSteps", config.max_steps},
        {"strictClassification", config.strict_classification},
    };
}

} // namespace codeflow
