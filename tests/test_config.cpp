// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "codeflow/common/logging.h"
#include "codeflow/common/utils.h"
#include "codeflow/core/config.h"
#include "codeflow/core/errors.h"
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>

using namespace codeflow;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path = fs::temp_directory_path() / ("codeflow-config-" + generate_run_id());
    TempDir() { fs::create_directories(path); }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    auto shared = std::make_shared<std::map<std::string, std::string>>(std::move(vars));
    return [shared](const char* name) -> const char* {
        auto it = shared->find(name);
        return it == shared->end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST_CASE("Defaults", "[config]") {
    AppConfig config;
    REQUIRE(config.run.max_retries == 3);
    REQUIRE_FALSE(config.run.interactive);
    REQUIRE(config.run.approval_timeout_seconds == 300);
    REQUIRE(config.run.timeout_seconds == -1);
    REQUIRE(config.llm.max_concurrency == 1);
    REQUIRE(config.api_key.empty());
    REQUIRE_NOTHROW(validate(config.run));

    AppConfig empty = app_config_from_json(nlohmann::json(nullptr));
    REQUIRE(empty.run.max_retries == 3);
    REQUIRE(empty.checkpoint_dir == ".codeflow/checkpoints");
}

TEST_CASE("Sections from a parsed tree", "[config]") {
    nlohmann::json j = {
        {"llm", {{"model_path", "models/tiny.gguf"}, {"n_ctx", 2048}, {"temperature", 0.5},
                 {"max_concurrency", 2}, {"model", "tiny"}}},
        {"agents", {{"max_retries", 5}, {"interactive", true}, {"approval_timeout_seconds", 30},
                    {"timeout_seconds", 120}, {"strict_classification", true}}},
        {"checkpoint_dir", "/tmp/cf"},
        {"worker_threads", 4},
        {"log_level", "debug"},
        {"prompts", {{"review", {{"system", "Be harsh."}}}}},
    };

    AppConfig config = app_config_from_json(j, "/srv/codeflow");
    REQUIRE(config.llm.model_path == "/srv/codeflow/models/tiny.gguf");
    REQUIRE(config.llm.n_ctx == 2048);
    REQUIRE(config.llm.max_concurrency == 2);
    REQUIRE(config.run.temperature == 0.5f);
    REQUIRE(config.run.model == "tiny");
    REQUIRE(config.run.max_retries == 5);
    REQUIRE(config.run.interactive);
    REQUIRE(config.run.approval_timeout_seconds == 30);
    REQUIRE(config.run.timeout_seconds == 120);
    REQUIRE(config.run.strict_classification);
    REQUIRE(config.checkpoint_dir == "/tmp/cf");
    REQUIRE(config.worker_threads == 4);
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.prompts["review"]["system"] == "Be harsh.");

    SECTION("absolute model path is kept") {
        j["llm"]["model_path"] = "/opt/models/m.gguf";
        REQUIRE(app_config_from_json(j, "/srv/codeflow").llm.model_path == "/opt/models/m.gguf");
    }
}

TEST_CASE("Invalid values are rejected", "[config][errors]") {
    REQUIRE_THROWS_AS(app_config_from_json(nlohmann::json::array()), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"agents", "fast"}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"agents", {{"max_retries", "three"}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"agents", {{"interactive", "yes"}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"agents", {{"max_retries", -2}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"llm", {{"n_ctx", 0}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"llm", {{"max_concurrency", 0}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"worker_threads", 0}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"prompts", "none"}}), ConfigError);
}

TEST_CASE("Integers beyond int range are rejected", "[config][errors]") {
    REQUIRE_THROWS_AS(app_config_from_json({{"agents", {{"max_retries", 4294967297LL}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"agents", {{"timeout_seconds", -4294967296LL}}}}), ConfigError);
    REQUIRE_THROWS_AS(app_config_from_json({{"llm", {{"n_ctx", 18446744073709551615ULL}}}}), ConfigError);
    REQUIRE(app_config_from_json({{"agents", {{"max_retries", 2147483647}}}}).run.max_retries == 2147483647);

    SECTION("from a parsed document") {
        auto parsed = nlohmann::json::parse(R"({"agents": {"max_retries": 4294967297}})");
        REQUIRE(parsed["agents"]["max_retries"].is_number_unsigned());
        REQUIRE_THROWS_AS(app_config_from_json(parsed), ConfigError);
    }

    SECTION("from YAML") {
        TempDir dir;
        const fs::path file = dir.path / "huge.yaml";
        std::ofstream(file) << "agents:\n  max_retries: 4294967297\n";
        REQUIRE_THROWS_AS(load_app_config(file.string()), ConfigError);
    }
}

TEST_CASE("Run option ranges", "[config]") {
    RunConfig config;
    config.max_retries = 0;
    REQUIRE_NOTHROW(validate(config));

    SECTION("negative retries") {
        config.max_retries = -1;
        REQUIRE_THROWS_AS(validate(config), ConfigError);
    }
    SECTION("temperature") {
        config.temperature = 2.5f;
        REQUIRE_THROWS_AS(validate(config), ConfigError);
    }
    SECTION("timeouts") {
        config.timeout_seconds = 0;
        REQUIRE_THROWS_AS(validate(config), ConfigError);
        config.timeout_seconds = 10;
        config.approval_timeout_seconds = 0;
        REQUIRE_THROWS_AS(validate(config), ConfigError);
    }
    SECTION("step cap") {
        config.max_steps = -5;
        REQUIRE_THROWS_AS(validate(config), ConfigError);
        config.max_steps = 40;
        REQUIRE_NOTHROW(validate(config));
    }
}

TEST_CASE("Environment overrides", "[config][env]") {
    AppConfig config;
    apply_env_overrides(config, fake_env({
        {"CODEFLOW_API_KEY", "secret-key"},
        {"CODEFLOW_MODEL_PATH", "/models/other.gguf"},
        {"CODEFLOW_MODEL", "other"},
        {"CODEFLOW_INTERACTIVE", "yes"},
        {"CODEFLOW_CHECKPOINT_DIR", "/var/lib/codeflow"},
        {"CODEFLOW_LOG_LEVEL", "warn"},
    }));
    REQUIRE(config.api_key == "secret-key");
    REQUIRE(config.llm.model_path == "/models/other.gguf");
    REQUIRE(config.run.model == "other");
    REQUIRE(config.run.interactive);
    REQUIRE(config.checkpoint_dir == "/var/lib/codeflow");
    REQUIRE(config.log_level == "warn");

    SECTION("unset and empty variables change nothing") {
        AppConfig untouched;
        apply_env_overrides(untouched, fake_env({{"CODEFLOW_MODEL", ""}}));
        REQUIRE(untouched.run.model.empty());
        REQUIRE_FALSE(untouched.run.interactive);
    }

    SECTION("interactive flag can be turned off") {
        apply_env_overrides(config, fake_env({{"CODEFLOW_INTERACTIVE", "0"}}));
        REQUIRE_FALSE(config.run.interactive);
    }
}

TEST_CASE("Loading YAML files", "[config][yaml]") {
    TempDir dir;

    SECTION("missing file gives defaults") {
        AppConfig config = load_app_config((dir.path / "absent.yaml").string());
        REQUIRE(config.run.max_retries == 3);
    }

    SECTION("file contents") {
        const fs::path file = dir.path / "codeflow.yaml";
        std::ofstream(file) << "llm:\n"
                               "  model_path: models/local.gguf\n"
                               "  temperature: 0.25\n"
                               "agents:\n"
                               "  max_retries: 2\n"
                               "  interactive: false\n"
                               "checkpoint_dir: state\n"
                               "prompts:\n"
                               "  fallback:\n"
                               "    user: \"Help with: {{ taskDescription }}\"\n";
        AppConfig config = load_app_config(file.string());
        REQUIRE(config.run.max_retries == 2);
        REQUIRE(config.run.temperature == 0.25f);
        REQUIRE(fs::path(config.llm.model_path) == fs::absolute(dir.path / "models/local.gguf").lexically_normal());
        REQUIRE(config.checkpoint_dir == "state");
        REQUIRE(config.prompts["fallback"]["user"] == "Help with: {{ taskDescription }}");
    }

    SECTION("malformed YAML") {
        const fs::path file = dir.path / "broken.yaml";
        std::ofstream(file) << "agents: [max_retries: 2\n";
        REQUIRE_THROWS_AS(load_app_config(file.string()), ConfigError);
    }
}

TEST_CASE("Run options as JSON", "[config]") {
    RunConfig config;
    config.interactive = true;
    config.max_retries = 1;
    nlohmann::json j = to_json(config);
    REQUIRE(j["interactive"] == true);
    REQUIRE(j["maxRetries"] == 1);
    REQUIRE(j["approvalTimeoutSeconds"] == 300);
    REQUIRE(j["strictClassification"] == false);
}

TEST_CASE("Log level names", "[config][logging]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level(" WARNING ") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(parse_log_level("chatty") == spdlog::level::info);
}
