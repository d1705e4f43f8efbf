// examples/codeflow_cli/main.cpp
#include "codeflow/checkpoint/checkpoint_store.h"
#include "codeflow/common/logging.h"
#include "codeflow/common/utils.h"
#include "codeflow/core/config.h"
#include "codeflow/flow/code_assistant_graph.h"
#include "codeflow/flow/engine.h"
#include "codeflow/llm/llama_adapter.h"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace codeflow;

struct CliOptions {
    std::string command;
    std::string argument;
    std::string config_path = "codeflow.yaml";
    std::string format = "pretty";
    std::optional<std::string> model;
    std::optional<int> max_retries;
    std::optional<std::string> run_id;
    std::optional<std::string> log_level;
    bool interactive = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [args] [options]\n"
              << "\nCommands:\n"
              << "  generate <task>     run the workflow on a task description\n"
              << "  review <file>       review the code in <file>\n"
              << "  document <file>     add documentation to the code in <file>\n"
              << "  resume <run-id>     continue an interrupted run from its checkpoint\n"
              << "  status              show configuration and stored runs\n"
              << "\nOptions:\n"
              << "  --model <path>          model override\n"
              << "  --format <json|text|pretty>\n"
              << "  --interactive           ask for approval before finishing\n"
              << "  --config <file>         configuration file (default codeflow.yaml)\n"
              << "  --max-retries <n>       review/regeneration limit\n"
              << "  --run-id <id>           explicit run id\n"
              << "  --log-level <level>     trace|debug|info|warn|error|off\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return argv[++i];
        };
        if (arg == "--model" || arg == "-m") opts.model = value(arg);
        else if (arg == "--format") opts.format = value(arg);
        else if (arg == "--interactive" || arg == "-i") opts.interactive = true;
        else if (arg == "--config") opts.config_path = value(arg);
        else if (arg == "--max-retries") opts.max_retries = std::stoi(value(arg));
        else if (arg == "--run-id") opts.run_id = value(arg);
        else if (arg == "--log-level") opts.log_level = value(arg);
        else if (arg == "--help" || arg == "-h") return std::nullopt;
        else if (arg.rfind("--", 0) == 0) throw std::invalid_argument("Unknown option: " + arg);
        else positional.push_back(arg);
    }
    if (positional.empty()) {
        return std::nullopt;
    }
    opts.command = positional[0];
    if (positional.size() > 1) opts.argument = positional[1];
    if (positional.size() > 2) throw std::invalid_argument("Too many arguments");
    if (opts.format != "json" && opts.format != "text" && opts.format != "pretty") {
        throw std::invalid_argument("Unknown format: " + opts.format);
    }
    return opts;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string fence_language(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (ext == ".py") return "python";
    if (ext == ".cc" || ext == ".cpp" || ext == ".hpp" || ext == ".h") return "cpp";
    if (ext == ".js") return "javascript";
    if (ext == ".ts") return "typescript";
    return ext.empty() ? "" : ext.substr(1);
}

std::string review_task(const std::string& path) {
    return "Please review this code for improvements:\n\n```" + fence_language(path) + "\n" + read_file(path) + "\n```";
}

std::string document_task(const std::string& path) {
    return "Add comprehensive documentation to this code:\n\n```" + fence_language(path) + "\n" + read_file(path) + "\n```";
}

// ————————————————————————
// Output
// ————————————————————————

std::string field(const nlohmann::json& summary, const char* key) {
    const auto& v = summary.at(key);
    return v.is_null() ? "N/A" : v.get<std::string>();
}

void print_result(const RunResult& result, const std::string& format) {
    const nlohmann::json summary = result.summary();
    if (format == "json") {
        nlohmann::json j = to_json(result);
        j.erase("traces");
        std::cout << j.dump(2) << "\n";
        return;
    }
    if (format == "text") {
        std::cout << "Decision: " << field(summary, "decision") << "\n"
                  << "Generated Code:\n" << field(summary, "generatedArtifact") << "\n"
                  << "Review Feedback:\n" << field(summary, "reviewFeedback") << "\n"
                  << "Documented Code:\n" << field(summary, "documentedArtifact") << "\n"
                  << "Approval Status: " << field(summary, "approvalStatus") << "\n";
        if (result.error.has_value()) {
            std::cout << "Error: " << result.error->message << "\n";
        }
        return;
    }

    const std::string rule(60, '-');
    if (result.success) {
        std::cout << "[✅ SUCCESS] run " << result.run_id << " (" << result.steps_executed << " steps, "
                  << result.final_state.retry_count << " retries)\n";
    } else {
        std::cout << "[❌ ERROR] run " << result.run_id << ": " << result.message << "\n";
        if (result.stopped_at.has_value()) {
            std::cout << "Stopped at " << *result.stopped_at << "; resume with: codeflow resume " << result.run_id
                      << "\n";
        }
    }
    auto section = [&](const std::string& title, const std::string& body) {
        if (body == "N/A") return;
        std::cout << rule << "\n" << title << "\n" << rule << "\n" << body << "\n";
    };
    std::cout << "Decision: " << field(summary, "decision") << "\n";
    section("Generated Code", field(summary, "generatedArtifact"));
    section("Review Feedback", field(summary, "reviewFeedback"));
    section("Documented Code", field(summary, "documentedArtifact"));
    std::cout << "Approval Status: " << field(summary, "approvalStatus") << "\n";
}

int print_status(const AppConfig& config) {
    const bool has_key = !config.api_key.empty();
    const bool has_model = fs::exists(config.llm.model_path);

    std::cout << "Codeflow status\n";
    std::cout << "  API key         " << (has_key ? "✅ Set" : "❌ Missing") << "  (CODEFLOW_API_KEY)\n";
    std::cout << "  Model           " << (has_model ? "✅ Found" : "❌ Missing") << "  " << config.llm.model_path
              << "\n";
    std::cout << "  Checkpoints     " << config.checkpoint_dir << "\n";
    std::cout << "  Run config      " << to_json(config.run).dump() << "\n";

    FileCheckpointStore store(config.checkpoint_dir);
    const auto runs = store.list();
    std::cout << "  Stored runs     " << runs.size() << "\n";
    for (const auto& id : runs) {
        try {
            auto cp = store.load(id);
            if (!cp) continue;
            std::cout << "    " << id << "  " << (cp->finished() ? "finished" : "next: " + cp->next_step)
                      << "  (checkpoint #" << cp->sequence << ")\n";
        } catch (const CheckpointError& e) {
            std::cout << "    " << id << "  unreadable: " << e.what() << "\n";
        }
    }
    return has_model ? 0 : 1;
}

std::atomic<CancelToken*> g_cancel{nullptr};

void on_interrupt(int) {
    if (CancelToken* token = g_cancel.load()) token->cancel();
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<CliOptions> opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[❌ ERROR] " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (!opts.has_value()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        // 1. 配置
        AppConfig config = load_app_config(opts->config_path);
        apply_env_overrides(config);
        if (opts->model) config.run.model = *opts->model;
        if (opts->max_retries) config.run.max_retries = *opts->max_retries;
        if (opts->interactive) config.run.interactive = true;
        if (opts->log_level) config.log_level = *opts->log_level;
        validate(config.run);
        init_logging(config.log_level);

        if (opts->command == "status") {
            return print_status(config);
        }

        std::string task;
        if (opts->command == "generate" || opts->command == "review" || opts->command == "document") {
            if (opts->argument.empty()) {
                throw std::invalid_argument(opts->command + " needs an argument");
            }
            if (opts->command == "generate") task = opts->argument;
            else if (opts->command == "review") task = review_task(opts->argument);
            else task = document_task(opts->argument);
        } else if (opts->command == "resume") {
            if (opts->argument.empty()) {
                throw std::invalid_argument("resume needs a run id");
            }
        } else {
            throw std::invalid_argument("Unknown command: " + opts->command);
        }

        // 2. 模型后端
        if (!config.run.model.empty()) {
            config.llm.model_path = config.run.model;
        }
        LlamaAdapter::Config llm_config;
        llm_config.model_path = config.llm.model_path;
        llm_config.n_ctx = config.llm.n_ctx;
        llm_config.n_threads = config.llm.n_threads > 0 ? config.llm.n_threads
                                                        : static_cast<int>(std::thread::hardware_concurrency());
        llm_config.temperature = config.run.temperature;
        llm_config.min_p = config.llm.min_p;
        llm_config.n_predict = config.llm.n_predict;
        LlamaAdapter llama(llm_config);
        LimitedGenerationService generation(llama, config.llm.max_concurrency);

        // 3. 引擎
        FileCheckpointStore checkpoints(config.checkpoint_dir);
        StreamApprovalChannel approval(std::cin, std::cout, STDIN_FILENO);
        auto graph = build_code_assistant_graph(PromptSet::from_json(config.prompts));
        WorkflowEngine engine(graph, generation, &checkpoints, &approval);

        CancelToken cancel;
        g_cancel.store(&cancel);
        std::signal(SIGINT, on_interrupt);

        // 4. 执行
        RunResult result = opts->command == "resume"
            ? engine.resume(opts->argument, config.run, &cancel)
            : engine.run_as(opts->run_id.value_or(generate_run_id()), task, config.run, &cancel);

        std::signal(SIGINT, SIG_DFL);
        g_cancel.store(nullptr);

        print_result(result, opts->format);
        return result.success ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "[💥 FATAL] " << e.what() << std::endl;
        return 1;
    }
}
