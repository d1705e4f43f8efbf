// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "codeflow/checkpoint/checkpoint_store.h"
#include "codeflow/flow/code_assistant_graph.h"
#include "codeflow/flow/engine.h"
#include "test_support.h"
#include <limits>

using namespace codeflow;
using codeflow::testing::ScriptedGenerationService;

namespace {

// Flips a cancel token once a given kind of call has been answered.
class CancelAfter : public GenerationService {
public:
    CancelAfter(GenerationService& inner, CancelToken& token, std::string kind)
        : inner_(inner), token_(token), kind_(std::move(kind)) {}

    std::string complete(const std::string& system, const std::string& user,
                         const GenerationOptions& options) override {
        std::string response = inner_.complete(system, user, options);
        if (ScriptedGenerationService::classify(system) == kind_) token_.cancel();
        return response;
    }

private:
    GenerationService& inner_;
    CancelToken& token_;
    std::string kind_;
};

std::vector<StepName> trace_steps(const RunResult& result) {
    std::vector<StepName> steps;
    for (const auto& t : result.traces) steps.push_back(t.step);
    return steps;
}

} // namespace

TEST_CASE("Scenario A: generate, clean review, document, approve", "[engine][scenario]") {
    ScriptedGenerationService service;
    MemoryCheckpointStore checkpoints;
    WorkflowEngine engine(build_code_assistant_graph(), service, &checkpoints);

    RunResult result = engine.run_as("run-a", "Please generate an email validator");

    REQUIRE(result.success);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.run_id == "run-a");
    const WorkflowState& s = result.final_state;
    REQUIRE(s.routing_decision == RoutingDecision::GENERATE);
    REQUIRE(s.generated_artifact == service.generation);
    REQUIRE(s.review_feedback == "Looks good to me.");
    REQUIRE(s.documented_artifact == service.documentation);
    REQUIRE(s.approval_status == ApprovalStatus::APPROVED);
    REQUIRE(s.retry_count == 0);

    REQUIRE(result.steps_executed == 5);
    REQUIRE(trace_steps(result) == std::vector<StepName>{"orchestrator", "code_generator", "code_reviewer",
                                                         "documentation_agent", "human_gate"});
    for (const auto& t : result.traces) {
        REQUIRE(t.status == "success");
        REQUIRE(t.run_id == "run-a");
    }
    REQUIRE(result.traces[1].state_delta.contains("generatedArtifact"));

    auto last = checkpoints.load("run-a");
    REQUIRE(last.has_value());
    REQUIRE(last->finished());
    REQUIRE(last->sequence == 5);
    REQUIRE(last->last_step == "human_gate");
    REQUIRE(last->state == s);

    nlohmann::json summary = result.summary();
    REQUIRE(summary["decision"] == "GENERATE");
    REQUIRE(summary["approvalStatus"] == "approved");
    REQUIRE(summary["reviewFeedback"] == "Looks good to me.");
    REQUIRE(to_json(result)["runId"] == "run-a");
}

TEST_CASE("Scenario B: review always asks for a fix", "[engine][scenario][retry]") {
    ScriptedGenerationService service;
    service.review = "Please fix the regex, it has an error.";
    WorkflowEngine engine(build_code_assistant_graph(), service);

    SECTION("default limit") {
        RunResult result = engine.run("generate an email validator");
        REQUIRE(result.success);
        REQUIRE(result.final_state.retry_count == 3);
        REQUIRE(service.count("generation") == 4);
        REQUIRE(service.count("review") == 4);
        REQUIRE(service.count("documentation") == 1);
        REQUIRE(result.final_state.documented_artifact.has_value());
        REQUIRE(result.final_state.approval_status == ApprovalStatus::APPROVED);
        REQUIRE(result.steps_executed == 1 + 4 + 4 + 1 + 1);
    }

    SECTION("custom limit") {
        RunConfig config;
        config.max_retries = 1;
        RunResult result = engine.run("generate an email validator", config);
        REQUIRE(result.success);
        REQUIRE(result.final_state.retry_count == 1);
        REQUIRE(service.count("generation") == 2);
    }

    SECTION("no retries") {
        RunConfig config;
        config.max_retries = 0;
        RunResult result = engine.run("generate an email validator", config);
        REQUIRE(result.success);
        REQUIRE(result.final_state.retry_count == 0);
        REQUIRE(service.count("generation") == 1);
        REQUIRE(service.count("documentation") == 1);
    }
}

TEST_CASE("Scenario C: garbled classification takes the fallback path", "[engine][scenario]") {
    ScriptedGenerationService service;
    service.orchestrator = "  ¯\\_(ツ)_/¯ ";
    WorkflowEngine engine(build_code_assistant_graph(), service);

    RunResult result = engine.run("do something");
    REQUIRE(result.success);
    REQUIRE(result.final_state.routing_decision == RoutingDecision::UNKNOWN);
    REQUIRE(result.final_state.documented_artifact == "Here is some general help.");
    REQUIRE_FALSE(result.final_state.generated_artifact.has_value());
    REQUIRE(service.count("generation") == 0);
    REQUIRE(trace_steps(result) == std::vector<StepName>{"orchestrator", "fallback_agent"});

    SECTION("empty classification") {
        service.orchestrator = "";
        RunResult again = engine.run("do something");
        REQUIRE(again.success);
        REQUIRE(again.final_state.routing_decision == RoutingDecision::UNKNOWN);
        REQUIRE(again.final_state.documented_artifact.has_value());
    }
}

TEST_CASE("Review and document decisions skip generation", "[engine]") {
    ScriptedGenerationService service;
    WorkflowEngine engine(build_code_assistant_graph(), service);

    service.orchestrator = "REVIEW";
    RunResult reviewed = engine.run("Please review this code:\nx=1");
    REQUIRE(reviewed.success);
    REQUIRE(trace_steps(reviewed) ==
            std::vector<StepName>{"orchestrator", "code_reviewer", "documentation_agent", "human_gate"});

    service.orchestrator = "DOCUMENT";
    RunResult documented = engine.run("Add docs to this code");
    REQUIRE(documented.success);
    REQUIRE(trace_steps(documented) == std::vector<StepName>{"orchestrator", "documentation_agent", "human_gate"});
}

TEST_CASE("Retry bound from a mid-graph start", "[engine][retry]") {
    ScriptedGenerationService service;
    service.review = "ERROR: still broken, fix it";
    WorkflowEngine engine(build_code_assistant_graph(), service);

    WorkflowState state = make_initial_state("write add()");
    state.generated_artifact = "def add(a, b): return a - b";
    RunConfig config;
    config.max_retries = 3;

    RunResult result = engine.execute("run-mid", "code_reviewer", state, config);
    REQUIRE(result.success);
    REQUIRE(result.final_state.retry_count == 3);
    REQUIRE(service.count("review") == 4);
    REQUIRE(service.count("generation") == 3);
    REQUIRE(result.steps_executed <= engine.iteration_cap(config));

    auto steps = trace_steps(result);
    REQUIRE(steps.front() == "code_reviewer");
    REQUIRE(steps[steps.size() - 2] == "documentation_agent");
    REQUIRE(steps.back() == "human_gate");
}

TEST_CASE("Iteration cap", "[engine][budget]") {
    ScriptedGenerationService service;
    service.review = "fix";
    WorkflowEngine engine(build_code_assistant_graph(), service);

    RunConfig config;
    REQUIRE(engine.iteration_cap(config) == 2 * 6 + 2 * 3);

    config.max_steps = 3;
    RunResult result = engine.run("generate x", config);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->kind == ErrorKind::BUDGET);
    REQUIRE(result.steps_executed == 3);
    REQUIRE(result.stopped_at == "code_generator");
    REQUIRE(result.final_state.review_feedback == "fix");
}

TEST_CASE("Whole-run timeout", "[engine][budget]") {
    ScriptedGenerationService service;
    service.delay = std::chrono::milliseconds(600);
    WorkflowEngine engine(build_code_assistant_graph(), service);

    RunConfig config;
    config.timeout_seconds = 1;
    RunResult result = engine.run("generate x", config);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->kind == ErrorKind::TIMEOUT);
    REQUIRE(result.stopped_at == "code_reviewer");
    REQUIRE(result.final_state.generated_artifact.has_value());
}

TEST_CASE("Service failure aborts with partial state", "[engine][errors]") {
    ScriptedGenerationService service;
    service.failing = {"review"};
    MemoryCheckpointStore checkpoints;
    WorkflowEngine engine(build_code_assistant_graph(), service, &checkpoints);

    RunResult result = engine.run_as("run-fail", "generate a parser");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->kind == ErrorKind::SERVICE);
    REQUIRE(result.error->step == "code_reviewer");
    REQUIRE(result.error->service_kind == ServiceErrorKind::NETWORK);
    REQUIRE(result.stopped_at == "code_reviewer");
    REQUIRE(result.final_state.routing_decision == RoutingDecision::GENERATE);
    REQUIRE(result.final_state.generated_artifact.has_value());
    REQUIRE_FALSE(result.final_state.review_feedback.has_value());
    REQUIRE(service.count("review") == 1); // never retried
    REQUIRE(result.traces.back().status == "failed");
    REQUIRE(result.traces.back().error.has_value());

    auto cp = checkpoints.load("run-fail");
    REQUIRE(cp->next_step == "code_reviewer");
    REQUIRE(cp->sequence == 2);

    SECTION("resume after the service recovers") {
        service.failing.clear();
        RunResult resumed = engine.resume("run-fail");
        REQUIRE(resumed.success);
        REQUIRE(service.count("generation") == 1);
        REQUIRE(resumed.final_state.approval_status == ApprovalStatus::APPROVED);
        REQUIRE(resumed.traces.front().step == "code_reviewer");
        REQUIRE(resumed.traces.front().sequence == 3);
        REQUIRE(checkpoints.load("run-fail")->finished());

        RunResult again = engine.resume("run-fail");
        REQUIRE(again.success);
        REQUIRE(again.steps_executed == 0);
        REQUIRE(again.final_state == resumed.final_state);
    }

    SECTION("the id cannot be reused for a new run") {
        RunResult dup = engine.run_as("run-fail", "generate something else");
        REQUIRE(dup.error->kind == ErrorKind::INVALID_INPUT);
    }
}

TEST_CASE("Strict classification aborts on service failure", "[engine][errors]") {
    ScriptedGenerationService service;
    service.failing = {"orchestrator"};
    WorkflowEngine engine(build_code_assistant_graph(), service);

    RunResult lenient = engine.run("generate x");
    REQUIRE(lenient.success);
    REQUIRE(lenient.final_state.routing_decision == RoutingDecision::UNKNOWN);

    RunConfig strict;
    strict.strict_classification = true;
    RunResult result = engine.run("generate x", strict);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->kind == ErrorKind::SERVICE);
    REQUIRE(result.stopped_at == "orchestrator");
}

TEST_CASE("Router outside its declared set aborts the run", "[engine][errors]") {
    ScriptedGenerationService service;
    auto graph = std::make_shared<Graph>();
    graph->add_step(std::make_unique<GenerationStep>(PromptSet::defaults().generation, "gen"));
    graph->add_step(std::make_unique<FallbackStep>(PromptSet::defaults().fallback, "fb"));
    graph->set_entry("gen");
    graph->add_conditional_edges("gen", [](const WorkflowState&) { return StepName("bogus"); }, {"fb"});
    graph->add_edge("fb", StepName(kTerminal));
    WorkflowEngine engine(graph, service);

    RunResult result = engine.run("generate x");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->kind == ErrorKind::GRAPH);
    REQUIRE(result.final_state.generated_artifact == service.generation);
}

TEST_CASE("Cancellation", "[engine][cancel]") {
    ScriptedGenerationService service;
    MemoryCheckpointStore checkpoints;

    SECTION("before the first step") {
        WorkflowEngine engine(build_code_assistant_graph(), service, &checkpoints);
        CancelToken cancel;
        cancel.cancel();
        RunResult result = engine.run_as("run-c0", "generate x", {}, &cancel);
        REQUIRE(result.error->kind == ErrorKind::CANCELLED);
        REQUIRE(result.steps_executed == 0);
        REQUIRE(service.calls().empty());
    }

    SECTION("between steps, then resume") {
        CancelToken cancel;
        CancelAfter cancelling(service, cancel, "generation");
        WorkflowEngine engine(build_code_assistant_graph(), cancelling, &checkpoints);

        RunResult result = engine.run_as("run-c1", "generate x", {}, &cancel);
        REQUIRE(result.error->kind == ErrorKind::CANCELLED);
        REQUIRE(result.stopped_at == "code_reviewer");
        REQUIRE(result.final_state.generated_artifact.has_value());
        REQUIRE(checkpoints.load("run-c1")->next_step == "code_reviewer");

        WorkflowEngine fresh(build_code_assistant_graph(), service, &checkpoints);
        RunResult resumed = fresh.resume("run-c1");
        REQUIRE(resumed.success);
        REQUIRE(service.count("generation") == 1);
    }

    SECTION("while waiting for approval") {
        ApprovalBroker broker;
        WorkflowEngine engine(build_code_assistant_graph(), service, &checkpoints, &broker);
        RunConfig config;
        config.interactive = true;
        CancelToken cancel;
        std::thread canceller([&] {
            for (int i = 0; i < 400 && broker.pending().empty(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            cancel.cancel();
        });
        RunResult result = engine.run_as("run-c2", "generate x", config, &cancel);
        canceller.join();
        REQUIRE(result.error->kind == ErrorKind::CANCELLED);
        REQUIRE(result.stopped_at == "human_gate");
        REQUIRE_FALSE(result.final_state.approval_status.has_value());
        REQUIRE(result.final_state.documented_artifact.has_value());
    }
}

TEST_CASE("Interactive approval decision", "[engine][approval]") {
    ScriptedGenerationService service;
    ApprovalBroker broker;
    WorkflowEngine engine(build_code_assistant_graph(), service, nullptr, &broker);
    RunConfig config;
    config.interactive = true;

    broker.submit("run-no", false);
    RunResult rejected = engine.run_as("run-no", "generate x", config);
    REQUIRE(rejected.success);
    REQUIRE(rejected.final_state.approval_status == ApprovalStatus::REJECTED);

    broker.submit("run-yes", true);
    RunResult approved = engine.run_as("run-yes", "generate x", config);
    REQUIRE(approved.final_state.approval_status == ApprovalStatus::APPROVED);
}

TEST_CASE("Invalid input", "[engine][errors]") {
    ScriptedGenerationService service;
    WorkflowEngine engine(build_code_assistant_graph(), service);

    RunResult empty = engine.run("   ");
    REQUIRE(empty.error->kind == ErrorKind::INVALID_INPUT);
    REQUIRE(service.calls().empty());

    RunConfig bad;
    bad.max_retries = -1;
    REQUIRE(engine.run("generate x", bad).error->kind == ErrorKind::INVALID_INPUT);

    REQUIRE(engine.execute("run-z", "nowhere", make_initial_state("x"), {}).error->kind == ErrorKind::GRAPH);
    REQUIRE(engine.resume("run-z").error->kind == ErrorKind::NOT_FOUND);
}

TEST_CASE("Iteration cap stays bounded for very large retry limits", "[engine][budget]") {
    ScriptedGenerationService service;
    WorkflowEngine engine(build_code_assistant_graph(), service);

    RunConfig config;
    config.max_retries = 2000000000;
    REQUIRE_NOTHROW(validate(config));
    REQUIRE(engine.iteration_cap(config) == std::numeric_limits<int>::max());

    config.max_retries = std::numeric_limits<int>::max();
    REQUIRE(engine.iteration_cap(config) > 0);
}

TEST_CASE("Unused approval decisions end with the run", "[engine][approval]") {
    ScriptedGenerationService service;
    service.failing = {"review"};
    ApprovalBroker broker;
    WorkflowEngine engine(build_code_assistant_graph(), service, nullptr, &broker);
    RunConfig config;
    config.interactive = true;

    broker.submit("run-early", true);
    RunResult result = engine.run_as("run-early", "generate x", config);
    REQUIRE(result.error->kind == ErrorKind::SERVICE);
    REQUIRE_FALSE(broker.await_decision("run-early", result.final_state, std::chrono::milliseconds(100), nullptr)
                      .has_value());
}
