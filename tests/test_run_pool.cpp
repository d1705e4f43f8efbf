// tests/test_run_pool.cpp
#include <catch2/catch_test_macros.hpp>
#include "codeflow/flow/code_assistant_graph.h"
#include "codeflow/flow/run_pool.h"
#include "test_support.h"
#include <algorithm>

using namespace codeflow;
using codeflow::testing::ScriptedGenerationService;

namespace {

bool wait_for_pending(const ApprovalBroker& broker, const std::string& run_id) {
    for (int i = 0; i < 400; ++i) {
        auto pending = broker.pending();
        if (std::find(pending.begin(), pending.end(), run_id) != pending.end()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

} // namespace

TEST_CASE("Concurrent runs keep independent state", "[pool]") {
    ScriptedGenerationService service;
    service.delay = std::chrono::milliseconds(10);
    WorkflowEngine engine(build_code_assistant_graph(), service);
    RunPool pool(engine, 3);
    REQUIRE(pool.worker_count() == 3);

    RunConfig lenient;
    RunConfig no_retry;
    no_retry.max_retries = 0;

    auto a = pool.submit("task A", lenient, "run-a");
    auto b = pool.submit("task B", no_retry, "run-b");
    auto c = pool.submit("task C");
    REQUIRE(a.run_id == "run-a");
    REQUIRE_FALSE(c.run_id.empty());

    RunResult ra = a.result.get();
    RunResult rb = b.result.get();
    RunResult rc = c.result.get();
    REQUIRE(ra.success);
    REQUIRE(rb.success);
    REQUIRE(rc.success);
    REQUIRE(ra.final_state.task_description == "task A");
    REQUIRE(rb.final_state.task_description == "task B");
    REQUIRE(rc.final_state.task_description == "task C");
    REQUIRE(rc.run_id == c.run_id);
    REQUIRE(service.count("orchestrator") == 3);
}

TEST_CASE("Generation concurrency cap holds across runs", "[pool]") {
    ScriptedGenerationService service;
    service.delay = std::chrono::milliseconds(15);
    LimitedGenerationService limited(service, 1);
    WorkflowEngine engine(build_code_assistant_graph(), limited);
    RunPool pool(engine, 4);

    std::vector<RunPool::Submission> submissions;
    for (int i = 0; i < 4; ++i) {
        submissions.push_back(pool.submit("task " + std::to_string(i)));
    }
    for (auto& s : submissions) {
        REQUIRE(s.result.get().success);
    }
    REQUIRE(service.max_in_flight() == 1);
    REQUIRE(limited.in_flight() == 0);
}

TEST_CASE("Cancelling runs through the pool", "[pool][cancel]") {
    ScriptedGenerationService service;
    ApprovalBroker broker;
    WorkflowEngine engine(build_code_assistant_graph(), service, nullptr, &broker);
    RunPool pool(engine, 1);
    RunConfig interactive;
    interactive.interactive = true;

    SECTION("run suspended at the approval gate") {
        auto waiting = pool.submit("task", interactive, "run-w");
        REQUIRE(wait_for_pending(broker, "run-w"));
        REQUIRE(pool.cancel("run-w"));

        RunResult result = waiting.result.get();
        REQUIRE(result.error->kind == ErrorKind::CANCELLED);
        REQUIRE(result.stopped_at == "human_gate");
        REQUIRE_FALSE(pool.cancel("run-w"));
        REQUIRE(pool.active().empty());
    }

    SECTION("queued run never starts") {
        auto first = pool.submit("first", interactive, "run-1");
        REQUIRE(wait_for_pending(broker, "run-1"));
        auto second = pool.submit("second", {}, "run-2");
        REQUIRE(pool.active().size() == 2);
        REQUIRE(pool.cancel("run-2"));

        broker.submit("run-1", true);
        RunResult r1 = first.result.get();
        RunResult r2 = second.result.get();
        REQUIRE(r1.success);
        REQUIRE(r1.final_state.approval_status == ApprovalStatus::APPROVED);
        REQUIRE(r2.error->kind == ErrorKind::CANCELLED);
        REQUIRE(r2.steps_executed == 0);
    }

    SECTION("duplicate active id is rejected") {
        auto first = pool.submit("first", interactive, "run-dup");
        REQUIRE_THROWS_AS(pool.submit("again", {}, "run-dup"), std::invalid_argument);
        REQUIRE(wait_for_pending(broker, "run-dup"));
        broker.submit("run-dup", false);
        REQUIRE(first.result.get().final_state.approval_status == ApprovalStatus::REJECTED);
    }

    REQUIRE_FALSE(pool.cancel("never-submitted"));
}

TEST_CASE("Resume through the pool", "[pool][checkpoint]") {
    ScriptedGenerationService service;
    service.failing = {"documentation"};
    MemoryCheckpointStore checkpoints;
    WorkflowEngine engine(build_code_assistant_graph(), service, &checkpoints);
    RunPool pool(engine, 2);

    RunResult failed = pool.submit("task", {}, "run-r").result.get();
    REQUIRE(failed.error->kind == ErrorKind::SERVICE);
    REQUIRE(failed.stopped_at == "documentation_agent");

    service.failing.clear();
    RunResult resumed = pool.submit_resume("run-r").result.get();
    REQUIRE(resumed.success);
    REQUIRE(resumed.steps_executed == 2);
    REQUIRE(service.count("review") == 1);
}

TEST_CASE("Pool lifecycle", "[pool]") {
    ScriptedGenerationService service;
    WorkflowEngine engine(build_code_assistant_graph(), service);

    REQUIRE_THROWS_AS(RunPool(engine, 0), std::invalid_argument);

    RunPool pool(engine, 2);
    auto pending = pool.submit("task");
    pool.shutdown();
    REQUIRE(pending.result.get().success); // queued work drains
    REQUIRE_THROWS_AS(pool.submit("late"), std::runtime_error);
    pool.shutdown();
}
