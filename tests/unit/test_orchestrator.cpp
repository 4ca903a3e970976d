#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/loop_config.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/loop_errors.hpp"
#include "fakes/fake_collaborators.hpp"
#include "protocol/run_summary.hpp"
#include "runtime/orchestrator.hpp"
#include "session/backlog_store.hpp"
#include "verification/verification_runner.hpp"

namespace {

using storyloop::core::config::LoopConfig;
using storyloop::core::errors::ErrorCategory;
using storyloop::core::errors::LoopError;
using storyloop::core::errors::Result;
using storyloop::core::errors::get_error;
using storyloop::core::errors::get_value;
using storyloop::core::errors::is_error;
using storyloop::fakes::FakeCommandExecutor;
using storyloop::fakes::FakeVersionControl;
using storyloop::fakes::InMemoryStatePersistence;
using storyloop::fakes::RecordingReporter;
using storyloop::fakes::ScriptedAgent;
using storyloop::fakes::structured_block;
using storyloop::protocol::CheckCommand;
using storyloop::protocol::RunSummary;
using storyloop::protocol::StopReason;
using storyloop::runtime::Orchestrator;
using storyloop::runtime::OrchestratorOptions;
using storyloop::session::BacklogStore;
using storyloop::verification::VerificationRunner;
using std::chrono::milliseconds;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_orchestrator_" + storyloop::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

const char* kTwoItems = R"({
  "project": "demo",
  "branchName": "storyloop/demo",
  "description": "",
  "workItems": [
    {"id": "WI-2", "title": "Second", "description": "", "acceptanceCriteria": [],
     "priority": 2, "passes": false},
    {"id": "WI-1", "title": "First", "description": "", "acceptanceCriteria": [],
     "priority": 1, "passes": false}
  ]
})";

const char* kOneItem = R"({
  "project": "demo",
  "branchName": "storyloop/demo",
  "description": "",
  "workItems": [
    {"id": "WI-1", "title": "Only", "description": "", "acceptanceCriteria": [],
     "priority": 1, "passes": false}
  ]
})";

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.max_iterations = 10;
        config.max_retries_per_item = 3;
        config.retry.initial_delay_ms = 100;
        config.retry.backoff_multiplier = 2.0;
        config.retry.max_delay_ms = 150;
        config.iteration_pause_ms = 5;

        CheckCommand build;
        build.name = "build";
        build.command = "make";
        checks.push_back(build);
    }

    void write_backlog(const std::string& document) {
        std::ofstream out(workspace.root() / "backlog.json", std::ios::trunc);
        out << document;
    }

    Result<RunSummary> run_loop(ScriptedAgent& agent, bool simulate_only = false,
                                std::optional<std::string> target = std::nullopt) {
        OrchestratorOptions options;
        options.config = config;
        options.simulate_only = simulate_only;
        options.target_item = std::move(target);
        options.working_directory = workspace.root();

        VerificationRunner verifier(executor, checks, workspace.root(), simulate_only);
        Orchestrator orchestrator(options, backlog_store, persistence, vcs, agent, verifier,
                                  reporter,
                                  [this](milliseconds delay) { slept.push_back(delay); });
        return orchestrator.run();
    }

    TempWorkspace workspace;
    BacklogStore backlog_store{workspace.root() / "backlog.json"};
    InMemoryStatePersistence persistence;
    FakeVersionControl vcs;
    FakeCommandExecutor executor;
    RecordingReporter reporter;
    LoopConfig config;
    std::vector<CheckCommand> checks;
    std::vector<milliseconds> slept;
};

TEST_F(OrchestratorTest, CompletesEveryItemInPriorityOrder) {
    write_backlog(kTwoItems);
    ScriptedAgent agent({structured_block("success", "continue")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    const auto& summary = get_value(result);
    EXPECT_TRUE(summary.success);
    EXPECT_EQ(summary.iterations_used, 2u);
    EXPECT_EQ(summary.completed_items, 2u);
    EXPECT_TRUE(summary.blocked_items.empty());
    EXPECT_EQ(summary.stop_reason, StopReason::AllComplete);

    ASSERT_EQ(agent.requests.size(), 2u);
    EXPECT_EQ(agent.requests[0].item.id, "WI-1");
    EXPECT_EQ(agent.requests[0].iteration_number, 1u);
    EXPECT_EQ(agent.requests[1].item.id, "WI-2");
    EXPECT_EQ(agent.requests[1].iteration_number, 2u);
    EXPECT_EQ(executor.requests.size(), 2u);

    const std::vector<std::string> expected_events = {
        "started:WI-1#1", "output:WI-1", "verified:WI-1:pass", "completed:WI-1",
        "started:WI-2#2", "output:WI-2", "verified:WI-2:pass", "completed:WI-2",
        "finished"};
    EXPECT_EQ(reporter.events, expected_events);

    // Only the pause between the two passes; none after the final item.
    ASSERT_EQ(slept.size(), 1u);
    EXPECT_EQ(slept[0], milliseconds(5));

    auto reloaded = backlog_store.load();
    ASSERT_FALSE(is_error(reloaded));
    for (const auto& item : get_value(reloaded).items) {
        EXPECT_TRUE(item.passes) << item.id;
    }
}

TEST_F(OrchestratorTest, BlocksItemAfterRetriesAreExhausted) {
    write_backlog(kOneItem);
    config.max_retries_per_item = 2;
    ScriptedAgent agent({structured_block("failure", "continue", "WI-1", "\"tests broke\"")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    const auto& summary = get_value(result);
    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.iterations_used, 2u);
    EXPECT_EQ(summary.completed_items, 0u);
    EXPECT_EQ(summary.blocked_items, std::vector<std::string>{"WI-1"});
    EXPECT_EQ(summary.stop_reason, StopReason::Stalled);
    EXPECT_FALSE(summary.reached_max_iterations);

    EXPECT_EQ(vcs.resets, (std::vector<std::string>{"rev-1", "rev-2"}));
    EXPECT_EQ(reporter.failures, (std::vector<std::string>{"tests broke", "tests broke"}));
    EXPECT_TRUE(executor.requests.empty());
    EXPECT_EQ(reporter.events.back(), "finished");
    EXPECT_EQ(reporter.events[reporter.events.size() - 2], "blocked:WI-1#2");
}

TEST_F(OrchestratorTest, CompleteSignalSkipsVerification) {
    write_backlog(kOneItem);
    ScriptedAgent agent({structured_block("success", "complete")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success);
    EXPECT_EQ(get_value(result).iterations_used, 1u);
    EXPECT_TRUE(executor.requests.empty());
    EXPECT_TRUE(slept.empty());

    auto reloaded = backlog_store.load();
    ASSERT_FALSE(is_error(reloaded));
    EXPECT_TRUE(get_value(reloaded).items[0].passes);
}

TEST_F(OrchestratorTest, CompleteSignalWinsOverFailureStatus) {
    write_backlog(kOneItem);
    ScriptedAgent agent({structured_block("failure", "complete")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success);
    EXPECT_TRUE(vcs.resets.empty());
}

TEST_F(OrchestratorTest, StopsWhenIterationBudgetRunsOut) {
    write_backlog(kOneItem);
    config.max_iterations = 1;
    ScriptedAgent agent({"no structured output here"});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    const auto& summary = get_value(result);
    EXPECT_TRUE(summary.reached_max_iterations);
    EXPECT_EQ(summary.iterations_used, 1u);
    EXPECT_EQ(summary.completed_items, 0u);
    EXPECT_TRUE(summary.blocked_items.empty());
    EXPECT_EQ(summary.stop_reason, StopReason::IterationBudgetExhausted);
}

TEST_F(OrchestratorTest, BlockedSignalBlocksOnFirstAttempt) {
    write_backlog(kOneItem);
    ScriptedAgent agent(
        {structured_block("success", "blocked", "WI-1", "\"needs credentials\"")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).iterations_used, 1u);
    EXPECT_EQ(get_value(result).blocked_items, std::vector<std::string>{"WI-1"});
    EXPECT_EQ(vcs.resets, std::vector<std::string>{"rev-1"});
    EXPECT_EQ(reporter.failures, std::vector<std::string>{"needs credentials"});
    EXPECT_TRUE(executor.requests.empty());
    EXPECT_TRUE(slept.empty());
}

TEST_F(OrchestratorTest, FailedVerificationRollsBack) {
    write_backlog(kOneItem);
    config.max_iterations = 1;
    executor.default_exit_code = 1;
    ScriptedAgent agent({structured_block("success", "continue")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).success);
    EXPECT_EQ(vcs.resets, std::vector<std::string>{"rev-1"});
    EXPECT_EQ(reporter.failures, std::vector<std::string>{"Verification failed"});

    auto reloaded = backlog_store.load();
    ASSERT_FALSE(is_error(reloaded));
    EXPECT_FALSE(get_value(reloaded).items[0].passes);
}

TEST_F(OrchestratorTest, RetryDelaysFollowBackoffPolicy) {
    write_backlog(kOneItem);
    ScriptedAgent agent({structured_block("failure", "continue")});

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).iterations_used, 3u);
    EXPECT_EQ(slept, (std::vector<milliseconds>{milliseconds(100), milliseconds(150)}));
    EXPECT_EQ(reporter.delays, slept);
}

TEST_F(OrchestratorTest, SpawnFailureIsRetriedNotFatal) {
    write_backlog(kOneItem);
    config.max_iterations = 1;
    ScriptedAgent agent({});
    agent.spawn_error = LoopError{ErrorCategory::Agent, "cannot spawn", "agent_spawn_failed"};

    auto result = run_loop(agent);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).iterations_used, 1u);
    EXPECT_EQ(reporter.failures, std::vector<std::string>{"cannot spawn"});
    EXPECT_EQ(vcs.resets, std::vector<std::string>{"rev-1"});
}

TEST_F(OrchestratorTest, PinnedCompleteItemEndsWithoutWork) {
    write_backlog(R"({"project": "demo", "branchName": "storyloop/demo", "description": "",
      "workItems": [
        {"id": "WI-1", "title": "a", "description": "", "acceptanceCriteria": [],
         "priority": 1, "passes": false},
        {"id": "WI-2", "title": "b", "description": "", "acceptanceCriteria": [],
         "priority": 2, "passes": true}]})");
    ScriptedAgent agent({structured_block("success", "complete")});

    auto result = run_loop(agent, false, std::string("WI-2"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).iterations_used, 0u);
    EXPECT_EQ(get_value(result).stop_reason, StopReason::NoEligibleItem);
    EXPECT_TRUE(agent.requests.empty());
}

TEST_F(OrchestratorTest, PinnedItemIsTheOnlyOneRun) {
    write_backlog(kTwoItems);
    ScriptedAgent agent({structured_block("success", "complete")});

    auto result = run_loop(agent, false, std::string("WI-2"));
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(agent.requests.size(), 1u);
    EXPECT_EQ(agent.requests[0].item.id, "WI-2");
    EXPECT_EQ(get_value(result).completed_items, 1u);
    EXPECT_EQ(get_value(result).stop_reason, StopReason::NoEligibleItem);
}

TEST_F(OrchestratorTest, ResumedRunKeepsRetryCounts) {
    write_backlog(kOneItem);
    config.max_iterations = 1;
    config.max_retries_per_item = 2;
    ScriptedAgent agent({structured_block("failure", "continue")});

    auto first = run_loop(agent);
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first).blocked_items.empty());

    config.max_iterations = 5;
    auto second = run_loop(agent);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).iterations_used, 1u);
    EXPECT_EQ(get_value(second).blocked_items, std::vector<std::string>{"WI-1"});
    EXPECT_EQ(agent.requests.back().iteration_number, 2u);
}

TEST_F(OrchestratorTest, SummaryIgnoresBlockedIdsMissingFromBacklog) {
    write_backlog(kOneItem);
    ScriptedAgent blocker({structured_block("success", "blocked")});
    auto first = run_loop(blocker);
    ASSERT_FALSE(is_error(first));
    ASSERT_EQ(get_value(first).blocked_items, std::vector<std::string>{"WI-1"});

    write_backlog(R"({"project": "demo", "branchName": "storyloop/demo", "description": "",
      "workItems": [
        {"id": "WI-9", "title": "Replacement", "description": "", "acceptanceCriteria": [],
         "priority": 1, "passes": false}]})");
    ScriptedAgent agent({structured_block("success", "complete", "WI-9")});

    auto second = run_loop(agent);
    ASSERT_FALSE(is_error(second));
    EXPECT_TRUE(get_value(second).success);
    EXPECT_TRUE(get_value(second).blocked_items.empty());
    EXPECT_EQ(get_value(second).stop_reason, StopReason::AllComplete);
}

TEST_F(OrchestratorTest, SimulateModeNeverRollsBackOrSleeps) {
    write_backlog(kTwoItems);
    config.max_iterations = 3;
    ScriptedAgent agent({structured_block("failure", "continue")});

    auto result = run_loop(agent, true);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).iterations_used, 3u);
    EXPECT_TRUE(vcs.resets.empty());
    EXPECT_TRUE(slept.empty());
}

TEST_F(OrchestratorTest, CreatesBranchFromMainWhenMissing) {
    write_backlog(kOneItem);
    ScriptedAgent agent({structured_block("success", "complete")});

    ASSERT_FALSE(is_error(run_loop(agent)));
    EXPECT_EQ(vcs.created, std::vector<std::string>{"storyloop/demo<-main"});
    EXPECT_EQ(vcs.branch, "storyloop/demo");
}

TEST_F(OrchestratorTest, StaysOnBranchWhenAlreadyCheckedOut) {
    write_backlog(kOneItem);
    vcs.branch = "storyloop/demo";
    vcs.branches.insert("storyloop/demo");
    ScriptedAgent agent({structured_block("success", "complete")});

    ASSERT_FALSE(is_error(run_loop(agent)));
    EXPECT_TRUE(vcs.created.empty());
    EXPECT_TRUE(vcs.checkouts.empty());
}

TEST_F(OrchestratorTest, MissingBacklogIsFatal) {
    ScriptedAgent agent({});

    auto result = run_loop(agent);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "backlog_not_found");
    EXPECT_TRUE(reporter.events.empty());
}

TEST_F(OrchestratorTest, MalformedStateIsFatal) {
    write_backlog(kOneItem);
    persistence.document = "{not json";
    ScriptedAgent agent({});

    auto result = run_loop(agent);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "state_malformed");
    EXPECT_TRUE(agent.requests.empty());
}

TEST_F(OrchestratorTest, FailedRollbackIsFatal) {
    write_backlog(kOneItem);
    vcs.fail_reset = true;
    ScriptedAgent agent({structured_block("failure", "continue")});

    auto result = run_loop(agent);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "git_command_failed");
    EXPECT_EQ(agent.requests.size(), 1u);
}

TEST_F(OrchestratorTest, StateWriteFailureIsFatal) {
    write_backlog(kOneItem);
    persistence.fail_writes = true;
    ScriptedAgent agent({structured_block("success", "complete")});

    auto result = run_loop(agent);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Persistence);
}

}  // namespace
