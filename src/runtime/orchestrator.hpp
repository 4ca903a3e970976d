#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include "core/config/loop_config.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/backlog.hpp"
#include "protocol/run_summary.hpp"
#include "protocol/structured_output.hpp"
#include "runtime/backlog_selector.hpp"
#include "runtime/backoff.hpp"
#include "runtime/code_agent.hpp"
#include "runtime/output_interpreter.hpp"
#include "runtime/run_reporter.hpp"
#include "session/backlog_store.hpp"
#include "session/run_state_store.hpp"
#include "session/state_persistence.hpp"
#include "vcs/version_control.hpp"
#include "verification/verification_runner.hpp"

namespace storyloop::runtime {

// What the loop does with one interpreted output.
struct CompleteItem {};                          // the process says the item is done
struct VerifyItem {};                            // success, run the checks first
struct RetryItem { std::string message; };       // roll back and try again later
struct BlockItem { std::string message; };       // roll back and stop trying

using IterationVerdict = std::variant<CompleteItem, VerifyItem, RetryItem, BlockItem>;

// `complete` wins over the reported status; `blocked` wins over `continue`.
IterationVerdict classify_output(const protocol::ParsedOutput& parsed);

struct OrchestratorOptions {
    core::config::LoopConfig config;
    bool simulate_only = false;                  // no rollback, no pauses
    std::optional<std::string> target_item;      // pin the run to one item
    std::filesystem::path working_directory = ".";
};

// The supervised loop. Each pass selects an item, runs the external process
// once, and either completes the item or rolls the tree back and records the
// failure. Every collaborator must outlive the orchestrator.
class Orchestrator {
public:
    Orchestrator(OrchestratorOptions options,
                 const session::BacklogStore& backlog_store,
                 session::StatePersistence& state_persistence,
                 vcs::VersionControl& version_control,
                 CodeAgent& agent,
                 const verification::VerificationRunner& verifier,
                 RunReporter& reporter,
                 Sleeper sleeper = thread_sleeper());

    // Errors are structural (backlog, state, rollback); recoverable failures
    // of the external process never end the run early.
    core::errors::Result<protocol::RunSummary> run();

private:
    enum class PassOutcome {
        Completed,      // item done, more work remains
        AllComplete,    // item done and nothing remains
        Retrying,       // item failed, backoff already waited out
        Blocked         // item failed for the last time
    };

    core::errors::Result<std::string> initialize();
    core::errors::Result<std::string> ensure_branch();

    core::errors::Result<PassOutcome> run_pass(const protocol::WorkItem& item);
    core::errors::Result<PassOutcome> complete_item(const std::string& item_id);
    core::errors::Result<PassOutcome> verify_item(const std::string& item_id,
                                                  const std::string& start_revision);
    core::errors::Result<PassOutcome> roll_back_and_fail(const std::string& item_id,
                                                         const std::string& start_revision,
                                                         const std::string& message,
                                                         std::uint32_t max_retries);

    protocol::RunSummary summarize(std::uint32_t iterations_used) const;

    OrchestratorOptions options_;
    const session::BacklogStore& backlog_store_;
    session::StatePersistence& state_persistence_;
    vcs::VersionControl& version_control_;
    CodeAgent& agent_;
    const verification::VerificationRunner& verifier_;
    RunReporter& reporter_;
    Sleeper sleeper_;
    OutputInterpreter interpreter_;

    protocol::Backlog backlog_;
    std::optional<session::RunStateStore> state_;
    std::optional<BacklogSelector> selector_;
};

}  // namespace storyloop::runtime
