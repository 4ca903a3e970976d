#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/loop_config.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/loop_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/workspace_guard.hpp"
#include "protocol/cli_request.hpp"
#include "runtime/backlog_selector.hpp"
#include "runtime/code_agent.hpp"
#include "runtime/orchestrator.hpp"
#include "runtime/run_reporter.hpp"
#include "session/archive_manager.hpp"
#include "session/backlog_store.hpp"
#include "session/iteration_journal.hpp"
#include "session/run_state_store.hpp"
#include "session/state_persistence.hpp"
#include "tools/command_executor.hpp"
#include "vcs/git_version_control.hpp"
#include "verification/verification_runner.hpp"

namespace {

namespace errors = storyloop::core::errors;

constexpr int kExitSuccess = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitSetupError = 3;

int fail(const std::string& context, const errors::LoopError& err, const int exit_code) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code;
}

// Structural problems with config, backlog or state map to 3; anything that
// went wrong while working (git, processes) maps to 1.
int exit_code_for(const errors::LoopError& err) {
    switch (err.category) {
        case errors::ErrorCategory::Input:
        case errors::ErrorCategory::Policy:
        case errors::ErrorCategory::Persistence:
        case errors::ErrorCategory::State:
            return kExitSetupError;
        default:
            return kExitRunFailed;
    }
}

struct Workspace {
    storyloop::core::config::LoopConfig config;
    std::filesystem::path backlog_path;
    std::filesystem::path progress_path;
};

errors::Result<Workspace> prepare_workspace(const storyloop::protocol::CliRequest& req) {
    auto loaded = storyloop::core::config::load_config(req.working_directory, req.config_path);
    if (errors::is_error(loaded)) {
        return errors::get_error(loaded);
    }

    storyloop::core::config::ConfigOverrides overrides;
    overrides.max_iterations = req.max_iterations;

    Workspace workspace;
    workspace.config = storyloop::core::config::merge_overrides(errors::get_value(loaded), overrides);

    const storyloop::policy::WorkspaceGuard guard;
    auto backlog_path = guard.validate_path_in_workspace(req.working_directory,
                                                         workspace.config.backlog_path);
    if (errors::is_error(backlog_path)) {
        return errors::get_error(backlog_path);
    }
    auto progress_path = guard.validate_path_in_workspace(req.working_directory,
                                                          workspace.config.progress_path);
    if (errors::is_error(progress_path)) {
        return errors::get_error(progress_path);
    }
    auto prompt_path = guard.validate_path_in_workspace(req.working_directory,
                                                        workspace.config.prompt_path);
    if (errors::is_error(prompt_path)) {
        return errors::get_error(prompt_path);
    }

    workspace.backlog_path = errors::get_value(backlog_path);
    workspace.progress_path = errors::get_value(progress_path);
    workspace.config.prompt_path = errors::get_value(prompt_path);
    return workspace;
}

int run_command(const storyloop::protocol::CliRequest& req, const Workspace& workspace,
                const std::string& run_id) {
    const auto& config = workspace.config;
    LOG_INFO("Max iterations: " + std::to_string(config.max_iterations));
    if (req.dry_run) {
        LOG_WARN("Dry-run mode enabled, no changes will be made");
    }

    storyloop::session::BacklogStore backlog_store(workspace.backlog_path);
    auto backlog = backlog_store.load();
    if (errors::is_error(backlog)) {
        return fail("Failed to load backlog", errors::get_error(backlog), kExitSetupError);
    }

    storyloop::session::ArchiveManager archive_manager(req.working_directory,
                                                       workspace.backlog_path,
                                                       workspace.progress_path);
    auto archived = archive_manager.archive_if_branch_changed(errors::get_value(backlog).branch_name);
    if (errors::is_error(archived)) {
        return fail("Failed to archive previous run", errors::get_error(archived), kExitSetupError);
    }
    auto progress = archive_manager.initialize_progress_file();
    if (errors::is_error(progress)) {
        return fail("Failed to create progress file", errors::get_error(progress), kExitSetupError);
    }

    storyloop::tools::ShellCommandExecutor executor;
    storyloop::vcs::GitVersionControl git(executor, req.working_directory);
    storyloop::session::FileStatePersistence persistence(
        storyloop::session::FileStatePersistence::default_location(req.working_directory));

    std::unique_ptr<storyloop::runtime::CodeAgent> agent;
    if (req.dry_run) {
        agent = std::make_unique<storyloop::runtime::SimulatedAgent>();
    } else {
        agent = std::make_unique<storyloop::runtime::CommandAgent>(
            executor, config.agent_command, config.prompt_path, config.agent_timeout_ms);
    }

    storyloop::verification::VerificationRunner verifier(
        executor, config.verification_commands, req.working_directory, req.dry_run);

    storyloop::session::IterationJournal journal(req.working_directory);
    storyloop::runtime::LogReporter log_reporter;
    storyloop::runtime::JournalReporter journal_reporter(run_id, journal);
    storyloop::runtime::FanoutReporter reporter({&log_reporter, &journal_reporter});

    storyloop::runtime::OrchestratorOptions options;
    options.config = config;
    options.simulate_only = req.dry_run;
    options.target_item = req.target_item;
    options.working_directory = req.working_directory;

    storyloop::runtime::Orchestrator orchestrator(options, backlog_store, persistence, git,
                                                  *agent, verifier, reporter);
    auto finished = orchestrator.run();
    if (errors::is_error(finished)) {
        const auto& err = errors::get_error(finished);
        return fail("Run aborted", err, exit_code_for(err));
    }

    const auto& summary = errors::get_value(finished);
    LOG_INFO("Stop reason: " + storyloop::protocol::to_string(summary.stop_reason));
    return summary.success ? kExitSuccess : kExitRunFailed;
}

int status_command(const storyloop::protocol::CliRequest& req, const Workspace& workspace) {
    storyloop::session::BacklogStore backlog_store(workspace.backlog_path);
    auto loaded = backlog_store.load();
    if (errors::is_error(loaded)) {
        return fail("Failed to load backlog", errors::get_error(loaded), kExitSetupError);
    }
    const auto& backlog = errors::get_value(loaded);

    storyloop::session::FileStatePersistence persistence(
        storyloop::session::FileStatePersistence::default_location(req.working_directory));
    auto opened = storyloop::session::RunStateStore::open_existing(persistence);
    if (errors::is_error(opened)) {
        return fail("Failed to read run state", errors::get_error(opened), kExitSetupError);
    }
    const auto& store = errors::get_value(opened);

    LOG_INFO("Project: " + backlog.project);
    LOG_INFO("Branch: " + backlog.branch_name);
    LOG_INFO("Description: " + backlog.description);

    const std::vector<std::string> blocked =
        store.has_value() ? store->blocked_items() : std::vector<std::string>{};
    const storyloop::runtime::BacklogSelector selector(backlog, blocked);
    LOG_INFO("Items: " + std::to_string(selector.completed_count()) + "/" +
             std::to_string(selector.total_count()) + " complete");

    if (store.has_value()) {
        LOG_INFO("Iteration: " + std::to_string(store->current_iteration()) + "/" +
                 std::to_string(store->max_iterations()));
        if (!blocked.empty()) {
            std::string joined;
            for (const auto& id : blocked) {
                joined += (joined.empty() ? "" : ", ") + id;
            }
            LOG_WARN("Blocked items: " + joined);
        }
    } else {
        LOG_INFO("No active run (state file not found)");
    }

    std::vector<storyloop::protocol::WorkItem> items = backlog.items;
    std::stable_sort(items.begin(), items.end(),
                     [](const storyloop::protocol::WorkItem& a,
                        const storyloop::protocol::WorkItem& b) {
                         return a.priority < b.priority;
                     });
    for (const auto& item : items) {
        LOG_INFO(std::string("  ") + (item.passes ? "[x] " : "[ ] ") + "[" +
                 std::to_string(item.priority) + "] " + item.id + ": " + item.title);
        if (req.verbose) {
            for (const auto& criterion : item.acceptance_criteria) {
                LOG_DEBUG("      - " + criterion);
            }
        }
    }

    if (store.has_value() && req.verbose) {
        LOG_DEBUG("Iteration history:");
        for (const auto& iteration : store->iterations()) {
            LOG_DEBUG("  " + storyloop::protocol::to_string(iteration.status) + " " +
                      iteration.item_id + " (retries: " +
                      std::to_string(iteration.retry_count) + ")" +
                      (iteration.error.has_value() ? " error: " + iteration.error.value() : ""));
        }
    }

    const std::size_t remaining = selector.total_count() - selector.completed_count();
    if (remaining == 0) {
        LOG_SUCCESS("All items complete");
    } else {
        LOG_INFO(std::to_string(remaining) + " item(s) remaining");
    }
    return kExitSuccess;
}

int unblock_command(const storyloop::protocol::CliRequest& req) {
    storyloop::session::FileStatePersistence persistence(
        storyloop::session::FileStatePersistence::default_location(req.working_directory));
    auto opened = storyloop::session::RunStateStore::open_existing(persistence);
    if (errors::is_error(opened)) {
        return fail("Failed to read run state", errors::get_error(opened), kExitSetupError);
    }
    auto store = errors::get_value(opened);
    if (!store.has_value()) {
        LOG_ERROR("No run state found. Nothing to unblock.");
        return kExitSetupError;
    }

    const std::string& item_id = req.item_id.value();
    auto unblocked = store->unblock_story(item_id);
    if (errors::is_error(unblocked)) {
        return fail("Failed to unblock " + item_id, errors::get_error(unblocked), kExitSetupError);
    }
    if (errors::get_value(unblocked)) {
        LOG_SUCCESS("Unblocked " + item_id);
    } else {
        LOG_WARN(item_id + " was not blocked");
    }
    return kExitSuccess;
}

int reset_command(const storyloop::protocol::CliRequest& req, const Workspace& workspace) {
    storyloop::session::FileStatePersistence persistence(
        storyloop::session::FileStatePersistence::default_location(req.working_directory));
    auto opened = storyloop::session::RunStateStore::open_existing(persistence);
    if (errors::is_error(opened)) {
        if (!req.force) {
            return fail("Failed to read run state", errors::get_error(opened), kExitSetupError);
        }
        LOG_WARN("Run state is unreadable and will be replaced");

        storyloop::session::BacklogStore backlog_store(workspace.backlog_path);
        auto backlog = backlog_store.load();
        if (errors::is_error(backlog)) {
            return fail("Failed to load backlog", errors::get_error(backlog), kExitSetupError);
        }
        auto fresh = storyloop::session::RunStateStore::create_fresh(
            persistence, errors::get_value(backlog).branch_name, workspace.config.max_iterations);
        if (errors::is_error(fresh)) {
            return fail("Failed to reset run state", errors::get_error(fresh), kExitSetupError);
        }
        LOG_SUCCESS("Run state reset");
        return kExitSuccess;
    }

    auto store = errors::get_value(opened);
    if (!store.has_value()) {
        LOG_INFO("No run state found. Nothing to reset.");
        return kExitSuccess;
    }

    if (!req.force) {
        LOG_WARN("This will discard " + std::to_string(store->iterations().size()) +
                 " recorded iteration(s) and every blocked item");
        LOG_INFO("Use --force to confirm");
        return kExitSuccess;
    }

    auto discarded = store->reset();
    if (errors::is_error(discarded)) {
        return fail("Failed to reset run state", errors::get_error(discarded), kExitSetupError);
    }
    LOG_SUCCESS("Run state reset, " + std::to_string(errors::get_value(discarded)) +
                " iteration(s) discarded");
    return kExitSuccess;
}

int rollback_command(const storyloop::protocol::CliRequest& req) {
    storyloop::session::FileStatePersistence persistence(
        storyloop::session::FileStatePersistence::default_location(req.working_directory));
    auto opened = storyloop::session::RunStateStore::open_existing(persistence);
    if (errors::is_error(opened)) {
        return fail("Failed to read run state", errors::get_error(opened), kExitSetupError);
    }
    auto store = errors::get_value(opened);
    if (!store.has_value()) {
        LOG_ERROR("No run state found. Nothing to roll back.");
        return kExitSetupError;
    }

    std::optional<std::string> revision;
    if (req.rollback_all) {
        revision = store->first_start_revision();
        if (!revision.has_value()) {
            LOG_WARN("No iterations to roll back");
            return kExitSuccess;
        }
    } else {
        const std::string& item_id = req.item_id.value();
        for (const auto& iteration : store->iterations()) {
            if (iteration.item_id == item_id) {
                revision = iteration.start_revision;
                break;
            }
        }
        if (!revision.has_value()) {
            LOG_ERROR("No iteration found for work item: " + item_id);
            return kExitSetupError;
        }
    }

    storyloop::tools::ShellCommandExecutor executor;
    storyloop::vcs::GitVersionControl git(executor, req.working_directory);

    if (!req.force) {
        LOG_WARN("This will reset the working tree to " + revision.value());
        auto changed = git.files_changed_since(revision.value());
        if (errors::is_error(changed)) {
            LOG_WARN("Unable to list changed files: " + errors::get_error(changed).message);
        } else {
            for (const auto& file : errors::get_value(changed)) {
                LOG_INFO("  would discard changes to " + file);
            }
        }
        LOG_INFO("Use --force to confirm");
        return kExitSuccess;
    }

    auto reset = git.reset_to(revision.value());
    if (errors::is_error(reset)) {
        return fail("Rollback failed", errors::get_error(reset), kExitRunFailed);
    }

    if (req.rollback_all) {
        auto discarded = store->reset();
        if (errors::is_error(discarded)) {
            return fail("Failed to update run state", errors::get_error(discarded), kExitSetupError);
        }
        LOG_SUCCESS("Rolled back all iterations");
        return kExitSuccess;
    }

    auto rolled_back = store->rollback_from(req.item_id.value());
    if (errors::is_error(rolled_back)) {
        return fail("Failed to update run state", errors::get_error(rolled_back), kExitSetupError);
    }
    LOG_SUCCESS("Rolled back " + req.item_id.value());
    return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a unique Run ID for this execution
    const std::string run_id = storyloop::core::config::generate_run_id();

    // 2. Register the Run ID with the Global Logger
    storyloop::core::logging::Logger::get().set_run_id(run_id);

    // 3. Parse CLI input and return normalized input errors
    auto parsed = storyloop::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        return fail("Input error", errors::get_error(parsed), kExitInputError);
    }

    const auto& req = errors::get_value(parsed);
    storyloop::core::logging::Logger::get().set_verbose(req.verbose);
    if (req.command == storyloop::protocol::CliCommand::Help) {
        LOG_INFO(storyloop::app::cli::usage());
        return kExitSuccess;
    }

    // 4. Load and validate configuration at the boundary
    auto prepared = prepare_workspace(req);
    if (errors::is_error(prepared)) {
        return fail("Configuration error", errors::get_error(prepared), kExitSetupError);
    }
    const auto& workspace = errors::get_value(prepared);

    // 5. Dispatch
    switch (req.command) {
        case storyloop::protocol::CliCommand::Run:
            return run_command(req, workspace, run_id);
        case storyloop::protocol::CliCommand::Status:
            return status_command(req, workspace);
        case storyloop::protocol::CliCommand::Unblock:
            return unblock_command(req);
        case storyloop::protocol::CliCommand::Reset:
            return reset_command(req, workspace);
        case storyloop::protocol::CliCommand::Rollback:
            return rollback_command(req);
        case storyloop::protocol::CliCommand::Help:
            break;
    }
    return kExitSuccess;
}
