#include "runtime/orchestrator.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include "core/logging/logger.hpp"

namespace storyloop::runtime {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using protocol::NextAction;
using protocol::OutputStatus;

namespace {

template <typename>
inline constexpr bool kUnhandledVerdict = false;

constexpr const char* kVerificationFailed = "Verification failed";
constexpr const char* kReportedBlocked = "External process reported the item as blocked";

}  // namespace

IterationVerdict classify_output(const protocol::ParsedOutput& parsed) {
    if (!parsed.structured.has_value()) {
        return RetryItem{OutputInterpreter::kNoStructuredOutput};
    }

    const auto& structured = parsed.structured.value();
    switch (structured.next_action) {
        case NextAction::Complete:
            return CompleteItem{};
        case NextAction::Blocked:
            return BlockItem{structured.error.value_or(kReportedBlocked)};
        case NextAction::Continue:
            break;
    }

    switch (structured.status) {
        case OutputStatus::Success:
            return VerifyItem{};
        case OutputStatus::Failure:
            return RetryItem{OutputInterpreter::error_message(parsed).value_or(
                OutputInterpreter::kFailureWithoutDetails)};
    }
    return RetryItem{OutputInterpreter::kFailureWithoutDetails};
}

Orchestrator::Orchestrator(OrchestratorOptions options,
                           const session::BacklogStore& backlog_store,
                           session::StatePersistence& state_persistence,
                           vcs::VersionControl& version_control,
                           CodeAgent& agent,
                           const verification::VerificationRunner& verifier,
                           RunReporter& reporter,
                           Sleeper sleeper)
    : options_(std::move(options)),
      backlog_store_(backlog_store),
      state_persistence_(state_persistence),
      version_control_(version_control),
      agent_(agent),
      verifier_(verifier),
      reporter_(reporter),
      sleeper_(std::move(sleeper)) {}

Result<std::string> Orchestrator::ensure_branch() {
    const std::string& target = backlog_.branch_name;
    auto current = version_control_.current_branch();
    if (is_error(current)) {
        return get_error(current);
    }
    if (get_value(current) == target) {
        return target;
    }

    LOG_INFO("Switching to branch: " + target);
    const std::string main_branch = version_control_.main_branch();
    return version_control_.checkout_or_create(target, main_branch);
}

Result<std::string> Orchestrator::initialize() {
    selector_.reset();
    state_.reset();

    auto loaded = backlog_store_.load();
    if (is_error(loaded)) {
        return get_error(loaded);
    }
    backlog_ = get_value(loaded);

    auto branch = ensure_branch();
    if (is_error(branch)) {
        return get_error(branch);
    }

    auto opened = session::RunStateStore::open(state_persistence_, backlog_.branch_name,
                                               options_.config.max_iterations);
    if (is_error(opened)) {
        return get_error(opened);
    }
    state_.emplace(get_value(opened));
    selector_.emplace(backlog_, state_->blocked_items(), options_.target_item);

    LOG_DEBUG("Loaded " + std::to_string(backlog_.items.size()) + " work item(s) for " +
              backlog_.branch_name);
    return backlog_.branch_name;
}

Result<protocol::RunSummary> Orchestrator::run() {
    auto initialized = initialize();
    if (is_error(initialized)) {
        return get_error(initialized);
    }

    std::uint32_t iterations_used = 0;
    while (state_->can_start_new_iteration()) {
        selector_->update_blocked(state_->blocked_items());
        if (selector_->all_complete_or_blocked()) {
            break;
        }

        const auto item = selector_->next_item();
        if (!item.has_value()) {
            LOG_WARN("No eligible work item left to run");
            break;
        }

        auto outcome = run_pass(item.value());
        if (is_error(outcome)) {
            return get_error(outcome);
        }
        ++iterations_used;

        const PassOutcome pass = get_value(outcome);
        if (pass == PassOutcome::AllComplete) {
            break;
        }
        if (pass == PassOutcome::Completed && !options_.simulate_only) {
            sleeper_(std::chrono::milliseconds(options_.config.iteration_pause_ms));
        }
    }

    selector_->update_blocked(state_->blocked_items());
    auto summary = summarize(iterations_used);
    reporter_.run_finished(summary);
    return summary;
}

Result<Orchestrator::PassOutcome> Orchestrator::run_pass(const protocol::WorkItem& item) {
    const std::uint32_t iteration_number = state_->current_iteration() + 1;

    auto revision = version_control_.current_revision();
    if (is_error(revision)) {
        return get_error(revision);
    }
    const std::string start_revision = get_value(revision);

    auto started = state_->start_iteration(item.id, start_revision);
    if (is_error(started)) {
        return get_error(started);
    }
    reporter_.iteration_started(iteration_number, options_.config.max_iterations, item,
                                start_revision);

    protocol::AgentRequest request;
    request.item = item;
    request.iteration_number = iteration_number;
    request.max_iterations = options_.config.max_iterations;
    request.working_directory = options_.working_directory;

    IterationVerdict verdict;
    auto invoked = agent_.run(request);
    if (is_error(invoked)) {
        verdict = RetryItem{get_error(invoked).message};
    } else {
        const auto parsed = interpreter_.interpret(get_value(invoked).output);
        reporter_.output_interpreted(item.id, parsed);
        verdict = classify_output(parsed);
    }

    return std::visit(
        [&](const auto& v) -> Result<PassOutcome> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, CompleteItem>) {
                return complete_item(item.id);
            } else if constexpr (std::is_same_v<T, VerifyItem>) {
                return verify_item(item.id, start_revision);
            } else if constexpr (std::is_same_v<T, RetryItem>) {
                return roll_back_and_fail(item.id, start_revision, v.message,
                                          options_.config.max_retries_per_item);
            } else if constexpr (std::is_same_v<T, BlockItem>) {
                return roll_back_and_fail(item.id, start_revision, v.message, 1);
            } else {
                static_assert(kUnhandledVerdict<T>, "unhandled iteration verdict");
            }
        },
        verdict);
}

Result<Orchestrator::PassOutcome> Orchestrator::complete_item(const std::string& item_id) {
    auto it = std::find_if(backlog_.items.begin(), backlog_.items.end(),
                           [&item_id](const protocol::WorkItem& candidate) {
                               return candidate.id == item_id;
                           });
    if (it == backlog_.items.end()) {
        return LoopError{ErrorCategory::Internal,
                         "Selected work item vanished from the backlog: " + item_id,
                         "item_not_found"};
    }
    it->passes = true;
    auto saved = backlog_store_.save(backlog_);
    if (is_error(saved)) {
        return get_error(saved);
    }

    auto end_revision = version_control_.current_revision();
    if (is_error(end_revision)) {
        return get_error(end_revision);
    }
    auto completed = state_->complete_iteration(item_id, get_value(end_revision));
    if (is_error(completed)) {
        return get_error(completed);
    }

    reporter_.item_completed(item_id);
    return selector_->all_complete() ? PassOutcome::AllComplete : PassOutcome::Completed;
}

Result<Orchestrator::PassOutcome> Orchestrator::verify_item(
    const std::string& item_id, const std::string& start_revision) {
    const auto report = verifier_.run();
    reporter_.verification_finished(item_id, report);
    if (report.success) {
        return complete_item(item_id);
    }
    return roll_back_and_fail(item_id, start_revision, kVerificationFailed,
                              options_.config.max_retries_per_item);
}

Result<Orchestrator::PassOutcome> Orchestrator::roll_back_and_fail(
    const std::string& item_id, const std::string& start_revision,
    const std::string& message, const std::uint32_t max_retries) {
    reporter_.iteration_failed(item_id, message);

    if (!options_.simulate_only) {
        LOG_INFO("Rolling back changes...");
        auto reset = version_control_.reset_to(start_revision);
        if (is_error(reset)) {
            return get_error(reset);
        }
    }

    auto failed = state_->fail_iteration(item_id, message, max_retries);
    if (is_error(failed)) {
        return get_error(failed);
    }

    const auto last = state_->last_iteration_for(item_id);
    const std::uint32_t retry_count = last.has_value() ? last->retry_count : 1;

    if (get_value(failed) == protocol::IterationStatus::Blocked) {
        reporter_.item_blocked(item_id, retry_count);
        return PassOutcome::Blocked;
    }

    const auto delay = backoff_delay(retry_count, options_.config.retry);
    reporter_.retry_scheduled(item_id, delay, retry_count + 1);
    if (!options_.simulate_only) {
        sleeper_(delay);
    }
    return PassOutcome::Retrying;
}

protocol::RunSummary Orchestrator::summarize(const std::uint32_t iterations_used) const {
    protocol::RunSummary summary;
    summary.success = selector_->all_complete();
    summary.total_items = selector_->total_count();
    summary.completed_items = selector_->completed_count();
    for (const auto& item : selector_->blocked_items()) {
        summary.blocked_items.push_back(item.id);
    }
    summary.iterations_used = iterations_used;
    summary.reached_max_iterations = !state_->can_start_new_iteration();

    if (summary.success) {
        summary.stop_reason = protocol::StopReason::AllComplete;
    } else if (selector_->all_complete_or_blocked()) {
        summary.stop_reason = protocol::StopReason::Stalled;
    } else if (summary.reached_max_iterations) {
        summary.stop_reason = protocol::StopReason::IterationBudgetExhausted;
    } else {
        summary.stop_reason = protocol::StopReason::NoEligibleItem;
    }
    return summary;
}

}  // namespace storyloop::runtime
