#include "runtime/run_reporter.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/output_interpreter.hpp"

namespace storyloop::runtime {

using core::errors::get_error;
using core::errors::is_error;

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        joined += (joined.empty() ? "" : ", ") + value;
    }
    return joined;
}

template <typename T>
void warn_on_error(const core::errors::Result<T>& result) {
    if (is_error(result)) {
        LOG_WARN("Unable to write iteration journal: " + get_error(result).message);
    }
}

}  // namespace

void LogReporter::iteration_started(const std::uint32_t iteration_number,
                                    const std::uint32_t max_iterations,
                                    const protocol::WorkItem& item,
                                    const std::string& start_revision) {
    LOG_INFO("=== Iteration " + std::to_string(iteration_number) + "/" +
             std::to_string(max_iterations) + ": " + item.id + " ===");
    LOG_INFO("Item: " + item.title);
    LOG_DEBUG("Start revision: " + start_revision);
}

void LogReporter::output_interpreted(const std::string& item_id,
                                     const protocol::ParsedOutput& parsed) {
    if (!parsed.structured.has_value()) {
        LOG_WARN("No structured output from external process for " + item_id);
        return;
    }
    const auto& structured = parsed.structured.value();
    LOG_INFO("Reported status: " + protocol::to_string(structured.status) +
             ", next action: " + protocol::to_string(structured.next_action));
    const auto learnings = OutputInterpreter::learnings(parsed);
    if (!learnings.empty()) {
        LOG_INFO("Learnings: " + join(learnings));
    }
    const auto files = OutputInterpreter::files_changed(parsed);
    if (!files.empty()) {
        LOG_DEBUG("Files changed: " + join(files));
    }
}

void LogReporter::verification_finished(const std::string& item_id,
                                        const protocol::VerificationReport& report) {
    if (report.success) {
        LOG_INFO("Verification passed for " + item_id);
    } else {
        LOG_WARN("Verification failed for " + item_id);
    }
}

void LogReporter::iteration_failed(const std::string& item_id,
                                   const std::string& message) {
    LOG_ERROR("Iteration failed for " + item_id + ": " + message);
}

void LogReporter::retry_scheduled(const std::string& item_id,
                                  const std::chrono::milliseconds delay,
                                  const std::uint32_t next_attempt) {
    LOG_INFO("Will retry " + item_id + " in " + std::to_string(delay.count()) +
             "ms (attempt " + std::to_string(next_attempt) + ")");
}

void LogReporter::item_blocked(const std::string& item_id,
                               const std::uint32_t retry_count) {
    LOG_ERROR("Item " + item_id + " is now blocked after " +
              std::to_string(retry_count) + " failed attempt(s)");
}

void LogReporter::item_completed(const std::string& item_id) {
    LOG_SUCCESS("Item " + item_id + " completed");
}

void LogReporter::run_finished(const protocol::RunSummary& summary) {
    LOG_INFO("Run finished: " + std::to_string(summary.completed_items) + "/" +
             std::to_string(summary.total_items) + " items complete after " +
             std::to_string(summary.iterations_used) + " iteration(s)");
    if (!summary.blocked_items.empty()) {
        LOG_WARN("Blocked items: " + join(summary.blocked_items));
    }
    if (summary.stop_reason == protocol::StopReason::IterationBudgetExhausted) {
        LOG_WARN("Stopped because the iteration budget is exhausted");
    }
    if (summary.success) {
        LOG_SUCCESS("All items complete");
    }
}

JournalReporter::JournalReporter(std::string run_id,
                                 const session::IterationJournal& journal)
    : run_id_(std::move(run_id)), journal_(journal) {}

void JournalReporter::iteration_started(const std::uint32_t iteration_number,
                                        const std::uint32_t,
                                        const protocol::WorkItem& item,
                                        const std::string& start_revision) {
    warn_on_error(
        journal_.write_iteration_started(run_id_, iteration_number, item, start_revision));
}

void JournalReporter::output_interpreted(const std::string& item_id,
                                         const protocol::ParsedOutput& parsed) {
    warn_on_error(journal_.write_output(run_id_, item_id, parsed));
}

void JournalReporter::verification_finished(const std::string& item_id,
                                            const protocol::VerificationReport& report) {
    warn_on_error(journal_.write_verification(run_id_, item_id, report));
}

void JournalReporter::iteration_failed(const std::string& item_id,
                                       const std::string& message) {
    warn_on_error(journal_.write_failure(run_id_, item_id, message));
}

void JournalReporter::retry_scheduled(const std::string& item_id,
                                      const std::chrono::milliseconds delay,
                                      const std::uint32_t next_attempt) {
    warn_on_error(journal_.write_retry_scheduled(run_id_, item_id, delay, next_attempt));
}

void JournalReporter::item_blocked(const std::string& item_id,
                                   const std::uint32_t retry_count) {
    warn_on_error(journal_.write_blocked(run_id_, item_id, retry_count));
}

void JournalReporter::item_completed(const std::string& item_id) {
    warn_on_error(journal_.write_completed(run_id_, item_id));
}

void JournalReporter::run_finished(const protocol::RunSummary& summary) {
    warn_on_error(journal_.write_run_finished(run_id_, summary));
}

FanoutReporter::FanoutReporter(std::vector<RunReporter*> reporters)
    : reporters_(std::move(reporters)) {}

void FanoutReporter::iteration_started(const std::uint32_t iteration_number,
                                       const std::uint32_t max_iterations,
                                       const protocol::WorkItem& item,
                                       const std::string& start_revision) {
    for (auto* reporter : reporters_) {
        reporter->iteration_started(iteration_number, max_iterations, item, start_revision);
    }
}

void FanoutReporter::output_interpreted(const std::string& item_id,
                                        const protocol::ParsedOutput& parsed) {
    for (auto* reporter : reporters_) {
        reporter->output_interpreted(item_id, parsed);
    }
}

void FanoutReporter::verification_finished(const std::string& item_id,
                                           const protocol::VerificationReport& report) {
    for (auto* reporter : reporters_) {
        reporter->verification_finished(item_id, report);
    }
}

void FanoutReporter::iteration_failed(const std::string& item_id,
                                      const std::string& message) {
    for (auto* reporter : reporters_) {
        reporter->iteration_failed(item_id, message);
    }
}

void FanoutReporter::retry_scheduled(const std::string& item_id,
                                     const std::chrono::milliseconds delay,
                                     const std::uint32_t next_attempt) {
    for (auto* reporter : reporters_) {
        reporter->retry_scheduled(item_id, delay, next_attempt);
    }
}

void FanoutReporter::item_blocked(const std::string& item_id,
                                  const std::uint32_t retry_count) {
    for (auto* reporter : reporters_) {
        reporter->item_blocked(item_id, retry_count);
    }
}

void FanoutReporter::item_completed(const std::string& item_id) {
    for (auto* reporter : reporters_) {
        reporter->item_completed(item_id);
    }
}

void FanoutReporter::run_finished(const protocol::RunSummary& summary) {
    for (auto* reporter : reporters_) {
        reporter->run_finished(summary);
    }
}

}  // namespace storyloop::runtime
