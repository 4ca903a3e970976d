#include "session/iteration_journal.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/time/timestamps.hpp"

namespace storyloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

namespace {

json make_event(const std::string& run_id, const std::string& name,
                json payload) {
    json event;
    event["ts_unix_ms"] = core::time::now_unix_ms();
    event["event"] = name;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

json report_to_json(const protocol::VerificationReport& report) {
    json payload;
    payload["success"] = report.success;
    payload["total_duration_ms"] = report.total_duration_ms;
    payload["checks"] = json::array();
    for (const auto& check : report.results) {
        json entry;
        entry["name"] = check.name;
        entry["command"] = check.command;
        entry["success"] = check.success;
        entry["optional"] = check.optional;
        entry["duration_ms"] = check.duration_ms;
        payload["checks"].push_back(entry);
    }
    return payload;
}

}  // namespace

IterationJournal::IterationJournal(std::filesystem::path workspace_root,
                                   std::filesystem::path journal_subdir)
    : workspace_root_(std::move(workspace_root)),
      journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> IterationJournal::journal_path() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return LoopError{ErrorCategory::Input,
                         "Workspace root is not a directory: " +
                             workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto journal_dir = workspace_root_ / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to create journal directory: " +
                             journal_dir.string(),
                         "journal_dir_create_failed"};
    }
    return journal_dir / "journal.jsonl";
}

core::errors::Result<std::filesystem::path> IterationJournal::append_event(
    const std::string& event_json) const {
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to open journal: " + path.string(),
                         "journal_open_failed"};
    }
    out << event_json << "\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to write journal event: " + path.string(),
                         "journal_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> IterationJournal::write_iteration_started(
    const std::string& run_id, const std::uint32_t iteration_number,
    const protocol::WorkItem& item, const std::string& start_revision) const {
    json payload;
    payload["iteration"] = iteration_number;
    payload["item_id"] = item.id;
    payload["title"] = item.title;
    payload["start_revision"] = start_revision;
    return append_event(make_event(run_id, "iteration_started", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_output(
    const std::string& run_id, const std::string& item_id,
    const protocol::ParsedOutput& parsed) const {
    json payload;
    payload["item_id"] = item_id;
    payload["structured"] = parsed.structured.has_value();
    if (parsed.structured.has_value()) {
        const auto& result = parsed.structured.value();
        payload["status"] = protocol::to_string(result.status);
        payload["next_action"] = protocol::to_string(result.next_action);
        payload["reported_item_id"] = result.item_id;
        payload["files_changed"] = result.files_changed;
        payload["learnings"] = result.learnings;
        payload["error"] = result.error.has_value() ? result.error.value() : "";
    }
    return append_event(make_event(run_id, "iteration_output", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_verification(
    const std::string& run_id, const std::string& item_id,
    const protocol::VerificationReport& report) const {
    json payload = report_to_json(report);
    payload["item_id"] = item_id;
    return append_event(make_event(run_id, "verification", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_failure(
    const std::string& run_id, const std::string& item_id,
    const std::string& message) const {
    json payload;
    payload["item_id"] = item_id;
    payload["error"] = message;
    return append_event(make_event(run_id, "iteration_failed", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_retry_scheduled(
    const std::string& run_id, const std::string& item_id,
    const std::chrono::milliseconds delay, const std::uint32_t next_attempt) const {
    json payload;
    payload["item_id"] = item_id;
    payload["delay_ms"] = delay.count();
    payload["next_attempt"] = next_attempt;
    return append_event(make_event(run_id, "retry_scheduled", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_blocked(
    const std::string& run_id, const std::string& item_id,
    const std::uint32_t retry_count) const {
    json payload;
    payload["item_id"] = item_id;
    payload["retry_count"] = retry_count;
    return append_event(make_event(run_id, "item_blocked", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_completed(
    const std::string& run_id, const std::string& item_id) const {
    json payload;
    payload["item_id"] = item_id;
    return append_event(make_event(run_id, "item_completed", payload).dump());
}

core::errors::Result<std::filesystem::path> IterationJournal::write_run_finished(
    const std::string& run_id, const protocol::RunSummary& summary) const {
    json payload;
    payload["success"] = summary.success;
    payload["total_items"] = summary.total_items;
    payload["completed_items"] = summary.completed_items;
    payload["blocked_items"] = summary.blocked_items;
    payload["iterations_used"] = summary.iterations_used;
    payload["reached_max_iterations"] = summary.reached_max_iterations;
    payload["stop_reason"] = protocol::to_string(summary.stop_reason);
    return append_event(make_event(run_id, "run_finished", payload).dump());
}

}  // namespace storyloop::session
