#include "session/run_state_store.hpp"

#include <algorithm>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"

namespace storyloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;
using nlohmann::json;
using protocol::Iteration;
using protocol::IterationStatus;
using protocol::RunStateRecord;

namespace {

LoopError malformed(const std::string& detail) {
    return LoopError{ErrorCategory::Persistence,
                     "Persisted run state is malformed: " + detail,
                     "state_malformed",
                     "Inspect .storyloop/state.json or run `storyloop reset --force`."};
}

LoopError no_live_iteration(const std::string& item_id) {
    return LoopError{ErrorCategory::State,
                     "No iteration in progress for work item: " + item_id,
                     "iteration_not_found"};
}

json iteration_to_json(const Iteration& iteration) {
    json payload;
    payload["itemId"] = iteration.item_id;
    payload["status"] = protocol::to_string(iteration.status);
    payload["startRevision"] = iteration.start_revision;
    payload["retryCount"] = iteration.retry_count;
    if (iteration.end_revision.has_value()) {
        payload["endRevision"] = iteration.end_revision.value();
    }
    if (iteration.started_at.has_value()) {
        payload["startedAt"] = iteration.started_at.value();
    }
    if (iteration.completed_at.has_value()) {
        payload["completedAt"] = iteration.completed_at.value();
    }
    if (iteration.error.has_value()) {
        payload["error"] = iteration.error.value();
    }
    return payload;
}

bool read_optional_string(const json& object, const char* key,
                          std::optional<std::string>& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

Result<Iteration> iteration_from_json(const json& payload) {
    if (!payload.is_object()) {
        return malformed("iteration entries must be objects");
    }
    const auto item_id = payload.find("itemId");
    const auto status = payload.find("status");
    const auto start_revision = payload.find("startRevision");
    if (item_id == payload.end() || !item_id->is_string() ||
        status == payload.end() || !status->is_string() ||
        start_revision == payload.end() || !start_revision->is_string()) {
        return malformed("iteration needs itemId, status and startRevision");
    }

    Iteration iteration;
    iteration.item_id = item_id->get<std::string>();
    iteration.start_revision = start_revision->get<std::string>();
    const auto parsed_status =
        protocol::iteration_status_from_string(status->get<std::string>());
    if (!parsed_status.has_value()) {
        return malformed("unknown iteration status '" + status->get<std::string>() +
                         "'");
    }
    iteration.status = parsed_status.value();

    const auto retry_count = payload.find("retryCount");
    if (retry_count != payload.end()) {
        if (!retry_count->is_number_unsigned()) {
            return malformed("retryCount must be a non-negative integer");
        }
        iteration.retry_count = retry_count->get<std::uint32_t>();
    }

    if (!read_optional_string(payload, "endRevision", iteration.end_revision) ||
        !read_optional_string(payload, "startedAt", iteration.started_at) ||
        !read_optional_string(payload, "completedAt", iteration.completed_at) ||
        !read_optional_string(payload, "error", iteration.error)) {
        return malformed("optional iteration fields must be strings");
    }
    return iteration;
}

}  // namespace

std::string encode_run_state(const RunStateRecord& record) {
    json payload;
    payload["version"] = record.version;
    payload["branchName"] = record.branch_name;
    payload["currentIteration"] = record.current_iteration;
    payload["maxIterations"] = record.max_iterations;
    payload["iterations"] = json::array();
    for (const auto& iteration : record.iterations) {
        payload["iterations"].push_back(iteration_to_json(iteration));
    }
    payload["blockedItems"] = record.blocked_items;
    payload["startedAt"] = record.started_at;
    payload["lastUpdatedAt"] = record.last_updated_at;
    return payload.dump(2);
}

Result<RunStateRecord> decode_run_state(const std::string& document) {
    const json payload = json::parse(document, nullptr, false);
    if (payload.is_discarded()) {
        return malformed("not valid JSON");
    }
    if (!payload.is_object()) {
        return malformed("top level must be an object");
    }

    const auto version = payload.find("version");
    if (version == payload.end() || !version->is_number_integer() ||
        version->get<int>() != RunStateRecord::kVersion) {
        return malformed("unsupported version");
    }

    const auto branch = payload.find("branchName");
    const auto current = payload.find("currentIteration");
    const auto max = payload.find("maxIterations");
    const auto iterations = payload.find("iterations");
    const auto blocked = payload.find("blockedItems");
    const auto started = payload.find("startedAt");
    const auto updated = payload.find("lastUpdatedAt");
    if (branch == payload.end() || !branch->is_string() ||
        current == payload.end() || !current->is_number_unsigned() ||
        max == payload.end() || !max->is_number_unsigned() ||
        iterations == payload.end() || !iterations->is_array() ||
        blocked == payload.end() || !blocked->is_array() ||
        started == payload.end() || !started->is_string() ||
        updated == payload.end() || !updated->is_string()) {
        return malformed("missing or mistyped top-level field");
    }

    RunStateRecord record;
    record.branch_name = branch->get<std::string>();
    record.current_iteration = current->get<std::uint32_t>();
    record.max_iterations = max->get<std::uint32_t>();
    record.started_at = started->get<std::string>();
    record.last_updated_at = updated->get<std::string>();

    for (const auto& entry : *iterations) {
        auto iteration = iteration_from_json(entry);
        if (core::errors::is_error(iteration)) {
            return core::errors::get_error(iteration);
        }
        record.iterations.push_back(core::errors::get_value(iteration));
    }
    for (const auto& entry : *blocked) {
        if (!entry.is_string()) {
            return malformed("blockedItems must contain strings");
        }
        record.blocked_items.push_back(entry.get<std::string>());
    }
    return record;
}

RunStateStore::RunStateStore(StatePersistence& persistence, RunStateRecord record)
    : persistence_(&persistence), record_(std::move(record)) {}

RunStateRecord RunStateStore::fresh_record(const std::string& branch_name,
                                           const std::uint32_t max_iterations) {
    RunStateRecord record;
    record.branch_name = branch_name;
    record.max_iterations = max_iterations;
    record.started_at = core::time::now_iso8601();
    record.last_updated_at = record.started_at;
    return record;
}

Result<RunStateStore> RunStateStore::open(StatePersistence& persistence,
                                          const std::string& branch_name,
                                          const std::uint32_t max_iterations) {
    auto stored = persistence.read();
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }

    RunStateRecord record;
    const auto& document = core::errors::get_value(stored);
    if (document.has_value()) {
        auto decoded = decode_run_state(document.value());
        if (core::errors::is_error(decoded)) {
            return core::errors::get_error(decoded);
        }
        record = core::errors::get_value(decoded);
    }

    if (!document.has_value() || record.branch_name != branch_name) {
        if (document.has_value()) {
            LOG_INFO("RunStateStore: branch changed from " + record.branch_name +
                     " to " + branch_name + ", starting a fresh run");
        }
        record = fresh_record(branch_name, max_iterations);
    } else {
        LOG_DEBUG("RunStateStore: resuming run at iteration " +
                  std::to_string(record.current_iteration));
    }
    record.max_iterations = max_iterations;

    RunStateStore store(persistence, std::move(record));
    auto persisted = store.persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    return store;
}

Result<std::optional<RunStateStore>> RunStateStore::open_existing(
    StatePersistence& persistence) {
    auto stored = persistence.read();
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }
    const auto& document = core::errors::get_value(stored);
    if (!document.has_value()) {
        return std::optional<RunStateStore>{};
    }

    auto decoded = decode_run_state(document.value());
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    return std::optional<RunStateStore>(
        RunStateStore(persistence, core::errors::get_value(decoded)));
}

Result<RunStateStore> RunStateStore::create_fresh(StatePersistence& persistence,
                                                  const std::string& branch_name,
                                                  const std::uint32_t max_iterations) {
    RunStateStore store(persistence, fresh_record(branch_name, max_iterations));
    auto persisted = store.persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    return store;
}

Result<std::size_t> RunStateStore::persist() {
    record_.last_updated_at = core::time::now_iso8601();
    return persistence_->write(encode_run_state(record_));
}

Iteration* RunStateStore::find_live(const std::string& item_id) {
    auto it = std::find_if(record_.iterations.begin(), record_.iterations.end(),
                           [&item_id](const Iteration& iteration) {
                               return iteration.item_id == item_id &&
                                      iteration.status == IterationStatus::InProgress;
                           });
    return it == record_.iterations.end() ? nullptr : &*it;
}

void RunStateStore::remove_blocked(const std::string& item_id) {
    auto& blocked = record_.blocked_items;
    blocked.erase(std::remove(blocked.begin(), blocked.end(), item_id),
                  blocked.end());
}

Result<Iteration> RunStateStore::start_iteration(const std::string& item_id,
                                                 const std::string& start_revision) {
    auto& iterations = record_.iterations;
    const auto previous = std::find_if(
        iterations.begin(), iterations.end(), [&item_id](const Iteration& iteration) {
            return iteration.item_id == item_id &&
                   iteration.status != IterationStatus::RolledBack;
        });
    const std::uint32_t retry_count =
        previous != iterations.end() ? previous->retry_count : 0;

    // A leftover in_progress record from a crashed run is superseded here too.
    iterations.erase(
        std::remove_if(iterations.begin(), iterations.end(),
                       [&item_id](const Iteration& iteration) {
                           return iteration.item_id == item_id &&
                                  iteration.status != IterationStatus::RolledBack;
                       }),
        iterations.end());

    Iteration iteration;
    iteration.item_id = item_id;
    iteration.status = IterationStatus::InProgress;
    iteration.start_revision = start_revision;
    iteration.retry_count = retry_count;
    iteration.started_at = core::time::now_iso8601();
    iterations.push_back(iteration);
    ++record_.current_iteration;

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    LOG_DEBUG("RunStateStore: item " + item_id + " transition pending -> in_progress" +
              " (retry " + std::to_string(retry_count) + ")");
    return iteration;
}

Result<Iteration> RunStateStore::complete_iteration(const std::string& item_id,
                                                    const std::string& end_revision) {
    Iteration* iteration = find_live(item_id);
    if (iteration == nullptr) {
        return no_live_iteration(item_id);
    }

    iteration->status = IterationStatus::Completed;
    iteration->end_revision = end_revision;
    iteration->completed_at = core::time::now_iso8601();
    const Iteration completed = *iteration;

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    LOG_DEBUG("RunStateStore: item " + item_id + " transition in_progress -> completed");
    return completed;
}

Result<IterationStatus> RunStateStore::fail_iteration(const std::string& item_id,
                                                      const std::string& error_message,
                                                      const std::uint32_t max_retries) {
    Iteration* iteration = find_live(item_id);
    if (iteration == nullptr) {
        return no_live_iteration(item_id);
    }

    ++iteration->retry_count;
    iteration->error = error_message;
    iteration->completed_at = core::time::now_iso8601();

    if (iteration->retry_count >= max_retries) {
        iteration->status = IterationStatus::Blocked;
        if (!is_blocked(item_id)) {
            record_.blocked_items.push_back(item_id);
        }
    } else {
        iteration->status = IterationStatus::Failed;
    }
    const IterationStatus status = iteration->status;
    const std::uint32_t retry_count = iteration->retry_count;

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    LOG_DEBUG("RunStateStore: item " + item_id + " transition in_progress -> " +
              protocol::to_string(status) + " (attempt " +
              std::to_string(retry_count) + ")");
    return status;
}

Result<bool> RunStateStore::mark_rolled_back(const std::string& item_id) {
    auto& iterations = record_.iterations;
    auto target = std::find_if(
        iterations.rbegin(), iterations.rend(), [&item_id](const Iteration& iteration) {
            return iteration.item_id == item_id &&
                   (iteration.status == IterationStatus::InProgress ||
                    iteration.status == IterationStatus::Failed ||
                    iteration.status == IterationStatus::Blocked);
        });

    const bool marked = target != iterations.rend();
    if (marked) {
        LOG_DEBUG("RunStateStore: item " + item_id + " transition " +
                  protocol::to_string(target->status) + " -> rolled_back");
        target->status = IterationStatus::RolledBack;
    }
    remove_blocked(item_id);

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    return marked;
}

Result<std::string> RunStateStore::rollback_from(const std::string& item_id) {
    auto& iterations = record_.iterations;
    const auto first = std::find_if(
        iterations.begin(), iterations.end(),
        [&item_id](const Iteration& iteration) { return iteration.item_id == item_id; });
    if (first == iterations.end()) {
        return LoopError{ErrorCategory::State,
                         "No iteration found for work item: " + item_id,
                         "iteration_not_found"};
    }

    const std::string start_revision = first->start_revision;
    for (auto it = first; it != iterations.end(); ++it) {
        it->status = IterationStatus::RolledBack;
    }
    remove_blocked(item_id);

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    return start_revision;
}

Result<bool> RunStateStore::unblock_story(const std::string& item_id) {
    const bool was_blocked = is_blocked(item_id);
    remove_blocked(item_id);

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    return was_blocked;
}

Result<std::size_t> RunStateStore::reset() {
    const std::size_t discarded = record_.iterations.size();
    record_ = fresh_record(record_.branch_name, record_.max_iterations);

    auto persisted = persist();
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    LOG_INFO("RunStateStore: reset run for branch " + record_.branch_name);
    return discarded;
}

std::optional<Iteration> RunStateStore::last_iteration_for(
    const std::string& item_id) const {
    const Iteration* latest = nullptr;
    for (const auto& iteration : record_.iterations) {
        if (iteration.item_id != item_id) {
            continue;
        }
        // ISO-8601 UTC strings order lexically; later entries win ties.
        const std::string started = iteration.started_at.value_or("");
        if (latest == nullptr || started >= latest->started_at.value_or("")) {
            latest = &iteration;
        }
    }
    if (latest == nullptr) {
        return std::nullopt;
    }
    return *latest;
}

std::optional<std::string> RunStateStore::first_start_revision() const {
    if (record_.iterations.empty()) {
        return std::nullopt;
    }
    return record_.iterations.front().start_revision;
}

bool RunStateStore::can_start_new_iteration() const {
    return record_.current_iteration < record_.max_iterations;
}

bool RunStateStore::is_blocked(const std::string& item_id) const {
    const auto& blocked = record_.blocked_items;
    return std::find(blocked.begin(), blocked.end(), item_id) != blocked.end();
}

}  // namespace storyloop::session
