#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/iteration.hpp"
#include "session/state_persistence.hpp"

namespace storyloop::session {

// Owns the durable run record. Every mutating call writes the whole record
// through to the persistence boundary before returning.
class RunStateStore {
public:
    // Resumes the persisted record when it belongs to `branch_name`, otherwise
    // starts fresh. The persisted ceiling is replaced by `max_iterations`.
    // A persisted record that cannot be parsed is an error, not a fresh start.
    static core::errors::Result<RunStateStore> open(StatePersistence& persistence,
                                                    const std::string& branch_name,
                                                    std::uint32_t max_iterations);

    // Loads the persisted record as is, for commands that inspect or repair a
    // run. nullopt when nothing has been persisted yet.
    static core::errors::Result<std::optional<RunStateStore>> open_existing(
        StatePersistence& persistence);

    // Discards whatever is persisted and writes a fresh record.
    static core::errors::Result<RunStateStore> create_fresh(
        StatePersistence& persistence, const std::string& branch_name,
        std::uint32_t max_iterations);

    // Supersedes any earlier non-rolled-back iteration of `item_id`, inheriting
    // its retry count, and appends a new in_progress iteration.
    core::errors::Result<protocol::Iteration> start_iteration(
        const std::string& item_id, const std::string& start_revision);

    core::errors::Result<protocol::Iteration> complete_iteration(
        const std::string& item_id, const std::string& end_revision);

    // Returns Blocked once the retry count reaches `max_retries`, else Failed.
    core::errors::Result<protocol::IterationStatus> fail_iteration(
        const std::string& item_id, const std::string& error_message,
        std::uint32_t max_retries);

    // Marks the most recent in_progress, failed or blocked iteration of
    // `item_id` rolled back and always unblocks the item. Returns whether an
    // iteration was marked.
    core::errors::Result<bool> mark_rolled_back(const std::string& item_id);

    // Marks the earliest iteration of `item_id` and every later iteration
    // rolled back, unblocks the item, and returns the earliest start revision.
    core::errors::Result<std::string> rollback_from(const std::string& item_id);

    // Returns whether the item was blocked.
    core::errors::Result<bool> unblock_story(const std::string& item_id);

    // Returns the number of iterations discarded.
    core::errors::Result<std::size_t> reset();

    std::optional<protocol::Iteration> last_iteration_for(
        const std::string& item_id) const;
    std::optional<std::string> first_start_revision() const;

    bool can_start_new_iteration() const;
    bool is_blocked(const std::string& item_id) const;
    std::uint32_t current_iteration() const { return record_.current_iteration; }
    std::uint32_t max_iterations() const { return record_.max_iterations; }
    const std::vector<std::string>& blocked_items() const {
        return record_.blocked_items;
    }
    const std::vector<protocol::Iteration>& iterations() const {
        return record_.iterations;
    }
    const protocol::RunStateRecord& state() const { return record_; }

private:
    RunStateStore(StatePersistence& persistence, protocol::RunStateRecord record);

    core::errors::Result<std::size_t> persist();
    protocol::Iteration* find_live(const std::string& item_id);
    void remove_blocked(const std::string& item_id);

    static protocol::RunStateRecord fresh_record(const std::string& branch_name,
                                                 std::uint32_t max_iterations);

    StatePersistence* persistence_;
    protocol::RunStateRecord record_;
};

// Serialized form of the run record; exposed for the status command and tests.
std::string encode_run_state(const protocol::RunStateRecord& record);
core::errors::Result<protocol::RunStateRecord> decode_run_state(
    const std::string& document);

}  // namespace storyloop::session
