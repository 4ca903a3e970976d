#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "protocol/backlog.hpp"
#include "protocol/run_summary.hpp"
#include "protocol/structured_output.hpp"
#include "protocol/verification_contract.hpp"

namespace storyloop::session {

// Append-only JSONL record of what happened in each iteration, one event per line.
class IterationJournal {
public:
    explicit IterationJournal(std::filesystem::path workspace_root,
                              std::filesystem::path journal_subdir = ".storyloop");

    core::errors::Result<std::filesystem::path> write_iteration_started(
        const std::string& run_id, std::uint32_t iteration_number,
        const protocol::WorkItem& item, const std::string& start_revision) const;

    core::errors::Result<std::filesystem::path> write_output(
        const std::string& run_id, const std::string& item_id,
        const protocol::ParsedOutput& parsed) const;

    core::errors::Result<std::filesystem::path> write_verification(
        const std::string& run_id, const std::string& item_id,
        const protocol::VerificationReport& report) const;

    core::errors::Result<std::filesystem::path> write_failure(
        const std::string& run_id, const std::string& item_id,
        const std::string& message) const;

    core::errors::Result<std::filesystem::path> write_retry_scheduled(
        const std::string& run_id, const std::string& item_id,
        std::chrono::milliseconds delay, std::uint32_t next_attempt) const;

    core::errors::Result<std::filesystem::path> write_blocked(
        const std::string& run_id, const std::string& item_id,
        std::uint32_t retry_count) const;

    core::errors::Result<std::filesystem::path> write_completed(
        const std::string& run_id, const std::string& item_id) const;

    core::errors::Result<std::filesystem::path> write_run_finished(
        const std::string& run_id, const protocol::RunSummary& summary) const;

    core::errors::Result<std::filesystem::path> journal_path() const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path journal_subdir_;
};

}  // namespace storyloop::session
