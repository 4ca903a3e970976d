#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace storyloop::protocol {

enum class IterationStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
    Blocked,
    RolledBack
};

struct Iteration {
    std::string item_id;
    IterationStatus status = IterationStatus::Pending;
    std::string start_revision;
    std::optional<std::string> end_revision;
    std::uint32_t retry_count = 0;
    std::optional<std::string> started_at;
    std::optional<std::string> completed_at;
    std::optional<std::string> error;
};

// Durable record of one run against one branch.
struct RunStateRecord {
    static constexpr int kVersion = 1;

    int version = kVersion;
    std::string branch_name;
    std::uint32_t current_iteration = 0;
    std::uint32_t max_iterations = 0;
    std::vector<Iteration> iterations;
    std::vector<std::string> blocked_items;
    std::string started_at;
    std::string last_updated_at;
};

inline std::string to_string(const IterationStatus status) {
    switch (status) {
        case IterationStatus::Pending:
            return "pending";
        case IterationStatus::InProgress:
            return "in_progress";
        case IterationStatus::Completed:
            return "completed";
        case IterationStatus::Failed:
            return "failed";
        case IterationStatus::Blocked:
            return "blocked";
        case IterationStatus::RolledBack:
            return "rolled_back";
        default:
            return "unknown";
    }
}

inline std::optional<IterationStatus> iteration_status_from_string(
    const std::string& text) {
    if (text == "pending") return IterationStatus::Pending;
    if (text == "in_progress") return IterationStatus::InProgress;
    if (text == "completed") return IterationStatus::Completed;
    if (text == "failed") return IterationStatus::Failed;
    if (text == "blocked") return IterationStatus::Blocked;
    if (text == "rolled_back") return IterationStatus::RolledBack;
    return std::nullopt;
}

}  // namespace storyloop::protocol
