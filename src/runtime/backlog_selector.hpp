#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "protocol/backlog.hpp"

namespace storyloop::runtime {

// Read-only view over a backlog plus the current blocked set and an optional
// pinned target. The backlog must outlive the selector.
class BacklogSelector {
public:
    BacklogSelector(const protocol::Backlog& backlog,
                    const std::vector<std::string>& blocked_items,
                    std::optional<std::string> target_item = std::nullopt);

    // Pinned: the target if it exists, is incomplete and unblocked, else none.
    // Unpinned: lowest priority value among eligible items, backlog order on ties.
    std::optional<protocol::WorkItem> next_item() const;
    std::vector<protocol::WorkItem> remaining() const;
    std::vector<protocol::WorkItem> completed_items() const;
    std::vector<protocol::WorkItem> blocked_items() const;

    bool all_complete() const;
    bool all_complete_or_blocked() const;

    std::size_t total_count() const;
    std::size_t completed_count() const;
    std::size_t blocked_count() const;

    void update_blocked(const std::vector<std::string>& blocked_items);

private:
    bool is_eligible(const protocol::WorkItem& item) const;
    bool is_blocked(const std::string& id) const;

    const protocol::Backlog& backlog_;
    std::unordered_set<std::string> blocked_;
    std::optional<std::string> target_item_;
};

}  // namespace storyloop::runtime
