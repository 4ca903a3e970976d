#include "runtime/backlog_selector.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace storyloop::runtime {

using protocol::WorkItem;

BacklogSelector::BacklogSelector(const protocol::Backlog& backlog,
                                 const std::vector<std::string>& blocked_items,
                                 std::optional<std::string> target_item)
    : backlog_(backlog),
      blocked_(blocked_items.begin(), blocked_items.end()),
      target_item_(std::move(target_item)) {}

void BacklogSelector::update_blocked(const std::vector<std::string>& blocked_items) {
    blocked_ = std::unordered_set<std::string>(blocked_items.begin(),
                                               blocked_items.end());
}

bool BacklogSelector::is_blocked(const std::string& id) const {
    return blocked_.find(id) != blocked_.end();
}

bool BacklogSelector::is_eligible(const WorkItem& item) const {
    return !item.passes && !is_blocked(item.id);
}

std::optional<WorkItem> BacklogSelector::next_item() const {
    if (target_item_.has_value()) {
        const auto it = std::find_if(
            backlog_.items.begin(), backlog_.items.end(),
            [this](const WorkItem& item) { return item.id == *target_item_; });
        if (it != backlog_.items.end() && is_eligible(*it)) {
            return *it;
        }
        return std::nullopt;
    }

    const WorkItem* best = nullptr;
    for (const auto& item : backlog_.items) {
        if (!is_eligible(item)) {
            continue;
        }
        // Strict comparison keeps the earliest item on priority ties.
        if (best == nullptr || item.priority < best->priority) {
            best = &item;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

std::vector<WorkItem> BacklogSelector::remaining() const {
    std::vector<WorkItem> eligible;
    for (const auto& item : backlog_.items) {
        if (is_eligible(item)) {
            eligible.push_back(item);
        }
    }
    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const WorkItem& a, const WorkItem& b) {
                         return a.priority < b.priority;
                     });
    return eligible;
}

std::vector<WorkItem> BacklogSelector::completed_items() const {
    std::vector<WorkItem> completed;
    std::copy_if(backlog_.items.begin(), backlog_.items.end(),
                 std::back_inserter(completed),
                 [](const WorkItem& item) { return item.passes; });
    return completed;
}

std::vector<WorkItem> BacklogSelector::blocked_items() const {
    std::vector<WorkItem> blocked;
    std::copy_if(backlog_.items.begin(), backlog_.items.end(),
                 std::back_inserter(blocked),
                 [this](const WorkItem& item) { return is_blocked(item.id); });
    return blocked;
}

bool BacklogSelector::all_complete() const {
    return std::all_of(backlog_.items.begin(), backlog_.items.end(),
                       [](const WorkItem& item) { return item.passes; });
}

bool BacklogSelector::all_complete_or_blocked() const {
    return std::all_of(backlog_.items.begin(), backlog_.items.end(),
                       [this](const WorkItem& item) {
                           return item.passes || is_blocked(item.id);
                       });
}

std::size_t BacklogSelector::total_count() const {
    return backlog_.items.size();
}

std::size_t BacklogSelector::completed_count() const {
    return static_cast<std::size_t>(
        std::count_if(backlog_.items.begin(), backlog_.items.end(),
                      [](const WorkItem& item) { return item.passes; }));
}

std::size_t BacklogSelector::blocked_count() const {
    // Stale ids for items no longer in the backlog do not count.
    return static_cast<std::size_t>(
        std::count_if(backlog_.items.begin(), backlog_.items.end(),
                      [this](const WorkItem& item) { return is_blocked(item.id); }));
}

}  // namespace storyloop::runtime
