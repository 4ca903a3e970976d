#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace storyloop::protocol {

enum class StopReason {
    AllComplete,
    Stalled,                   // every remaining item is blocked
    IterationBudgetExhausted,
    NoEligibleItem             // e.g. the pinned item is complete or blocked
};

struct RunSummary {
    bool success = false;      // every work item passes
    std::size_t total_items = 0;
    std::size_t completed_items = 0;
    std::vector<std::string> blocked_items;
    std::uint32_t iterations_used = 0;
    bool reached_max_iterations = false;
    StopReason stop_reason = StopReason::NoEligibleItem;
};

inline std::string to_string(const StopReason reason) {
    switch (reason) {
        case StopReason::AllComplete:
            return "all_complete";
        case StopReason::Stalled:
            return "stalled";
        case StopReason::IterationBudgetExhausted:
            return "iteration_budget_exhausted";
        case StopReason::NoEligibleItem:
            return "no_eligible_item";
        default:
            return "unknown";
    }
}

}  // namespace storyloop::protocol
