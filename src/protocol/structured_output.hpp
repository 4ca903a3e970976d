#pragma once

#include <optional>
#include <string>
#include <vector>

namespace storyloop::protocol {

    // Reserved tag of the fenced block the external process must emit.
    inline constexpr const char* kStructuredOutputMarker = "json:storyloop-output";

    enum class OutputStatus {
        Success,
        Failure
    };

    enum class NextAction {
        Continue,
        Complete,
        Blocked
    };

    // The machine-readable result block, once validated.
    struct StructuredResult {
        OutputStatus status = OutputStatus::Failure;
        std::string item_id;
        std::vector<std::string> files_changed;
        std::vector<std::string> learnings;
        std::optional<std::string> error;
        NextAction next_action = NextAction::Continue;
    };

    struct ParsedOutput {
        std::optional<StructuredResult> structured;  // absent: no block, or block rejected
        std::string raw_output;
    };

    inline bool operator==(const StructuredResult& a, const StructuredResult& b) {
        return a.status == b.status && a.item_id == b.item_id &&
               a.files_changed == b.files_changed && a.learnings == b.learnings &&
               a.error == b.error && a.next_action == b.next_action;
    }

    inline bool operator==(const ParsedOutput& a, const ParsedOutput& b) {
        return a.structured == b.structured && a.raw_output == b.raw_output;
    }

    inline std::string to_string(const OutputStatus status) {
        switch (status) {
            case OutputStatus::Success: return "success";
            case OutputStatus::Failure: return "failure";
            default: return "unknown";
        }
    }

    inline std::string to_string(const NextAction action) {
        switch (action) {
            case NextAction::Continue: return "continue";
            case NextAction::Complete: return "complete";
            case NextAction::Blocked:  return "blocked";
            default: return "unknown";
        }
    }

} // namespace storyloop::protocol
