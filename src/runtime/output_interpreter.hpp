#pragma once

#include <optional>
#include <string>
#include <vector>
#include "protocol/structured_output.hpp"

namespace storyloop::runtime {

// Pulls the structured result out of free-form process output. Only the first
// block tagged with protocol::kStructuredOutputMarker is considered. A missing
// block and a malformed block both yield an absent result; neither is an error.
class OutputInterpreter {
public:
    protocol::ParsedOutput interpret(const std::string& raw_text) const;

    static bool is_success(const protocol::ParsedOutput& parsed);
    static bool is_complete(const protocol::ParsedOutput& parsed);
    static bool is_blocked(const protocol::ParsedOutput& parsed);

    // Structured error; else a generic failure message when the process
    // reported failure; else a "no structured output" message when the block
    // was absent; else nothing.
    static std::optional<std::string> error_message(
        const protocol::ParsedOutput& parsed);

    static std::vector<std::string> learnings(const protocol::ParsedOutput& parsed);
    static std::vector<std::string> files_changed(const protocol::ParsedOutput& parsed);

    static constexpr const char* kFailureWithoutDetails =
        "External process reported failure without details";
    static constexpr const char* kNoStructuredOutput =
        "No structured output received from external process";
};

}  // namespace storyloop::runtime
