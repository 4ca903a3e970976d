#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace storyloop::protocol {

    // A named check the verification pass runs after a successful iteration.
    struct CheckCommand {
        std::string name;
        std::string command;
        bool optional = false;          // a failing optional check does not fail the pass
        std::uint32_t timeout_ms = 300000;
    };

    struct CheckResult {
        std::string name;
        std::string command;
        bool success = false;
        bool optional = false;
        std::string output;             // stdout + stderr, trimmed
        double duration_ms = 0.0;
    };

    struct VerificationReport {
        bool success = true;            // false iff a non-optional check failed
        std::vector<CheckResult> results;
        double total_duration_ms = 0.0;
    };

} // namespace storyloop::protocol
