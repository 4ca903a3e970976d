#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "protocol/backlog.hpp"

namespace storyloop::protocol {

    // What the loop hands the external code-generation process
    struct AgentRequest {
        WorkItem item;
        std::uint32_t iteration_number = 0;    // 1-based, across the whole run
        std::uint32_t max_iterations = 0;
        std::filesystem::path working_directory;
    };

    // What comes back: opaque text plus the process' own success signal
    struct AgentOutput {
        std::string output;     // stdout followed by stderr
        int exit_code = -1;
        bool success = false;
        double duration_ms = 0.0;
    };

} // namespace storyloop::protocol
