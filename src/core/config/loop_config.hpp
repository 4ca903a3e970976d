#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/verification_contract.hpp"

namespace storyloop::core::config {

// Exponential backoff between failed attempts of the same work item.
struct RetryPolicy {
    std::uint64_t initial_delay_ms = 2000;
    double backoff_multiplier = 2.0;
    std::uint64_t max_delay_ms = 60000;
};

// Fully validated configuration. Every field carries its default.
struct LoopConfig {
    std::uint32_t max_iterations = 10;
    std::uint32_t max_retries_per_item = 3;
    RetryPolicy retry;
    std::uint64_t iteration_pause_ms = 2000;
    std::vector<protocol::CheckCommand> verification_commands;
    std::filesystem::path backlog_path = "backlog.json";
    std::filesystem::path progress_path = "progress.txt";
    std::filesystem::path prompt_path = "PROMPT.md";
    std::string agent_command = "claude --dangerously-skip-permissions --print";
    std::uint32_t agent_timeout_ms = 0;   // 0: the loop imposes no timeout
};

// Values given on the command line take precedence over the file.
struct ConfigOverrides {
    std::optional<std::uint32_t> max_iterations;
};

// Candidate file names, searched in order inside the working directory.
const std::vector<std::string>& config_file_names();

std::optional<std::filesystem::path> find_config_file(
    const std::filesystem::path& working_directory);

// Parses and validates a config document. Unknown keys are ignored.
errors::Result<LoopConfig> parse_config(const std::string& text,
                                const std::string& source_name);

// Loads `explicit_path` when given, else the first candidate file found in
// `working_directory`, else returns the defaults.
errors::Result<LoopConfig> load_config(
    const std::filesystem::path& working_directory,
    const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

LoopConfig merge_overrides(LoopConfig config, const ConfigOverrides& overrides);

}  // namespace storyloop::core::config
