#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace storyloop::protocol {

    enum class CliCommand {
        Run,
        Status,
        Unblock,
        Reset,
        Rollback,
        Help
    };

    // Validated command-line input, one command per invocation
    struct CliRequest {
        CliCommand command = CliCommand::Help;
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::optional<std::filesystem::path> config_path;
        bool verbose = false;

        // run
        std::optional<std::uint32_t> max_iterations;
        bool dry_run = false;
        std::optional<std::string> target_item;

        // unblock, rollback
        std::optional<std::string> item_id;
        bool rollback_all = false;

        // reset, rollback
        bool force = false;
    };

    inline std::string to_string(const CliCommand command) {
        switch (command) {
            case CliCommand::Run:      return "run";
            case CliCommand::Status:   return "status";
            case CliCommand::Unblock:  return "unblock";
            case CliCommand::Reset:    return "reset";
            case CliCommand::Rollback: return "rollback";
            case CliCommand::Help:     return "help";
            default: return "unknown";
        }
    }

} // namespace storyloop::protocol
