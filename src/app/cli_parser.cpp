#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace storyloop::app::cli {

    using namespace storyloop::core::errors;
    using storyloop::protocol::CliCommand;
    using storyloop::protocol::CliRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> cwd;
        std::optional<std::string> config;
        std::optional<std::string> max_iterations;
        std::optional<std::string> story;
        std::vector<std::string> positionals;
        bool dry_run = false;
        bool all = false;
        bool force = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage:\n"
               "  storyloop run [--max-iterations N] [--dry-run] [--story ID]\n"
               "  storyloop status\n"
               "  storyloop unblock <item-id>\n"
               "  storyloop reset [--force]\n"
               "  storyloop rollback (<item-id> | --all) [--force]\n"
               "Common options: [--config PATH] [--cwd DIR] [--verbose]";
    }

    namespace {

        Result<CliCommand> parse_command(const std::string& command) {
            if (command == "run") return CliCommand::Run;
            if (command == "status") return CliCommand::Status;
            if (command == "unblock") return CliCommand::Unblock;
            if (command == "reset") return CliCommand::Reset;
            if (command == "rollback") return CliCommand::Rollback;
            if (command == "help" || command == "--help" || command == "-h") return CliCommand::Help;
            return LoopError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Commands: run, status, unblock, reset, rollback."};
        }

        LoopError not_supported(const std::string& flag, CliCommand command) {
            return LoopError{ErrorCategory::Input, flag + " is not supported by '" + storyloop::protocol::to_string(command) + "'", "unsupported_flag"};
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return LoopError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        auto command = parse_command(argv[1]);
        if (is_error(command)) {
            return get_error(command);
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--max-iterations") {
                if (i + 1 < args.size()) raw.max_iterations = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --max-iterations", "missing_value"};
            } else if (args[i] == "--story") {
                if (i + 1 < args.size()) raw.story = args[++i];
                else return LoopError{ErrorCategory::Input, "Missing value for --story", "missing_value"};
            } else if (args[i] == "--dry-run") {
                raw.dry_run = true;
            } else if (args[i] == "--all") {
                raw.all = true;
            } else if (args[i] == "--force") {
                raw.force = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (!args[i].empty() && args[i][0] == '-') {
                return LoopError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else {
                raw.positionals.push_back(args[i]);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliRequest req;
        req.command = get_value(command);
        req.verbose = raw.verbose;

        const bool is_run = req.command == CliCommand::Run;
        const bool takes_item = req.command == CliCommand::Unblock || req.command == CliCommand::Rollback;
        const bool takes_force = req.command == CliCommand::Reset || req.command == CliCommand::Rollback;

        if (!is_run && raw.max_iterations) return not_supported("--max-iterations", req.command);
        if (!is_run && raw.story) return not_supported("--story", req.command);
        if (!is_run && raw.dry_run) return not_supported("--dry-run", req.command);
        if (!takes_force && raw.force) return not_supported("--force", req.command);
        if (req.command != CliCommand::Rollback && raw.all) return not_supported("--all", req.command);

        if (!takes_item && !raw.positionals.empty()) {
            return LoopError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals.front(), "unknown_argument"};
        }
        if (takes_item && raw.positionals.size() > 1) {
            return LoopError{ErrorCategory::Input, "Expected a single work item id", "unknown_argument"};
        }

        if (req.command == CliCommand::Unblock && raw.positionals.empty()) {
            return LoopError{ErrorCategory::Input, "unblock requires a work item id", "missing_required_argument", "Usage: storyloop unblock <item-id>"};
        }
        if (req.command == CliCommand::Rollback) {
            // Mutual Exclusion XOR check
            if (raw.positionals.empty() && !raw.all) {
                return LoopError{ErrorCategory::Input, "rollback requires a work item id or --all", "missing_required_argument"};
            }
            if (!raw.positionals.empty() && raw.all) {
                return LoopError{ErrorCategory::Input, "Cannot provide both a work item id and --all", "conflicting_flags"};
            }
            req.rollback_all = raw.all;
        }
        if (takes_item && !raw.positionals.empty()) req.item_id = raw.positionals.front();

        req.force = raw.force;
        req.dry_run = raw.dry_run;
        if (raw.story) {
            if (raw.story->empty()) {
                return LoopError{ErrorCategory::Input, "--story cannot be empty", "missing_value"};
            }
            req.target_item = raw.story.value();
        }
        if (raw.config) req.config_path = std::filesystem::path(raw.config.value());

        // Exception-free integer parsing
        if (raw.max_iterations) {
            uint32_t iterations = 0;
            const char* begin = raw.max_iterations->data();
            const char* end = raw.max_iterations->data() + raw.max_iterations->size();
            auto [ptr, ec] = std::from_chars(begin, end, iterations);
            if (ec != std::errc() || ptr != end) {
                return LoopError{ErrorCategory::Input, "Invalid number for --max-iterations", "invalid_integer", "Provide a positive integer."};
            }
            if (iterations == 0 || iterations > 1000) {
                return LoopError{ErrorCategory::Input, "--max-iterations out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            req.max_iterations = iterations;
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return LoopError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return LoopError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return LoopError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return req;
    }

} // namespace storyloop::app::cli
