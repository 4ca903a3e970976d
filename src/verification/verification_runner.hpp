#pragma once

#include <filesystem>
#include <vector>
#include "policy/workspace_guard.hpp"
#include "protocol/verification_contract.hpp"
#include "tools/command_executor.hpp"

namespace storyloop::verification {

// Runs the configured checks in order after an iteration reports success.
// A failing non-optional check fails the report; an empty list passes.
class VerificationRunner {
public:
    VerificationRunner(const tools::CommandExecutor& executor,
                       std::vector<protocol::CheckCommand> commands,
                       std::filesystem::path working_directory,
                       bool simulate_only = false,
                       policy::WorkspaceGuard guard = policy::WorkspaceGuard{});

    protocol::VerificationReport run() const;

    const std::vector<protocol::CheckCommand>& commands() const { return commands_; }

private:
    protocol::CheckResult run_check(const protocol::CheckCommand& check) const;

    const tools::CommandExecutor& executor_;
    std::vector<protocol::CheckCommand> commands_;
    std::filesystem::path working_directory_;
    bool simulate_only_;
    policy::WorkspaceGuard guard_;
};

}  // namespace storyloop::verification
