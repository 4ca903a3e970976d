#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "policy/workspace_guard.hpp"
#include "tools/command_executor.hpp"
#include "vcs/version_control.hpp"

namespace storyloop::vcs {

// Runs git through the process capability in `working_directory`. Revisions
// and branch names pass the workspace guard before they reach the shell.
class GitVersionControl : public VersionControl {
public:
    GitVersionControl(const tools::CommandExecutor& executor,
                      std::filesystem::path working_directory,
                      policy::WorkspaceGuard guard = policy::WorkspaceGuard{});

    core::errors::Result<std::string> current_revision() const override;
    core::errors::Result<std::string> reset_to(const std::string& revision) override;

    core::errors::Result<std::string> current_branch() const override;
    bool branch_exists(const std::string& branch_name) const override;
    core::errors::Result<std::string> checkout(const std::string& branch_name) override;
    core::errors::Result<std::string> create_branch(
        const std::string& branch_name, const std::string& from_branch) override;
    core::errors::Result<std::string> checkout_or_create(
        const std::string& branch_name, const std::string& from_branch) override;
    std::string main_branch() const override;

    core::errors::Result<std::string> commit_all(const std::string& message) override;
    core::errors::Result<std::vector<std::string>> files_changed_since(
        const std::string& revision) const override;

private:
    // Returns trimmed stdout, or git_command_failed with stderr in the message.
    core::errors::Result<std::string> git(const std::string& arguments) const;

    const tools::CommandExecutor& executor_;
    std::filesystem::path working_directory_;
    policy::WorkspaceGuard guard_;
};

}  // namespace storyloop::vcs
