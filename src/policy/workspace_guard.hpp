#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"

namespace storyloop::policy {

struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf /",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
};

class WorkspaceGuard {
public:
    explicit WorkspaceGuard(CommandPolicy command_policy = {});

    // Resolves `target_path` against `workspace_root` and rejects anything
    // that lands outside it.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

    // Accepts hex object names and plain ref names; nothing a shell would expand.
    core::errors::Result<std::string> validate_revision(
        const std::string& revision) const;

    // Subset of git check-ref-format rules.
    core::errors::Result<std::string> validate_branch_name(
        const std::string& branch_name) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
};

}  // namespace storyloop::policy
