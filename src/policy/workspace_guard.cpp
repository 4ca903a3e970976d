#include "policy/workspace_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace storyloop::policy {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

bool is_ref_char(const unsigned char c) {
    return std::isalnum(c) != 0 || c == '/' || c == '-' || c == '_' || c == '.';
}

}  // namespace

WorkspaceGuard::WorkspaceGuard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

bool WorkspaceGuard::is_within_root(const std::filesystem::path& root,
                                    const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string WorkspaceGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::filesystem::path> WorkspaceGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return LoopError{ErrorCategory::Input,
                         "Workspace root does not exist: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return LoopError{ErrorCategory::Input,
                         "Workspace root is not a directory: " +
                             workspace_root.string(),
                         "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return LoopError{ErrorCategory::Input,
                         "Unable to resolve workspace root: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return LoopError{ErrorCategory::Input,
                         "Unable to resolve target path: " + target_path.string(),
                         "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return LoopError{ErrorCategory::Policy,
                         "Path escapes workspace root: " + canonical_candidate.string(),
                         "path_outside_workspace",
                         "Configured paths must stay inside the working directory."};
    }

    return canonical_candidate;
}

core::errors::Result<std::string> WorkspaceGuard::validate_command(
    const std::string& command) const {
    if (command.empty()) {
        return LoopError{ErrorCategory::Input, "Command cannot be empty.",
                         "empty_command"};
    }

    const std::string lowered = lowercase(command);
    for (const auto& blocked : command_policy_.blocked_substrings) {
        const std::string blocked_lowered = lowercase(blocked);
        if (lowered.find(blocked_lowered) == std::string::npos) {
            continue;
        }
        return LoopError{ErrorCategory::Policy,
                         "Command contains blocked operation: " + blocked,
                         "blocked_command"};
    }

    return command;
}

core::errors::Result<std::string> WorkspaceGuard::validate_revision(
    const std::string& revision) const {
    if (revision.empty()) {
        return LoopError{ErrorCategory::Input, "Revision cannot be empty.",
                         "invalid_revision"};
    }
    if (revision.front() == '-') {
        return LoopError{ErrorCategory::Policy,
                         "Revision looks like an option: " + revision,
                         "invalid_revision"};
    }
    const bool safe = std::all_of(revision.begin(), revision.end(),
                                  [](const unsigned char c) {
                                      return is_ref_char(c) || c == '^' || c == '~';
                                  });
    if (!safe) {
        return LoopError{ErrorCategory::Policy,
                         "Revision contains unsupported characters: " + revision,
                         "invalid_revision"};
    }
    return revision;
}

core::errors::Result<std::string> WorkspaceGuard::validate_branch_name(
    const std::string& branch_name) const {
    const auto reject = [&branch_name](const std::string& reason) {
        return LoopError{ErrorCategory::Input,
                         "Invalid branch name '" + branch_name + "': " + reason,
                         "invalid_branch_name",
                         "Use letters, digits, '/', '-', '_' and '.' only."};
    };

    if (branch_name.empty()) {
        return reject("empty");
    }
    if (branch_name.front() == '-' || branch_name.front() == '/' ||
        branch_name.back() == '/' || branch_name.back() == '.') {
        return reject("bad leading or trailing character");
    }
    if (branch_name.find("..") != std::string::npos ||
        branch_name.find("//") != std::string::npos ||
        branch_name.find("/.") != std::string::npos) {
        return reject("contains an invalid sequence");
    }
    if (branch_name.size() >= 5 &&
        branch_name.compare(branch_name.size() - 5, 5, ".lock") == 0) {
        return reject("ends with .lock");
    }
    if (!std::all_of(branch_name.begin(), branch_name.end(),
                     [](const unsigned char c) { return is_ref_char(c); })) {
        return reject("contains unsupported characters");
    }
    return branch_name;
}

}  // namespace storyloop::policy
