#include "vcs/git_version_control.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace storyloop::vcs {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

}  // namespace

GitVersionControl::GitVersionControl(const tools::CommandExecutor& executor,
                                     std::filesystem::path working_directory,
                                     policy::WorkspaceGuard guard)
    : executor_(executor),
      working_directory_(std::move(working_directory)),
      guard_(std::move(guard)) {}

Result<std::string> GitVersionControl::git(const std::string& arguments) const {
    tools::ProcessRequest request;
    request.command = "git " + arguments;
    request.working_directory = working_directory_;

    auto capture_result = executor_.run(request);
    if (is_error(capture_result)) {
        return get_error(capture_result);
    }
    const auto& capture = get_value(capture_result);
    if (!capture.succeeded()) {
        const std::string detail = trim(capture.stderr_text);
        return LoopError{ErrorCategory::Execution,
                         "Git command failed: git " + arguments +
                             (detail.empty() ? "" : ": " + detail),
                         "git_command_failed"};
    }
    return trim(capture.stdout_text);
}

Result<std::string> GitVersionControl::current_revision() const {
    return git("rev-parse HEAD");
}

Result<std::string> GitVersionControl::reset_to(const std::string& revision) {
    auto checked = guard_.validate_revision(revision);
    if (is_error(checked)) {
        return get_error(checked);
    }
    LOG_DEBUG("Resetting working tree to " + revision);
    auto reset = git("reset --hard " + tools::shell_quote(revision));
    if (is_error(reset)) {
        return get_error(reset);
    }
    return revision;
}

Result<std::string> GitVersionControl::current_branch() const {
    return git("rev-parse --abbrev-ref HEAD");
}

bool GitVersionControl::branch_exists(const std::string& branch_name) const {
    if (is_error(guard_.validate_branch_name(branch_name))) {
        return false;
    }
    return !is_error(git("rev-parse --verify --quiet " + tools::shell_quote(branch_name)));
}

Result<std::string> GitVersionControl::checkout(const std::string& branch_name) {
    auto checked = guard_.validate_branch_name(branch_name);
    if (is_error(checked)) {
        return get_error(checked);
    }
    LOG_DEBUG("Checking out branch: " + branch_name);
    auto result = git("checkout " + tools::shell_quote(branch_name));
    if (is_error(result)) {
        return get_error(result);
    }
    return branch_name;
}

Result<std::string> GitVersionControl::create_branch(const std::string& branch_name,
                                                     const std::string& from_branch) {
    auto checked = guard_.validate_branch_name(branch_name);
    if (is_error(checked)) {
        return get_error(checked);
    }
    auto checked_from = guard_.validate_branch_name(from_branch);
    if (is_error(checked_from)) {
        return get_error(checked_from);
    }
    LOG_DEBUG("Creating branch: " + branch_name + " from " + from_branch);
    auto result = git("checkout -b " + tools::shell_quote(branch_name) + " " +
                      tools::shell_quote(from_branch));
    if (is_error(result)) {
        return get_error(result);
    }
    return branch_name;
}

Result<std::string> GitVersionControl::checkout_or_create(
    const std::string& branch_name, const std::string& from_branch) {
    if (branch_exists(branch_name)) {
        return checkout(branch_name);
    }
    return create_branch(branch_name, from_branch);
}

std::string GitVersionControl::main_branch() const {
    if (branch_exists("main")) {
        return "main";
    }
    if (branch_exists("master")) {
        return "master";
    }
    return "main";
}

Result<std::string> GitVersionControl::commit_all(const std::string& message) {
    auto staged = git("add -A");
    if (is_error(staged)) {
        return get_error(staged);
    }
    auto committed = git("commit -m " + tools::shell_quote(message));
    if (is_error(committed)) {
        return get_error(committed);
    }
    return current_revision();
}

Result<std::vector<std::string>> GitVersionControl::files_changed_since(
    const std::string& revision) const {
    auto checked = guard_.validate_revision(revision);
    if (is_error(checked)) {
        return get_error(checked);
    }
    auto output = git("diff --name-only " + tools::shell_quote(revision) + " HEAD");
    if (is_error(output)) {
        return get_error(output);
    }
    return split_lines(get_value(output));
}

}  // namespace storyloop::vcs
