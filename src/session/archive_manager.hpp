#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/loop_errors.hpp"

namespace storyloop::session {

// Keeps the previous branch's backlog and progress notes when the backlog
// moves to a new branch.
class ArchiveManager {
public:
    ArchiveManager(std::filesystem::path workspace_root,
                   std::filesystem::path backlog_path,
                   std::filesystem::path progress_path);

    std::optional<std::string> last_branch() const;
    core::errors::Result<std::filesystem::path> save_last_branch(
        const std::string& branch_name) const;

    // Copies the backlog and progress file to archive/<date>-<branch>/.
    // Returns nullopt when there was nothing to copy.
    core::errors::Result<std::optional<std::filesystem::path>> archive(
        const std::string& branch_name) const;

    // Archives the previous branch and resets the progress file when the
    // branch differs from the remembered one, then remembers `current_branch`.
    core::errors::Result<std::optional<std::filesystem::path>> archive_if_branch_changed(
        const std::string& current_branch) const;

    core::errors::Result<std::filesystem::path> reset_progress_file() const;

    // Creates the progress file when it does not exist yet.
    core::errors::Result<std::filesystem::path> initialize_progress_file() const;

private:
    std::filesystem::path workspace_root_;
    std::filesystem::path backlog_path_;
    std::filesystem::path progress_path_;
    std::filesystem::path last_branch_path_;
    std::filesystem::path archive_dir_;
};

}  // namespace storyloop::session
