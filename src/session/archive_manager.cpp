#include "session/archive_manager.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"

namespace storyloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

constexpr const char* kBranchPrefix = "storyloop/";

std::filesystem::path resolve(const std::filesystem::path& root,
                              const std::filesystem::path& path) {
    return path.is_absolute() ? path : root / path;
}

std::string archive_folder_name(const std::string& branch_name) {
    std::string name = branch_name;
    if (name.rfind(kBranchPrefix, 0) == 0) {
        name = name.substr(std::char_traits<char>::length(kBranchPrefix));
    }
    for (char& c : name) {
        if (c == '/') {
            c = '-';
        }
    }
    return core::time::to_date(core::time::Clock::now()) + "-" + name;
}

std::optional<LoopError> copy_if_present(const std::filesystem::path& from,
                                         const std::filesystem::path& to,
                                         bool& copied) {
    std::error_code ec;
    if (!std::filesystem::exists(from, ec) || ec) {
        return std::nullopt;
    }
    std::filesystem::copy_file(from, to,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to archive " + from.string() + ": " + ec.message(),
                         "archive_copy_failed"};
    }
    copied = true;
    return std::nullopt;
}

}  // namespace

ArchiveManager::ArchiveManager(std::filesystem::path workspace_root,
                               std::filesystem::path backlog_path,
                               std::filesystem::path progress_path)
    : workspace_root_(std::move(workspace_root)),
      backlog_path_(resolve(workspace_root_, backlog_path)),
      progress_path_(resolve(workspace_root_, progress_path)),
      last_branch_path_(workspace_root_ / ".storyloop" / "last-branch"),
      archive_dir_(workspace_root_ / "archive") {}

std::optional<std::string> ArchiveManager::last_branch() const {
    std::ifstream in(last_branch_path_);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string branch;
    std::getline(in, branch);
    if (branch.empty()) {
        return std::nullopt;
    }
    return branch;
}

core::errors::Result<std::filesystem::path> ArchiveManager::save_last_branch(
    const std::string& branch_name) const {
    std::error_code ec;
    std::filesystem::create_directories(last_branch_path_.parent_path(), ec);
    if (ec) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to create " + last_branch_path_.parent_path().string(),
                         "archive_dir_create_failed"};
    }
    std::ofstream out(last_branch_path_, std::ios::trunc);
    out << branch_name;
    if (!out.good()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to write " + last_branch_path_.string(),
                         "last_branch_write_failed"};
    }
    return last_branch_path_;
}

core::errors::Result<std::optional<std::filesystem::path>> ArchiveManager::archive(
    const std::string& branch_name) const {
    std::error_code ec;
    const bool has_backlog = std::filesystem::exists(backlog_path_, ec);
    const bool has_progress = std::filesystem::exists(progress_path_, ec);
    if (!has_backlog && !has_progress) {
        LOG_DEBUG("ArchiveManager: nothing to archive");
        return std::optional<std::filesystem::path>{};
    }

    const auto target = archive_dir_ / archive_folder_name(branch_name);
    std::filesystem::create_directories(target, ec);
    if (ec) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to create archive directory: " + target.string(),
                         "archive_dir_create_failed"};
    }

    bool copied = false;
    if (auto err = copy_if_present(backlog_path_, target / backlog_path_.filename(),
                                   copied)) {
        return *err;
    }
    if (auto err = copy_if_present(progress_path_, target / progress_path_.filename(),
                                   copied)) {
        return *err;
    }

    LOG_INFO("Archived previous run to: " + target.string());
    return std::optional<std::filesystem::path>(target);
}

core::errors::Result<std::filesystem::path> ArchiveManager::reset_progress_file() const {
    std::error_code ec;
    if (progress_path_.has_parent_path()) {
        std::filesystem::create_directories(progress_path_.parent_path(), ec);
    }
    std::ofstream out(progress_path_, std::ios::trunc);
    out << "# storyloop progress log\n"
        << "Started: " << core::time::now_iso8601() << "\n"
        << "---\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to write progress file: " + progress_path_.string(),
                         "progress_write_failed"};
    }
    return progress_path_;
}

core::errors::Result<std::filesystem::path>
ArchiveManager::initialize_progress_file() const {
    std::error_code ec;
    if (std::filesystem::exists(progress_path_, ec) && !ec) {
        return progress_path_;
    }
    return reset_progress_file();
}

core::errors::Result<std::optional<std::filesystem::path>>
ArchiveManager::archive_if_branch_changed(const std::string& current_branch) const {
    std::optional<std::filesystem::path> archived;
    const auto previous = last_branch();
    if (previous.has_value() && previous.value() != current_branch) {
        auto archive_result = archive(previous.value());
        if (core::errors::is_error(archive_result)) {
            return core::errors::get_error(archive_result);
        }
        archived = core::errors::get_value(archive_result);

        auto reset = reset_progress_file();
        if (core::errors::is_error(reset)) {
            return core::errors::get_error(reset);
        }
    }

    auto saved = save_last_branch(current_branch);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return archived;
}

}  // namespace storyloop::session
