#include "session/state_persistence.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace storyloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;

FileStatePersistence::FileStatePersistence(std::filesystem::path state_file)
    : state_file_(std::move(state_file)) {}

std::filesystem::path FileStatePersistence::default_location(
    const std::filesystem::path& working_directory) {
    return working_directory / ".storyloop" / "state.json";
}

core::errors::Result<std::optional<std::string>> FileStatePersistence::read() const {
    std::error_code ec;
    if (!std::filesystem::exists(state_file_, ec) || ec) {
        return std::optional<std::string>{};
    }

    std::ifstream in(state_file_);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to open state file: " + state_file_.string(),
                         "state_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return LoopError{ErrorCategory::Persistence,
                         "I/O error while reading state file: " + state_file_.string(),
                         "state_read_failed"};
    }
    return std::optional<std::string>(buffer.str());
}

core::errors::Result<std::size_t> FileStatePersistence::write(
    const std::string& document) {
    std::error_code ec;
    const auto parent = state_file_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return LoopError{ErrorCategory::Persistence,
                             "Unable to create state directory: " + parent.string(),
                             "state_dir_create_failed"};
        }
    }

    auto staging = state_file_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            return LoopError{ErrorCategory::Persistence,
                             "Unable to open state file: " + staging.string(),
                             "state_open_failed"};
        }
        out << document;
        out.flush();
        if (!out.good()) {
            return LoopError{ErrorCategory::Persistence,
                             "Unable to write state file: " + staging.string(),
                             "state_write_failed"};
        }
    }

    std::filesystem::rename(staging, state_file_, ec);
    if (ec) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to replace state file: " + state_file_.string(),
                         "state_write_failed"};
    }
    return document.size();
}

}  // namespace storyloop::session
