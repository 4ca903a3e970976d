#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/loop_errors.hpp"

namespace storyloop::session {

// Whole-document persistence boundary for the run state.
class StatePersistence {
public:
    virtual ~StatePersistence() = default;

    // nullopt when nothing has been persisted yet.
    virtual core::errors::Result<std::optional<std::string>> read() const = 0;

    // Replaces the stored document; returns the number of bytes written.
    virtual core::errors::Result<std::size_t> write(const std::string& document) = 0;
};

// Stores the document in a single file, replaced atomically on every write.
class FileStatePersistence : public StatePersistence {
public:
    explicit FileStatePersistence(std::filesystem::path state_file);

    // <working_directory>/.storyloop/state.json
    static std::filesystem::path default_location(
        const std::filesystem::path& working_directory);

    core::errors::Result<std::optional<std::string>> read() const override;
    core::errors::Result<std::size_t> write(const std::string& document) override;

    const std::filesystem::path& path() const { return state_file_; }

private:
    std::filesystem::path state_file_;
};

}  // namespace storyloop::session
