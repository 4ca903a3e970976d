#pragma once

#include <filesystem>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "protocol/backlog.hpp"

namespace storyloop::session {

// Reads and rewrites the backlog document. The document is rewritten whole
// every time an item's completion flag changes.
class BacklogStore {
public:
    explicit BacklogStore(std::filesystem::path backlog_path);

    // Missing file -> backlog_not_found; bad JSON or schema -> backlog_malformed.
    core::errors::Result<protocol::Backlog> load() const;
    core::errors::Result<std::filesystem::path> save(const protocol::Backlog& backlog) const;

    const std::filesystem::path& path() const { return backlog_path_; }

private:
    std::filesystem::path backlog_path_;
};

std::string encode_backlog(const protocol::Backlog& backlog);
core::errors::Result<protocol::Backlog> decode_backlog(const std::string& document);

}  // namespace storyloop::session
