#pragma once

#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"

namespace storyloop::vcs {

// Version-control capability used by the loop and the rollback command.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    virtual core::errors::Result<std::string> current_revision() const = 0;
    virtual core::errors::Result<std::string> reset_to(const std::string& revision) = 0;

    virtual core::errors::Result<std::string> current_branch() const = 0;
    virtual bool branch_exists(const std::string& branch_name) const = 0;
    virtual core::errors::Result<std::string> checkout(const std::string& branch_name) = 0;
    virtual core::errors::Result<std::string> create_branch(
        const std::string& branch_name, const std::string& from_branch) = 0;
    virtual core::errors::Result<std::string> checkout_or_create(
        const std::string& branch_name, const std::string& from_branch) = 0;
    // "main" or "master", whichever exists; "main" when neither does.
    virtual std::string main_branch() const = 0;

    // Stages everything and commits; returns the new revision.
    virtual core::errors::Result<std::string> commit_all(const std::string& message) = 0;
    virtual core::errors::Result<std::vector<std::string>> files_changed_since(
        const std::string& revision) const = 0;
};

}  // namespace storyloop::vcs
