#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/loop_errors.hpp"

namespace storyloop::tools {

struct ProcessRequest {
    std::string command;                         // run by /bin/sh -c
    std::filesystem::path working_directory = ".";
    std::optional<std::string> stdin_text;       // closed immediately when absent
    std::uint32_t timeout_ms = 0;                // 0: wait for as long as it takes
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

// Process-execution capability shared by git, the external agent and the
// verification checks. A non-zero exit is a normal capture, not an error;
// errors mean the process could not be run at all.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;
    virtual core::errors::Result<ProcessCapture> run(const ProcessRequest& request) const = 0;
};

class ShellCommandExecutor : public CommandExecutor {
public:
    core::errors::Result<ProcessCapture> run(const ProcessRequest& request) const override;
};

// Wraps `value` in single quotes for /bin/sh.
std::string shell_quote(const std::string& value);

}  // namespace storyloop::tools
