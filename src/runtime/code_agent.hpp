#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "tools/command_executor.hpp"

namespace storyloop::runtime {

// The external code-generation process. The loop treats it as opaque: text in,
// text out. An error means the process could not be run at all.
class CodeAgent {
public:
    virtual ~CodeAgent() = default;
    virtual core::errors::Result<protocol::AgentOutput> run(
        const protocol::AgentRequest& request) = 0;
};

// Pipes the prompt file plus a "current work item" section into a shell
// command and captures everything it prints.
class CommandAgent : public CodeAgent {
public:
    CommandAgent(const tools::CommandExecutor& executor, std::string agent_command,
                 std::filesystem::path prompt_path, std::uint32_t timeout_ms = 0);

    core::errors::Result<protocol::AgentOutput> run(
        const protocol::AgentRequest& request) override;

private:
    core::errors::Result<std::string> read_prompt(
        const std::filesystem::path& working_directory) const;

    const tools::CommandExecutor& executor_;
    std::string agent_command_;
    std::filesystem::path prompt_path_;
    std::uint32_t timeout_ms_;
};

// Dry-run stand-in: does nothing and reports success for the requested item.
class SimulatedAgent : public CodeAgent {
public:
    core::errors::Result<protocol::AgentOutput> run(
        const protocol::AgentRequest& request) override;
};

// Appended to the prompt so the process knows which item it is working on.
std::string describe_work_item(const protocol::AgentRequest& request);

}  // namespace storyloop::runtime
