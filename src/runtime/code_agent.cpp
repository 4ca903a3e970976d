#include "runtime/code_agent.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/structured_output.hpp"

namespace storyloop::runtime {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;

std::string describe_work_item(const protocol::AgentRequest& request) {
    const auto& item = request.item;
    std::ostringstream out;
    out << "\n\n## Current work item\n\n"
        << "Iteration " << request.iteration_number << " of "
        << request.max_iterations << ".\n\n"
        << "- id: " << item.id << "\n"
        << "- title: " << item.title << "\n"
        << "- priority: " << item.priority << "\n";
    if (!item.description.empty()) {
        out << "\n" << item.description << "\n";
    }
    if (!item.acceptance_criteria.empty()) {
        out << "\nAcceptance criteria:\n";
        for (const auto& criterion : item.acceptance_criteria) {
            out << "- " << criterion << "\n";
        }
    }
    if (!item.notes.empty()) {
        out << "\nNotes: " << item.notes << "\n";
    }
    out << "\nEnd your reply with a ```" << protocol::kStructuredOutputMarker
        << " block.\n";
    return out.str();
}

CommandAgent::CommandAgent(const tools::CommandExecutor& executor,
                           std::string agent_command,
                           std::filesystem::path prompt_path,
                           const std::uint32_t timeout_ms)
    : executor_(executor),
      agent_command_(std::move(agent_command)),
      prompt_path_(std::move(prompt_path)),
      timeout_ms_(timeout_ms) {}

Result<std::string> CommandAgent::read_prompt(
    const std::filesystem::path& working_directory) const {
    const std::filesystem::path path =
        prompt_path_.is_absolute() ? prompt_path_ : working_directory / prompt_path_;
    std::ifstream in(path);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Agent,
                         "Failed to read prompt file: " + path.string(),
                         "prompt_not_found",
                         "Create the prompt file or set promptPath in the config."};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

Result<protocol::AgentOutput> CommandAgent::run(const protocol::AgentRequest& request) {
    auto prompt = read_prompt(request.working_directory);
    if (is_error(prompt)) {
        return get_error(prompt);
    }

    tools::ProcessRequest process;
    process.command = agent_command_;
    process.working_directory = request.working_directory;
    process.stdin_text = get_value(prompt) + describe_work_item(request);
    process.timeout_ms = timeout_ms_;

    LOG_DEBUG("Starting external process: " + agent_command_);
    auto capture_result = executor_.run(process);
    if (is_error(capture_result)) {
        const auto& err = get_error(capture_result);
        return LoopError{ErrorCategory::Agent,
                         "Failed to run external process: " + err.message,
                         "agent_spawn_failed"};
    }
    const auto& capture = get_value(capture_result);

    protocol::AgentOutput output;
    output.output = capture.stdout_text + capture.stderr_text;
    output.exit_code = capture.exit_code;
    output.success = capture.succeeded();
    output.duration_ms = capture.duration_ms;
    if (capture.timed_out) {
        LOG_WARN("External process timed out after " + std::to_string(timeout_ms_) +
                 "ms");
    }
    return output;
}

Result<protocol::AgentOutput> SimulatedAgent::run(const protocol::AgentRequest& request) {
    LOG_INFO("[DRY RUN] Would run the external process for " + request.item.id);

    const nlohmann::json block = {
        {"status", "success"},
        {"itemId", request.item.id},
        {"filesChanged", nlohmann::json::array()},
        {"learnings", nlohmann::json::array({"This was a dry run"})},
        {"error", nullptr},
        {"nextAction", "continue"}};

    std::ostringstream text;
    text << "[DRY RUN] Simulated execution, no changes made.\n\n"
         << "```" << protocol::kStructuredOutputMarker << "\n"
         << block.dump(2) << "\n"
         << "```\n";

    protocol::AgentOutput output;
    output.output = text.str();
    output.exit_code = 0;
    output.success = true;
    return output;
}

}  // namespace storyloop::runtime
