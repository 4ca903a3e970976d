#include "verification/verification_runner.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace storyloop::verification {

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

}  // namespace

VerificationRunner::VerificationRunner(const tools::CommandExecutor& executor,
                                       std::vector<protocol::CheckCommand> commands,
                                       std::filesystem::path working_directory,
                                       const bool simulate_only,
                                       policy::WorkspaceGuard guard)
    : executor_(executor),
      commands_(std::move(commands)),
      working_directory_(std::move(working_directory)),
      simulate_only_(simulate_only),
      guard_(std::move(guard)) {}

protocol::CheckResult VerificationRunner::run_check(
    const protocol::CheckCommand& check) const {
    protocol::CheckResult result;
    result.name = check.name;
    result.command = check.command;
    result.optional = check.optional;

    if (simulate_only_) {
        LOG_DEBUG("[DRY RUN] Would run: " + check.command);
        result.success = true;
        result.output = "[DRY RUN] Simulated success";
        return result;
    }

    auto screened = guard_.validate_command(check.command);
    if (is_error(screened)) {
        result.success = false;
        result.output = get_error(screened).message;
        return result;
    }

    tools::ProcessRequest request;
    request.command = check.command;
    request.working_directory = working_directory_;
    request.timeout_ms = check.timeout_ms;

    auto capture_result = executor_.run(request);
    if (is_error(capture_result)) {
        result.success = false;
        result.output = get_error(capture_result).message;
        return result;
    }

    const auto& capture = get_value(capture_result);
    result.success = capture.succeeded();
    result.output = trim(capture.stdout_text + capture.stderr_text);
    if (capture.timed_out) {
        result.output += (result.output.empty() ? "" : "\n");
        result.output += "Timed out after " + std::to_string(check.timeout_ms) + "ms";
    }
    result.duration_ms = capture.duration_ms;
    return result;
}

protocol::VerificationReport VerificationRunner::run() const {
    protocol::VerificationReport report;
    if (commands_.empty()) {
        LOG_DEBUG("No verification commands configured");
        return report;
    }

    LOG_INFO("Running verification checks...");
    const auto started = std::chrono::steady_clock::now();
    for (const auto& check : commands_) {
        auto result = run_check(check);
        if (result.success) {
            LOG_SUCCESS("  " + check.name + ": passed");
        } else if (check.optional) {
            LOG_WARN("  " + check.name + ": failed (optional)");
        } else {
            LOG_ERROR("  " + check.name + ": failed");
            report.success = false;
        }
        report.results.push_back(std::move(result));
    }
    report.total_duration_ms = std::chrono::duration<double, std::milli>(
                                   std::chrono::steady_clock::now() - started)
                                   .count();
    return report;
}

}  // namespace storyloop::verification
