#include "core/config/loop_config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace storyloop::core::config {

using errors::ErrorCategory;
using errors::LoopError;
using errors::Result;
using nlohmann::json;

namespace {

LoopError invalid_config(const std::string& source_name,
                         const std::string& detail) {
    return LoopError{ErrorCategory::Input,
                     "Invalid config in " + source_name + ": " + detail,
                     "invalid_config",
                     "Fix the value or remove the key to use its default."};
}

constexpr std::uint64_t kMaxIntegerValue = std::numeric_limits<std::uint32_t>::max();

// Reads an optional integer field in [0, 2^32 - 1]; leaves `out` untouched when absent.
std::optional<LoopError> read_uint(const json& object, const char* key,
                                   const std::string& source_name,
                                   std::uint64_t& out) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    if (it->is_number_unsigned()) {
        value = it->get<std::uint64_t>();
    } else if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        value = static_cast<std::uint64_t>(it->get<std::int64_t>());
    } else {
        return invalid_config(source_name,
                              std::string(key) + " must be a non-negative integer");
    }
    if (value > kMaxIntegerValue) {
        return invalid_config(source_name,
                              std::string(key) + " must not exceed " +
                                  std::to_string(kMaxIntegerValue));
    }
    out = value;
    return std::nullopt;
}

std::optional<LoopError> read_string(const json& object, const char* key,
                                     const std::string& source_name,
                                     std::string& out) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        return invalid_config(source_name,
                              std::string(key) + " must be a non-empty string");
    }
    out = it->get<std::string>();
    return std::nullopt;
}

std::optional<LoopError> read_path(const json& object, const char* key,
                                   const std::string& source_name,
                                   std::filesystem::path& out) {
    std::string value;
    if (auto err = read_string(object, key, source_name, value)) {
        return err;
    }
    if (!value.empty()) {
        out = value;
    }
    return std::nullopt;
}

std::optional<LoopError> read_retry(const json& object,
                                    const std::string& source_name,
                                    RetryPolicy& retry) {
    const auto it = object.find("retry");
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        return invalid_config(source_name, "retry must be an object");
    }
    if (auto err = read_uint(*it, "initialDelayMs", source_name,
                             retry.initial_delay_ms)) {
        return err;
    }
    if (auto err =
            read_uint(*it, "maxDelayMs", source_name, retry.max_delay_ms)) {
        return err;
    }
    const auto multiplier = it->find("backoffMultiplier");
    if (multiplier != it->end()) {
        if (!multiplier->is_number()) {
            return invalid_config(source_name,
                                  "retry.backoffMultiplier must be a number");
        }
        retry.backoff_multiplier = multiplier->get<double>();
    }
    return std::nullopt;
}

std::optional<LoopError> read_check(const json& entry,
                                    const std::string& source_name,
                                    protocol::CheckCommand& check) {
    if (!entry.is_object()) {
        return invalid_config(source_name,
                              "verification.commands entries must be objects");
    }
    const auto name = entry.find("name");
    const auto command = entry.find("command");
    if (name == entry.end() || !name->is_string() || command == entry.end() ||
        !command->is_string()) {
        return invalid_config(
            source_name,
            "verification.commands entries need string name and command");
    }
    check.name = name->get<std::string>();
    check.command = command->get<std::string>();

    const auto optional = entry.find("optional");
    if (optional != entry.end()) {
        if (!optional->is_boolean()) {
            return invalid_config(source_name,
                                  "verification optional flag must be a boolean");
        }
        check.optional = optional->get<bool>();
    }

    std::uint64_t timeout_ms = check.timeout_ms;
    if (auto err = read_uint(entry, "timeoutMs", source_name, timeout_ms)) {
        return err;
    }
    check.timeout_ms = static_cast<std::uint32_t>(timeout_ms);
    return std::nullopt;
}

std::optional<LoopError> read_verification(const json& object,
                                           const std::string& source_name,
                                           LoopConfig& config) {
    const auto it = object.find("verification");
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        return invalid_config(source_name, "verification must be an object");
    }
    const auto commands = it->find("commands");
    if (commands == it->end()) {
        return std::nullopt;
    }
    if (!commands->is_array()) {
        return invalid_config(source_name,
                              "verification.commands must be an array");
    }
    for (const auto& entry : *commands) {
        protocol::CheckCommand check;
        if (auto err = read_check(entry, source_name, check)) {
            return err;
        }
        config.verification_commands.push_back(std::move(check));
    }
    return std::nullopt;
}

std::optional<LoopError> validate(const LoopConfig& config,
                                  const std::string& source_name) {
    if (config.max_iterations == 0) {
        return invalid_config(source_name, "maxIterations must be greater than zero");
    }
    if (config.max_retries_per_item == 0) {
        return invalid_config(source_name,
                              "maxRetriesPerItem must be greater than zero");
    }
    if (config.retry.backoff_multiplier < 1.0) {
        return invalid_config(source_name,
                              "retry.backoffMultiplier must be at least 1");
    }
    if (config.retry.max_delay_ms < config.retry.initial_delay_ms) {
        return invalid_config(source_name,
                              "retry.maxDelayMs must not be below retry.initialDelayMs");
    }
    for (const auto& check : config.verification_commands) {
        if (check.name.empty() || check.command.empty()) {
            return invalid_config(source_name,
                                  "verification commands need a name and a command");
        }
    }
    return std::nullopt;
}

}  // namespace

const std::vector<std::string>& config_file_names() {
    static const std::vector<std::string> names = {
        "storyloop.config.json", ".storylooprc.json", ".storylooprc"};
    return names;
}

std::optional<std::filesystem::path> find_config_file(
    const std::filesystem::path& working_directory) {
    for (const auto& name : config_file_names()) {
        const auto candidate = working_directory / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<LoopConfig> parse_config(const std::string& text,
                                const std::string& source_name) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return LoopError{ErrorCategory::Input,
                         "Invalid JSON in config file: " + source_name,
                         "invalid_config_json"};
    }
    if (!document.is_object()) {
        return invalid_config(source_name, "top level must be an object");
    }

    LoopConfig config;
    std::uint64_t max_iterations = config.max_iterations;
    std::uint64_t max_retries = config.max_retries_per_item;
    std::uint64_t agent_timeout = config.agent_timeout_ms;

    std::optional<LoopError> err;
    if ((err = read_uint(document, "maxIterations", source_name, max_iterations)) ||
        (err = read_uint(document, "maxRetriesPerItem", source_name, max_retries)) ||
        (err = read_uint(document, "iterationPauseMs", source_name,
                         config.iteration_pause_ms)) ||
        (err = read_uint(document, "agentTimeoutMs", source_name, agent_timeout)) ||
        (err = read_retry(document, source_name, config.retry)) ||
        (err = read_verification(document, source_name, config)) ||
        (err = read_path(document, "backlogPath", source_name, config.backlog_path)) ||
        (err = read_path(document, "progressPath", source_name, config.progress_path)) ||
        (err = read_path(document, "promptPath", source_name, config.prompt_path)) ||
        (err = read_string(document, "agentCommand", source_name,
                           config.agent_command))) {
        return *err;
    }

    config.max_iterations = static_cast<std::uint32_t>(max_iterations);
    config.max_retries_per_item = static_cast<std::uint32_t>(max_retries);
    config.agent_timeout_ms = static_cast<std::uint32_t>(agent_timeout);

    if (auto invalid = validate(config, source_name)) {
        return *invalid;
    }
    return config;
}

Result<LoopConfig> load_config(
    const std::filesystem::path& working_directory,
    const std::optional<std::filesystem::path>& explicit_path) {
    std::optional<std::filesystem::path> path = explicit_path;
    if (path.has_value() && path->is_relative()) {
        path = working_directory / *path;
    }
    if (!path.has_value()) {
        path = find_config_file(working_directory);
    }
    if (!path.has_value()) {
        LOG_DEBUG("No config file found, using defaults");
        return LoopConfig{};
    }

    std::ifstream in(*path);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Input,
                         "Unable to open config file: " + path->string(),
                         "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    LOG_DEBUG("Loading config from " + path->string());
    return parse_config(buffer.str(), path->string());
}

LoopConfig merge_overrides(LoopConfig config, const ConfigOverrides& overrides) {
    if (overrides.max_iterations.has_value()) {
        config.max_iterations = overrides.max_iterations.value();
    }
    return config;
}

}  // namespace storyloop::core::config
