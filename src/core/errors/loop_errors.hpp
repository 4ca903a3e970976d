#pragma once
#include <string>
#include <variant>

namespace storyloop::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,        // E.g., invalid CLI flag or config value
        Execution,    // E.g., a git or shell command failed
        Agent,        // E.g., the external code-generation process could not run
        Policy,       // E.g., a path escapes the workspace
        Persistence,  // E.g., backlog or state file missing, unreadable, malformed
        State,        // E.g., no live iteration for a work item
        Internal      // E.g., logic bug
    };

    // The standardized error payload
    struct LoopError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a LoopError.
    template <typename T>
    using Result = std::variant<T, LoopError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LoopError>(result);
    }

    template <typename T>
    const LoopError& get_error(const Result<T>& result) {
        return std::get<LoopError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:       return "input";
            case ErrorCategory::Execution:   return "execution";
            case ErrorCategory::Agent:       return "agent";
            case ErrorCategory::Policy:      return "policy";
            case ErrorCategory::Persistence: return "persistence";
            case ErrorCategory::State:       return "state";
            case ErrorCategory::Internal:    return "internal";
            default: return "unknown";
        }
    }

} // namespace storyloop::core::errors
