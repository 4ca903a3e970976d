#include "runtime/output_interpreter.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace storyloop::runtime {

using nlohmann::json;
using protocol::NextAction;
using protocol::OutputStatus;
using protocol::ParsedOutput;
using protocol::StructuredResult;

namespace {

constexpr const char* kFence = "```";

std::optional<std::string> extract_block(const std::string& text) {
    const std::string opening = std::string(kFence) + protocol::kStructuredOutputMarker;
    const auto start = text.find(opening);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    const auto body_start = start + opening.size();
    const auto end = text.find(kFence, body_start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(body_start, end - body_start);
}

std::string trim(const std::string& value) {
    std::size_t first = 0;
    while (first < value.size() &&
           std::isspace(static_cast<unsigned char>(value[first])) != 0) {
        ++first;
    }
    std::size_t last = value.size();
    while (last > first &&
           std::isspace(static_cast<unsigned char>(value[last - 1])) != 0) {
        --last;
    }
    return value.substr(first, last - first);
}

bool read_string_list(const json& object, const char* key,
                      std::vector<std::string>& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_array()) {
        return false;
    }
    for (const auto& entry : *it) {
        if (!entry.is_string()) {
            return false;
        }
        out.push_back(entry.get<std::string>());
    }
    return true;
}

std::optional<StructuredResult> validate(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }

    const auto status = document.find("status");
    const auto item_id = document.find("itemId");
    const auto next_action = document.find("nextAction");
    if (status == document.end() || !status->is_string() ||
        item_id == document.end() || !item_id->is_string() ||
        next_action == document.end() || !next_action->is_string()) {
        return std::nullopt;
    }

    StructuredResult result;
    const auto status_text = status->get<std::string>();
    if (status_text == "success") {
        result.status = OutputStatus::Success;
    } else if (status_text == "failure") {
        result.status = OutputStatus::Failure;
    } else {
        return std::nullopt;
    }

    const auto action_text = next_action->get<std::string>();
    if (action_text == "continue") {
        result.next_action = NextAction::Continue;
    } else if (action_text == "complete") {
        result.next_action = NextAction::Complete;
    } else if (action_text == "blocked") {
        result.next_action = NextAction::Blocked;
    } else {
        return std::nullopt;
    }

    result.item_id = item_id->get<std::string>();
    if (!read_string_list(document, "filesChanged", result.files_changed) ||
        !read_string_list(document, "learnings", result.learnings)) {
        return std::nullopt;
    }

    const auto error = document.find("error");
    if (error != document.end() && !error->is_null()) {
        if (!error->is_string()) {
            return std::nullopt;
        }
        if (!error->get<std::string>().empty()) {
            result.error = error->get<std::string>();
        }
    }
    return result;
}

}  // namespace

ParsedOutput OutputInterpreter::interpret(const std::string& raw_text) const {
    ParsedOutput parsed;
    parsed.raw_output = raw_text;

    const auto block = extract_block(raw_text);
    if (!block.has_value()) {
        return parsed;
    }

    const json document = json::parse(trim(block.value()), nullptr, false);
    if (document.is_discarded()) {
        LOG_WARN("Structured output block is not valid JSON; ignoring it");
        return parsed;
    }

    parsed.structured = validate(document);
    if (parsed.structured.has_value()) {
        LOG_DEBUG("Parsed structured output for " + parsed.structured->item_id);
    } else {
        LOG_WARN("Structured output block failed validation; ignoring it");
    }
    return parsed;
}

bool OutputInterpreter::is_success(const ParsedOutput& parsed) {
    return parsed.structured.has_value() &&
           parsed.structured->status == OutputStatus::Success;
}

bool OutputInterpreter::is_complete(const ParsedOutput& parsed) {
    return parsed.structured.has_value() &&
           parsed.structured->next_action == NextAction::Complete;
}

bool OutputInterpreter::is_blocked(const ParsedOutput& parsed) {
    return parsed.structured.has_value() &&
           parsed.structured->next_action == NextAction::Blocked;
}

std::optional<std::string> OutputInterpreter::error_message(
    const ParsedOutput& parsed) {
    if (!parsed.structured.has_value()) {
        return std::string(kNoStructuredOutput);
    }
    if (parsed.structured->error.has_value()) {
        return parsed.structured->error;
    }
    if (parsed.structured->status == OutputStatus::Failure) {
        return std::string(kFailureWithoutDetails);
    }
    return std::nullopt;
}

std::vector<std::string> OutputInterpreter::learnings(const ParsedOutput& parsed) {
    return parsed.structured.has_value() ? parsed.structured->learnings
                                         : std::vector<std::string>{};
}

std::vector<std::string> OutputInterpreter::files_changed(
    const ParsedOutput& parsed) {
    return parsed.structured.has_value() ? parsed.structured->files_changed
                                         : std::vector<std::string>{};
}

}  // namespace storyloop::runtime
