#include "session/backlog_store.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace storyloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;
using nlohmann::json;
using protocol::Backlog;
using protocol::WorkItem;

namespace {

LoopError malformed(const std::string& detail) {
    return LoopError{ErrorCategory::Persistence, "Backlog is malformed: " + detail,
                     "backlog_malformed"};
}

bool has_string(const json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string();
}

json item_to_json(const WorkItem& item) {
    json payload;
    payload["id"] = item.id;
    payload["title"] = item.title;
    payload["description"] = item.description;
    payload["acceptanceCriteria"] = item.acceptance_criteria;
    payload["priority"] = item.priority;
    payload["passes"] = item.passes;
    payload["notes"] = item.notes;
    return payload;
}

Result<WorkItem> item_from_json(const json& payload) {
    if (!payload.is_object()) {
        return malformed("work items must be objects");
    }
    if (!has_string(payload, "id") || !has_string(payload, "title") ||
        !has_string(payload, "description")) {
        return malformed("work item needs string id, title and description");
    }

    WorkItem item;
    item.id = payload.at("id").get<std::string>();
    item.title = payload.at("title").get<std::string>();
    item.description = payload.at("description").get<std::string>();

    const auto criteria = payload.find("acceptanceCriteria");
    if (criteria == payload.end() || !criteria->is_array()) {
        return malformed("work item " + item.id + " needs acceptanceCriteria");
    }
    for (const auto& entry : *criteria) {
        if (!entry.is_string()) {
            return malformed("acceptanceCriteria of " + item.id +
                             " must contain strings");
        }
        item.acceptance_criteria.push_back(entry.get<std::string>());
    }

    const auto priority = payload.find("priority");
    if (priority == payload.end() || !priority->is_number_integer()) {
        return malformed("work item " + item.id + " needs an integer priority");
    }
    if (priority->is_number_unsigned()
            ? priority->get<std::uint64_t>() >
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : (priority->get<std::int64_t>() < std::numeric_limits<int>::min() ||
               priority->get<std::int64_t>() > std::numeric_limits<int>::max())) {
        return malformed("priority of " + item.id + " is out of range");
    }
    item.priority = priority->get<int>();

    const auto passes = payload.find("passes");
    if (passes == payload.end() || !passes->is_boolean()) {
        return malformed("work item " + item.id + " needs a boolean passes flag");
    }
    item.passes = passes->get<bool>();

    const auto notes = payload.find("notes");
    if (notes != payload.end()) {
        if (!notes->is_string()) {
            return malformed("notes of " + item.id + " must be a string");
        }
        item.notes = notes->get<std::string>();
    }
    return item;
}

}  // namespace

std::string encode_backlog(const Backlog& backlog) {
    json payload;
    payload["project"] = backlog.project;
    payload["branchName"] = backlog.branch_name;
    payload["description"] = backlog.description;
    payload["workItems"] = json::array();
    for (const auto& item : backlog.items) {
        payload["workItems"].push_back(item_to_json(item));
    }
    return payload.dump(2);
}

Result<Backlog> decode_backlog(const std::string& document) {
    const json payload = json::parse(document, nullptr, false);
    if (payload.is_discarded()) {
        return malformed("not valid JSON");
    }
    if (!payload.is_object()) {
        return malformed("top level must be an object");
    }
    if (!has_string(payload, "project") || !has_string(payload, "branchName") ||
        !has_string(payload, "description")) {
        return malformed("needs string project, branchName and description");
    }
    const auto items = payload.find("workItems");
    if (items == payload.end() || !items->is_array()) {
        return malformed("needs a workItems array");
    }

    Backlog backlog;
    backlog.project = payload.at("project").get<std::string>();
    backlog.branch_name = payload.at("branchName").get<std::string>();
    backlog.description = payload.at("description").get<std::string>();
    if (backlog.branch_name.empty()) {
        return malformed("branchName cannot be empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : *items) {
        auto item = item_from_json(entry);
        if (core::errors::is_error(item)) {
            return core::errors::get_error(item);
        }
        const auto& value = core::errors::get_value(item);
        if (!seen.insert(value.id).second) {
            return malformed("duplicate work item id " + value.id);
        }
        backlog.items.push_back(value);
    }
    return backlog;
}

BacklogStore::BacklogStore(std::filesystem::path backlog_path)
    : backlog_path_(std::move(backlog_path)) {}

Result<Backlog> BacklogStore::load() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(backlog_path_, ec) || ec) {
        return LoopError{ErrorCategory::Persistence,
                         "Backlog not found: " + backlog_path_.string(),
                         "backlog_not_found",
                         "Set backlogPath in storyloop.config.json."};
    }

    std::ifstream in(backlog_path_);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to open backlog: " + backlog_path_.string(),
                         "backlog_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return decode_backlog(buffer.str());
}

Result<std::filesystem::path> BacklogStore::save(const Backlog& backlog) const {
    std::ofstream out(backlog_path_, std::ios::trunc);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to open backlog for writing: " + backlog_path_.string(),
                         "backlog_write_failed"};
    }
    out << encode_backlog(backlog) << "\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Persistence,
                         "Unable to write backlog: " + backlog_path_.string(),
                         "backlog_write_failed"};
    }
    return backlog_path_;
}

}  // namespace storyloop::session
