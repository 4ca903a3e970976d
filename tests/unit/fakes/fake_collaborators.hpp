#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "runtime/code_agent.hpp"
#include "runtime/run_reporter.hpp"
#include "session/state_persistence.hpp"
#include "tools/command_executor.hpp"
#include "vcs/version_control.hpp"

namespace storyloop::fakes {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using core::errors::Result;

class InMemoryStatePersistence : public session::StatePersistence {
public:
    Result<std::optional<std::string>> read() const override { return document; }

    Result<std::size_t> write(const std::string& text) override {
        if (fail_writes) {
            return LoopError{ErrorCategory::Persistence, "disk full", "state_write_failed"};
        }
        document = text;
        ++write_count;
        return text.size();
    }

    std::optional<std::string> document;
    std::size_t write_count = 0;
    bool fail_writes = false;
};

// Hands out rev-1, rev-2, ... and records every reset.
class FakeVersionControl : public vcs::VersionControl {
public:
    Result<std::string> current_revision() const override {
        return "rev-" + std::to_string(++revision_reads_);
    }

    Result<std::string> reset_to(const std::string& revision) override {
        if (fail_reset) {
            return LoopError{ErrorCategory::Execution, "reset refused", "git_command_failed"};
        }
        resets.push_back(revision);
        return revision;
    }

    Result<std::string> current_branch() const override { return branch; }

    bool branch_exists(const std::string& branch_name) const override {
        return branches.count(branch_name) > 0;
    }

    Result<std::string> checkout(const std::string& branch_name) override {
        branch = branch_name;
        checkouts.push_back(branch_name);
        return branch_name;
    }

    Result<std::string> create_branch(const std::string& branch_name,
                                      const std::string& from_branch) override {
        created.push_back(branch_name + "<-" + from_branch);
        branches.insert(branch_name);
        branch = branch_name;
        return branch_name;
    }

    Result<std::string> checkout_or_create(const std::string& branch_name,
                                           const std::string& from_branch) override {
        if (branch_exists(branch_name)) {
            return checkout(branch_name);
        }
        return create_branch(branch_name, from_branch);
    }

    std::string main_branch() const override { return "main"; }

    Result<std::string> commit_all(const std::string&) override {
        return current_revision();
    }

    Result<std::vector<std::string>> files_changed_since(const std::string&) const override {
        return std::vector<std::string>{};
    }

    std::string branch = "main";
    std::set<std::string> branches = {"main"};
    std::vector<std::string> resets;
    std::vector<std::string> checkouts;
    std::vector<std::string> created;
    bool fail_reset = false;

private:
    mutable std::uint32_t revision_reads_ = 0;
};

// Replays scripted outputs in order; the last one repeats once the script runs out.
class ScriptedAgent : public runtime::CodeAgent {
public:
    explicit ScriptedAgent(std::vector<std::string> outputs) : outputs_(std::move(outputs)) {}

    Result<protocol::AgentOutput> run(const protocol::AgentRequest& request) override {
        requests.push_back(request);
        if (spawn_error.has_value()) {
            return spawn_error.value();
        }
        protocol::AgentOutput output;
        output.output = outputs_.empty() ? "" : outputs_[std::min(next_, outputs_.size() - 1)];
        output.exit_code = 0;
        output.success = true;
        ++next_;
        return output;
    }

    std::vector<protocol::AgentRequest> requests;
    std::optional<LoopError> spawn_error;

private:
    std::vector<std::string> outputs_;
    std::size_t next_ = 0;
};

// Returns queued captures in order, then `default_exit_code` for everything else.
class FakeCommandExecutor : public tools::CommandExecutor {
public:
    Result<tools::ProcessCapture> run(const tools::ProcessRequest& request) const override {
        requests.push_back(request);
        if (!queued.empty()) {
            auto capture = queued.front();
            queued.pop_front();
            return capture;
        }
        tools::ProcessCapture capture;
        capture.exit_code = default_exit_code;
        capture.stdout_text = default_stdout;
        return capture;
    }

    void queue(int exit_code, std::string stdout_text = "", std::string stderr_text = "") {
        tools::ProcessCapture capture;
        capture.exit_code = exit_code;
        capture.stdout_text = std::move(stdout_text);
        capture.stderr_text = std::move(stderr_text);
        queued.push_back(std::move(capture));
    }

    mutable std::vector<tools::ProcessRequest> requests;
    mutable std::deque<tools::ProcessCapture> queued;
    int default_exit_code = 0;
    std::string default_stdout;
};

class RecordingReporter : public runtime::RunReporter {
public:
    void iteration_started(std::uint32_t iteration_number, std::uint32_t,
                           const protocol::WorkItem& item, const std::string&) override {
        events.push_back("started:" + item.id + "#" + std::to_string(iteration_number));
    }
    void output_interpreted(const std::string& item_id,
                            const protocol::ParsedOutput&) override {
        events.push_back("output:" + item_id);
    }
    void verification_finished(const std::string& item_id,
                               const protocol::VerificationReport& report) override {
        events.push_back("verified:" + item_id + (report.success ? ":pass" : ":fail"));
    }
    void iteration_failed(const std::string& item_id, const std::string& message) override {
        events.push_back("failed:" + item_id);
        failures.push_back(message);
    }
    void retry_scheduled(const std::string& item_id, std::chrono::milliseconds delay,
                         std::uint32_t next_attempt) override {
        events.push_back("retry:" + item_id + "#" + std::to_string(next_attempt));
        delays.push_back(delay);
    }
    void item_blocked(const std::string& item_id, std::uint32_t retry_count) override {
        events.push_back("blocked:" + item_id + "#" + std::to_string(retry_count));
    }
    void item_completed(const std::string& item_id) override {
        events.push_back("completed:" + item_id);
    }
    void run_finished(const protocol::RunSummary&) override {
        events.push_back("finished");
    }

    std::vector<std::string> events;
    std::vector<std::string> failures;
    std::vector<std::chrono::milliseconds> delays;
};

inline std::string structured_block(const std::string& status, const std::string& next_action,
                                    const std::string& item_id = "WI-1",
                                    const std::string& error_json = "null") {
    return "working on it...\n```json:storyloop-output\n{\"status\": \"" + status +
           "\", \"itemId\": \"" + item_id + "\", \"filesChanged\": [], \"learnings\": [], "
           "\"error\": " + error_json + ", \"nextAction\": \"" + next_action + "\"}\n```\n";
}

}  // namespace storyloop::fakes
