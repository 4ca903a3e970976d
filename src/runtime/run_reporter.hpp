#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "protocol/backlog.hpp"
#include "protocol/run_summary.hpp"
#include "protocol/structured_output.hpp"
#include "protocol/verification_contract.hpp"
#include "session/iteration_journal.hpp"

namespace storyloop::runtime {

// Receives every user-visible event of a run. Handed to the orchestrator
// explicitly; reporting never affects the loop's control flow.
class RunReporter {
public:
    virtual ~RunReporter() = default;

    virtual void iteration_started(std::uint32_t iteration_number,
                                   std::uint32_t max_iterations,
                                   const protocol::WorkItem& item,
                                   const std::string& start_revision) = 0;
    virtual void output_interpreted(const std::string& item_id,
                                    const protocol::ParsedOutput& parsed) = 0;
    virtual void verification_finished(const std::string& item_id,
                                       const protocol::VerificationReport& report) = 0;
    virtual void iteration_failed(const std::string& item_id,
                                  const std::string& message) = 0;
    virtual void retry_scheduled(const std::string& item_id,
                                 std::chrono::milliseconds delay,
                                 std::uint32_t next_attempt) = 0;
    virtual void item_blocked(const std::string& item_id, std::uint32_t retry_count) = 0;
    virtual void item_completed(const std::string& item_id) = 0;
    virtual void run_finished(const protocol::RunSummary& summary) = 0;
};

class LogReporter : public RunReporter {
public:
    void iteration_started(std::uint32_t iteration_number, std::uint32_t max_iterations,
                           const protocol::WorkItem& item,
                           const std::string& start_revision) override;
    void output_interpreted(const std::string& item_id,
                            const protocol::ParsedOutput& parsed) override;
    void verification_finished(const std::string& item_id,
                               const protocol::VerificationReport& report) override;
    void iteration_failed(const std::string& item_id, const std::string& message) override;
    void retry_scheduled(const std::string& item_id, std::chrono::milliseconds delay,
                         std::uint32_t next_attempt) override;
    void item_blocked(const std::string& item_id, std::uint32_t retry_count) override;
    void item_completed(const std::string& item_id) override;
    void run_finished(const protocol::RunSummary& summary) override;
};

// Appends events to the iteration journal. A failed write is logged and
// otherwise ignored.
class JournalReporter : public RunReporter {
public:
    JournalReporter(std::string run_id, const session::IterationJournal& journal);

    void iteration_started(std::uint32_t iteration_number, std::uint32_t max_iterations,
                           const protocol::WorkItem& item,
                           const std::string& start_revision) override;
    void output_interpreted(const std::string& item_id,
                            const protocol::ParsedOutput& parsed) override;
    void verification_finished(const std::string& item_id,
                               const protocol::VerificationReport& report) override;
    void iteration_failed(const std::string& item_id, const std::string& message) override;
    void retry_scheduled(const std::string& item_id, std::chrono::milliseconds delay,
                         std::uint32_t next_attempt) override;
    void item_blocked(const std::string& item_id, std::uint32_t retry_count) override;
    void item_completed(const std::string& item_id) override;
    void run_finished(const protocol::RunSummary& summary) override;

private:
    std::string run_id_;
    const session::IterationJournal& journal_;
};

// Forwards each event to every reporter, in order. Does not own them.
class FanoutReporter : public RunReporter {
public:
    explicit FanoutReporter(std::vector<RunReporter*> reporters);

    void iteration_started(std::uint32_t iteration_number, std::uint32_t max_iterations,
                           const protocol::WorkItem& item,
                           const std::string& start_revision) override;
    void output_interpreted(const std::string& item_id,
                            const protocol::ParsedOutput& parsed) override;
    void verification_finished(const std::string& item_id,
                               const protocol::VerificationReport& report) override;
    void iteration_failed(const std::string& item_id, const std::string& message) override;
    void retry_scheduled(const std::string& item_id, std::chrono::milliseconds delay,
                         std::uint32_t next_attempt) override;
    void item_blocked(const std::string& item_id, std::uint32_t retry_count) override;
    void item_completed(const std::string& item_id) override;
    void run_finished(const protocol::RunSummary& summary) override;

private:
    std::vector<RunReporter*> reporters_;
};

}  // namespace storyloop::runtime
