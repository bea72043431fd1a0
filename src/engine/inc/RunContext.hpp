#pragma once

#include "JobDAG.hpp"
#include "WorkflowErrors.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class Status {
    Pending,
    Running,
    Success,
    Failure,
    Skipped,
    Cancelled
};

const char* to_string(Status status);
bool is_terminal(Status status);

using Timestamp = std::chrono::system_clock::time_point;

struct StepRecord {
    std::string key;                    // Step id, or "#<index>"
    std::string name;
    Status status = Status::Pending;    // Outcome
    Status conclusion = Status::Pending;
    std::map<std::string, std::string> outputs;
    int exit_code = -1;
    int attempts = 0;
    std::vector<std::string> log;       // Redacted output of the last attempt
    ErrorKind error = ErrorKind::None;
    std::string error_detail;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
};

struct JobRecord {
    std::string id;                     // Job instance id
    std::string job_key;
    Status status = Status::Pending;
    bool continue_on_error = false;
    std::map<std::string, std::string> outputs;
    ErrorKind error = ErrorKind::None;
    std::string error_detail;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    std::vector<StepRecord> steps;

    // Cancelled, or a failure the job does not tolerate through continue-on-error
    bool blocks_dependents() const {
        return status == Status::Cancelled || (status == Status::Failure && !continue_on_error);
    }
};

// Mutable state of one workflow run. Every method takes the single internal lock,
// so status publication is atomic with respect to readers. Statuses only move
// forward: pending -> running -> terminal, or pending -> terminal; the first
// terminal publication wins.
class RunContext {
public:
    explicit RunContext(const JobDAG& plan);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    const JobDAG& plan() const { return plan_; }

    // Pending -> Running. False when the instance is no longer pending.
    bool start_job(const std::string& id);

    // Publish a terminal status. False when one was already published. Steps still
    // pending are marked skipped.
    bool finish_job(const std::string& id, Status status, ErrorKind error = ErrorKind::None,
                    const std::string& detail = "");

    void set_job_outputs(const std::string& id, const std::map<std::string, std::string>& outputs);

    // Pending -> Running for a step of a running instance. False when the instance
    // is not running anymore or the step already left pending.
    bool start_step(const std::string& id, size_t index);

    // Terminal record of a started step
    void finish_step(const std::string& id, size_t index, const StepRecord& record);

    // Pending -> Skipped
    void skip_step(const std::string& id, size_t index);

    // Snapshots
    JobRecord job(const std::string& id) const;
    std::vector<JobRecord> snapshot() const;
    Status job_status(const std::string& id) const;
    std::optional<StepRecord> step(const std::string& id, const std::string& key) const;
    bool all_terminal() const;

    void mark_cancelled_externally();
    bool cancelled_externally() const;

    // Cancelled when externally aborted with a cancelled instance; Failure when an
    // instance failed without continue-on-error; Success otherwise
    Status run_status() const;

    static std::string step_key(const Step& step, size_t index);

private:
    JobRecord& record(const std::string& id);
    const JobRecord& record(const std::string& id) const;

    const JobDAG& plan_;
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> jobs_;
    std::vector<std::string> order_;
    bool cancelled_externally_ = false;
};
