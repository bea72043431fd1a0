#include "RunContext.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

const char* to_string(Status status) {
    switch (status) {
        case Status::Pending:   return "pending";
        case Status::Running:   return "running";
        case Status::Success:   return "success";
        case Status::Failure:   return "failure";
        case Status::Skipped:   return "skipped";
        case Status::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(Status status) {
    return status != Status::Pending && status != Status::Running;
}

std::string RunContext::step_key(const Step& step, size_t index) {
    return step.id.empty() ? "#" + std::to_string(index) : step.id;
}

RunContext::RunContext(const JobDAG& plan) : plan_(plan) {
    for (const JobInstance* instance : plan.instances()) {
        JobRecord rec;
        rec.id = instance->id;
        rec.job_key = instance->job->key;
        rec.continue_on_error = instance->job->continue_on_error;
        for (size_t i = 0; i < instance->job->steps.size(); ++i) {
            StepRecord step;
            step.key = step_key(instance->job->steps[i], i);
            step.name = instance->job->steps[i].display_name();
            rec.steps.push_back(std::move(step));
        }
        order_.push_back(rec.id);
        jobs_.emplace(rec.id, std::move(rec));
    }
}

JobRecord& RunContext::record(const std::string& id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw std::out_of_range("Unknown job instance: " + id);
    }
    return it->second;
}

const JobRecord& RunContext::record(const std::string& id) const {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw std::out_of_range("Unknown job instance: " + id);
    }
    return it->second;
}

bool RunContext::start_job(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord& rec = record(id);
    if (rec.status != Status::Pending) return false;
    rec.status = Status::Running;
    rec.started_at = std::chrono::system_clock::now();
    return true;
}

bool RunContext::finish_job(const std::string& id, Status status, ErrorKind error, const std::string& detail) {
    if (!is_terminal(status)) {
        throw std::invalid_argument(std::string("Not a terminal status: ") + to_string(status));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord& rec = record(id);
    if (is_terminal(rec.status)) return false;

    rec.status = status;
    rec.error = error;
    rec.error_detail = detail;
    rec.finished_at = std::chrono::system_clock::now();
    for (auto& step : rec.steps) {
        if (step.status == Status::Pending) {
            step.status = Status::Skipped;
            step.conclusion = Status::Skipped;
        }
    }
    LogUtils::debug("Job instance '{}' -> {}", id, to_string(status));
    return true;
}

void RunContext::set_job_outputs(const std::string& id, const std::map<std::string, std::string>& outputs) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(id).outputs = outputs;
}

bool RunContext::start_step(const std::string& id, size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord& rec = record(id);
    if (rec.status != Status::Running) return false;
    StepRecord& step = rec.steps.at(index);
    if (step.status != Status::Pending) return false;
    step.status = Status::Running;
    step.started_at = std::chrono::system_clock::now();
    return true;
}

void RunContext::finish_step(const std::string& id, size_t index, const StepRecord& result) {
    if (!is_terminal(result.status)) {
        throw std::invalid_argument(std::string("Not a terminal status: ") + to_string(result.status));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    StepRecord& step = record(id).steps.at(index);
    if (is_terminal(step.status)) return;

    const std::string key = step.key;
    const auto started = step.started_at;
    step = result;
    step.key = key;
    step.started_at = started ? started : result.started_at;
    step.finished_at = std::chrono::system_clock::now();
}

void RunContext::skip_step(const std::string& id, size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    StepRecord& step = record(id).steps.at(index);
    if (step.status != Status::Pending) return;
    step.status = Status::Skipped;
    step.conclusion = Status::Skipped;
}

JobRecord RunContext::job(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record(id);
}

std::vector<JobRecord> RunContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobRecord> result;
    result.reserve(order_.size());
    for (const auto& id : order_) result.push_back(jobs_.at(id));
    return result;
}

Status RunContext::job_status(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record(id).status;
}

std::optional<StepRecord> RunContext::step(const std::string& id, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& step : record(id).steps) {
        if (step.key == key) return step;
    }
    return std::nullopt;
}

bool RunContext::all_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, rec] : jobs_) {
        if (!is_terminal(rec.status)) return false;
    }
    return true;
}

void RunContext::mark_cancelled_externally() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_externally_ = true;
}

bool RunContext::cancelled_externally() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_externally_;
}

Status RunContext::run_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    bool any_cancelled = false;
    bool any_failed = false;
    for (const auto& [id, rec] : jobs_) {
        if (rec.status == Status::Cancelled) any_cancelled = true;
        if (rec.status == Status::Failure && !rec.continue_on_error) any_failed = true;
    }
    if (cancelled_externally_ && any_cancelled) return Status::Cancelled;
    if (any_failed) return Status::Failure;
    return Status::Success;
}
