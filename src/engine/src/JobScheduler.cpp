#include "JobScheduler.hpp"
#include "ExpressionEngine.hpp"
#include "JobExprContext.hpp"
#include "LogUtils.hpp"
#include "TimestampUtils.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace {

constexpr std::chrono::milliseconds CONTROL_POLL_INTERVAL(100);

} // namespace

JobScheduler::JobScheduler(const ConfigData& config,
                           ISandbox& sandbox,
                           const ISecretProvider& secrets,
                           IArtifactStore* artifacts)
    : config_(config),
      dag_(JobDAG::build_execution_plan(config.workflow)),
      run_(std::make_unique<RunContext>(*dag_)) {

    resolve_secrets(secrets);
    step_runner_ = std::make_unique<StepRunner>(config_.global, *run_, sandbox, masker_, secrets_, artifacts);

    for (const JobInstance* instance : dag_->instances()) {
        instance_tokens_.emplace(instance->id, run_token_.child());
    }
}

JobScheduler::~JobScheduler() {
    work_queue_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void JobScheduler::resolve_secrets(const ISecretProvider& secrets) {
    std::set<std::string> names = dag_->workflow().secret_refs;
    names.insert(config_.global.secrets.begin(), config_.global.secrets.end());

    for (const auto& name : names) {
        auto value = secrets.resolve(name);
        if (!value) {
            LogUtils::warn("Secret '{}' is referenced but not available; it resolves to an empty string", name);
            continue;
        }
        secrets_[name] = *value;
        masker_.add(*value);
    }
}

Status JobScheduler::run() {
    if (started_) {
        throw std::logic_error("JobScheduler::run() may only be called once");
    }
    started_ = true;

    // Create thread pool
    const size_t concurrency = static_cast<size_t>(std::max(1, config_.concurrency));
    const size_t pool_size = std::max<size_t>(1, std::min(concurrency, dag_->size()));
    for (size_t i = 0; i < pool_size; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }

    LogUtils::info("Running workflow '{}': {} job instance(s), concurrency {}",
                   dag_->workflow().name, dag_->size(), concurrency);

    while (true) {
        if (cancel_requested_.load() && !run_cancelled_) {
            cancel_run("Run was cancelled", true);
        }

        bool progress = schedule();
        if (in_flight_.empty() && run_->all_terminal()) break;

        if (in_flight_.empty() && !progress) {
            // Nothing running and nothing admissible: leave no instance behind
            LogUtils::error("Scheduler stalled with unfinished job instances; cancelling them");
            for (const JobInstance* instance : dag_->instances()) {
                cancel_instance(instance->id, "Instance could not be scheduled");
            }
            continue;
        }

        // Skips and cancellations may have made more instances ready
        auto wait = progress ? std::chrono::milliseconds(0) : CONTROL_POLL_INTERVAL;
        if (auto done = completions_.dequeue_for(wait)) {
            handle_completion(*done);
        }
    }

    // Stop queue and wait for threads
    work_queue_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();

    Status status = run_->run_status();
    LogUtils::info("Workflow '{}' finished: {}", dag_->workflow().name, to_string(status));
    return status;
}

bool JobScheduler::schedule() {
    const size_t before = seen_ready_.size();
    evaluate_ready();
    bool admitted = admit();
    return admitted || seen_ready_.size() != before;
}

void JobScheduler::evaluate_ready() {
    std::set<std::string> completed;
    for (const auto& rec : run_->snapshot()) {
        if (is_terminal(rec.status)) completed.insert(rec.id);
    }

    for (const auto& id : dag_->ready_set(completed)) {
        if (!seen_ready_.insert(id).second) continue;

        const JobInstance& instance = dag_->instance(id);
        if (run_cancelled_) {
            cancel_instance(id, "Run was cancelled");
            continue;
        }

        const CancellationToken& token = instance_tokens_.at(id);
        try {
            JobExprContext ctx(*run_, instance, step_runner_->job_env(instance, token), secrets_, token,
                               JobExprContext::Level::Job);
            if (!ExpressionEngine::evaluate_condition(instance.job->if_expr, ctx)) {
                LogUtils::info("Skipping job instance '{}'", id);
                run_->finish_job(id, Status::Skipped);
                continue;
            }
        } catch (const EvalError& e) {
            std::string detail = masker_.mask(e.what());
            LogUtils::error("Condition of job instance '{}' failed: {}", id, detail);
            run_->finish_job(id, Status::Failure, ErrorKind::Eval, detail);
            continue;
        }
        waiting_.push_back(id);
    }
}

bool JobScheduler::admit() {
    const size_t concurrency = static_cast<size_t>(std::max(1, config_.concurrency));
    bool admitted = false;

    for (auto it = waiting_.begin(); it != waiting_.end();) {
        const std::string id = *it;
        const JobInstance& instance = dag_->instance(id);

        // Cancelled while waiting (fail-fast, supersession)
        if (is_terminal(run_->job_status(id))) {
            it = waiting_.erase(it);
            admitted = true;
            continue;
        }

        const Job& job = *instance.job;
        if (job.max_parallel && running_per_job_[job.key] >= *job.max_parallel) {
            ++it;
            continue;
        }

        // Supersession goes before the capacity gate, the older holder may fill the pool
        const std::string& group = instance.concurrency_group;
        if (!group.empty()) {
            auto holder = group_holder_.find(group);
            if (holder != group_holder_.end() && holder->second != id) {
                if (!job.concurrency.cancel_in_progress) {
                    ++it;
                    continue;
                }
                // The older instance is Cancelled before the newer one is Running
                cancel_instance(holder->second,
                                "Superseded by '" + id + "' in concurrency group '" + group + "'");
            }
            group_holder_[group] = id;
        }

        if (in_flight_.size() >= concurrency) break;

        if (!run_->start_job(id)) {
            it = waiting_.erase(it);
            continue;
        }

        LogUtils::info("Starting job instance '{}'", id);
        in_flight_.insert(id);
        running_per_job_[job.key]++;
        work_queue_.enqueue(&instance);
        it = waiting_.erase(it);
        admitted = true;
    }
    return admitted;
}

void JobScheduler::handle_completion(const std::string& id) {
    const JobInstance& instance = dag_->instance(id);
    in_flight_.erase(id);
    running_per_job_[instance.job->key]--;

    auto holder = group_holder_.find(instance.concurrency_group);
    if (holder != group_holder_.end() && holder->second == id) {
        group_holder_.erase(holder);
    }

    JobRecord rec = run_->job(id);
    if (rec.started_at && rec.finished_at) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(*rec.finished_at - *rec.started_at);
        LogUtils::info("Job instance '{}' finished: {} in {}", id, to_string(rec.status),
                       TimestampUtils::format_duration(elapsed));
    } else {
        LogUtils::info("Job instance '{}' finished: {}", id, to_string(rec.status));
    }

    if (rec.status != Status::Failure || rec.continue_on_error) return;

    if (!instance.job->matrix.empty() && instance.job->fail_fast) {
        for (const JobInstance* sibling : dag_->instances_of(instance.job->key)) {
            if (sibling->id == id) continue;
            cancel_instance(sibling->id, "Matrix sibling '" + id + "' failed (fail-fast)");
        }
    }

    if (config_.global.fail_fast && !run_cancelled_) {
        cancel_run("Job instance '" + id + "' failed (fail-fast)", false);
    }
}

void JobScheduler::cancel_instance(const std::string& id, const std::string& reason) {
    if (run_->finish_job(id, Status::Cancelled, ErrorKind::Cancelled, reason)) {
        LogUtils::warn("Cancelled job instance '{}': {}", id, reason);
    }
    instance_tokens_.at(id).cancel();
}

void JobScheduler::cancel_run(const std::string& reason, bool external) {
    run_cancelled_ = true;
    if (external) {
        run_->mark_cancelled_externally();
    }
    LogUtils::warn("{}", reason);

    for (const JobInstance* instance : dag_->instances()) {
        if (!is_terminal(run_->job_status(instance->id))) {
            cancel_instance(instance->id, reason);
        }
    }
    run_token_.cancel();
}

void JobScheduler::worker_loop() {
    while (true) {
        auto next = work_queue_.dequeue();
        if (!next) return;

        const JobInstance& instance = **next;
        try {
            run_instance(instance);
        } catch (const std::exception& e) {
            LogUtils::error("Job instance '{}' aborted: {}", instance.id, e.what());
            run_->finish_job(instance.id, Status::Failure, ErrorKind::Execution, masker_.mask(e.what()));
        }
        completions_.enqueue(instance.id);
    }
}

void JobScheduler::run_instance(const JobInstance& instance) {
    const std::string& id = instance.id;
    JobExecution job(instance, instance_tokens_.at(id));
    if (instance.job->timeout) {
        job.deadline = std::chrono::steady_clock::now() + *instance.job->timeout;
    }

    try {
        job.env = step_runner_->job_env(instance, job.token);
    } catch (const EvalError& e) {
        run_->finish_job(id, Status::Failure, ErrorKind::Eval, masker_.mask(e.what()));
        return;
    }

    const auto& steps = instance.job->steps;
    for (size_t i = 0; i < steps.size(); ++i) {
        step_runner_->run_step(steps[i], i, job);
    }

    ErrorKind error = ErrorKind::None;
    std::string detail;

    if (job.token.is_cancelled()) {
        // Already published as Cancelled by whoever cancelled the token
        run_->finish_job(id, Status::Cancelled, ErrorKind::Cancelled, "Job instance was cancelled");
        return;
    }

    if (job.steps_failed) {
        for (const auto& step : run_->job(id).steps) {
            if (step.conclusion == Status::Failure) {
                error = step.error;
                detail = "Step '" + step.name + "' failed: " + step.error_detail;
                break;
            }
        }
    }

    evaluate_outputs(instance, job, error, detail);

    if (job.steps_failed || error != ErrorKind::None) {
        run_->finish_job(id, Status::Failure, error == ErrorKind::None ? ErrorKind::Execution : error, detail);
    } else {
        run_->finish_job(id, Status::Success);
    }
}

void JobScheduler::evaluate_outputs(const JobInstance& instance, JobExecution& job,
                                    ErrorKind& error, std::string& detail) {
    if (instance.job->outputs.empty()) return;

    JobExprContext ctx(*run_, instance, job.env, secrets_, job.token,
                       JobExprContext::Level::Step, job.steps_failed);
    std::map<std::string, std::string> outputs;
    for (const auto& [name, expression] : instance.job->outputs) {
        try {
            outputs[name] = ExpressionEngine::interpolate(expression, ctx);
        } catch (const EvalError& e) {
            LogUtils::error("Output '{}' of job instance '{}' failed: {}", name, instance.id, masker_.mask(e.what()));
            if (error == ErrorKind::None) {
                error = ErrorKind::Eval;
                detail = "Output '" + name + "': " + masker_.mask(e.what());
            }
        }
    }
    run_->set_job_outputs(instance.id, outputs);
}
