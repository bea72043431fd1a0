#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "CancellationToken.hpp"
#include "ConfigData.hpp"
#include "IArtifactStore.hpp"
#include "ISandbox.hpp"
#include "ISecretProvider.hpp"
#include "JobDAG.hpp"
#include "RunContext.hpp"
#include "SecretMasker.hpp"
#include "StepRunner.hpp"
#include "ThreadSafeQueue.hpp"


// Job scheduler class
//
// run() drives a control loop on the calling thread: it consumes completion
// events, evaluates the `if` of newly ready instances and admits them to a pool
// of `concurrency` worker threads. Each admitted instance runs its steps
// sequentially on one worker.
class JobScheduler {
public:
    // Builds the execution plan; throws GraphError before anything runs
    JobScheduler(const ConfigData& config,
                 ISandbox& sandbox,
                 const ISecretProvider& secrets,
                 IArtifactStore* artifacts = nullptr);

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Run scheduler; returns the run status. May be called once.
    Status run();

    // Request cancellation of the whole run. Only stores a flag, so it may be
    // called from a signal handler.
    void cancel() { cancel_requested_.store(true); }

    bool has_failure() const { return run_->run_status() == Status::Failure; }

    const JobDAG& plan() const { return *dag_; }
    const RunContext& context() const { return *run_; }
    const SecretMasker& masker() const { return masker_; }

private:
    // Worker thread loop
    void worker_loop();
    void run_instance(const JobInstance& instance);
    void evaluate_outputs(const JobInstance& instance, JobExecution& job,
                          ErrorKind& error, std::string& detail);

    void resolve_secrets(const ISecretProvider& secrets);
    bool schedule();
    void evaluate_ready();
    bool admit();
    void handle_completion(const std::string& id);
    void cancel_instance(const std::string& id, const std::string& reason);
    void cancel_run(const std::string& reason, bool external);

    const ConfigData& config_;                              // Configuration data
    std::unique_ptr<JobDAG> dag_;                           // Job dependency graph
    std::unique_ptr<RunContext> run_;
    SecretMasker masker_;
    SecretMap secrets_;
    std::unique_ptr<StepRunner> step_runner_;

    CancellationToken run_token_;
    std::map<std::string, CancellationToken> instance_tokens_;  // Fixed after construction

    ThreadSafeQueue<const JobInstance*> work_queue_;        // Admitted instances
    ThreadSafeQueue<std::string> completions_;              // Instances whose worker returned
    std::vector<std::thread> workers_;

    std::atomic<bool> cancel_requested_{false};
    bool started_ = false;

    // Admission state, owned by the control loop
    bool run_cancelled_ = false;
    std::set<std::string> seen_ready_;
    std::vector<std::string> waiting_;                      // Condition passed, not admitted yet
    std::set<std::string> in_flight_;
    std::map<std::string, size_t> running_per_job_;
    std::map<std::string, std::string> group_holder_;       // Concurrency group -> instance id
};
