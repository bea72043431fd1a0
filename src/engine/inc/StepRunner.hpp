#pragma once

#include "CancellationToken.hpp"
#include "GlobalConfig.hpp"
#include "IArtifactStore.hpp"
#include "ISandbox.hpp"
#include "JobExprContext.hpp"
#include "RunContext.hpp"
#include "SecretMasker.hpp"
#include <chrono>
#include <optional>

// Per-instance state shared by the steps of one job instance
struct JobExecution {
    const JobInstance& instance;
    EnvMap env;                                                     // Workflow and job env, interpolated
    std::optional<std::chrono::steady_clock::time_point> deadline;  // From the job's timeout-minutes
    CancellationToken token;
    bool steps_failed = false;                                      // Some step concluded failure

    JobExecution(const JobInstance& instance, CancellationToken token)
        : instance(instance), token(std::move(token)) {}
};

// Runs one step of a job instance and publishes its record to the run context
class StepRunner {
public:
    StepRunner(const GlobalConfig& global,
               RunContext& run,
               ISandbox& sandbox,
               SecretMasker& masker,
               const SecretMap& secrets,
               IArtifactStore* artifacts = nullptr);

    StepRecord run_step(const Step& step, size_t index, JobExecution& job);

    // Workflow env (runner vars on top) and job env, each layer interpolated
    // against the layers below it. Throws EvalError.
    EnvMap job_env(const JobInstance& instance, const CancellationToken& token) const;

    // Effective timeout of the next attempt; zero when the job budget is spent
    std::chrono::milliseconds effective_timeout(const Step& step, const JobExecution& job) const;

private:
    void execute_attempt(const Step& step, size_t index, JobExecution& job,
                         const EnvMap& env, StepRecord& record);
    void run_command(const Step& step, size_t index, JobExecution& job, const EnvMap& env,
                     std::chrono::milliseconds timeout, StepRecord& record);
    void run_artifact_action(const Step& step, JobExecution& job, const EnvMap& env, StepRecord& record);
    void handle_line(const JobExecution& job, const std::string& line, StepRecord& record);
    std::string resolve_working_directory(const Step& step, const JobExprContext& ctx) const;
    std::string resolve_shell(const Step& step) const;

    const GlobalConfig& global_;
    RunContext& run_;
    ISandbox& sandbox_;
    SecretMasker& masker_;
    const SecretMap& secrets_;
    IArtifactStore* artifacts_;
    std::map<std::string, std::string> ambient_env_;
};
