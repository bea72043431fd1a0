#include "StepRunner.hpp"
#include "ExpressionEngine.hpp"
#include "LogUtils.hpp"
#include "OutputParser.hpp"
#include "ScopedEnvVar.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fmt/format.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

enum class ArtifactAction {
    None,
    Upload,
    Download
};

ArtifactAction artifact_action(const std::string& uses) {
    std::string name = uses.substr(0, uses.find('@'));
    if (name == "actions/upload-artifact") return ArtifactAction::Upload;
    if (name == "actions/download-artifact") return ArtifactAction::Download;
    return ArtifactAction::None;
}

std::string input(const Step& step, const std::string& key, const std::string& fallback = "") {
    auto it = step.with.find(key);
    return it == step.with.end() ? fallback : it->second;
}

void fail(StepRecord& record, ErrorKind kind, const std::string& detail) {
    record.status = Status::Failure;
    record.error = kind;
    record.error_detail = detail;
}

} // namespace

StepRunner::StepRunner(const GlobalConfig& global,
                       RunContext& run,
                       ISandbox& sandbox,
                       SecretMasker& masker,
                       const SecretMap& secrets,
                       IArtifactStore* artifacts)
    : global_(global), run_(run), sandbox_(sandbox), masker_(masker), secrets_(secrets),
      artifacts_(artifacts), ambient_env_(ScopedEnvVar::snapshot()) {}

EnvMap StepRunner::job_env(const JobInstance& instance, const CancellationToken& token) const {
    const Workflow& workflow = run_.plan().workflow();

    EnvMap env;
    auto add_layer = [&](const EnvMap& layer) {
        JobExprContext ctx(run_, instance, env, secrets_, token, JobExprContext::Level::Job);
        EnvMap resolved = env;
        for (const auto& [key, value] : layer) {
            resolved[key] = ExpressionEngine::interpolate(value, ctx);
        }
        env = std::move(resolved);
    };

    add_layer(workflow.env);
    add_layer(global_.env);
    add_layer(instance.job->env);
    return env;
}

std::chrono::milliseconds StepRunner::effective_timeout(const Step& step, const JobExecution& job) const {
    using namespace std::chrono;

    std::optional<milliseconds> remaining;
    if (job.deadline) {
        remaining = duration_cast<milliseconds>(*job.deadline - steady_clock::now());
        if (remaining->count() <= 0) return milliseconds(0);
    }

    if (step.timeout && remaining) return std::min(*step.timeout, *remaining);
    if (step.timeout) return *step.timeout;
    if (remaining) return *remaining;
    return global_.default_timeout;
}

std::string StepRunner::resolve_shell(const Step& step) const {
    if (!step.shell.empty()) return step.shell;
    const Workflow& workflow = run_.plan().workflow();
    if (!workflow.default_shell.empty()) return workflow.default_shell;
    return global_.shell;
}

std::string StepRunner::resolve_working_directory(const Step& step, const JobExprContext& ctx) const {
    fs::path base = global_.working_directory.empty() ? fs::path(".") : fs::path(global_.working_directory);

    std::string dir = step.working_directory;
    if (dir.empty()) dir = run_.plan().workflow().default_working_directory;
    if (dir.empty()) return base.string();

    fs::path path(ExpressionEngine::interpolate(dir, ctx));
    if (path.is_relative()) path = base / path;
    return path.string();
}

void StepRunner::handle_line(const JobExecution& job, const std::string& line, StepRecord& record) {
    OutputCommand cmd = OutputParser::parse_line(line);
    switch (cmd.kind) {
        case OutputCommand::Kind::SetOutput:
            record.outputs[cmd.name] = cmd.value;
            break;
        case OutputCommand::Kind::AddMask:
            masker_.add(cmd.value);
            break;
        case OutputCommand::Kind::None:
            break;
    }

    std::string masked = masker_.mask(line);
    LogUtils::step_output(job.instance.id, masked);
    record.log.push_back(std::move(masked));
}

StepRecord StepRunner::run_step(const Step& step, size_t index, JobExecution& job) {
    const std::string& id = job.instance.id;
    StepRecord record;
    record.key = RunContext::step_key(step, index);
    record.name = step.display_name();

    if (job.token.is_cancelled()) {
        run_.skip_step(id, index);
        return *run_.step(id, record.key);
    }

    // Step env and `if` are evaluated before the step counts as started
    EnvMap env = job.env;
    bool should_run = false;
    try {
        JobExprContext base_ctx(run_, job.instance, job.env, secrets_, job.token,
                                JobExprContext::Level::Step, job.steps_failed);
        for (const auto& [key, value] : step.env) {
            env[key] = ExpressionEngine::interpolate(value, base_ctx);
        }
        JobExprContext ctx(run_, job.instance, env, secrets_, job.token,
                           JobExprContext::Level::Step, job.steps_failed);
        should_run = ExpressionEngine::evaluate_condition(step.if_expr, ctx);
    } catch (const EvalError& e) {
        if (!run_.start_step(id, index)) {
            run_.skip_step(id, index);
            return *run_.step(id, record.key);
        }
        fail(record, ErrorKind::Eval, masker_.mask(e.what()));
        record.attempts = 1;
        record.conclusion = step.continue_on_error ? Status::Success : Status::Failure;
        LogUtils::error("[{}] Step '{}' failed: {}", id, record.name, record.error_detail);
        if (record.conclusion == Status::Failure) job.steps_failed = true;
        run_.finish_step(id, index, record);
        return record;
    }

    if (!should_run) {
        LogUtils::info("[{}] Skipping step '{}'", id, record.name);
        run_.skip_step(id, index);
        return *run_.step(id, record.key);
    }

    if (!run_.start_step(id, index)) {
        run_.skip_step(id, index);
        return *run_.step(id, record.key);
    }

    LogUtils::info("[{}] Running step '{}'", id, record.name);
    const auto step_start = std::chrono::steady_clock::now();

    const int max_attempts = 1 + std::max(0, step.retries);
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        StepRecord current;
        current.name = record.name;
        current.attempts = attempt;

        execute_attempt(step, index, job, env, current);
        record = std::move(current);

        if (record.status != Status::Failure || attempt == max_attempts || job.token.is_cancelled()) {
            break;
        }
        LogUtils::warn("[{}] Step '{}' failed ({}), retrying ({}/{})",
                       id, record.name, record.error_detail, attempt + 1, max_attempts);
    }

    record.key = RunContext::step_key(step, index);
    if (record.status == Status::Failure && step.continue_on_error) {
        record.conclusion = Status::Success;
    } else {
        record.conclusion = record.status;
    }
    if (record.conclusion == Status::Failure) job.steps_failed = true;

    const std::string elapsed = TimestampUtils::format_duration(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - step_start));
    if (record.status == Status::Success) {
        LogUtils::info("[{}] Step '{}' succeeded in {}", id, record.name, elapsed);
    } else {
        LogUtils::error("[{}] Step '{}' ended {} after {}: {}",
                        id, record.name, to_string(record.status), elapsed, record.error_detail);
    }

    run_.finish_step(id, index, record);
    return record;
}

void StepRunner::execute_attempt(const Step& step, size_t index, JobExecution& job,
                                 const EnvMap& env, StepRecord& record) {
    if (job.token.is_cancelled()) {
        record.status = Status::Cancelled;
        record.error = ErrorKind::Cancelled;
        record.error_detail = "Job instance was cancelled";
        return;
    }

    const auto timeout = effective_timeout(step, job);
    if (timeout.count() <= 0) {
        fail(record, ErrorKind::Timeout, "Job timeout exceeded before the step started");
        return;
    }

    try {
        if (!step.uses.empty()) {
            run_artifact_action(step, job, env, record);
        } else {
            run_command(step, index, job, env, timeout, record);
        }
    } catch (const EvalError& e) {
        fail(record, ErrorKind::Eval, masker_.mask(e.what()));
    } catch (const std::runtime_error& e) {
        // Artifact store and filesystem failures
        fail(record, ErrorKind::Execution, masker_.mask(e.what()));
    }
}

void StepRunner::run_command(const Step& step, size_t index, JobExecution& job, const EnvMap& env,
                             std::chrono::milliseconds timeout, StepRecord& record) {
    JobExprContext ctx(run_, job.instance, env, secrets_, job.token,
                       JobExprContext::Level::Step, job.steps_failed);

    SandboxRequest request;
    request.command = ExpressionEngine::interpolate(step.run, ctx);
    request.shell = resolve_shell(step);
    request.working_directory = resolve_working_directory(step, ctx);
    request.timeout = timeout;
    request.label = job.instance.id + " / " + record.name;

    request.env = ambient_env_;
    request.env["CI"] = "true";
    request.env["FLOWEXEC_WORKFLOW"] = run_.plan().workflow().name;
    request.env["FLOWEXEC_JOB"] = job.instance.job->key;
    request.env["FLOWEXEC_STEP"] = RunContext::step_key(step, index);
    request.env["FLOWEXEC_WORKSPACE"] = global_.working_directory;
    for (const auto& [key, value] : env) request.env[key] = value;

    SandboxResult result = sandbox_.execute(request, job.token,
        [this, &job, &record](OutputStream, const std::string& line) {
            handle_line(job, line, record);
        });

    record.exit_code = result.exit_code;
    if (!result.error.empty()) {
        fail(record, ErrorKind::Execution, masker_.mask(result.error));
    } else if (result.cancelled) {
        record.status = Status::Cancelled;
        record.error = ErrorKind::Cancelled;
        record.error_detail = "Step was cancelled";
    } else if (result.timed_out) {
        fail(record, ErrorKind::Timeout, fmt::format("Step exceeded its timeout of {} ms", timeout.count()));
    } else if (result.exit_code != 0) {
        fail(record, ErrorKind::Execution, fmt::format("Process completed with exit code {}", result.exit_code));
    } else {
        record.status = Status::Success;
    }
}

void StepRunner::run_artifact_action(const Step& step, JobExecution& job, const EnvMap& env, StepRecord& record) {
    ArtifactAction action = artifact_action(step.uses);
    if (action == ArtifactAction::None) {
        throw std::runtime_error("Unsupported action: " + step.uses);
    }
    if (!artifacts_) {
        throw std::runtime_error("No artifact store configured for " + step.uses);
    }

    JobExprContext ctx(run_, job.instance, env, secrets_, job.token,
                       JobExprContext::Level::Step, job.steps_failed);
    const fs::path workdir = resolve_working_directory(step, ctx);

    if (action == ArtifactAction::Upload) {
        const std::string name = ExpressionEngine::interpolate(input(step, "name", "artifact"), ctx);
        const std::string path = ExpressionEngine::interpolate(input(step, "path"), ctx);
        if (path.empty()) {
            throw std::runtime_error("actions/upload-artifact requires a 'path' input");
        }
        fs::path source = fs::path(path).is_relative() ? workdir / path : fs::path(path);
        artifacts_->upload(name, source);
        handle_line(job, "Uploaded artifact '" + name + "' from " + source.string(), record);
    } else {
        const std::string name = ExpressionEngine::interpolate(input(step, "name"), ctx);
        if (name.empty()) {
            throw std::runtime_error("actions/download-artifact requires a 'name' input");
        }
        auto stored = artifacts_->download(name);
        if (!stored) {
            throw std::runtime_error("Artifact not found: " + name);
        }

        const std::string path = ExpressionEngine::interpolate(input(step, "path", "."), ctx);
        fs::path target = fs::path(path).is_relative() ? workdir / path : fs::path(path);
        fs::create_directories(target);
        if (fs::is_directory(*stored)) {
            fs::copy(*stored, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        } else {
            fs::copy_file(*stored, target / stored->filename(), fs::copy_options::overwrite_existing);
        }
        handle_line(job, "Downloaded artifact '" + name + "' to " + target.string(), record);
    }
    record.exit_code = 0;
    record.status = Status::Success;
}
