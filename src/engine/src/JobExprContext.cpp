#include "JobExprContext.hpp"
#include <algorithm>
#include <set>

namespace {

std::optional<ExprValue> find_value(const std::map<std::string, std::string>& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return ExprValue(it->second);
}

std::vector<ExprValue> all_values(const std::map<std::string, std::string>& values) {
    std::vector<ExprValue> result;
    for (const auto& [key, value] : values) result.emplace_back(value);
    return result;
}

} // namespace

JobExprContext::JobExprContext(const RunContext& run,
                               const JobInstance& instance,
                               EnvMap env,
                               const SecretMap& secrets,
                               const CancellationToken& token,
                               Level level,
                               bool steps_failed)
    : run_(run), instance_(instance), env_(std::move(env)), secrets_(secrets),
      token_(token), level_(level), steps_failed_(steps_failed) {}

bool JobExprContext::needs_job(const std::string& job_key) const {
    const auto& needs = instance_.job->needs;
    return std::find(needs.begin(), needs.end(), job_key) != needs.end();
}

std::optional<ExprValue> JobExprContext::lookup(const std::vector<std::string>& path) const {
    if (path.size() < 2) return std::nullopt;
    const std::string& ns = path[0];

    if (ns == "env" && path.size() == 2) return find_value(env_, path[1]);
    if (ns == "matrix" && path.size() == 2) return find_value(instance_.matrix, path[1]);
    if (ns == "secrets" && path.size() == 2) return find_value(secrets_, path[1]);
    if (ns == "steps") return lookup_steps(path);
    if (ns == "needs") {
        if (!needs_job(path[1])) return std::nullopt;
        return lookup_job(path[1], std::vector<std::string>(path.begin() + 2, path.end()));
    }
    if (ns == "job") {
        if (!run_.plan().workflow().find_job(path[1])) return std::nullopt;
        return lookup_job(path[1], std::vector<std::string>(path.begin() + 2, path.end()));
    }
    return std::nullopt;
}

std::optional<ExprValue> JobExprContext::lookup_steps(const std::vector<std::string>& path) const {
    if (path.size() < 3) return std::nullopt;

    auto step = run_.step(instance_.id, path[1]);
    if (!step) return std::nullopt;

    const std::string& field = path[2];
    if (field == "outputs" && path.size() == 4) {
        return find_value(step->outputs, path[3]);
    }
    if (path.size() == 3 && (field == "outcome" || field == "conclusion")) {
        Status status = field == "outcome" ? step->status : step->conclusion;
        if (!is_terminal(status)) return ExprValue("");
        return ExprValue(to_string(status));
    }
    return std::nullopt;
}

// result and outputs of a job aggregated over its instances; all must be terminal
std::optional<ExprValue> JobExprContext::lookup_job(const std::string& job_key,
                                                    const std::vector<std::string>& rest) const {
    if (rest.empty()) return std::nullopt;

    std::vector<JobRecord> records;
    for (const JobInstance* inst : run_.plan().instances_of(job_key)) {
        JobRecord rec = run_.job(inst->id);
        if (!is_terminal(rec.status)) {
            throw EvalError("Job '" + job_key + "' has not finished yet (instance '" + inst->id + "' is " +
                            to_string(rec.status) + ")");
        }
        records.push_back(std::move(rec));
    }

    if (rest[0] == "result" && rest.size() == 1) {
        bool any_failure = false, any_cancelled = false, all_skipped = !records.empty();
        for (const auto& rec : records) {
            if (rec.status == Status::Failure) any_failure = true;
            if (rec.status == Status::Cancelled) any_cancelled = true;
            if (rec.status != Status::Skipped) all_skipped = false;
        }
        if (any_failure) return ExprValue("failure");
        if (any_cancelled) return ExprValue("cancelled");
        if (all_skipped) return ExprValue("skipped");
        return ExprValue("success");
    }

    if (rest[0] == "outputs" && rest.size() == 2) {
        // Matrix jobs: the last instance in plan order that set the output
        std::optional<ExprValue> value;
        for (const auto& rec : records) {
            if (auto v = find_value(rec.outputs, rest[1])) value = v;
        }
        return value;
    }
    return std::nullopt;
}

std::optional<std::vector<ExprValue>> JobExprContext::lookup_collection(const std::vector<std::string>& path) const {
    if (path.empty()) return std::nullopt;
    const std::string& ns = path[0];

    // env, env.*, matrix, matrix.*
    if (path.size() == 1 || (path.size() == 2 && path[1] == "*")) {
        if (ns == "env") return all_values(env_);
        if (ns == "matrix") return all_values(instance_.matrix);
        return std::nullopt;
    }

    // needs.*.<rest> and steps.*.<rest>
    if (path[1] == "*" && (ns == "needs" || ns == "steps")) {
        std::vector<std::string> keys;
        if (ns == "needs") {
            std::set<std::string> seen;
            for (const auto& need : instance_.job->needs) {
                if (seen.insert(need).second) keys.push_back(need);
            }
        } else {
            for (const auto& step : run_.job(instance_.id).steps) {
                if (step.key[0] != '#') keys.push_back(step.key);
            }
        }
        std::vector<ExprValue> items;
        for (const auto& key : keys) {
            std::vector<std::string> concrete = path;
            concrete[1] = key;
            if (auto value = lookup(concrete)) items.push_back(*value);
        }
        return items;
    }

    if (path.size() == 3 && path[2] == "outputs") {
        if (ns == "steps") {
            auto step = run_.step(instance_.id, path[1]);
            if (step) return all_values(step->outputs);
        }
        if (ns == "needs" && needs_job(path[1])) {
            std::map<std::string, std::string> merged;
            for (const JobInstance* inst : run_.plan().instances_of(path[1])) {
                for (const auto& [key, value] : run_.job(inst->id).outputs) merged[key] = value;
            }
            return all_values(merged);
        }
    }
    return std::nullopt;
}

bool JobExprContext::ancestor_failed(const std::string& id, bool count_continue_on_error) const {
    std::set<std::string> visited;
    std::vector<std::string> pending = run_.plan().dependencies(id);
    while (!pending.empty()) {
        std::string current = pending.back();
        pending.pop_back();
        if (!visited.insert(current).second) continue;

        JobRecord rec = run_.job(current);
        if (rec.status == Status::Failure && (count_continue_on_error || !rec.continue_on_error)) return true;
        for (auto& dep : run_.plan().dependencies(current)) pending.push_back(dep);
    }
    return false;
}

bool JobExprContext::status_success() const {
    if (token_.is_cancelled()) return false;
    if (level_ == Level::Step) return !steps_failed_;

    // Skipped needs are acceptable, a failure further upstream still counts
    for (const auto& dep : run_.plan().dependencies(instance_.id)) {
        if (run_.job(dep).blocks_dependents()) return false;
    }
    return !ancestor_failed(instance_.id, false);
}

bool JobExprContext::status_failure() const {
    if (level_ == Level::Step) return steps_failed_;
    return ancestor_failed(instance_.id, true);
}

bool JobExprContext::status_cancelled() const {
    return token_.is_cancelled();
}
