#include "WorkflowParser.hpp"
#include "ConfigParser.hpp"
#include "ExpressionEngine.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <set>

namespace {

std::string child_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string index_path(const std::string& parent, size_t index) {
    return fmt::format("{}[{}]", parent, index);
}

template <typename T>
T scalar_as(const YAML::Node& node, const std::string& path, const char* expected) {
    if (!node.IsScalar()) {
        throw ParseError(path, fmt::format("expected {}", expected));
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ParseError(path, fmt::format("expected {}, got '{}'", expected, node.Scalar()));
    }
}

std::string as_string(const YAML::Node& node, const std::string& path) {
    return scalar_as<std::string>(node, path, "a string");
}

bool as_bool(const YAML::Node& node, const std::string& path) {
    return scalar_as<bool>(node, path, "a boolean");
}

void require_map(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw ParseError(path, "expected a mapping");
    }
}

void check_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& path) {
    require_map(node, path);
    try {
        YAML::check_unknown_keys(node, valid_keys, path.empty() ? "workflow" : path);
    } catch (const std::runtime_error& e) {
        throw ParseError(path, e.what());
    }
}

// Ordered (key, node) pairs of a mapping; duplicate keys are rejected
std::vector<std::pair<std::string, YAML::Node>> map_entries(const YAML::Node& node, const std::string& path) {
    require_map(node, path);
    std::vector<std::pair<std::string, YAML::Node>> entries;
    std::set<std::string> seen;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = as_string(it->first, path);
        if (!seen.insert(key).second) {
            throw ParseError(child_path(path, key), "duplicate key");
        }
        entries.emplace_back(key, it->second);
    }
    return entries;
}

void check_template(const std::string& text, const std::string& path) {
    try {
        ExpressionEngine::validate_template(text);
    } catch (const EvalError& e) {
        throw ParseError(path, e.what());
    }
}

void check_condition(const std::string& condition, const std::string& path) {
    try {
        ExpressionEngine::validate_condition(condition);
    } catch (const EvalError& e) {
        throw ParseError(path, e.what());
    }
}

EnvMap parse_env(const YAML::Node& node, const std::string& path) {
    EnvMap env;
    for (const auto& [key, value] : map_entries(node, path)) {
        std::string entry_path = child_path(path, key);
        if (!StringUtils::is_identifier(key)) {
            throw ParseError(entry_path, "environment variable names must match [A-Za-z_][A-Za-z0-9_]*");
        }
        std::string text = value.IsNull() ? "" : as_string(value, entry_path);
        check_template(text, entry_path);
        env[key] = text;
    }
    return env;
}

std::chrono::milliseconds parse_timeout(const YAML::Node& node, const std::string& path) {
    double minutes = scalar_as<double>(node, path, "a number of minutes");
    auto duration = TimestampUtils::minutes_to_duration(minutes);
    if (!duration) {
        throw ParseError(path, "timeout-minutes must be positive");
    }
    return *duration;
}

MatrixCombination parse_combination(const YAML::Node& node, const std::string& path) {
    MatrixCombination combination;
    for (const auto& [key, value] : map_entries(node, path)) {
        combination[key] = as_string(value, child_path(path, key));
    }
    if (combination.empty()) {
        throw ParseError(path, "matrix entry must not be empty");
    }
    return combination;
}

std::vector<MatrixCombination> parse_combination_list(const YAML::Node& node, const std::string& path) {
    if (!node.IsSequence()) {
        throw ParseError(path, "expected a sequence of mappings");
    }
    std::vector<MatrixCombination> list;
    for (size_t i = 0; i < node.size(); ++i) {
        list.push_back(parse_combination(node[i], index_path(path, i)));
    }
    return list;
}

MatrixConfig parse_matrix(const YAML::Node& node, const std::string& path) {
    MatrixConfig matrix;
    for (const auto& [key, value] : map_entries(node, path)) {
        std::string entry_path = child_path(path, key);
        if (key == "include") {
            matrix.include = parse_combination_list(value, entry_path);
        } else if (key == "exclude") {
            matrix.exclude = parse_combination_list(value, entry_path);
        } else {
            if (!value.IsSequence() || value.size() == 0) {
                throw ParseError(entry_path, "matrix dimension must be a non-empty sequence of scalars");
            }
            std::vector<std::string> values;
            for (size_t i = 0; i < value.size(); ++i) {
                values.push_back(as_string(value[i], index_path(entry_path, i)));
            }
            matrix.dimensions.emplace_back(key, std::move(values));
        }
    }
    return matrix;
}

void parse_strategy(const YAML::Node& node, const std::string& path, Job& job) {
    static const std::set<std::string> valid_keys = {"matrix", "fail-fast", "max-parallel"};
    check_keys(node, valid_keys, path);

    if (node["matrix"]) {
        job.matrix = parse_matrix(node["matrix"], child_path(path, "matrix"));
    }
    if (node["fail-fast"]) {
        job.fail_fast = as_bool(node["fail-fast"], child_path(path, "fail-fast"));
    }
    if (node["max-parallel"]) {
        std::string entry_path = child_path(path, "max-parallel");
        int max_parallel = scalar_as<int>(node["max-parallel"], entry_path, "an integer");
        if (max_parallel < 1) {
            throw ParseError(entry_path, "max-parallel must be at least 1");
        }
        job.max_parallel = static_cast<size_t>(max_parallel);
    }
}

ConcurrencyConfig parse_concurrency(const YAML::Node& node, const std::string& path) {
    ConcurrencyConfig concurrency;
    if (node.IsScalar()) {
        concurrency.group = as_string(node, path);
    } else {
        static const std::set<std::string> valid_keys = {"group", "cancel-in-progress"};
        check_keys(node, valid_keys, path);
        if (!node["group"]) {
            throw ParseError(path, "missing required key 'group'");
        }
        concurrency.group = as_string(node["group"], child_path(path, "group"));
        if (node["cancel-in-progress"]) {
            concurrency.cancel_in_progress = as_bool(node["cancel-in-progress"], child_path(path, "cancel-in-progress"));
        }
    }
    if (StringUtils::trimmed(concurrency.group).empty()) {
        throw ParseError(path, "concurrency group must not be empty");
    }
    check_template(concurrency.group, path);
    return concurrency;
}

Step parse_step(const YAML::Node& node, const std::string& path) {
    static const std::set<std::string> valid_keys = {
        "id", "name", "run", "uses", "with", "env", "if", "continue-on-error",
        "timeout-minutes", "shell", "working-directory", "retries"
    };
    check_keys(node, valid_keys, path);

    Step step;
    if (node["id"]) {
        std::string id_path = child_path(path, "id");
        step.id = as_string(node["id"], id_path);
        if (!StringUtils::is_key_identifier(step.id)) {
            throw ParseError(id_path, fmt::format("invalid step id '{}'", step.id));
        }
    }
    if (node["name"]) {
        step.name = as_string(node["name"], child_path(path, "name"));
        check_template(step.name, child_path(path, "name"));
    }

    bool has_run = static_cast<bool>(node["run"]);
    bool has_uses = static_cast<bool>(node["uses"]);
    if (has_run == has_uses) {
        throw ParseError(path, "a step needs exactly one of 'run' or 'uses'");
    }
    if (has_run) {
        step.run = as_string(node["run"], child_path(path, "run"));
        if (StringUtils::trimmed(step.run).empty()) {
            throw ParseError(child_path(path, "run"), "command must not be empty");
        }
        check_template(step.run, child_path(path, "run"));
        if (node["with"]) {
            throw ParseError(child_path(path, "with"), "'with' is only valid together with 'uses'");
        }
    } else {
        step.uses = as_string(node["uses"], child_path(path, "uses"));
        if (StringUtils::trimmed(step.uses).empty()) {
            throw ParseError(child_path(path, "uses"), "action reference must not be empty");
        }
    }

    if (node["with"]) {
        std::string with_path = child_path(path, "with");
        for (const auto& [key, value] : map_entries(node["with"], with_path)) {
            std::string input = value.IsNull() ? "" : as_string(value, child_path(with_path, key));
            check_template(input, child_path(with_path, key));
            step.with[key] = input;
        }
    }
    if (node["env"]) {
        step.env = parse_env(node["env"], child_path(path, "env"));
    }
    if (node["if"]) {
        step.if_expr = as_string(node["if"], child_path(path, "if"));
        check_condition(step.if_expr, child_path(path, "if"));
    }
    if (node["continue-on-error"]) {
        step.continue_on_error = as_bool(node["continue-on-error"], child_path(path, "continue-on-error"));
    }
    if (node["timeout-minutes"]) {
        step.timeout = parse_timeout(node["timeout-minutes"], child_path(path, "timeout-minutes"));
    }
    if (node["shell"]) {
        step.shell = as_string(node["shell"], child_path(path, "shell"));
    }
    if (node["working-directory"]) {
        step.working_directory = as_string(node["working-directory"], child_path(path, "working-directory"));
        check_template(step.working_directory, child_path(path, "working-directory"));
    }
    if (node["retries"]) {
        std::string retries_path = child_path(path, "retries");
        step.retries = scalar_as<int>(node["retries"], retries_path, "an integer");
        if (step.retries < 0) {
            throw ParseError(retries_path, "retries must not be negative");
        }
    }
    return step;
}

Job parse_job(const std::string& key, const YAML::Node& node, const std::string& path, std::vector<std::string>& warnings) {
    static const std::set<std::string> valid_keys = {
        "name", "needs", "if", "steps", "env", "outputs", "concurrency",
        "continue-on-error", "timeout-minutes", "strategy", "runs-on"
    };
    check_keys(node, valid_keys, path);

    Job job;
    job.key = key;
    job.name = key;
    if (node["name"]) {
        job.name = as_string(node["name"], child_path(path, "name"));
    }

    if (node["needs"]) {
        const YAML::Node& needs = node["needs"];
        std::string needs_path = child_path(path, "needs");
        if (needs.IsScalar()) {
            job.needs.push_back(as_string(needs, needs_path));
        } else if (needs.IsSequence()) {
            for (size_t i = 0; i < needs.size(); ++i) {
                std::string dep = as_string(needs[i], index_path(needs_path, i));
                if (std::find(job.needs.begin(), job.needs.end(), dep) == job.needs.end()) {
                    job.needs.push_back(dep);
                }
            }
        } else {
            throw ParseError(needs_path, "expected a job id or a sequence of job ids");
        }
    }

    if (node["if"]) {
        job.if_expr = as_string(node["if"], child_path(path, "if"));
        check_condition(job.if_expr, child_path(path, "if"));
    }
    if (node["env"]) {
        job.env = parse_env(node["env"], child_path(path, "env"));
    }
    if (node["outputs"]) {
        std::string outputs_path = child_path(path, "outputs");
        for (const auto& [name, value] : map_entries(node["outputs"], outputs_path)) {
            std::string entry_path = child_path(outputs_path, name);
            if (!StringUtils::is_key_identifier(name)) {
                throw ParseError(entry_path, fmt::format("invalid output name '{}'", name));
            }
            std::string expression = as_string(value, entry_path);
            check_template(expression, entry_path);
            job.outputs.emplace_back(name, expression);
        }
    }
    if (node["concurrency"]) {
        job.concurrency = parse_concurrency(node["concurrency"], child_path(path, "concurrency"));
    }
    if (node["continue-on-error"]) {
        job.continue_on_error = as_bool(node["continue-on-error"], child_path(path, "continue-on-error"));
    }
    if (node["timeout-minutes"]) {
        job.timeout = parse_timeout(node["timeout-minutes"], child_path(path, "timeout-minutes"));
    }
    if (node["strategy"]) {
        parse_strategy(node["strategy"], child_path(path, "strategy"), job);
    }

    if (node["steps"]) {
        const YAML::Node& steps = node["steps"];
        std::string steps_path = child_path(path, "steps");
        if (!steps.IsSequence()) {
            throw ParseError(steps_path, "expected a sequence of steps");
        }

        std::set<std::string> ids;
        std::map<std::string, size_t> names;
        for (size_t i = 0; i < steps.size(); ++i) {
            std::string step_path = index_path(steps_path, i);
            Step step = parse_step(steps[i], step_path);
            if (!step.id.empty() && !ids.insert(step.id).second) {
                throw ParseError(child_path(step_path, "id"), fmt::format("duplicate step id '{}'", step.id));
            }
            auto [it, inserted] = names.emplace(step.display_name(), i);
            if (!inserted) {
                warnings.push_back(fmt::format("{}: step name '{}' is also used by {}",
                                               step_path, it->first, index_path(steps_path, it->second)));
            }
            job.steps.push_back(std::move(step));
        }
    }
    return job;
}

void parse_defaults(const YAML::Node& node, Workflow& workflow) {
    static const std::set<std::string> valid_keys = {"run"};
    check_keys(node, valid_keys, "defaults");
    if (!node["run"]) return;

    static const std::set<std::string> run_keys = {"shell", "working-directory"};
    check_keys(node["run"], run_keys, "defaults.run");
    if (node["run"]["shell"]) {
        workflow.default_shell = as_string(node["run"]["shell"], "defaults.run.shell");
    }
    if (node["run"]["working-directory"]) {
        workflow.default_working_directory =
            as_string(node["run"]["working-directory"], "defaults.run.working-directory");
    }
}

void collect_secret_refs(const YAML::Node& node, std::set<std::string>& refs) {
    if (node.IsScalar()) {
        for (const auto& name : ExpressionEngine::referenced_names(node.Scalar(), "secrets")) {
            refs.insert(name);
        }
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            collect_secret_refs(item, refs);
        }
    } else if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            collect_secret_refs(it->second, refs);
        }
    }
}

} // namespace

Workflow WorkflowParser::parse(const std::string& raw) {
    YAML::Node root;
    try {
        root = YAML::Load(raw);
    } catch (const YAML::ParserException& e) {
        throw ParseError("", fmt::format("invalid YAML at line {}, column {}: {}",
                                         e.mark.line + 1, e.mark.column + 1, e.msg));
    }
    return parse_node(root);
}

Workflow WorkflowParser::parse_file(const std::string& file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file_path);
    } catch (const YAML::BadFile&) {
        throw ParseError("", "cannot read workflow file '" + file_path + "'");
    } catch (const YAML::ParserException& e) {
        throw ParseError("", fmt::format("invalid YAML in '{}' at line {}, column {}: {}",
                                         file_path, e.mark.line + 1, e.mark.column + 1, e.msg));
    }
    return parse_node(root);
}

Workflow WorkflowParser::parse_node(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        throw ParseError("", "workflow document is empty");
    }
    static const std::set<std::string> valid_keys = {
        "name", "run-name", "on", "env", "defaults", "jobs"
    };
    check_keys(root, valid_keys, "");

    Workflow workflow;
    if (root["name"]) {
        workflow.name = as_string(root["name"], "name");
    }
    if (root["run-name"]) {
        workflow.run_name = as_string(root["run-name"], "run-name");
        check_template(workflow.run_name, "run-name");
    }
    if (root["on"]) {
        workflow.on = YAML::Clone(root["on"]);
    }
    if (root["env"]) {
        workflow.env = parse_env(root["env"], "env");
    }
    if (root["defaults"]) {
        parse_defaults(root["defaults"], workflow);
    }

    if (!root["jobs"]) {
        throw ParseError("jobs", "a workflow needs at least one job");
    }
    auto jobs = map_entries(root["jobs"], "jobs");
    if (jobs.empty()) {
        throw ParseError("jobs", "a workflow needs at least one job");
    }

    std::map<std::string, std::string> display_names;
    for (const auto& [key, node] : jobs) {
        std::string path = child_path("jobs", key);
        if (!StringUtils::is_key_identifier(key)) {
            throw ParseError(path, fmt::format("invalid job id '{}'", key));
        }
        Job job = parse_job(key, node, path, workflow.warnings);

        auto [it, inserted] = display_names.emplace(job.name, key);
        if (!inserted) {
            workflow.warnings.push_back(fmt::format("{}: job name '{}' is also used by jobs.{}",
                                                    path, job.name, it->second));
        }
        if (job.steps.empty()) {
            workflow.warnings.push_back(fmt::format("{}: job has no steps", path));
        }
        workflow.jobs.push_back(std::move(job));
    }

    collect_secret_refs(root, workflow.secret_refs);
    return workflow;
}
