#include "JobDAG.hpp"
#include "ExpressionEngine.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include "WorkflowErrors.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <queue>
#include <stdexcept>

namespace {

bool is_dimension(const MatrixConfig& matrix, const std::string& key) {
    for (const auto& [name, values] : matrix.dimensions) {
        if (name == key) return true;
    }
    return false;
}

// Every key of entry present in combination with the same value
bool matches_all(const MatrixCombination& combination, const MatrixCombination& entry) {
    for (const auto& [key, value] : entry) {
        auto it = combination.find(key);
        if (it == combination.end() || it->second != value) return false;
    }
    return true;
}

std::string interpolate_group(const Workflow& workflow, const Job& job, const MatrixCombination& matrix) {
    if (!job.concurrency.enabled()) return "";

    MapExprContext ctx;
    for (const auto& [key, value] : workflow.env) ctx.set("env", key, ExprValue(value));
    for (const auto& [key, value] : job.env) ctx.set("env", key, ExprValue(value));
    for (const auto& [key, value] : matrix) ctx.set("matrix", key, ExprValue(value));

    try {
        return ExpressionEngine::interpolate(job.concurrency.group, ctx);
    } catch (const EvalError& e) {
        throw GraphError("Invalid concurrency group of job '" + job.key + "': " + e.what());
    }
}

} // namespace

std::unique_ptr<JobDAG> JobDAG::build_execution_plan(const Workflow& workflow) {
    auto dag = std::make_unique<JobDAG>(PrivateTag{}, workflow);
    dag->check_needs();
    dag->check_cycles();
    dag->build();
    LogUtils::debug("Execution plan: {} job(s), {} instance(s)", workflow.jobs.size(), dag->size());
    return dag;
}

JobDAG::JobDAG(PrivateTag, const Workflow& workflow) : workflow_(workflow) {}

std::vector<MatrixCombination> JobDAG::expand_matrix(const MatrixConfig& matrix) {
    std::vector<MatrixCombination> combinations;

    // Cross product, first dimension varies slowest
    if (!matrix.dimensions.empty()) {
        combinations.emplace_back();
        for (const auto& [name, values] : matrix.dimensions) {
            std::vector<MatrixCombination> next;
            next.reserve(combinations.size() * values.size());
            for (const auto& partial : combinations) {
                for (const auto& value : values) {
                    MatrixCombination combination = partial;
                    combination[name] = value;
                    next.push_back(std::move(combination));
                }
            }
            combinations = std::move(next);
        }
    }

    for (const auto& entry : matrix.exclude) {
        combinations.erase(
            std::remove_if(combinations.begin(), combinations.end(),
                           [&entry](const MatrixCombination& c) { return matches_all(c, entry); }),
            combinations.end());
    }

    const size_t original_count = combinations.size();
    for (const auto& entry : matrix.include) {
        MatrixCombination on_dimensions;
        MatrixCombination extra;
        for (const auto& [key, value] : entry) {
            if (is_dimension(matrix, key)) {
                on_dimensions[key] = value;
            } else {
                extra[key] = value;
            }
        }

        bool merged = false;
        for (size_t i = 0; i < original_count; ++i) {
            if (!matches_all(combinations[i], on_dimensions)) continue;
            for (const auto& [key, value] : extra) combinations[i][key] = value;
            merged = true;
        }
        if (!merged) {
            combinations.push_back(entry);
        }
    }

    return combinations;
}

std::string JobDAG::instance_id(const Job& job, const MatrixCombination& combination) {
    if (combination.empty()) return job.key;

    std::vector<std::string> values;
    for (const auto& [name, dim_values] : job.matrix.dimensions) {
        auto it = combination.find(name);
        if (it != combination.end()) values.push_back(it->second);
    }
    for (const auto& [key, value] : combination) {
        if (!is_dimension(job.matrix, key)) values.push_back(value);
    }
    return job.key + " (" + StringUtils::join(values, ", ") + ")";
}

void JobDAG::check_needs() const {
    for (const auto& job : workflow_.jobs) {
        for (const auto& need : job.needs) {
            if (!workflow_.find_job(need)) {
                throw GraphError("Job '" + job.key + "' needs unknown job '" + need + "'");
            }
        }
    }
}

void JobDAG::check_cycles() const {
    // Kahn's algorithm over jobs; whatever keeps a positive in-degree is on or behind a cycle
    std::map<std::string, int> in_degree;
    std::map<std::string, std::vector<std::string>> successors;
    for (const auto& job : workflow_.jobs) {
        in_degree.emplace(job.key, 0);
    }
    for (const auto& job : workflow_.jobs) {
        std::set<std::string> unique_needs(job.needs.begin(), job.needs.end());
        for (const auto& need : unique_needs) {
            successors[need].push_back(job.key);
            in_degree[job.key]++;
        }
    }

    std::queue<std::string> ready;
    for (const auto& [key, degree] : in_degree) {
        if (degree == 0) ready.push(key);
    }
    size_t visited = 0;
    while (!ready.empty()) {
        std::string key = ready.front();
        ready.pop();
        ++visited;
        for (const auto& next : successors[key]) {
            if (--in_degree[next] == 0) ready.push(next);
        }
    }

    if (visited != in_degree.size()) {
        std::vector<std::string> involved;
        for (const auto& job : workflow_.jobs) {
            if (in_degree[job.key] > 0) involved.push_back(job.key);
        }
        throw GraphError("Dependency cycle detected among jobs: " + StringUtils::join(involved, ", "));
    }
}

void JobDAG::build() {
    for (const auto& job : workflow_.jobs) {
        std::vector<MatrixCombination> combinations;
        if (job.matrix.empty()) {
            combinations.emplace_back();
        } else {
            combinations = expand_matrix(job.matrix);
            if (combinations.empty()) {
                throw GraphError("Matrix of job '" + job.key + "' produces no combinations");
            }
        }

        auto& job_nodes = job_to_nodes_[job.key];
        for (const auto& combination : combinations) {
            auto node = std::make_unique<DAGNode>();
            node->instance.id = instance_id(job, combination);
            node->instance.job = &job;
            node->instance.matrix = combination;
            node->instance.concurrency_group = interpolate_group(workflow_, job, combination);
            node->instance.index = nodes_.size();

            if (id_to_node_.count(node->instance.id)) {
                throw GraphError("Duplicate job instance '" + node->instance.id + "'");
            }
            id_to_node_[node->instance.id] = node.get();
            job_nodes.push_back(node.get());
            nodes_.push_back(std::move(node));
        }
    }

    // Every instance depends on every instance of each needed job
    for (auto& node : nodes_) {
        std::set<std::string> unique_needs(node->instance.job->needs.begin(), node->instance.job->needs.end());
        for (const auto& need : unique_needs) {
            for (DAGNode* pred : job_to_nodes_.at(need)) {
                node->predecessors.push_back(pred);
                pred->successors.push_back(node.get());
            }
        }
    }
}

const DAGNode& JobDAG::node(const std::string& id) const {
    auto it = id_to_node_.find(id);
    if (it == id_to_node_.end()) {
        throw std::out_of_range("Unknown job instance: " + id);
    }
    return *it->second;
}

std::vector<std::string> JobDAG::ready_set(const std::set<std::string>& completed) const {
    std::vector<std::string> ready;
    for (const auto& node : nodes_) {
        if (completed.count(node->instance.id)) continue;
        bool all_done = std::all_of(node->predecessors.begin(), node->predecessors.end(),
                                    [&completed](const DAGNode* p) { return completed.count(p->instance.id) != 0; });
        if (all_done) ready.push_back(node->instance.id);
    }
    return ready;
}

std::vector<std::string> JobDAG::topological_order() const {
    std::vector<size_t> in_degree(nodes_.size());
    for (const auto& node : nodes_) {
        in_degree[node->instance.index] = static_cast<size_t>(node->predecessors.size());
    }

    // Lowest plan index first among the currently available
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (in_degree[i] == 0) ready.push(i);
    }

    std::vector<std::string> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        const DAGNode& current = *nodes_[ready.top()];
        ready.pop();
        order.push_back(current.instance.id);
        for (const DAGNode* next : current.successors) {
            if (--in_degree[next->instance.index] == 0) ready.push(next->instance.index);
        }
    }
    return order;
}

std::vector<const JobInstance*> JobDAG::instances() const {
    std::vector<const JobInstance*> result;
    result.reserve(nodes_.size());
    for (const auto& node : nodes_) result.push_back(&node->instance);
    return result;
}

const JobInstance& JobDAG::instance(const std::string& id) const {
    return node(id).instance;
}

std::vector<const JobInstance*> JobDAG::instances_of(const std::string& job_id) const {
    std::vector<const JobInstance*> result;
    auto it = job_to_nodes_.find(job_id);
    if (it == job_to_nodes_.end()) return result;
    for (const DAGNode* n : it->second) result.push_back(&n->instance);
    return result;
}

std::vector<std::string> JobDAG::dependencies(const std::string& id) const {
    std::vector<std::string> result;
    for (const DAGNode* p : node(id).predecessors) result.push_back(p->instance.id);
    return result;
}

std::vector<std::string> JobDAG::dependents(const std::string& id) const {
    std::vector<std::string> result;
    for (const DAGNode* s : node(id).successors) result.push_back(s->instance.id);
    return result;
}
