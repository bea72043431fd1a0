#pragma once

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "Workflow.hpp"

// One job bound to one matrix combination
struct JobInstance {
    std::string id;                       // "<job>" or "<job> (<v1>, <v2>, ...)"
    const Job* job = nullptr;
    MatrixCombination matrix;
    std::string concurrency_group;        // Interpolated, empty when none
    size_t index = 0;                     // Position in plan order
};

// DAG node structure
struct DAGNode {
    JobInstance instance;
    std::vector<DAGNode*> predecessors;   // Instances this one needs
    std::vector<DAGNode*> successors;     // Instances needing this one
};

// Executable job graph: matrix-expanded instances and their needs edges.
// Owns a copy of the workflow so instances can point into it.
class JobDAG {
    struct PrivateTag {};

public:
    JobDAG(PrivateTag, const Workflow& workflow);

    // Throws GraphError on unresolved needs, cycles or empty matrices
    static std::unique_ptr<JobDAG> build_execution_plan(const Workflow& workflow);

    JobDAG(const JobDAG&) = delete;
    JobDAG& operator=(const JobDAG&) = delete;

    // Instances not in completed whose dependencies all are, in plan order
    std::vector<std::string> ready_set(const std::set<std::string>& completed) const;

    std::vector<std::string> topological_order() const;

    std::vector<const JobInstance*> instances() const;
    const JobInstance& instance(const std::string& id) const;
    std::vector<const JobInstance*> instances_of(const std::string& job_id) const;
    std::vector<std::string> dependencies(const std::string& id) const;
    std::vector<std::string> dependents(const std::string& id) const;

    bool contains(const std::string& id) const { return id_to_node_.count(id) != 0; }
    size_t size() const { return nodes_.size(); }
    const Workflow& workflow() const { return workflow_; }

    // Matrix combinations in expansion order, include/exclude applied
    static std::vector<MatrixCombination> expand_matrix(const MatrixConfig& matrix);

    static std::string instance_id(const Job& job, const MatrixCombination& combination);

private:
    void build();
    void check_needs() const;
    void check_cycles() const;
    const DAGNode& node(const std::string& id) const;

    Workflow workflow_;
    std::vector<std::unique_ptr<DAGNode>> nodes_;                   // Storage for all nodes, plan order
    std::unordered_map<std::string, DAGNode*> id_to_node_;          // Mapping from instance id to node
    std::unordered_map<std::string, std::vector<DAGNode*>> job_to_nodes_;
};
