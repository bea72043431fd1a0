#pragma once

#include "Step.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using MatrixCombination = std::map<std::string, std::string>;

struct MatrixConfig {
    // Dimensions in declaration order
    std::vector<std::pair<std::string, std::vector<std::string>>> dimensions;
    std::vector<MatrixCombination> include;
    std::vector<MatrixCombination> exclude;

    bool empty() const {
        return dimensions.empty() && include.empty();
    }
};

struct ConcurrencyConfig {
    std::string group;              // May contain ${{ }} over env and matrix
    bool cancel_in_progress = true;

    bool enabled() const { return !group.empty(); }
};

struct Job {
    std::string key;                // Job identifier
    std::string name;               // Job name
    std::vector<std::string> needs; // Dependent jobs
    std::vector<Step> steps;        // Steps in the job

    std::string if_expr;
    ConcurrencyConfig concurrency;
    bool continue_on_error = false;
    std::optional<std::chrono::milliseconds> timeout;
    EnvMap env;
    std::vector<std::pair<std::string, std::string>> outputs;  // name -> expression

    MatrixConfig matrix;
    bool fail_fast = true;
    std::optional<size_t> max_parallel;

    Job() = default;
    Job(const std::string& key,
        const std::string& name,
        const std::vector<std::string>& needs,
        const std::vector<Step>& steps)
        : key(key), name(name), needs(needs), steps(steps) {}
};
