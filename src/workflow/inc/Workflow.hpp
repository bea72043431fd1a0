#pragma once

#include "Job.hpp"
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

struct Workflow {
    std::string name;
    std::string run_name;
    std::vector<Job> jobs;           // Declaration order
    EnvMap env;
    YAML::Node on;                   // Trigger metadata, passed through untouched
    std::string default_shell;
    std::string default_working_directory;
    std::set<std::string> secret_refs;  // Names used as secrets.<name>
    std::vector<std::string> warnings;  // Non-fatal findings of the parser

    const Job* find_job(const std::string& key) const {
        for (const auto& job : jobs) {
            if (job.key == key) return &job;
        }
        return nullptr;
    }
};
