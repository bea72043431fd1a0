#pragma once

#include "Step.hpp"
#include <chrono>
#include <string>
#include <vector>

struct GlobalConfig {
    bool verbose = false;
    std::string log_dir = "log/";
    std::string workflow_file;
    std::string working_directory = ".";
    std::string artifact_dir = ".flowexec/artifacts";
    std::string shell = "/bin/sh";
    bool fail_fast = false;
    std::chrono::milliseconds default_timeout = std::chrono::minutes(360);
    std::vector<std::string> secrets;       // Secret names resolved before the run
    std::string secrets_file;               // YAML map of name -> value
    EnvMap env;                             // Extra workflow-level env
    std::string report_file;
    bool validate_only = false;
};
