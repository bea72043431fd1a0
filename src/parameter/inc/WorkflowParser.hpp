#pragma once

#include "Workflow.hpp"
#include "WorkflowErrors.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

// Workflow YAML -> Workflow. Every method throws ParseError carrying the path of
// the offending node, e.g. "jobs.build.steps[2].env".
class WorkflowParser {
public:
    static Workflow parse(const std::string& raw);
    static Workflow parse_file(const std::string& file_path);
    static Workflow parse_node(const YAML::Node& root);
};
