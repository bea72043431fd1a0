#pragma once

#include "GlobalConfig.hpp"
#include "Workflow.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    int concurrency = 4;
    Workflow workflow;
};
