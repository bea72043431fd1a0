#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

using EnvMap = std::map<std::string, std::string>;

struct Step {
    std::string id;                 // Optional, used for output references
    std::string name;               // Step name
    std::string run;                // Shell command
    std::string uses;               // Delegated action reference
    std::map<std::string, std::string> with;  // Action inputs (may contain expressions)
    EnvMap env;
    std::string if_expr;
    bool continue_on_error = false;
    std::optional<std::chrono::milliseconds> timeout;
    std::string shell;
    std::string working_directory;
    int retries = 0;                // Extra attempts after a failed one

    bool is_run() const { return !run.empty(); }

    std::string display_name() const {
        if (!name.empty()) return name;
        if (!id.empty()) return id;
        if (!uses.empty()) return uses;
        return "Run " + run.substr(0, run.find('\n'));
    }
};
