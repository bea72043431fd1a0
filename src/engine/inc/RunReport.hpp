#pragma once

#include "RunContext.hpp"
#include "SecretMasker.hpp"
#include <nlohmann/json.hpp>
#include <string>

// JSON view of a finished (or in-progress) run. Outputs and logs pass through the
// masker once more, so values masked late in the run are hidden everywhere.
class RunReport {
public:
    static nlohmann::json to_json(const RunContext& run, const SecretMasker& masker);

    // Throws std::runtime_error when the file cannot be written
    static void write(const std::string& path, const RunContext& run, const SecretMasker& masker);
};
