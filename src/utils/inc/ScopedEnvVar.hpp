#pragma once

#include <map>
#include <optional>
#include <string>

// Sets (or unsets, with std::nullopt) a process environment variable for the
// lifetime of the object
class ScopedEnvVar {
private:
    std::string name_;
    std::string old_value_;
    bool had_old_value_;

public:
    explicit ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value);

    ~ScopedEnvVar();

    void restore();

    // Copy of the current process environment
    static std::map<std::string, std::string> snapshot();

    // Deleted copy semantics
    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;
};
