#include "ScopedEnvVar.hpp"
#include "LogUtils.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unistd.h>

extern char** environ;

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value)
    : name_(name), had_old_value_(false) {

    if (name_.empty()) {
        throw std::invalid_argument("ScopedEnvVar: environment variable name cannot be empty");
    }

    const char* old = getenv(name_.c_str());
    if (old != nullptr) {
        old_value_ = old;
        had_old_value_ = true;
    }

    if (new_value) {
        if (setenv(name_.c_str(), new_value->c_str(), 1) != 0) {
            throw std::runtime_error("ScopedEnvVar: setenv failed for " + name_);
        }
    } else if (unsetenv(name_.c_str()) != 0) {
        throw std::runtime_error("ScopedEnvVar: unsetenv failed for " + name_);
    }
}

ScopedEnvVar::~ScopedEnvVar() {
    try {
        restore();
    } catch (const std::exception& e) {
        LogUtils::warn("Failed to restore environment variable {}: {}", name_, e.what());
    }
}

void ScopedEnvVar::restore() {
    if (had_old_value_) {
        if (setenv(name_.c_str(), old_value_.c_str(), 1) != 0) {
            throw std::runtime_error("ScopedEnvVar: setenv failed (restore old)");
        }
    } else {
        if (unsetenv(name_.c_str()) != 0) {
            throw std::runtime_error("ScopedEnvVar: unsetenv failed");
        }
    }
}

std::map<std::string, std::string> ScopedEnvVar::snapshot() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        size_t pos = kv.find('=');
        if (pos == std::string::npos) continue;
        env[kv.substr(0, pos)] = kv.substr(pos + 1);
    }
    return env;
}
