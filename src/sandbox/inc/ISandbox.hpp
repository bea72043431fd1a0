#pragma once

#include "CancellationToken.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

enum class OutputStream {
    Stdout,
    Stderr
};

// Receives each output line (without the trailing newline) as it arrives
using LineHandler = std::function<void(OutputStream, const std::string&)>;

struct SandboxRequest {
    std::string command;
    std::string shell = "/bin/sh";
    std::string working_directory = ".";
    std::map<std::string, std::string> env;     // complete child environment
    std::optional<std::chrono::milliseconds> timeout;
    std::string label;                          // used in log messages
};

struct SandboxResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string error;                          // launch failure, empty otherwise

    bool ok() const { return exit_code == 0 && !timed_out && !cancelled && error.empty(); }
};

class ISandbox {
public:
    virtual ~ISandbox() = default;

    // Blocks until the command finished, timed out or was cancelled. Must be safe
    // to call from several worker threads at once.
    virtual SandboxResult execute(const SandboxRequest& request,
                                  const CancellationToken& token,
                                  const LineHandler& on_line) = 0;
};
