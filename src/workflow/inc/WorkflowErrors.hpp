#pragma once

#include <stdexcept>
#include <string>

// Malformed workflow document; nothing executes
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& path, const std::string& message)
        : std::runtime_error(path.empty() ? message : path + ": " + message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Cycle or unresolved dependency; nothing executes
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Expression failure; fails the owning step or job only
class EvalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Error kinds recorded in the run context
enum class ErrorKind {
    None,
    Eval,
    Execution,
    Timeout,
    Cancelled
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:      return "none";
        case ErrorKind::Eval:      return "EvalError";
        case ErrorKind::Execution: return "ExecutionError";
        case ErrorKind::Timeout:   return "TimeoutError";
        case ErrorKind::Cancelled: return "CancelledError";
    }
    return "unknown";
}
