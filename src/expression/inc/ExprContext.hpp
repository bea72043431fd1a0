#pragma once

#include "ExprValue.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Data source for expression evaluation.
//
// Paths are the dotted/bracketed segments of a property access, e.g.
// steps.build.outputs['version'] -> {"steps", "build", "outputs", "version"}.
// Implementations must not change observable state while being read and may throw
// EvalError for references that are not yet readable.
class ExprContext {
public:
    virtual ~ExprContext() = default;

    // Scalar at path, std::nullopt when undefined
    virtual std::optional<ExprValue> lookup(const std::vector<std::string>& path) const = 0;

    // Values below path in a stable order, std::nullopt when path is not a collection
    virtual std::optional<std::vector<ExprValue>> lookup_collection(const std::vector<std::string>& path) const {
        (void)path;
        return std::nullopt;
    }

    // Status functions
    virtual bool status_success() const = 0;
    virtual bool status_failure() const = 0;
    virtual bool status_cancelled() const = 0;
};

// Context backed by plain maps: namespace -> dotted key -> value.
// Used where no run state exists yet (plan building, tests).
class MapExprContext : public ExprContext {
public:
    void set(const std::string& ns, const std::string& key, ExprValue value);
    void set_status(bool success, bool failure, bool cancelled);

    std::optional<ExprValue> lookup(const std::vector<std::string>& path) const override;
    std::optional<std::vector<ExprValue>> lookup_collection(const std::vector<std::string>& path) const override;

    bool status_success() const override { return success_; }
    bool status_failure() const override { return failure_; }
    bool status_cancelled() const override { return cancelled_; }

private:
    std::map<std::string, std::map<std::string, ExprValue>> values_;
    bool success_ = true;
    bool failure_ = false;
    bool cancelled_ = false;
};
