#pragma once
#include "ExprContext.hpp"
#include "ExprValue.hpp"
#include <memory>
#include <set>
#include <string>

struct ExprNode;

// Workflow expression: the text between "${{" and "}}", or a bare `if:` condition.
// Parsing happens once in the constructor; evaluation is read-only on both the
// expression and the context.
class ExpressionEngine {
public:
    using Result = ExprValue;

    // Throws EvalError on syntax errors
    explicit ExpressionEngine(const std::string& expression);
    ~ExpressionEngine() = default;

    Result evaluate(const ExprContext& context) const;

    // True when the expression calls success(), failure(), always() or cancelled()
    bool uses_status_function() const;

    const std::string& text() const { return expression_; }

    // Replace every ${{ ... }} span in text by the string form of its value
    static std::string interpolate(const std::string& text, const ExprContext& context);

    // Evaluate an `if:` condition. An empty condition means success(); a condition
    // without a status function is combined as success() && (condition).
    static bool evaluate_condition(const std::string& condition, const ExprContext& context);

    static bool contains_expression(const std::string& text);

    // Syntax checks without evaluation; throw EvalError
    static void validate_template(const std::string& text);
    static void validate_condition(const std::string& condition);

    // Names referenced as <root>.<name> or <root>['name'] inside ${{ }} spans of text
    static std::set<std::string> referenced_names(const std::string& text, const std::string& root);

private:
    std::string expression_;
    std::shared_ptr<const ExprNode> root_;
};
