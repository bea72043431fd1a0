#pragma once

#include <optional>
#include <string>
#include <variant>

// Value produced by workflow expressions: null, boolean, number or string
class ExprValue {
public:
    enum class Kind {
        Null,
        Boolean,
        Number,
        String
    };

    ExprValue() = default;
    explicit ExprValue(bool value) : value_(value) {}
    explicit ExprValue(double value) : value_(value) {}
    explicit ExprValue(int value) : value_(static_cast<double>(value)) {}
    explicit ExprValue(std::string value) : value_(std::move(value)) {}
    explicit ExprValue(const char* value) : value_(std::string(value)) {}

    Kind kind() const { return static_cast<Kind>(value_.index()); }
    bool is_null() const { return kind() == Kind::Null; }
    bool is_bool() const { return kind() == Kind::Boolean; }
    bool is_number() const { return kind() == Kind::Number; }
    bool is_string() const { return kind() == Kind::String; }

    bool as_bool() const { return std::get<bool>(value_); }
    double as_number() const { return std::get<double>(value_); }
    const std::string& as_string() const { return std::get<std::string>(value_); }

    // null, false, 0, NaN and "" are falsy
    bool truthy() const;

    // Text form used by interpolation and format(); null becomes ""
    std::string to_string() const;

    // Equality with the coercion rules of workflow expressions: a number equals its
    // string representation, strings compare case-insensitively, any other
    // cross-type pair is unequal
    bool loosely_equals(const ExprValue& other) const;

    // Ordering for <, <=, >, >=; std::nullopt when the operands are not comparable
    std::optional<int> compare(const ExprValue& other) const;

    static std::string format_number(double value);

    bool operator==(const ExprValue& other) const { return value_ == other.value_; }
    bool operator!=(const ExprValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, double, std::string> value_;
};
