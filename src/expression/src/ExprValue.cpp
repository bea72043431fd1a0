#include "ExprValue.hpp"
#include "StringUtils.hpp"
#include <cmath>
#include <limits>
#include <fmt/format.h>

bool ExprValue::truthy() const {
    switch (kind()) {
        case Kind::Null:    return false;
        case Kind::Boolean: return as_bool();
        case Kind::Number:  return as_number() != 0.0 && !std::isnan(as_number());
        case Kind::String:  return !as_string().empty();
    }
    return false;
}

std::string ExprValue::format_number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";

    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    return fmt::format("{}", value);
}

std::string ExprValue::to_string() const {
    switch (kind()) {
        case Kind::Null:    return "";
        case Kind::Boolean: return as_bool() ? "true" : "false";
        case Kind::Number:  return format_number(as_number());
        case Kind::String:  return as_string();
    }
    return "";
}

bool ExprValue::loosely_equals(const ExprValue& other) const {
    if (kind() == other.kind()) {
        switch (kind()) {
            case Kind::Null:    return true;
            case Kind::Boolean: return as_bool() == other.as_bool();
            case Kind::Number:  return as_number() == other.as_number();
            case Kind::String:  return StringUtils::iequals(as_string(), other.as_string());
        }
    }

    if (is_number() && other.is_string()) {
        return format_number(as_number()) == other.as_string();
    }
    if (is_string() && other.is_number()) {
        return as_string() == format_number(other.as_number());
    }
    return false;
}

std::optional<int> ExprValue::compare(const ExprValue& other) const {
    if (kind() != other.kind()) return std::nullopt;

    switch (kind()) {
        case Kind::Null:
            return 0;
        case Kind::Boolean:
            return static_cast<int>(as_bool()) - static_cast<int>(other.as_bool());
        case Kind::Number: {
            double a = as_number();
            double b = other.as_number();
            if (std::isnan(a) || std::isnan(b)) return std::nullopt;
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        case Kind::String: {
            std::string a = StringUtils::to_lower(as_string());
            std::string b = StringUtils::to_lower(other.as_string());
            int cmp = a.compare(b);
            return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
        }
    }
    return std::nullopt;
}
