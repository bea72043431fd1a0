#include "ExprContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>

void MapExprContext::set(const std::string& ns, const std::string& key, ExprValue value) {
    values_[ns][key] = std::move(value);
}

void MapExprContext::set_status(bool success, bool failure, bool cancelled) {
    success_ = success;
    failure_ = failure;
    cancelled_ = cancelled;
}

std::optional<ExprValue> MapExprContext::lookup(const std::vector<std::string>& path) const {
    if (path.size() < 2) return std::nullopt;

    auto ns = values_.find(path[0]);
    if (ns == values_.end()) return std::nullopt;

    std::vector<std::string> rest(path.begin() + 1, path.end());
    auto it = ns->second.find(StringUtils::join(rest, "."));
    if (it == ns->second.end()) return std::nullopt;
    return it->second;
}

namespace {

// Dotted key matches pattern segment by segment, "*" matching any one segment
bool matches_pattern(const std::vector<std::string>& key, const std::vector<std::string>& pattern) {
    if (key.size() != pattern.size()) return false;
    for (size_t i = 0; i < key.size(); ++i) {
        if (pattern[i] != "*" && pattern[i] != key[i]) return false;
    }
    return true;
}

} // namespace

std::optional<std::vector<ExprValue>> MapExprContext::lookup_collection(const std::vector<std::string>& path) const {
    if (path.empty()) return std::nullopt;

    auto ns = values_.find(path[0]);
    if (ns == values_.end()) return std::nullopt;

    std::vector<std::string> rest(path.begin() + 1, path.end());
    const bool wildcard = std::find(rest.begin(), rest.end(), "*") != rest.end();

    std::vector<ExprValue> items;
    for (const auto& [key, value] : ns->second) {
        std::vector<std::string> segments = StringUtils::split(key, '.');
        if (wildcard) {
            if (matches_pattern(segments, rest)) items.push_back(value);
        } else if (segments.size() == rest.size() + 1 &&
                   std::equal(rest.begin(), rest.end(), segments.begin())) {
            items.push_back(value);
        }
    }
    if (items.empty()) return std::nullopt;
    return items;
}
