#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <iterator>
#include <vector>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

std::string StringUtils::trimmed(const std::string& str) {
    std::string copy = str;
    trim(copy);
    return copy;
}

bool StringUtils::iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

bool StringUtils::istarts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return iequals(str.substr(0, prefix.size()), prefix);
}

bool StringUtils::iends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return iequals(str.substr(str.size() - suffix.size()), suffix);
}

bool StringUtils::icontains(const std::string& str, const std::string& needle) {
    return to_lower(str).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string StringUtils::replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;

    std::string result;
    size_t pos = 0;
    while (true) {
        size_t found = str.find(from, pos);
        if (found == std::string::npos) {
            result.append(str, pos, std::string::npos);
            break;
        }
        result.append(str, pos, found - pos);
        result += to;
        pos = found + from.size();
    }
    return result;
}

bool StringUtils::is_identifier(const std::string& str) {
    if (str.empty()) return false;
    unsigned char first = static_cast<unsigned char>(str[0]);
    if (!std::isalpha(first) && first != '_') return false;
    return std::all_of(str.begin() + 1, str.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '_';
    });
}

bool StringUtils::is_key_identifier(const std::string& str) {
    if (str.empty()) return false;
    unsigned char first = static_cast<unsigned char>(str[0]);
    if (!std::isalpha(first) && first != '_') return false;
    return std::all_of(str.begin() + 1, str.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '_' || ch == '-';
    });
}
