#pragma once

#include <string>
#include <vector>

class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);

    // Case-insensitive (ASCII) comparisons
    static bool iequals(const std::string& a, const std::string& b);
    static bool istarts_with(const std::string& str, const std::string& prefix);
    static bool iends_with(const std::string& str, const std::string& suffix);
    static bool icontains(const std::string& str, const std::string& needle);

    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);
    static std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

    // [A-Za-z_][A-Za-z0-9_]*
    static bool is_identifier(const std::string& str);

    // Like is_identifier but also allows '-' after the first character
    static bool is_key_identifier(const std::string& str);
};
