#pragma once

#include <string>
#include <vector>
#include <optional>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);

    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // Lowercase, collapse every run of non-alphanumeric characters into one '_'
    // and strip leading/trailing '_'
    static std::string to_identifier(const std::string& str);

    // Parses the whole string as a number, nullopt when any character is left over
    static std::optional<double> parse_number(const std::string& str);
};
