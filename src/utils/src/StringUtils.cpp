#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cmath>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

std::string StringUtils::to_upper(const std::string& str) {
    std::string upper_str = str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper_str;
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

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size()
        && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : str) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string StringUtils::to_identifier(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    bool pending_separator = false;

    for (unsigned char ch : str) {
        if (std::isalnum(ch)) {
            if (pending_separator && !result.empty()) {
                result.push_back('_');
            }
            pending_separator = false;
            result.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            pending_separator = true;
        }
    }
    return result;
}

std::optional<double> StringUtils::parse_number(const std::string& str) {
    std::string text = trimmed(str);
    if (text.empty()) {
        return std::nullopt;
    }

    // strtod accepts these, workflow comparisons should not
    const std::string lower = to_lower(text);
    if (lower.find("inf") != std::string::npos || lower.find("nan") != std::string::npos
        || lower.find('x') != std::string::npos) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}
