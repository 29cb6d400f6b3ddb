#pragma once

#include <optional>
#include <string>

enum class ErrorPolicy {
    Fail,
    Retry,
    Continue
};

struct RetryConfig {
    int max_attempts = 3;
    double delay_seconds = 1.0;
};

const char* to_string(ErrorPolicy policy);

// "stop" is accepted as an alias of "fail"
std::optional<ErrorPolicy> parse_error_policy(const std::string& name);
