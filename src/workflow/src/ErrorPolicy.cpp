#include "ErrorPolicy.hpp"
#include "StringUtils.hpp"

const char* to_string(ErrorPolicy policy) {
    switch (policy) {
        case ErrorPolicy::Fail:     return "fail";
        case ErrorPolicy::Retry:    return "retry";
        case ErrorPolicy::Continue: return "continue";
    }
    return "fail";
}

std::optional<ErrorPolicy> parse_error_policy(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "fail" || lower == "stop") return ErrorPolicy::Fail;
    if (lower == "retry")                   return ErrorPolicy::Retry;
    if (lower == "continue")                return ErrorPolicy::Continue;
    return std::nullopt;
}
