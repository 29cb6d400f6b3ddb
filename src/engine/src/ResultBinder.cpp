#include "ResultBinder.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <cctype>

std::string ResultBinder::normalize(const std::string& text) {
    std::string key = StringUtils::to_identifier(text);
    if (!key.empty() && std::isdigit(static_cast<unsigned char>(key[0]))) {
        key = "step_" + key;
    }
    return key;
}

std::string ResultBinder::derive_key(const Step& step) {
    std::string key = normalize(step.name);
    if (!key.empty()) {
        return key;
    }

    if (step.selector) {
        key = normalize(std::string(to_string(step.action)) + " " + *step.selector);
        if (!key.empty()) {
            return key;
        }
    }

    return to_string(step.action);
}

std::string ResultBinder::bind(const Step& step, const Value& result, Environment& env) const {
    std::string key = derive_key(step);
    if (env.contains(key)) {
        LogUtils::debug("Result of '{}' overwrites variable {}", step.display_name(), key);
    } else {
        LogUtils::debug("Result of '{}' bound to {}", step.display_name(), key);
    }
    env.set(key, result);
    return key;
}
