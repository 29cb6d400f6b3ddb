#pragma once

#include "ActionKind.hpp"
#include "Condition.hpp"
#include "ErrorPolicy.hpp"
#include "LoopSpec.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Parsed control-flow parameters, monostate for leaf actions
using StepControl = std::variant<std::monostate, ConditionList, LoopSpec>;

struct Step {
    std::string name;                       // Step name, may be empty
    ActionKind action = ActionKind::Navigate;
    std::optional<std::string> selector;    // Template
    std::optional<Value> value;             // Value or template
    std::optional<Value> data;              // save payload
    std::optional<double> timeout;          // Seconds
    std::optional<ConditionList> condition; // Guard, step is skipped when false
    std::optional<ErrorPolicy> on_error;
    std::optional<RetryConfig> retry;
    StepControl control;                    // if: ConditionList, loop: LoopSpec
    std::vector<Step> steps;                // Control-flow body
    std::vector<Step> else_steps;

    // Name used in logs and outcomes
    std::string display_name() const {
        return name.empty() ? std::string(to_string(action)) : name;
    }

    ErrorPolicy effective_policy() const {
        return on_error.value_or(ErrorPolicy::Fail);
    }

    RetryConfig effective_retry() const {
        return retry.value_or(RetryConfig{});
    }
};
