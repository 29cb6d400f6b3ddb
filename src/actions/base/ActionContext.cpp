#include "ActionContext.hpp"
#include "WorkflowErrors.hpp"

const std::string& ActionParams::require_selector() const {
    if (!selector) {
        throw StepExecutionError("Step '" + step_name + "' has no selector");
    }
    return *selector;
}

const Value& ActionParams::require_value() const {
    if (!value) {
        throw StepExecutionError("Step '" + step_name + "' has no value");
    }
    return *value;
}

std::string ActionParams::value_text() const {
    return ValueUtils::to_text(require_value());
}
