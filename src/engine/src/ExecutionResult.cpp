#include "ExecutionResult.hpp"
#include <algorithm>

const char* to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Success: return "success";
        case StepStatus::Retried: return "retried";
        case StepStatus::Skipped: return "skipped";
        case StepStatus::Failed:  return "failed";
    }
    return "unknown";
}

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const StepOutcome* ExecutionResult::find_outcome(const std::string& step_name) const {
    auto it = std::find_if(outcomes.begin(), outcomes.end(),
                           [&](const StepOutcome& outcome) { return outcome.step_name == step_name; });
    return it == outcomes.end() ? nullptr : &*it;
}

size_t ExecutionResult::count(StepStatus status) const {
    return std::count_if(outcomes.begin(), outcomes.end(),
                         [&](const StepOutcome& outcome) { return outcome.status == status; });
}

namespace {

Value error_json(const ErrorInfo& error) {
    return Value{{"kind", to_string(error.kind)}, {"message", error.message}};
}

}

Value ExecutionResult::to_json() const {
    Value steps = Value::array();
    for (const auto& outcome : outcomes) {
        Value entry = {
            {"step_name", outcome.step_name},
            {"action", outcome.action},
            {"status", to_string(outcome.status)},
            {"attempts", outcome.attempts},
            {"depth", outcome.depth},
            {"duration_ms", outcome.duration_ms}
        };
        if (!outcome.binding_key.empty()) {
            entry["binding_key"] = outcome.binding_key;
        }
        if (outcome.error) {
            entry["error"] = error_json(*outcome.error);
        }
        steps.push_back(std::move(entry));
    }

    Value root = {
        {"workflow", workflow_name},
        {"version", workflow_version},
        {"status", to_string(status)},
        {"variables", ValueUtils::from_map(variables)},
        {"outcomes", std::move(steps)}
    };
    if (error) {
        root["error"] = error_json(*error);
    }
    return root;
}
