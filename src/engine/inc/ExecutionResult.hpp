#pragma once

#include "ErrorKind.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <vector>

enum class StepStatus {
    Success,
    Retried,
    Skipped,
    Failed
};

enum class RunStatus {
    Completed,
    Failed,
    Cancelled
};

const char* to_string(StepStatus status);
const char* to_string(RunStatus status);

struct StepOutcome {
    std::string step_name;
    std::string action;
    StepStatus status = StepStatus::Success;
    int attempts = 0;
    std::optional<ErrorInfo> error;
    int depth = 0;              // 0 for top-level steps
    std::string binding_key;    // Empty when nothing was bound
    double duration_ms = 0.0;
};

struct ExecutionResult {
    std::string workflow_name;
    std::string workflow_version;
    RunStatus status = RunStatus::Completed;
    std::optional<ErrorInfo> error;
    ValueMap variables;
    std::vector<StepOutcome> outcomes;  // Pre-order

    bool succeeded() const { return status == RunStatus::Completed; }

    // First outcome recorded for the step name, nullptr when none
    const StepOutcome* find_outcome(const std::string& step_name) const;

    size_t count(StepStatus status) const;

    Value to_json() const;
};
