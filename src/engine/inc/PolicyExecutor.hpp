#pragma once

#include "ErrorKind.hpp"
#include "Step.hpp"
#include "Value.hpp"
#include <functional>
#include <optional>

struct StepResult {
    Value value;
    std::optional<ErrorInfo> error;  // Set when a continue-policy step failed
    int attempts = 1;
};

// Applies a step's on_error policy around one invocation:
//   fail:     rethrow the first error
//   retry:    re-invoke after delay_seconds, RetryExhaustedError after max_attempts
//   continue: record the error and yield a null result
class PolicyExecutor {
public:
    using Operation = std::function<Value()>;
    using Sleeper = std::function<void(double seconds)>;

    PolicyExecutor();

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    StepResult execute(const Step& step, const Operation& operation) const;

    // Errors that are not WorkflowError are reported as StepExecutionError
    static ErrorInfo describe(const Step& step, const std::exception& e);

private:
    Sleeper sleeper_;
};
