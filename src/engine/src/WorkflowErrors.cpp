#include "WorkflowErrors.hpp"
#include <fmt/format.h>

namespace {

std::string join_errors(const std::vector<std::string>& errors) {
    if (errors.size() == 1) {
        return "Invalid workflow: " + errors.front();
    }

    std::string message = fmt::format("Invalid workflow ({} errors):", errors.size());
    for (const auto& error : errors) {
        message += "\n  - " + error;
    }
    return message;
}

}

ValidationError::ValidationError(const std::string& message)
    : WorkflowError(ErrorKind::Validation, "Invalid workflow: " + message), errors_{message} {}

ValidationError::ValidationError(const std::vector<std::string>& errors)
    : WorkflowError(ErrorKind::Validation, join_errors(errors)), errors_(errors) {}

ReferenceError::ReferenceError(const std::string& reference)
    : WorkflowError(ErrorKind::Reference, "Undefined variable: " + reference), reference_(reference) {}

RetryExhaustedError::RetryExhaustedError(const std::string& step_name, int attempts, const ErrorInfo& last_error)
    : WorkflowError(ErrorKind::RetryExhausted,
                    fmt::format("Step '{}' failed after {} attempts: {}", step_name, attempts, last_error.message)),
      attempts_(attempts),
      last_error_(last_error) {}
