#pragma once

#include <optional>
#include <string>

enum class ErrorKind {
    Validation,
    Reference,
    TypeMismatch,
    StepExecution,
    Timeout,
    RetryExhausted,
    Cancelled
};

const char* to_string(ErrorKind kind);

struct ErrorInfo {
    ErrorKind kind = ErrorKind::StepExecution;
    std::string message;
};
