#pragma once

#include "ErrorKind.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Base of every error raised while loading or executing a workflow
class WorkflowError : public std::runtime_error {
public:
    WorkflowError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    ErrorInfo info() const { return ErrorInfo{kind_, what()}; }

private:
    ErrorKind kind_;
};

// Malformed workflow document, raised before any step runs
class ValidationError : public WorkflowError {
public:
    explicit ValidationError(const std::string& message);
    explicit ValidationError(const std::vector<std::string>& errors);

    const std::vector<std::string>& errors() const noexcept { return errors_; }

private:
    std::vector<std::string> errors_;
};

// Template referenced a variable or property that is not bound
class ReferenceError : public WorkflowError {
public:
    explicit ReferenceError(const std::string& reference);

    const std::string& reference() const noexcept { return reference_; }

private:
    std::string reference_;
};

class TypeMismatchError : public WorkflowError {
public:
    explicit TypeMismatchError(const std::string& message)
        : WorkflowError(ErrorKind::TypeMismatch, message) {}
};

// External collaborator call failed
class StepExecutionError : public WorkflowError {
public:
    explicit StepExecutionError(const std::string& message)
        : WorkflowError(ErrorKind::StepExecution, message) {}
};

class TimeoutError : public WorkflowError {
public:
    explicit TimeoutError(const std::string& message)
        : WorkflowError(ErrorKind::Timeout, message) {}
};

// A retry-policy step failed on its final attempt
class RetryExhaustedError : public WorkflowError {
public:
    RetryExhaustedError(const std::string& step_name, int attempts, const ErrorInfo& last_error);

    int attempts() const noexcept { return attempts_; }
    const ErrorInfo& last_error() const noexcept { return last_error_; }

private:
    int attempts_;
    ErrorInfo last_error_;
};

class CancelledError : public WorkflowError {
public:
    explicit CancelledError(const std::string& message)
        : WorkflowError(ErrorKind::Cancelled, message) {}
};
