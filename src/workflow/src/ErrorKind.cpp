#include "ErrorKind.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return "ValidationError";
        case ErrorKind::Reference:      return "ReferenceError";
        case ErrorKind::TypeMismatch:   return "TypeMismatchError";
        case ErrorKind::StepExecution:  return "StepExecutionError";
        case ErrorKind::Timeout:        return "TimeoutError";
        case ErrorKind::RetryExhausted: return "RetryExhaustedError";
        case ErrorKind::Cancelled:      return "CancelledError";
    }
    return "StepExecutionError";
}
