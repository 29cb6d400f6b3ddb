#include "PolicyExecutor.hpp"
#include "WorkflowErrors.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <fmt/format.h>

PolicyExecutor::PolicyExecutor()
    : sleeper_([](double seconds) {
          if (seconds > 0) {
              std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
          }
      }) {}

ErrorInfo PolicyExecutor::describe(const Step& step, const std::exception& e) {
    if (auto* workflow_error = dynamic_cast<const WorkflowError*>(&e)) {
        return workflow_error->info();
    }
    return ErrorInfo{ErrorKind::StepExecution, fmt::format("Step '{}' failed: {}", step.display_name(), e.what())};
}

StepResult PolicyExecutor::execute(const Step& step, const Operation& operation) const {
    const ErrorPolicy policy = step.effective_policy();
    const RetryConfig retry = step.effective_retry();
    const int max_attempts = (policy == ErrorPolicy::Retry) ? std::max(1, retry.max_attempts) : 1;

    ErrorInfo last_error;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        try {
            return StepResult{operation(), std::nullopt, attempt};
        } catch (const CancelledError&) {
            throw;
        } catch (const WorkflowError& e) {
            if (policy == ErrorPolicy::Fail) {
                throw;
            }
            last_error = e.info();
        } catch (const std::exception& e) {
            last_error = describe(step, e);
            if (policy == ErrorPolicy::Fail) {
                throw StepExecutionError(last_error.message);
            }
        }

        if (policy == ErrorPolicy::Retry && attempt < max_attempts) {
            LogUtils::warn("Step '{}' failed (attempt {}/{}): {}. Retrying in {}s",
                           step.display_name(), attempt, max_attempts, last_error.message, retry.delay_seconds);
            sleeper_(retry.delay_seconds);
        }
    }

    if (policy == ErrorPolicy::Retry) {
        LogUtils::error("Step '{}' failed after {} attempts: {}", step.display_name(), max_attempts, last_error.message);
        throw RetryExhaustedError(step.display_name(), max_attempts, last_error);
    }

    LogUtils::warn("Step '{}' failed, continuing: [{}] {}",
                   step.display_name(), to_string(last_error.kind), last_error.message);
    return StepResult{Value(), last_error, max_attempts};
}
