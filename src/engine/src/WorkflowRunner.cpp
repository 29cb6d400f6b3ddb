#include "WorkflowRunner.hpp"
#include "WorkflowErrors.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fmt/format.h>

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

Value require_number(const Value& value, const char* field, const Step& step) {
    if (value.is_number()) {
        return value;
    }
    if (value.is_string()) {
        if (auto parsed = StringUtils::parse_number(value.get<std::string>())) {
            if (*parsed == std::trunc(*parsed) && std::fabs(*parsed) < 9.2e18) {
                return static_cast<int64_t>(*parsed);
            }
            return *parsed;
        }
    }
    throw TypeMismatchError(fmt::format("Loop '{}' expects a number for '{}', got {}",
                                        step.display_name(), field, ValueUtils::type_name(value)));
}

}

WorkflowRunner::WorkflowRunner(Workflow workflow, BrowserDriver& driver, Storage& storage, GlobalConfig global)
    : workflow_(std::move(workflow)),
      global_(std::move(global)),
      conditions_(resolver_),
      context_{driver, storage, env_, global_},
      dispatcher_(context_, resolver_, policy_, *this) {}

ExecutionResult WorkflowRunner::run(const ValueMap& overrides) {
    result_ = ExecutionResult{};
    result_.workflow_name = workflow_.name;
    result_.workflow_version = workflow_.version;

    failure_recorded_ = false;
    context_.stop_requested = false;

    env_.clear();
    env_.seed(workflow_.variables);
    env_.seed(overrides);

    LogUtils::info("Starting workflow: {} (version {}), {} step(s)",
                   workflow_.name, workflow_.version, workflow_.steps.size());
    auto start = std::chrono::steady_clock::now();

    try {
        execute_sequence(workflow_.steps, 0);
        result_.status = RunStatus::Completed;
        if (context_.stop_requested) {
            LogUtils::info("Workflow {} stopped early by a stop step", workflow_.name);
        }
    } catch (const CancelledError& e) {
        result_.status = RunStatus::Cancelled;
        result_.error = e.info();
        LogUtils::warn("Workflow {} cancelled: {}", workflow_.name, e.what());
    } catch (const WorkflowError& e) {
        result_.status = RunStatus::Failed;
        result_.error = e.info();
        LogUtils::error("Workflow {} failed: [{}] {}", workflow_.name, to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        result_.status = RunStatus::Failed;
        result_.error = ErrorInfo{ErrorKind::StepExecution, e.what()};
        LogUtils::error("Workflow {} failed: {}", workflow_.name, e.what());
    }

    result_.variables = global_.export_variables.empty() ? env_.snapshot()
                                                         : env_.snapshot(global_.export_variables);

    LogUtils::info("Workflow {} {} in {:.1f} ms: {} succeeded, {} retried, {} skipped, {} failed",
                   workflow_.name, to_string(result_.status), elapsed_ms(start),
                   result_.count(StepStatus::Success), result_.count(StepStatus::Retried),
                   result_.count(StepStatus::Skipped), result_.count(StepStatus::Failed));
    return result_;
}

void WorkflowRunner::execute_sequence(const std::vector<Step>& steps, int depth) {
    for (const auto& step : steps) {
        if (context_.stop_requested) {
            return;
        }
        execute_step(step, depth);
    }
}

void WorkflowRunner::execute_step(const Step& step, int depth) {
    if (cancel_token_ && cancel_token_->is_cancelled()) {
        throw CancelledError(fmt::format("Cancelled before step '{}'", step.display_name()));
    }

    // Reserve the slot so a control step precedes its body outcomes
    const size_t slot = result_.outcomes.size();
    {
        StepOutcome outcome;
        outcome.step_name = step.display_name();
        outcome.action = to_string(step.action);
        outcome.depth = depth;
        result_.outcomes.push_back(std::move(outcome));
    }

    LogUtils::info("Executing step: {} ({})", step.display_name(), to_string(step.action));
    auto start = std::chrono::steady_clock::now();

    try {
        if (step.condition) {
            StepResult guard = policy_.execute(step, [this, &step]() {
                return Value(conditions_.evaluate(*step.condition, env_));
            });
            if (guard.error || !guard.value.get<bool>()) {
                auto& outcome = result_.outcomes[slot];
                outcome.status = guard.error ? StepStatus::Failed : StepStatus::Skipped;
                outcome.attempts = guard.error ? guard.attempts : 0;
                outcome.error = guard.error;
                outcome.duration_ms = elapsed_ms(start);
                LogUtils::info("Skipping step: {} (condition not met)", step.display_name());
                return;
            }
        }

        StepResult result = dispatcher_.dispatch(step, depth);

        // Only leaf results are bound, a false if leaves the Environment untouched
        std::string key;
        if (!is_control_flow(step.action)) {
            key = binder_.bind(step, result.value, env_);
        }

        auto& outcome = result_.outcomes[slot];
        outcome.attempts = result.attempts;
        outcome.error = result.error;
        outcome.binding_key = key;
        if (result.error) {
            outcome.status = StepStatus::Failed;
        } else {
            outcome.status = result.attempts > 1 ? StepStatus::Retried : StepStatus::Success;
        }
        outcome.duration_ms = elapsed_ms(start);

        LogUtils::info("Completed step: {} ({}, {:.1f} ms)",
                       step.display_name(), to_string(outcome.status), outcome.duration_ms);
    } catch (const WorkflowError& e) {
        auto& outcome = result_.outcomes[slot];
        outcome.status = StepStatus::Failed;
        outcome.error = e.info();
        outcome.duration_ms = elapsed_ms(start);
        // Ancestors of the failing step keep their own attempt count
        if (!failure_recorded_) {
            failure_recorded_ = true;
            if (auto* exhausted = dynamic_cast<const RetryExhaustedError*>(&e)) {
                outcome.attempts = exhausted->attempts();
            }
        }
        outcome.attempts = std::max(outcome.attempts, 1);
        throw;
    } catch (const std::exception& e) {
        ErrorInfo info = PolicyExecutor::describe(step, e);
        auto& outcome = result_.outcomes[slot];
        outcome.status = StepStatus::Failed;
        outcome.error = info;
        outcome.attempts = std::max(outcome.attempts, 1);
        outcome.duration_ms = elapsed_ms(start);
        failure_recorded_ = true;
        throw StepExecutionError(info.message);
    }
}

StepResult WorkflowRunner::execute_if(const Step& step, int depth) {
    const auto& condition = std::get<ConditionList>(step.control);

    StepResult result = policy_.execute(step, [this, &condition]() {
        return Value(conditions_.evaluate(condition, env_));
    });
    if (result.error) {
        return result;
    }

    if (result.value.get<bool>()) {
        LogUtils::debug("Condition of '{}' is true, running {} step(s)", step.display_name(), step.steps.size());
        execute_sequence(step.steps, depth + 1);
    } else if (!step.else_steps.empty()) {
        LogUtils::debug("Condition of '{}' is false, running {} else step(s)",
                        step.display_name(), step.else_steps.size());
        execute_sequence(step.else_steps, depth + 1);
    } else {
        LogUtils::debug("Condition of '{}' is false, nothing to run", step.display_name());
    }
    return result;
}

StepResult WorkflowRunner::execute_loop(const Step& step, int depth) {
    const auto& spec = std::get<LoopSpec>(step.control);
    LogUtils::debug("Entering {} loop '{}'", loop_type_name(spec), step.display_name());
    return std::visit([&](const auto& loop) { return run_loop(step, loop, depth); }, spec);
}

StepResult WorkflowRunner::run_conditional_loop(const Step& step, const ConditionList& condition,
                                                std::optional<int64_t> max_iterations, bool expected, int depth) {
    int64_t iterations = 0;
    int attempts = 1;

    while (true) {
        if (max_iterations && iterations >= *max_iterations) {
            LogUtils::warn("Loop '{}' stopped after reaching max_iterations ({})", step.display_name(), *max_iterations);
            break;
        }

        StepResult check = policy_.execute(step, [this, &condition]() {
            return Value(conditions_.evaluate(condition, env_));
        });
        attempts = std::max(attempts, check.attempts);
        if (check.error) {
            return StepResult{iterations, check.error, attempts};
        }
        if (check.value.get<bool>() != expected) {
            break;
        }

        execute_sequence(step.steps, depth + 1);
        ++iterations;
        if (context_.stop_requested) break;
    }

    LogUtils::debug("Loop '{}' finished after {} iteration(s)", step.display_name(), iterations);
    return StepResult{iterations, std::nullopt, attempts};
}

StepResult WorkflowRunner::run_loop(const Step& step, const WhileLoop& loop, int depth) {
    return run_conditional_loop(step, loop.condition, loop.max_iterations, true, depth);
}

StepResult WorkflowRunner::run_loop(const Step& step, const UntilLoop& loop, int depth) {
    return run_conditional_loop(step, loop.condition, loop.max_iterations, false, depth);
}

StepResult WorkflowRunner::run_loop(const Step& step, const ForLoop& loop, int depth) {
    StepResult range = policy_.execute(step, [this, &step, &loop]() {
        Value start = require_number(resolver_.resolve_value(loop.start, env_), "start", step);
        Value end = require_number(resolver_.resolve_value(loop.end, env_), "end", step);
        Value increment = require_number(resolver_.resolve_value(loop.step, env_), "step", step);
        if (increment.get<double>() == 0.0) {
            throw TypeMismatchError(fmt::format("Loop '{}' has a zero step", step.display_name()));
        }
        return Value::array({start, end, increment});
    });
    if (range.error) {
        return StepResult{0, range.error, range.attempts};
    }

    const Value& start = range.value[0];
    const Value& end = range.value[1];
    const Value& increment = range.value[2];
    int64_t iterations = 0;

    if (ValueUtils::fits_int64(start) && ValueUtils::fits_int64(end) && ValueUtils::fits_int64(increment)) {
        const int64_t first = start.get<int64_t>();
        const int64_t last = end.get<int64_t>();
        const int64_t delta = increment.get<int64_t>();
        // Distances are taken in uint64_t so that no step past 'last' is ever computed
        const uint64_t stride = delta > 0 ? static_cast<uint64_t>(delta) : uint64_t{0} - static_cast<uint64_t>(delta);
        if (delta > 0 ? first <= last : first >= last) {
            for (int64_t i = first;; i += delta) {
                env_.set(loop.variable, i);
                execute_sequence(step.steps, depth + 1);
                ++iterations;
                if (context_.stop_requested) break;
                uint64_t remaining = delta > 0 ? static_cast<uint64_t>(last) - static_cast<uint64_t>(i)
                                               : static_cast<uint64_t>(i) - static_cast<uint64_t>(last);
                if (remaining < stride) break;
            }
        }
    } else {
        const double first = start.get<double>();
        const double last = end.get<double>();
        const double delta = increment.get<double>();
        for (int64_t n = 0;; ++n) {
            const double d = first + static_cast<double>(n) * delta;
            if (delta > 0 ? d > last : d < last) break;
            env_.set(loop.variable, d);
            execute_sequence(step.steps, depth + 1);
            ++iterations;
            if (context_.stop_requested) break;
        }
    }

    return StepResult{iterations, std::nullopt, range.attempts};
}

StepResult WorkflowRunner::run_loop(const Step& step, const ForEachLoop& loop, int depth) {
    StepResult items = policy_.execute(step, [this, &step, &loop]() {
        Value resolved = resolver_.resolve_value(loop.items, env_);
        if (!resolved.is_array()) {
            throw TypeMismatchError(fmt::format("Loop '{}' items must resolve to a sequence, got {}",
                                                step.display_name(), ValueUtils::type_name(resolved)));
        }
        return resolved;
    });
    if (items.error) {
        return StepResult{0, items.error, items.attempts};
    }

    const std::string index_name = loop.variable + "_index";
    int64_t index = 0;
    for (const auto& item : items.value) {
        env_.set(loop.variable, item);
        env_.set(index_name, index);
        execute_sequence(step.steps, depth + 1);
        ++index;
        if (context_.stop_requested) break;
    }

    return StepResult{index, std::nullopt, items.attempts};
}

StepResult WorkflowRunner::run_loop(const Step& step, const RepeatLoop& loop, int depth) {
    StepResult times = policy_.execute(step, [this, &step, &loop]() {
        Value count = require_number(resolver_.resolve_value(loop.times, env_), "times", step);
        if (!ValueUtils::fits_int64(count) || count.get<int64_t>() < 0) {
            throw TypeMismatchError(fmt::format("Loop '{}' expects a non-negative integer for 'times', got {}",
                                                step.display_name(), count.dump()));
        }
        return count;
    });
    if (times.error) {
        return StepResult{0, times.error, times.attempts};
    }

    const int64_t count = times.value.get<int64_t>();
    int64_t iterations = 0;
    while (iterations < count) {
        if (!loop.variable.empty()) {
            env_.set(loop.variable, iterations);
        }
        execute_sequence(step.steps, depth + 1);
        ++iterations;
        if (context_.stop_requested) break;
    }

    return StepResult{iterations, std::nullopt, times.attempts};
}
