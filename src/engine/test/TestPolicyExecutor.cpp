#include "PolicyExecutor.hpp"
#include "WorkflowErrors.hpp"
#include <cassert>
#include <iostream>
#include <vector>

namespace {

Step make_step(std::optional<ErrorPolicy> policy, std::optional<RetryConfig> retry = std::nullopt) {
    Step step;
    step.name = "Open results";
    step.action = ActionKind::Click;
    step.selector = "#results";
    step.on_error = policy;
    step.retry = retry;
    return step;
}

}

void test_success_returns_value() {
    PolicyExecutor executor;
    auto result = executor.execute(make_step(std::nullopt), [] { return Value("ok"); });

    assert(result.value == "ok");
    assert(!result.error);
    assert(result.attempts == 1);
    std::cout << "test_success_returns_value passed." << std::endl;
}

void test_fail_policy_propagates() {
    PolicyExecutor executor;
    int calls = 0;
    bool thrown = false;
    try {
        executor.execute(make_step(ErrorPolicy::Fail), [&]() -> Value {
            ++calls;
            throw StepExecutionError("click failed");
        });
    } catch (const StepExecutionError& e) {
        thrown = true;
        assert(std::string(e.what()) == "click failed");
    }
    assert(thrown);
    assert(calls == 1);
    std::cout << "test_fail_policy_propagates passed." << std::endl;
}

void test_foreign_exceptions_are_wrapped() {
    PolicyExecutor executor;
    bool thrown = false;
    try {
        executor.execute(make_step(std::nullopt), []() -> Value { throw std::runtime_error("socket closed"); });
    } catch (const StepExecutionError& e) {
        thrown = true;
        std::string message = e.what();
        assert(message.find("Open results") != std::string::npos);
        assert(message.find("socket closed") != std::string::npos);
    }
    assert(thrown);
    std::cout << "test_foreign_exceptions_are_wrapped passed." << std::endl;
}

void test_retry_exhausts_after_max_attempts() {
    PolicyExecutor executor;
    std::vector<double> delays;
    executor.set_sleeper([&](double seconds) { delays.push_back(seconds); });

    int calls = 0;
    bool thrown = false;
    try {
        executor.execute(make_step(ErrorPolicy::Retry, RetryConfig{3, 0.5}), [&]() -> Value {
            ++calls;
            throw TimeoutError("still loading");
        });
    } catch (const RetryExhaustedError& e) {
        thrown = true;
        assert(e.attempts() == 3);
        assert(e.last_error().kind == ErrorKind::Timeout);
        assert(e.kind() == ErrorKind::RetryExhausted);
    }
    assert(thrown);
    assert(calls == 3);
    assert((delays == std::vector<double>{0.5, 0.5}));
    std::cout << "test_retry_exhausts_after_max_attempts passed." << std::endl;
}

void test_retry_recovers() {
    PolicyExecutor executor;
    int sleeps = 0;
    executor.set_sleeper([&](double) { ++sleeps; });

    int calls = 0;
    auto result = executor.execute(make_step(ErrorPolicy::Retry, RetryConfig{5, 1.0}), [&]() -> Value {
        if (++calls < 3) {
            throw StepExecutionError("flaky");
        }
        return 7;
    });

    assert(result.value == 7);
    assert(result.attempts == 3);
    assert(!result.error);
    assert(sleeps == 2);
    std::cout << "test_retry_recovers passed." << std::endl;
}

void test_continue_records_error() {
    PolicyExecutor executor;
    int calls = 0;
    auto result = executor.execute(make_step(ErrorPolicy::Continue), [&]() -> Value {
        ++calls;
        throw ReferenceError("missing");
    });

    assert(calls == 1);
    assert(result.value.is_null());
    assert(result.error);
    assert(result.error->kind == ErrorKind::Reference);
    std::cout << "test_continue_records_error passed." << std::endl;
}

void test_cancellation_is_never_swallowed() {
    PolicyExecutor executor;
    bool thrown = false;
    try {
        executor.execute(make_step(ErrorPolicy::Continue), []() -> Value { throw CancelledError("stop"); });
    } catch (const CancelledError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_cancellation_is_never_swallowed passed." << std::endl;
}

int main() {
    test_success_returns_value();
    test_fail_policy_propagates();
    test_foreign_exceptions_are_wrapped();
    test_retry_exhausts_after_max_attempts();
    test_retry_recovers();
    test_continue_records_error();
    test_cancellation_is_never_swallowed();

    std::cout << "All PolicyExecutor tests passed!" << std::endl;
    return 0;
}
