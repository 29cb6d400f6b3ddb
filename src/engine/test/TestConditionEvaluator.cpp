#include "ConditionEvaluator.hpp"
#include "WorkflowErrors.hpp"
#include <cassert>
#include <iostream>

namespace {

Condition make(ConditionOperator op, Value left, Value right) {
    return Condition{op, std::move(left), std::move(right)};
}

bool throws_type_mismatch(ConditionOperator op, const Value& left, const Value& right) {
    try {
        ConditionEvaluator::compare(op, left, right);
    } catch (const TypeMismatchError&) {
        return true;
    }
    return false;
}

}

void test_numeric_comparison() {
    using Op = ConditionOperator;
    assert(ConditionEvaluator::compare(Op::LessThanOrEquals, 3, 3));
    assert(ConditionEvaluator::compare(Op::GreaterThan, "10", "9"));
    assert(ConditionEvaluator::compare(Op::Equals, "2.0", 2));
    assert(ConditionEvaluator::compare(Op::LessThan, 1.5, "2"));
    assert(!ConditionEvaluator::compare(Op::GreaterThanOrEquals, 4, 5));
    std::cout << "test_numeric_comparison passed." << std::endl;
}

void test_lexical_comparison() {
    using Op = ConditionOperator;
    assert(ConditionEvaluator::compare(Op::LessThan, "apple", "banana"));
    assert(ConditionEvaluator::compare(Op::NotEquals, "Apple", "apple"));
    assert(ConditionEvaluator::compare(Op::Equals, "done", "done"));
    // "10" vs "9a": not both numeric, compared as text
    assert(ConditionEvaluator::compare(Op::LessThan, "10", "9a"));
    std::cout << "test_lexical_comparison passed." << std::endl;
}

void test_bool_and_null_identity() {
    using Op = ConditionOperator;
    assert(ConditionEvaluator::compare(Op::Equals, true, true));
    assert(ConditionEvaluator::compare(Op::NotEquals, true, "true"));
    assert(ConditionEvaluator::compare(Op::Equals, nullptr, nullptr));
    assert(ConditionEvaluator::compare(Op::NotEquals, nullptr, 0));
    assert(throws_type_mismatch(Op::LessThan, true, false));
    assert(throws_type_mismatch(Op::GreaterThan, nullptr, 1));
    std::cout << "test_bool_and_null_identity passed." << std::endl;
}

void test_container_mismatch() {
    using Op = ConditionOperator;
    assert(throws_type_mismatch(Op::Equals, Value::array({1}), 1));
    assert(throws_type_mismatch(Op::LessThan, Value::array({1}), 2));
    assert(throws_type_mismatch(Op::StartsWith, Value::object(), "a"));
    assert(ConditionEvaluator::compare(Op::Equals, Value::array({1, 2}), Value::array({1, 2})));
    std::cout << "test_container_mismatch passed." << std::endl;
}

void test_string_and_sequence_operators() {
    using Op = ConditionOperator;
    assert(ConditionEvaluator::compare(Op::Contains, "Results for shoes", "shoes"));
    assert(ConditionEvaluator::compare(Op::Contains, Value::array({"a", 2}), "2"));
    assert(ConditionEvaluator::compare(Op::NotContains, Value::array({"a", "b"}), "c"));
    assert(ConditionEvaluator::compare(Op::Contains, Value{{"k", 1}}, "k"));
    assert(ConditionEvaluator::compare(Op::StartsWith, "https://x.test", "https://"));
    assert(ConditionEvaluator::compare(Op::EndsWith, "report.pdf", ".pdf"));
    assert(ConditionEvaluator::compare(Op::Matches, "Order #1234", "#\\d{4}$"));
    assert(!ConditionEvaluator::compare(Op::Matches, "Order #12", "#\\d{4}$"));
    assert(throws_type_mismatch(Op::Matches, "x", "("));
    std::cout << "test_string_and_sequence_operators passed." << std::endl;
}

void test_operator_names_and_aliases() {
    assert(parse_condition_operator("less_than_or_equals") == ConditionOperator::LessThanOrEquals);
    assert(parse_condition_operator("<=") == ConditionOperator::LessThanOrEquals);
    assert(parse_condition_operator("==") == ConditionOperator::Equals);
    assert(parse_condition_operator("!=") == ConditionOperator::NotEquals);
    assert(!parse_condition_operator("approximately").has_value());
    std::cout << "test_operator_names_and_aliases passed." << std::endl;
}

void test_operands_are_resolved() {
    TemplateResolver resolver;
    ConditionEvaluator evaluator(resolver);
    Environment env({{"page", 3}, {"title", "Checkout"}});

    assert(evaluator.evaluate(make(ConditionOperator::LessThanOrEquals, "{{page}}", 3), env));
    assert(!evaluator.evaluate(make(ConditionOperator::LessThanOrEquals, "{{page + 1}}", 3), env));
    assert(evaluator.evaluate(make(ConditionOperator::Equals, "{{title}}", "Checkout"), env));

    bool thrown = false;
    try {
        evaluator.evaluate(make(ConditionOperator::Equals, "{{missing}}", 1), env);
    } catch (const ReferenceError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_operands_are_resolved passed." << std::endl;
}

void test_condition_list_is_conjunction() {
    TemplateResolver resolver;
    ConditionEvaluator evaluator(resolver);
    Environment env({{"page", 2}});

    ConditionList both = {
        make(ConditionOperator::GreaterThan, "{{page}}", 1),
        make(ConditionOperator::LessThan, "{{page}}", 5)
    };
    assert(evaluator.evaluate(both, env));

    both.push_back(make(ConditionOperator::Equals, "{{page}}", 3));
    assert(!evaluator.evaluate(both, env));
    assert(evaluator.evaluate(ConditionList{}, env));
    std::cout << "test_condition_list_is_conjunction passed." << std::endl;
}

int main() {
    test_numeric_comparison();
    test_lexical_comparison();
    test_bool_and_null_identity();
    test_container_mismatch();
    test_string_and_sequence_operators();
    test_operator_names_and_aliases();
    test_operands_are_resolved();
    test_condition_list_is_conjunction();

    std::cout << "All ConditionEvaluator tests passed!" << std::endl;
    return 0;
}
