#include "ConditionEvaluator.hpp"
#include "WorkflowErrors.hpp"
#include "StringUtils.hpp"
#include <regex>
#include <fmt/format.h>

namespace {

// Numbers and numeric strings; booleans are never numeric
std::optional<double> as_number(const Value& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return StringUtils::parse_number(value.get_ref<const std::string&>());
    }
    return std::nullopt;
}

[[noreturn]] void mismatch(ConditionOperator op, const Value& left, const Value& right) {
    throw TypeMismatchError(fmt::format("Cannot compare {} with {} using '{}'",
                                        ValueUtils::type_name(left),
                                        ValueUtils::type_name(right),
                                        to_string(op)));
}

bool values_equal(const Value& left, const Value& right) {
    auto lnum = as_number(left);
    auto rnum = as_number(right);
    if (lnum && rnum) {
        return *lnum == *rnum;
    }

    if (left.is_boolean() || right.is_boolean() || left.is_null() || right.is_null()) {
        return left == right;
    }

    if (left.is_structured() || right.is_structured()) {
        if (left.type() != right.type()) {
            mismatch(ConditionOperator::Equals, left, right);
        }
        return left == right;
    }

    return ValueUtils::to_text(left) == ValueUtils::to_text(right);
}

// <0, 0, >0
int order(ConditionOperator op, const Value& left, const Value& right) {
    auto lnum = as_number(left);
    auto rnum = as_number(right);
    if (lnum && rnum) {
        return *lnum < *rnum ? -1 : (*lnum > *rnum ? 1 : 0);
    }

    bool comparable = (left.is_string() || left.is_number()) && (right.is_string() || right.is_number());
    if (!comparable) {
        mismatch(op, left, right);
    }
    return ValueUtils::to_text(left).compare(ValueUtils::to_text(right));
}

const std::string& scalar_text(ConditionOperator op, const Value& value, const Value& other, std::string& storage) {
    if (value.is_structured()) {
        mismatch(op, value, other);
    }
    storage = ValueUtils::to_text(value);
    return storage;
}

bool contains(const Value& container, const Value& needle) {
    if (container.is_array()) {
        for (const auto& item : container) {
            bool equal = (item.is_structured() || needle.is_structured()) ? item == needle
                                                                          : values_equal(item, needle);
            if (equal) {
                return true;
            }
        }
        return false;
    }

    if (container.is_object()) {
        if (needle.is_structured()) {
            mismatch(ConditionOperator::Contains, container, needle);
        }
        return container.contains(ValueUtils::to_text(needle));
    }

    if (needle.is_structured() || container.is_null()) {
        mismatch(ConditionOperator::Contains, container, needle);
    }
    return ValueUtils::to_text(container).find(ValueUtils::to_text(needle)) != std::string::npos;
}

}

bool ConditionEvaluator::compare(ConditionOperator op, const Value& left, const Value& right) {
    switch (op) {
        case ConditionOperator::Equals:
            return values_equal(left, right);
        case ConditionOperator::NotEquals:
            return !values_equal(left, right);
        case ConditionOperator::LessThan:
            return order(op, left, right) < 0;
        case ConditionOperator::LessThanOrEquals:
            return order(op, left, right) <= 0;
        case ConditionOperator::GreaterThan:
            return order(op, left, right) > 0;
        case ConditionOperator::GreaterThanOrEquals:
            return order(op, left, right) >= 0;
        case ConditionOperator::Contains:
            return contains(left, right);
        case ConditionOperator::NotContains:
            return !contains(left, right);
        case ConditionOperator::StartsWith: {
            std::string l, r;
            return StringUtils::starts_with(scalar_text(op, left, right, l), scalar_text(op, right, left, r));
        }
        case ConditionOperator::EndsWith: {
            std::string l, r;
            return StringUtils::ends_with(scalar_text(op, left, right, l), scalar_text(op, right, left, r));
        }
        case ConditionOperator::Matches: {
            std::string text, pattern;
            scalar_text(op, left, right, text);
            scalar_text(op, right, left, pattern);
            try {
                return std::regex_search(text, std::regex(pattern, std::regex::ECMAScript));
            } catch (const std::regex_error& e) {
                throw TypeMismatchError(fmt::format("Invalid regular expression '{}': {}", pattern, e.what()));
            }
        }
    }
    return false;
}

bool ConditionEvaluator::evaluate(const Condition& condition, const Environment& env) const {
    Value left = resolver_.resolve_value(condition.left, env);
    Value right = resolver_.resolve_value(condition.right, env);
    return compare(condition.op, left, right);
}

bool ConditionEvaluator::evaluate(const ConditionList& conditions, const Environment& env) const {
    for (const auto& condition : conditions) {
        if (!evaluate(condition, env)) {
            return false;
        }
    }
    return true;
}
