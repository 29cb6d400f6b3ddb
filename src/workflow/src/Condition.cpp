#include "Condition.hpp"
#include <array>
#include <utility>

namespace {

struct OperatorName {
    ConditionOperator op;
    const char* name;
    const char* symbol;
};

constexpr std::array<OperatorName, 11> operator_names = {{
    {ConditionOperator::Equals,              "equals",                 "=="},
    {ConditionOperator::NotEquals,           "not_equals",             "!="},
    {ConditionOperator::LessThan,            "less_than",              "<"},
    {ConditionOperator::LessThanOrEquals,    "less_than_or_equals",    "<="},
    {ConditionOperator::GreaterThan,         "greater_than",           ">"},
    {ConditionOperator::GreaterThanOrEquals, "greater_than_or_equals", ">="},
    {ConditionOperator::Contains,            "contains",               nullptr},
    {ConditionOperator::NotContains,         "not_contains",           nullptr},
    {ConditionOperator::StartsWith,          "starts_with",            nullptr},
    {ConditionOperator::EndsWith,            "ends_with",              nullptr},
    {ConditionOperator::Matches,             "matches",                nullptr},
}};

}

const char* to_string(ConditionOperator op) {
    for (const auto& entry : operator_names) {
        if (entry.op == op) return entry.name;
    }
    return "equals";
}

std::optional<ConditionOperator> parse_condition_operator(const std::string& name) {
    for (const auto& entry : operator_names) {
        if (name == entry.name || (entry.symbol && name == entry.symbol)) {
            return entry.op;
        }
    }
    return std::nullopt;
}
