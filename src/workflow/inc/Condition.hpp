#pragma once

#include "Value.hpp"
#include <optional>
#include <string>
#include <vector>

enum class ConditionOperator {
    Equals,
    NotEquals,
    LessThan,
    LessThanOrEquals,
    GreaterThan,
    GreaterThanOrEquals,
    Contains,
    NotContains,
    StartsWith,
    EndsWith,
    Matches
};

const char* to_string(ConditionOperator op);

// Accepts the word forms ("less_than") and the symbolic aliases ("<")
std::optional<ConditionOperator> parse_condition_operator(const std::string& name);

struct Condition {
    ConditionOperator op = ConditionOperator::Equals;
    Value left;   // Template, resolved at evaluation time
    Value right;  // Template, resolved at evaluation time
};

// All conditions must hold
using ConditionList = std::vector<Condition>;
