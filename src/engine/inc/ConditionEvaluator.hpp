#pragma once

#include "Condition.hpp"
#include "Environment.hpp"
#include "TemplateResolver.hpp"

class ConditionEvaluator {
public:
    explicit ConditionEvaluator(const TemplateResolver& resolver) : resolver_(resolver) {}

    // Operands are resolved through the template resolver before comparison
    bool evaluate(const Condition& condition, const Environment& env) const;

    // Logical AND, an empty list holds
    bool evaluate(const ConditionList& conditions, const Environment& env) const;

    // Compares already-resolved operands. Throws TypeMismatchError when the
    // operand types cannot be compared with the operator.
    static bool compare(ConditionOperator op, const Value& left, const Value& right);

private:
    const TemplateResolver& resolver_;
};
