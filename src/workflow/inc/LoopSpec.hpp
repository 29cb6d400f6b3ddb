#pragma once

#include "Condition.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <variant>

struct WhileLoop {
    ConditionList condition;
    std::optional<int64_t> max_iterations;  // no cap when absent
};

// Runs while the condition is false
struct UntilLoop {
    ConditionList condition;
    std::optional<int64_t> max_iterations;
};

// Inclusive range start..end
struct ForLoop {
    Value start;
    Value end;
    Value step = 1;
    std::string variable;
};

struct ForEachLoop {
    Value items;  // must resolve to a sequence
    std::string variable;
};

struct RepeatLoop {
    Value times;
    std::string variable;  // optional, receives the 0-based iteration
};

using LoopSpec = std::variant<WhileLoop, UntilLoop, ForLoop, ForEachLoop, RepeatLoop>;

const char* loop_type_name(const LoopSpec& spec);
