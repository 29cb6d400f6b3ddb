#pragma once
#include "ActionKind.hpp"
#include "Step.hpp"
#include <functional>
#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

// Parsers for the action-specific "value" of a step. Control-flow actions
// turn it into Step::control, every other action keeps it as a plain Value.
// The table is filled once, when the registry is first used, and is
// read-only afterwards.
class StepParserRegistry {
public:
    using StepParser = std::function<void(const YAML::Node& value, Step& step, const std::string& path)>;

    // False when no parser is registered for step.action
    static bool apply(const YAML::Node& value, Step& step, const std::string& path);

private:
    StepParserRegistry();

    static StepParserRegistry& instance();

    std::map<ActionKind, StepParser> parsers_;
};
