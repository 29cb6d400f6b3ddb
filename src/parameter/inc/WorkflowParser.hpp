#pragma once

#include "Workflow.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

// Builds a Workflow from a YAML (or JSON) document. Structural problems
// (unknown keys, wrong node kinds, bad operator or loop type) throw
// ValidationError naming the offending path. Semantic checks are left to
// WorkflowValidator.
class WorkflowParser {
public:
    static Workflow parse(const YAML::Node& root);
    static Workflow parse_string(const std::string& content);
    static Workflow parse_file(const std::string& path);

    static ConditionList parse_conditions(const YAML::Node& node, const std::string& path);
    static LoopSpec parse_loop(const YAML::Node& node, const std::string& path);

private:
    static std::vector<Step> parse_steps(const YAML::Node& node, const std::string& path);
    static Step parse_step(const YAML::Node& node, const std::string& path);
    static Condition parse_condition(const YAML::Node& node, const std::string& path);

    static void apply_defaults(std::vector<Step>& steps,
                               const std::optional<ErrorPolicy>& policy,
                               const std::optional<RetryConfig>& retry);
};
