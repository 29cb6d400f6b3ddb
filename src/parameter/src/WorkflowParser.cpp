#include "WorkflowParser.hpp"
#include "ConfigParser.hpp"
#include "StepParserRegistry.hpp"
#include "ValueConverter.hpp"
#include "WorkflowErrors.hpp"
#include <fmt/format.h>

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& reason) {
    throw ValidationError(path + ": " + reason);
}

std::string scalar_text(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        fail(path, "expected a scalar");
    }
    return node.Scalar();
}

void check_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& path) {
    if (!node.IsMap()) {
        fail(path, "expected a mapping");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (valid_keys.find(key) == valid_keys.end()) {
            fail(path, "unknown key '" + key + "'");
        }
    }
}

ErrorPolicy parse_policy(const YAML::Node& node, const std::string& path) {
    auto policy = parse_error_policy(scalar_text(node, path));
    if (!policy) {
        fail(path, "unknown error policy '" + node.Scalar() + "' (expected fail, retry or continue)");
    }
    return *policy;
}

RetryConfig parse_retry(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<RetryConfig>();
    } catch (const YAML::Exception& e) {
        fail(path, e.what());
    } catch (const std::runtime_error& e) {
        fail(path, e.what());
    }
}

std::string loop_variable(const YAML::Node& node, const std::string& path) {
    if (node["variable"] && node["var"]) {
        fail(path, "only one of 'variable' and 'var' may be given");
    }
    if (node["variable"]) {
        return scalar_text(node["variable"], path + ".variable");
    }
    if (node["var"]) {
        return scalar_text(node["var"], path + ".var");
    }
    return {};
}

std::optional<int64_t> max_iterations(const YAML::Node& node, const std::string& path) {
    if (!node["max_iterations"]) {
        return std::nullopt;
    }
    Value value = ValueConverter::from_yaml(node["max_iterations"]);
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        fail(path + ".max_iterations", "expected a non-negative integer");
    }
    return value.get<int64_t>();
}

}

Condition WorkflowParser::parse_condition(const YAML::Node& node, const std::string& path) {
    static const std::set<std::string> valid_keys = {"operator", "left", "right"};
    check_keys(node, valid_keys, path);

    if (!node["operator"]) {
        fail(path, "missing required field 'operator'");
    }
    std::string name = scalar_text(node["operator"], path + ".operator");
    auto op = parse_condition_operator(name);
    if (!op) {
        fail(path + ".operator", "unknown operator '" + name + "'");
    }

    if (!node["left"] || !node["right"]) {
        fail(path, "condition requires both 'left' and 'right'");
    }

    Condition condition;
    condition.op = *op;
    condition.left = ValueConverter::from_yaml(node["left"]);
    condition.right = ValueConverter::from_yaml(node["right"]);
    return condition;
}

ConditionList WorkflowParser::parse_conditions(const YAML::Node& node, const std::string& path) {
    ConditionList conditions;
    if (node.IsMap()) {
        conditions.push_back(parse_condition(node, path));
    } else if (node.IsSequence()) {
        for (size_t i = 0; i < node.size(); ++i) {
            conditions.push_back(parse_condition(node[i], fmt::format("{}[{}]", path, i)));
        }
        if (conditions.empty()) {
            fail(path, "condition list is empty");
        }
    } else {
        fail(path, "expected a condition mapping or a list of conditions");
    }
    return conditions;
}

LoopSpec WorkflowParser::parse_loop(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        fail(path, "expected a loop mapping with a 'type'");
    }
    if (!node["type"]) {
        fail(path, "missing required field 'type'");
    }

    const std::string type = scalar_text(node["type"], path + ".type");
    auto require = [&](const char* key) -> YAML::Node {
        if (!node[key]) {
            fail(path, fmt::format("{} loop requires '{}'", type, key));
        }
        return node[key];
    };

    if (type == "while" || type == "until") {
        check_keys(node, {"type", "condition", "max_iterations"}, path);
        ConditionList condition = parse_conditions(require("condition"), path + ".condition");
        if (type == "while") {
            return WhileLoop{std::move(condition), max_iterations(node, path)};
        }
        return UntilLoop{std::move(condition), max_iterations(node, path)};
    }

    if (type == "for") {
        check_keys(node, {"type", "start", "end", "step", "variable", "var"}, path);
        ForLoop loop;
        loop.start = ValueConverter::from_yaml(require("start"));
        loop.end = ValueConverter::from_yaml(require("end"));
        if (node["step"]) {
            loop.step = ValueConverter::from_yaml(node["step"]);
        }
        loop.variable = loop_variable(node, path);
        return loop;
    }

    if (type == "for_each" || type == "foreach") {
        check_keys(node, {"type", "items", "variable", "var"}, path);
        ForEachLoop loop;
        loop.items = ValueConverter::from_yaml(require("items"));
        loop.variable = loop_variable(node, path);
        return loop;
    }

    if (type == "repeat") {
        check_keys(node, {"type", "times", "variable", "var"}, path);
        RepeatLoop loop;
        loop.times = ValueConverter::from_yaml(require("times"));
        loop.variable = loop_variable(node, path);
        return loop;
    }

    fail(path + ".type", "unknown loop type '" + type + "' (expected while, until, for, for_each or repeat)");
}

Step WorkflowParser::parse_step(const YAML::Node& node, const std::string& path) {
    static const std::set<std::string> valid_keys = {
        "name", "action", "selector", "value", "data", "timeout", "condition",
        "on_error", "retry", "steps", "else_steps", "description"
    };
    check_keys(node, valid_keys, path);

    Step step;
    if (node["name"]) {
        step.name = scalar_text(node["name"], path + ".name");
    }

    if (!node["action"]) {
        fail(path, "missing required field 'action'");
    }
    std::string action = scalar_text(node["action"], path + ".action");
    auto kind = parse_action_kind(action);
    if (!kind) {
        fail(path + ".action", "unknown action '" + action + "'");
    }
    step.action = *kind;

    if (node["selector"]) {
        step.selector = scalar_text(node["selector"], path + ".selector");
    }

    if (node["value"]) {
        if (!StepParserRegistry::apply(node["value"], step, path + ".value")) {
            step.value = ValueConverter::from_yaml(node["value"]);
        }
    }

    if (node["data"]) {
        step.data = ValueConverter::from_yaml(node["data"]);
    }

    if (node["timeout"]) {
        Value timeout = ValueConverter::from_yaml(node["timeout"]);
        if (!timeout.is_number()) {
            fail(path + ".timeout", "expected a number of seconds");
        }
        step.timeout = timeout.get<double>();
    }

    if (node["condition"]) {
        step.condition = parse_conditions(node["condition"], path + ".condition");
    }

    if (node["on_error"]) {
        step.on_error = parse_policy(node["on_error"], path + ".on_error");
    }
    if (node["retry"]) {
        step.retry = parse_retry(node["retry"], path + ".retry");
        if (!step.on_error) {
            step.on_error = ErrorPolicy::Retry;
        }
    }

    if (node["steps"]) {
        step.steps = parse_steps(node["steps"], path + ".steps");
    }
    if (node["else_steps"]) {
        step.else_steps = parse_steps(node["else_steps"], path + ".else_steps");
    }

    return step;
}

std::vector<Step> WorkflowParser::parse_steps(const YAML::Node& node, const std::string& path) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        fail(path, "expected a list of steps");
    }

    std::vector<Step> steps;
    steps.reserve(node.size());
    for (size_t i = 0; i < node.size(); ++i) {
        steps.push_back(parse_step(node[i], fmt::format("{}[{}]", path, i)));
    }
    return steps;
}

void WorkflowParser::apply_defaults(std::vector<Step>& steps,
                                    const std::optional<ErrorPolicy>& policy,
                                    const std::optional<RetryConfig>& retry) {
    for (auto& step : steps) {
        if (!step.on_error && policy) {
            step.on_error = policy;
        }
        if (step.on_error == ErrorPolicy::Retry && !step.retry && retry) {
            step.retry = retry;
        }
        apply_defaults(step.steps, policy, retry);
        apply_defaults(step.else_steps, policy, retry);
    }
}

Workflow WorkflowParser::parse(const YAML::Node& root) {
    static const std::set<std::string> valid_keys = {
        "name", "version", "description", "variables", "on_error", "retry", "steps"
    };
    check_keys(root, valid_keys, "workflow");

    Workflow workflow;
    if (root["name"]) {
        workflow.name = scalar_text(root["name"], "name");
    }
    if (root["version"]) {
        workflow.version = scalar_text(root["version"], "version");
    }
    if (root["description"]) {
        workflow.description = scalar_text(root["description"], "description");
    }

    if (root["variables"]) {
        const auto& vars = root["variables"];
        if (!vars.IsMap() && !vars.IsNull()) {
            fail("variables", "expected a mapping");
        }
        for (auto it = vars.begin(); it != vars.end(); ++it) {
            workflow.variables[it->first.as<std::string>()] = ValueConverter::from_yaml(it->second);
        }
    }

    std::optional<ErrorPolicy> default_policy;
    std::optional<RetryConfig> default_retry;
    if (root["on_error"]) {
        default_policy = parse_policy(root["on_error"], "on_error");
    }
    if (root["retry"]) {
        default_retry = parse_retry(root["retry"], "retry");
    }

    if (root["steps"]) {
        workflow.steps = parse_steps(root["steps"], "steps");
    }
    apply_defaults(workflow.steps, default_policy, default_retry);

    return workflow;
}

Workflow WorkflowParser::parse_string(const std::string& content) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw ValidationError(std::string("malformed document: ") + e.what());
    }
    return parse(root);
}

Workflow WorkflowParser::parse_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ValidationError("cannot open workflow file '" + path + "'");
    } catch (const YAML::Exception& e) {
        throw ValidationError("malformed workflow file '" + path + "': " + e.what());
    }
    return parse(root);
}
