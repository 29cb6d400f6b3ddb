#include "WorkflowValidator.hpp"
#include "ResultBinder.hpp"
#include "TemplateResolver.hpp"
#include "WorkflowErrors.hpp"
#include "LogUtils.hpp"
#include <regex>
#include <type_traits>
#include <fmt/format.h>

namespace {

void check_template(const Value& value, const std::string& path, ValidationReport& report) {
    try {
        TemplateResolver::check_syntax(value);
    } catch (const ValidationError& e) {
        report.errors.push_back(path + ": " + e.errors().front());
    }
}

void check_conditions(const ConditionList& conditions, const std::string& path, ValidationReport& report) {
    for (size_t i = 0; i < conditions.size(); ++i) {
        const auto& condition = conditions[i];
        std::string item = conditions.size() == 1 ? path : fmt::format("{}[{}]", path, i);
        check_template(condition.left, item + ".left", report);
        check_template(condition.right, item + ".right", report);

        // Literal patterns can be compiled up front
        if (condition.op == ConditionOperator::Matches && condition.right.is_string() &&
            !TemplateResolver::has_placeholders(condition.right.get<std::string>())) {
            try {
                std::regex pattern(condition.right.get<std::string>(), std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                report.errors.push_back(fmt::format("{}.right: invalid regular expression: {}", item, e.what()));
            }
        }
    }
}

bool is_identifier(const std::string& name) {
    static const std::regex pattern("[A-Za-z_][A-Za-z0-9_]*");
    return std::regex_match(name, pattern);
}

void check_variable(const std::string& variable, bool required, const std::string& path, ValidationReport& report) {
    if (variable.empty()) {
        if (required) {
            report.errors.push_back(path + ": loop requires 'variable'");
        }
    } else if (!is_identifier(variable)) {
        report.errors.push_back(fmt::format("{}.variable: '{}' is not a valid variable name", path, variable));
    }
}

}

ValidationReport WorkflowValidator::validate(const Workflow& workflow) const {
    ValidationReport report;

    if (workflow.name.empty()) {
        report.errors.push_back("name: missing required field");
    }
    if (workflow.version.empty()) {
        report.errors.push_back("version: missing required field");
    }
    if (workflow.steps.empty()) {
        report.errors.push_back("steps: workflow must contain at least one step");
    }

    for (const auto& [name, value] : workflow.variables) {
        if (!is_identifier(name)) {
            report.errors.push_back(fmt::format("variables.{}: not a valid variable name", name));
        }
    }

    std::map<std::string, std::string> keys;
    check_steps(workflow.steps, "steps", 0, report, keys);
    return report;
}

void WorkflowValidator::validate_or_throw(const Workflow& workflow) const {
    ValidationReport report = validate(workflow);
    for (const auto& warning : report.warnings) {
        LogUtils::warn("Workflow {}: {}", workflow.name, warning);
    }
    if (!report.ok()) {
        throw ValidationError(report.errors);
    }
}

void WorkflowValidator::check_steps(const std::vector<Step>& steps, const std::string& path, int depth,
                                    ValidationReport& report, std::map<std::string, std::string>& keys) const {
    for (size_t i = 0; i < steps.size(); ++i) {
        check_step(steps[i], fmt::format("{}[{}]", path, i), depth, report, keys);
    }
}

void WorkflowValidator::check_step(const Step& step, const std::string& path, int depth,
                                   ValidationReport& report, std::map<std::string, std::string>& keys) const {
    const std::string action = to_string(step.action);
    auto missing = [&](const char* field) {
        report.errors.push_back(fmt::format("{}: {} step '{}' requires '{}'", path, action, step.display_name(), field));
    };

    switch (step.action) {
        case ActionKind::Navigate:
        case ActionKind::Evaluate:
        case ActionKind::ExecuteScript:
        case ActionKind::Wait:
        case ActionKind::Save:
        case ActionKind::Load:
            if (!step.value) missing("value");
            break;
        case ActionKind::Click:
        case ActionKind::WaitFor:
        case ActionKind::Extract:
        case ActionKind::GetText:
        case ActionKind::Hover:
        case ActionKind::SetVariable:
            if (!step.selector) missing("selector");
            break;
        case ActionKind::Screenshot:
        case ActionKind::Stop:
            break;
        case ActionKind::Type:
        case ActionKind::SetInputFiles:
        case ActionKind::GetAttribute:
            if (!step.selector) missing("selector");
            if (!step.value) missing("value");
            break;
        case ActionKind::If:
            if (!std::holds_alternative<ConditionList>(step.control)) missing("value");
            if (step.steps.empty()) missing("steps");
            break;
        case ActionKind::Loop:
            if (!std::holds_alternative<LoopSpec>(step.control)) missing("value");
            if (step.steps.empty()) missing("steps");
            break;
    }

    if (!is_control_flow(step.action) && !step.steps.empty()) {
        report.errors.push_back(fmt::format("{}: only if and loop steps may contain 'steps'", path));
    }
    if (step.action != ActionKind::If && !step.else_steps.empty()) {
        report.errors.push_back(fmt::format("{}: 'else_steps' is only allowed on if steps", path));
    }
    if (step.data && step.action != ActionKind::Save) {
        report.warnings.push_back(fmt::format("{}: 'data' is ignored by {} steps", path, action));
    }

    if (step.action == ActionKind::Wait && step.value && step.value->is_number() && step.value->get<double>() < 0) {
        report.errors.push_back(fmt::format("{}.value: wait duration must not be negative", path));
    }
    if (step.timeout && *step.timeout <= 0) {
        report.errors.push_back(fmt::format("{}.timeout: must be positive", path));
    }

    if (step.retry) {
        if (step.effective_policy() != ErrorPolicy::Retry) {
            report.errors.push_back(fmt::format("{}: 'retry' given but on_error is '{}'",
                                                path, to_string(step.effective_policy())));
        }
        if (step.retry->max_attempts < 1) {
            report.errors.push_back(fmt::format("{}.retry.max_attempts: must be at least 1", path));
        }
        if (step.retry->delay_seconds < 0) {
            report.errors.push_back(fmt::format("{}.retry.delay_seconds: must not be negative", path));
        }
    }

    if (step.selector) check_template(*step.selector, path + ".selector", report);
    if (step.value) check_template(*step.value, path + ".value", report);
    if (step.data) check_template(*step.data, path + ".data", report);
    if (step.condition) check_conditions(*step.condition, path + ".condition", report);

    if (const auto* condition = std::get_if<ConditionList>(&step.control)) {
        check_conditions(*condition, path + ".value", report);
    } else if (const auto* loop = std::get_if<LoopSpec>(&step.control)) {
        check_loop(*loop, path + ".value", report);
    }

    // Identical keys from distinct steps overwrite each other at run time
    if (!is_control_flow(step.action)) {
        std::string key = ResultBinder::derive_key(step);
        auto [it, inserted] = keys.emplace(key, path);
        if (!inserted) {
            report.warnings.push_back(fmt::format("{}: result key '{}' is also bound by {}", path, key, it->second));
        }
    }

    if (step.steps.empty() && step.else_steps.empty()) {
        return;
    }
    if (depth + 1 >= max_nesting_depth_) {
        report.errors.push_back(fmt::format("{}: nesting deeper than {} levels", path, max_nesting_depth_));
        return;
    }
    check_steps(step.steps, path + ".steps", depth + 1, report, keys);
    check_steps(step.else_steps, path + ".else_steps", depth + 1, report, keys);
}

void WorkflowValidator::check_loop(const LoopSpec& loop, const std::string& path, ValidationReport& report) const {
    std::visit([&](const auto& spec) {
        using T = std::decay_t<decltype(spec)>;
        if constexpr (std::is_same_v<T, WhileLoop> || std::is_same_v<T, UntilLoop>) {
            check_conditions(spec.condition, path + ".condition", report);
        } else if constexpr (std::is_same_v<T, ForLoop>) {
            check_template(spec.start, path + ".start", report);
            check_template(spec.end, path + ".end", report);
            check_template(spec.step, path + ".step", report);
            if (spec.step.is_number() && spec.step.template get<double>() == 0.0) {
                report.errors.push_back(path + ".step: must not be zero");
            }
            check_variable(spec.variable, true, path, report);
        } else if constexpr (std::is_same_v<T, ForEachLoop>) {
            check_template(spec.items, path + ".items", report);
            if (!spec.items.is_string() && !spec.items.is_array()) {
                report.errors.push_back(fmt::format("{}.items: expected a sequence or a template, got {}",
                                                    path, ValueUtils::type_name(spec.items)));
            }
            check_variable(spec.variable, true, path, report);
        } else if constexpr (std::is_same_v<T, RepeatLoop>) {
            check_template(spec.times, path + ".times", report);
            if (spec.times.is_number() && (!spec.times.is_number_integer() || spec.times.template get<int64_t>() < 0)) {
                report.errors.push_back(path + ".times: must be a non-negative integer");
            }
            check_variable(spec.variable, false, path, report);
        }
    }, loop);
}
