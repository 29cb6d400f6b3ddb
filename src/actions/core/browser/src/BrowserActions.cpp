#include "NavigateAction.hpp"
#include "ClickAction.hpp"
#include "TypeAction.hpp"
#include "SetInputFilesAction.hpp"
#include "WaitForAction.hpp"
#include "ExtractAction.hpp"
#include "ScriptAction.hpp"
#include "GetTextAction.hpp"
#include "GetAttributeAction.hpp"
#include "HoverAction.hpp"
#include "ScreenshotAction.hpp"
#include "WorkflowErrors.hpp"
#include "LogUtils.hpp"
#include <fmt/format.h>

namespace {

[[noreturn]] void driver_failure(const ActionContext& context, const std::string& operation, const std::string& target) {
    std::string reason = context.driver.last_error();
    throw StepExecutionError(fmt::format("{} {} failed: {}", operation, target,
                                         reason.empty() ? "unknown driver error" : reason));
}

}

Value NavigateAction::execute(const ActionParams& params) {
    std::string url = params.value_text();
    if (!context_.driver.navigate(url)) {
        driver_failure(context_, "navigate", url);
    }
    return url;
}

Value ClickAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    if (!context_.driver.click(selector)) {
        driver_failure(context_, "click", selector);
    }
    return true;
}

Value TypeAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    if (!context_.driver.type(selector, params.value_text())) {
        driver_failure(context_, "type into", selector);
    }
    return true;
}

Value SetInputFilesAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    if (!context_.driver.set_input_files(selector, params.value_text())) {
        driver_failure(context_, "set_input_files on", selector);
    }
    return true;
}

Value WaitForAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    if (!context_.driver.wait_for(selector, params.timeout)) {
        std::string reason = context_.driver.last_error();
        throw TimeoutError(fmt::format("Timed out after {}s waiting for '{}'{}", params.timeout, selector,
                                       reason.empty() ? "" : ": " + reason));
    }
    return true;
}

Value ExtractAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    Value field_map = params.value.value_or(Value::object());

    auto records = context_.driver.extract(selector, field_map);
    if (!records) {
        driver_failure(context_, "extract", selector);
    }

    LogUtils::debug("Extracted {} record(s) from {}", records->size(), selector);
    return std::move(*records);
}

Value ScriptAction::execute(const ActionParams& params) {
    std::string script = params.value_text();
    auto result = (mode_ == Mode::Evaluate) ? context_.driver.evaluate(script)
                                            : context_.driver.execute_script(script);
    if (!result) {
        driver_failure(context_, mode_ == Mode::Evaluate ? "evaluate" : "execute_script", "script");
    }
    return std::move(*result);
}

Value GetTextAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    auto text = context_.driver.get_text(selector);
    if (!text) {
        driver_failure(context_, "get_text", selector);
    }
    return *text;
}

Value GetAttributeAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    std::string attribute = params.value_text();
    if (attribute.empty()) {
        throw StepExecutionError("get_attribute on " + selector + " needs an attribute name");
    }

    auto value = context_.driver.get_attribute(selector, attribute);
    if (!value) {
        driver_failure(context_, "get_attribute " + attribute + " of", selector);
    }
    return std::move(*value);
}

Value HoverAction::execute(const ActionParams& params) {
    const auto& selector = params.require_selector();
    if (!context_.driver.hover(selector)) {
        driver_failure(context_, "hover over", selector);
    }
    return true;
}

Value ScreenshotAction::execute(const ActionParams& params) {
    std::string path = params.value ? params.value_text() : "screenshot.png";
    if (!context_.driver.screenshot(path)) {
        driver_failure(context_, "screenshot to", path);
    }
    return path;
}
