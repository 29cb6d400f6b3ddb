#include "StepDispatcher.hpp"
#include "ActionFactory.hpp"
#include "LogUtils.hpp"

// Including the action headers registers them with the ActionFactory
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
#include "WaitAction.hpp"
#include "SaveAction.hpp"
#include "LoadAction.hpp"
#include "SetVariableAction.hpp"
#include "StopAction.hpp"

StepDispatcher::StepDispatcher(ActionContext& context,
                               const TemplateResolver& resolver,
                               const PolicyExecutor& policy,
                               ControlFlowHandler& control)
    : context_(context), resolver_(resolver), policy_(policy), control_(control) {}

ActionParams StepDispatcher::resolve_params(const Step& step) const {
    ActionParams params;
    params.step_name = step.display_name();
    params.timeout = step.timeout.value_or(context_.global.driver.default_timeout);

    if (step.selector) {
        params.selector = resolver_.resolve_string(*step.selector, context_.env);
    }
    if (step.value) {
        params.value = resolver_.resolve_value(*step.value, context_.env);
    }
    if (step.data) {
        params.data = resolver_.resolve_value(*step.data, context_.env);
    }
    return params;
}

Value StepDispatcher::invoke_leaf(const Step& step) {
    ActionParams params = resolve_params(step);
    auto action = ActionFactory::instance().create_action(to_string(step.action), context_);
    return action->execute(params);
}

StepResult StepDispatcher::dispatch(const Step& step, int depth) {
    switch (step.action) {
        case ActionKind::If:
            return control_.execute_if(step, depth);
        case ActionKind::Loop:
            return control_.execute_loop(step, depth);
        default:
            break;
    }

    return policy_.execute(step, [this, &step]() { return invoke_leaf(step); });
}
