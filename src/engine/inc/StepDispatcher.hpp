#pragma once

#include "ActionContext.hpp"
#include "PolicyExecutor.hpp"
#include "Step.hpp"
#include "TemplateResolver.hpp"

// Executes the control-flow actions, implemented by the runner which owns
// the step tree walk
class ControlFlowHandler {
public:
    virtual ~ControlFlowHandler() = default;

    virtual StepResult execute_if(const Step& step, int depth) = 0;
    virtual StepResult execute_loop(const Step& step, int depth) = 0;
};

// Maps a step to its handler. Leaf actions are created through the
// ActionFactory and run under the step's error policy.
class StepDispatcher {
public:
    StepDispatcher(ActionContext& context,
                   const TemplateResolver& resolver,
                   const PolicyExecutor& policy,
                   ControlFlowHandler& control);

    StepResult dispatch(const Step& step, int depth);

    // Resolves selector, value and data against the current Environment
    ActionParams resolve_params(const Step& step) const;

private:
    Value invoke_leaf(const Step& step);

    ActionContext& context_;
    const TemplateResolver& resolver_;
    const PolicyExecutor& policy_;
    ControlFlowHandler& control_;
};
