#pragma once

#include "ActionContext.hpp"
#include "CancellationToken.hpp"
#include "ConditionEvaluator.hpp"
#include "Environment.hpp"
#include "ExecutionResult.hpp"
#include "GlobalConfig.hpp"
#include "PolicyExecutor.hpp"
#include "ResultBinder.hpp"
#include "StepDispatcher.hpp"
#include "TemplateResolver.hpp"
#include "Workflow.hpp"

// Executes one workflow: seeds the Environment, walks the step tree in
// document order and records one outcome per executed step. Step failures
// end up in the returned ExecutionResult, run() does not throw for them.
class WorkflowRunner : public ControlFlowHandler {
public:
    WorkflowRunner(Workflow workflow, BrowserDriver& driver, Storage& storage, GlobalConfig global = {});

    WorkflowRunner(const WorkflowRunner&) = delete;
    WorkflowRunner& operator=(const WorkflowRunner&) = delete;

    // overrides are applied on top of the workflow variables
    ExecutionResult run(const ValueMap& overrides = {});

    void set_sleeper(PolicyExecutor::Sleeper sleeper) { policy_.set_sleeper(std::move(sleeper)); }
    void set_cancellation_token(const CancellationToken* token) { cancel_token_ = token; }

    const Environment& environment() const noexcept { return env_; }
    const Workflow& workflow() const noexcept { return workflow_; }

    StepResult execute_if(const Step& step, int depth) override;
    StepResult execute_loop(const Step& step, int depth) override;

private:
    void execute_sequence(const std::vector<Step>& steps, int depth);
    void execute_step(const Step& step, int depth);

    StepResult run_loop(const Step& step, const WhileLoop& loop, int depth);
    StepResult run_loop(const Step& step, const UntilLoop& loop, int depth);
    StepResult run_loop(const Step& step, const ForLoop& loop, int depth);
    StepResult run_loop(const Step& step, const ForEachLoop& loop, int depth);
    StepResult run_loop(const Step& step, const RepeatLoop& loop, int depth);

    // Shared by while and until, body runs while the condition equals expected
    StepResult run_conditional_loop(const Step& step, const ConditionList& condition,
                                    std::optional<int64_t> max_iterations, bool expected, int depth);

    Workflow workflow_;
    GlobalConfig global_;
    Environment env_;
    TemplateResolver resolver_;
    ConditionEvaluator conditions_;
    PolicyExecutor policy_;
    ResultBinder binder_;
    ActionContext context_;
    StepDispatcher dispatcher_;
    const CancellationToken* cancel_token_ = nullptr;
    ExecutionResult result_;

    // Set once the outcome of the step that raised a failure is recorded
    bool failure_recorded_ = false;
};
