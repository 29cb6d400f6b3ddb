#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"
#include "LogUtils.hpp"

// Ends the run early. Steps after this one are not executed and the run
// still reports completed.
class StopAction : public ActionBase {
public:
    explicit StopAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override {
        LogUtils::info("Stop requested by step '{}'", params.step_name);
        context_.stop_requested = true;
        return true;
    }

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "stop",
            [](ActionContext& context) {
                return std::make_unique<StopAction>(context);
            });
        return true;
    }();
};
