#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"
#include "LogUtils.hpp"

// Binds value (null when absent) to the variable named by selector
class SetVariableAction : public ActionBase {
public:
    explicit SetVariableAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override {
        const auto& name = params.require_selector();
        Value value = params.value.value_or(Value());

        LogUtils::debug("Set variable {} = {}", name, value.dump());
        context_.env.set(name, value);
        return value;
    }

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "set_variable",
            [](ActionContext& context) {
                return std::make_unique<SetVariableAction>(context);
            });
        return true;
    }();
};
