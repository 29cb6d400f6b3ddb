#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"
#include "WorkflowErrors.hpp"
#include "StringUtils.hpp"

// Pauses the run for value seconds and binds the duration
class WaitAction : public ActionBase {
public:
    explicit WaitAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override {
        const Value& value = params.require_value();

        std::optional<double> seconds;
        if (value.is_number()) {
            seconds = value.get<double>();
        } else if (value.is_string()) {
            seconds = StringUtils::parse_number(value.get<std::string>());
        }
        if (!seconds || *seconds < 0) {
            throw TypeMismatchError("wait expects a non-negative number of seconds, got " + value.dump());
        }

        context_.driver.wait(*seconds);
        return *seconds;
    }

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "wait",
            [](ActionContext& context) {
                return std::make_unique<WaitAction>(context);
            });
        return true;
    }();
};
