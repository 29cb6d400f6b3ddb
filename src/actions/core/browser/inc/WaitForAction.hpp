#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

// Blocks until selector appears, TimeoutError after params.timeout seconds
class WaitForAction : public ActionBase {
public:
    explicit WaitForAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "wait_for",
            [](ActionContext& context) {
                return std::make_unique<WaitForAction>(context);
            });
        return true;
    }();
};
