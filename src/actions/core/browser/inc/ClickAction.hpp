#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

class ClickAction : public ActionBase {
public:
    explicit ClickAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "click",
            [](ActionContext& context) {
                return std::make_unique<ClickAction>(context);
            });
        return true;
    }();
};
