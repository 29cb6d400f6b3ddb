#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

class HoverAction : public ActionBase {
public:
    explicit HoverAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "hover",
            [](ActionContext& context) {
                return std::make_unique<HoverAction>(context);
            });
        return true;
    }();
};
