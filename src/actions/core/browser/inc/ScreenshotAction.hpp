#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

class ScreenshotAction : public ActionBase {
public:
    explicit ScreenshotAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "screenshot",
            [](ActionContext& context) {
                return std::make_unique<ScreenshotAction>(context);
            });
        return true;
    }();
};
