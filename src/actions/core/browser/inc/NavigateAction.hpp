#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

// Opens the URL in value, binds the URL
class NavigateAction : public ActionBase {
public:
    explicit NavigateAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "navigate",
            [](ActionContext& context) {
                return std::make_unique<NavigateAction>(context);
            });
        return true;
    }();
};
