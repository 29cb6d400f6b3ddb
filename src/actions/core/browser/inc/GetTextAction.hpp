#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

class GetTextAction : public ActionBase {
public:
    explicit GetTextAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "get_text",
            [](ActionContext& context) {
                return std::make_unique<GetTextAction>(context);
            });
        return true;
    }();
};
