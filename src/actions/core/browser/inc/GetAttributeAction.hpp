#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

class GetAttributeAction : public ActionBase {
public:
    explicit GetAttributeAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "get_attribute",
            [](ActionContext& context) {
                return std::make_unique<GetAttributeAction>(context);
            });
        return true;
    }();
};
