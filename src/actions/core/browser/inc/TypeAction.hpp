#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

// Types the text in value into selector
class TypeAction : public ActionBase {
public:
    explicit TypeAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "type",
            [](ActionContext& context) {
                return std::make_unique<TypeAction>(context);
            });
        return true;
    }();
};
