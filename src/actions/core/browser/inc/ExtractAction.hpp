#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

// Reads records matching selector. value, when a mapping, names the fields
// to extract; binds a sequence of mappings.
class ExtractAction : public ActionBase {
public:
    explicit ExtractAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "extract",
            [](ActionContext& context) {
                return std::make_unique<ExtractAction>(context);
            });
        return true;
    }();
};
