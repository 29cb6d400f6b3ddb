#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"
#include "WorkflowErrors.hpp"

class LoadAction : public ActionBase {
public:
    explicit LoadAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override {
        std::string path = params.value_text();
        auto loaded = context_.storage.load(path);
        if (!loaded) {
            throw StepExecutionError("load from " + path + " failed: " + context_.storage.last_error());
        }
        return std::move(*loaded);
    }

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "load",
            [](ActionContext& context) {
                return std::make_unique<LoadAction>(context);
            });
        return true;
    }();
};
