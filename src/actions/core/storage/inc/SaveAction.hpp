#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"
#include "WorkflowErrors.hpp"
#include "LogUtils.hpp"

// Persists data (the whole Environment when absent) to the path in value
class SaveAction : public ActionBase {
public:
    explicit SaveAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override {
        std::string path = params.value_text();
        Value payload = params.data ? *params.data : ValueUtils::from_map(context_.env.snapshot());

        if (!context_.storage.save(path, payload)) {
            throw StepExecutionError("save to " + path + " failed: " + context_.storage.last_error());
        }

        LogUtils::info("Saved {} to {}", ValueUtils::type_name(payload), path);
        return path;
    }

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "save",
            [](ActionContext& context) {
                return std::make_unique<SaveAction>(context);
            });
        return true;
    }();
};
