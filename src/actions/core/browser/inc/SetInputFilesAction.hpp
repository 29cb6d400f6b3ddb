#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

// Attaches the file path in value to a file input
class SetInputFilesAction : public ActionBase {
public:
    explicit SetInputFilesAction(ActionContext& context) : context_(context) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "set_input_files",
            [](ActionContext& context) {
                return std::make_unique<SetInputFilesAction>(context);
            });
        return true;
    }();
};
