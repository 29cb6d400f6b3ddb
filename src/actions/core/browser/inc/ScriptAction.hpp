#pragma once
#include "ActionBase.hpp"
#include "ActionFactory.hpp"

// Runs the script in value and binds its result. "evaluate" reads a value
// from the page, "execute_script" runs statements for their side effects.
class ScriptAction : public ActionBase {
public:
    enum class Mode { Evaluate, Execute };

    ScriptAction(ActionContext& context, Mode mode) : context_(context), mode_(mode) {}

    Value execute(const ActionParams& params) override;

private:
    ActionContext& context_;
    Mode mode_;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "evaluate",
            [](ActionContext& context) {
                return std::make_unique<ScriptAction>(context, Mode::Evaluate);
            });
        ActionFactory::instance().register_action(
            "execute_script",
            [](ActionContext& context) {
                return std::make_unique<ScriptAction>(context, Mode::Execute);
            });
        return true;
    }();
};
