#include "ActionKind.hpp"
#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<ActionKind, const char*>, 19> action_names = {{
    {ActionKind::Navigate,      "navigate"},
    {ActionKind::Click,         "click"},
    {ActionKind::Type,          "type"},
    {ActionKind::Wait,          "wait"},
    {ActionKind::WaitFor,       "wait_for"},
    {ActionKind::Extract,       "extract"},
    {ActionKind::Evaluate,      "evaluate"},
    {ActionKind::ExecuteScript, "execute_script"},
    {ActionKind::Save,          "save"},
    {ActionKind::Load,          "load"},
    {ActionKind::SetVariable,   "set_variable"},
    {ActionKind::SetInputFiles, "set_input_files"},
    {ActionKind::GetText,       "get_text"},
    {ActionKind::GetAttribute,  "get_attribute"},
    {ActionKind::Hover,         "hover"},
    {ActionKind::Screenshot,    "screenshot"},
    {ActionKind::Stop,          "stop"},
    {ActionKind::If,            "if"},
    {ActionKind::Loop,          "loop"},
}};

}

const char* to_string(ActionKind kind) {
    for (const auto& [k, name] : action_names) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<ActionKind> parse_action_kind(const std::string& name) {
    for (const auto& [k, action_name] : action_names) {
        if (name == action_name) return k;
    }
    return std::nullopt;
}
