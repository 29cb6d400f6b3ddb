#pragma once

#include <optional>
#include <string>

enum class ActionKind {
    Navigate,
    Click,
    Type,
    Wait,
    WaitFor,
    Extract,
    Evaluate,
    ExecuteScript,
    Save,
    Load,
    SetVariable,
    SetInputFiles,
    GetText,
    GetAttribute,
    Hover,
    Screenshot,
    Stop,
    If,
    Loop
};

// Document identifier of an action, e.g. "wait_for"
const char* to_string(ActionKind kind);

std::optional<ActionKind> parse_action_kind(const std::string& name);

inline bool is_control_flow(ActionKind kind) {
    return kind == ActionKind::If || kind == ActionKind::Loop;
}
