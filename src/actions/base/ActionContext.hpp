#pragma once

#include "BrowserDriver.hpp"
#include "Environment.hpp"
#include "GlobalConfig.hpp"
#include "Storage.hpp"
#include "Value.hpp"
#include <optional>
#include <string>

// Collaborators shared by every action of one run
struct ActionContext {
    BrowserDriver& driver;
    Storage& storage;
    Environment& env;
    const GlobalConfig& global;

    // Set by a stop step, the runner ends the run as completed
    bool stop_requested = false;
};

// Step fields after template resolution
struct ActionParams {
    std::string step_name;
    std::optional<std::string> selector;
    std::optional<Value> value;
    std::optional<Value> data;
    double timeout = 30.0;

    const std::string& require_selector() const;
    const Value& require_value() const;
    std::string value_text() const;
};
