#pragma once

#include "ActionContext.hpp"
#include "Value.hpp"

class ActionBase {
public:
    virtual ~ActionBase() = default;

    // Runs the action with resolved parameters and returns the value bound
    // for later steps. Failures are thrown as WorkflowError subclasses.
    virtual Value execute(const ActionParams& params) = 0;
};
