#pragma once

#include "Environment.hpp"
#include "Step.hpp"
#include <string>

// Stores step results in the Environment. The key is derived, in order of
// precedence, from:
//   1. the step name, when not empty
//   2. the action and selector ("click #submit" -> click_submit)
//   3. the action alone
// normalized to lowercase with non-alphanumeric runs collapsed to '_'. Keys
// starting with a digit get a "step_" prefix. Later bindings overwrite
// earlier ones with the same key.
class ResultBinder {
public:
    static std::string derive_key(const Step& step);

    static std::string normalize(const std::string& text);

    // Returns the key used
    std::string bind(const Step& step, const Value& result, Environment& env) const;
};
