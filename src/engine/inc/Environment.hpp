#pragma once

#include "Value.hpp"
#include <string>
#include <vector>

// Variable store threaded through one workflow execution. Control-flow bodies
// share it with their parent sequence, there are no child scopes.
class Environment {
public:
    Environment() = default;
    explicit Environment(const ValueMap& seed);

    void seed(const ValueMap& values);
    void set(const std::string& name, Value value);
    bool erase(const std::string& name);
    void clear();

    bool contains(const std::string& name) const;

    // Throws ReferenceError when the variable is not bound
    const Value& get(const std::string& name) const;
    const Value* find(const std::string& name) const;

    size_t size() const noexcept { return vars_.size(); }

    const ValueMap& snapshot() const noexcept { return vars_; }

    // Caller-selected subset, names that are not bound are left out
    ValueMap snapshot(const std::vector<std::string>& names) const;

private:
    ValueMap vars_;
};
