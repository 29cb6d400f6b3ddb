#include "Environment.hpp"
#include "WorkflowErrors.hpp"

Environment::Environment(const ValueMap& seed) : vars_(seed) {}

void Environment::seed(const ValueMap& values) {
    for (const auto& [name, value] : values) {
        vars_[name] = value;
    }
}

void Environment::set(const std::string& name, Value value) {
    vars_[name] = std::move(value);
}

bool Environment::erase(const std::string& name) {
    return vars_.erase(name) > 0;
}

void Environment::clear() {
    vars_.clear();
}

bool Environment::contains(const std::string& name) const {
    return vars_.find(name) != vars_.end();
}

const Value& Environment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        throw ReferenceError(name);
    }
    return it->second;
}

const Value* Environment::find(const std::string& name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

ValueMap Environment::snapshot(const std::vector<std::string>& names) const {
    ValueMap subset;
    for (const auto& name : names) {
        auto it = vars_.find(name);
        if (it != vars_.end()) {
            subset.emplace(name, it->second);
        }
    }
    return subset;
}
