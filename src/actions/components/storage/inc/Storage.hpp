#pragma once

#include "Value.hpp"
#include <optional>
#include <string>

// Workflow-scoped persistence consumed by save/load steps
class Storage {
public:
    virtual ~Storage() = default;

    virtual bool save(const std::string& path, const Value& value) = 0;
    virtual std::optional<Value> load(const std::string& path) = 0;

    virtual std::string last_error() const = 0;
};
