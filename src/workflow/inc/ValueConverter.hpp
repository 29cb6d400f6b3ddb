#pragma once

#include "Value.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

// Conversions between yaml-cpp nodes and Value. Plain scalars are typed
// (true/false, null/~, integers, floats), quoted scalars always stay strings.
namespace ValueConverter {

Value from_yaml(const YAML::Node& node);

// Plain scalar text to its typed value
Value from_scalar(const std::string& text);

std::string to_yaml_string(const Value& value);

void emit(YAML::Emitter& out, const Value& value);

}
