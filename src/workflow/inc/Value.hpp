#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

// Dynamic value flowing through a workflow: null, boolean, number, string,
// sequence or mapping
using Value = nlohmann::json;
using ValueMap = std::map<std::string, Value>;

namespace ValueUtils {

// Text form used when a value is interpolated into a larger string
std::string to_text(const Value& value);

const char* type_name(const Value& value);

bool is_truthy(const Value& value);

// Integer that converts to int64_t without wrapping
bool fits_int64(const Value& value);

Value from_map(const ValueMap& map);

}
