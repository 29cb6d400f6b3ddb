#include "Value.hpp"
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace ValueUtils {

std::string to_text(const Value& value) {
    switch (value.type()) {
        case Value::value_t::string:
            return value.get<std::string>();
        case Value::value_t::number_integer:
            return std::to_string(value.get<int64_t>());
        case Value::value_t::number_unsigned:
            return std::to_string(value.get<uint64_t>());
        case Value::value_t::number_float: {
            double d = value.get<double>();
            if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e15) {
                return std::to_string(static_cast<int64_t>(d));
            }
            return fmt::format("{}", d);
        }
        default:
            return value.dump();
    }
}

bool fits_int64(const Value& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return value.is_number_integer();
}

const char* type_name(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:            return "null";
        case Value::value_t::boolean:         return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:    return "number";
        case Value::value_t::string:          return "string";
        case Value::value_t::array:           return "sequence";
        case Value::value_t::object:          return "mapping";
        default:                              return "unknown";
    }
}

bool is_truthy(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:    return false;
        case Value::value_t::boolean: return value.get<bool>();
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return value.get<double>() != 0.0;
        case Value::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case Value::value_t::array:
        case Value::value_t::object:
            return !value.empty();
        default:
            return false;
    }
}

Value from_map(const ValueMap& map) {
    Value object = Value::object();
    for (const auto& [key, value] : map) {
        object[key] = value;
    }
    return object;
}

}
