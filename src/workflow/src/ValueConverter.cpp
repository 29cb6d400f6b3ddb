#include "ValueConverter.hpp"
#include "StringUtils.hpp"
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace ValueConverter {

namespace {

bool is_null_literal(const std::string& text) {
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

std::optional<bool> bool_literal(const std::string& text) {
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;
    return std::nullopt;
}

std::optional<int64_t> integer_literal(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (start == text.size()) {
        return std::nullopt;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

}

Value from_scalar(const std::string& text) {
    if (is_null_literal(text)) {
        return nullptr;
    }
    if (auto b = bool_literal(text)) {
        return *b;
    }
    if (auto i = integer_literal(text)) {
        return *i;
    }
    if (auto d = StringUtils::parse_number(text)) {
        return *d;
    }
    return text;
}

Value from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Scalar:
            // yaml-cpp tags quoted scalars with "!"
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return from_scalar(node.Scalar());

        case YAML::NodeType::Sequence: {
            Value array = Value::array();
            for (const auto& item : node) {
                array.push_back(from_yaml(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            Value object = Value::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                object[it->first.as<std::string>()] = from_yaml(it->second);
            }
            return object;
        }
    }
    throw std::runtime_error("Unsupported YAML node type");
}

void emit(YAML::Emitter& out, const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
            out << YAML::Null;
            break;
        case Value::value_t::boolean:
            out << value.get<bool>();
            break;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            out << ValueUtils::to_text(value);
            break;
        case Value::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            // Quote strings a plain scalar would read back as another type
            if (!from_scalar(text).is_string()) {
                out << YAML::DoubleQuoted << text;
            } else {
                out << text;
            }
            break;
        }
        case Value::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : value) {
                emit(out, item);
            }
            out << YAML::EndSeq;
            break;
        case Value::value_t::object:
            out << YAML::BeginMap;
            for (auto it = value.begin(); it != value.end(); ++it) {
                out << YAML::Key << it.key() << YAML::Value;
                emit(out, it.value());
            }
            out << YAML::EndMap;
            break;
        default:
            out << YAML::Null;
            break;
    }
}

std::string to_yaml_string(const Value& value) {
    YAML::Emitter out;
    emit(out, value);
    return std::string(out.c_str()) + "\n";
}

}
