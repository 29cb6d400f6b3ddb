#include "DryRunDriver.hpp"
#include "LogUtils.hpp"
#include "ValueConverter.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <fmt/format.h>

namespace {

ValueMap to_value_map(const Value& object, const std::string& section) {
    if (object.is_null()) {
        return {};
    }
    if (!object.is_object()) {
        throw std::runtime_error("Fixture section '" + section + "' must be a mapping");
    }

    ValueMap map;
    for (auto it = object.begin(); it != object.end(); ++it) {
        map[it.key()] = it.value();
    }
    return map;
}

}

DryRunDriver::DryRunDriver(Fixtures fixtures) : fixtures_(std::move(fixtures)) {}

DryRunDriver::Fixtures DryRunDriver::parse_fixtures(const std::string& content) {
    Value root;
    try {
        root = ValueConverter::from_yaml(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid fixture document: ") + e.what());
    }

    Fixtures fixtures;
    if (root.is_null()) {
        return fixtures;
    }
    if (!root.is_object()) {
        throw std::runtime_error("Fixture document must be a mapping");
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        const auto& key = it.key();
        if (key == "texts") {
            fixtures.texts = to_value_map(it.value(), key);
        } else if (key == "attributes") {
            fixtures.attributes = to_value_map(it.value(), key);
        } else if (key == "records") {
            fixtures.records = to_value_map(it.value(), key);
        } else if (key == "scripts") {
            fixtures.scripts = to_value_map(it.value(), key);
        } else if (key == "missing") {
            if (!it.value().is_array()) {
                throw std::runtime_error("Fixture section 'missing' must be a sequence");
            }
            for (const auto& selector : it.value()) {
                fixtures.missing.insert(ValueUtils::to_text(selector));
            }
        } else {
            throw std::runtime_error("Unknown fixture key: " + key);
        }
    }
    return fixtures;
}

DryRunDriver::Fixtures DryRunDriver::load_fixtures(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open fixture file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_fixtures(buffer.str());
}

bool DryRunDriver::check_present(const std::string& selector) {
    if (fixtures_.missing.count(selector)) {
        last_error_ = "Element not found: " + selector;
        LogUtils::debug("[dry-run] {}", last_error_);
        return false;
    }
    return true;
}

bool DryRunDriver::navigate(const std::string& url) {
    calls_.push_back("navigate " + url);
    LogUtils::info("[dry-run] navigate to {}", url);

    if (url.empty()) {
        last_error_ = "Cannot navigate to an empty URL";
        return false;
    }
    current_url_ = url;
    return true;
}

bool DryRunDriver::click(const std::string& selector) {
    calls_.push_back("click " + selector);
    LogUtils::info("[dry-run] click {}", selector);
    return check_present(selector);
}

bool DryRunDriver::type(const std::string& selector, const std::string& text) {
    calls_.push_back("type " + selector);
    LogUtils::info("[dry-run] type into {}", selector);
    if (!check_present(selector)) {
        return false;
    }
    inputs_[selector] = text;
    return true;
}

bool DryRunDriver::set_input_files(const std::string& selector, const std::string& path) {
    calls_.push_back("set_input_files " + selector);
    LogUtils::info("[dry-run] set input files of {} to {}", selector, path);
    if (!check_present(selector)) {
        return false;
    }
    inputs_[selector] = path;
    return true;
}

bool DryRunDriver::hover(const std::string& selector) {
    calls_.push_back("hover " + selector);
    LogUtils::info("[dry-run] hover over {}", selector);
    return check_present(selector);
}

void DryRunDriver::wait(double seconds) {
    calls_.push_back(fmt::format("wait {}", seconds));
    LogUtils::info("[dry-run] wait {}s", seconds);
    if (seconds > 0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

bool DryRunDriver::wait_for(const std::string& selector, double timeout_seconds) {
    calls_.push_back("wait_for " + selector);
    LogUtils::info("[dry-run] wait for {} (timeout {}s)", selector, timeout_seconds);
    if (fixtures_.missing.count(selector)) {
        last_error_ = fmt::format("Timed out after {}s waiting for {}", timeout_seconds, selector);
        return false;
    }
    return true;
}

std::optional<Value> DryRunDriver::extract(const std::string& selector, const Value& field_map) {
    calls_.push_back("extract " + selector);
    LogUtils::info("[dry-run] extract {}", selector);
    if (!check_present(selector)) {
        return std::nullopt;
    }

    auto it = fixtures_.records.find(selector);
    if (it == fixtures_.records.end()) {
        return Value::array();
    }

    const Value& records = it->second.is_array() ? it->second : Value::array({it->second});
    if (!field_map.is_object() || field_map.empty()) {
        return records;
    }

    // Project each record onto the requested fields
    Value projected = Value::array();
    for (const auto& record : records) {
        Value row = Value::object();
        for (auto field = field_map.begin(); field != field_map.end(); ++field) {
            row[field.key()] = (record.is_object() && record.contains(field.key())) ? record[field.key()] : Value();
        }
        projected.push_back(std::move(row));
    }
    return projected;
}

std::optional<Value> DryRunDriver::evaluate(const std::string& script) {
    calls_.push_back("evaluate " + script);
    LogUtils::info("[dry-run] evaluate {}", script);
    auto it = fixtures_.scripts.find(script);
    return it == fixtures_.scripts.end() ? Value() : it->second;
}

std::optional<Value> DryRunDriver::execute_script(const std::string& script) {
    calls_.push_back("execute_script " + script);
    LogUtils::info("[dry-run] execute script {}", script);
    auto it = fixtures_.scripts.find(script);
    return it == fixtures_.scripts.end() ? Value() : it->second;
}

std::optional<std::string> DryRunDriver::get_text(const std::string& selector) {
    calls_.push_back("get_text " + selector);
    LogUtils::info("[dry-run] get text of {}", selector);
    if (!check_present(selector)) {
        return std::nullopt;
    }

    auto it = fixtures_.texts.find(selector);
    return it == fixtures_.texts.end() ? std::string() : ValueUtils::to_text(it->second);
}

std::optional<Value> DryRunDriver::get_attribute(const std::string& selector, const std::string& attribute) {
    calls_.push_back("get_attribute " + selector + " " + attribute);
    LogUtils::info("[dry-run] get attribute {} of {}", attribute, selector);
    if (!check_present(selector)) {
        return std::nullopt;
    }

    auto it = fixtures_.attributes.find(selector);
    if (it == fixtures_.attributes.end() || !it->second.is_object() || !it->second.contains(attribute)) {
        return Value();
    }
    return it->second[attribute];
}

bool DryRunDriver::screenshot(const std::string& path) {
    calls_.push_back("screenshot " + path);
    LogUtils::info("[dry-run] screenshot to {}", path);
    if (path.empty()) {
        last_error_ = "Screenshot path is empty";
        return false;
    }
    screenshots_.push_back(path);
    return true;
}

void DryRunDriver::close() noexcept {
    current_url_.clear();
}
