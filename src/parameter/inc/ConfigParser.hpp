#pragma once

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>
#include "DriverConfig.hpp"
#include "ErrorPolicy.hpp"
#include "StorageConfig.hpp"

namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw std::runtime_error("Expected a mapping in " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<DriverConfig> {
        static bool decode(const Node& node, DriverConfig& rhs) {
            static const std::set<std::string> valid_keys = {"type", "fixtures", "default_timeout"};
            check_unknown_keys(node, valid_keys, "driver");

            if (node["type"]) {
                rhs.type = node["type"].as<std::string>();
            }
            if (node["fixtures"]) {
                rhs.fixtures = node["fixtures"].as<std::string>();
            }
            if (node["default_timeout"]) {
                rhs.default_timeout = node["default_timeout"].as<double>();
                if (rhs.default_timeout <= 0) {
                    throw std::runtime_error("driver::default_timeout must be positive");
                }
            }
            return true;
        }
    };

    template<>
    struct convert<StorageConfig> {
        static bool decode(const Node& node, StorageConfig& rhs) {
            static const std::set<std::string> valid_keys = {"dir"};
            check_unknown_keys(node, valid_keys, "storage");

            if (node["dir"]) {
                rhs.dir = node["dir"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<RetryConfig> {
        static bool decode(const Node& node, RetryConfig& rhs) {
            static const std::set<std::string> valid_keys = {"max_attempts", "delay_seconds", "delay"};
            check_unknown_keys(node, valid_keys, "retry");

            if (node["max_attempts"]) {
                rhs.max_attempts = node["max_attempts"].as<int>();
            }
            if (node["delay_seconds"] && node["delay"]) {
                throw std::runtime_error("retry accepts only one of 'delay_seconds' and 'delay'");
            }
            if (node["delay_seconds"]) {
                rhs.delay_seconds = node["delay_seconds"].as<double>();
            } else if (node["delay"]) {
                rhs.delay_seconds = node["delay"].as<double>();
            }
            return true;
        }
    };

}
