#include "ParameterContext.hpp"
#include "LogUtils.hpp"
#include "ValueConverter.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef AUTOFLOW_BUILD_GIT
#define AUTOFLOW_BUILD_GIT "unknown"
#endif
#ifndef AUTOFLOW_BUILD_TARGET_OSTYPE
#define AUTOFLOW_BUILD_TARGET_OSTYPE "unknown"
#endif
#ifndef AUTOFLOW_BUILD_TARGET_CPUTYPE
#define AUTOFLOW_BUILD_TARGET_CPUTYPE "unknown"
#endif
#ifndef AUTOFLOW_BUILD_DATE
#define AUTOFLOW_BUILD_DATE "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--workflow", 'w', "Workflow document to execute", true},
    {"--config-file", 'c', "Specify engine config file path", true},
    {"--var", 'D', "Override a workflow variable (NAME=VALUE, repeatable)", true},
    {"--output", 'o', "Write the execution result as JSON to this file", true},
    {"--storage-dir", 's', "Base directory for save/load steps", true},
    {"--fixtures", 'f', "Fixture file answered by the dry-run driver", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: autoflow [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  AUTOFLOW_STORAGE_DIR, AUTOFLOW_FIXTURES, AUTOFLOW_LOG_FILE, AUTOFLOW_LOG_LEVEL\n"
              << "\nExamples:\n"
              << "  autoflow --workflow=examples/search.yaml\n"
              << "  autoflow -w examples/pagination.yaml -D start_page=2 -o result.json\n\n";
}

void ParameterContext::show_version() {
    std::cout << "autoflow version: 0.3.0" << std::endl;
    std::cout << "git: " << AUTOFLOW_BUILD_GIT << std::endl;
    std::cout << "build: " << AUTOFLOW_BUILD_TARGET_OSTYPE << "-" << AUTOFLOW_BUILD_TARGET_CPUTYPE << " " << AUTOFLOW_BUILD_DATE << std::endl;
}

std::pair<std::string, Value> ParameterContext::parse_variable(const std::string& assignment) {
    size_t pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw std::runtime_error("Invalid variable override '" + assignment + "', expected NAME=VALUE");
    }
    return {assignment.substr(0, pos), ValueConverter::from_scalar(assignment.substr(pos + 1))};
}

void ParameterContext::parse_log(const YAML::Node& log_node) {
    static const std::set<std::string> valid_keys = {"level", "file"};
    YAML::check_unknown_keys(log_node, valid_keys, "log");

    if (log_node["level"]) {
        global_config.log_level = log_node["level"].as<std::string>();
        LogUtils::parse_level(global_config.log_level);
    }
    if (log_node["file"]) {
        global_config.log_file = log_node["file"].as<std::string>();
    }
}

void ParameterContext::parse_engine(const YAML::Node& engine_node) {
    static const std::set<std::string> valid_keys = {"max_nesting_depth", "export_variables"};
    YAML::check_unknown_keys(engine_node, valid_keys, "engine");

    if (engine_node["max_nesting_depth"]) {
        global_config.max_nesting_depth = engine_node["max_nesting_depth"].as<int>();
        if (global_config.max_nesting_depth < 1) {
            throw std::runtime_error("engine::max_nesting_depth must be at least 1");
        }
    }
    if (engine_node["export_variables"]) {
        global_config.export_variables = engine_node["export_variables"].as<std::vector<std::string>>();
    }
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }

    static const std::set<std::string> valid_keys = {"log", "driver", "storage", "engine"};
    YAML::check_unknown_keys(config, valid_keys, "config");

    if (config["log"]) {
        parse_log(config["log"]);
    }
    if (config["driver"]) {
        global_config.driver = config["driver"].as<DriverConfig>();
    }
    if (config["storage"]) {
        global_config.storage = config["storage"].as<StorageConfig>();
    }
    if (config["engine"]) {
        parse_engine(config["engine"]);
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }

        if (key == "--var") {
            cli_variables.push_back(value);
        } else {
            cli_params[key] = value;
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--workflow")) {
        workflow_file = cli_params["--workflow"];
    }
    if (cli_params.count("--output")) {
        global_config.output_file = cli_params["--output"];
    }
    if (cli_params.count("--storage-dir")) {
        global_config.storage.dir = cli_params["--storage-dir"];
    }
    if (cli_params.count("--fixtures")) {
        global_config.driver.fixtures = cli_params["--fixtures"];
    }
    if (cli_params.count("--verbose")) {
        global_config.verbose = true;
        global_config.log_level = "debug";
    }

    for (const auto& assignment : cli_variables) {
        auto [name, value] = parse_variable(assignment);
        variable_overrides[name] = std::move(value);
    }
}

void ParameterContext::merge_environment_vars() {
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"AUTOFLOW_STORAGE_DIR", "storage_dir"},
        {"AUTOFLOW_FIXTURES", "fixtures"},
        {"AUTOFLOW_LOG_FILE", "log_file"},
        {"AUTOFLOW_LOG_LEVEL", "log_level"}
    };

    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (!env_value) {
            continue;
        }

        if (key == "storage_dir") {
            global_config.storage.dir = env_value;
        } else if (key == "fixtures") {
            global_config.driver.fixtures = env_value;
        } else if (key == "log_file") {
            global_config.log_file = env_value;
        } else if (key == "log_level") {
            LogUtils::parse_level(env_value);
            global_config.log_level = env_value;
        }
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();

    if (workflow_file.empty()) {
        throw std::runtime_error("Missing required option: --workflow or -w");
    }
    return true;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return global_config;
}

const std::string& ParameterContext::get_workflow_file() const {
    return workflow_file;
}

const ValueMap& ParameterContext::get_variable_overrides() const {
    return variable_overrides;
}
