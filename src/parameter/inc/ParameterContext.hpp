#pragma once

#include "ConfigParser.hpp"
#include "GlobalConfig.hpp"
#include "Value.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when only help or version was requested
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const GlobalConfig& get_global_config() const;
    const std::string& get_workflow_file() const;

    // --var NAME=VALUE overrides in command-line order
    const ValueMap& get_variable_overrides() const;

    // Splits NAME=VALUE and types VALUE like a plain YAML scalar
    static std::pair<std::string, Value> parse_variable(const std::string& assignment);

private:
    GlobalConfig global_config;
    std::string workflow_file;
    ValueMap variable_overrides;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> cli_variables;

    void parse_log(const YAML::Node& log_node);
    void parse_engine(const YAML::Node& engine_node);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--workflow")
        char short_opt;          // Short option (e.g. 'w')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
