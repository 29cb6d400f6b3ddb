#include "ParameterContext.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace {

// Sets an environment variable for the current scope only
class EnvOverride {
public:
    EnvOverride(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvOverride() {
        unsetenv(name_);
    }

private:
    const char* name_;
};

}

// Test command line parameter parsing
void test_commandline_merge() {
    ParameterContext ctx;
    const char* argv[] = {
        "autoflow",
        "--workflow=flows/search.yaml",
        "-o", "result.json",
        "--storage-dir", "/tmp/autoflow",
        "-f", "fixtures.yaml",
        "-D", "query=laptop",
        "--var=max_pages=3",
        "-v"
    };
    ctx.merge_commandline(12, const_cast<char**>(argv));

    const auto& global = ctx.get_global_config();
    assert(ctx.get_workflow_file() == "flows/search.yaml");
    assert(global.output_file == "result.json");
    assert(global.storage.dir == "/tmp/autoflow");
    assert(global.driver.fixtures == "fixtures.yaml");
    assert(global.verbose);
    assert(global.log_level == "debug");

    const auto& vars = ctx.get_variable_overrides();
    assert(vars.at("query") == "laptop");
    assert(vars.at("max_pages") == 3);
    std::cout << "Commandline merge test passed.\n";
}

void test_parse_variable() {
    auto [name, value] = ParameterContext::parse_variable("flag=true");
    assert(name == "flag");
    assert(value == true);

    auto [url_name, url] = ParameterContext::parse_variable("url=https://a.test/?x=1");
    assert(url_name == "url");
    assert(url == "https://a.test/?x=1");

    auto [empty_name, empty] = ParameterContext::parse_variable("note=");
    assert(empty_name == "note");
    assert(empty.is_null());

    for (const char* bad : {"novalue", "=3"}) {
        bool thrown = false;
        try {
            ParameterContext::parse_variable(bad);
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }
    std::cout << "Variable parsing test passed.\n";
}

// Test environment variable merge
void test_environment_merge() {
    EnvOverride dir("AUTOFLOW_STORAGE_DIR", "/data/runs");
    EnvOverride level("AUTOFLOW_LOG_LEVEL", "warn");

    ParameterContext ctx;
    ctx.merge_environment_vars();

    const auto& global = ctx.get_global_config();
    assert(global.storage.dir == "/data/runs");
    assert(global.log_level == "warn");
    std::cout << "Environment merge test passed.\n";
}

// Test YAML config merge
void test_yaml_merge() {
    ParameterContext ctx;
    YAML::Node config = YAML::Load(R"(
log:
  level: error
  file: logs/run.log
driver:
  type: dry-run
  fixtures: fixtures/shop.yaml
  default_timeout: 8
storage:
  dir: output
engine:
  max_nesting_depth: 6
  export_variables: [results, page]
)");
    ctx.merge_yaml(config);

    const auto& global = ctx.get_global_config();
    assert(global.log_level == "error");
    assert(global.log_file == "logs/run.log");
    assert(global.driver.fixtures == "fixtures/shop.yaml");
    assert(global.driver.default_timeout == 8.0);
    assert(global.storage.dir == "output");
    assert(global.max_nesting_depth == 6);
    assert((global.export_variables == std::vector<std::string>{"results", "page"}));
    std::cout << "YAML merge test passed.\n";
}

void test_yaml_rejects_bad_values() {
    for (const char* yaml : {"browser: {}", "log: {level: loud}", "engine: {max_nesting_depth: 0}"}) {
        ParameterContext ctx;
        bool thrown = false;
        try {
            ctx.merge_yaml(YAML::Load(yaml));
        } catch (const std::exception&) {
            thrown = true;
        }
        assert(thrown);
    }
    std::cout << "YAML rejection test passed.\n";
}

// Test priority: config file < environment < command line
void test_priority() {
    const std::string config_file = "test_autoflow_config.yaml";
    {
        std::ofstream out(config_file);
        out << "storage:\n  dir: from_config\ndriver:\n  fixtures: config_fixtures.yaml\nlog:\n  level: error\n";
    }

    EnvOverride dir("AUTOFLOW_STORAGE_DIR", "from_env");
    EnvOverride level("AUTOFLOW_LOG_LEVEL", "info");

    ParameterContext ctx;
    const char* argv[] = {
        "autoflow",
        "-c", config_file.c_str(),
        "-w", "flow.yaml",
        "--storage-dir=from_cli"
    };
    bool proceed = ctx.init(6, const_cast<char**>(argv));
    assert(proceed);

    const auto& global = ctx.get_global_config();
    assert(global.storage.dir == "from_cli");
    assert(global.log_level == "info");
    assert(global.driver.fixtures == "config_fixtures.yaml");

    std::filesystem::remove(config_file);
    std::cout << "Priority test passed.\n";
}

void test_missing_workflow_and_unknown_options() {
    {
        ParameterContext ctx;
        const char* argv[] = {"autoflow", "-o", "out.json"};
        bool thrown = false;
        try {
            ctx.init(3, const_cast<char**>(argv));
        } catch (const std::runtime_error& e) {
            thrown = std::string(e.what()).find("--workflow") != std::string::npos;
        }
        assert(thrown);
    }
    {
        ParameterContext ctx;
        const char* argv[] = {"autoflow", "--headless"};
        bool thrown = false;
        try {
            ctx.parse_commandline(2, const_cast<char**>(argv));
        } catch (const std::runtime_error& e) {
            thrown = std::string(e.what()).find("Unknown option: --headless") != std::string::npos;
        }
        assert(thrown);
    }
    {
        ParameterContext ctx;
        const char* argv[] = {"autoflow", "-w"};
        bool thrown = false;
        try {
            ctx.parse_commandline(2, const_cast<char**>(argv));
        } catch (const std::runtime_error& e) {
            thrown = std::string(e.what()).find("requires a value") != std::string::npos;
        }
        assert(thrown);
    }
    std::cout << "Invalid command line test passed.\n";
}

void test_help_and_version_stop_early() {
    ParameterContext ctx;
    const char* help[] = {"autoflow", "--help"};
    assert(!ctx.init(2, const_cast<char**>(help)));

    ParameterContext other;
    const char* version[] = {"autoflow", "-V"};
    assert(!other.init(2, const_cast<char**>(version)));
    std::cout << "Help and version test passed.\n";
}

int main() {
    test_commandline_merge();
    test_parse_variable();
    test_environment_merge();
    test_yaml_merge();
    test_yaml_rejects_bad_values();
    test_priority();
    test_missing_workflow_and_unknown_options();
    test_help_and_version_stop_early();

    std::cout << "All ParameterContext tests passed!" << std::endl;
    return 0;
}
