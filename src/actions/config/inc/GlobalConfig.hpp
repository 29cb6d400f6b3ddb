#pragma once

#include <string>
#include <vector>
#include "DriverConfig.hpp"
#include "StorageConfig.hpp"

struct GlobalConfig {
    bool verbose = false;
    std::string log_level = "info";
    std::string log_file;
    DriverConfig driver;
    StorageConfig storage;
    int max_nesting_depth = 32;
    std::vector<std::string> export_variables;  // Empty means the full Environment
    std::string output_file;
};
