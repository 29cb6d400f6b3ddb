#pragma once

#include <string>

struct StorageConfig {
    std::string dir = ".";
};
