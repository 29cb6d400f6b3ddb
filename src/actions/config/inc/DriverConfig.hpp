#pragma once

#include <string>

struct DriverConfig {
    std::string type = "dry-run";
    std::string fixtures;          // Fixture file answered by the dry-run driver
    double default_timeout = 30.0; // Seconds, used by wait_for steps without a timeout
};
