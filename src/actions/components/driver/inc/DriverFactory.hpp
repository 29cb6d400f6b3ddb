#pragma once

#include "BrowserDriver.hpp"
#include "DriverConfig.hpp"
#include <memory>

class DriverFactory {
public:
    static std::unique_ptr<BrowserDriver> create(const DriverConfig& config);
};
