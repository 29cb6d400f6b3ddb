#include "DriverFactory.hpp"
#include "DryRunDriver.hpp"
#include <stdexcept>

std::unique_ptr<BrowserDriver> DriverFactory::create(const DriverConfig& config) {
    if (config.type == "dry-run") {
        if (config.fixtures.empty()) {
            return std::make_unique<DryRunDriver>();
        }
        return std::make_unique<DryRunDriver>(DryRunDriver::load_fixtures(config.fixtures));
    }

    throw std::invalid_argument("Unsupported driver type: " + config.type);
}
