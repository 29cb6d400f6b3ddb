#pragma once

#include "Step.hpp"
#include "Value.hpp"
#include <string>
#include <vector>

struct Workflow {
    std::string name;
    std::string version;
    std::string description;
    ValueMap variables;        // Initial Environment seed
    std::vector<Step> steps;
};
