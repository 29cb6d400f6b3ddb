#pragma once

#include "Workflow.hpp"
#include <map>
#include <string>
#include <vector>

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }
};

// Semantic checks on a parsed workflow, run before any step executes.
// Every problem is collected instead of stopping at the first one.
class WorkflowValidator {
public:
    explicit WorkflowValidator(int max_nesting_depth = 32) : max_nesting_depth_(max_nesting_depth) {}

    ValidationReport validate(const Workflow& workflow) const;

    // Logs the warnings, throws ValidationError listing every error
    void validate_or_throw(const Workflow& workflow) const;

private:
    void check_steps(const std::vector<Step>& steps, const std::string& path, int depth,
                     ValidationReport& report, std::map<std::string, std::string>& keys) const;
    void check_step(const Step& step, const std::string& path, int depth,
                    ValidationReport& report, std::map<std::string, std::string>& keys) const;
    void check_loop(const LoopSpec& loop, const std::string& path, ValidationReport& report) const;

    int max_nesting_depth_;
};
