#include "StepParserRegistry.hpp"
#include "WorkflowParser.hpp"

StepParserRegistry::StepParserRegistry() {
    parsers_[ActionKind::If] = [](const YAML::Node& value, Step& step, const std::string& path) {
        step.control = WorkflowParser::parse_conditions(value, path);
    };
    parsers_[ActionKind::Loop] = [](const YAML::Node& value, Step& step, const std::string& path) {
        step.control = WorkflowParser::parse_loop(value, path);
    };
}

StepParserRegistry& StepParserRegistry::instance() {
    static StepParserRegistry registry;
    return registry;
}

bool StepParserRegistry::apply(const YAML::Node& value, Step& step, const std::string& path) {
    const auto& parsers = instance().parsers_;
    auto it = parsers.find(step.action);
    if (it == parsers.end()) {
        return false;
    }

    it->second(value, step, path);
    return true;
}
