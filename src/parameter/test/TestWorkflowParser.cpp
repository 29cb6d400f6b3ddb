#include "WorkflowParser.hpp"
#include "WorkflowErrors.hpp"
#include <cassert>
#include <iostream>

namespace {

// Returns the validation message, empty when parsing succeeded
std::string parse_error(const std::string& yaml) {
    try {
        WorkflowParser::parse_string(yaml);
    } catch (const ValidationError& e) {
        return e.what();
    }
    return {};
}

}

void test_parse_minimal_workflow() {
    Workflow workflow = WorkflowParser::parse_string(R"(
name: search
version: "1.0"
description: Search a shop
variables:
  query: laptop
  max_pages: 3
  strict: true
  quoted: "42"
steps:
  - name: Open
    action: navigate
    value: "https://shop.test/?q={{query}}"
  - action: click
    selector: "#go"
    timeout: 5
)");

    assert(workflow.name == "search");
    assert(workflow.version == "1.0");
    assert(workflow.description == "Search a shop");
    assert(workflow.variables.at("query") == "laptop");
    assert(workflow.variables.at("max_pages") == 3);
    assert(workflow.variables.at("strict") == true);
    assert(workflow.variables.at("quoted") == "42");
    assert(workflow.steps.size() == 2);

    const auto& open = workflow.steps[0];
    assert(open.name == "Open");
    assert(open.action == ActionKind::Navigate);
    assert(*open.value == "https://shop.test/?q={{query}}");
    assert(!open.on_error);

    const auto& click = workflow.steps[1];
    assert(click.action == ActionKind::Click);
    assert(*click.selector == "#go");
    assert(*click.timeout == 5.0);
    std::cout << "test_parse_minimal_workflow passed." << std::endl;
}

void test_parse_json_document() {
    Workflow workflow = WorkflowParser::parse_string(
        R"({"name": "j", "version": "1", "steps": [{"action": "wait", "value": 1.5}]})");
    assert(workflow.steps.size() == 1);
    assert(workflow.steps[0].action == ActionKind::Wait);
    assert(*workflow.steps[0].value == 1.5);
    std::cout << "test_parse_json_document passed." << std::endl;
}

void test_parse_if_with_else() {
    Workflow workflow = WorkflowParser::parse_string(R"(
name: branch
version: "1"
steps:
  - action: if
    value:
      - {operator: ">", left: "{{count}}", right: 0}
      - {operator: not_equals, left: "{{mode}}", right: off}
    steps:
      - {action: click, selector: "#a"}
    else_steps:
      - {action: click, selector: "#b"}
      - {action: click, selector: "#c"}
)");

    const auto& step = workflow.steps[0];
    const auto& conditions = std::get<ConditionList>(step.control);
    assert(conditions.size() == 2);
    assert(conditions[0].op == ConditionOperator::GreaterThan);
    assert(conditions[0].right == 0);
    assert(conditions[1].op == ConditionOperator::NotEquals);
    assert(step.steps.size() == 1);
    assert(step.else_steps.size() == 2);
    std::cout << "test_parse_if_with_else passed." << std::endl;
}

void test_parse_loop_types() {
    Workflow workflow = WorkflowParser::parse_string(R"(
name: loops
version: "1"
steps:
  - action: loop
    value:
      type: while
      condition: {operator: less_than, left: "{{page}}", right: 5}
      max_iterations: 10
    steps: [{action: click, selector: ".next"}]
  - action: loop
    value: {type: until, condition: {operator: equals, left: "{{done}}", right: true}}
    steps: [{action: click, selector: ".more"}]
  - action: loop
    value: {type: for, start: 1, end: "{{pages}}", variable: p}
    steps: [{action: click, selector: ".p"}]
  - action: loop
    value: {type: foreach, items: "{{links}}", var: link}
    steps: [{action: navigate, value: "{{link}}"}]
  - action: loop
    value: {type: repeat, times: 3}
    steps: [{action: wait, value: 1}]
)");

    const auto& loops = workflow.steps;
    const auto& w = std::get<WhileLoop>(std::get<LoopSpec>(loops[0].control));
    assert(w.condition.size() == 1);
    assert(w.max_iterations && *w.max_iterations == 10);

    const auto& u = std::get<UntilLoop>(std::get<LoopSpec>(loops[1].control));
    assert(!u.max_iterations);

    const auto& f = std::get<ForLoop>(std::get<LoopSpec>(loops[2].control));
    assert(f.start == 1);
    assert(f.end == "{{pages}}");
    assert(f.step == 1);
    assert(f.variable == "p");

    const auto& e = std::get<ForEachLoop>(std::get<LoopSpec>(loops[3].control));
    assert(e.variable == "link");

    const auto& r = std::get<RepeatLoop>(std::get<LoopSpec>(loops[4].control));
    assert(r.times == 3);
    assert(r.variable.empty());

    std::vector<std::string> types;
    for (const auto& step : loops) {
        types.push_back(loop_type_name(std::get<LoopSpec>(step.control)));
    }
    assert((types == std::vector<std::string>{"while", "until", "for", "for_each", "repeat"}));
    std::cout << "test_parse_loop_types passed." << std::endl;
}

void test_workflow_defaults_apply_recursively() {
    Workflow workflow = WorkflowParser::parse_string(R"(
name: defaults
version: "1"
on_error: retry
retry: {max_attempts: 4, delay: 0.5}
steps:
  - action: click
    selector: "#a"
  - action: click
    selector: "#b"
    on_error: continue
  - action: loop
    value: {type: repeat, times: 2}
    steps:
      - action: click
        selector: "#c"
        retry: {max_attempts: 2}
)");

    const auto& a = workflow.steps[0];
    assert(a.effective_policy() == ErrorPolicy::Retry);
    assert(a.effective_retry().max_attempts == 4);
    assert(a.effective_retry().delay_seconds == 0.5);

    assert(workflow.steps[1].effective_policy() == ErrorPolicy::Continue);
    assert(!workflow.steps[1].retry);

    const auto& nested = workflow.steps[2].steps[0];
    assert(nested.effective_policy() == ErrorPolicy::Retry);
    assert(nested.effective_retry().max_attempts == 2);
    assert(nested.effective_retry().delay_seconds == 1.0);
    std::cout << "test_workflow_defaults_apply_recursively passed." << std::endl;
}

void test_retry_implies_retry_policy() {
    Workflow workflow = WorkflowParser::parse_string(R"(
name: r
version: "1"
steps:
  - action: click
    selector: "#a"
    retry: {max_attempts: 2}
)");
    assert(workflow.steps[0].effective_policy() == ErrorPolicy::Retry);
    std::cout << "test_retry_implies_retry_policy passed." << std::endl;
}

void test_structural_errors_name_path() {
    std::string error = parse_error(R"(
name: bad
version: "1"
steps:
  - action: click
    selector: "#a"
    colour: red
)");
    assert(error.find("steps[0]") != std::string::npos);
    assert(error.find("colour") != std::string::npos);

    error = parse_error(R"(
name: bad
version: "1"
steps:
  - action: drag_and_drop
    selector: "#a"
)");
    assert(error.find("steps[0].action") != std::string::npos);
    assert(error.find("drag_and_drop") != std::string::npos);

    error = parse_error(R"(
name: bad
version: "1"
steps:
  - action: loop
    value: {type: forever}
    steps: [{action: wait, value: 1}]
)");
    assert(error.find("steps[0].value.type") != std::string::npos);

    error = parse_error(R"(
name: bad
version: "1"
steps:
  - action: if
    value: {operator: about, left: 1, right: 2}
    steps: [{action: wait, value: 1}]
)");
    assert(error.find("unknown operator 'about'") != std::string::npos);

    error = parse_error(R"(
name: bad
version: "1"
steps:
  - action: click
    selector: "#a"
    on_error: ignore
)");
    assert(error.find("steps[0].on_error") != std::string::npos);
    std::cout << "test_structural_errors_name_path passed." << std::endl;
}

void test_missing_action_and_malformed_document() {
    assert(parse_error("name: x\nversion: '1'\nsteps:\n  - selector: '#a'\n")
               .find("missing required field 'action'") != std::string::npos);
    assert(parse_error("name: [unclosed").find("malformed document") != std::string::npos);
    assert(parse_error("name: x\nsteps: {action: click}\n").find("expected a list of steps") != std::string::npos);
    std::cout << "test_missing_action_and_malformed_document passed." << std::endl;
}

void test_parse_missing_file() {
    bool thrown = false;
    try {
        WorkflowParser::parse_file("does/not/exist.yaml");
    } catch (const ValidationError& e) {
        thrown = std::string(e.what()).find("cannot open workflow file") != std::string::npos;
    }
    assert(thrown);
    std::cout << "test_parse_missing_file passed." << std::endl;
}

int main() {
    test_parse_minimal_workflow();
    test_parse_json_document();
    test_parse_if_with_else();
    test_parse_loop_types();
    test_workflow_defaults_apply_recursively();
    test_retry_implies_retry_policy();
    test_structural_errors_name_path();
    test_missing_action_and_malformed_document();
    test_parse_missing_file();

    std::cout << "All WorkflowParser tests passed!" << std::endl;
    return 0;
}
