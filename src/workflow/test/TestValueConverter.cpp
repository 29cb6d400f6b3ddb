#include "ValueConverter.hpp"
#include "ActionKind.hpp"
#include "ErrorPolicy.hpp"
#include "Condition.hpp"
#include <cassert>
#include <iostream>

void test_plain_scalars_are_typed() {
    assert(ValueConverter::from_scalar("42") == 42);
    assert(ValueConverter::from_scalar("-7").is_number_integer());
    assert(ValueConverter::from_scalar("2.5") == 2.5);
    assert(ValueConverter::from_scalar("true") == true);
    assert(ValueConverter::from_scalar("False") == false);
    assert(ValueConverter::from_scalar("~").is_null());
    assert(ValueConverter::from_scalar("").is_null());
    assert(ValueConverter::from_scalar("laptop") == "laptop");
    assert(ValueConverter::from_scalar("12px") == "12px");
    std::cout << "test_plain_scalars_are_typed passed." << std::endl;
}

void test_yaml_documents() {
    Value value = ValueConverter::from_yaml(YAML::Load(R"(
page: 1
ratio: 0.5
quoted: "1"
flag: yes
tags: [a, "true", 3]
nested: {empty: null, deep: {x: ~}}
)"));

    assert(value["page"] == 1);
    assert(value["ratio"] == 0.5);
    assert(value["quoted"] == "1");
    assert(value["flag"] == "yes");
    assert((value["tags"] == Value::array({"a", "true", 3})));
    assert(value["nested"]["empty"].is_null());
    assert(value["nested"]["deep"]["x"].is_null());
    std::cout << "test_yaml_documents passed." << std::endl;
}

void test_emit_quotes_ambiguous_strings() {
    Value value = {{"code", "007"}, {"name", "shop"}, {"enabled", "true"}, {"count", 3}};
    std::string yaml = ValueConverter::to_yaml_string(value);

    assert(yaml.find("code: \"007\"") != std::string::npos);
    assert(yaml.find("enabled: \"true\"") != std::string::npos);
    assert(yaml.find("name: shop") != std::string::npos);
    assert(yaml.find("count: 3") != std::string::npos);
    assert(ValueConverter::from_yaml(YAML::Load(yaml)) == value);
    std::cout << "test_emit_quotes_ambiguous_strings passed." << std::endl;
}

void test_text_and_truthiness() {
    assert(ValueUtils::to_text(Value(3.0)) == "3");
    assert(ValueUtils::to_text(Value(2.5)) == "2.5");
    assert(ValueUtils::to_text(Value("x")) == "x");
    assert(ValueUtils::to_text(Value::array({1, 2})) == "[1,2]");

    assert(!ValueUtils::is_truthy(Value()));
    assert(!ValueUtils::is_truthy(Value("")));
    assert(!ValueUtils::is_truthy(Value(0)));
    assert(!ValueUtils::is_truthy(Value::array()));
    assert(ValueUtils::is_truthy(Value("0")));
    assert(ValueUtils::is_truthy(Value{{"a", 1}}));

    assert(std::string(ValueUtils::type_name(Value::object())) == "mapping");
    std::cout << "test_text_and_truthiness passed." << std::endl;
}

void test_document_identifiers() {
    assert(parse_action_kind("wait_for") == ActionKind::WaitFor);
    assert(std::string(to_string(ActionKind::SetInputFiles)) == "set_input_files");
    assert(parse_action_kind("hover") == ActionKind::Hover);
    assert(parse_action_kind("stop") == ActionKind::Stop);
    assert(std::string(to_string(ActionKind::GetAttribute)) == "get_attribute");
    assert(!parse_action_kind("drag_and_drop"));

    assert(parse_error_policy("stop") == ErrorPolicy::Fail);
    assert(parse_error_policy("continue") == ErrorPolicy::Continue);
    assert(!parse_error_policy("ignore"));

    assert(parse_condition_operator(">=") == ConditionOperator::GreaterThanOrEquals);
    assert(parse_condition_operator("matches") == ConditionOperator::Matches);
    assert(!parse_condition_operator("=~"));
    std::cout << "test_document_identifiers passed." << std::endl;
}

int main() {
    test_plain_scalars_are_typed();
    test_yaml_documents();
    test_emit_quotes_ambiguous_strings();
    test_text_and_truthiness();
    test_document_identifiers();

    std::cout << "All workflow value tests passed!" << std::endl;
    return 0;
}
