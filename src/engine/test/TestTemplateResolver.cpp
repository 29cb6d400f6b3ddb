#include "TemplateResolver.hpp"
#include "WorkflowErrors.hpp"
#include <cassert>
#include <cstdint>
#include <limits>
#include <iostream>

Environment make_env() {
    return Environment({
        {"page", 1},
        {"price", 2.5},
        {"name", "Ada"},
        {"item", {{"id", 42}, {"title", "Widget"}}},
        {"links", Value::array({{{"url", "https://a.test"}}, {{"url", "https://b.test"}}})},
        {"results", Value::array({1, 2})},
        {"flag", true}
    });
}

void test_whole_placeholder_keeps_type() {
    TemplateResolver resolver;
    auto env = make_env();

    assert(resolver.resolve("{{page}}", env) == 1);
    assert(resolver.resolve("{{ results }}", env) == Value::array({1, 2}));
    assert(resolver.resolve("{{item}}", env).is_object());
    assert(resolver.resolve("{{flag}}", env) == true);
    std::cout << "test_whole_placeholder_keeps_type passed." << std::endl;
}

void test_interpolation() {
    TemplateResolver resolver;
    auto env = make_env();

    assert(resolver.resolve("Hello {{name}}, page {{page}}", env) == "Hello Ada, page 1");
    assert(resolver.resolve("https://shop.test/?p={{page + 1}}", env) == "https://shop.test/?p=2");
    assert(resolver.resolve_string("{{price}}", env) == "2.5");
    std::cout << "test_interpolation passed." << std::endl;
}

void test_property_and_index_access() {
    TemplateResolver resolver;
    auto env = make_env();

    assert(resolver.resolve("{{item.id}}", env) == 42);
    assert(resolver.resolve("{{links.1.url}}", env) == "https://b.test");
    assert(resolver.resolve("{{links[0].url}}", env) == "https://a.test");
    assert(resolver.resolve("{{item[\"title\"]}}", env) == "Widget");
    assert(resolver.resolve("{{results[page]}}", env) == 2);
    assert(resolver.resolve("{{links.length}}", env) == 2);
    assert(resolver.resolve("{{name.length}}", env) == 3);
    std::cout << "test_property_and_index_access passed." << std::endl;
}

void test_arithmetic() {
    TemplateResolver resolver;
    auto env = make_env();

    Value next = resolver.resolve("{{page + 1}}", env);
    assert(next.is_number_integer() && next == 2);
    assert(resolver.resolve("{{price * 2}}", env) == 5.0);
    assert(resolver.resolve("{{10 / 4}}", env) == 2.5);
    assert(resolver.resolve("{{10 / 5}}", env) == 2);
    assert(resolver.resolve("{{7 % 3}}", env) == 1);
    assert(resolver.resolve("{{-(page + 2) * 2}}", env) == -6);
    std::cout << "test_arithmetic passed." << std::endl;
}

void test_concatenation() {
    TemplateResolver resolver;
    auto env = make_env();

    assert(resolver.resolve("{{name + '!'}}", env) == "Ada!");
    assert(resolver.resolve("{{results + 3}}", env) == Value::array({1, 2, 3}));
    assert(resolver.resolve("{{results + results}}", env) == Value::array({1, 2, 1, 2}));
    std::cout << "test_concatenation passed." << std::endl;
}

void test_undefined_variable_names_reference() {
    TemplateResolver resolver;
    auto env = make_env();

    bool thrown = false;
    try {
        resolver.resolve("Hi {{ user }}", env);
    } catch (const ReferenceError& e) {
        thrown = true;
        assert(e.reference() == "user");
    }
    assert(thrown);

    thrown = false;
    try {
        resolver.resolve("{{item.price}}", env);
    } catch (const ReferenceError& e) {
        thrown = true;
        assert(e.reference() == "item.price");
    }
    assert(thrown);

    thrown = false;
    try {
        resolver.resolve("{{links.5}}", env);
    } catch (const ReferenceError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_undefined_variable_names_reference passed." << std::endl;
}

void test_type_mismatch() {
    TemplateResolver resolver;
    auto env = make_env();

    bool thrown = false;
    try {
        resolver.resolve("{{name * 2}}", env);
    } catch (const TypeMismatchError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        resolver.resolve("{{page / 0}}", env);
    } catch (const TypeMismatchError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_type_mismatch passed." << std::endl;
}

void test_integer_overflow_is_type_mismatch() {
    TemplateResolver resolver;
    const int64_t min = std::numeric_limits<int64_t>::min();
    const int64_t max = std::numeric_limits<int64_t>::max();
    Environment env({{"min", min}, {"max", max}, {"minus_one", -1}, {"two", 2}});

    for (const char* text : {"{{min / minus_one}}", "{{max + 1}}", "{{min - 1}}",
                             "{{max * two}}", "{{-min}}"}) {
        bool thrown = false;
        try {
            resolver.resolve(text, env);
        } catch (const TypeMismatchError& e) {
            thrown = std::string(e.what()).find("overflow") != std::string::npos;
        }
        assert(thrown);
    }

    assert(resolver.resolve("{{min % minus_one}}", env) == 0);
    assert(resolver.resolve("{{max / minus_one}}", env) == -max);
    assert(resolver.resolve("{{-max}}", env) == -max);
    assert(resolver.resolve("{{max - 1 + 1}}", env) == max);
    std::cout << "test_integer_overflow_is_type_mismatch passed." << std::endl;
}

void test_resolution_is_idempotent() {
    TemplateResolver resolver;
    auto env = make_env();

    const std::string literal = "a literal { with } braces";
    Value once = resolver.resolve(literal, env);
    Value twice = resolver.resolve(once.get<std::string>(), env);
    assert(once == literal);
    assert(twice == once);

    Value resolved = resolver.resolve("Page {{page}}", env);
    assert(resolver.resolve(resolved.get<std::string>(), env) == resolved);
    std::cout << "test_resolution_is_idempotent passed." << std::endl;
}

void test_resolve_value_walks_containers() {
    TemplateResolver resolver;
    auto env = make_env();

    Value input = {{"id", "{{item.id}}"}, {"pages", Value::array({"{{page}}", "p{{page + 1}}"})}, {"n", 3}};
    Value out = resolver.resolve_value(input, env);

    assert(out["id"] == 42);
    assert(out["pages"][0] == 1);
    assert(out["pages"][1] == "p2");
    assert(out["n"] == 3);
    std::cout << "test_resolve_value_walks_containers passed." << std::endl;
}

void test_check_syntax() {
    TemplateResolver::check_syntax(std::string("plain"));
    TemplateResolver::check_syntax(std::string("{{ a.b[0] + 'x' }}"));

    const char* broken[] = {"{{ page + }}", "{{ unterminated", "{{ }}", "{{ a..b }}", "{{ (a }}", "{{ a # b }}"};
    for (const char* text : broken) {
        bool thrown = false;
        try {
            TemplateResolver::check_syntax(std::string(text));
        } catch (const ValidationError&) {
            thrown = true;
        }
        assert(thrown);
    }
    std::cout << "test_check_syntax passed." << std::endl;
}

int main() {
    test_whole_placeholder_keeps_type();
    test_interpolation();
    test_property_and_index_access();
    test_arithmetic();
    test_concatenation();
    test_undefined_variable_names_reference();
    test_type_mismatch();
    test_integer_overflow_is_type_mismatch();
    test_resolution_is_idempotent();
    test_resolve_value_walks_containers();
    test_check_syntax();

    std::cout << "All TemplateResolver tests passed!" << std::endl;
    return 0;
}
