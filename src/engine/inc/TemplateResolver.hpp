#pragma once

#include "Environment.hpp"
#include "Value.hpp"
#include <memory>
#include <string>
#include <vector>

struct TemplateNode;

// Compiled `{{expr}}` expression over the restricted template grammar:
// literals, identifiers, dotted/bracket access, + - * / %, unary minus
// and parentheses.
class TemplateExpression {
public:
    explicit TemplateExpression(const std::string& source);
    ~TemplateExpression();

    TemplateExpression(TemplateExpression&&) noexcept;
    TemplateExpression& operator=(TemplateExpression&&) noexcept;

    Value evaluate(const Environment& env) const;

    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
    std::unique_ptr<TemplateNode> root_;
};

class TemplateResolver {
public:
    struct Segment {
        bool is_expression;
        std::string text;
    };

    // A string that is exactly one placeholder resolves to the typed value,
    // any other string is interpolated. Strings without placeholders are
    // returned unchanged.
    Value resolve(const std::string& text, const Environment& env) const;

    // Always yields the interpolated text form
    std::string resolve_string(const std::string& text, const Environment& env) const;

    // Walks sequences and mappings, resolving every string found
    Value resolve_value(const Value& value, const Environment& env) const;

    Value evaluate_expression(const std::string& expression, const Environment& env) const;

    static bool has_placeholders(const std::string& text);

    // Splits text into literal and expression segments, throws ValidationError
    // on an unterminated or empty placeholder
    static std::vector<Segment> split(const std::string& text);

    // Parses every placeholder without evaluating, throws ValidationError
    static void check_syntax(const std::string& text);
    static void check_syntax(const Value& value);
};
