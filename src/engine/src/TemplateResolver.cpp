#include "TemplateResolver.hpp"
#include "WorkflowErrors.hpp"
#include "StringUtils.hpp"
#include <cctype>
#include <cmath>
#include <fmt/format.h>

struct TemplateNode {
    enum class Kind { Literal, Variable, Member, Index, Negate, Binary };

    Kind kind = Kind::Literal;
    Value literal;
    std::string name;   // Variable name or member key
    char op = 0;
    std::unique_ptr<TemplateNode> lhs;
    std::unique_ptr<TemplateNode> rhs;
};

namespace {

using NodePtr = std::unique_ptr<TemplateNode>;

struct Token {
    enum class Type { Number, String, Identifier, Symbol, End };

    Type type = Type::End;
    std::string text;
    Value number;
    size_t pos = 0;
};

class Lexer {
public:
    explicit Lexer(const std::string& src) : src_(src) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skip_spaces();
            Token token;
            token.pos = pos_;
            if (pos_ >= src_.size()) {
                tokens.push_back(token);
                return tokens;
            }

            char c = src_[pos_];
            bool after_dot = !tokens.empty() && tokens.back().type == Token::Type::Symbol && tokens.back().text == ".";

            if (std::isdigit(static_cast<unsigned char>(c))) {
                token.type = Token::Type::Number;
                lex_number(token, after_dot);
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                token.type = Token::Type::Identifier;
                size_t start = pos_;
                while (pos_ < src_.size() &&
                       (std::isalnum(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
                    ++pos_;
                }
                token.text = src_.substr(start, pos_ - start);
            } else if (c == '"' || c == '\'') {
                token.type = Token::Type::String;
                lex_string(token, c);
            } else if (std::string("+-*/%()[].").find(c) != std::string::npos) {
                token.type = Token::Type::Symbol;
                token.text = std::string(1, c);
                ++pos_;
            } else {
                fail(fmt::format("unexpected character '{}' at offset {}", c, pos_));
            }
            tokens.push_back(std::move(token));
        }
    }

private:
    void skip_spaces() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    }

    // Right after '.', digits are a sequence index and never a fraction
    void lex_number(Token& token, bool integer_only) {
        size_t start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;

        bool is_float = false;
        if (!integer_only && pos_ + 1 < src_.size() && src_[pos_] == '.' &&
            std::isdigit(static_cast<unsigned char>(src_[pos_ + 1]))) {
            is_float = true;
            ++pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        token.text = src_.substr(start, pos_ - start);
        try {
            if (is_float) {
                token.number = std::stod(token.text);
            } else {
                token.number = static_cast<int64_t>(std::stoll(token.text));
            }
        } catch (const std::out_of_range&) {
            fail("number out of range: " + token.text);
        }
    }

    void lex_string(Token& token, char quote) {
        ++pos_;
        std::string out;
        while (pos_ < src_.size() && src_[pos_] != quote) {
            if (src_[pos_] == '\\' && pos_ + 1 < src_.size()) {
                ++pos_;
            }
            out += src_[pos_++];
        }
        if (pos_ >= src_.size()) {
            fail("unterminated string literal");
        }
        ++pos_;
        token.text = std::move(out);
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw ValidationError(fmt::format("invalid template expression '{}': {}", src_, reason));
    }

    const std::string& src_;
    size_t pos_ = 0;
};

// additive := multiplicative (('+'|'-') multiplicative)*
// multiplicative := unary (('*'|'/'|'%') unary)*
// unary := '-' unary | postfix
// postfix := primary ('.' (identifier|integer) | '[' additive ']')*
// primary := number | string | true | false | null | identifier | '(' additive ')'
class Parser {
public:
    explicit Parser(const std::string& src) : src_(src), tokens_(Lexer(src).tokenize()) {}

    NodePtr parse() {
        auto node = parse_additive();
        if (peek().type != Token::Type::End) {
            fail(fmt::format("unexpected token '{}' at offset {}", peek().text, peek().pos));
        }
        return node;
    }

private:
    const Token& peek() const { return tokens_[index_]; }

    bool accept_symbol(const char* symbol) {
        if (peek().type == Token::Type::Symbol && peek().text == symbol) {
            ++index_;
            return true;
        }
        return false;
    }

    NodePtr make_binary(char op, NodePtr lhs, NodePtr rhs) {
        auto node = std::make_unique<TemplateNode>();
        node->kind = TemplateNode::Kind::Binary;
        node->op = op;
        node->lhs = std::move(lhs);
        node->rhs = std::move(rhs);
        return node;
    }

    NodePtr parse_additive() {
        auto node = parse_multiplicative();
        while (true) {
            if (accept_symbol("+")) {
                node = make_binary('+', std::move(node), parse_multiplicative());
            } else if (accept_symbol("-")) {
                node = make_binary('-', std::move(node), parse_multiplicative());
            } else {
                return node;
            }
        }
    }

    NodePtr parse_multiplicative() {
        auto node = parse_unary();
        while (true) {
            if (accept_symbol("*")) {
                node = make_binary('*', std::move(node), parse_unary());
            } else if (accept_symbol("/")) {
                node = make_binary('/', std::move(node), parse_unary());
            } else if (accept_symbol("%")) {
                node = make_binary('%', std::move(node), parse_unary());
            } else {
                return node;
            }
        }
    }

    NodePtr parse_unary() {
        if (accept_symbol("-")) {
            auto node = std::make_unique<TemplateNode>();
            node->kind = TemplateNode::Kind::Negate;
            node->lhs = parse_unary();
            return node;
        }
        return parse_postfix();
    }

    NodePtr parse_postfix() {
        auto node = parse_primary();
        while (true) {
            if (accept_symbol(".")) {
                const Token& token = peek();
                if (token.type != Token::Type::Identifier && token.type != Token::Type::Number) {
                    fail(fmt::format("expected property name after '.' at offset {}", token.pos));
                }
                auto member = std::make_unique<TemplateNode>();
                member->kind = TemplateNode::Kind::Member;
                member->name = token.text;
                member->lhs = std::move(node);
                node = std::move(member);
                ++index_;
            } else if (accept_symbol("[")) {
                auto index = std::make_unique<TemplateNode>();
                index->kind = TemplateNode::Kind::Index;
                index->lhs = std::move(node);
                index->rhs = parse_additive();
                if (!accept_symbol("]")) {
                    fail(fmt::format("expected ']' at offset {}", peek().pos));
                }
                node = std::move(index);
            } else {
                return node;
            }
        }
    }

    NodePtr parse_primary() {
        const Token& token = peek();
        auto node = std::make_unique<TemplateNode>();

        switch (token.type) {
            case Token::Type::Number:
                node->literal = token.number;
                ++index_;
                return node;

            case Token::Type::String:
                node->literal = token.text;
                ++index_;
                return node;

            case Token::Type::Identifier:
                if (token.text == "true" || token.text == "false") {
                    node->literal = (token.text == "true");
                } else if (token.text == "null") {
                    node->literal = nullptr;
                } else {
                    node->kind = TemplateNode::Kind::Variable;
                    node->name = token.text;
                }
                ++index_;
                return node;

            case Token::Type::Symbol:
                if (accept_symbol("(")) {
                    node = parse_additive();
                    if (!accept_symbol(")")) {
                        fail(fmt::format("expected ')' at offset {}", peek().pos));
                    }
                    return node;
                }
                fail(fmt::format("unexpected '{}' at offset {}", token.text, token.pos));

            case Token::Type::End:
                break;
        }
        fail("unexpected end of expression");
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw ValidationError(fmt::format("invalid template expression '{}': {}", src_, reason));
    }

    const std::string& src_;
    std::vector<Token> tokens_;
    size_t index_ = 0;
};

// Dotted path of a node, used to name unresolved references
std::string describe(const TemplateNode& node) {
    switch (node.kind) {
        case TemplateNode::Kind::Variable:
            return node.name;
        case TemplateNode::Kind::Member:
            return describe(*node.lhs) + "." + node.name;
        case TemplateNode::Kind::Index:
            return describe(*node.lhs) + "[" + describe(*node.rhs) + "]";
        case TemplateNode::Kind::Literal:
            return node.literal.is_string() ? "\"" + node.literal.get<std::string>() + "\"" : node.literal.dump();
        case TemplateNode::Kind::Negate:
            return "-" + describe(*node.lhs);
        case TemplateNode::Kind::Binary:
            return describe(*node.lhs) + " " + node.op + " " + describe(*node.rhs);
    }
    return {};
}

Value length_of(const Value& value) {
    if (value.is_string()) {
        return static_cast<int64_t>(value.get_ref<const std::string&>().size());
    }
    return static_cast<int64_t>(value.size());
}

Value access_member(const Value& base, const std::string& key, const TemplateNode& node) {
    if (base.is_object()) {
        auto it = base.find(key);
        if (it != base.end()) {
            return *it;
        }
        if (key == "length") {
            return length_of(base);
        }
        throw ReferenceError(describe(node));
    }

    if (base.is_array()) {
        if (key == "length") {
            return length_of(base);
        }
        if (!key.empty() && std::isdigit(static_cast<unsigned char>(key[0]))) {
            size_t index = std::stoull(key);
            if (index < base.size()) {
                return base[index];
            }
        }
        throw ReferenceError(describe(node));
    }

    if (base.is_string() && key == "length") {
        return length_of(base);
    }

    throw TypeMismatchError(fmt::format("Cannot access property '{}' of {} value in '{}'",
                                        key, ValueUtils::type_name(base), describe(node)));
}

Value access_index(const Value& base, const Value& index, const TemplateNode& node) {
    if (index.is_string()) {
        return access_member(base, index.get<std::string>(), node);
    }

    if (!index.is_number_integer()) {
        throw TypeMismatchError(fmt::format("Index of '{}' must be an integer or string, got {}",
                                            describe(node), ValueUtils::type_name(index)));
    }

    if (base.is_array()) {
        int64_t i = index.get<int64_t>();
        if (i < 0) {
            i += static_cast<int64_t>(base.size());
        }
        if (i >= 0 && static_cast<size_t>(i) < base.size()) {
            return base[static_cast<size_t>(i)];
        }
        throw ReferenceError(describe(node));
    }

    if (base.is_string()) {
        const auto& text = base.get_ref<const std::string&>();
        int64_t i = index.get<int64_t>();
        if (i >= 0 && static_cast<size_t>(i) < text.size()) {
            return std::string(1, text[static_cast<size_t>(i)]);
        }
        throw ReferenceError(describe(node));
    }

    return access_member(base, ValueUtils::to_text(index), node);
}

[[noreturn]] void overflow(const TemplateNode& node) {
    throw TypeMismatchError("Integer overflow in '" + describe(node) + "'");
}

Value arithmetic(char op, const Value& lhs, const Value& rhs, const TemplateNode& node) {
    if (op == '+') {
        if (lhs.is_array()) {
            Value result = lhs;
            if (rhs.is_array()) {
                result.insert(result.end(), rhs.begin(), rhs.end());
            } else {
                result.push_back(rhs);
            }
            return result;
        }
        if (lhs.is_string() || rhs.is_string()) {
            if (lhs.is_object() || rhs.is_object() || rhs.is_array()) {
                throw TypeMismatchError(fmt::format("Cannot concatenate {} and {} in '{}'",
                                                    ValueUtils::type_name(lhs), ValueUtils::type_name(rhs), describe(node)));
            }
            return ValueUtils::to_text(lhs) + ValueUtils::to_text(rhs);
        }
    }

    if (!lhs.is_number() || !rhs.is_number()) {
        throw TypeMismatchError(fmt::format("Operator '{}' needs numbers, got {} and {} in '{}'",
                                            op, ValueUtils::type_name(lhs), ValueUtils::type_name(rhs), describe(node)));
    }

    if (ValueUtils::fits_int64(lhs) && ValueUtils::fits_int64(rhs)) {
        int64_t a = lhs.get<int64_t>();
        int64_t b = rhs.get<int64_t>();
        int64_t out = 0;
        switch (op) {
            case '+':
                if (__builtin_add_overflow(a, b, &out)) overflow(node);
                return out;
            case '-':
                if (__builtin_sub_overflow(a, b, &out)) overflow(node);
                return out;
            case '*':
                if (__builtin_mul_overflow(a, b, &out)) overflow(node);
                return out;
            case '/':
                if (b == 0) throw TypeMismatchError("Division by zero in '" + describe(node) + "'");
                // INT64_MIN / -1 does not fit
                if (b == -1) {
                    if (__builtin_sub_overflow(int64_t{0}, a, &out)) overflow(node);
                    return out;
                }
                if (a % b == 0) return a / b;
                return static_cast<double>(a) / static_cast<double>(b);
            case '%':
                if (b == 0) throw TypeMismatchError("Modulo by zero in '" + describe(node) + "'");
                if (b == -1) return int64_t{0};
                return a % b;
        }
    }

    double a = lhs.get<double>();
    double b = rhs.get<double>();
    switch (op) {
        case '+': return a + b;
        case '-': return a - b;
        case '*': return a * b;
        case '/':
            if (b == 0.0) throw TypeMismatchError("Division by zero in '" + describe(node) + "'");
            return a / b;
        case '%':
            if (b == 0.0) throw TypeMismatchError("Modulo by zero in '" + describe(node) + "'");
            return std::fmod(a, b);
    }
    throw TypeMismatchError(fmt::format("Unknown operator '{}'", op));
}

Value evaluate_node(const TemplateNode& node, const Environment& env) {
    switch (node.kind) {
        case TemplateNode::Kind::Literal:
            return node.literal;

        case TemplateNode::Kind::Variable:
            return env.get(node.name);

        case TemplateNode::Kind::Member:
            return access_member(evaluate_node(*node.lhs, env), node.name, node);

        case TemplateNode::Kind::Index:
            return access_index(evaluate_node(*node.lhs, env), evaluate_node(*node.rhs, env), node);

        case TemplateNode::Kind::Negate: {
            Value operand = evaluate_node(*node.lhs, env);
            if (ValueUtils::fits_int64(operand)) {
                int64_t out = 0;
                if (__builtin_sub_overflow(int64_t{0}, operand.get<int64_t>(), &out)) overflow(node);
                return out;
            }
            if (operand.is_number()) return -operand.get<double>();
            throw TypeMismatchError(fmt::format("Cannot negate {} value in '{}'",
                                                ValueUtils::type_name(operand), describe(node)));
        }

        case TemplateNode::Kind::Binary:
            return arithmetic(node.op, evaluate_node(*node.lhs, env), evaluate_node(*node.rhs, env), node);
    }
    return nullptr;
}

}

TemplateExpression::TemplateExpression(const std::string& source)
    : source_(StringUtils::trimmed(source)) {
    if (source_.empty()) {
        throw ValidationError("empty template placeholder");
    }
    root_ = Parser(source_).parse();
}

TemplateExpression::~TemplateExpression() = default;
TemplateExpression::TemplateExpression(TemplateExpression&&) noexcept = default;
TemplateExpression& TemplateExpression::operator=(TemplateExpression&&) noexcept = default;

Value TemplateExpression::evaluate(const Environment& env) const {
    return evaluate_node(*root_, env);
}

bool TemplateResolver::has_placeholders(const std::string& text) {
    return text.find("{{") != std::string::npos;
}

std::vector<TemplateResolver::Segment> TemplateResolver::split(const std::string& text) {
    std::vector<Segment> segments;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string::npos) {
            segments.push_back({false, text.substr(pos)});
            break;
        }
        if (open > pos) {
            segments.push_back({false, text.substr(pos, open - pos)});
        }

        size_t close = text.find("}}", open + 2);
        if (close == std::string::npos) {
            throw ValidationError(fmt::format("unterminated placeholder in template '{}'", text));
        }

        std::string expression = StringUtils::trimmed(text.substr(open + 2, close - open - 2));
        if (expression.empty()) {
            throw ValidationError(fmt::format("empty placeholder in template '{}'", text));
        }
        segments.push_back({true, std::move(expression)});
        pos = close + 2;
    }

    return segments;
}

Value TemplateResolver::evaluate_expression(const std::string& expression, const Environment& env) const {
    return TemplateExpression(expression).evaluate(env);
}

Value TemplateResolver::resolve(const std::string& text, const Environment& env) const {
    if (!has_placeholders(text)) {
        return text;
    }

    auto segments = split(text);
    if (segments.size() == 1 && segments.front().is_expression) {
        return evaluate_expression(segments.front().text, env);
    }

    std::string out;
    for (const auto& segment : segments) {
        if (segment.is_expression) {
            out += ValueUtils::to_text(evaluate_expression(segment.text, env));
        } else {
            out += segment.text;
        }
    }
    return out;
}

std::string TemplateResolver::resolve_string(const std::string& text, const Environment& env) const {
    return ValueUtils::to_text(resolve(text, env));
}

Value TemplateResolver::resolve_value(const Value& value, const Environment& env) const {
    if (value.is_string()) {
        return resolve(value.get_ref<const std::string&>(), env);
    }

    if (value.is_array()) {
        Value out = Value::array();
        for (const auto& item : value) {
            out.push_back(resolve_value(item, env));
        }
        return out;
    }

    if (value.is_object()) {
        Value out = Value::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = resolve_value(it.value(), env);
        }
        return out;
    }

    return value;
}

void TemplateResolver::check_syntax(const std::string& text) {
    if (!has_placeholders(text)) {
        return;
    }
    for (const auto& segment : split(text)) {
        if (segment.is_expression) {
            TemplateExpression expression(segment.text);
        }
    }
}

void TemplateResolver::check_syntax(const Value& value) {
    if (value.is_string()) {
        check_syntax(value.get_ref<const std::string&>());
    } else if (value.is_structured()) {
        for (const auto& item : value) {
            check_syntax(item);
        }
    }
}
