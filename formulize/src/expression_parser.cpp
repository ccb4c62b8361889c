#include <formulize/expression_parser.hpp>
#include <formulize/errors.hpp>
#include <cctype>
#include <cstdlib>
#include <array>
#include <utility>

namespace formulize {

namespace {

// Longest operators first so "===" wins over "=="
constexpr std::array<std::string_view, 15> MULTI_CHAR_OPERATORS = {
    "===", "!==", "**=", "**", "==", "!=", "<=", ">=", "&&", "||", "+=", "-=", "*=", "/=", "=>"
};

constexpr std::string_view SINGLE_CHAR_OPERATORS = "+-*/%^()[]{},;:?!<>=.";

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool is_reserved_word(std::string_view word) {
    static constexpr std::array<std::string_view, 8> reserved = {
        "mod", "to", "in", "and", "xor", "or", "not", "end"
    };
    for (auto r : reserved) {
        if (r == word) return true;
    }
    return false;
}

std::vector<Token> tokenize(std::string_view source) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    const std::size_t n = source.size();

    while (i < n) {
        char c = source[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        // Comments
        if (c == '/' && i + 1 < n && source[i + 1] == '/') {
            while (i < n && source[i] != '\n') ++i;
            continue;
        }
        if (c == '/' && i + 1 < n && source[i + 1] == '*') {
            std::size_t close = source.find("*/", i + 2);
            if (close == std::string_view::npos) {
                throw ParseError("unterminated comment", i);
            }
            i = close + 2;
            continue;
        }

        Token token;
        token.position = i;

        if (is_digit(c) || (c == '.' && i + 1 < n && is_digit(source[i + 1]))) {
            std::size_t start = i;
            while (i < n && is_digit(source[i])) ++i;
            if (i < n && source[i] == '.') {
                ++i;
                while (i < n && is_digit(source[i])) ++i;
            }
            // Exponent only when digits follow, so "2e" stays 2 * e
            if (i < n && (source[i] == 'e' || source[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < n && (source[j] == '+' || source[j] == '-')) ++j;
                if (j < n && is_digit(source[j])) {
                    i = j;
                    while (i < n && is_digit(source[i])) ++i;
                }
            }
            token.kind = Token::NUMBER;
            token.text = std::string(source.substr(start, i - start));
            token.number = std::strtod(token.text.c_str(), nullptr);
            tokens.push_back(std::move(token));
            continue;
        }

        if (is_identifier_start(c)) {
            std::size_t start = i;
            while (i < n && is_identifier_char(source[i])) ++i;
            token.kind = Token::IDENTIFIER;
            token.text = std::string(source.substr(start, i - start));
            tokens.push_back(std::move(token));
            continue;
        }

        if (c == '"' || c == '\'' || c == '`') {
            char quote = c;
            std::size_t start = ++i;
            while (i < n && source[i] != quote) {
                if (source[i] == '\\') ++i;
                ++i;
            }
            if (i >= n) {
                throw ParseError("unterminated string", token.position);
            }
            token.kind = Token::STRING;
            token.text = std::string(source.substr(start, i - start));
            ++i;
            tokens.push_back(std::move(token));
            continue;
        }

        bool matched = false;
        for (auto op : MULTI_CHAR_OPERATORS) {
            if (source.substr(i, op.size()) == op) {
                token.kind = Token::OPERATOR;
                token.text = std::string(op);
                i += op.size();
                matched = true;
                break;
            }
        }
        if (!matched && SINGLE_CHAR_OPERATORS.find(c) != std::string_view::npos) {
            token.kind = Token::OPERATOR;
            token.text = std::string(1, c);
            ++i;
            matched = true;
        }
        if (!matched) {
            throw ParseError(std::string("unexpected character '") + c + "'", i);
        }
        tokens.push_back(std::move(token));
    }

    Token end;
    end.kind = Token::END;
    end.position = n;
    tokens.push_back(end);
    return tokens;
}

ExpressionPtr ExpressionParser::parse(std::string_view source) {
    ExpressionParser parser(tokenize(source));
    if (parser.peek().kind == Token::END) {
        throw ParseError("empty expression", 0);
    }
    ExpressionPtr result = parser.parse_conditional();
    if (parser.peek().kind != Token::END) {
        throw ParseError("unexpected token '" + parser.peek().text + "'", parser.peek().position);
    }
    return result;
}

bool ExpressionParser::match_operator(std::string_view op) {
    if (peek().is_operator(op)) {
        ++pos_;
        return true;
    }
    return false;
}

bool ExpressionParser::match_keyword(std::string_view keyword) {
    if (peek().is(Token::IDENTIFIER, keyword)) {
        ++pos_;
        return true;
    }
    return false;
}

void ExpressionParser::expect_operator(std::string_view op) {
    if (!match_operator(op)) {
        throw ParseError("expected '" + std::string(op) + "' but found '" + peek().text + "'", peek().position);
    }
}

NestingGuard ExpressionParser::enter() {
    if (nesting_ >= MAX_EXPRESSION_DEPTH) {
        throw ParseError("expression nested too deeply", peek().position);
    }
    return NestingGuard(nesting_);
}

ExpressionPtr ExpressionParser::binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs) const {
    ExpressionPtr node = ExpressionNode::make_binary(op, std::move(lhs), std::move(rhs));
    if (node->depth > MAX_EXPRESSION_DEPTH) {
        throw ParseError("expression nested too deeply", peek().position);
    }
    return node;
}

ExpressionPtr ExpressionParser::parse_conditional() {
    auto guard = enter();
    ExpressionPtr condition = parse_or();
    if (match_operator("?")) {
        ExpressionPtr when_true = parse_conditional();
        expect_operator(":");
        ExpressionPtr when_false = parse_conditional();
        return ExpressionNode::make_conditional(condition, when_true, when_false);
    }
    return condition;
}

ExpressionPtr ExpressionParser::parse_or() {
    ExpressionPtr lhs = parse_xor();
    while (match_keyword("or")) {
        lhs = binary(BinaryOp::Or, lhs, parse_xor());
    }
    return lhs;
}

ExpressionPtr ExpressionParser::parse_xor() {
    ExpressionPtr lhs = parse_and();
    while (match_keyword("xor")) {
        lhs = binary(BinaryOp::Xor, lhs, parse_and());
    }
    return lhs;
}

ExpressionPtr ExpressionParser::parse_and() {
    ExpressionPtr lhs = parse_compare();
    while (match_keyword("and")) {
        lhs = binary(BinaryOp::And, lhs, parse_compare());
    }
    return lhs;
}

ExpressionPtr ExpressionParser::parse_compare() {
    ExpressionPtr lhs = parse_additive();
    while (true) {
        BinaryOp op;
        if (match_operator("<")) op = BinaryOp::Less;
        else if (match_operator("<=")) op = BinaryOp::LessEqual;
        else if (match_operator(">")) op = BinaryOp::Greater;
        else if (match_operator(">=")) op = BinaryOp::GreaterEqual;
        else if (match_operator("==")) op = BinaryOp::Equal;
        else if (match_operator("!=")) op = BinaryOp::NotEqual;
        else break;
        lhs = binary(op, lhs, parse_additive());
    }
    return lhs;
}

ExpressionPtr ExpressionParser::parse_additive() {
    ExpressionPtr lhs = parse_multiplicative();
    while (true) {
        if (match_operator("+")) {
            lhs = binary(BinaryOp::Add, lhs, parse_multiplicative());
        } else if (match_operator("-")) {
            lhs = binary(BinaryOp::Subtract, lhs, parse_multiplicative());
        } else {
            break;
        }
    }
    return lhs;
}

ExpressionPtr ExpressionParser::parse_multiplicative() {
    ExpressionPtr lhs = parse_unary();
    while (true) {
        if (match_operator("*")) {
            lhs = binary(BinaryOp::Multiply, lhs, parse_unary());
        } else if (match_operator("/")) {
            lhs = binary(BinaryOp::Divide, lhs, parse_unary());
        } else if (match_operator("%") || match_keyword("mod")) {
            lhs = binary(BinaryOp::Mod, lhs, parse_unary());
        } else if (starts_implicit_operand()) {
            // 2x, 2(x + 1), (a)(b)
            lhs = binary(BinaryOp::Multiply, lhs, parse_unary());
        } else {
            break;
        }
    }
    return lhs;
}

ExpressionPtr ExpressionParser::parse_unary() {
    auto guard = enter();
    if (match_operator("-")) {
        return ExpressionNode::make_unary(UnaryOp::Negate, parse_unary());
    }
    if (match_operator("+")) {
        return ExpressionNode::make_unary(UnaryOp::Plus, parse_unary());
    }
    if (match_keyword("not")) {
        return ExpressionNode::make_unary(UnaryOp::Not, parse_unary());
    }
    return parse_power();
}

ExpressionPtr ExpressionParser::parse_power() {
    ExpressionPtr base = parse_primary();
    if (match_operator("^")) {
        // Right associative, exponent may carry its own sign
        return binary(BinaryOp::Power, base, parse_unary());
    }
    return base;
}

ExpressionPtr ExpressionParser::parse_primary() {
    const Token& token = peek();

    if (token.kind == Token::NUMBER) {
        advance();
        return ExpressionNode::make_number(token.number);
    }

    if (token.kind == Token::IDENTIFIER) {
        if (is_reserved_word(token.text)) {
            throw ParseError("unexpected keyword '" + token.text + "'", token.position);
        }
        std::string name = advance().text;
        if (match_operator("(")) {
            if (!is_known_function(name)) {
                throw ParseError("unknown function '" + name + "'", token.position);
            }
            return ExpressionNode::make_call(name, parse_list(")"));
        }
        return ExpressionNode::make_symbol(name);
    }

    if (match_operator("(")) {
        ExpressionPtr inner = parse_conditional();
        expect_operator(")");
        return inner;
    }

    if (match_operator("[")) {
        return ExpressionNode::make_array(parse_list("]"));
    }

    if (token.kind == Token::END) {
        throw ParseError("unexpected end of expression", token.position);
    }
    throw ParseError("unexpected token '" + token.text + "'", token.position);
}

std::vector<ExpressionPtr> ExpressionParser::parse_list(std::string_view closing) {
    std::vector<ExpressionPtr> items;
    if (match_operator(closing)) {
        return items;
    }
    do {
        items.push_back(parse_conditional());
    } while (match_operator(","));
    expect_operator(closing);
    return items;
}

bool ExpressionParser::starts_implicit_operand() const {
    const Token& token = peek();
    if (token.kind == Token::IDENTIFIER) {
        return !is_reserved_word(token.text);
    }
    return token.is_operator("(");
}

} // namespace formulize
