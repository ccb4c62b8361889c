#ifndef FORMULIZE_EXPRESSION_PARSER_HPP
#define FORMULIZE_EXPRESSION_PARSER_HPP

#include <formulize/expression.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace formulize {

/**
 * Token produced by the math-syntax lexer. The generated-function parser
 * reuses the same lexer with its own keyword handling.
 */
struct Token {
    enum Kind {
        NUMBER,
        IDENTIFIER,
        STRING,
        OPERATOR,
        END
    };

    Kind kind = END;
    std::string text;
    double number = 0.0;
    std::size_t position = 0;

    bool is(Kind k, std::string_view t) const { return kind == k && text == t; }
    bool is_operator(std::string_view t) const { return is(OPERATOR, t); }
};

/**
 * Split source text into tokens. Multi-character operators are matched
 * longest-first. Throws ParseError on characters outside the grammar.
 */
std::vector<Token> tokenize(std::string_view source);

// Holds one level of parser recursion for its lifetime
class NestingGuard {
public:
    explicit NestingGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~NestingGuard() { --depth_; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    std::size_t& depth_;
};

/**
 * Recursive descent parser for the math expression grammar:
 *
 *   conditional → or ("?" conditional ":" conditional)?
 *   or          → xor ("or" xor)*
 *   xor         → and ("xor" and)*
 *   and         → compare ("and" compare)*
 *   compare     → additive (("<"|"<="|">"|">="|"=="|"!=") additive)*
 *   additive    → multiplicative (("+"|"-") multiplicative)*
 *   multiplicative → unary (("*"|"/"|"%"|"mod") unary | implicit unary)*
 *   unary       → ("-"|"+"|"not") unary | power
 *   power       → primary ("^" unary)?
 *   primary     → number | identifier | call | "(" conditional ")" | "[" list "]"
 *
 * Input nested deeper than MAX_EXPRESSION_DEPTH is rejected with ParseError.
 */
class ExpressionParser {
public:
    static ExpressionPtr parse(std::string_view source);

private:
    explicit ExpressionParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t nesting_ = 0;

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }
    bool match_operator(std::string_view op);
    bool match_keyword(std::string_view keyword);
    void expect_operator(std::string_view op);

    NestingGuard enter();
    ExpressionPtr binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs) const;

    ExpressionPtr parse_conditional();
    ExpressionPtr parse_or();
    ExpressionPtr parse_xor();
    ExpressionPtr parse_and();
    ExpressionPtr parse_compare();
    ExpressionPtr parse_additive();
    ExpressionPtr parse_multiplicative();
    ExpressionPtr parse_unary();
    ExpressionPtr parse_power();
    ExpressionPtr parse_primary();
    std::vector<ExpressionPtr> parse_list(std::string_view closing);

    bool starts_implicit_operand() const;
};

// Words with operator meaning in the math grammar
bool is_reserved_word(std::string_view word);

} // namespace formulize

#endif // FORMULIZE_EXPRESSION_PARSER_HPP
