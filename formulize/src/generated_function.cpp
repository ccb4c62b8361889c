#include <formulize/generated_function.hpp>
#include <formulize/expression.hpp>
#include <formulize/expression_parser.hpp>
#include <formulize/errors.hpp>
#include <formulize/log.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <map>
#include <numbers>
#include <utility>

namespace formulize {

using ObjectEntries = std::vector<std::pair<std::string, ExpressionPtr>>;

struct GeneratedFunction::Statement {
    enum class Kind {
        Declare,
        Destructure,
        Assign,
        MemberAssign,
        If,
        Block,
        Try,
        Return
    };

    Kind kind = Kind::Block;
    std::string name;
    std::string member;
    ExpressionPtr expression;                 // Assigned value or condition
    std::optional<ObjectEntries> object;      // Object literal initializer / return value

    std::vector<std::pair<std::string, std::string>> bindings;  // Destructure: (local, field)

    std::vector<StatementPtr> body;       // Block, then-branch, try block
    std::vector<StatementPtr> alternate;  // else-branch, catch block
    std::vector<StatementPtr> finalizer;  // finally block
    bool has_catch = false;
};

namespace {

using Statement = GeneratedFunction::Statement;
using StatementPtr = GeneratedFunction::StatementPtr;

// JavaScript Math members backed by the shared function table
bool is_math_function(const std::string& name) {
    static const std::set<std::string> allowed = {
        "abs", "sign", "sqrt", "cbrt", "exp", "log", "log2", "log10",
        "sin", "cos", "tan", "asin", "acos", "atan", "atan2",
        "sinh", "cosh", "tanh", "floor", "ceil", "round", "trunc",
        "min", "max", "pow", "hypot"
    };
    return allowed.count(name) > 0;
}

const double* math_constant(const std::string& name) {
    static const std::map<std::string, double> constants = {
        {"PI", std::numbers::pi},
        {"E", std::numbers::e},
        {"LN2", std::numbers::ln2},
        {"LN10", std::numbers::ln10},
        {"LOG2E", std::numbers::log2e},
        {"LOG10E", std::numbers::log10e},
        {"SQRT2", std::numbers::sqrt2},
        {"SQRT1_2", std::numbers::sqrt2 / 2.0},
    };
    auto it = constants.find(name);
    return (it != constants.end()) ? &it->second : nullptr;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::size_t find_evaluate_function(std::string_view text) {
    constexpr std::string_view keyword = "function";
    constexpr std::string_view name = "evaluate";

    for (std::size_t at = text.find(keyword); at != std::string_view::npos; at = text.find(keyword, at + 1)) {
        std::size_t name_at = at + keyword.size();
        while (name_at < text.size() && std::isspace(static_cast<unsigned char>(text[name_at]))) {
            ++name_at;
        }
        if (name_at == at + keyword.size() || text.substr(name_at, name.size()) != name) {
            continue;
        }
        std::size_t end = name_at + name.size();
        if (end < text.size() && is_word_char(text[end])) {
            continue;
        }
        return at;
    }
    return std::string_view::npos;
}

/**
 * Recursive descent parser for the generated-function grammar. Tracks
 * declared locals per block so unknown identifiers are rejected up front.
 * Statements and expressions nested deeper than MAX_EXPRESSION_DEPTH are
 * rejected.
 */
class GeneratedFunctionParser {
public:
    GeneratedFunctionParser(std::vector<Token> tokens, GeneratedFunction& function)
        : tokens_(std::move(tokens)), function_(function) {}

    void parse_program();

private:
    struct Local {
        bool constant = false;
        bool object = false;
        bool opaque = false;  // catch parameter, never readable
    };

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t nesting_ = 0;
    GeneratedFunction& function_;
    std::vector<std::map<std::string, Local>> scopes_;

    const Token& peek(std::size_t ahead = 0) const {
        return tokens_[std::min(pos_ + ahead, tokens_.size() - 1)];
    }
    const Token& advance() {
        const Token& token = peek();
        if (pos_ < tokens_.size() - 1) ++pos_;
        return token;
    }

    GeneratedCodeInvalid invalid(const std::string& message) const {
        return GeneratedCodeInvalid(message + " at position " + std::to_string(peek().position));
    }

    bool match_operator(std::string_view op) {
        if (peek().is_operator(op)) {
            advance();
            return true;
        }
        return false;
    }

    bool match_keyword(std::string_view keyword) {
        if (peek().is(Token::IDENTIFIER, keyword)) {
            advance();
            return true;
        }
        return false;
    }

    void expect_operator(std::string_view op) {
        if (!match_operator(op)) {
            throw invalid("expected '" + std::string(op) + "' but found '" + peek().text + "'");
        }
    }

    void expect_keyword(std::string_view keyword) {
        if (!match_keyword(keyword)) {
            throw invalid("expected '" + std::string(keyword) + "'");
        }
    }

    std::string expect_identifier() {
        if (peek().kind != Token::IDENTIFIER) {
            throw invalid("expected identifier but found '" + peek().text + "'");
        }
        return advance().text;
    }

    void end_statement() { match_operator(";"); }

    NestingGuard enter() {
        if (nesting_ >= MAX_EXPRESSION_DEPTH) {
            throw invalid("code nested too deeply");
        }
        return NestingGuard(nesting_);
    }

    ExpressionPtr binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs) const {
        ExpressionPtr node = ExpressionNode::make_binary(op, std::move(lhs), std::move(rhs));
        if (node->depth > MAX_EXPRESSION_DEPTH) {
            throw invalid("expression nested too deeply");
        }
        return node;
    }

    const Local* find_local(const std::string& name) const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            auto found = it->find(name);
            if (found != it->end()) return &found->second;
        }
        return nullptr;
    }

    void declare(const std::string& name, Local local) {
        static const std::set<std::string> reserved = {
            "Math", "Number", "isFinite", "isNaN", "NaN", "Infinity", "true", "false", "undefined",
            "function", "return", "if", "else", "try", "catch", "finally", "const", "let", "var"
        };
        if (name == function_.parameter_ || reserved.count(name) > 0) {
            throw invalid("cannot declare '" + name + "'");
        }
        if (scopes_.back().count(name) > 0) {
            throw invalid("'" + name + "' is already declared");
        }
        scopes_.back()[name] = local;
    }

    static StatementPtr make(std::shared_ptr<Statement> statement) { return statement; }

    std::vector<StatementPtr> parse_block();
    std::vector<StatementPtr> parse_branch();
    void parse_statement(std::vector<StatementPtr>& out);
    void parse_declaration(bool constant, std::vector<StatementPtr>& out);
    StatementPtr parse_if();
    StatementPtr parse_try();
    StatementPtr parse_return();
    StatementPtr parse_assignment();
    ObjectEntries parse_object_literal();
    std::string parse_property_key();

    ExpressionPtr parse_expression();
    ExpressionPtr parse_or();
    ExpressionPtr parse_and();
    ExpressionPtr parse_equality();
    ExpressionPtr parse_relational();
    ExpressionPtr parse_additive();
    ExpressionPtr parse_multiplicative();
    ExpressionPtr parse_unary();
    ExpressionPtr parse_exponent();
    ExpressionPtr parse_primary();
    ExpressionPtr parse_identifier(const std::string& name);
    std::vector<ExpressionPtr> parse_arguments(std::string_view closing);
};

void GeneratedFunctionParser::parse_program() {
    expect_keyword("function");
    expect_keyword("evaluate");
    expect_operator("(");
    function_.parameter_ = expect_identifier();
    expect_operator(")");

    function_.body_ = parse_block();

    end_statement();
    if (peek().kind != Token::END) {
        throw invalid("unexpected '" + peek().text + "' after evaluate()");
    }
}

std::vector<StatementPtr> GeneratedFunctionParser::parse_block() {
    expect_operator("{");
    scopes_.emplace_back();

    std::vector<StatementPtr> statements;
    while (!match_operator("}")) {
        if (peek().kind == Token::END) {
            throw invalid("unterminated block");
        }
        parse_statement(statements);
    }

    scopes_.pop_back();
    return statements;
}

std::vector<StatementPtr> GeneratedFunctionParser::parse_branch() {
    std::vector<StatementPtr> statements;
    scopes_.emplace_back();
    parse_statement(statements);
    scopes_.pop_back();
    return statements;
}

void GeneratedFunctionParser::parse_statement(std::vector<StatementPtr>& out) {
    auto guard = enter();
    const Token& token = peek();

    if (token.is_operator(";")) {
        advance();
        return;
    }

    if (token.is_operator("{")) {
        auto block = std::make_shared<Statement>();
        block->kind = Statement::Kind::Block;
        block->body = parse_block();
        out.push_back(make(block));
        return;
    }

    if (token.kind == Token::IDENTIFIER) {
        if (token.text == "const" || token.text == "let" || token.text == "var") {
            bool constant = advance().text == "const";
            parse_declaration(constant, out);
            return;
        }
        if (token.text == "if") {
            out.push_back(parse_if());
            return;
        }
        if (token.text == "try") {
            out.push_back(parse_try());
            return;
        }
        if (token.text == "return") {
            out.push_back(parse_return());
            return;
        }
        out.push_back(parse_assignment());
        return;
    }

    throw invalid("unsupported statement starting with '" + token.text + "'");
}

void GeneratedFunctionParser::parse_declaration(bool constant, std::vector<StatementPtr>& out) {
    do {
        if (match_operator("{")) {
            auto statement = std::make_shared<Statement>();
            statement->kind = Statement::Kind::Destructure;
            while (!peek().is_operator("}")) {
                std::string field = expect_identifier();
                std::string local = field;
                if (match_operator(":")) {
                    local = expect_identifier();
                }
                statement->bindings.emplace_back(local, field);
                if (!match_operator(",")) break;
            }
            expect_operator("}");
            expect_operator("=");

            if (expect_identifier() != function_.parameter_) {
                throw invalid("destructuring is only supported from the parameter object");
            }
            for (const auto& [local, field] : statement->bindings) {
                declare(local, Local{constant, false, false});
                function_.referenced_inputs_.insert(field);
            }
            out.push_back(make(statement));
            continue;
        }

        auto statement = std::make_shared<Statement>();
        statement->kind = Statement::Kind::Declare;
        statement->name = expect_identifier();

        bool object = false;
        if (match_operator("=")) {
            if (peek().is_operator("{")) {
                statement->object = parse_object_literal();
                object = true;
            } else {
                statement->expression = parse_expression();
            }
        } else if (constant) {
            throw invalid("const '" + statement->name + "' has no initializer");
        }

        // Declared after the initializer so `let x = x` is rejected
        declare(statement->name, Local{constant, object, false});
        out.push_back(make(statement));
    } while (match_operator(","));

    end_statement();
}

StatementPtr GeneratedFunctionParser::parse_if() {
    expect_keyword("if");
    auto statement = std::make_shared<Statement>();
    statement->kind = Statement::Kind::If;

    expect_operator("(");
    statement->expression = parse_expression();
    expect_operator(")");

    statement->body = parse_branch();
    if (match_keyword("else")) {
        statement->alternate = parse_branch();
    }
    return make(statement);
}

StatementPtr GeneratedFunctionParser::parse_try() {
    expect_keyword("try");
    auto statement = std::make_shared<Statement>();
    statement->kind = Statement::Kind::Try;
    statement->body = parse_block();

    if (match_keyword("catch")) {
        statement->has_catch = true;
        scopes_.emplace_back();
        if (match_operator("(")) {
            declare(expect_identifier(), Local{true, false, true});
            expect_operator(")");
        }
        statement->alternate = parse_block();
        scopes_.pop_back();
    }
    if (match_keyword("finally")) {
        statement->finalizer = parse_block();
    }
    if (!statement->has_catch && statement->finalizer.empty()) {
        throw invalid("try without catch or finally");
    }
    return make(statement);
}

StatementPtr GeneratedFunctionParser::parse_return() {
    expect_keyword("return");
    auto statement = std::make_shared<Statement>();
    statement->kind = Statement::Kind::Return;

    if (peek().is_operator("{")) {
        statement->object = parse_object_literal();
    } else {
        std::string name = expect_identifier();
        const Local* local = find_local(name);
        if (!local || !local->object) {
            throw invalid("evaluate() must return an object");
        }
        statement->name = name;
    }
    end_statement();
    return make(statement);
}

StatementPtr GeneratedFunctionParser::parse_assignment() {
    std::string name = expect_identifier();
    const Local* local = find_local(name);
    if (!local) {
        throw invalid("assignment to undeclared '" + name + "'");
    }

    auto statement = std::make_shared<Statement>();
    statement->name = name;

    if (peek().is_operator(".") || peek().is_operator("[")) {
        if (!local->object) {
            throw invalid("'" + name + "' is not an object");
        }
        statement->kind = Statement::Kind::MemberAssign;
        statement->member = parse_property_key();
        expect_operator("=");
        statement->expression = parse_expression();
        end_statement();
        return make(statement);
    }

    if (local->constant) {
        throw invalid("assignment to const '" + name + "'");
    }
    if (local->object || local->opaque) {
        throw invalid("cannot reassign '" + name + "'");
    }

    statement->kind = Statement::Kind::Assign;

    // Compound assignments are lowered to name = name <op> value
    std::optional<BinaryOp> compound;
    if (match_operator("+=")) compound = BinaryOp::Add;
    else if (match_operator("-=")) compound = BinaryOp::Subtract;
    else if (match_operator("*=")) compound = BinaryOp::Multiply;
    else if (match_operator("/=")) compound = BinaryOp::Divide;
    else expect_operator("=");

    ExpressionPtr value = parse_expression();
    statement->expression = compound
        ? ExpressionNode::make_binary(*compound, ExpressionNode::make_symbol(name), value)
        : value;

    end_statement();
    return make(statement);
}

ObjectEntries GeneratedFunctionParser::parse_object_literal() {
    expect_operator("{");
    ObjectEntries entries;

    while (!peek().is_operator("}")) {
        const Token& key_token = peek();
        if (key_token.kind != Token::IDENTIFIER && key_token.kind != Token::STRING && key_token.kind != Token::NUMBER) {
            throw invalid("invalid object key '" + key_token.text + "'");
        }
        std::string key = advance().text;

        if (key_token.kind == Token::IDENTIFIER && (peek().is_operator(",") || peek().is_operator("}"))) {
            // Shorthand {y}
            entries.emplace_back(key, parse_identifier(key));
        } else {
            expect_operator(":");
            entries.emplace_back(key, parse_expression());
        }

        if (!match_operator(",")) break;
    }

    expect_operator("}");
    return entries;
}

std::string GeneratedFunctionParser::parse_property_key() {
    if (match_operator(".")) {
        return expect_identifier();
    }
    expect_operator("[");
    const Token& key = peek();
    if (key.kind != Token::STRING && key.kind != Token::NUMBER) {
        throw invalid("computed property keys must be literals");
    }
    std::string text = advance().text;
    expect_operator("]");
    return text;
}

ExpressionPtr GeneratedFunctionParser::parse_expression() {
    auto guard = enter();
    ExpressionPtr condition = parse_or();
    if (match_operator("?")) {
        ExpressionPtr when_true = parse_expression();
        expect_operator(":");
        ExpressionPtr when_false = parse_expression();
        return ExpressionNode::make_conditional(condition, when_true, when_false);
    }
    return condition;
}

ExpressionPtr GeneratedFunctionParser::parse_or() {
    ExpressionPtr lhs = parse_and();
    while (match_operator("||")) {
        lhs = binary(BinaryOp::Or, lhs, parse_and());
    }
    return lhs;
}

ExpressionPtr GeneratedFunctionParser::parse_and() {
    ExpressionPtr lhs = parse_equality();
    while (match_operator("&&")) {
        lhs = binary(BinaryOp::And, lhs, parse_equality());
    }
    return lhs;
}

ExpressionPtr GeneratedFunctionParser::parse_equality() {
    ExpressionPtr lhs = parse_relational();
    while (true) {
        if (match_operator("===") || match_operator("==")) {
            lhs = binary(BinaryOp::Equal, lhs, parse_relational());
        } else if (match_operator("!==") || match_operator("!=")) {
            lhs = binary(BinaryOp::NotEqual, lhs, parse_relational());
        } else {
            return lhs;
        }
    }
}

ExpressionPtr GeneratedFunctionParser::parse_relational() {
    ExpressionPtr lhs = parse_additive();
    while (true) {
        BinaryOp op;
        if (match_operator("<")) op = BinaryOp::Less;
        else if (match_operator("<=")) op = BinaryOp::LessEqual;
        else if (match_operator(">")) op = BinaryOp::Greater;
        else if (match_operator(">=")) op = BinaryOp::GreaterEqual;
        else return lhs;
        lhs = binary(op, lhs, parse_additive());
    }
}

ExpressionPtr GeneratedFunctionParser::parse_additive() {
    ExpressionPtr lhs = parse_multiplicative();
    while (true) {
        if (match_operator("+")) {
            lhs = binary(BinaryOp::Add, lhs, parse_multiplicative());
        } else if (match_operator("-")) {
            lhs = binary(BinaryOp::Subtract, lhs, parse_multiplicative());
        } else {
            return lhs;
        }
    }
}

ExpressionPtr GeneratedFunctionParser::parse_multiplicative() {
    ExpressionPtr lhs = parse_unary();
    while (true) {
        if (match_operator("*")) {
            lhs = binary(BinaryOp::Multiply, lhs, parse_unary());
        } else if (match_operator("/")) {
            lhs = binary(BinaryOp::Divide, lhs, parse_unary());
        } else if (match_operator("%")) {
            lhs = binary(BinaryOp::Remainder, lhs, parse_unary());
        } else {
            return lhs;
        }
    }
}

ExpressionPtr GeneratedFunctionParser::parse_unary() {
    auto guard = enter();
    if (match_operator("-")) {
        return ExpressionNode::make_unary(UnaryOp::Negate, parse_unary());
    }
    if (match_operator("+")) {
        return ExpressionNode::make_unary(UnaryOp::Plus, parse_unary());
    }
    if (match_operator("!")) {
        return ExpressionNode::make_unary(UnaryOp::Not, parse_unary());
    }
    return parse_exponent();
}

ExpressionPtr GeneratedFunctionParser::parse_exponent() {
    ExpressionPtr base = parse_primary();
    if (match_operator("**")) {
        return binary(BinaryOp::Power, base, parse_unary());
    }
    return base;
}

ExpressionPtr GeneratedFunctionParser::parse_primary() {
    const Token& token = peek();

    if (token.kind == Token::NUMBER) {
        return ExpressionNode::make_number(advance().number);
    }
    if (match_operator("(")) {
        ExpressionPtr inner = parse_expression();
        expect_operator(")");
        return inner;
    }
    if (match_operator("[")) {
        return ExpressionNode::make_array(parse_arguments("]"));
    }
    if (token.kind == Token::IDENTIFIER) {
        std::string name = advance().text;
        return parse_identifier(name);
    }
    if (token.kind == Token::END) {
        throw invalid("unexpected end of input");
    }
    throw invalid("unexpected '" + token.text + "'");
}

ExpressionPtr GeneratedFunctionParser::parse_identifier(const std::string& name) {
    if (name == function_.parameter_) {
        std::string field = parse_property_key();
        function_.referenced_inputs_.insert(field);
        return ExpressionNode::make_input(field);
    }

    if (name == "Math") {
        expect_operator(".");
        std::string member = expect_identifier();
        if (const double* constant = math_constant(member)) {
            return ExpressionNode::make_number(*constant);
        }
        if (!is_math_function(member) || !is_known_function(member)) {
            throw invalid("Math." + member + " is not allowed");
        }
        expect_operator("(");
        return ExpressionNode::make_call(member, parse_arguments(")"));
    }

    if (name == "Number") {
        expect_operator(".");
        std::string member = expect_identifier();
        if (member == "EPSILON") {
            return ExpressionNode::make_number(std::numeric_limits<double>::epsilon());
        }
        if (member != "isFinite" && member != "isNaN") {
            throw invalid("Number." + member + " is not allowed");
        }
        expect_operator("(");
        return ExpressionNode::make_call(member, parse_arguments(")"));
    }

    if ((name == "isFinite" || name == "isNaN") && match_operator("(")) {
        return ExpressionNode::make_call(name, parse_arguments(")"));
    }

    if (name == "true") return ExpressionNode::make_number(1.0);
    if (name == "false") return ExpressionNode::make_number(0.0);
    if (name == "NaN") return ExpressionNode::make_number(std::numeric_limits<double>::quiet_NaN());
    if (name == "Infinity") return ExpressionNode::make_number(std::numeric_limits<double>::infinity());

    const Local* local = find_local(name);
    if (!local) {
        throw invalid("unknown identifier '" + name + "'");
    }
    if (local->opaque) {
        throw invalid("'" + name + "' cannot be read");
    }
    if (local->object) {
        if (!peek().is_operator(".") && !peek().is_operator("[")) {
            throw invalid("object '" + name + "' used as a value");
        }
        // Member reads of local objects are encoded as dotted symbol names
        return ExpressionNode::make_symbol(name + "." + parse_property_key());
    }
    return ExpressionNode::make_symbol(name);
}

std::vector<ExpressionPtr> GeneratedFunctionParser::parse_arguments(std::string_view closing) {
    std::vector<ExpressionPtr> arguments;
    while (!peek().is_operator(closing)) {
        arguments.push_back(parse_expression());
        if (!match_operator(",")) break;
    }
    expect_operator(closing);
    return arguments;
}

GeneratedFunction GeneratedFunction::parse(std::string_view source) {
    const std::size_t start = find_evaluate_function(source);
    if (start == std::string_view::npos) {
        throw GeneratedCodeInvalid("no function named evaluate");
    }

    std::string text(source);
    std::vector<Token> tokens;
    try {
        tokens = tokenize(source.substr(start));
    } catch (const ParseError& e) {
        throw GeneratedCodeInvalid(e.what());
    }

    GeneratedFunction function;
    function.source_ = text;
    GeneratedFunctionParser parser(std::move(tokens), function);
    parser.parse_program();
    return function;
}

namespace {

struct Binding {
    Value value;
    std::map<std::string, Value> members;
    bool is_object = false;
};

/**
 * Runtime state of one call: block-scoped bindings over the parameter object.
 */
class Interpreter : public SymbolScope {
public:
    explicit Interpreter(const ValueMap& inputs) : inputs_(inputs) {}

    const Value* lookup(const std::string& name) const override {
        auto dot = name.find('.');
        if (dot == std::string::npos) {
            const Binding* binding = find(name);
            return (binding && !binding->is_object) ? &binding->value : nullptr;
        }

        const Binding* binding = find(name.substr(0, dot));
        if (!binding || !binding->is_object) {
            return nullptr;
        }
        auto it = binding->members.find(name.substr(dot + 1));
        if (it == binding->members.end()) {
            throw EvaluationError("property '" + name + "' is undefined");
        }
        return &it->second;
    }

    const Value* lookup_input(const std::string& name) const override {
        auto it = inputs_.find(name);
        return (it != inputs_.end()) ? &it->second : nullptr;
    }

    std::optional<ValueMap> run_block(const std::vector<StatementPtr>& statements) {
        FrameGuard guard(frames_);
        for (const auto& statement : statements) {
            if (auto returned = execute(*statement)) {
                return returned;
            }
        }
        return std::nullopt;
    }

private:
    using Frame = std::map<std::string, Binding>;

    // Pops the block frame on every exit path, including exceptions
    struct FrameGuard {
        explicit FrameGuard(std::vector<Frame>& frames) : frames_(frames) { frames_.emplace_back(); }
        ~FrameGuard() { frames_.pop_back(); }
        FrameGuard(const FrameGuard&) = delete;
        FrameGuard& operator=(const FrameGuard&) = delete;
        std::vector<Frame>& frames_;
    };

    const ValueMap& inputs_;
    std::vector<Frame> frames_;

    const Binding* find(const std::string& name) const {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            auto found = it->find(name);
            if (found != it->end()) return &found->second;
        }
        return nullptr;
    }

    Binding* find(const std::string& name) {
        return const_cast<Binding*>(static_cast<const Interpreter*>(this)->find(name));
    }

    Binding& require(const std::string& name) {
        Binding* binding = find(name);
        if (!binding) {
            throw EvaluationError("'" + name + "' is not defined");
        }
        return *binding;
    }

    Value eval(const ExpressionPtr& expression) const {
        return formulize::evaluate(*expression, *this);
    }

    std::map<std::string, Value> build_object(const ObjectEntries& entries) const {
        std::map<std::string, Value> object;
        for (const auto& [key, expression] : entries) {
            object[key] = eval(expression);
        }
        return object;
    }

    std::optional<ValueMap> execute(const Statement& statement);
};

std::optional<ValueMap> Interpreter::execute(const Statement& statement) {
    switch (statement.kind) {
        case Statement::Kind::Declare: {
            Binding binding;
            if (statement.object) {
                binding.is_object = true;
                binding.members = build_object(*statement.object);
            } else if (statement.expression) {
                binding.value = eval(statement.expression);
            }
            frames_.back()[statement.name] = std::move(binding);
            return std::nullopt;
        }

        case Statement::Kind::Destructure: {
            for (const auto& [local, field] : statement.bindings) {
                const Value* input = lookup_input(field);
                frames_.back()[local].value = input ? *input : Value(std::numeric_limits<double>::quiet_NaN());
            }
            return std::nullopt;
        }

        case Statement::Kind::Assign: {
            Value value = eval(statement.expression);
            require(statement.name).value = std::move(value);
            return std::nullopt;
        }

        case Statement::Kind::MemberAssign: {
            Value value = eval(statement.expression);
            require(statement.name).members[statement.member] = std::move(value);
            return std::nullopt;
        }

        case Statement::Kind::If:
            if (is_truthy(eval(statement.expression))) {
                return run_block(statement.body);
            }
            if (!statement.alternate.empty()) {
                return run_block(statement.alternate);
            }
            return std::nullopt;

        case Statement::Kind::Block:
            return run_block(statement.body);

        case Statement::Kind::Try: {
            std::optional<ValueMap> returned;
            try {
                returned = run_block(statement.body);
            } catch (const EvaluationError& e) {
                if (!statement.has_catch) {
                    if (auto finally_returned = run_block(statement.finalizer)) {
                        return finally_returned;
                    }
                    throw;
                }
                FORMULIZE_LOG_DEBUG("Generated evaluate() caught: %s", e.what());
                returned = run_block(statement.alternate);
            }
            if (!statement.finalizer.empty()) {
                if (auto finally_returned = run_block(statement.finalizer)) {
                    return finally_returned;
                }
            }
            return returned;
        }

        case Statement::Kind::Return: {
            ValueMap result;
            if (statement.object) {
                for (auto& [key, value] : build_object(*statement.object)) {
                    result[key] = std::move(value);
                }
            } else {
                for (const auto& [key, value] : require(statement.name).members) {
                    result[key] = value;
                }
            }
            return result;
        }
    }
    throw EvaluationError("unsupported statement");
}

} // namespace

ValueMap GeneratedFunction::call(const ValueMap& inputs) const {
    Interpreter interpreter(inputs);
    if (auto returned = interpreter.run_block(body_)) {
        return std::move(*returned);
    }
    FORMULIZE_LOG_WARN("Generated evaluate() returned no object");
    return {};
}

ValueMap GeneratedFunctionEvaluator::evaluate(const ValueMap& values) {
    ValueMap returned;
    try {
        returned = function_.call(values);
    } catch (const EvaluationError& e) {
        FORMULIZE_LOG_ERROR("Generated evaluate() failed: %s", e.what());
        return {};
    }

    ValueMap result;
    std::vector<std::string> missing;
    for (const auto& target : targets_) {
        auto it = returned.find(target);
        if (it != returned.end()) {
            result[target] = it->second;
        } else {
            missing.push_back(target);
        }
    }

    // A head that names a target of its own never stands in for another one
    if (missing.size() == 1 && formula_head_ &&
        std::find(targets_.begin(), targets_.end(), *formula_head_) == targets_.end()) {
        auto it = returned.find(*formula_head_);
        if (it != returned.end()) {
            result[missing.front()] = it->second;
        }
    }
    return result;
}

} // namespace formulize
