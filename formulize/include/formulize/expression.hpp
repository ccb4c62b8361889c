#ifndef FORMULIZE_EXPRESSION_HPP
#define FORMULIZE_EXPRESSION_HPP

#include <formulize/value.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <set>

namespace formulize {

enum class NodeType {
    Number,
    Symbol,       // Name looked up in the local scope
    Input,        // Field of the evaluate() parameter object
    Unary,
    Binary,
    Call,
    Array,
    Conditional
};

enum class UnaryOp {
    Negate,
    Plus,
    Not
};

enum class BinaryOp {
    Add,
    Subtract,
    Multiply,
    Divide,
    Mod,          // Floored modulo
    Remainder,    // Truncated remainder
    Power,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual,
    And,
    Or,
    Xor
};

// Deepest AST either parser accepts; evaluation recurses once per level
constexpr std::size_t MAX_EXPRESSION_DEPTH = 256;

struct ExpressionNode;
using ExpressionPtr = std::shared_ptr<const ExpressionNode>;

/**
 * Node of the restricted expression AST shared by the math-syntax parser
 * and the generated-function interpreter.
 */
struct ExpressionNode {
    NodeType type = NodeType::Number;
    double number = 0.0;
    std::string name;           // Symbol, Input or Call name
    UnaryOp unary_op = UnaryOp::Plus;
    BinaryOp binary_op = BinaryOp::Add;
    std::vector<ExpressionPtr> children;
    std::size_t depth = 1;      // Levels in this subtree, leaves are 1

    static ExpressionPtr make_number(double value);
    static ExpressionPtr make_symbol(std::string name);
    static ExpressionPtr make_input(std::string name);
    static ExpressionPtr make_unary(UnaryOp op, ExpressionPtr operand);
    static ExpressionPtr make_binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs);
    static ExpressionPtr make_call(std::string name, std::vector<ExpressionPtr> args);
    static ExpressionPtr make_array(std::vector<ExpressionPtr> elements);
    static ExpressionPtr make_conditional(ExpressionPtr condition, ExpressionPtr when_true, ExpressionPtr when_false);
};

/**
 * Symbol source for evaluation.
 */
class SymbolScope {
public:
    virtual ~SymbolScope() = default;

    virtual const Value* lookup(const std::string& name) const = 0;

    virtual const Value* lookup_input(const std::string& name) const {
        (void)name;
        return nullptr;
    }
};

// Scope over value maps; `inputs` backs Input nodes when present
class MapScope : public SymbolScope {
public:
    explicit MapScope(const ValueMap& locals, const ValueMap* inputs = nullptr)
        : locals_(locals), inputs_(inputs) {}

    const Value* lookup(const std::string& name) const override;
    const Value* lookup_input(const std::string& name) const override;

private:
    const ValueMap& locals_;
    const ValueMap* inputs_;
};

/**
 * Evaluate an AST against a scope.
 * Throws EvaluationError for undefined symbols, unknown functions and
 * operand type mismatches.
 */
Value evaluate(const ExpressionNode& node, const SymbolScope& scope);

bool is_truthy(const Value& value);

// True when `name` is in the fixed set of callable functions
bool is_known_function(const std::string& name);

// Named constant (pi, e, ...) used when a symbol is not in scope
const double* find_constant(const std::string& name);

// Symbol names referenced anywhere in the tree
void collect_symbols(const ExpressionNode& node, std::set<std::string>& out);

} // namespace formulize

#endif // FORMULIZE_EXPRESSION_HPP
