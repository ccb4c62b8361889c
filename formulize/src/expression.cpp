#include <formulize/expression.hpp>
#include <formulize/errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <functional>
#include <unordered_map>

namespace formulize {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::shared_ptr<ExpressionNode> make_node(NodeType type) {
    auto node = std::make_shared<ExpressionNode>();
    node->type = type;
    return node;
}

ExpressionPtr finish(std::shared_ptr<ExpressionNode> node) {
    for (const auto& child : node->children) {
        node->depth = std::max(node->depth, child->depth + 1);
    }
    return node;
}

std::vector<double> require_numbers(const Value& value, const char* context) {
    if (value.is_number()) {
        return {value.number()};
    }
    auto numbers = value.numbers();
    if (!numbers) {
        throw EvaluationError(std::string(context) + " requires numeric operands");
    }
    return *numbers;
}

double require_scalar(const Value& value, const char* context) {
    if (!value.is_number()) {
        throw EvaluationError(std::string(context) + " requires a scalar operand, got " + value.to_string());
    }
    return value.number();
}

double floored_mod(double x, double y) {
    if (y == 0.0) return x;
    return x - y * std::floor(x / y);
}

double sign_of(double x) {
    if (std::isnan(x)) return x;
    return (x > 0.0) ? 1.0 : (x < 0.0 ? -1.0 : 0.0);
}

// Apply a scalar function to a scalar or element-wise to a numeric list
Value map_unary(const Value& value, const std::function<double(double)>& fn, const char* name) {
    if (value.is_number()) {
        return Value(fn(value.number()));
    }
    auto numbers = value.numbers();
    if (!numbers) {
        throw EvaluationError(std::string(name) + " requires numeric arguments");
    }
    for (double& n : *numbers) {
        n = fn(n);
    }
    return Value::from_numbers(*numbers);
}

// Flatten arguments (scalars and numeric lists) for aggregate functions
std::vector<double> flatten(const std::vector<Value>& args, const char* name) {
    std::vector<double> out;
    for (const auto& arg : args) {
        auto numbers = require_numbers(arg, name);
        out.insert(out.end(), numbers.begin(), numbers.end());
    }
    return out;
}

struct FunctionSpec {
    std::size_t min_args;
    std::size_t max_args;
    std::function<Value(const std::vector<Value>&)> impl;
};

constexpr std::size_t VARIADIC = std::numeric_limits<std::size_t>::max();

FunctionSpec unary_spec(double (*fn)(double), const char* name) {
    return {1, 1, [fn, name](const std::vector<Value>& args) {
        return map_unary(args[0], fn, name);
    }};
}

const std::unordered_map<std::string, FunctionSpec>& function_table() {
    static const std::unordered_map<std::string, FunctionSpec> table = [] {
        std::unordered_map<std::string, FunctionSpec> t;

        t["sqrt"] = unary_spec([](double x) { return std::sqrt(x); }, "sqrt");
        t["cbrt"] = unary_spec([](double x) { return std::cbrt(x); }, "cbrt");
        t["abs"] = unary_spec([](double x) { return std::fabs(x); }, "abs");
        t["sign"] = unary_spec(sign_of, "sign");
        t["exp"] = unary_spec([](double x) { return std::exp(x); }, "exp");
        t["log2"] = unary_spec([](double x) { return std::log2(x); }, "log2");
        t["log10"] = unary_spec([](double x) { return std::log10(x); }, "log10");
        t["sin"] = unary_spec([](double x) { return std::sin(x); }, "sin");
        t["cos"] = unary_spec([](double x) { return std::cos(x); }, "cos");
        t["tan"] = unary_spec([](double x) { return std::tan(x); }, "tan");
        t["asin"] = unary_spec([](double x) { return std::asin(x); }, "asin");
        t["acos"] = unary_spec([](double x) { return std::acos(x); }, "acos");
        t["atan"] = unary_spec([](double x) { return std::atan(x); }, "atan");
        t["sinh"] = unary_spec([](double x) { return std::sinh(x); }, "sinh");
        t["cosh"] = unary_spec([](double x) { return std::cosh(x); }, "cosh");
        t["tanh"] = unary_spec([](double x) { return std::tanh(x); }, "tanh");
        t["floor"] = unary_spec([](double x) { return std::floor(x); }, "floor");
        t["ceil"] = unary_spec([](double x) { return std::ceil(x); }, "ceil");
        t["round"] = unary_spec([](double x) { return std::round(x); }, "round");
        t["trunc"] = unary_spec([](double x) { return std::trunc(x); }, "trunc");

        // log(x) is natural, log(x, base) changes base
        t["log"] = {1, 2, [](const std::vector<Value>& args) {
            if (args.size() == 2) {
                double base = require_scalar(args[1], "log");
                return map_unary(args[0], [base](double x) { return std::log(x) / std::log(base); }, "log");
            }
            return map_unary(args[0], [](double x) { return std::log(x); }, "log");
        }};

        t["atan2"] = {2, 2, [](const std::vector<Value>& args) {
            return Value(std::atan2(require_scalar(args[0], "atan2"), require_scalar(args[1], "atan2")));
        }};
        t["pow"] = {2, 2, [](const std::vector<Value>& args) {
            double exponent = require_scalar(args[1], "pow");
            return map_unary(args[0], [exponent](double x) { return std::pow(x, exponent); }, "pow");
        }};
        t["mod"] = {2, 2, [](const std::vector<Value>& args) {
            return Value(floored_mod(require_scalar(args[0], "mod"), require_scalar(args[1], "mod")));
        }};
        t["hypot"] = {1, VARIADIC, [](const std::vector<Value>& args) {
            double acc = 0.0;
            for (double n : flatten(args, "hypot")) acc += n * n;
            return Value(std::sqrt(acc));
        }};
        t["min"] = {1, VARIADIC, [](const std::vector<Value>& args) {
            auto numbers = flatten(args, "min");
            if (numbers.empty()) throw EvaluationError("min of empty list");
            double best = numbers[0];
            for (double n : numbers) {
                if (std::isnan(n)) return Value(NaN);
                best = std::min(best, n);
            }
            return Value(best);
        }};
        t["max"] = {1, VARIADIC, [](const std::vector<Value>& args) {
            auto numbers = flatten(args, "max");
            if (numbers.empty()) throw EvaluationError("max of empty list");
            double best = numbers[0];
            for (double n : numbers) {
                if (std::isnan(n)) return Value(NaN);
                best = std::max(best, n);
            }
            return Value(best);
        }};
        t["sum"] = {1, VARIADIC, [](const std::vector<Value>& args) {
            double acc = 0.0;
            for (double n : flatten(args, "sum")) acc += n;
            return Value(acc);
        }};
        t["mean"] = {1, VARIADIC, [](const std::vector<Value>& args) {
            auto numbers = flatten(args, "mean");
            if (numbers.empty()) throw EvaluationError("mean of empty list");
            double acc = 0.0;
            for (double n : numbers) acc += n;
            return Value(acc / static_cast<double>(numbers.size()));
        }};
        t["norm"] = {1, 1, [](const std::vector<Value>& args) {
            double acc = 0.0;
            for (double n : require_numbers(args[0], "norm")) acc += n * n;
            return Value(std::sqrt(acc));
        }};
        t["dot"] = {2, 2, [](const std::vector<Value>& args) {
            auto a = require_numbers(args[0], "dot");
            auto b = require_numbers(args[1], "dot");
            if (a.size() != b.size()) throw EvaluationError("dot requires vectors of equal length");
            double acc = 0.0;
            for (std::size_t i = 0; i < a.size(); ++i) acc += a[i] * b[i];
            return Value(acc);
        }};
        t["isFinite"] = {1, 1, [](const std::vector<Value>& args) {
            return Value(args[0].is_number() && std::isfinite(args[0].number()) ? 1.0 : 0.0);
        }};
        t["isNaN"] = {1, 1, [](const std::vector<Value>& args) {
            return Value(args[0].is_number() && std::isnan(args[0].number()) ? 1.0 : 0.0);
        }};

        return t;
    }();
    return table;
}

Value elementwise(const Value& lhs, const Value& rhs, double (*op)(double, double), const char* name) {
    if (lhs.is_number() && rhs.is_number()) {
        return Value(op(lhs.number(), rhs.number()));
    }

    auto a = require_numbers(lhs, name);
    auto b = require_numbers(rhs, name);

    // Scalar broadcast
    if (lhs.is_number()) {
        for (double& n : b) n = op(lhs.number(), n);
        return Value::from_numbers(b);
    }
    if (rhs.is_number()) {
        for (double& n : a) n = op(n, rhs.number());
        return Value::from_numbers(a);
    }

    if (a.size() != b.size()) {
        throw EvaluationError(std::string(name) + " requires vectors of equal length");
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        a[i] = op(a[i], b[i]);
    }
    return Value::from_numbers(a);
}

Value multiply(const Value& lhs, const Value& rhs) {
    if (lhs.is_list() && rhs.is_list()) {
        auto a = require_numbers(lhs, "multiplication");
        auto b = require_numbers(rhs, "multiplication");
        if (a.size() != b.size()) {
            throw EvaluationError("vector product requires equal lengths");
        }
        double acc = 0.0;
        for (std::size_t i = 0; i < a.size(); ++i) acc += a[i] * b[i];
        return Value(acc);
    }
    return elementwise(lhs, rhs, [](double x, double y) { return x * y; }, "multiplication");
}

Value evaluate_binary(const ExpressionNode& node, const SymbolScope& scope) {
    const BinaryOp op = node.binary_op;

    // Short-circuit operators return the deciding operand
    if (op == BinaryOp::And || op == BinaryOp::Or) {
        Value lhs = evaluate(*node.children[0], scope);
        bool lhs_true = is_truthy(lhs);
        if (op == BinaryOp::And && !lhs_true) return lhs;
        if (op == BinaryOp::Or && lhs_true) return lhs;
        return evaluate(*node.children[1], scope);
    }

    Value lhs = evaluate(*node.children[0], scope);
    Value rhs = evaluate(*node.children[1], scope);

    switch (op) {
        case BinaryOp::Add:
            return elementwise(lhs, rhs, [](double x, double y) { return x + y; }, "addition");
        case BinaryOp::Subtract:
            return elementwise(lhs, rhs, [](double x, double y) { return x - y; }, "subtraction");
        case BinaryOp::Multiply:
            return multiply(lhs, rhs);
        case BinaryOp::Divide:
            if (rhs.is_list()) {
                throw EvaluationError("division by a vector");
            }
            return elementwise(lhs, rhs, [](double x, double y) { return x / y; }, "division");
        case BinaryOp::Mod:
            return Value(floored_mod(require_scalar(lhs, "mod"), require_scalar(rhs, "mod")));
        case BinaryOp::Remainder:
            return Value(std::fmod(require_scalar(lhs, "%"), require_scalar(rhs, "%")));
        case BinaryOp::Power:
            return Value(std::pow(require_scalar(lhs, "power"), require_scalar(rhs, "power")));
        case BinaryOp::Less:
            return Value(require_scalar(lhs, "<") < require_scalar(rhs, "<") ? 1.0 : 0.0);
        case BinaryOp::LessEqual:
            return Value(require_scalar(lhs, "<=") <= require_scalar(rhs, "<=") ? 1.0 : 0.0);
        case BinaryOp::Greater:
            return Value(require_scalar(lhs, ">") > require_scalar(rhs, ">") ? 1.0 : 0.0);
        case BinaryOp::GreaterEqual:
            return Value(require_scalar(lhs, ">=") >= require_scalar(rhs, ">=") ? 1.0 : 0.0);
        case BinaryOp::Equal:
            return Value(require_scalar(lhs, "==") == require_scalar(rhs, "==") ? 1.0 : 0.0);
        case BinaryOp::NotEqual:
            return Value(require_scalar(lhs, "!=") != require_scalar(rhs, "!=") ? 1.0 : 0.0);
        case BinaryOp::Xor:
            return Value(is_truthy(lhs) != is_truthy(rhs) ? 1.0 : 0.0);
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    throw EvaluationError("unsupported binary operator");
}

Value evaluate_call(const ExpressionNode& node, const SymbolScope& scope) {
    const auto& table = function_table();
    auto it = table.find(node.name);
    if (it == table.end()) {
        throw EvaluationError("unknown function '" + node.name + "'");
    }

    const FunctionSpec& spec = it->second;
    if (node.children.size() < spec.min_args || node.children.size() > spec.max_args) {
        throw EvaluationError("wrong number of arguments for '" + node.name + "'");
    }

    std::vector<Value> args;
    args.reserve(node.children.size());
    for (const auto& child : node.children) {
        args.push_back(evaluate(*child, scope));
    }
    return spec.impl(args);
}

} // namespace

ExpressionPtr ExpressionNode::make_number(double value) {
    auto node = make_node(NodeType::Number);
    node->number = value;
    return node;
}

ExpressionPtr ExpressionNode::make_symbol(std::string name) {
    auto node = make_node(NodeType::Symbol);
    node->name = std::move(name);
    return node;
}

ExpressionPtr ExpressionNode::make_input(std::string name) {
    auto node = make_node(NodeType::Input);
    node->name = std::move(name);
    return node;
}

ExpressionPtr ExpressionNode::make_unary(UnaryOp op, ExpressionPtr operand) {
    auto node = make_node(NodeType::Unary);
    node->unary_op = op;
    node->children.push_back(std::move(operand));
    return finish(std::move(node));
}

ExpressionPtr ExpressionNode::make_binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs) {
    auto node = make_node(NodeType::Binary);
    node->binary_op = op;
    node->children.push_back(std::move(lhs));
    node->children.push_back(std::move(rhs));
    return finish(std::move(node));
}

ExpressionPtr ExpressionNode::make_call(std::string name, std::vector<ExpressionPtr> args) {
    auto node = make_node(NodeType::Call);
    node->name = std::move(name);
    node->children = std::move(args);
    return finish(std::move(node));
}

ExpressionPtr ExpressionNode::make_array(std::vector<ExpressionPtr> elements) {
    auto node = make_node(NodeType::Array);
    node->children = std::move(elements);
    return finish(std::move(node));
}

ExpressionPtr ExpressionNode::make_conditional(ExpressionPtr condition, ExpressionPtr when_true, ExpressionPtr when_false) {
    auto node = make_node(NodeType::Conditional);
    node->children.push_back(std::move(condition));
    node->children.push_back(std::move(when_true));
    node->children.push_back(std::move(when_false));
    return finish(std::move(node));
}

const Value* MapScope::lookup(const std::string& name) const {
    auto it = locals_.find(name);
    return (it != locals_.end()) ? &it->second : nullptr;
}

const Value* MapScope::lookup_input(const std::string& name) const {
    if (!inputs_) return nullptr;
    auto it = inputs_->find(name);
    return (it != inputs_->end()) ? &it->second : nullptr;
}

bool is_truthy(const Value& value) {
    if (value.is_number()) {
        double n = value.number();
        return n != 0.0 && !std::isnan(n);
    }
    if (value.is_list()) {
        return true;
    }
    return false;
}

bool is_known_function(const std::string& name) {
    return function_table().count(name) > 0;
}

const double* find_constant(const std::string& name) {
    static const std::unordered_map<std::string, double> constants = {
        {"pi", std::numbers::pi},
        {"PI", std::numbers::pi},
        {"e", std::numbers::e},
        {"E", std::numbers::e},
        {"tau", 2.0 * std::numbers::pi},
        {"phi", std::numbers::phi},
        {"Infinity", std::numeric_limits<double>::infinity()},
        {"NaN", NaN},
    };
    auto it = constants.find(name);
    return (it != constants.end()) ? &it->second : nullptr;
}

Value evaluate(const ExpressionNode& node, const SymbolScope& scope) {
    switch (node.type) {
        case NodeType::Number:
            return Value(node.number);

        case NodeType::Symbol: {
            if (const Value* value = scope.lookup(node.name)) {
                if (value->is_undefined()) {
                    throw EvaluationError("symbol '" + node.name + "' is undefined");
                }
                return *value;
            }
            if (const double* constant = find_constant(node.name)) {
                return Value(*constant);
            }
            throw EvaluationError("undefined symbol '" + node.name + "'");
        }

        case NodeType::Input: {
            if (const Value* value = scope.lookup_input(node.name)) {
                return *value;
            }
            // Reading a missing field behaves like undefined arithmetic
            return Value(NaN);
        }

        case NodeType::Unary: {
            Value operand = evaluate(*node.children[0], scope);
            switch (node.unary_op) {
                case UnaryOp::Negate:
                    return map_unary(operand, [](double x) { return -x; }, "negation");
                case UnaryOp::Plus:
                    return map_unary(operand, [](double x) { return x; }, "unary plus");
                case UnaryOp::Not:
                    return Value(is_truthy(operand) ? 0.0 : 1.0);
            }
            throw EvaluationError("unsupported unary operator");
        }

        case NodeType::Binary:
            return evaluate_binary(node, scope);

        case NodeType::Call:
            return evaluate_call(node, scope);

        case NodeType::Array: {
            ElementList elements;
            elements.reserve(node.children.size());
            for (const auto& child : node.children) {
                Value element = evaluate(*child, scope);
                if (!element.is_number()) {
                    throw EvaluationError("array elements must be scalars");
                }
                elements.emplace_back(element.number());
            }
            return Value(std::move(elements));
        }

        case NodeType::Conditional: {
            Value condition = evaluate(*node.children[0], scope);
            return is_truthy(condition)
                ? evaluate(*node.children[1], scope)
                : evaluate(*node.children[2], scope);
        }
    }
    throw EvaluationError("unsupported expression node");
}

void collect_symbols(const ExpressionNode& node, std::set<std::string>& out) {
    if (node.type == NodeType::Symbol) {
        out.insert(node.name);
    }
    for (const auto& child : node.children) {
        collect_symbols(*child, out);
    }
}

} // namespace formulize
