#ifndef FORMULIZE_GENERATED_FUNCTION_HPP
#define FORMULIZE_GENERATED_FUNCTION_HPP

#include <formulize/evaluator.hpp>
#include <formulize/value.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace formulize {

// Offset of the first "function evaluate" in `text`, npos when absent
std::size_t find_evaluate_function(std::string_view text);

/**
 * An externally generated `function evaluate(p) { ... }` parsed into a
 * restricted AST and interpreted. Nothing in the text is executed as host code.
 *
 * Accepted statements:
 *   const|let|var name = expr | {key: expr, ...}   (several declarators allowed)
 *   const {a, b: alias} = p
 *   name = expr, name += expr (also -=, *=, /=)
 *   obj.key = expr, obj["key"] = expr
 *   if (expr) stmt [else stmt]
 *   { ... }
 *   try { ... } catch [(e)] { ... } [finally { ... }]
 *   return {key: expr, ...} | return obj
 *
 * Expressions: numbers, arithmetic including `**`, comparisons (`===`,
 * `!==`, `==`, `!=`, `<`, ...), `&& || !`, ternaries, array literals,
 * `p.name` / `p["name"]`, `Math.<fn>(...)` over the allowed function set,
 * `Math.PI`, `Math.E`, `isFinite`, `isNaN`, `Number.isFinite`, `Number.isNaN`.
 *
 * Anything else raises GeneratedCodeInvalid at parse time, as does code
 * nested deeper than MAX_EXPRESSION_DEPTH.
 */
class GeneratedFunction {
public:
    // Parse from the first "function evaluate"; throws GeneratedCodeInvalid
    static GeneratedFunction parse(std::string_view source);

    /**
     * Run the function with `inputs` as its parameter object.
     * Returns the returned object, or an empty map when no return is reached.
     * Throws EvaluationError for failures outside a try block.
     */
    ValueMap call(const ValueMap& inputs) const;

    const std::string& source() const { return source_; }
    const std::string& parameter() const { return parameter_; }

    // Parameter fields read anywhere in the body
    const std::set<std::string>& referenced_inputs() const { return referenced_inputs_; }

    struct Statement;
    using StatementPtr = std::shared_ptr<const Statement>;

private:
    std::string source_;
    std::string parameter_;
    std::vector<StatementPtr> body_;
    std::set<std::string> referenced_inputs_;

    friend class GeneratedFunctionParser;
};

/**
 * Evaluator for the external strategy.
 * `formula_head` is the single-letter left side of the source formula; when
 * it is not itself a target, a result under that key stands in for the one
 * target the function did not return by name.
 */
class GeneratedFunctionEvaluator : public Evaluator {
public:
    GeneratedFunctionEvaluator(GeneratedFunction function,
                               std::vector<std::string> targets,
                               std::optional<std::string> formula_head = std::nullopt)
        : function_(std::move(function)), targets_(std::move(targets)), formula_head_(std::move(formula_head)) {}

    ValueMap evaluate(const ValueMap& values) override;
    Strategy strategy() const override { return Strategy::External; }
    std::string describe() const override { return function_.source(); }

    const GeneratedFunction& function() const { return function_; }

private:
    GeneratedFunction function_;
    std::vector<std::string> targets_;
    std::optional<std::string> formula_head_;
};

} // namespace formulize

#endif // FORMULIZE_GENERATED_FUNCTION_HPP
