#ifndef FORMULIZE_SYMBOLIC_RESOLVER_HPP
#define FORMULIZE_SYMBOLIC_RESOLVER_HPP

#include <formulize/config.hpp>
#include <formulize/evaluator.hpp>
#include <formulize/expression.hpp>
#include <formulize/name_translation.hpp>
#include <formulize/value.hpp>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace formulize {

// Direct computation for one variable; receives the current scope under original ids
using MappingFunction = std::function<Value(const ValueMap& scope)>;

struct ResolutionReport {
    std::size_t passes = 0;
    std::vector<std::string> unresolved;  // Residue ids, reported as NaN

    bool complete() const { return unresolved.empty(); }
};

struct ResolutionResult {
    ValueMap values;  // Keyed by original id
    ResolutionReport report;
};

/**
 * Fixed-point solver over a system of equations.
 *
 * Each equation is one of
 *   VAR = EXPR
 *   EXPR = VAR
 *   [VAR, VAR, ...] = EXPR
 * with variable references written as {id}. Every pass walks the equations
 * in order and resolves targets whose defining side can be evaluated in the
 * current scope; resolved values join the scope for later equations. Passes
 * repeat until every target is resolved or a pass makes no progress, at
 * which point the residue is reported as NaN.
 *
 * When two equations define the same target, the first one that evaluates
 * in expression order wins.
 */
class SymbolicResolver {
public:
    /**
     * @param expressions Equations in source order
     * @param variable_names Every registry id, used to build the name map
     * @param targets Computed variable ids, in registry order
     * @param mappings Direct computations that take precedence over equations
     */
    SymbolicResolver(const std::vector<std::string>& expressions,
                     const std::vector<std::string>& variable_names,
                     const std::vector<std::string>& targets,
                     std::map<std::string, MappingFunction> mappings = {},
                     ResolverOptions options = {});

    ResolutionResult resolve(const ValueMap& snapshot) const;

    const NameTranslator& translator() const { return translator_; }
    const std::vector<std::string>& targets() const { return targets_; }

    // Number of equations that parsed into a usable form
    std::size_t equation_count() const { return equations_.size(); }

    // Preprocessed source text of every usable equation
    std::vector<std::string> equation_sources() const;

    // One line per target naming how it is computed
    std::string describe() const;

private:
    struct Equation {
        std::string source;
        std::string lhs_source;
        std::string rhs_source;
        ExpressionPtr lhs;
        ExpressionPtr rhs;
        std::vector<std::string> vector_targets;  // Safe names of a [a, b] = ... left side
        std::set<std::string> symbols;
    };

    struct PassState;

    NameTranslator translator_;
    std::vector<std::string> targets_;
    std::map<std::string, MappingFunction> mappings_;
    ResolverOptions options_;
    std::vector<Equation> equations_;

    void add_equation(const std::string& text);

    bool try_mappings(PassState& state) const;
    bool try_vector_form(const Equation& equation, PassState& state) const;
    bool try_scalar_forms(const Equation& equation, PassState& state) const;
    bool try_linear_isolation(const Equation& equation, PassState& state) const;
};

/**
 * Evaluator for the symbolic strategy. Keeps the report of the last pass.
 */
class SymbolicEvaluator : public Evaluator {
public:
    explicit SymbolicEvaluator(SymbolicResolver resolver)
        : resolver_(std::move(resolver)) {}

    ValueMap evaluate(const ValueMap& values) override;
    Strategy strategy() const override { return Strategy::Symbolic; }
    std::string describe() const override;

    const ResolutionReport& last_report() const { return last_report_; }
    const SymbolicResolver& resolver() const { return resolver_; }

private:
    SymbolicResolver resolver_;
    ResolutionReport last_report_;
};

} // namespace formulize

#endif // FORMULIZE_SYMBOLIC_RESOLVER_HPP
