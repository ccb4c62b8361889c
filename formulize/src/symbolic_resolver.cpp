#include <formulize/symbolic_resolver.hpp>
#include <formulize/expression_parser.hpp>
#include <formulize/errors.hpp>
#include <formulize/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace formulize {

namespace {

std::string trim_copy(std::string_view text) {
    std::size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return "";
    }
    std::size_t end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

} // namespace

struct SymbolicResolver::PassState {
    ValueMap scope;                       // Safe names; unresolved targets are present but undefined
    std::vector<std::string> unresolved;  // Original ids in target order
    ValueMap results;                     // Original ids

    bool is_unresolved(const std::string& id) const {
        return std::find(unresolved.begin(), unresolved.end(), id) != unresolved.end();
    }

    void resolve(const std::string& id, const std::string& safe, const Value& value) {
        scope[safe] = value;
        results[id] = value;
        unresolved.erase(std::find(unresolved.begin(), unresolved.end(), id));
    }
};

SymbolicResolver::SymbolicResolver(const std::vector<std::string>& expressions,
                                   const std::vector<std::string>& variable_names,
                                   const std::vector<std::string>& targets,
                                   std::map<std::string, MappingFunction> mappings,
                                   ResolverOptions options)
    : translator_(variable_names),
      targets_(targets),
      mappings_(std::move(mappings)),
      options_(options) {

    for (const auto& [id, mapping] : mappings_) {
        if (std::find(targets_.begin(), targets_.end(), id) == targets_.end()) {
            FORMULIZE_LOG_WARN("Mapping for '%s' ignored: variable is not computed", id.c_str());
        }
    }

    equations_.reserve(expressions.size());
    for (const auto& text : expressions) {
        add_equation(text);
    }
}

void SymbolicResolver::add_equation(const std::string& text) {
    std::string processed = translator_.preprocess(text);

    // Locate the single top-level '='; comparison operators are separate tokens
    std::optional<std::size_t> split;
    try {
        int depth = 0;
        for (const auto& token : tokenize(processed)) {
            if (token.is_operator("(") || token.is_operator("[")) {
                ++depth;
            } else if (token.is_operator(")") || token.is_operator("]")) {
                --depth;
            } else if (token.is_operator("=") && depth == 0) {
                if (split) {
                    FORMULIZE_LOG_WARN("Expression '%s' has more than one '=', ignored", text.c_str());
                    return;
                }
                split = token.position;
            }
        }
    } catch (const ParseError& e) {
        FORMULIZE_LOG_WARN("Expression '%s' ignored: %s", text.c_str(), e.what());
        return;
    }

    if (!split) {
        FORMULIZE_LOG_WARN("Expression '%s' is not an equation, ignored", text.c_str());
        return;
    }

    Equation equation;
    equation.source = processed;
    equation.lhs_source = trim_copy(std::string_view(processed).substr(0, *split));
    equation.rhs_source = trim_copy(std::string_view(processed).substr(*split + 1));
    try {
        equation.lhs = ExpressionParser::parse(std::string_view(processed).substr(0, *split));
        equation.rhs = ExpressionParser::parse(std::string_view(processed).substr(*split + 1));
    } catch (const ParseError& e) {
        FORMULIZE_LOG_WARN("Expression '%s' ignored: %s", text.c_str(), e.what());
        return;
    }

    if (equation.lhs->type == NodeType::Array) {
        bool all_symbols = !equation.lhs->children.empty();
        for (const auto& child : equation.lhs->children) {
            if (child->type != NodeType::Symbol) {
                all_symbols = false;
                break;
            }
        }
        if (all_symbols) {
            for (const auto& child : equation.lhs->children) {
                equation.vector_targets.push_back(child->name);
            }
        }
    }

    collect_symbols(*equation.lhs, equation.symbols);
    collect_symbols(*equation.rhs, equation.symbols);
    equations_.push_back(std::move(equation));
}

std::vector<std::string> SymbolicResolver::equation_sources() const {
    std::vector<std::string> sources;
    sources.reserve(equations_.size());
    for (const auto& equation : equations_) {
        sources.push_back(equation.source);
    }
    return sources;
}

std::string SymbolicResolver::describe() const {
    std::string text;
    for (const auto& id : targets_) {
        const std::string safe = translator_.to_safe(id);
        std::string line = id + " = NaN  (no defining equation)";

        if (mappings_.count(id) > 0) {
            line = id + " = mapping(" + id + ")";
        } else {
            for (const auto& equation : equations_) {
                if (equation.lhs->type == NodeType::Symbol && equation.lhs->name == safe) {
                    line = id + " = " + equation.rhs_source;
                    break;
                }
                if (equation.rhs->type == NodeType::Symbol && equation.rhs->name == safe) {
                    line = id + " = " + equation.lhs_source;
                    break;
                }
                if (std::find(equation.vector_targets.begin(), equation.vector_targets.end(), safe) != equation.vector_targets.end()) {
                    line = id + " from " + equation.source;
                    break;
                }
                if (options_.linear_isolation && equation.symbols.count(safe) > 0) {
                    line = id + " solved from " + equation.source;
                    break;
                }
            }
        }
        text += line;
        text += "\n";
    }
    return text;
}

ResolutionResult SymbolicResolver::resolve(const ValueMap& snapshot) const {
    PassState state;

    // Every registered name shadows the constants, even without a value
    for (const auto& [id, safe] : translator_.mapping()) {
        state.scope.emplace(safe, Value());
    }

    // Stale computed values are never read
    for (const auto& [id, value] : snapshot) {
        if (std::find(targets_.begin(), targets_.end(), id) == targets_.end()) {
            state.scope[translator_.to_safe(id)] = value;
        }
    }
    for (const auto& id : targets_) {
        state.scope[translator_.to_safe(id)] = Value();
        state.unresolved.push_back(id);
    }

    ResolutionResult result;
    ResolutionReport& report = result.report;

    while (!state.unresolved.empty()) {
        ++report.passes;
        const std::size_t before = state.unresolved.size();

        try_mappings(state);

        for (const auto& equation : equations_) {
            if (state.unresolved.empty()) {
                break;
            }
            if (try_vector_form(equation, state)) {
                continue;
            }
            if (try_scalar_forms(equation, state)) {
                continue;
            }
            if (options_.linear_isolation) {
                try_linear_isolation(equation, state);
            }
        }

        if (state.unresolved.size() == before) {
            break;
        }
    }

    for (const auto& id : state.unresolved) {
        state.results[id] = Value(std::numeric_limits<double>::quiet_NaN());
        report.unresolved.push_back(id);
    }
    if (!report.unresolved.empty()) {
        FORMULIZE_LOG_INFO("Resolution stopped after %zu passes with %zu unresolved variables",
                           report.passes, report.unresolved.size());
    }

    result.values = std::move(state.results);
    return result;
}

bool SymbolicResolver::try_mappings(PassState& state) const {
    bool progress = false;
    for (const auto& [id, mapping] : mappings_) {
        if (!state.is_unresolved(id)) {
            continue;
        }

        ValueMap view;
        for (const auto& [safe, value] : state.scope) {
            if (!value.is_undefined()) {
                view.emplace(translator_.to_original(safe).value_or(safe), value);
            }
        }

        try {
            Value value = mapping(view);
            if (value.is_undefined()) {
                continue;
            }
            state.resolve(id, translator_.to_safe(id), value);
            progress = true;
        } catch (const std::exception& e) {
            FORMULIZE_LOG_DEBUG("Mapping for '%s' failed, retrying next pass: %s", id.c_str(), e.what());
        }
    }
    return progress;
}

bool SymbolicResolver::try_vector_form(const Equation& equation, PassState& state) const {
    if (equation.vector_targets.empty()) {
        return false;
    }

    std::optional<std::vector<double>> numbers;
    try {
        numbers = evaluate(*equation.rhs, MapScope(state.scope)).numbers();
    } catch (const EvaluationError& e) {
        FORMULIZE_LOG_DEBUG("Could not evaluate '%s': %s", equation.source.c_str(), e.what());
        return false;
    }

    if (!numbers || numbers->size() != equation.vector_targets.size()) {
        return false;
    }

    bool assigned = false;
    for (std::size_t i = 0; i < numbers->size(); ++i) {
        const std::string& safe = equation.vector_targets[i];
        auto id = translator_.to_original(safe);
        if (!id || !state.is_unresolved(*id) || mappings_.count(*id) > 0) {
            continue;
        }
        state.resolve(*id, safe, Value((*numbers)[i]));
        assigned = true;
    }
    return assigned;
}

bool SymbolicResolver::try_scalar_forms(const Equation& equation, PassState& state) const {
    // Copy: resolving shrinks the list
    const std::vector<std::string> candidates = state.unresolved;

    for (const auto& id : candidates) {
        if (mappings_.count(id) > 0) {
            continue;
        }

        const std::string safe = translator_.to_safe(id);
        const ExpressionNode* defining = nullptr;
        if (equation.lhs->type == NodeType::Symbol && equation.lhs->name == safe) {
            defining = equation.rhs.get();
        } else if (equation.rhs->type == NodeType::Symbol && equation.rhs->name == safe) {
            defining = equation.lhs.get();
        } else {
            continue;
        }

        try {
            Value value = evaluate(*defining, MapScope(state.scope));
            if (value.is_undefined()) {
                continue;
            }
            state.resolve(id, safe, value);
            return true;
        } catch (const EvaluationError& e) {
            FORMULIZE_LOG_DEBUG("Could not evaluate %s from '%s': %s", id.c_str(), equation.source.c_str(), e.what());
        }
    }
    return false;
}

bool SymbolicResolver::try_linear_isolation(const Equation& equation, PassState& state) const {
    const std::vector<std::string> candidates = state.unresolved;

    for (const auto& id : candidates) {
        if (mappings_.count(id) > 0) {
            continue;
        }

        const std::string safe = translator_.to_safe(id);
        if (equation.symbols.count(safe) == 0) {
            continue;
        }
        // Textual forms are handled by try_scalar_forms
        if ((equation.lhs->type == NodeType::Symbol && equation.lhs->name == safe) ||
            (equation.rhs->type == NodeType::Symbol && equation.rhs->name == safe)) {
            continue;
        }

        ValueMap probe_scope = state.scope;
        auto residual = [&](double t) -> std::optional<double> {
            probe_scope[safe] = Value(t);
            MapScope scope(probe_scope);
            Value lhs = evaluate(*equation.lhs, scope);
            Value rhs = evaluate(*equation.rhs, scope);
            if (!lhs.is_number() || !rhs.is_number()) {
                return std::nullopt;
            }
            double difference = lhs.number() - rhs.number();
            if (!std::isfinite(difference)) {
                return std::nullopt;
            }
            return difference;
        };

        try {
            auto f0 = residual(0.0);
            auto f1 = residual(1.0);
            auto f2 = residual(2.0);
            if (!f0 || !f1 || !f2) {
                continue;
            }

            double slope = *f1 - *f0;
            double curvature = (*f2 - *f1) - slope;
            double scale = std::max({1.0, std::fabs(*f0), std::fabs(*f1), std::fabs(*f2)});
            if (std::fabs(slope) <= options_.linear_slope_epsilon || std::fabs(curvature) > 1e-9 * scale) {
                continue;
            }

            double solution = -*f0 / slope;
            if (!std::isfinite(solution)) {
                continue;
            }
            state.resolve(id, safe, Value(solution));
            return true;
        } catch (const EvaluationError& e) {
            FORMULIZE_LOG_DEBUG("Could not isolate %s in '%s': %s", id.c_str(), equation.source.c_str(), e.what());
        }
    }
    return false;
}

ValueMap SymbolicEvaluator::evaluate(const ValueMap& values) {
    ResolutionResult result = resolver_.resolve(values);
    last_report_ = std::move(result.report);
    return std::move(result.values);
}

std::string SymbolicEvaluator::describe() const {
    return resolver_.describe();
}

} // namespace formulize
