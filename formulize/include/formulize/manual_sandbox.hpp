#ifndef FORMULIZE_MANUAL_SANDBOX_HPP
#define FORMULIZE_MANUAL_SANDBOX_HPP

#include <formulize/evaluator.hpp>
#include <formulize/value.hpp>
#include <formulize/variable_registry.hpp>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace formulize {

/**
 * Read/write view of variables by id handed to manual functions.
 * Reading an unknown id yields an undefined value; writing an unknown id is a no-op.
 */
class VariableAccessor {
public:
    virtual ~VariableAccessor() = default;

    virtual Value get(const std::string& id) const = 0;

    // Returns false (no-op) for an unknown id
    virtual bool set(const std::string& id, const Value& value) = 0;

    virtual bool has(const std::string& id) const = 0;
    virtual std::vector<std::string> names() const = 0;

    // Scalar view of get(); NaN when the value is not a number
    double number(const std::string& id) const;

    bool set(const std::string& id, double value) { return set(id, Value(value)); }
};

// Accessor writing straight into the registry without triggering recompute
class RegistryAccessor : public VariableAccessor {
public:
    explicit RegistryAccessor(VariableRegistry& registry) : registry_(registry) {}

    Value get(const std::string& id) const override;
    bool set(const std::string& id, const Value& value) override;
    bool has(const std::string& id) const override { return registry_.contains(id); }
    std::vector<std::string> names() const override { return registry_.ids(); }

    using VariableAccessor::set;

private:
    VariableRegistry& registry_;
};

// Named coordinates of a single plotted point, e.g. {x: 1, y: 2}
using DataPoint = std::map<std::string, double>;

using ValueList = std::vector<std::pair<std::string, Value>>;

// One view of a step, optionally scoped to an expression of a formula
struct StepView {
    std::string description;
    ValueList values;
    std::string expression;
};

/**
 * Checkpoint recorded by step() during a manual execution.
 * `formulas` maps formula ids to their view; the empty id applies to all formulas.
 */
struct CollectedStep {
    std::size_t index = 0;
    std::string id;
    std::string description;
    ValueList values;
    std::string expression;
    std::map<std::string, StepView> formulas;
};

struct ManualResult {
    ValueMap values;                                    // Computed variables after the call
    std::map<std::string, std::vector<DataPoint>> points;   // Graph id -> points in collection order
    std::vector<CollectedStep> steps;
};

/**
 * Side channels available to a manual function during one call.
 */
class ManualContext {
public:
    ManualContext(VariableAccessor& vars, ManualResult& result, bool record_steps, std::string formula_id)
        : vars_(vars), result_(result), record_steps_(record_steps), formula_id_(std::move(formula_id)) {}

    VariableAccessor& vars() { return vars_; }
    const VariableAccessor& vars() const { return vars_; }

    // Append a point to the ordered list of `graph_id`
    void collect(const std::string& graph_id, DataPoint point);

    /**
     * Record a step. No-op unless step recording was requested for this call.
     * The single-view forms apply to all formulas.
     */
    void step(const std::string& description, ValueList values = {});
    void step(const StepView& view, const std::string& id = "");
    void step(const std::map<std::string, StepView>& views, const std::string& id = "");

    bool recording_steps() const { return record_steps_; }
    const std::string& formula_id() const { return formula_id_; }

private:
    VariableAccessor& vars_;
    ManualResult& result_;
    bool record_steps_;
    std::string formula_id_;
};

struct ManualFunction {
    std::string formula_id;
    std::string expression;   // Display text of the formula the function implements
    std::function<void(ManualContext&)> body;
};

/**
 * Runs manual functions against the registry. Every function runs exactly
 * once per execution, in registration order; a function that throws is
 * logged and the others still run. Results are read back from every
 * computed variable afterwards.
 */
class ManualSandbox {
public:
    ManualSandbox(VariableRegistry& registry, std::vector<ManualFunction> functions)
        : registry_(registry), functions_(std::move(functions)) {}

    ManualResult execute(bool record_steps = false);

    const std::vector<ManualFunction>& functions() const { return functions_; }

private:
    VariableRegistry& registry_;
    std::vector<ManualFunction> functions_;
};

class ManualEvaluator : public Evaluator {
public:
    explicit ManualEvaluator(ManualSandbox sandbox) : sandbox_(std::move(sandbox)) {}

    ValueMap evaluate(const ValueMap& values) override;
    Strategy strategy() const override { return Strategy::Manual; }
    std::string describe() const override;

    // Run once with step recording and return the collected steps
    std::vector<CollectedStep> record_steps();

    const ManualResult& last_result() const { return last_result_; }

private:
    ManualSandbox sandbox_;
    ManualResult last_result_;
};

} // namespace formulize

#endif // FORMULIZE_MANUAL_SANDBOX_HPP
