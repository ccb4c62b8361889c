#include <formulize/manual_sandbox.hpp>
#include <formulize/log.hpp>
#include <exception>
#include <limits>

namespace formulize {

double VariableAccessor::number(const std::string& id) const {
    Value value = get(id);
    return value.is_number() ? value.number() : std::numeric_limits<double>::quiet_NaN();
}

Value RegistryAccessor::get(const std::string& id) const {
    const Variable* variable = registry_.find(id);
    return variable ? variable->value : Value();
}

bool RegistryAccessor::set(const std::string& id, const Value& value) {
    if (!registry_.contains(id)) {
        FORMULIZE_LOG_DEBUG("Manual write to unknown variable '%s' ignored", id.c_str());
        return false;
    }
    return registry_.stage_value(id, value);
}

void ManualContext::collect(const std::string& graph_id, DataPoint point) {
    result_.points[graph_id].push_back(std::move(point));
}

void ManualContext::step(const std::string& description, ValueList values) {
    step(StepView{description, std::move(values), ""});
}

void ManualContext::step(const StepView& view, const std::string& id) {
    if (!record_steps_) {
        return;
    }

    CollectedStep collected;
    collected.index = result_.steps.size();
    collected.id = id;
    collected.description = view.description;
    collected.values = view.values;
    collected.expression = view.expression;
    collected.formulas.emplace("", view);
    result_.steps.push_back(std::move(collected));
}

void ManualContext::step(const std::map<std::string, StepView>& views, const std::string& id) {
    if (!record_steps_) {
        return;
    }

    CollectedStep collected;
    collected.index = result_.steps.size();
    collected.id = id;
    if (!views.empty()) {
        const StepView& first = views.begin()->second;
        collected.description = first.description;
        collected.values = first.values;
        collected.expression = first.expression;
    }
    collected.formulas = views;
    result_.steps.push_back(std::move(collected));
}

ManualResult ManualSandbox::execute(bool record_steps) {
    ManualResult result;
    RegistryAccessor accessor(registry_);

    for (const auto& function : functions_) {
        if (!function.body) {
            FORMULIZE_LOG_WARN("Formula '%s' has no manual function", function.formula_id.c_str());
            continue;
        }

        ManualContext context(accessor, result, record_steps, function.formula_id);
        try {
            function.body(context);
        } catch (const std::exception& e) {
            FORMULIZE_LOG_ERROR("Manual function for formula '%s' failed: %s", function.formula_id.c_str(), e.what());
        }
    }

    for (const auto& id : registry_.ids_with_role(Role::Computed)) {
        const Value& value = registry_.variable(id).value;
        if (!value.is_undefined()) {
            result.values[id] = value;
        }
    }
    return result;
}

ValueMap ManualEvaluator::evaluate(const ValueMap& values) {
    (void)values;  // Functions read the registry through their accessor
    last_result_ = sandbox_.execute(false);
    return last_result_.values;
}

std::vector<CollectedStep> ManualEvaluator::record_steps() {
    last_result_ = sandbox_.execute(true);
    return last_result_.steps;
}

std::string ManualEvaluator::describe() const {
    std::string text;
    for (const auto& function : sandbox_.functions()) {
        text += function.formula_id.empty() ? std::string("(formula)") : function.formula_id;
        text += ": ";
        text += function.expression;
        text += "\n";
    }
    return text;
}

} // namespace formulize
