#include <formulize/variable_registry.hpp>
#include <formulize/errors.hpp>
#include <formulize/log.hpp>

namespace formulize {

const char* role_name(Role role) {
    switch (role) {
        case Role::Constant: return "constant";
        case Role::Input:    return "input";
        case Role::Computed: return "computed";
    }
    return "unknown";
}

bool VariableRegistry::add_variable(const std::string& id, Variable definition) {
    if (variables_.count(id) > 0) {
        return false;
    }

    auto [it, inserted] = variables_.emplace(id, std::move(definition));
    order_.push_back(id);

    // Key variable may already be registered; the dedicated pass covers forward references
    Variable& added = it->second;
    if (added.has_key() && added.set) {
        const Variable* key_variable = find(added.key);
        if (key_variable && key_variable->set && !key_variable->value.is_undefined()) {
            apply_positional_join(*key_variable, key_variable->value, added);
        }
    }

    FORMULIZE_LOG_DEBUG("Registered variable '%s' (%s)", id.c_str(), role_name(added.role));
    return inserted;
}

bool VariableRegistry::set_value(const std::string& id, double value) {
    return set_value(id, Value(value));
}

bool VariableRegistry::set_value(const std::string& id, const Value& value) {
    Variable* variable = find_mutable(id);
    if (!variable) {
        FORMULIZE_LOG_WARN("set_value: unknown variable '%s'", id.c_str());
        return false;
    }

    variable->value = value;
    if (value.is_number()) {
        update_index_based_variables(id);
    }

    if (!initializing_) {
        notify(ChangeKind::Value, id);
    }
    return true;
}

bool VariableRegistry::set_set_value(const std::string& id, const ElementList& value) {
    Variable* variable = find_mutable(id);
    if (!variable) {
        FORMULIZE_LOG_WARN("set_set_value: unknown variable '%s'", id.c_str());
        return false;
    }

    variable->value = Value(value);

    if (!initializing_) {
        notify(ChangeKind::Value, id);
    }
    return true;
}

bool VariableRegistry::set_role(const std::string& id, Role role) {
    Variable* variable = find_mutable(id);
    if (!variable) {
        FORMULIZE_LOG_WARN("set_role: unknown variable '%s'", id.c_str());
        return false;
    }

    variable->role = role;
    if (role == Role::Input && !variable->range) {
        variable->range = std::make_pair(InputDefaults::MIN_VALUE, InputDefaults::MAX_VALUE);
    }

    if (!initializing_) {
        notify(ChangeKind::Role, id);
    }
    return true;
}

bool VariableRegistry::stage_value(const std::string& id, const Value& value) {
    Variable* variable = find_mutable(id);
    if (!variable) {
        FORMULIZE_LOG_WARN("stage_value: unknown variable '%s'", id.c_str());
        return false;
    }
    variable->value = value;
    return true;
}

void VariableRegistry::set_errored(const std::string& id, bool errored) {
    if (Variable* variable = find_mutable(id)) {
        variable->errored = errored;
    }
}

void VariableRegistry::resolve_key_relationships() {
    for (const auto& id : order_) {
        Variable& variable = variables_.at(id);
        if (!variable.has_key() || !variable.set) {
            continue;
        }

        const Variable* key_variable = find(variable.key);
        if (!key_variable) {
            FORMULIZE_LOG_WARN("Variable '%s' references missing key '%s'", id.c_str(), variable.key.c_str());
            continue;
        }
        if (key_variable->set && !key_variable->value.is_undefined()) {
            apply_positional_join(*key_variable, key_variable->value, variable);
        }
    }
}

void VariableRegistry::resolve_member_of_relationships() {
    for (const auto& id : order_) {
        Variable& variable = variables_.at(id);
        if (!variable.is_member()) {
            continue;
        }

        const Variable* parent = find(variable.member_of);
        if (!parent || !parent->set) {
            FORMULIZE_LOG_WARN("Variable '%s' is a member of '%s' which has no set",
                               id.c_str(), variable.member_of.c_str());
            continue;
        }

        variable.set = *parent->set;
        const ElementList& members = *variable.set;

        // Follow the parent while its value is one of the members
        if (parent->value.is_number() && index_of(members, parent->value)) {
            variable.value = parent->value;
            continue;
        }

        if (variable.index) {
            if (*variable.index < members.size()) {
                variable.value = element_to_number(members[*variable.index]);
            }
            continue;
        }

        // Step-mode values are staged externally, no default
        if (variable.value.is_undefined() && !members.empty() && !step_mode_) {
            variable.value = element_to_number(members.front());
        }
    }
}

const Variable& VariableRegistry::variable(const std::string& id) const {
    auto it = variables_.find(id);
    if (it == variables_.end()) {
        throw UnknownVariableError(id);
    }
    return it->second;
}

const Variable* VariableRegistry::find(const std::string& id) const {
    auto it = variables_.find(id);
    return (it != variables_.end()) ? &it->second : nullptr;
}

Variable* VariableRegistry::find_mutable(const std::string& id) {
    auto it = variables_.find(id);
    return (it != variables_.end()) ? &it->second : nullptr;
}

std::vector<std::string> VariableRegistry::ids_with_role(Role role) const {
    std::vector<std::string> out;
    for (const auto& id : order_) {
        if (variables_.at(id).role == role) {
            out.push_back(id);
        }
    }
    return out;
}

bool VariableRegistry::has_role(Role role) const {
    for (const auto& [id, variable] : variables_) {
        if (variable.role == role) return true;
    }
    return false;
}

std::unordered_map<std::string, Variable> VariableRegistry::get_variables() const {
    return variables_;
}

ValueMap VariableRegistry::values_snapshot() const {
    ValueMap snapshot;
    for (const auto& id : order_) {
        const Variable& variable = variables_.at(id);
        if (!variable.value.is_undefined()) {
            snapshot.emplace(id, variable.value);
        }
    }
    return snapshot;
}

void VariableRegistry::reset() {
    variables_.clear();
    order_.clear();
}

bool VariableRegistry::apply_positional_join(const Variable& source, const Value& source_value, Variable& target) {
    if (!source.set || !target.set) {
        return false;
    }

    auto index = index_of(*source.set, source_value);
    if (!index || *index >= target.set->size()) {
        return false;  // Value not in the source set, nothing to propagate
    }

    target.value = element_to_number((*target.set)[*index]);
    return true;
}

void VariableRegistry::update_index_based_variables(const std::string& changed_id) {
    Variable* changed = find_mutable(changed_id);
    if (!changed || !changed->set) {
        return;
    }

    // The changed variable selects its key's value
    if (changed->has_key()) {
        if (Variable* key_variable = find_mutable(changed->key)) {
            apply_positional_join(*changed, changed->value, *key_variable);
        }
    }

    // Variables keyed on the changed variable follow it
    for (const auto& id : order_) {
        if (id == changed_id) continue;
        Variable& dependent = variables_.at(id);
        if (dependent.key == changed_id) {
            apply_positional_join(*changed, changed->value, dependent);
        }
    }
}

void VariableRegistry::notify(ChangeKind kind, const std::string& id) {
    if (change_handler_) {
        change_handler_(kind, id);
    }
}

} // namespace formulize
