#ifndef FORMULIZE_VARIABLE_REGISTRY_HPP
#define FORMULIZE_VARIABLE_REGISTRY_HPP

#include <formulize/variable.hpp>
#include <formulize/value.hpp>
#include <unordered_map>
#include <vector>
#include <string>
#include <functional>

namespace formulize {

/**
 * Canonical store of variable definitions and values.
 * Preserves insertion order so every consumer iterates deterministically.
 */
class VariableRegistry {
public:
    enum class ChangeKind {
        Value,  // A value was set through the public mutation API
        Role    // A role changed, the evaluator must be re-derived
    };

    using ChangeHandler = std::function<void(ChangeKind kind, const std::string& id)>;

    VariableRegistry() = default;

    /**
     * Insert a variable if absent; a second add for the same id is a no-op.
     * Applies the key join immediately when the key variable already exists.
     * Returns true if the variable was inserted.
     */
    bool add_variable(const std::string& id, Variable definition);

    /**
     * Set a scalar value. Propagates the positional join in both directions
     * and notifies the change handler unless initializing.
     * Returns false (and logs) for an unknown id.
     */
    bool set_value(const std::string& id, double value);
    bool set_value(const std::string& id, const Value& value);

    // Replace the value of a set-valued variable
    bool set_set_value(const std::string& id, const ElementList& value);

    bool set_role(const std::string& id, Role role);

    /**
     * Write without triggering recompute or positional propagation.
     * Used by step-mode drivers and the manual sandbox.
     */
    bool stage_value(const std::string& id, const Value& value);

    // Dispatcher-side bookkeeping for the last pass
    void set_errored(const std::string& id, bool errored);

    void resolve_key_relationships();
    /**
     * Copy each parent's set into its members. A member takes the parent's
     * value when that value is in the set, else the element at its index,
     * else the first element (never in step mode).
     */
    void resolve_member_of_relationships();

    // Checked accessor, throws UnknownVariableError
    const Variable& variable(const std::string& id) const;

    const Variable* find(const std::string& id) const;
    bool contains(const std::string& id) const { return variables_.count(id) > 0; }

    const std::vector<std::string>& ids() const { return order_; }
    std::vector<std::string> ids_with_role(Role role) const;
    bool has_role(Role role) const;

    // Copy of every variable definition keyed by id
    std::unordered_map<std::string, Variable> get_variables() const;

    // Every variable that currently holds a value
    ValueMap values_snapshot() const;

    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    void reset();

    void set_initializing(bool initializing) { initializing_ = initializing; }
    bool is_initializing() const { return initializing_; }

    void set_step_mode(bool step_mode) { step_mode_ = step_mode; }
    bool is_step_mode() const { return step_mode_; }

    void set_change_handler(ChangeHandler handler) { change_handler_ = std::move(handler); }

private:
    std::unordered_map<std::string, Variable> variables_;
    std::vector<std::string> order_;

    ChangeHandler change_handler_;
    bool initializing_ = false;
    bool step_mode_ = false;

    Variable* find_mutable(const std::string& id);

    // Value of `target` taken positionally from `source`'s current index
    static bool apply_positional_join(const Variable& source, const Value& source_value, Variable& target);

    void update_index_based_variables(const std::string& changed_id);

    void notify(ChangeKind kind, const std::string& id);
};

/**
 * RAII scope that suppresses recompute while a batch of variables is registered.
 */
class BulkInitialization {
public:
    explicit BulkInitialization(VariableRegistry& registry)
        : registry_(registry), previous_(registry.is_initializing()) {
        registry_.set_initializing(true);
    }

    ~BulkInitialization() {
        registry_.set_initializing(previous_);
    }

    BulkInitialization(const BulkInitialization&) = delete;
    BulkInitialization& operator=(const BulkInitialization&) = delete;

private:
    VariableRegistry& registry_;
    bool previous_;
};

} // namespace formulize

#endif // FORMULIZE_VARIABLE_REGISTRY_HPP
