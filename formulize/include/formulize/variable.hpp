#ifndef FORMULIZE_VARIABLE_HPP
#define FORMULIZE_VARIABLE_HPP

#include <formulize/value.hpp>
#include <formulize/config.hpp>
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace formulize {

/**
 * Write ownership of a variable.
 * - Constant: fixed, never recomputed.
 * - Input: set by the user/UI.
 * - Computed: written only by the active strategy during a recompute pass
 *   (or staged by a step-mode driver).
 */
enum class Role {
    Constant,
    Input,
    Computed
};

const char* role_name(Role role);

struct Variable {
    Role role = Role::Constant;
    Value value;

    std::string name;
    std::string description;
    std::string units;

    std::optional<int> precision;
    std::optional<std::pair<double, double>> range;   // Meaningful only for inputs
    std::optional<double> step;

    std::vector<std::string> options;
    std::optional<ElementList> set;                   // Permissible discrete values

    std::string key;        // Id whose index within its own set selects this variable's value
    std::string member_of;  // Parent whose set this variable inherits
    std::optional<std::size_t> index;

    // Set by the dispatcher when the last pass produced no valid value
    bool errored = false;

    bool has_key() const { return !key.empty(); }
    bool is_member() const { return !member_of.empty(); }

    static Variable constant(double value) {
        Variable v;
        v.role = Role::Constant;
        v.value = value;
        return v;
    }

    static Variable input(double value = InputDefaults::VALUE,
                          std::pair<double, double> range = {InputDefaults::MIN_VALUE, InputDefaults::MAX_VALUE}) {
        Variable v;
        v.role = Role::Input;
        v.value = value;
        v.range = range;
        v.step = InputDefaults::STEP_SIZE;
        return v;
    }

    static Variable computed() {
        Variable v;
        v.role = Role::Computed;
        return v;
    }

    static Variable with_set(Role role, ElementList members, Value initial = Value()) {
        Variable v;
        v.role = role;
        v.set = std::move(members);
        v.value = std::move(initial);
        return v;
    }
};

} // namespace formulize

#endif // FORMULIZE_VARIABLE_HPP
