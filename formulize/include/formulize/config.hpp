#ifndef FORMULIZE_CONFIG_HPP
#define FORMULIZE_CONFIG_HPP

#include <cstddef>

namespace formulize {

// Defaults applied to input variables that do not declare their own
struct InputDefaults {
    static constexpr double MIN_VALUE = -10.0;
    static constexpr double MAX_VALUE = 10.0;
    static constexpr double STEP_SIZE = 0.5;
    static constexpr double VALUE = 1.0;  // 1 rather than 0 to keep division/log well-defined
};

enum class Strategy {
    Symbolic,   // Expression resolver
    Manual,     // User functions mutating variables
    External    // Generated evaluate() function
};

const char* strategy_name(Strategy strategy);

struct ResolverOptions {
    bool linear_isolation = true;   // Solve equations linear in the target when no direct form matches
    double linear_slope_epsilon = 1e-10;
};

struct EngineConfig {
    Strategy strategy = Strategy::Symbolic;

    // Computed values are staged by an external driver instead of live recompute
    bool step_mode = false;

    ResolverOptions resolver;
};

} // namespace formulize

#endif // FORMULIZE_CONFIG_HPP
