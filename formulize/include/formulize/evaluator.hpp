#ifndef FORMULIZE_EVALUATOR_HPP
#define FORMULIZE_EVALUATOR_HPP

#include <formulize/value.hpp>
#include <formulize/config.hpp>
#include <string>

namespace formulize {

/**
 * The active computation: maps a snapshot of variable values (keyed by id)
 * to values for the computed variables. Exactly one strategy provides the
 * evaluator at a time; the dispatcher swaps it as a whole.
 */
class Evaluator {
public:
    virtual ~Evaluator() = default;

    /**
     * Compute values for the target variables.
     * Targets missing from the result contributed nothing this pass.
     */
    virtual ValueMap evaluate(const ValueMap& values) = 0;

    virtual Strategy strategy() const = 0;

    // Human-readable rendition of what the evaluator computes
    virtual std::string describe() const = 0;
};

} // namespace formulize

#endif // FORMULIZE_EVALUATOR_HPP
