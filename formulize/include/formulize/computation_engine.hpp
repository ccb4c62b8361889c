#ifndef FORMULIZE_COMPUTATION_ENGINE_HPP
#define FORMULIZE_COMPUTATION_ENGINE_HPP

#include <formulize/config.hpp>
#include <formulize/evaluator.hpp>
#include <formulize/external_function_adapter.hpp>
#include <formulize/generated_function.hpp>
#include <formulize/manual_sandbox.hpp>
#include <formulize/symbolic_resolver.hpp>
#include <formulize/variable_registry.hpp>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace formulize {

// A generation request in flight; the response is installed with install_generated()
struct PendingGeneration {
    GenerationRequest request;
    std::future<GenerationResponse> response;
};

/**
 * Strategy dispatcher and reactive controller.
 *
 * Owns the variable registry and the single active evaluator. Any value
 * set or role change reported by the registry triggers a recompute; a
 * recompute that is already running is never re-entered, so writes made
 * by a strategy during its own pass do not cascade.
 *
 * Results are written back only for computed variables and only when
 * valid (finite number or array). Anything else leaves the previous value
 * in place and marks the variable errored.
 *
 * A role change made during a pass is applied right after it: the
 * evaluator is re-derived and one more pass runs.
 *
 * Not thread-safe: every call except the background half of
 * request_generation() must come from one thread.
 */
class ComputationEngine {
public:
    using ChangeCallback = std::function<void(const std::vector<std::string>& changed_ids)>;
    using SubscriptionId = std::size_t;

    explicit ComputationEngine(EngineConfig config = {});

    ComputationEngine(const ComputationEngine&) = delete;
    ComputationEngine& operator=(const ComputationEngine&) = delete;

    VariableRegistry& registry() { return registry_; }
    const VariableRegistry& registry() const { return registry_; }

    const EngineConfig& config() const { return config_; }

    /**
     * Select the active strategy. Once a computation is set, the evaluator
     * is re-derived and a recompute runs.
     */
    void set_strategy(Strategy strategy);
    Strategy strategy() const { return config_.strategy; }

    /**
     * Record the expression and manual-function set, build the evaluator
     * for the active strategy and run one pass (skipped in step mode).
     * Throws ConfigurationError, leaving the previous computation in place,
     * when there are no computed variables or the strategy lacks its input.
     */
    void set_computation(std::vector<std::string> expressions,
                         std::vector<ManualFunction> manual_functions = {});

    // Direct computation of one variable, preferred over its equations
    void set_mapping(const std::string& id, MappingFunction mapping);
    void clear_mapping(const std::string& id);

    void recompute();
    bool is_recomputing() const { return recomputing_; }
    bool has_evaluator() const { return evaluator_ != nullptr; }

    // Change notification after each recompute pass
    SubscriptionId subscribe(ChangeCallback callback);
    bool unsubscribe(SubscriptionId id);

    // === Step mode ===

    void set_step_mode(bool step_mode);
    bool is_step_mode() const { return config_.step_mode; }

    // Write a value without recomputing
    bool stage_value(const std::string& id, const Value& value);

    /**
     * Run the manual functions once with step recording and return the
     * steps. Variable values are restored afterwards.
     * Throws ConfigurationError unless the manual strategy is active.
     */
    std::vector<CollectedStep> record_steps();

    // Stage the values of a recorded step
    void apply_step(const CollectedStep& step);

    // === External generation ===

    // Request for the current formula; throws ConfigurationError without one
    GenerationRequest generation_request() const;

    /**
     * Start a generation on a background thread. The current evaluator stays
     * live until install_generated() is called with the response.
     */
    PendingGeneration request_generation(std::shared_ptr<GenerationClient> client) const;

    /**
     * Validate a response and make it the external evaluator.
     * Throws GeneratedCodeInvalid and keeps the previous evaluator on failure.
     * Responses are not deduplicated: the last installed one wins.
     */
    void install_generated(const GenerationRequest& request, const GenerationResponse& response);

    // Synchronous request + install
    void generate_external(GenerationClient& client);

    // === Introspection ===

    // Human-readable rendition of the active evaluator, empty without one
    std::string last_generated_code() const;

    const ManualResult& last_manual_result() const;

    // Report of the last symbolic pass, null for other strategies
    const ResolutionReport* last_resolution_report() const;

    const std::vector<std::string>& expressions() const { return expressions_; }

private:
    EngineConfig config_;
    VariableRegistry registry_;

    std::vector<std::string> expressions_;
    std::vector<ManualFunction> manual_functions_;
    std::map<std::string, MappingFunction> mappings_;
    std::optional<GeneratedFunction> generated_;
    bool configured_ = false;

    std::unique_ptr<Evaluator> evaluator_;
    bool recomputing_ = false;
    bool pending_refresh_ = false;  // Role changed during a pass

    std::map<SubscriptionId, ChangeCallback> subscribers_;
    SubscriptionId next_subscription_ = 1;

    ManualResult empty_manual_result_;

    void on_registry_change(VariableRegistry::ChangeKind kind, const std::string& id);

    void check_configuration(Strategy strategy,
                             const std::vector<std::string>& expressions,
                             const std::vector<ManualFunction>& manual_functions) const;

    std::unique_ptr<Evaluator> build_evaluator();

    // Re-derive after a strategy or role change; clears instead of throwing
    void refresh_evaluator();

    // Re-derive and recompute for a role change seen mid-pass
    void apply_pending_refresh();

    void notify(const std::vector<std::string>& changed_ids);
};

} // namespace formulize

#endif // FORMULIZE_COMPUTATION_ENGINE_HPP
