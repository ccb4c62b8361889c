#include <formulize/computation_engine.hpp>
#include <formulize/errors.hpp>
#include <formulize/log.hpp>
#include <utility>

namespace formulize {

const char* strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::Symbolic: return "symbolic";
        case Strategy::Manual:   return "manual";
        case Strategy::External: return "external";
    }
    return "unknown";
}

namespace {

// Holds the re-entrancy flag for the duration of a pass
class RecomputeGuard {
public:
    explicit RecomputeGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~RecomputeGuard() { flag_ = false; }

    RecomputeGuard(const RecomputeGuard&) = delete;
    RecomputeGuard& operator=(const RecomputeGuard&) = delete;

private:
    bool& flag_;
};

} // namespace

ComputationEngine::ComputationEngine(EngineConfig config)
    : config_(config) {
    registry_.set_step_mode(config_.step_mode);
    registry_.set_change_handler([this](VariableRegistry::ChangeKind kind, const std::string& id) {
        on_registry_change(kind, id);
    });
}

void ComputationEngine::set_strategy(Strategy strategy) {
    if (config_.strategy == strategy) {
        return;
    }
    FORMULIZE_LOG_DEBUG("Switching strategy %s -> %s", strategy_name(config_.strategy), strategy_name(strategy));
    config_.strategy = strategy;

    if (configured_) {
        refresh_evaluator();
        recompute();
    }
}

void ComputationEngine::set_computation(std::vector<std::string> expressions,
                                        std::vector<ManualFunction> manual_functions) {
    check_configuration(config_.strategy, expressions, manual_functions);

    expressions_ = std::move(expressions);
    manual_functions_ = std::move(manual_functions);
    configured_ = true;
    evaluator_ = build_evaluator();

    // Step mode: values are staged by an external driver
    if (config_.step_mode) {
        FORMULIZE_LOG_DEBUG("Step mode, skipping initial pass");
        return;
    }
    recompute();
}

void ComputationEngine::set_mapping(const std::string& id, MappingFunction mapping) {
    mappings_[id] = std::move(mapping);
    if (configured_ && config_.strategy == Strategy::Symbolic) {
        refresh_evaluator();
        recompute();
    }
}

void ComputationEngine::clear_mapping(const std::string& id) {
    if (mappings_.erase(id) > 0 && configured_ && config_.strategy == Strategy::Symbolic) {
        refresh_evaluator();
        recompute();
    }
}

void ComputationEngine::recompute() {
    if (recomputing_) {
        FORMULIZE_LOG_DEBUG("Recompute already in progress, skipped");
        return;
    }
    if (!evaluator_) {
        return;
    }

    std::vector<std::string> changed;
    {
        RecomputeGuard guard(recomputing_);

        const ValueMap snapshot = registry_.values_snapshot();
        const std::vector<std::string> targets = registry_.ids_with_role(Role::Computed);

        ValueMap results;
        try {
            results = evaluator_->evaluate(snapshot);
        } catch (const Error& e) {
            FORMULIZE_LOG_ERROR("%s evaluation failed: %s", strategy_name(evaluator_->strategy()), e.what());
        }

        for (const auto& id : targets) {
            auto previous_it = snapshot.find(id);
            const Value previous = (previous_it != snapshot.end()) ? previous_it->second : Value();

            auto result = results.find(id);
            if (result != results.end() && result->second.is_valid_result()) {
                registry_.set_errored(id, false);
                if (result->second != previous) {
                    registry_.set_value(id, result->second);
                    changed.push_back(id);
                } else {
                    registry_.stage_value(id, result->second);
                }
            } else {
                // Undo anything a strategy wrote directly during the pass
                registry_.stage_value(id, previous);
                registry_.set_errored(id, true);
                FORMULIZE_LOG_DEBUG("No valid value for '%s' this pass", id.c_str());
            }
        }
    }

    if (!changed.empty()) {
        notify(changed);
    }
    apply_pending_refresh();
}

ComputationEngine::SubscriptionId ComputationEngine::subscribe(ChangeCallback callback) {
    SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

bool ComputationEngine::unsubscribe(SubscriptionId id) {
    return subscribers_.erase(id) > 0;
}

void ComputationEngine::set_step_mode(bool step_mode) {
    config_.step_mode = step_mode;
    registry_.set_step_mode(step_mode);
}

bool ComputationEngine::stage_value(const std::string& id, const Value& value) {
    return registry_.stage_value(id, value);
}

std::vector<CollectedStep> ComputationEngine::record_steps() {
    auto* manual = dynamic_cast<ManualEvaluator*>(evaluator_.get());
    if (!manual) {
        throw ConfigurationError("step recording requires the manual strategy");
    }

    std::vector<CollectedStep> steps;
    {
        RecomputeGuard guard(recomputing_);

        std::vector<std::pair<std::string, Value>> saved;
        saved.reserve(registry_.size());
        for (const auto& id : registry_.ids()) {
            saved.emplace_back(id, registry_.variable(id).value);
        }

        steps = manual->record_steps();

        for (const auto& [id, value] : saved) {
            registry_.stage_value(id, value);
        }
    }
    apply_pending_refresh();
    return steps;
}

void ComputationEngine::apply_step(const CollectedStep& step) {
    std::vector<std::string> changed;
    for (const auto& [id, value] : step.values) {
        if (registry_.stage_value(id, value)) {
            changed.push_back(id);
        }
    }
    if (!changed.empty()) {
        notify(changed);
    }
}

GenerationRequest ComputationEngine::generation_request() const {
    if (expressions_.empty()) {
        throw ConfigurationError("no formula to generate a function from");
    }

    std::vector<std::string> inputs;
    for (const auto& id : registry_.ids()) {
        if (registry_.variable(id).role != Role::Computed) {
            inputs.push_back(id);
        }
    }
    return build_generation_request(expressions_.front(), inputs, registry_.ids_with_role(Role::Computed));
}

PendingGeneration ComputationEngine::request_generation(std::shared_ptr<GenerationClient> client) const {
    if (!client) {
        throw ConfigurationError("no generation client");
    }

    PendingGeneration pending;
    pending.request = generation_request();
    pending.response = std::async(std::launch::async, [client, request = pending.request]() {
        return client->generate(request);
    });
    return pending;
}

void ComputationEngine::install_generated(const GenerationRequest& request, const GenerationResponse& response) {
    // Validation throws before any state changes
    GeneratedFunction function = validate_generated(request, response);

    if (generated_) {
        FORMULIZE_LOG_INFO("Replacing previously installed generated function");
    }
    generated_ = std::move(function);

    if (configured_ && config_.strategy == Strategy::External) {
        refresh_evaluator();
        recompute();
    }
}

void ComputationEngine::generate_external(GenerationClient& client) {
    GenerationRequest request = generation_request();
    GenerationResponse response = client.generate(request);
    install_generated(request, response);
}

std::string ComputationEngine::last_generated_code() const {
    return evaluator_ ? evaluator_->describe() : std::string();
}

const ManualResult& ComputationEngine::last_manual_result() const {
    if (auto* manual = dynamic_cast<const ManualEvaluator*>(evaluator_.get())) {
        return manual->last_result();
    }
    return empty_manual_result_;
}

const ResolutionReport* ComputationEngine::last_resolution_report() const {
    if (auto* symbolic = dynamic_cast<const SymbolicEvaluator*>(evaluator_.get())) {
        return &symbolic->last_report();
    }
    return nullptr;
}

void ComputationEngine::on_registry_change(VariableRegistry::ChangeKind kind, const std::string& id) {
    if (kind == VariableRegistry::ChangeKind::Role) {
        FORMULIZE_LOG_DEBUG("Role of '%s' changed, re-deriving evaluator", id.c_str());
        if (recomputing_) {
            // The evaluator is in use; re-derive once the pass is over
            pending_refresh_ = true;
            return;
        }
        refresh_evaluator();
    }
    recompute();
}

void ComputationEngine::check_configuration(Strategy strategy,
                                            const std::vector<std::string>& expressions,
                                            const std::vector<ManualFunction>& manual_functions) const {
    if (!registry_.has_role(Role::Computed)) {
        throw ConfigurationError("no computed variables");
    }

    switch (strategy) {
        case Strategy::Symbolic:
            if (expressions.empty()) {
                throw ConfigurationError("symbolic strategy requires expressions");
            }
            break;
        case Strategy::Manual:
            if (manual_functions.empty()) {
                throw ConfigurationError("manual strategy requires manual functions");
            }
            break;
        case Strategy::External:
            if (expressions.empty()) {
                throw ConfigurationError("external strategy requires a formula");
            }
            break;
    }
}

std::unique_ptr<Evaluator> ComputationEngine::build_evaluator() {
    const std::vector<std::string> targets = registry_.ids_with_role(Role::Computed);

    switch (config_.strategy) {
        case Strategy::Symbolic:
            return std::make_unique<SymbolicEvaluator>(
                SymbolicResolver(expressions_, registry_.ids(), targets, mappings_, config_.resolver));

        case Strategy::Manual:
            return std::make_unique<ManualEvaluator>(ManualSandbox(registry_, manual_functions_));

        case Strategy::External:
            if (!generated_) {
                FORMULIZE_LOG_INFO("External strategy selected, no generated function installed yet");
                return nullptr;
            }
            return std::make_unique<GeneratedFunctionEvaluator>(
                *generated_, targets, expressions_.empty() ? std::nullopt : formula_head(expressions_.front()));
    }
    return nullptr;
}

void ComputationEngine::refresh_evaluator() {
    if (!configured_) {
        return;
    }

    if (!registry_.has_role(Role::Computed)) {
        FORMULIZE_LOG_INFO("No computed variables, evaluator cleared");
        evaluator_.reset();
        return;
    }

    try {
        check_configuration(config_.strategy, expressions_, manual_functions_);
        evaluator_ = build_evaluator();
    } catch (const ConfigurationError& e) {
        FORMULIZE_LOG_WARN("%s, evaluator cleared", e.what());
        evaluator_.reset();
    }
}

void ComputationEngine::apply_pending_refresh() {
    if (!pending_refresh_) {
        return;
    }
    pending_refresh_ = false;
    refresh_evaluator();
    recompute();
}

void ComputationEngine::notify(const std::vector<std::string>& changed_ids) {
    // Copy so callbacks may unsubscribe
    auto subscribers = subscribers_;
    for (const auto& [id, callback] : subscribers) {
        if (callback) {
            callback(changed_ids);
        }
    }
}

} // namespace formulize
