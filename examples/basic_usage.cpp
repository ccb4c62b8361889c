/**
 * Basic Computation Engine Example
 *
 * Demonstrates the three computation strategies:
 * - Symbolic equations resolved against the variable registry
 * - Manual functions writing computed variables directly
 * - A generated evaluate() function installed from a canned response
 */

#include <formulize/computation_engine.hpp>
#include <formulize/errors.hpp>
#include <formulize/log.hpp>
#include <iostream>

using namespace formulize;

namespace {

// Stands in for a remote code-generation service
class CannedGenerationClient : public GenerationClient {
public:
    GenerationResponse generate(const GenerationRequest& request) override {
        std::cout << "  Prompt sent for: " << request.formula_text << "\n";
        return GenerationResponse{
            "```javascript\n"
            "function evaluate(variables) {\n"
            "  try {\n"
            "    const K = 0.5 * variables.m * variables.v ** 2;\n"
            "    const p = variables.m * variables.v;\n"
            "    return { K: K, p: p };\n"
            "  } catch (error) {\n"
            "    return { K: NaN, p: NaN };\n"
            "  }\n"
            "}\n"
            "```"};
    }
};

void print_computed(const ComputationEngine& engine) {
    for (const auto& id : engine.registry().ids_with_role(Role::Computed)) {
        const Variable& variable = engine.registry().variable(id);
        std::cout << "  " << id << " = " << variable.value.to_string()
                  << (variable.errored ? "  (errored)" : "") << "\n";
    }
}

} // namespace

int main() {
    std::cout << "=== Basic Computation Engine Example ===\n\n";

    log::set_min_level(log::Level::Info);

    ComputationEngine engine;
    {
        BulkInitialization batch(engine.registry());
        engine.registry().add_variable("m", Variable::input(2.0));
        engine.registry().add_variable("v", Variable::input(3.0));
        engine.registry().add_variable("K", Variable::computed());
        engine.registry().add_variable("p", Variable::computed());
    }

    engine.subscribe([](const std::vector<std::string>& changed) {
        std::cout << "  [changed:";
        for (const auto& id : changed) std::cout << " " << id;
        std::cout << "]\n";
    });

    // Symbolic strategy
    std::cout << "Symbolic strategy:\n";
    try {
        engine.set_computation({"{K} = 1/2 {m} {v}^2", "{p} = {m} * {v}"});
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    print_computed(engine);
    std::cout << engine.last_generated_code();

    std::cout << "\nSetting v = 4:\n";
    engine.registry().set_value("v", 4.0);
    print_computed(engine);

    // Manual strategy
    std::cout << "\nManual strategy:\n";
    engine.set_computation({"{K} = 1/2 {m} {v}^2", "{p} = {m} * {v}"}, {
        {"kinetic", "K = 1/2 m v^2", [](ManualContext& ctx) {
            double m = ctx.vars().number("m");
            double v = ctx.vars().number("v");
            ctx.vars().set("K", 0.5 * m * v * v);
            ctx.vars().set("p", m * v);
            for (double t = 0.0; t <= v; t += 1.0) {
                ctx.collect("energy", {{"v", t}, {"K", 0.5 * m * t * t}});
            }
        }},
    });
    engine.set_strategy(Strategy::Manual);
    print_computed(engine);
    std::cout << "  Collected " << engine.last_manual_result().points.at("energy").size()
              << " points for graph 'energy'\n";

    // External strategy
    std::cout << "\nExternal strategy:\n";
    engine.set_strategy(Strategy::External);
    CannedGenerationClient client;
    try {
        engine.generate_external(client);
    } catch (const Error& e) {
        std::cerr << "  Generation failed: " << e.what() << "\n";
        return 1;
    }
    print_computed(engine);

    std::cout << "\nSetting m = 1:\n";
    engine.registry().set_value("m", 1.0);
    print_computed(engine);

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
