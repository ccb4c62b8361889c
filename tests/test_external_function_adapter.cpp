#include <gtest/gtest.h>
#include <formulize/external_function_adapter.hpp>
#include <formulize/errors.hpp>
#include "test_helpers.hpp"

using namespace formulize;
using test_utils::number_of;

class ExternalFunctionAdapterTest : public ::testing::Test {
protected:
    GenerationRequest request(const std::string& formula,
                              std::vector<std::string> inputs,
                              std::vector<std::string> targets) {
        return build_generation_request(formula, inputs, targets);
    }

    static GenerationResponse response(const std::string& text) {
        return GenerationResponse{text};
    }
};

// === REQUEST ===

TEST_F(ExternalFunctionAdapterTest, RequestCarriesFormulaAndNames) {
    GenerationRequest req = request("y = m * x + b", {"m", "x", "b"}, {"y"});
    EXPECT_EQ(req.formula_text, "y = m * x + b");
    EXPECT_EQ(req.input_variable_names.size(), 3u);
    EXPECT_EQ(req.system_instruction, GENERATION_SYSTEM_INSTRUCTION);
    EXPECT_NE(req.prompt.find("y = m * x + b"), std::string::npos);
    EXPECT_NE(req.prompt.find("Input variables: m, x, b"), std::string::npos);
    EXPECT_NE(req.prompt.find("Computed variables: y"), std::string::npos);
    EXPECT_NE(req.prompt.find("parameter named variables"), std::string::npos);
}

TEST_F(ExternalFunctionAdapterTest, RequestNeedsFormulaAndTargets) {
    EXPECT_THROW(request("   ", {"x"}, {"y"}), ConfigurationError);
    EXPECT_THROW(request("y = x", {"x"}, {}), ConfigurationError);
}

// === TEXT HELPERS ===

TEST_F(ExternalFunctionAdapterTest, StripCodeFences) {
    EXPECT_EQ(strip_code_fences("  function evaluate(p) {}  \n"), "function evaluate(p) {}");
    EXPECT_EQ(strip_code_fences("```javascript\nfunction evaluate(p) {}\n```"), "function evaluate(p) {}");
    EXPECT_EQ(strip_code_fences("Sure:\n```\nfunction evaluate(p) {}\n```\nDone."), "function evaluate(p) {}");
    EXPECT_EQ(strip_code_fences("```js\nfunction evaluate(p) {}"), "function evaluate(p) {}");
}

TEST_F(ExternalFunctionAdapterTest, FormulaHead) {
    EXPECT_EQ(formula_head("F = m * a"), std::optional<std::string>("F"));
    EXPECT_EQ(formula_head("  {K} = 1/2 m v^2"), std::optional<std::string>("K"));
    EXPECT_FALSE(formula_head("Fnet = m * a").has_value());
    EXPECT_FALSE(formula_head("F == m").has_value());
    EXPECT_FALSE(formula_head("m * a").has_value());
}

// === VALIDATION ===

TEST_F(ExternalFunctionAdapterTest, AcceptsFencedResponse) {
    GenerationRequest req = request("y = 2x", {"x"}, {"y"});
    GeneratedFunction function = validate_generated(req, response(
        "```javascript\nfunction evaluate(variables) {\n  return { y: 2 * variables.x };\n}\n```"));
    EXPECT_DOUBLE_EQ(number_of(function.call({{"x", Value(3.0)}}), "y"), 6.0);
}

TEST_F(ExternalFunctionAdapterTest, RejectsResponseWithoutEvaluate) {
    GenerationRequest req = request("y = 2x", {"x"}, {"y"});
    EXPECT_THROW(validate_generated(req, response("return { y: 2 * x };")), GeneratedCodeInvalid);
}

TEST_F(ExternalFunctionAdapterTest, RejectsResponseMissingTargetKey) {
    GenerationRequest req = request("y = 2x", {"x"}, {"y"});
    EXPECT_THROW(validate_generated(req, response("function evaluate(p) { return { z: 2 * p.x }; }")),
                 GeneratedCodeInvalid);
}

TEST_F(ExternalFunctionAdapterTest, TargetKeysMayBeQuoted) {
    GenerationRequest req = request("v.1 = 2x", {"x"}, {"v.1"});
    EXPECT_NO_THROW(validate_generated(req, response("function evaluate(p) { return { \"v.1\": 2 * p.x }; }")));
}

TEST_F(ExternalFunctionAdapterTest, FormulaHeadSatisfiesMissingTarget) {
    GenerationRequest req = request("F = m * a", {"m", "a"}, {"F_net"});
    EXPECT_NO_THROW(validate_generated(req, response("function evaluate(p) { return { F: p.m * p.a }; }")));
}

TEST_F(ExternalFunctionAdapterTest, RejectsCodeOutsideGrammar) {
    GenerationRequest req = request("y = 2x", {"x"}, {"y"});
    EXPECT_THROW(validate_generated(req, response(
                     "function evaluate(p) { fetch('http://example.com'); return { y: 2 * p.x }; }")),
                 GeneratedCodeInvalid);
}

TEST_F(ExternalFunctionAdapterTest, UnusedInputOnlyWarns) {
    test_utils::LogCapture logs(formulize::log::Level::Warn);
    GenerationRequest req = request("y = 2x", {"x", "k"}, {"y"});
    EXPECT_NO_THROW(validate_generated(req, response("function evaluate(p) { return { y: 2 * p.x }; }")));
    EXPECT_TRUE(logs.contains(formulize::log::Level::Warn, "'k'"));
    EXPECT_FALSE(logs.contains(formulize::log::Level::Warn, "'x'"));
}

TEST_F(ExternalFunctionAdapterTest, LongWhitespaceRunsAreScannedLinearly) {
    GenerationRequest req = request("y = 2x", {"x"}, {"y"});
    const std::string gap(1000000, ' ');
    GeneratedFunction function = validate_generated(req, response(
        "function" + gap + "evaluate(p) { return { y" + gap + ": 2 * p.x }; }"));
    EXPECT_DOUBLE_EQ(number_of(function.call({{"x", Value(4.0)}}), "y"), 8.0);
}

TEST_F(ExternalFunctionAdapterTest, RejectsDeeplyNestedResponse) {
    GenerationRequest req = request("y = 1", {}, {"y"});
    const std::string nested = std::string(200000, '(') + "1" + std::string(200000, ')');
    EXPECT_THROW(validate_generated(req, response("function evaluate(p) { return { y: " + nested + " }; }")),
                 GeneratedCodeInvalid);
}

// === CLIENT ===

namespace {

class CannedClient : public GenerationClient {
public:
    explicit CannedClient(std::string text) : text_(std::move(text)) {}

    GenerationResponse generate(const GenerationRequest& request) override {
        last_prompt = request.prompt;
        return GenerationResponse{text_};
    }

    std::string last_prompt;

private:
    std::string text_;
};

class FailingClient : public GenerationClient {
public:
    GenerationResponse generate(const GenerationRequest&) override {
        throw GenerationTransportError("service unavailable", 503);
    }
};

} // namespace

TEST_F(ExternalFunctionAdapterTest, ClientRoundTrip) {
    CannedClient client("function evaluate(p) { return { y: p.x + 1 }; }");
    GenerationRequest req = request("y = x + 1", {"x"}, {"y"});
    GeneratedFunction function = validate_generated(req, client.generate(req));
    EXPECT_EQ(client.last_prompt, req.prompt);
    EXPECT_DOUBLE_EQ(number_of(function.call({{"x", Value(1.0)}}), "y"), 2.0);
}

TEST_F(ExternalFunctionAdapterTest, TransportErrorCarriesStatus) {
    FailingClient client;
    try {
        client.generate(request("y = x", {"x"}, {"y"}));
        FAIL() << "Expected GenerationTransportError";
    } catch (const GenerationTransportError& e) {
        EXPECT_EQ(e.status(), 503);
        EXPECT_NE(std::string(e.what()).find("service unavailable"), std::string::npos);
    }
}
