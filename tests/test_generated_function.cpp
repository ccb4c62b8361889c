#include <gtest/gtest.h>
#include <formulize/generated_function.hpp>
#include <formulize/errors.hpp>
#include <cmath>
#include <numbers>
#include "test_helpers.hpp"

using namespace formulize;
using test_utils::number_of;

class GeneratedFunctionTest : public ::testing::Test {
protected:
    ValueMap call(const std::string& source, const ValueMap& inputs) {
        return GeneratedFunction::parse(source).call(inputs);
    }
};

// === PARSING ===

TEST_F(GeneratedFunctionTest, SimpleReturnObject) {
    auto function = GeneratedFunction::parse(
        "function evaluate(variables) { return { y: variables.x * 2 }; }");
    EXPECT_EQ(function.parameter(), "variables");
    EXPECT_EQ(function.referenced_inputs(), (std::set<std::string>{"x"}));

    ValueMap result = function.call({{"x", Value(4.0)}});
    EXPECT_DOUBLE_EQ(number_of(result, "y"), 8.0);
}

TEST_F(GeneratedFunctionTest, IgnoresTextBeforeFunction) {
    ValueMap result = call("Here is the function:\nfunction evaluate(p) {\n  return { y: p.x + 1 };\n}",
                           {{"x", Value(1.0)}});
    EXPECT_DOUBLE_EQ(number_of(result, "y"), 2.0);
}

TEST_F(GeneratedFunctionTest, BracketInputAccessAndQuotedKeys) {
    auto function = GeneratedFunction::parse(
        "function evaluate(p) { return { 'F net': p[\"m\"] * p['a'] }; }");
    EXPECT_EQ(function.referenced_inputs(), (std::set<std::string>{"a", "m"}));
    ValueMap result = function.call({{"m", Value(2.0)}, {"a", Value(3.0)}});
    EXPECT_DOUBLE_EQ(number_of(result, "F net"), 6.0);
}

TEST_F(GeneratedFunctionTest, DestructuringWithAlias) {
    auto function = GeneratedFunction::parse(R"(
        function evaluate(p) {
            const { x, k: factor } = p;
            return { y: x * factor };
        })");
    EXPECT_EQ(function.referenced_inputs(), (std::set<std::string>{"k", "x"}));
    EXPECT_DOUBLE_EQ(number_of(function.call({{"x", Value(3.0)}, {"k", Value(5.0)}}), "y"), 15.0);
}

// === STATEMENTS ===

TEST_F(GeneratedFunctionTest, LocalsCompoundAssignmentAndBranches) {
    const std::string source = R"(
        function evaluate(v) {
            let total = 0;
            total += v.a;
            total *= 2;
            if (total > 10) {
                total = 10;
            } else total -= 1;
            return { y: total };
        })";
    EXPECT_DOUBLE_EQ(number_of(call(source, {{"a", Value(3.0)}}), "y"), 5.0);
    EXPECT_DOUBLE_EQ(number_of(call(source, {{"a", Value(10.0)}}), "y"), 10.0);
}

TEST_F(GeneratedFunctionTest, ObjectLocalWithMemberAssignment) {
    const std::string source = R"(
        function evaluate(v) {
            const result = {};
            result.y = v.x + 1;
            result["z"] = Math.sqrt(v.x);
            return result;
        })";
    ValueMap result = call(source, {{"x", Value(16.0)}});
    EXPECT_DOUBLE_EQ(number_of(result, "y"), 17.0);
    EXPECT_DOUBLE_EQ(number_of(result, "z"), 4.0);
}

TEST_F(GeneratedFunctionTest, ObjectMembersReadBack) {
    const std::string source = R"(
        function evaluate(v) {
            const parts = { a: v.x * 2, b: 3 };
            return { y: parts.a + parts.b };
        })";
    EXPECT_DOUBLE_EQ(number_of(call(source, {{"x", Value(1.0)}}), "y"), 5.0);
}

TEST_F(GeneratedFunctionTest, ShorthandReturnKeys) {
    const std::string source = R"(
        function evaluate(v) {
            const y = v.x - 1;
            const z = y * y;
            return { y, z };
        })";
    ValueMap result = call(source, {{"x", Value(4.0)}});
    EXPECT_DOUBLE_EQ(number_of(result, "y"), 3.0);
    EXPECT_DOUBLE_EQ(number_of(result, "z"), 9.0);
}

TEST_F(GeneratedFunctionTest, TryCatchGuardsDivision) {
    const std::string source = R"(
        function evaluate(variables) {
            try {
                const r = variables.x / variables.y;
                if (!isFinite(r)) {
                    return { q: NaN };
                }
                return { q: r };
            } catch (error) {
                return { q: NaN };
            }
        })";
    EXPECT_DOUBLE_EQ(number_of(call(source, {{"x", Value(6.0)}, {"y", Value(3.0)}}), "q"), 2.0);
    EXPECT_TRUE(std::isnan(number_of(call(source, {{"x", Value(6.0)}, {"y", Value(0.0)}}), "q")));
}

TEST_F(GeneratedFunctionTest, CatchHandlesRuntimeErrors) {
    const std::string source = R"(
        function evaluate(v) {
            try {
                return { y: [1, 2] + [1, 2, 3] };
            } catch (e) {
                return { y: -1 };
            } finally {
                let unused = 0;
            }
        })";
    EXPECT_DOUBLE_EQ(number_of(call(source, {}), "y"), -1.0);
}

// === EXPRESSIONS ===

TEST_F(GeneratedFunctionTest, MathAndNumberMembers) {
    const std::string source = R"(
        function evaluate(v) {
            return {
                area: Math.PI * Math.pow(v.r, 2),
                cube: v.r ** 3,
                big: Math.max(v.r, 10, -1),
                finite: Number.isFinite(v.r) ? 1 : 0,
                rem: -7 % 3,
                eq: v.r === 2 && v.r !== 3
            };
        })";
    ValueMap result = call(source, {{"r", Value(2.0)}});
    EXPECT_NEAR(number_of(result, "area"), 4.0 * std::numbers::pi, 1e-12);
    EXPECT_DOUBLE_EQ(number_of(result, "cube"), 8.0);
    EXPECT_DOUBLE_EQ(number_of(result, "big"), 10.0);
    EXPECT_DOUBLE_EQ(number_of(result, "finite"), 1.0);
    // Truncated remainder, as in JavaScript
    EXPECT_DOUBLE_EQ(number_of(result, "rem"), -1.0);
    EXPECT_DOUBLE_EQ(number_of(result, "eq"), 1.0);
}

TEST_F(GeneratedFunctionTest, MissingInputReadsAsNaN) {
    ValueMap result = call("function evaluate(p) { return { y: p.missing + 1 }; }", {});
    EXPECT_TRUE(std::isnan(number_of(result, "y")));
}

// === RUNTIME FAILURES ===

TEST_F(GeneratedFunctionTest, NoReturnYieldsEmptyResult) {
    test_utils::LogCapture logs(formulize::log::Level::Warn);
    ValueMap result = call("function evaluate(p) { let a = p.x; }", {{"x", Value(1.0)}});
    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(logs.contains(formulize::log::Level::Warn, "returned no object"));
}

TEST_F(GeneratedFunctionTest, UncaughtErrorPropagates) {
    auto function = GeneratedFunction::parse("function evaluate(p) { let r; return { y: r + 1 }; }");
    EXPECT_THROW(function.call({}), EvaluationError);
}

// === REJECTED CODE ===

TEST_F(GeneratedFunctionTest, RejectsMissingEvaluate) {
    EXPECT_THROW(GeneratedFunction::parse("function compute(p) { return { y: 1 }; }"), GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsUnknownIdentifiers) {
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: window.x }; }"),
                 GeneratedCodeInvalid);
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: eval('1') }; }"),
                 GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsDisallowedMathMembers) {
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: Math.random() }; }"),
                 GeneratedCodeInvalid);
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: Number.parseFloat('1') }; }"),
                 GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsUnsupportedStatements) {
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { while (true) {} return { y: 1 }; }"),
                 GeneratedCodeInvalid);
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return 5; }"), GeneratedCodeInvalid);
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: 1 }; } evaluate(p);"),
                 GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsInvalidBindings) {
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { const a = 1; a = 2; return { y: a }; }"),
                 GeneratedCodeInvalid);
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { const p = 1; return { y: p }; }"),
                 GeneratedCodeInvalid);
    EXPECT_THROW(GeneratedFunction::parse(
                     "function evaluate(p) { try { return { y: 1 }; } catch (e) { return { y: e }; } }"),
                 GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, TokenizerErrorsBecomeInvalidCode) {
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: p.x # 2 }; }"),
                 GeneratedCodeInvalid);
}

// === NESTING LIMITS ===

TEST_F(GeneratedFunctionTest, ModerateNestingIsAccepted) {
    const std::string source = "function evaluate(p) { return { y: " + std::string(60, '(') + "p.x" +
                               std::string(60, ')') + " + 1 }; }";
    EXPECT_DOUBLE_EQ(number_of(call(source, {{"x", Value(1.0)}}), "y"), 2.0);
}

TEST_F(GeneratedFunctionTest, RejectsDeeplyNestedParentheses) {
    const std::string source = "function evaluate(p) { return { y: " + std::string(200000, '(') + "1" +
                               std::string(200000, ')') + " }; }";
    EXPECT_THROW(GeneratedFunction::parse(source), GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsLongUnaryChain) {
    const std::string source = "function evaluate(p) { return { y: " + std::string(100000, '-') + "1 }; }";
    EXPECT_THROW(GeneratedFunction::parse(source), GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsLongOperatorChain) {
    std::string chain = "p.x";
    for (int i = 0; i < 100000; ++i) {
        chain += " * 1";
    }
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { return { y: " + chain + " }; }"),
                 GeneratedCodeInvalid);
}

TEST_F(GeneratedFunctionTest, RejectsDeeplyNestedStatements) {
    std::string body;
    for (int i = 0; i < 50000; ++i) {
        body += "if (p.x > 0) ";
    }
    body += "return { y: 1 };";
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { " + body + " }"), GeneratedCodeInvalid);

    const std::string blocks = std::string(50000, '{') + std::string(50000, '}');
    EXPECT_THROW(GeneratedFunction::parse("function evaluate(p) { " + blocks + " return { y: 1 }; }"),
                 GeneratedCodeInvalid);
}

// === EVALUATOR ===

TEST_F(GeneratedFunctionTest, EvaluatorKeepsOnlyTargets) {
    GeneratedFunctionEvaluator evaluator(
        GeneratedFunction::parse("function evaluate(p) { return { y: p.x, extra: 1 }; }"), {"y"});
    ValueMap result = evaluator.evaluate({{"x", Value(2.0)}});
    EXPECT_EQ(result.size(), 1u);
    EXPECT_DOUBLE_EQ(number_of(result, "y"), 2.0);
    EXPECT_EQ(evaluator.strategy(), Strategy::External);
}

TEST_F(GeneratedFunctionTest, EvaluatorMapsFormulaHeadToSingleMissingTarget) {
    GeneratedFunctionEvaluator evaluator(
        GeneratedFunction::parse("function evaluate(p) { return { F: p.m * p.a }; }"), {"F_net"}, "F");
    ValueMap result = evaluator.evaluate({{"m", Value(2.0)}, {"a", Value(5.0)}});
    EXPECT_DOUBLE_EQ(number_of(result, "F_net"), 10.0);
}

TEST_F(GeneratedFunctionTest, EvaluatorSkipsHeadAliasForSeveralMissingTargets) {
    GeneratedFunctionEvaluator evaluator(
        GeneratedFunction::parse("function evaluate(p) { return { F: 1 }; }"), {"a", "b"}, "F");
    EXPECT_TRUE(evaluator.evaluate({}).empty());
}

TEST_F(GeneratedFunctionTest, EvaluatorSkipsHeadAliasWhenHeadIsATarget) {
    GeneratedFunctionEvaluator evaluator(
        GeneratedFunction::parse("function evaluate(p) { return { K: 9 }; }"), {"K", "p"}, "K");
    ValueMap result = evaluator.evaluate({});
    EXPECT_DOUBLE_EQ(number_of(result, "K"), 9.0);
    EXPECT_EQ(result.count("p"), 0u);
}

TEST_F(GeneratedFunctionTest, EvaluatorSwallowsRuntimeErrors) {
    test_utils::LogCapture logs(formulize::log::Level::Error);
    GeneratedFunctionEvaluator evaluator(
        GeneratedFunction::parse("function evaluate(p) { let r; return { y: r }; }"), {"y"});
    EXPECT_TRUE(evaluator.evaluate({}).empty());
    EXPECT_EQ(logs.count(formulize::log::Level::Error), 1u);
}
