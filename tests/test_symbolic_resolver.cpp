#include <gtest/gtest.h>
#include <formulize/symbolic_resolver.hpp>
#include <formulize/errors.hpp>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include "test_helpers.hpp"

using namespace formulize;
using test_utils::number_of;

class SymbolicResolverTest : public ::testing::Test {
protected:
    ResolutionResult solve(const std::vector<std::string>& expressions,
                           const std::vector<std::string>& names,
                           const std::vector<std::string>& targets,
                           const ValueMap& snapshot,
                           std::map<std::string, MappingFunction> mappings = {},
                           ResolverOptions options = {}) {
        SymbolicResolver resolver(expressions, names, targets, std::move(mappings), options);
        return resolver.resolve(snapshot);
    }
};

// === DIRECT FORMS ===

TEST_F(SymbolicResolverTest, ForwardAssignment) {
    auto result = solve({"{y} = {x} + 1"}, {"x", "y"}, {"y"}, {{"x", Value(2.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 3.0);
    EXPECT_TRUE(result.report.complete());
    EXPECT_EQ(result.report.passes, 1u);
}

TEST_F(SymbolicResolverTest, ReverseAssignment) {
    auto result = solve({"{x} * 2 = {y}"}, {"x", "y"}, {"y"}, {{"x", Value(4.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 8.0);
}

TEST_F(SymbolicResolverTest, VectorDestructuring) {
    auto result = solve({"[{a}, {b}] = [{x} * 2, {x} * 3]"}, {"x", "a", "b"}, {"a", "b"},
                        {{"x", Value(5.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "a"), 10.0);
    EXPECT_DOUBLE_EQ(number_of(result.values, "b"), 15.0);
}

TEST_F(SymbolicResolverTest, VectorLengthMismatchLeavesTargetsUnresolved) {
    auto result = solve({"[{a}, {b}] = [{x}, {x}, {x}]"}, {"x", "a", "b"}, {"a", "b"},
                        {{"x", Value(1.0)}});
    EXPECT_TRUE(std::isnan(number_of(result.values, "a")));
    EXPECT_EQ(result.report.unresolved.size(), 2u);
}

TEST_F(SymbolicResolverTest, VectorValuedTarget) {
    auto result = solve({"{v} = [{x}, {x} + 1]"}, {"x", "v"}, {"v"}, {{"x", Value(1.0)}});
    test_utils::expect_numbers(result.values.at("v"), {1.0, 2.0});
}

// === FIXED POINT ===

TEST_F(SymbolicResolverTest, ChainsAcrossPassesRegardlessOfOrder) {
    auto result = solve({"{z} = {y} * 2", "{y} = {x} + 1"}, {"x", "y", "z"}, {"y", "z"},
                        {{"x", Value(1.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 2.0);
    EXPECT_DOUBLE_EQ(number_of(result.values, "z"), 4.0);
    EXPECT_EQ(result.report.passes, 2u);
}

TEST_F(SymbolicResolverTest, CircularDefinitionTerminatesWithNaN) {
    auto result = solve({"{a} = {b}", "{b} = {a}"}, {"a", "b"}, {"a", "b"}, {});
    EXPECT_TRUE(std::isnan(number_of(result.values, "a")));
    EXPECT_TRUE(std::isnan(number_of(result.values, "b")));
    EXPECT_LE(result.report.passes, 2u);
    EXPECT_EQ(result.report.unresolved, (std::vector<std::string>{"a", "b"}));
}

TEST_F(SymbolicResolverTest, StaleComputedValuesAreNotRead) {
    // y has no defining equation; its old value must not leak into z
    auto result = solve({"{z} = {y} + 1"}, {"y", "z"}, {"y", "z"},
                        {{"y", Value(99.0)}, {"z", Value(100.0)}});
    EXPECT_TRUE(std::isnan(number_of(result.values, "y")));
    EXPECT_TRUE(std::isnan(number_of(result.values, "z")));
}

TEST_F(SymbolicResolverTest, FirstEvaluableEquationWins) {
    auto result = solve({"{y} = {x} + 1", "{y} = {x} + 100"}, {"x", "y"}, {"y"}, {{"x", Value(0.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 1.0);
}

TEST_F(SymbolicResolverTest, ConstantsAvailableInExpressions) {
    auto result = solve({"{c} = 2 * pi * {r}"}, {"r", "c"}, {"c"}, {{"r", Value(1.0)}});
    EXPECT_NEAR(number_of(result.values, "c"), 2.0 * std::numbers::pi, 1e-12);
}

TEST_F(SymbolicResolverTest, TargetNamedLikeConstantIsNotShadowed) {
    // An unresolved target called e must not evaluate as Euler's number
    auto result = solve({"{y} = {e} + 1"}, {"e", "y"}, {"e", "y"}, {});
    EXPECT_TRUE(std::isnan(number_of(result.values, "y")));
}

TEST_F(SymbolicResolverTest, UnsetVariableShadowsConstant) {
    // Registered but without a value, so y cannot be computed
    auto result = solve({"{y} = 2 * {e}", "{z} = {pi} + {x}"}, {"e", "pi", "x", "y", "z"}, {"y", "z"},
                        {{"x", Value(1.0)}});
    EXPECT_TRUE(std::isnan(number_of(result.values, "y")));
    EXPECT_TRUE(std::isnan(number_of(result.values, "z")));
    EXPECT_EQ(result.report.unresolved.size(), 2u);
}

TEST_F(SymbolicResolverTest, UnregisteredConstantStillAvailable) {
    auto result = solve({"{y} = 2 * e"}, {"x", "y"}, {"y"}, {{"x", Value(1.0)}});
    EXPECT_NEAR(number_of(result.values, "y"), 2.0 * std::numbers::e, 1e-12);
}

// === NAME TRANSLATION ===

TEST_F(SymbolicResolverTest, UnsafeIdsAreTranslated) {
    auto result = solve({"{v.1} = {mass kg} * 2"}, {"mass kg", "v.1"}, {"v.1"},
                        {{"mass kg", Value(3.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "v.1"), 6.0);
}

TEST_F(SymbolicResolverTest, ReservedWordIdsAreTranslated) {
    auto result = solve({"{end} = {in} mod 4"}, {"in", "end"}, {"end"}, {{"in", Value(10.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "end"), 2.0);
}

// === MAPPINGS ===

TEST_F(SymbolicResolverTest, MappingTakesPrecedenceOverEquation) {
    std::map<std::string, MappingFunction> mappings;
    mappings["y"] = [](const ValueMap& scope) {
        return Value(scope.at("x").number() * 100.0);
    };
    auto result = solve({"{y} = {x} + 1"}, {"x", "y"}, {"y"}, {{"x", Value(2.0)}}, mappings);
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 200.0);
}

TEST_F(SymbolicResolverTest, MappingSeesResolvedValuesUnderOriginalIds) {
    std::map<std::string, MappingFunction> mappings;
    mappings["out.total"] = [](const ValueMap& scope) {
        auto it = scope.find("y.1");
        if (it == scope.end()) {
            throw std::runtime_error("y.1 not ready");
        }
        return Value(it->second.number() + 1.0);
    };
    auto result = solve({"{y.1} = {x} * 2"}, {"x", "y.1", "out.total"}, {"y.1", "out.total"},
                        {{"x", Value(3.0)}}, mappings);
    EXPECT_DOUBLE_EQ(number_of(result.values, "y.1"), 6.0);
    EXPECT_DOUBLE_EQ(number_of(result.values, "out.total"), 7.0);
    EXPECT_EQ(result.report.passes, 2u);
}

TEST_F(SymbolicResolverTest, MappingForNonTargetIsIgnored) {
    test_utils::LogCapture logs(formulize::log::Level::Warn);
    std::map<std::string, MappingFunction> mappings;
    mappings["x"] = [](const ValueMap&) { return Value(1.0); };
    auto result = solve({"{y} = {x}"}, {"x", "y"}, {"y"}, {{"x", Value(5.0)}}, mappings);
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 5.0);
    EXPECT_TRUE(logs.contains(formulize::log::Level::Warn, "not computed"));
}

// === LINEAR ISOLATION ===

TEST_F(SymbolicResolverTest, SolvesEquationLinearInTarget) {
    auto result = solve({"2 * {y} + 3 = {x}"}, {"x", "y"}, {"y"}, {{"x", Value(7.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 2.0);
}

TEST_F(SymbolicResolverTest, SolvesForFactorOfProduct) {
    auto result = solve({"{F} = {m} * {a}"}, {"F", "m", "a"}, {"a"},
                        {{"F", Value(10.0)}, {"m", Value(4.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "a"), 2.5);
}

TEST_F(SymbolicResolverTest, NonLinearEquationIsNotIsolated) {
    auto result = solve({"{y} ^ 2 = {x}"}, {"x", "y"}, {"y"}, {{"x", Value(9.0)}});
    EXPECT_TRUE(std::isnan(number_of(result.values, "y")));
    EXPECT_FALSE(result.report.complete());
}

TEST_F(SymbolicResolverTest, LinearIsolationCanBeDisabled) {
    ResolverOptions options;
    options.linear_isolation = false;
    auto result = solve({"2 * {y} + 3 = {x}"}, {"x", "y"}, {"y"}, {{"x", Value(7.0)}}, {}, options);
    EXPECT_TRUE(std::isnan(number_of(result.values, "y")));
}

// === MALFORMED INPUT ===

TEST_F(SymbolicResolverTest, NonEquationsAreSkipped) {
    test_utils::LogCapture logs(formulize::log::Level::Warn);
    SymbolicResolver resolver({"{y} == {x}", "{y} = {x} = 1", "{y} = (", "{y} = {x} * 3"},
                              {"x", "y"}, {"y"});
    EXPECT_EQ(resolver.equation_count(), 1u);
    EXPECT_EQ(logs.count(formulize::log::Level::Warn), 3u);

    auto result = resolver.resolve({{"x", Value(2.0)}});
    EXPECT_DOUBLE_EQ(number_of(result.values, "y"), 6.0);
}

TEST_F(SymbolicResolverTest, NoTargetsResolvesNothing) {
    auto result = solve({"{y} = {x}"}, {"x", "y"}, {}, {{"x", Value(1.0)}});
    EXPECT_TRUE(result.values.empty());
    EXPECT_EQ(result.report.passes, 0u);
}

// === INTROSPECTION ===

TEST_F(SymbolicResolverTest, DescribeNamesEachTarget) {
    std::map<std::string, MappingFunction> mappings;
    mappings["m"] = [](const ValueMap&) { return Value(1.0); };
    SymbolicResolver resolver({"{y} = {x} + 1", "[{p}, {q}] = [1, 2]", "2 * {s} = {x}"},
                              {"x", "y", "p", "q", "s", "m", "orphan"},
                              {"y", "p", "s", "m", "orphan"}, mappings);

    std::string text = resolver.describe();
    EXPECT_NE(text.find("y = x + 1"), std::string::npos);
    EXPECT_NE(text.find("p from [p, q] = [1, 2]"), std::string::npos);
    EXPECT_NE(text.find("s solved from"), std::string::npos);
    EXPECT_NE(text.find("m = mapping(m)"), std::string::npos);
    EXPECT_NE(text.find("orphan = NaN"), std::string::npos);
}

TEST_F(SymbolicResolverTest, EvaluatorKeepsLastReport) {
    SymbolicEvaluator evaluator(SymbolicResolver({"{a} = {b}", "{b} = {a}"}, {"a", "b"}, {"a", "b"}));
    EXPECT_EQ(evaluator.strategy(), Strategy::Symbolic);
    evaluator.evaluate({});
    EXPECT_EQ(evaluator.last_report().unresolved.size(), 2u);
}
