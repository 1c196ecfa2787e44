#include <gtest/gtest.h>

#include <algorithm>

#include "TestData.hpp"
#include "engine/SuggestionGenerator.hpp"
#include "monitor/Logger.hpp"

using namespace testdata;

namespace {

ProcessedPrediction samplePrediction() {
    ProcessedPrediction p;
    p.values.assign(kOutputDimension, 0.0);

    ScalingToken font = token(1.2, 10, 30, 2);
    font.unit.clear();
    p.tokens["fontSize"] = font;
    p.values[0] = 1.2;
    p.values[1] = 10;
    p.values[2] = 30;
    p.values[3] = 2;

    p.performance["renderTime"] = 0.25;
    p.performance["bundleSize"] = 0.05;
    p.values[24] = 0.25;
    p.values[25] = 0.05;
    p.values[30] = 18.0;   // accessibility_fontSize
    p.values[31] = 40.0;   // accessibility_tapTarget
    return p;
}

ResponsiveConfig smallTapTargetConfig() {
    ResponsiveConfig c = standardConfig();
    c.strategy->accessibility.minTapTarget = 40;
    return c;
}

class SuggestionGeneratorTest : public ::testing::Test {
protected:
    SuggestionGenerator generator{Logger::silent()};
    PredictionComparison comparison;

    OptimizationSuggestions run(double confidence = 0.8) {
        comparison.overallImprovement = 12.5;
        return generator.generate(smallTapTargetConfig(), realisticUsage(), samplePrediction(), confidence,
                                  comparison);
    }
};

}  // namespace

TEST(SuggestionSeverity, Thresholds) {
    EXPECT_EQ(SuggestionGenerator::severityFor(45.0), "critical");
    EXPECT_EQ(SuggestionGenerator::severityFor(30.0), "critical");
    EXPECT_EQ(SuggestionGenerator::severityFor(29.9), "high");
    EXPECT_EQ(SuggestionGenerator::severityFor(20.0), "high");
    EXPECT_EQ(SuggestionGenerator::severityFor(10.0), "medium");
    EXPECT_EQ(SuggestionGenerator::severityFor(9.99), "low");
    EXPECT_EQ(SuggestionGenerator::severityFor(-15.0), "low");
}

TEST(SuggestionConstraints, OnePerConfiguredToken) {
    OptimizerConfig cfg;
    PostProcessConstraints c = SuggestionGenerator::constraintsFor(standardConfig(), cfg.performanceConstraints);

    ASSERT_EQ(c.tokens.size(), 5u);
    EXPECT_EQ(c.tokens[0].name, "fontSize");
    EXPECT_DOUBLE_EQ(c.tokens[0].min, 12.0);
    EXPECT_DOUBLE_EQ(c.tokens[0].max, 32.0);
    EXPECT_DOUBLE_EQ(c.tokens[0].step, 1.0);
    EXPECT_EQ(c.performance.size(), cfg.performanceConstraints.size());
}

TEST(SuggestionBaseline, EncodesCurrentConfiguration) {
    auto v = SuggestionGenerator::baselineVector(standardConfig(), realisticUsage());
    ASSERT_EQ(v.size(), kOutputDimension);

    EXPECT_DOUBLE_EQ(v[0], 0.85);   // fontSize scale
    EXPECT_DOUBLE_EQ(v[1], 12.0);
    EXPECT_DOUBLE_EQ(v[7], 4.0);    // spacing step
    EXPECT_DOUBLE_EQ(v[16], 0.85);  // shadow is not configured
    EXPECT_NEAR(v[28], 0.75, 1e-12);
    EXPECT_DOUBLE_EQ(v[30], 12.0);
    EXPECT_DOUBLE_EQ(v[31], 44.0);
}

TEST_F(SuggestionGeneratorTest, PredictedTokensKeepConfiguredPresentation) {
    OptimizationSuggestions s = run();

    ASSERT_EQ(s.suggestedTokens.size(), 5u);
    const ScalingToken& font = s.suggestedTokens.at("fontSize");
    EXPECT_DOUBLE_EQ(font.scale, 1.2);
    EXPECT_DOUBLE_EQ(font.min, 10.0);
    EXPECT_EQ(font.unit, "px");

    // no model output: copied and trimmed onto its own grid
    const ScalingToken& icon = s.suggestedTokens.at("iconSize");
    EXPECT_DOUBLE_EQ(icon.min, 16.0);
    EXPECT_DOUBLE_EQ(icon.max, 48.0);
    EXPECT_DOUBLE_EQ(icon.step, 4.0);

    const ScalingToken& spacing = s.suggestedTokens.at("spacing");
    EXPECT_DOUBLE_EQ(spacing.max, 64.0);
    EXPECT_DOUBLE_EQ(spacing.scale, 0.9);
}

TEST_F(SuggestionGeneratorTest, CurveRecommendations) {
    OptimizationSuggestions s = run(0.8);
    const auto& recs = s.scalingCurveRecommendations;
    ASSERT_EQ(recs.size(), 5u);

    // tokens referenced by usage records come first
    EXPECT_EQ(recs[0].token, "fontSize");
    EXPECT_EQ(recs[1].token, "spacing");
    EXPECT_NEAR(recs[0].confidence, 0.8 * 0.75, 1e-12);
    EXPECT_NEAR(recs[4].confidence, 0.8 * 0.5, 1e-12);
    EXPECT_TRUE(std::is_sorted(recs.begin(), recs.end(), [](const auto& a, const auto& b) {
        return a.confidence > b.confidence;
    }));

    const auto& font = recs[0];
    EXPECT_EQ(font.mode, "exponential");
    EXPECT_EQ(recs[1].mode, "linear");
    EXPECT_EQ(font.breakpointAdjustments.size(), 5u);
    EXPECT_DOUBLE_EQ(font.breakpointAdjustments.at("mobile"), -0.5);
    EXPECT_NEAR(font.breakpointAdjustments.at("laptop"), (1366.0 / 1920.0 - 1.0) * (1.2 - 0.85), 1e-9);
    EXPECT_NEAR(font.breakpointAdjustments.at("desktop"), 0.0, 1e-12);
    EXPECT_NE(font.reasoning.find("5 usage record"), std::string::npos);
}

TEST_F(SuggestionGeneratorTest, PerformanceImpacts) {
    OptimizationSuggestions s = run();
    ASSERT_EQ(s.performanceImpacts.size(), 4u);

    const PerformanceImpact& render = s.performanceImpacts[0];
    EXPECT_EQ(render.aspect, "render-time");
    EXPECT_NEAR(render.currentValue, 9.8, 1e-9);
    EXPECT_NEAR(render.predictedValue, 9.8 * 0.75, 1e-9);
    EXPECT_NEAR(render.improvementPercent, 25.0, 1e-9);
    EXPECT_EQ(render.severity, "high");

    EXPECT_EQ(s.performanceImpacts[1].aspect, "bundle-size");
    EXPECT_EQ(s.performanceImpacts[1].severity, "low");
    EXPECT_NEAR(s.estimatedImprovements.performance.renderTime, 25.0, 1e-9);
}

TEST_F(SuggestionGeneratorTest, ImpactsNeedObservations) {
    auto usage = realisticUsage();
    for (auto& d : usage) d.performance = PerformanceMetrics();

    OptimizationSuggestions s =
        generator.generate(smallTapTargetConfig(), usage, samplePrediction(), 0.5, comparison);
    EXPECT_TRUE(s.performanceImpacts.empty());
}

TEST_F(SuggestionGeneratorTest, AccessibilityWarnings) {
    OptimizationSuggestions s = run();
    const auto& w = s.accessibilityWarnings;
    ASSERT_EQ(w.size(), 3u);

    EXPECT_EQ(w[0].type, "font-size");
    EXPECT_DOUBLE_EQ(w[0].currentValue, 10.0);
    EXPECT_DOUBLE_EQ(w[0].recommendedValue, 12.0);
    EXPECT_EQ(w[0].wcagReference, "WCAG 2.1 AA - 1.4.4 Resize text");
    EXPECT_EQ(w[0].severity, "AA");

    EXPECT_EQ(w[1].type, "font-size");
    EXPECT_DOUBLE_EQ(w[1].recommendedValue, 18.0);

    EXPECT_EQ(w[2].type, "tap-target");
    EXPECT_EQ(w[2].severity, "best-practice");
    EXPECT_EQ(w[2].wcagReference, "WCAG 2.1 AAA - 2.5.5 Target Size");
    EXPECT_DOUBLE_EQ(w[2].recommendedValue, 44.0);

    EXPECT_DOUBLE_EQ(s.estimatedImprovements.userExperience.accessibilityScore, 15.0);
}

TEST_F(SuggestionGeneratorTest, ConfidenceAndOverall) {
    EXPECT_DOUBLE_EQ(run(0.8).confidenceScore, 0.8);
    EXPECT_DOUBLE_EQ(run(1.7).confidenceScore, 1.0);
    EXPECT_DOUBLE_EQ(run().estimatedImprovements.overall, 12.5);
}
