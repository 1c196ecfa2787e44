#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <set>

#include "TestData.hpp"
#include "features/FeatureExtractor.hpp"

using namespace testdata;

TEST(FeatureExtractorTest, VectorHasFixedWidthAndFiniteValues) {
    FeatureExtractor extractor;
    auto v = extractor.featuresToVector(extractor.extractFeatures(standardConfig(), realisticUsage()));

    ASSERT_EQ(v.size(), kFeatureDimension);
    for (double x : v) EXPECT_TRUE(std::isfinite(x));
}

TEST(FeatureExtractorTest, SameInputGivesSameVector) {
    FeatureExtractor extractor;
    auto usage = generatedUsage(50);
    auto a = extractor.featuresToVector(extractor.extractFeatures(standardConfig(), usage));
    auto b = extractor.featuresToVector(extractor.extractFeatures(standardConfig(), usage));
    EXPECT_EQ(a, b);
}

TEST(FeatureExtractorTest, ConfigurationSection) {
    FeatureExtractor extractor;
    auto f = extractor.extractFeatures(standardConfig(), realisticUsage());

    EXPECT_DOUBLE_EQ(f.config.breakpointCount, 5.0);
    EXPECT_DOUBLE_EQ(f.config.breakpointRatios[0], 375.0 / 1920.0);
    EXPECT_DOUBLE_EQ(f.config.breakpointRatios[4], 2560.0 / 1920.0);
    // unused slots are padded with 1
    EXPECT_DOUBLE_EQ(f.config.breakpointRatios[5], 1.0);
    EXPECT_DOUBLE_EQ(f.config.breakpointRatios[7], 1.0);
    EXPECT_DOUBLE_EQ(f.config.tokenComplexity, 5 * 4.0);
    EXPECT_DOUBLE_EQ(f.config.originDistribution[0], 1.0);
    EXPECT_DOUBLE_EQ(f.config.originDistribution[1], 0.0);
}

TEST(FeatureExtractorTest, ZeroBaseWidthUsesUnitRatios) {
    FeatureExtractor extractor;
    auto config = standardConfig();
    config.base.width = 0;
    auto f = extractor.extractFeatures(config, realisticUsage());
    for (double r : f.config.breakpointRatios) EXPECT_DOUBLE_EQ(r, 1.0);
}

TEST(FeatureExtractorTest, EmptyUsageGivesZeroedSections) {
    FeatureExtractor extractor;
    auto f = extractor.extractFeatures(standardConfig(), {});

    for (double x : f.usage.commonValues) EXPECT_DOUBLE_EQ(x, 0.0);
    EXPECT_TRUE(f.usage.componentFrequencies.empty());
    EXPECT_TRUE(f.usage.propertyPatterns.empty());
    for (double x : f.performance.avgRenderTimes) EXPECT_DOUBLE_EQ(x, 0.0);
    EXPECT_EQ(f.context.applicationType, "general");
    EXPECT_EQ(f.context.industry, "general");
    EXPECT_DOUBLE_EQ(f.context.deviceDistribution.desktop, 0.0);

    auto v = extractor.featuresToVector(f);
    EXPECT_EQ(v.size(), kFeatureDimension);
}

TEST(FeatureExtractorTest, UsageSection) {
    FeatureExtractor extractor;
    auto f = extractor.extractFeatures(standardConfig(), realisticUsage());

    // five records, each with a 16 and a 12; equal counts rank by value
    EXPECT_DOUBLE_EQ(f.usage.commonValues[0], 12.0);
    EXPECT_DOUBLE_EQ(f.usage.commonValues[1], 16.0);
    EXPECT_DOUBLE_EQ(f.usage.commonValues[2], 0.0);

    EXPECT_DOUBLE_EQ(f.usage.propertyPatterns.at("font-size"), 5.0);
    EXPECT_DOUBLE_EQ(f.usage.propertyPatterns.at("padding"), 5.0);

    EXPECT_DOUBLE_EQ(f.usage.componentFrequencies.at("Button"), 0.4);
    EXPECT_DOUBLE_EQ(f.usage.componentFrequencies.at("Card"), 0.4);
    EXPECT_DOUBLE_EQ(f.usage.componentFrequencies.at("Input"), 0.2);

    ASSERT_EQ(f.usage.valueDistributions.at("fontSize").size(), 5u);
}

TEST(FeatureExtractorTest, PerformanceSummarySkipsMissingValues) {
    FeatureExtractor extractor;
    auto usage = realisticUsage();
    usage[0].performance.renderTime.reset();
    usage[1].performance.renderTime.reset();
    usage[2].performance.renderTime.reset();
    usage[3].performance.renderTime.reset();
    // only card-2 (14ms) reports a render time

    auto f = extractor.extractFeatures(standardConfig(), usage);
    EXPECT_DOUBLE_EQ(f.performance.avgRenderTimes[0], 14.0);
    EXPECT_DOUBLE_EQ(f.performance.avgRenderTimes[1], 14.0);
    EXPECT_DOUBLE_EQ(f.performance.avgRenderTimes[2], 14.0);
    EXPECT_DOUBLE_EQ(f.performance.avgRenderTimes[3], 14.0);
    EXPECT_DOUBLE_EQ(f.performance.avgRenderTimes[4], 0.0);
}

TEST(FeatureExtractorTest, ContextSection) {
    FeatureExtractor extractor;
    auto f = extractor.extractFeatures(standardConfig(), realisticUsage());

    // positions: main, main, sidebar, header, footer
    EXPECT_DOUBLE_EQ(f.context.deviceDistribution.desktop, 0.4);
    EXPECT_DOUBLE_EQ(f.context.deviceDistribution.tablet, 0.2);
    EXPECT_DOUBLE_EQ(f.context.deviceDistribution.mobile, 0.2);
    EXPECT_DOUBLE_EQ(f.context.deviceDistribution.other, 0.2);
    EXPECT_NEAR(f.context.userBehavior.engagement, 0.4, 1e-12);
    EXPECT_NEAR(f.context.userBehavior.accessibility, 0.9, 1e-12);
    EXPECT_GT(f.context.userBehavior.performance, 0.0);
    EXPECT_LE(f.context.userBehavior.performance, 1.0);
}

TEST(FeatureExtractorTest, DominantComponentSelectsArchetype) {
    FeatureExtractor extractor;
    std::vector<ComponentUsageData> usage = {
        component("p1", "ProductCard", "main", 5),
        component("p2", "ProductCard", "main", 5),
        component("b1", "Button", "main", 5),
    };

    auto f = extractor.extractFeatures(standardConfig(), usage);
    EXPECT_EQ(f.context.applicationType, "e-commerce");
    EXPECT_EQ(f.context.industry, "retail");

    // below the dominance threshold the set counts as mixed
    usage.push_back(component("b2", "Button", "main", 5));
    usage.push_back(component("i1", "Input", "main", 5));
    f = extractor.extractFeatures(standardConfig(), usage);
    EXPECT_EQ(f.context.applicationType, "general");
}

TEST(FeatureExtractorTest, HeuristicsAreConfigurable) {
    FeatureHeuristics heuristics;
    heuristics.archetypes["Button"] = "dashboard";
    heuristics.positions["main"] = "mobile";
    FeatureExtractor extractor(heuristics);

    std::vector<ComponentUsageData> usage = {component("b1", "Button", "main", 5)};
    auto f = extractor.extractFeatures(standardConfig(), usage);
    EXPECT_EQ(f.context.applicationType, "dashboard");
    EXPECT_EQ(f.context.industry, "technology");
    EXPECT_DOUBLE_EQ(f.context.deviceDistribution.mobile, 1.0);
}

TEST(FeatureExtractorTest, NonFiniteLeavesBecomeZero) {
    FeatureExtractor extractor;
    auto f = extractor.extractFeatures(standardConfig(), realisticUsage());
    f.config.breakpointRatios[0] = std::numeric_limits<double>::quiet_NaN();
    f.config.tokenComplexity = std::numeric_limits<double>::infinity();

    auto v = extractor.featuresToVector(f);
    EXPECT_DOUBLE_EQ(v[1], 0.0);
    EXPECT_DOUBLE_EQ(v[9], 0.0);
}

TEST(FeatureExtractorTest, FeatureNamesMatchLayout) {
    const auto& names = FeatureExtractor::featureNames();
    ASSERT_EQ(names.size(), kFeatureDimension);
    EXPECT_EQ(names[0], "breakpoint_count");
    EXPECT_EQ(names[9], "token_complexity");
    EXPECT_EQ(names.back(), "reserved_127");

    std::set<std::string> unique(names.begin(), names.end());
    EXPECT_EQ(unique.size(), names.size());
}

TEST(FeatureExtractorTest, CategoricalEncodings) {
    EXPECT_DOUBLE_EQ(FeatureExtractor::encodeApplicationType("e-commerce"), 1.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::encodeApplicationType("unknown"), 5.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::encodeIndustry("media"), 3.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::encodeIndustry("unknown"), 8.0);
}
