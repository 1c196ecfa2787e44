#pragma once
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// =====================================================
//  Responsive configuration (read-only input)
// =====================================================

struct Breakpoint {
    std::string name;
    double width{};
    double height{};
    std::string alias;
};

// Scaling rule of one design token. Valid when min <= max and step > 0.
struct ScalingToken {
    double scale{1.0};
    double min{0.0};
    double max{0.0};
    double step{1.0};
    std::string curve;      // linear / ease-in / ... (optional)
    std::string unit;       // px / rem / ... (optional)
    std::optional<int> precision;
    bool responsive{true};
};

struct RoundingPolicy {
    std::string mode{"nearest"};
    int precision{2};
};

struct AccessibilityMinimums {
    double minFontSize{12.0};
    double minTapTarget{44.0};
    bool contrastPreservation{true};
};

struct PerformanceFlags {
    bool memoization{true};
    std::string cacheStrategy{"memory"};
    bool precomputeValues{false};
};

struct ScalingStrategy {
    std::string origin{"width"};   // width | height | min | max | diagonal | area
    std::string mode{"linear"};    // linear | exponential | logarithmic | golden-ratio | custom
    std::map<std::string, ScalingToken> tokens;
    RoundingPolicy rounding;
    AccessibilityMinimums accessibility;
    PerformanceFlags performance;
};

struct ResponsiveConfig {
    Breakpoint base;
    std::vector<Breakpoint> breakpoints;
    std::optional<ScalingStrategy> strategy;   // absent = malformed
};

// =====================================================
//  Component usage observations
// =====================================================

struct ResponsiveValueUsage {
    std::string property;
    double baseValue{};
    std::string token;
    std::map<std::string, double> breakpointValues;
    double usageFrequency{};
    std::optional<double> satisfactionScore;
};

struct PerformanceMetrics {
    std::optional<double> renderTime;     // ms
    std::optional<double> layoutShift;    // CLS score
    std::optional<double> memoryUsage;    // bytes
    std::optional<double> bundleSize;     // bytes
};

struct InteractionData {
    std::optional<double> interactionRate;
    std::optional<double> viewTime;       // ms
    std::string scrollBehavior{"normal"}; // smooth | jumpy | normal
    std::optional<double> accessibilityScore;
};

struct ComponentContext {
    std::optional<std::string> parent;
    std::vector<std::string> children;
    std::string position{"main"};         // header | main | sidebar | footer | modal | other
    std::string importance{"secondary"};  // primary | secondary | tertiary
};

struct ComponentUsageData {
    std::string componentId;
    std::string componentType;
    std::optional<std::vector<ResponsiveValueUsage>> responsiveValues;  // absent = malformed
    PerformanceMetrics performance;
    InteractionData interactions;
    ComponentContext context;
};

// =====================================================
//  Model features
// =====================================================

constexpr std::size_t kFeatureDimension = 128;
constexpr std::size_t kOutputDimension  = 32;
constexpr std::size_t kBreakpointSlots  = 8;
constexpr std::size_t kCommonValueSlots = 10;

struct ConfigurationFeatures {
    double breakpointCount{};
    std::array<double, kBreakpointSlots> breakpointRatios{};
    double tokenComplexity{};
    // width, height, min, max, diagonal, area
    std::array<double, 6> originDistribution{};
};

struct UsageFeatures {
    std::array<double, kCommonValueSlots> commonValues{};
    std::map<std::string, std::vector<double>> valueDistributions;  // token -> base values
    std::map<std::string, double> componentFrequencies;             // type -> share
    std::map<std::string, double> propertyPatterns;                 // property -> count
};

using StatSummary = std::array<double, 5>;  // mean, median, min, max, stddev

struct PerformanceFeatures {
    StatSummary avgRenderTimes{};
    StatSummary bundleSizes{};
    StatSummary memoryPatterns{};
    StatSummary layoutShiftFreq{};
};

struct DeviceDistribution {
    double desktop{};
    double tablet{};
    double mobile{};
    double other{};
};

struct UserBehavior {
    double engagement{};
    double accessibility{};
    double performance{};
};

struct ContextFeatures {
    std::string applicationType{"general"};
    DeviceDistribution deviceDistribution;
    UserBehavior userBehavior;
    std::string industry{"general"};
};

struct ModelFeatures {
    ConfigurationFeatures config;
    UsageFeatures usage;
    PerformanceFeatures performance;
    ContextFeatures context;
};

// =====================================================
//  Training data
// =====================================================

struct ModelLabels {
    std::map<std::string, ScalingToken> optimalTokens;
    std::map<std::string, double> performanceScores;    // renderTime, bundleSize, memoryUsage, layoutShift
    std::vector<double> satisfactionRatings;
    std::map<std::string, double> accessibilityScores;  // minFontSize, minTapTarget
};

struct TrainingMetadata {
    std::string timestamp;
    std::string source;
    double qualityScore{};
    std::size_t sampleSize{};
    std::string region;
};

struct TrainingData {
    ModelFeatures features;
    ModelLabels labels;
    TrainingMetadata metadata;
};

struct TrainingMetrics {
    double accuracy{};
    double precision{};
    double recall{};
    double f1Score{};
    double mse{};
    std::map<std::string, std::pair<double, double>> confidenceIntervals;
};

// Mean and population std of the per-fold validation metrics
struct CrossValidationMetrics {
    double meanAccuracy{};
    double meanPrecision{};
    double meanRecall{};
    double meanF1Score{};
    double meanMSE{};
    double stdAccuracy{};
    double stdPrecision{};
    double stdRecall{};
    double stdF1Score{};
    double stdMSE{};
    std::vector<TrainingMetrics> folds;   // completed folds only
};

template <typename T>
struct HyperparameterSuggestion {
    T current{};
    T suggested{};
    std::string reason;
};

struct HyperparameterAdvice {
    HyperparameterSuggestion<double> learningRate;
    HyperparameterSuggestion<int> batchSize;
    HyperparameterSuggestion<int> epochs;
    HyperparameterSuggestion<std::string> architecture;
};

// =====================================================
//  Optimization output
// =====================================================

struct ScalingCurveRecommendation {
    std::string token;
    std::string mode;
    double scale{};
    std::map<std::string, double> breakpointAdjustments;
    double confidence{};
    std::string reasoning;
};

struct PerformanceImpact {
    std::string aspect;    // bundle-size | render-time | memory | layout-shift
    double currentValue{};
    double predictedValue{};
    double improvementPercent{};
    std::string severity;  // low | medium | high | critical
};

struct AccessibilityWarning {
    std::string type;      // font-size | tap-target | contrast | spacing | motion
    double currentValue{};
    double recommendedValue{};
    std::string wcagReference;
    std::string severity;  // AA | AAA | best-practice
    std::string description;
};

struct EstimatedImprovements {
    struct Performance {
        double renderTime{};
        double bundleSize{};
        double memoryUsage{};
        double layoutShift{};
    } performance;
    struct UserExperience {
        double interactionRate{};
        double accessibilityScore{};
        double visualHierarchy{};
    } userExperience;
    struct DeveloperExperience {
        double codeReduction{};
        double maintenanceEffort{};
        double debuggingTime{};
    } developerExperience;
    double overall{};
};

struct OptimizationSuggestions {
    std::map<std::string, ScalingToken> suggestedTokens;
    std::vector<ScalingCurveRecommendation> scalingCurveRecommendations;
    std::vector<PerformanceImpact> performanceImpacts;
    std::vector<AccessibilityWarning> accessibilityWarnings;
    double confidenceScore{};
    EstimatedImprovements estimatedImprovements;
};

struct ModelInfo {
    std::string architecture;
    std::size_t parameters{};
    std::size_t layers{};
    bool isInitialized{false};
};

// Token order of the model's output layout
const std::vector<std::string>& canonicalTokens();

// Names of the non-token model outputs (slots 24..31)
const std::vector<std::string>& outputTailNames();

// All 32 output names: <token>_scale/_min/_max/_step, then the tail
const std::vector<std::string>& outputNames();
