#pragma once
#include <memory>
#include <vector>

#include "engine/PredictionEngine.hpp"
#include "model/Types.hpp"

class Logger;

// Turns a post-processed prediction into the public suggestion record.
class SuggestionGenerator {
public:
    explicit SuggestionGenerator(std::shared_ptr<Logger> log);

    OptimizationSuggestions generate(const ResponsiveConfig& config,
                                     const std::vector<ComponentUsageData>& usage,
                                     const ProcessedPrediction& prediction,
                                     double confidenceScore,
                                     const PredictionComparison& comparison) const;

    // One token constraint per configured token, plus the given output ranges
    static PostProcessConstraints constraintsFor(const ResponsiveConfig& config,
                                                 const std::vector<RangeConstraint>& performance);

    // Output-layout encoding of the current configuration and observations
    static std::vector<double> baselineVector(const ResponsiveConfig& config,
                                              const std::vector<ComponentUsageData>& usage);

    static std::string severityFor(double improvementPercent);

private:
    std::map<std::string, ScalingToken> suggestTokens(const ResponsiveConfig& config,
                                                      const ProcessedPrediction& prediction) const;

    std::vector<ScalingCurveRecommendation> recommendCurves(const ResponsiveConfig& config,
                                                            const std::vector<ComponentUsageData>& usage,
                                                            const std::map<std::string, ScalingToken>& suggested,
                                                            double confidenceScore) const;

    std::vector<PerformanceImpact> predictImpacts(const std::vector<ComponentUsageData>& usage,
                                                  const ProcessedPrediction& prediction) const;

    std::vector<AccessibilityWarning> checkAccessibility(const ResponsiveConfig& config,
                                                         const std::map<std::string, ScalingToken>& suggested,
                                                         const ProcessedPrediction& prediction) const;

    EstimatedImprovements estimate(const ResponsiveConfig& config,
                                   const std::vector<ComponentUsageData>& usage,
                                   const OptimizationSuggestions& s,
                                   const ProcessedPrediction& prediction,
                                   const PredictionComparison& comparison) const;

    std::shared_ptr<Logger> log_;
};
