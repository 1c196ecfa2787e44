#pragma once
#include <string>
#include <vector>

#include "features/FeatureHeuristics.hpp"
#include "model/Types.hpp"

// Turns a responsive configuration plus usage observations into model features.
// Stateless apart from the heuristic tables; safe to share between threads.
class FeatureExtractor {
public:
    explicit FeatureExtractor(FeatureHeuristics heuristics = FeatureHeuristics());

    // Total: an empty usage list gives zeroed usage/performance sections.
    ModelFeatures extractFeatures(const ResponsiveConfig& config,
                                  const std::vector<ComponentUsageData>& usage) const;

    // Fixed 128-slot flattening; non-finite leaves become 0
    std::vector<double> featuresToVector(const ModelFeatures& features) const;

    // Slot names matching featuresToVector()
    static const std::vector<std::string>& featureNames();

    static double encodeApplicationType(const std::string& type);
    static double encodeIndustry(const std::string& industry);

    const FeatureHeuristics& heuristics() const { return heuristics_; }

private:
    ConfigurationFeatures extractConfiguration(const ResponsiveConfig& config) const;
    UsageFeatures extractUsage(const std::vector<ComponentUsageData>& usage) const;
    PerformanceFeatures extractPerformance(const std::vector<ComponentUsageData>& usage) const;
    ContextFeatures extractContext(const std::vector<ComponentUsageData>& usage) const;

    std::string inferApplicationType(const std::vector<ComponentUsageData>& usage) const;
    std::string inferIndustry(const std::string& applicationType) const;

    FeatureHeuristics heuristics_;
};
