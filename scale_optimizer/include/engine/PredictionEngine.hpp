#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "model/Types.hpp"
#include "nn/Model.hpp"
#include "utils/Config.hpp"

class Logger;

struct ConfidenceEstimate {
    std::vector<double> mean;
    std::vector<double> variance;
    double confidence{};   // [0, 1], falls as variance grows
};

struct FeatureImportance {
    std::string name;
    double importance{};
};

struct Explanation {
    std::map<std::string, double> featureImportance;   // sums to 1 unless all zero
    std::vector<FeatureImportance> topFeatures;        // importance desc, then name
};

struct PredictionValidation {
    bool isValid{true};
    std::vector<std::string> violations;
    double confidence{1.0};
};

struct TokenConstraint {
    std::string name;
    double min{};
    double max{};
    double step{1.0};
};

struct PostProcessConstraints {
    std::vector<TokenConstraint> tokens;
    std::vector<RangeConstraint> performance;
};

struct ProcessedPrediction {
    std::map<std::string, ScalingToken> tokens;
    std::map<std::string, double> performance;
    std::vector<double> values;   // full output with processed slots written back
};

struct PredictionComparison {
    std::map<std::string, double> improvements;   // percent
    std::map<std::string, double> regressions;    // percent
    double overallImprovement{};
};

// Inference on top of a PredictiveModel. Holds no per-call state.
class PredictionEngine {
public:
    PredictionEngine(const InferenceConfig& config, std::shared_ptr<Logger> log);

    // features: one 128-slot vector. Returns 1 x outputSize().
    Tensor predict(const Model& model, const std::vector<double>& features) const;
    Tensor predictBatch(const Model& model, const std::vector<std::vector<double>>& batch) const;

    // numSamples <= 0 uses the configured sample count
    ConfidenceEstimate getPredictionConfidence(const Model& model, const std::vector<double>& features,
                                               int numSamples = 0) const;

    // Occlusion sensitivity: zero one slot at a time and measure the output shift
    Explanation explainPrediction(const Model& model, const std::vector<double>& features,
                                  const std::vector<std::string>& featureNames, int topN = 0) const;

    // Range names refer to outputNames()
    PredictionValidation validatePrediction(const Tensor& prediction,
                                            const std::vector<RangeConstraint>& expectedRanges) const;

    ProcessedPrediction postProcessPredictions(const Tensor& raw, const PostProcessConstraints& constraints) const;

    PredictionComparison comparePredictions(const std::vector<double>& optimized,
                                            const std::vector<double>& baseline) const;

private:
    static const PredictiveModel& requirePredictive(const Model& model);

    InferenceConfig config_;
    std::shared_ptr<Logger> log_;
};
