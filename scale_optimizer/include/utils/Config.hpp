#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "features/FeatureHeuristics.hpp"

struct TrainingConfig {
    int epochs = 100;
    int batchSize = 32;
    double learningRate = 0.001;
    double validationSplit = 0.2;
    double l2 = 0.001;
    std::uint32_t seed = 42;
    bool shuffle = true;
};

struct NetworkConfig {
    std::vector<int> hiddenUnits = {256, 128, 64};
    std::vector<double> dropout = {0.2, 0.1, 0.0};
};

struct InferenceConfig {
    int confidenceSamples = 10;
    std::uint32_t seed = 1337;
    int topFeatures = 10;
};

struct RangeConstraint {
    std::string name;
    double min;
    double max;
};

struct LoggingConfig {
    std::string level = "info";
    std::string traceFile;
};

class OptimizerConfig {
public:
    std::string architecture = "neural-network";
    TrainingConfig training;
    NetworkConfig network;
    std::string normalization = "standard";
    InferenceConfig inference;
    FeatureHeuristics heuristics;
    LoggingConfig logging;
    int threads = 4;

    // Ranges for model outputs after the token block, in output order
    std::vector<RangeConstraint> performanceConstraints = {
        {"renderTime", -0.5, 0.9},
        {"bundleSize", -0.5, 0.9},
        {"memoryUsage", -0.5, 0.9},
        {"layoutShift", -0.5, 0.9},
        {"satisfaction_mean", 0.0, 1.0},
        {"satisfaction_std", 0.0, 0.5},
        {"accessibility_fontSize", 8.0, 48.0},
        {"accessibility_tapTarget", 24.0, 96.0},
    };

    OptimizerConfig() = default;

    // Loads from a JSON file. A missing or malformed file keeps the defaults.
    explicit OptimizerConfig(const std::string& path);

    static OptimizerConfig fromJson(const nlohmann::json& j);

    // Throws ValidationError on out-of-range settings
    void validate() const;
};
