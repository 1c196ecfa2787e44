#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/ModelTrainer.hpp"
#include "engine/PredictionEngine.hpp"
#include "engine/SuggestionGenerator.hpp"
#include "features/FeatureExtractor.hpp"
#include "model/Types.hpp"
#include "nn/Model.hpp"
#include "utils/Config.hpp"

class Logger;
class ThreadPool;

// Owns the model lifecycle and composes extraction, inference and
// post-processing into the public operations.
//
// optimizeScaling / optimizeBatch / evaluateModel / explainOptimization only
// read the model and may run concurrently. trainModel and loadModel mutate it
// and must not overlap with any other call on the same instance.
class Optimizer {
public:
    explicit Optimizer(OptimizerConfig config = OptimizerConfig(), std::shared_ptr<Logger> log = nullptr);
    ~Optimizer();

    Optimizer(const Optimizer&) = delete;
    Optimizer& operator=(const Optimizer&) = delete;

    // Builds the configured model, or restores it from modelPath
    void initialize(const std::optional<std::string>& modelPath = std::nullopt);
    bool isInitialized() const { return initialized_.load(); }

    OptimizationSuggestions optimizeScaling(const ResponsiveConfig& config,
                                            const std::vector<ComponentUsageData>& usage) const;

    // Independent optimizeScaling calls on the worker pool, results in input order
    std::vector<OptimizationSuggestions> optimizeBatch(
        const ResponsiveConfig& config, const std::vector<std::vector<ComponentUsageData>>& datasets) const;

    Explanation explainOptimization(const ResponsiveConfig& config,
                                    const std::vector<ComponentUsageData>& usage) const;

    TrainingMetrics trainModel(const std::vector<TrainingData>& data);
    TrainingMetrics evaluateModel(const std::vector<TrainingData>& data) const;

    // Trains k fresh models of the configured architecture; the held model is untouched
    CrossValidationMetrics crossValidateModel(const std::vector<TrainingData>& data, int k = 5);
    HyperparameterAdvice suggestHyperparameters(const std::vector<TrainingData>& data) const;

    void saveModel(const std::string& path) const;
    void loadModel(const std::string& path);

    ModelInfo getModelInfo() const;

    const OptimizerConfig& config() const { return config_; }

private:
    void requireInitialized() const;

    OptimizerConfig config_;
    std::shared_ptr<Logger> log_;

    FeatureExtractor extractor_;
    ModelTrainer trainer_;
    PredictionEngine engine_;
    SuggestionGenerator suggestions_;

    std::unique_ptr<TrainableModel> model_;
    std::atomic<bool> initialized_{false};

    std::unique_ptr<ThreadPool> pool_;
};

// Initialised optimizer; throws if initialisation fails
std::unique_ptr<Optimizer> createOptimizer(const OptimizerConfig& config = OptimizerConfig(),
                                           std::shared_ptr<Logger> log = nullptr);

// One-shot helper for stateless callers: build, initialise, optimise
OptimizationSuggestions quickOptimize(const ResponsiveConfig& config,
                                      const std::vector<ComponentUsageData>& usage,
                                      const OptimizerConfig& optimizerConfig = OptimizerConfig());
