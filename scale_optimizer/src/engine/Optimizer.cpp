#include "engine/Optimizer.hpp"

#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>
#include <utility>

#include "engine/InputValidator.hpp"
#include "monitor/Logger.hpp"
#include "nn/ModelFactory.hpp"
#include "threadpool/ThreadPool.hpp"
#include "utils/Errors.hpp"

static std::string nowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

static std::shared_ptr<Logger> loggerFor(const OptimizerConfig& config, std::shared_ptr<Logger> log) {
    if (log) return log;
    return std::make_shared<Logger>(parseLogLevel(config.logging.level), config.logging.traceFile);
}

Optimizer::Optimizer(OptimizerConfig config, std::shared_ptr<Logger> log)
    : config_(std::move(config)),
      log_(loggerFor(config_, std::move(log))),
      extractor_(config_.heuristics),
      trainer_(config_, log_),
      engine_(config_.inference, log_),
      suggestions_(log_) {}

Optimizer::~Optimizer() = default;

void Optimizer::requireInitialized() const {
    if (!initialized_.load() || !model_) {
        throw NotInitializedError("AI Optimizer not initialized. Call initialize() first.");
    }
}

// ==========================================================
// Lifecycle
// ==========================================================
void Optimizer::initialize(const std::optional<std::string>& modelPath) {
    try {
        config_.validate();

        std::unique_ptr<TrainableModel> model = modelPath
            ? ModelFactory::load(*modelPath, config_, *log_)
            : ModelFactory::create(config_, *log_);

        if (!pool_) pool_ = std::make_unique<ThreadPool>(config_.threads);

        model_ = std::move(model);
        initialized_.store(true);

        log_->info("Optimizer", "AI Optimizer initialized: " + model_->architecture() + ", " +
                                std::to_string(model_->parameterCount()) + " parameters");
    } catch (const std::exception& e) {
        log_->error("Optimizer", std::string("AI Optimizer initialization failed: ") + e.what());
        throw OptimizerError(std::string("AI Optimizer initialization failed: ") + e.what());
    }
}

ModelInfo Optimizer::getModelInfo() const {
    ModelInfo info;
    info.isInitialized = initialized_.load();
    if (!model_) {
        info.architecture = config_.architecture;
        return info;
    }
    info.architecture = model_->architecture();
    info.parameters = model_->parameterCount();
    info.layers = model_->layerCount();
    return info;
}

// ==========================================================
// Optimisation
// ==========================================================
OptimizationSuggestions Optimizer::optimizeScaling(const ResponsiveConfig& config,
                                                   const std::vector<ComponentUsageData>& usage) const {
    requireInitialized();
    InputValidator::validateOptimizationInput(config, usage);

    auto t0 = std::chrono::steady_clock::now();

    ModelFeatures features = extractor_.extractFeatures(config, usage);
    std::vector<double> vec = extractor_.featuresToVector(features);

    Tensor raw = engine_.predict(*model_, vec);
    ConfidenceEstimate estimate = engine_.getPredictionConfidence(*model_, vec);
    PredictionValidation validation = engine_.validatePrediction(raw, config_.performanceConstraints);
    if (!validation.isValid) {
        log_->debug("Optimizer", std::to_string(validation.violations.size()) +
                                 " raw outputs outside their expected range");
    }

    ProcessedPrediction processed = engine_.postProcessPredictions(
        raw, SuggestionGenerator::constraintsFor(config, config_.performanceConstraints));
    raw.release();

    PredictionComparison comparison =
        engine_.comparePredictions(processed.values, SuggestionGenerator::baselineVector(config, usage));

    double confidence = estimate.confidence * (0.5 + 0.5 * validation.confidence);
    OptimizationSuggestions result = suggestions_.generate(config, usage, processed, confidence, comparison);

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    std::size_t records = 0;
    for (const auto& data : usage) records += data.responsiveValues->size();

    LogEntry e;
    e.timestamp = nowIso8601();
    e.component_count = usage.size();
    e.record_count = records;
    e.token_count = result.suggestedTokens.size();
    e.confidence = result.confidenceScore;
    e.duration_ms = ms;
    e.warnings = result.accessibilityWarnings.size();
    log_->log(e);

    log_->info("Optimizer", "Optimized " + std::to_string(usage.size()) + " components, confidence = " +
                            std::to_string(result.confidenceScore));
    return result;
}

std::vector<OptimizationSuggestions> Optimizer::optimizeBatch(
    const ResponsiveConfig& config, const std::vector<std::vector<ComponentUsageData>>& datasets) const {
    requireInitialized();

    std::vector<std::future<OptimizationSuggestions>> pending;
    pending.reserve(datasets.size());
    for (const auto& usage : datasets) {
        pending.push_back(pool_->submit([this, &config, &usage]() {
            return optimizeScaling(config, usage);
        }));
    }

    // wait for every task before rethrowing so none outlives the inputs
    std::vector<OptimizationSuggestions> results;
    results.reserve(pending.size());
    for (auto& f : pending) f.wait();
    for (auto& f : pending) results.push_back(f.get());
    return results;
}

Explanation Optimizer::explainOptimization(const ResponsiveConfig& config,
                                           const std::vector<ComponentUsageData>& usage) const {
    requireInitialized();
    InputValidator::validateOptimizationInput(config, usage);

    ModelFeatures features = extractor_.extractFeatures(config, usage);
    return engine_.explainPrediction(*model_, extractor_.featuresToVector(features),
                                     FeatureExtractor::featureNames());
}

// ==========================================================
// Training / persistence
// ==========================================================
TrainingMetrics Optimizer::trainModel(const std::vector<TrainingData>& data) {
    if (!initialized_.load() || !model_) throw NotInitializedError("Model not initialized");
    return trainer_.train(*model_, data);
}

TrainingMetrics Optimizer::evaluateModel(const std::vector<TrainingData>& data) const {
    if (!initialized_.load() || !model_) throw NotInitializedError("Model not initialized");
    return trainer_.evaluate(*model_, data);
}

CrossValidationMetrics Optimizer::crossValidateModel(const std::vector<TrainingData>& data, int k) {
    return trainer_.crossValidate([this] { return ModelFactory::create(config_, *log_); }, data, k);
}

HyperparameterAdvice Optimizer::suggestHyperparameters(const std::vector<TrainingData>& data) const {
    return trainer_.suggestHyperparameters(data);
}

void Optimizer::saveModel(const std::string& path) const {
    if (!model_) throw NotInitializedError("No model to save");
    model_->save(path);
    log_->info("Optimizer", "Model saved to " + path);
}

void Optimizer::loadModel(const std::string& path) {
    auto model = ModelFactory::load(path, config_, *log_);
    if (!pool_) pool_ = std::make_unique<ThreadPool>(config_.threads);

    model_ = std::move(model);
    initialized_.store(true);
    log_->info("Optimizer", "Model loaded from " + path);
}

// ==========================================================
// Convenience
// ==========================================================
std::unique_ptr<Optimizer> createOptimizer(const OptimizerConfig& config, std::shared_ptr<Logger> log) {
    auto optimizer = std::make_unique<Optimizer>(config, std::move(log));
    optimizer->initialize();
    return optimizer;
}

OptimizationSuggestions quickOptimize(const ResponsiveConfig& config,
                                      const std::vector<ComponentUsageData>& usage,
                                      const OptimizerConfig& optimizerConfig) {
    auto optimizer = createOptimizer(optimizerConfig);
    return optimizer->optimizeScaling(config, usage);
}
