#include "engine/ModelTrainer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "monitor/Logger.hpp"
#include "utils/Errors.hpp"
#include "utils/Stats.hpp"

namespace {

constexpr double kAccuracyTolerance = 0.1;
constexpr double kZ95 = 1.96;
constexpr double kEps = 1e-6;

// Label defaults for tokens missing from a training record
constexpr double kDefaultScale = 0.85;
constexpr double kDefaultMin = 8.0;
constexpr double kDefaultMax = 100.0;
constexpr double kDefaultStep = 1.0;
constexpr double kDefaultSatisfaction = 0.5;
constexpr double kDefaultMinFontSize = 16.0;
constexpr double kDefaultMinTapTarget = 44.0;

// Hyperparameter advice thresholds
constexpr std::size_t kSmallDataset = 100;
constexpr std::size_t kTinyDataset = 50;
constexpr std::size_t kLargeBatchDataset = 5000;
constexpr std::size_t kLargeDataset = 10000;
constexpr double kMaxSmallLearningRate = 0.01;
constexpr double kMaxLargeLearningRate = 0.1;
constexpr int kMinBatchSize = 8;
constexpr int kMaxBatchSize = 128;
constexpr int kMaxEpochs = 500;
constexpr int kMinEpochs = 50;
constexpr std::size_t kHighDimensional = 50;
constexpr std::size_t kLowDimensional = 10;

Tensor sliceRows(const Tensor& t, std::size_t begin, std::size_t end) {
    const auto& d = t.data();
    std::vector<float> out(d.begin() + begin * t.cols(), d.begin() + end * t.cols());
    return Tensor(end - begin, t.cols(), std::move(out));
}

double sane(double v) {
    if (!std::isfinite(v)) return 0.0;
    return stats::clamp(v, 0.0, 1.0);
}

double lookup(const std::map<std::string, double>& m, const std::string& key, double fallback) {
    auto it = m.find(key);
    return it != m.end() ? it->second : fallback;
}

std::string fmt(double v) {
    std::ostringstream os;
    os.precision(4);
    os << v;
    return os.str();
}

}  // namespace

ModelTrainer::ModelTrainer(const OptimizerConfig& config, std::shared_ptr<Logger> log)
    : training_(config.training),
      architecture_(config.architecture),
      extractor_(config.heuristics),
      log_(std::move(log)) {
    if (!log_) log_ = Logger::silent();
}

// ==========================================================
// Data preparation
// ==========================================================
std::vector<double> ModelTrainer::labelsToVector(const ModelLabels& labels) {
    std::vector<double> v;
    v.reserve(kOutputDimension);

    for (const auto& name : canonicalTokens()) {
        auto it = labels.optimalTokens.find(name);
        if (it == labels.optimalTokens.end()) {
            v.insert(v.end(), {kDefaultScale, kDefaultMin, kDefaultMax, kDefaultStep});
            continue;
        }
        const ScalingToken& t = it->second;
        v.push_back(t.scale);
        v.push_back(t.min);
        v.push_back(t.max);
        v.push_back(t.step > 0.0 ? t.step : kDefaultStep);
    }

    for (const char* name : {"renderTime", "bundleSize", "memoryUsage", "layoutShift"}) {
        v.push_back(lookup(labels.performanceScores, name, 0.0));
    }

    if (labels.satisfactionRatings.empty()) {
        v.push_back(kDefaultSatisfaction);
        v.push_back(0.0);
    } else {
        v.push_back(stats::mean(labels.satisfactionRatings));
        v.push_back(stats::stddev(labels.satisfactionRatings));
    }

    v.push_back(lookup(labels.accessibilityScores, "minFontSize", kDefaultMinFontSize));
    v.push_back(lookup(labels.accessibilityScores, "minTapTarget", kDefaultMinTapTarget));

    v.resize(kOutputDimension, 0.0);
    return v;
}

void ModelTrainer::prepare(const std::vector<TrainingData>& data, Tensor& x, Tensor& y) const {
    std::vector<std::vector<double>> xs, ys;
    xs.reserve(data.size());
    ys.reserve(data.size());
    for (const auto& record : data) {
        xs.push_back(extractor_.featuresToVector(record.features));
        ys.push_back(labelsToVector(record.labels));
    }
    x = Tensor::fromRows(xs);
    y = Tensor::fromRows(ys);
}

// ==========================================================
// Training
// ==========================================================
TrainingMetrics ModelTrainer::train(TrainableModel& model, const std::vector<TrainingData>& data) {
    if (data.empty()) {
        throw ValidationError("Training data is required and must be a non-empty array");
    }

    try {
        Tensor x, y;
        prepare(data, x, y);
        return train(model, x, y);
    } catch (const OptimizerError&) {
        throw;
    } catch (const std::exception& e) {
        throw TrainingError(std::string("Training failed: ") + e.what());
    }
}

TrainingMetrics ModelTrainer::train(TrainableModel& model, const Tensor& x, const Tensor& y) {
    if (x.rows() == 0) {
        throw ValidationError("Training data is required and must be a non-empty array");
    }
    if (x.cols() != model.inputSize() || y.cols() != model.outputSize() || x.rows() != y.rows()) {
        throw TrainingError("Training failed: expected " + std::to_string(model.inputSize()) + " features and " +
                            std::to_string(model.outputSize()) + " labels per row, got " +
                            std::to_string(x.cols()) + " and " + std::to_string(y.cols()) + " (" +
                            std::to_string(x.rows()) + " vs " + std::to_string(y.rows()) + " rows)");
    }

    try {
        const std::size_t n = x.rows();
        std::size_t valCount = static_cast<std::size_t>(std::floor(n * training_.validationSplit));
        std::size_t trainCount = n - valCount;
        if (trainCount == 0) {
            trainCount = n;
            valCount = 0;
        }

        Tensor xt = valCount ? sliceRows(x, 0, trainCount) : x;
        Tensor yt = valCount ? sliceRows(y, 0, trainCount) : y;
        Tensor xv = valCount ? sliceRows(x, trainCount, n) : Tensor();
        Tensor yv = valCount ? sliceRows(y, trainCount, n) : Tensor();

        log_->info("ModelTrainer", "Training " + model.architecture() + " on " + std::to_string(trainCount) +
                                   " samples (" + std::to_string(valCount) + " validation), " +
                                   std::to_string(training_.epochs) + " epochs");

        FitOptions opts;
        opts.epochs = 1;
        opts.batchSize = training_.batchSize;
        opts.learningRate = training_.learningRate;
        opts.l2 = training_.l2;
        opts.shuffle = training_.shuffle;
        opts.seed = training_.seed;

        for (int epoch = 1; epoch <= training_.epochs; ++epoch) {
            FitHistory h = model.fit(xt, yt, opts);
            double loss = h.loss.empty() ? 0.0 : h.loss.back();

            if (epoch % 10 != 0 && epoch != training_.epochs) continue;

            std::string line = "Epoch " + std::to_string(epoch) + ": loss = " + fmt(loss);
            if (valCount) {
                double trainLoss = normalizedLoss(model, xt, yt);
                double valLoss = normalizedLoss(model, xv, yv);
                line += ", val_loss = " + fmt(valLoss);
                if (epoch > 20 && valLoss > trainLoss * 1.5) {
                    log_->warn("ModelTrainer", "Possible overfitting at epoch " + std::to_string(epoch) +
                                               " (val_loss " + fmt(valLoss) + " > 1.5 x " + fmt(trainLoss) + ")");
                }
            }
            log_->debug("ModelTrainer", line);
        }

        TrainingMetrics metrics = valCount ? evaluate(model, xv, yv) : evaluate(model, xt, yt);
        log_->info("ModelTrainer", "Training completed: accuracy = " + fmt(metrics.accuracy) +
                                   ", f1 = " + fmt(metrics.f1Score) + ", mse = " + fmt(metrics.mse));
        return metrics;
    } catch (const OptimizerError&) {
        throw;
    } catch (const std::exception& e) {
        throw TrainingError(std::string("Training failed: ") + e.what());
    }
}

double ModelTrainer::normalizedLoss(const PredictiveModel& model, const Tensor& x, const Tensor& y) const {
    return computeMetrics(model.predict(x), y).mse;
}

// ==========================================================
// Evaluation
// ==========================================================
TrainingMetrics ModelTrainer::evaluate(const PredictiveModel& model, const std::vector<TrainingData>& data) const {
    if (data.empty()) {
        throw ValidationError("Evaluation data is required and must be a non-empty array");
    }

    try {
        Tensor x, y;
        prepare(data, x, y);
        return evaluate(model, x, y);
    } catch (const OptimizerError&) {
        throw;
    } catch (const std::exception& e) {
        throw TrainingError(std::string("Evaluation failed: ") + e.what());
    }
}

TrainingMetrics ModelTrainer::evaluate(const PredictiveModel& model, const Tensor& x, const Tensor& y) const {
    if (x.rows() == 0 || x.rows() != y.rows() || y.cols() != model.outputSize()) {
        throw TrainingError("Evaluation failed: feature/label dimensions do not match the model");
    }

    try {
        Tensor predictions = model.predict(x);
        return computeMetrics(predictions, y);
    } catch (const OptimizerError&) {
        throw;
    } catch (const std::exception& e) {
        throw TrainingError(std::string("Evaluation failed: ") + e.what());
    }
}

// ==========================================================
// Cross validation
// ==========================================================
CrossValidationMetrics ModelTrainer::crossValidate(
    const std::function<std::unique_ptr<TrainableModel>()>& makeModel, const std::vector<TrainingData>& data, int k) {
    if (k < 1) {
        throw ValidationError("Cross validation needs at least one fold");
    }
    if (data.size() < static_cast<std::size_t>(k)) {
        throw ValidationError("Insufficient data for " + std::to_string(k) + "-fold cross validation. Need at least " +
                              std::to_string(k) + " samples.");
    }

    const std::size_t folds = static_cast<std::size_t>(k);
    const std::size_t foldSize = data.size() / folds;

    CrossValidationMetrics result;
    for (std::size_t i = 0; i < folds; ++i) {
        std::size_t begin = i * foldSize;
        std::size_t end = i + 1 == folds ? data.size() : begin + foldSize;

        std::vector<TrainingData> holdout(data.begin() + begin, data.begin() + end);
        std::vector<TrainingData> fitSet;
        fitSet.reserve(data.size() - holdout.size());
        fitSet.insert(fitSet.end(), data.begin(), data.begin() + begin);
        fitSet.insert(fitSet.end(), data.begin() + end, data.end());
        if (fitSet.empty()) continue;

        try {
            std::unique_ptr<TrainableModel> model = makeModel();
            train(*model, fitSet);
            result.folds.push_back(evaluate(*model, holdout));
        } catch (const TrainingError& e) {
            log_->warn("ModelTrainer", "Fold " + std::to_string(i + 1) + " failed: " + e.what());
        }
    }

    if (result.folds.empty()) {
        log_->warn("ModelTrainer", "All cross-validation folds failed, returning default metrics");
        return result;
    }

    auto collect = [&](double TrainingMetrics::*field) {
        std::vector<double> values;
        values.reserve(result.folds.size());
        for (const auto& m : result.folds) values.push_back(m.*field);
        return values;
    };
    auto acc = collect(&TrainingMetrics::accuracy);
    auto prec = collect(&TrainingMetrics::precision);
    auto rec = collect(&TrainingMetrics::recall);
    auto f1 = collect(&TrainingMetrics::f1Score);
    auto mse = collect(&TrainingMetrics::mse);

    result.meanAccuracy = stats::mean(acc);
    result.meanPrecision = stats::mean(prec);
    result.meanRecall = stats::mean(rec);
    result.meanF1Score = stats::mean(f1);
    result.meanMSE = stats::mean(mse);
    result.stdAccuracy = stats::stddev(acc);
    result.stdPrecision = stats::stddev(prec);
    result.stdRecall = stats::stddev(rec);
    result.stdF1Score = stats::stddev(f1);
    result.stdMSE = stats::stddev(mse);

    log_->info("ModelTrainer", std::to_string(result.folds.size()) + "/" + std::to_string(folds) +
                               " folds: accuracy = " + fmt(result.meanAccuracy) + " +/- " + fmt(result.stdAccuracy));
    return result;
}

// ==========================================================
// Hyperparameter advice
// ==========================================================
HyperparameterAdvice ModelTrainer::suggestHyperparameters(const std::vector<TrainingData>& data) const {
    const std::size_t n = data.size();
    HyperparameterAdvice advice;

    auto& lr = advice.learningRate;
    lr.current = lr.suggested = training_.learningRate;
    lr.reason = "Current learning rate is appropriate";
    if (n < kSmallDataset) {
        lr.suggested = std::min(training_.learningRate * 0.5, kMaxSmallLearningRate);
        lr.reason = "Reduced learning rate for small dataset to prevent overfitting";
    } else if (n > kLargeDataset) {
        lr.suggested = std::min(training_.learningRate * 1.5, kMaxLargeLearningRate);
        lr.reason = "Increased learning rate for large dataset to speed up convergence";
    }

    auto& batch = advice.batchSize;
    batch.current = batch.suggested = training_.batchSize;
    batch.reason = "Current batch size is appropriate";
    if (n < kTinyDataset) {
        batch.suggested = std::max(training_.batchSize / 2, kMinBatchSize);
        batch.reason = "Reduced batch size for very small dataset";
    } else if (n > kLargeBatchDataset) {
        batch.suggested = std::min(training_.batchSize * 2, kMaxBatchSize);
        batch.reason = "Increased batch size for large dataset to improve training stability";
    }

    auto& epochs = advice.epochs;
    epochs.current = epochs.suggested = training_.epochs;
    epochs.reason = "Current epoch count is appropriate";
    if (n < kSmallDataset) {
        epochs.suggested = std::min(training_.epochs * 2, kMaxEpochs);
        epochs.reason = "Increased epochs for small dataset to ensure convergence";
    } else if (n > kLargeDataset) {
        epochs.suggested = std::max(training_.epochs / 2, kMinEpochs);
        epochs.reason = "Reduced epochs for large dataset to prevent overfitting";
    }

    // populated slots of the first example's encoded features
    std::size_t featureCount = 0;
    if (!data.empty()) {
        for (double v : extractor_.featuresToVector(data.front().features)) {
            if (v != 0.0) ++featureCount;
        }
    }

    auto& arch = advice.architecture;
    arch.current = arch.suggested = architecture_;
    arch.reason = "Current architecture is appropriate";
    if (featureCount > kHighDimensional) {
        arch.suggested = "neural-network";
        arch.reason = "Neural network architecture recommended for high-dimensional features";
    } else if (featureCount < kLowDimensional) {
        arch.suggested = "neural-network";
        arch.reason = "Neural network architecture sufficient for low-dimensional features";
    }
    return advice;
}

TrainingMetrics ModelTrainer::computeMetrics(const Tensor& predictions, const Tensor& labels) {
    if (predictions.rows() != labels.rows() || predictions.cols() != labels.cols()) {
        throw TrainingError("Evaluation failed: prediction shape does not match labels");
    }

    const std::size_t rows = labels.rows();
    const std::size_t cols = labels.cols();
    const auto& p = predictions.data();
    const auto& l = labels.data();

    // per-column min-max normalisation of the labels, applied to both sides
    std::vector<double> lo(cols), denom(cols);
    for (std::size_t c = 0; c < cols; ++c) {
        double mn = l[c], mx = l[c];
        for (std::size_t r = 1; r < rows; ++r) {
            mn = std::min(mn, static_cast<double>(l[r * cols + c]));
            mx = std::max(mx, static_cast<double>(l[r * cols + c]));
        }
        lo[c] = mn;
        denom[c] = (mx - mn) >= kEps ? (mx - mn) : std::max(std::fabs(mn), 1.0);
    }

    std::vector<double> pn(rows * cols), ln(rows * cols);
    std::size_t within = 0;
    double absSum = 0.0, sqSum = 0.0, labelMax = 0.0;

    for (std::size_t i = 0; i < rows * cols; ++i) {
        std::size_t c = i % cols;
        pn[i] = (p[i] - lo[c]) / denom[c];
        ln[i] = (l[i] - lo[c]) / denom[c];
        if (!std::isfinite(pn[i])) pn[i] = 0.0;

        double diff = pn[i] - ln[i];
        if (std::fabs(diff) <= kAccuracyTolerance) ++within;
        absSum += std::fabs(diff);
        sqSum += diff * diff;
        labelMax = std::max(labelMax, ln[i]);
    }

    const double count = static_cast<double>(rows * cols);
    TrainingMetrics m;
    m.accuracy = sane(within / count);

    double mae = absSum / count;
    m.precision = sane(1.0 - mae / (labelMax > kEps ? labelMax : 1.0));
    m.recall = sane(std::fabs(stats::correlation(pn, ln)));
    m.f1Score = (m.precision + m.recall) > 0.0
                    ? sane(2.0 * m.precision * m.recall / (m.precision + m.recall))
                    : 0.0;

    m.mse = sqSum / count;
    if (!std::isfinite(m.mse)) m.mse = 0.0;

    double margin = kZ95 * std::sqrt(m.mse);
    m.confidenceIntervals["prediction"] = {-margin, margin};
    m.confidenceIntervals["performance"] = {-margin * 0.5, margin * 0.5};
    m.confidenceIntervals["accessibility"] = {-margin * 0.3, margin * 0.3};
    return m;
}
