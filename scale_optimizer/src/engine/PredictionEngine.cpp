#include "engine/PredictionEngine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "monitor/Logger.hpp"
#include "utils/Errors.hpp"
#include "utils/Stats.hpp"

namespace {

constexpr double kMinScale = 0.1;
constexpr double kMaxScale = 2.0;
constexpr double kGridEps = 1e-9;

// Nearest point of the grid cmin + k*step that lies inside [cmin, cmax]
double snapToGrid(double x, double cmin, double cmax, double step) {
    if (!std::isfinite(x)) return cmin;
    x = stats::clamp(x, cmin, cmax);
    double k = std::round((x - cmin) / step);
    double v = cmin + k * step;
    if (v > cmax + kGridEps) v = cmin + (k - 1.0) * step;
    if (v < cmin) v = cmin;
    return v;
}

// Largest divisor of n (n >= 1) that does not exceed cap (cap >= 1)
long long largestDivisorAtMost(long long n, long long cap) {
    if (n % cap == 0) return cap;
    long long best = 1;
    for (long long i = 2; i <= n / i; ++i) {
        if (n % i != 0) continue;
        if (i <= cap) best = std::max(best, i);
        long long pair = n / i;
        if (pair <= cap) best = std::max(best, pair);
    }
    return best;
}

std::size_t indexOf(const std::vector<std::string>& names, const std::string& name) {
    auto it = std::find(names.begin(), names.end(), name);
    return it == names.end() ? names.size() : static_cast<std::size_t>(it - names.begin());
}

const std::vector<std::string>& performanceOutputs() {
    static const std::vector<std::string> names = {"renderTime", "bundleSize", "memoryUsage", "layoutShift"};
    return names;
}

}  // namespace

PredictionEngine::PredictionEngine(const InferenceConfig& config, std::shared_ptr<Logger> log)
    : config_(config), log_(std::move(log)) {
    if (!log_) log_ = Logger::silent();
}

const PredictiveModel& PredictionEngine::requirePredictive(const Model& model) {
    auto* predictive = dynamic_cast<const PredictiveModel*>(&model);
    if (!predictive) throw InferenceError("Invalid model: missing predict method");
    return *predictive;
}

// ==========================================================
// Inference
// ==========================================================
Tensor PredictionEngine::predict(const Model& model, const std::vector<double>& features) const {
    const PredictiveModel& predictive = requirePredictive(model);
    try {
        Tensor input = Tensor::fromRow(features);
        return predictive.predict(input);
    } catch (const std::exception& e) {
        log_->error("PredictionEngine", std::string("Prediction failed: ") + e.what());
        throw InferenceError(std::string("Prediction failed: ") + e.what());
    }
}

Tensor PredictionEngine::predictBatch(const Model& model, const std::vector<std::vector<double>>& batch) const {
    const PredictiveModel& predictive = requirePredictive(model);
    try {
        if (batch.empty()) throw std::invalid_argument("empty batch");
        Tensor input = Tensor::fromRows(batch);
        return predictive.predict(input);
    } catch (const std::exception& e) {
        log_->error("PredictionEngine", std::string("Batch prediction failed: ") + e.what());
        throw InferenceError(std::string("Batch prediction failed: ") + e.what());
    }
}

ConfidenceEstimate PredictionEngine::getPredictionConfidence(const Model& model,
                                                             const std::vector<double>& features,
                                                             int numSamples) const {
    const PredictiveModel& predictive = requirePredictive(model);
    const int samples = std::max(2, numSamples > 0 ? numSamples : config_.confidenceSamples);

    std::vector<std::vector<double>> draws;
    draws.reserve(samples);
    try {
        Tensor input = Tensor::fromRow(features);
        for (int i = 0; i < samples; ++i) {
            InferenceOptions opts;
            opts.stochastic = true;
            opts.seed = config_.seed + static_cast<std::uint32_t>(i);
            Tensor out = predictive.predict(input, opts);
            const auto& d = out.data();
            draws.emplace_back(d.begin(), d.end());
        }
    } catch (const std::exception& e) {
        throw InferenceError(std::string("Prediction failed: ") + e.what());
    }

    const std::size_t width = draws.front().size();
    ConfidenceEstimate est;
    est.mean.assign(width, 0.0);
    est.variance.assign(width, 0.0);

    double relVar = 0.0;
    std::vector<double> column(samples);
    for (std::size_t j = 0; j < width; ++j) {
        for (int i = 0; i < samples; ++i) column[i] = draws[i][j];
        est.mean[j] = stats::mean(column);
        est.variance[j] = stats::variance(column);
        relVar += est.variance[j] / (est.mean[j] * est.mean[j] + 1.0);
    }
    relVar = width ? relVar / width : 0.0;

    double confidence = 1.0 / (1.0 + relVar);
    est.confidence = std::isfinite(confidence) ? stats::clamp(confidence, 0.0, 1.0) : 0.0;
    return est;
}

// ==========================================================
// Explanation
// ==========================================================
Explanation PredictionEngine::explainPrediction(const Model& model, const std::vector<double>& features,
                                                const std::vector<std::string>& featureNames, int topN) const {
    if (!dynamic_cast<const PredictiveModel*>(&model)) {
        throw ExplanationError("Invalid model: missing predict capability");
    }
    if (features.empty()) {
        throw ExplanationError("Explanation failed: empty feature vector");
    }

    Tensor baseline = predict(model, features);
    const std::vector<float> base = baseline.data();
    baseline.release();

    std::vector<std::vector<double>> occluded(features.size(), features);
    for (std::size_t j = 0; j < features.size(); ++j) occluded[j][j] = 0.0;

    Tensor shifted = predictBatch(model, occluded);
    const auto& d = shifted.data();
    const std::size_t width = shifted.cols();

    std::vector<double> importance(features.size(), 0.0);
    double total = 0.0;
    for (std::size_t j = 0; j < features.size(); ++j) {
        double sum = 0.0;
        for (std::size_t k = 0; k < width; ++k) sum += std::fabs(d[j * width + k] - base[k]);
        importance[j] = width ? sum / width : 0.0;
        total += importance[j];
    }

    Explanation ex;
    std::vector<FeatureImportance> ranked;
    ranked.reserve(features.size());
    for (std::size_t j = 0; j < features.size(); ++j) {
        std::string name = j < featureNames.size() ? featureNames[j] : "feature_" + std::to_string(j);
        double value = total > 0.0 ? importance[j] / total : 0.0;
        ex.featureImportance[name] = value;
        ranked.push_back({name, value});
    }

    std::sort(ranked.begin(), ranked.end(), [](const FeatureImportance& a, const FeatureImportance& b) {
        if (a.importance != b.importance) return a.importance > b.importance;
        return a.name < b.name;
    });
    std::size_t keep = static_cast<std::size_t>(topN > 0 ? topN : config_.topFeatures);
    if (ranked.size() > keep) ranked.resize(keep);
    ex.topFeatures = std::move(ranked);
    return ex;
}

// ==========================================================
// Validation / post-processing
// ==========================================================
PredictionValidation PredictionEngine::validatePrediction(const Tensor& prediction,
                                                          const std::vector<RangeConstraint>& expectedRanges) const {
    PredictionValidation result;
    try {
        const auto& d = prediction.data();
        const auto& names = outputNames();

        for (const auto& range : expectedRanges) {
            std::size_t idx = indexOf(names, range.name);
            if (idx >= names.size() || idx >= d.size()) {
                throw std::out_of_range("unknown output '" + range.name + "'");
            }
            double v = d[idx];
            if (!std::isfinite(v) || v < range.min || v > range.max) {
                result.violations.push_back(range.name);
            }
        }
    } catch (const std::exception& e) {
        throw ValidationError(std::string("Prediction validation failed: ") + e.what());
    }

    result.isValid = result.violations.empty();
    if (!expectedRanges.empty()) {
        double ratio = static_cast<double>(result.violations.size()) / expectedRanges.size();
        result.confidence = std::max(0.0, 1.0 - ratio);
    }
    return result;
}

ProcessedPrediction PredictionEngine::postProcessPredictions(const Tensor& raw,
                                                             const PostProcessConstraints& constraints) const {
    ProcessedPrediction out;
    try {
        const auto& d = raw.data();
        if (d.size() < kOutputDimension) {
            throw std::length_error("expected " + std::to_string(kOutputDimension) + " outputs, got " +
                                    std::to_string(d.size()));
        }
        out.values.assign(d.begin(), d.begin() + kOutputDimension);

        const auto& tokens = canonicalTokens();
        for (const auto& c : constraints.tokens) {
            if (!(c.step > 0.0) || c.min > c.max) {
                throw std::invalid_argument("invalid constraint for token '" + c.name + "'");
            }
            std::size_t t = indexOf(tokens, c.name);
            if (t >= tokens.size()) continue;   // no model output for this token

            double* slot = &out.values[t * 4];
            ScalingToken token;

            token.scale = std::isfinite(slot[0]) ? stats::clamp(slot[0], kMinScale, kMaxScale) : 1.0;
            token.min = snapToGrid(slot[1], c.min, c.max, c.step);
            token.max = snapToGrid(std::isfinite(slot[2]) ? slot[2] : c.max, c.min, c.max, c.step);
            if (token.min > token.max) std::swap(token.min, token.max);

            // step: a multiple of the declared step that divides max - min
            long long span = std::llround((token.max - token.min) / c.step);
            long long mult = 1;
            if (std::isfinite(slot[3])) {
                double q = stats::clamp(slot[3] / c.step, 1.0, 1e9);
                mult = std::max(1LL, std::llround(q));
            }
            if (span > 0) {
                mult = largestDivisorAtMost(span, std::min(mult, span));
            } else {
                long long cap = std::max(1LL, std::llround((c.max - c.min) / c.step));
                mult = std::min(mult, cap);
            }
            token.step = c.step * static_cast<double>(mult);

            slot[0] = token.scale;
            slot[1] = token.min;
            slot[2] = token.max;
            slot[3] = token.step;
            out.tokens[c.name] = token;
        }

        const auto& tail = outputTailNames();
        for (const auto& r : constraints.performance) {
            std::size_t t = indexOf(tail, r.name);
            if (t >= tail.size()) continue;
            double& v = out.values[tokens.size() * 4 + t];
            v = std::isfinite(v) ? stats::clamp(v, r.min, r.max) : r.min;
            out.performance[r.name] = v;
        }
    } catch (const std::exception& e) {
        throw PostProcessingError(std::string("Post-processing failed: ") + e.what());
    }
    return out;
}

PredictionComparison PredictionEngine::comparePredictions(const std::vector<double>& optimized,
                                                          const std::vector<double>& baseline) const {
    PredictionComparison cmp;
    const auto& names = outputNames();
    const auto& perf = performanceOutputs();
    const std::size_t n = std::min({optimized.size(), baseline.size(), names.size()});

    double total = 0.0;
    std::size_t counted = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (baseline[i] == 0.0 || !std::isfinite(optimized[i]) || !std::isfinite(baseline[i])) continue;

        double change = (optimized[i] - baseline[i]) / baseline[i] * 100.0;
        bool lowerIsBetter = std::find(perf.begin(), perf.end(), names[i]) != perf.end();
        double improvement = lowerIsBetter ? -change : change;

        if (improvement > 0.0) {
            cmp.improvements[names[i]] = improvement;
            total += improvement;
        } else {
            cmp.regressions[names[i]] = std::fabs(improvement);
        }
        ++counted;
    }
    cmp.overallImprovement = counted ? total / counted : 0.0;
    return cmp;
}
