#include "nn/LinearModel.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

#include "nn/ModelIO.hpp"
#include "utils/Errors.hpp"

namespace {
constexpr const char* kFormat = "scale-optimizer/linear-regression";
}

LinearModel::LinearModel(std::size_t inputDim, std::size_t outputDim, Scaler::Mode normalization)
    : inDim_(inputDim), outDim_(outputDim), normalization_(normalization) {
    if (inputDim == 0 || outputDim == 0) {
        throw std::invalid_argument("LinearModel: input and output size must be positive");
    }
    W_.assign(outDim_ * inDim_, 0.0f);
    b_.assign(outDim_, 0.0f);
}

std::vector<float> LinearModel::predictRow(const float* x) const {
    std::vector<float> y(outDim_, 0.0f);
    for (std::size_t i = 0; i < outDim_; ++i) {
        float acc = b_[i];
        const float* wrow = &W_[i * inDim_];
        for (std::size_t j = 0; j < inDim_; ++j) acc += wrow[j] * x[j];
        y[i] = acc;
    }
    return y;
}

Tensor LinearModel::predict(const Tensor& input, const InferenceOptions&) const {
    if (input.cols() != inDim_) {
        throw std::invalid_argument("LinearModel: expected " + std::to_string(inDim_) +
                                    " input features, got " + std::to_string(input.cols()));
    }

    Tensor scaled = featureScaler_.transform(input);
    const auto& xs = scaled.data();

    std::vector<float> out;
    out.reserve(input.rows() * outDim_);
    for (std::size_t r = 0; r < input.rows(); ++r) {
        auto y = predictRow(&xs[r * inDim_]);
        out.insert(out.end(), y.begin(), y.end());
    }
    return labelScaler_.inverse(Tensor(input.rows(), outDim_, std::move(out)));
}

FitHistory LinearModel::fit(const Tensor& x, const Tensor& y, const FitOptions& opts) {
    if (x.rows() == 0) throw std::invalid_argument("LinearModel: empty training set");
    if (x.cols() != inDim_ || y.cols() != outDim_ || x.rows() != y.rows()) {
        throw std::invalid_argument("LinearModel: training tensor shape mismatch");
    }

    featureScaler_.partialFit(x, normalization_);
    labelScaler_.partialFit(y, Scaler::MINMAX);

    Tensor xsT = featureScaler_.transform(x);
    Tensor ysT = labelScaler_.transform(y);
    const auto& xs = xsT.data();
    const auto& ys = ysT.data();

    const std::size_t n = x.rows();
    const float lr = static_cast<float>(opts.learningRate);
    const float l2 = static_cast<float>(opts.l2);

    std::mt19937 rng(opts.seed + static_cast<std::uint32_t>(trainedSamples_));
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    FitHistory history;
    for (int epoch = 0; epoch < opts.epochs; ++epoch) {
        if (opts.shuffle) std::shuffle(order.begin(), order.end(), rng);

        double epochLoss = 0.0;
        for (std::size_t r : order) {
            const float* xr = &xs[r * inDim_];
            const float* target = &ys[r * outDim_];
            std::vector<float> pred = predictRow(xr);

            double sampleLoss = 0.0;
            for (std::size_t i = 0; i < outDim_; ++i) {
                float err = pred[i] - target[i];
                sampleLoss += static_cast<double>(err) * err;
                err = std::max(-1.0f, std::min(1.0f, err));

                b_[i] -= lr * err;
                float* wrow = &W_[i * inDim_];
                for (std::size_t j = 0; j < inDim_; ++j) {
                    // gradient = err * x_j + l2 * w
                    float grad = err * xr[j] + l2 * wrow[j];
                    wrow[j] -= lr * grad;
                }
            }
            epochLoss += sampleLoss / outDim_;
        }
        history.loss.push_back(epochLoss / static_cast<double>(n));
    }

    trainedSamples_ += n;
    return history;
}

void LinearModel::save(const std::string& path) const {
    nlohmann::json doc = {{"format", kFormat},
                          {"version", 1},
                          {"inputSize", inDim_},
                          {"outputSize", outDim_},
                          {"normalization", static_cast<int>(normalization_)},
                          {"trainedSamples", trainedSamples_},
                          {"weights", W_},
                          {"bias", b_},
                          {"featureScaler", featureScaler_.toJson()},
                          {"labelScaler", labelScaler_.toJson()}};
    writeModelDocument(path, doc);
}

void LinearModel::load(const std::string& path) {
    nlohmann::json doc = readModelDocument(path, kFormat);

    try {
        std::size_t inDim = doc.at("inputSize").get<std::size_t>();
        std::size_t outDim = doc.at("outputSize").get<std::size_t>();
        auto W = doc.at("weights").get<std::vector<float>>();
        auto b = doc.at("bias").get<std::vector<float>>();
        if (W.size() != outDim * inDim || b.size() != outDim) {
            throw PersistenceError("Model load failed: weight size mismatch");
        }

        featureScaler_ = Scaler::fromJson(doc.at("featureScaler"));
        labelScaler_ = Scaler::fromJson(doc.at("labelScaler"));
        inDim_ = inDim;
        outDim_ = outDim;
        W_ = std::move(W);
        b_ = std::move(b);
        normalization_ = static_cast<Scaler::Mode>(doc.value("normalization", 2));
        trainedSamples_ = doc.value("trainedSamples", std::size_t{0});
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Model load failed: " + std::string(e.what()));
    }
}
