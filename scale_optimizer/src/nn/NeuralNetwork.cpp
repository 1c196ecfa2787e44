#include "nn/NeuralNetwork.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "nn/ModelIO.hpp"
#include "utils/Errors.hpp"

namespace {

constexpr const char* kFormat = "scale-optimizer/neural-network";
constexpr float kBeta1 = 0.9f;
constexpr float kBeta2 = 0.999f;
constexpr float kAdamEps = 1e-7f;

// per-element gradient clip
constexpr float kGradClip = 5.0f;

inline float clipGrad(float g) {
    if (!std::isfinite(g)) return 0.0f;
    return std::max(-kGradClip, std::min(kGradClip, g));
}

}  // namespace

NeuralNetwork::NeuralNetwork(std::size_t inputDim, std::size_t outputDim,
                             const std::vector<int>& hiddenUnits,
                             const std::vector<double>& dropout,
                             Scaler::Mode normalization, std::uint32_t seed)
    : inputDim_(inputDim), outputDim_(outputDim), normalization_(normalization) {
    if (inputDim == 0 || outputDim == 0) {
        throw std::invalid_argument("NeuralNetwork: input and output size must be positive");
    }

    std::mt19937 rng(seed);
    std::size_t prev = inputDim;

    auto addLayer = [&](std::size_t out, const std::string& activation, double rate) {
        DenseLayer layer;
        layer.in = prev;
        layer.out = out;
        layer.activation = activation;
        layer.dropout = static_cast<float>(std::max(0.0, std::min(0.9, rate)));

        // He uniform for relu, Glorot uniform for the linear head
        double limit = activation == "relu" ? std::sqrt(6.0 / prev)
                                            : std::sqrt(6.0 / (prev + out));
        std::uniform_real_distribution<float> dist(static_cast<float>(-limit),
                                                   static_cast<float>(limit));
        layer.W.resize(out * prev);
        for (auto& w : layer.W) w = dist(rng);
        layer.b.assign(out, 0.0f);

        layers_.push_back(std::move(layer));
        prev = out;
    };

    for (std::size_t i = 0; i < hiddenUnits.size(); ++i) {
        if (hiddenUnits[i] <= 0) {
            throw std::invalid_argument("NeuralNetwork: hidden layer size must be positive");
        }
        double rate = i < dropout.size() ? dropout[i] : 0.0;
        addLayer(static_cast<std::size_t>(hiddenUnits[i]), "relu", rate);
    }
    addLayer(outputDim, "linear", 0.0);

    resetOptimizerState();
}

void NeuralNetwork::resetOptimizerState() {
    for (auto& layer : layers_) {
        layer.mW.assign(layer.W.size(), 0.0f);
        layer.vW.assign(layer.W.size(), 0.0f);
        layer.mb.assign(layer.b.size(), 0.0f);
        layer.vb.assign(layer.b.size(), 0.0f);
    }
    adamStep_ = 0;
}

std::size_t NeuralNetwork::parameterCount() const {
    std::size_t total = 0;
    for (const auto& layer : layers_) total += layer.W.size() + layer.b.size();
    return total;
}

std::size_t NeuralNetwork::layerCount() const {
    // dropout counts as its own layer
    std::size_t n = layers_.size();
    for (const auto& layer : layers_) {
        if (layer.dropout > 0.0f) ++n;
    }
    return n;
}

// ==========================================================
// Forward pass (single row)
// ==========================================================
std::vector<float> NeuralNetwork::forward(const float* x, std::mt19937* rng, Trace* trace) const {
    std::vector<float> a(x, x + inputDim_);
    if (trace) {
        trace->acts.clear();
        trace->masks.clear();
        trace->acts.push_back(a);
    }

    for (const auto& layer : layers_) {
        std::vector<float> z(layer.out);
        for (std::size_t o = 0; o < layer.out; ++o) {
            const float* w = &layer.W[o * layer.in];
            float s = layer.b[o];
            for (std::size_t i = 0; i < layer.in; ++i) s += w[i] * a[i];
            if (layer.activation == "relu" && s < 0.0f) s = 0.0f;
            z[o] = s;
        }

        std::vector<float> mask(layer.out, 1.0f);
        if (rng && layer.dropout > 0.0f) {
            std::bernoulli_distribution keep(1.0 - layer.dropout);
            float scale = 1.0f / (1.0f - layer.dropout);
            for (std::size_t o = 0; o < layer.out; ++o) {
                mask[o] = keep(*rng) ? scale : 0.0f;
                z[o] *= mask[o];
            }
        }

        if (trace) {
            trace->acts.push_back(z);
            trace->masks.push_back(std::move(mask));
        }
        a = std::move(z);
    }
    return a;
}

Tensor NeuralNetwork::predict(const Tensor& input, const InferenceOptions& opts) const {
    if (input.cols() != inputDim_) {
        throw std::invalid_argument("NeuralNetwork: expected " + std::to_string(inputDim_) +
                                    " input features, got " + std::to_string(input.cols()));
    }

    Tensor scaled = featureScaler_.transform(input);
    const auto& xs = scaled.data();

    std::mt19937 rng(opts.seed);
    std::mt19937* rngPtr = opts.stochastic ? &rng : nullptr;

    std::vector<float> out;
    out.reserve(input.rows() * outputDim_);
    for (std::size_t r = 0; r < input.rows(); ++r) {
        auto y = forward(&xs[r * inputDim_], rngPtr, nullptr);
        out.insert(out.end(), y.begin(), y.end());
    }
    return labelScaler_.inverse(Tensor(input.rows(), outputDim_, std::move(out)));
}

// ==========================================================
// Training
// ==========================================================
FitHistory NeuralNetwork::fit(const Tensor& x, const Tensor& y, const FitOptions& opts) {
    if (x.rows() == 0) throw std::invalid_argument("NeuralNetwork: empty training set");
    if (x.cols() != inputDim_ || y.cols() != outputDim_ || x.rows() != y.rows()) {
        throw std::invalid_argument("NeuralNetwork: training tensor shape mismatch (x " +
                                    std::to_string(x.rows()) + "x" + std::to_string(x.cols()) +
                                    ", y " + std::to_string(y.rows()) + "x" +
                                    std::to_string(y.cols()) + ")");
    }

    featureScaler_.partialFit(x, normalization_);
    labelScaler_.partialFit(y, Scaler::MINMAX);

    Tensor xsT = featureScaler_.transform(x);
    Tensor ysT = labelScaler_.transform(y);
    const auto& xs = xsT.data();
    const auto& ys = ysT.data();

    const std::size_t n = x.rows();
    const std::size_t batch = static_cast<std::size_t>(std::max(1, opts.batchSize));
    const float lr = static_cast<float>(opts.learningRate);
    const float l2 = static_cast<float>(opts.l2);

    // offset by the step count so incremental calls draw fresh masks
    std::mt19937 rng(opts.seed + static_cast<std::uint32_t>(adamStep_));

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    // gradient accumulators, same layout as the weights
    std::vector<std::vector<float>> gW(layers_.size()), gb(layers_.size());

    FitHistory history;
    Trace trace;

    for (int epoch = 0; epoch < opts.epochs; ++epoch) {
        if (opts.shuffle) std::shuffle(order.begin(), order.end(), rng);

        double epochLoss = 0.0;

        for (std::size_t start = 0; start < n; start += batch) {
            std::size_t end = std::min(n, start + batch);
            std::size_t bs = end - start;

            for (std::size_t l = 0; l < layers_.size(); ++l) {
                gW[l].assign(layers_[l].W.size(), 0.0f);
                gb[l].assign(layers_[l].b.size(), 0.0f);
            }

            for (std::size_t k = start; k < end; ++k) {
                std::size_t r = order[k];
                const float* target = &ys[r * outputDim_];
                auto pred = forward(&xs[r * inputDim_], &rng, &trace);

                // d(MSE)/d(pred)
                std::vector<float> grad(outputDim_);
                double sampleLoss = 0.0;
                for (std::size_t o = 0; o < outputDim_; ++o) {
                    float diff = pred[o] - target[o];
                    sampleLoss += static_cast<double>(diff) * diff;
                    grad[o] = 2.0f * diff / static_cast<float>(outputDim_);
                }
                epochLoss += sampleLoss / outputDim_;

                for (std::size_t l = layers_.size(); l-- > 0;) {
                    const auto& layer = layers_[l];
                    const auto& aPrev = trace.acts[l];
                    const auto& aOut = trace.acts[l + 1];
                    const auto& mask = trace.masks[l];

                    std::vector<float> gz(layer.out);
                    for (std::size_t o = 0; o < layer.out; ++o) {
                        float g = grad[o] * mask[o];
                        if (layer.activation == "relu" && aOut[o] <= 0.0f) g = 0.0f;
                        gz[o] = g;
                    }

                    std::vector<float> gPrev(layer.in, 0.0f);
                    for (std::size_t o = 0; o < layer.out; ++o) {
                        if (gz[o] == 0.0f) continue;
                        const float* w = &layer.W[o * layer.in];
                        float* gw = &gW[l][o * layer.in];
                        for (std::size_t i = 0; i < layer.in; ++i) {
                            gw[i] += gz[o] * aPrev[i];
                            gPrev[i] += gz[o] * w[i];
                        }
                        gb[l][o] += gz[o];
                    }
                    grad = std::move(gPrev);
                }
            }

            // Adam update
            ++adamStep_;
            const float bc1 = 1.0f - std::pow(kBeta1, static_cast<float>(adamStep_));
            const float bc2 = 1.0f - std::pow(kBeta2, static_cast<float>(adamStep_));
            const float inv = 1.0f / static_cast<float>(bs);

            for (std::size_t l = 0; l < layers_.size(); ++l) {
                auto& layer = layers_[l];
                for (std::size_t i = 0; i < layer.W.size(); ++i) {
                    float g = clipGrad(gW[l][i] * inv + l2 * layer.W[i]);
                    layer.mW[i] = kBeta1 * layer.mW[i] + (1.0f - kBeta1) * g;
                    layer.vW[i] = kBeta2 * layer.vW[i] + (1.0f - kBeta2) * g * g;
                    layer.W[i] -= lr * (layer.mW[i] / bc1) / (std::sqrt(layer.vW[i] / bc2) + kAdamEps);
                }
                for (std::size_t i = 0; i < layer.b.size(); ++i) {
                    float g = clipGrad(gb[l][i] * inv);
                    layer.mb[i] = kBeta1 * layer.mb[i] + (1.0f - kBeta1) * g;
                    layer.vb[i] = kBeta2 * layer.vb[i] + (1.0f - kBeta2) * g * g;
                    layer.b[i] -= lr * (layer.mb[i] / bc1) / (std::sqrt(layer.vb[i] / bc2) + kAdamEps);
                }
            }
        }

        history.loss.push_back(epochLoss / static_cast<double>(n));
    }

    trainedSamples_ += n;
    return history;
}

// ==========================================================
// Persistence
// ==========================================================
void NeuralNetwork::save(const std::string& path) const {
    nlohmann::json layers = nlohmann::json::array();
    for (const auto& layer : layers_) {
        layers.push_back({{"in", layer.in},
                          {"out", layer.out},
                          {"activation", layer.activation},
                          {"dropout", layer.dropout},
                          {"weights", layer.W},
                          {"bias", layer.b}});
    }

    nlohmann::json doc = {{"format", kFormat},
                          {"version", 1},
                          {"inputSize", inputDim_},
                          {"outputSize", outputDim_},
                          {"normalization", static_cast<int>(normalization_)},
                          {"trainedSamples", trainedSamples_},
                          {"layers", layers},
                          {"featureScaler", featureScaler_.toJson()},
                          {"labelScaler", labelScaler_.toJson()}};
    writeModelDocument(path, doc);
}

void NeuralNetwork::load(const std::string& path) {
    nlohmann::json doc = readModelDocument(path, kFormat);

    try {
        std::size_t inputDim = doc.at("inputSize").get<std::size_t>();
        std::size_t outputDim = doc.at("outputSize").get<std::size_t>();

        std::vector<DenseLayer> layers;
        std::size_t prev = inputDim;
        for (const auto& jl : doc.at("layers")) {
            DenseLayer layer;
            layer.in = jl.at("in").get<std::size_t>();
            layer.out = jl.at("out").get<std::size_t>();
            layer.activation = jl.value("activation", "linear");
            layer.dropout = jl.value("dropout", 0.0f);
            layer.W = jl.at("weights").get<std::vector<float>>();
            layer.b = jl.at("bias").get<std::vector<float>>();
            if (layer.in != prev || layer.W.size() != layer.in * layer.out ||
                layer.b.size() != layer.out) {
                throw PersistenceError("Model load failed: inconsistent layer shapes");
            }
            prev = layer.out;
            layers.push_back(std::move(layer));
        }
        if (layers.empty() || prev != outputDim) {
            throw PersistenceError("Model load failed: output size does not match layers");
        }

        Scaler featureScaler = Scaler::fromJson(doc.at("featureScaler"));
        Scaler labelScaler = Scaler::fromJson(doc.at("labelScaler"));

        inputDim_ = inputDim;
        outputDim_ = outputDim;
        layers_ = std::move(layers);
        featureScaler_ = std::move(featureScaler);
        labelScaler_ = std::move(labelScaler);
        normalization_ = static_cast<Scaler::Mode>(doc.value("normalization", 2));
        trainedSamples_ = doc.value("trainedSamples", std::size_t{0});
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Model load failed: " + std::string(e.what()));
    }

    // optimizer moments are not persisted
    resetOptimizerState();
}
