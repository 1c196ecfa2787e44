#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "nn/Model.hpp"
#include "nn/Scaler.hpp"

// Fully-connected regression network: input -> hidden (relu + dropout) -> linear output.
// Weights stored as vector<out_dim * in_dim> per layer (row-major).
// Trained with Adam on MSE; every fit() call folds its batch into the feature and
// label scalers, which are stored with the weights.
class NeuralNetwork : public TrainableModel {
public:
    NeuralNetwork(std::size_t inputDim, std::size_t outputDim,
                  const std::vector<int>& hiddenUnits, const std::vector<double>& dropout,
                  Scaler::Mode normalization, std::uint32_t seed);

    std::string architecture() const override { return "neural-network"; }
    std::size_t parameterCount() const override;
    std::size_t layerCount() const override;

    std::size_t inputSize() const override { return inputDim_; }
    std::size_t outputSize() const override { return outputDim_; }

    Tensor predict(const Tensor& input, const InferenceOptions& opts = {}) const override;
    FitHistory fit(const Tensor& x, const Tensor& y, const FitOptions& opts) override;
    std::size_t trainedSamples() const override { return trainedSamples_; }

    void save(const std::string& path) const override;
    void load(const std::string& path) override;

private:
    struct DenseLayer {
        std::size_t in = 0;
        std::size_t out = 0;
        std::string activation;   // relu | linear
        float dropout = 0.0f;
        std::vector<float> W;     // out * in
        std::vector<float> b;     // out
        // Adam moments
        std::vector<float> mW, vW, mb, vb;
    };

    struct Trace {
        std::vector<std::vector<float>> acts;   // acts[0] = input, acts[l+1] = layer l output
        std::vector<std::vector<float>> masks;  // dropout scale per unit (0 or 1/(1-p))
    };

    std::vector<float> forward(const float* x, std::mt19937* rng, Trace* trace) const;
    void resetOptimizerState();

    std::size_t inputDim_;
    std::size_t outputDim_;
    std::vector<DenseLayer> layers_;
    Scaler featureScaler_;
    Scaler labelScaler_;
    Scaler::Mode normalization_;
    std::size_t adamStep_ = 0;
    std::size_t trainedSamples_ = 0;
};
