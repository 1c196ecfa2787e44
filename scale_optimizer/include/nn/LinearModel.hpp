#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "nn/Model.hpp"
#include "nn/Scaler.hpp"

// Multi-output linear regressor trained with per-sample SGD + L2.
// W is out_dim x in_dim (row-major). Uses the same scaler handling as
// NeuralNetwork; it has no dropout, so stochastic inference is deterministic.
class LinearModel : public TrainableModel {
public:
    LinearModel(std::size_t inputDim, std::size_t outputDim, Scaler::Mode normalization);

    std::string architecture() const override { return "linear-regression"; }
    std::size_t parameterCount() const override { return W_.size() + b_.size(); }
    std::size_t layerCount() const override { return 1; }

    std::size_t inputSize() const override { return inDim_; }
    std::size_t outputSize() const override { return outDim_; }

    Tensor predict(const Tensor& input, const InferenceOptions& opts = {}) const override;
    FitHistory fit(const Tensor& x, const Tensor& y, const FitOptions& opts) override;
    std::size_t trainedSamples() const override { return trainedSamples_; }

    void save(const std::string& path) const override;
    void load(const std::string& path) override;

private:
    std::vector<float> predictRow(const float* x) const;

    std::size_t inDim_;
    std::size_t outDim_;
    std::vector<float> W_;
    std::vector<float> b_;
    Scaler featureScaler_;
    Scaler labelScaler_;
    Scaler::Mode normalization_;
    std::size_t trainedSamples_ = 0;
};
