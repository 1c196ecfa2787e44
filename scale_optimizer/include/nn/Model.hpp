#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "nn/Tensor.hpp"

struct InferenceOptions {
    // Keep dropout active (Monte-Carlo sampling)
    bool stochastic = false;
    std::uint32_t seed = 0;
};

struct FitOptions {
    int epochs = 100;
    int batchSize = 32;
    double learningRate = 0.001;
    double l2 = 0.0;
    bool shuffle = true;
    std::uint32_t seed = 42;
};

struct FitHistory {
    std::vector<double> loss;  // mean training loss per epoch
};

// Opaque persisted model artifact
class Model {
public:
    virtual ~Model() = default;

    virtual std::string architecture() const = 0;
    virtual std::size_t parameterCount() const = 0;
    virtual std::size_t layerCount() const = 0;

    // Throw PersistenceError on failure
    virtual void save(const std::string& path) const = 0;
    virtual void load(const std::string& path) = 0;
};

// A model that can run inference. predict() is const and keeps no per-call
// state, so concurrent callers are safe.
class PredictiveModel : public Model {
public:
    virtual std::size_t inputSize() const = 0;
    virtual std::size_t outputSize() const = 0;

    // input: rows x inputSize(); returns rows x outputSize() in label units
    virtual Tensor predict(const Tensor& input, const InferenceOptions& opts = {}) const = 0;
};

// A model whose weights can be updated. Repeated fit() calls continue from the
// current weights.
class TrainableModel : public PredictiveModel {
public:
    virtual FitHistory fit(const Tensor& x, const Tensor& y, const FitOptions& opts) = 0;

    // Number of rows seen by fit() so far
    virtual std::size_t trainedSamples() const = 0;
};
