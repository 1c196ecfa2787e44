#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "nn/Tensor.hpp"

// Column-wise scaler:
// - MINMAX:   x' = (x - min) / (max - min)
// - STANDARD: x' = (x - mean) / std
// - NONE:     x' = x
// Output is clipped to [clip_min, clip_max]. An unfitted scaler only clips.
// A column whose range (or std) is ~0 keeps unit scale and is only shifted.
// partialFit() merges further batches into the running min/max or mean/variance.
struct Scaler {
    enum Mode { NONE = 0, MINMAX = 1, STANDARD = 2 };
    Mode mode = NONE;
    std::vector<float> param1;  // min or mean
    std::vector<float> param2;  // max or std
    std::vector<double> m2;     // running sum of squared deviations (STANDARD)
    std::size_t count = 0;      // rows seen
    float clip_min = -10.0f;
    float clip_max = 10.0f;
    bool fitted = false;

    static Mode parseMode(const std::string& name);

    void fit(const Tensor& t, Mode m);
    void partialFit(const Tensor& t, Mode m);
    Tensor transform(const Tensor& in) const;
    Tensor inverse(const Tensor& in) const;

    nlohmann::json toJson() const;
    static Scaler fromJson(const nlohmann::json& j);
};
