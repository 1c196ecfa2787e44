#include "nn/Scaler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

Scaler::Mode Scaler::parseMode(const std::string& name) {
    if (name == "minmax") return MINMAX;
    // robust scaling falls back to z-score
    if (name == "standard" || name == "robust") return STANDARD;
    return NONE;
}

void Scaler::fit(const Tensor& t, Mode m) {
    fitted = false;
    count = 0;
    param1.clear();
    param2.clear();
    m2.clear();
    partialFit(t, m);
}

void Scaler::partialFit(const Tensor& t, Mode m) {
    const auto& d = t.data();
    std::size_t rows = t.rows();
    std::size_t cols = t.cols();
    if (rows == 0) throw std::runtime_error("Scaler fit on empty tensor");

    if (!fitted) {
        mode = m;
        count = 0;
        param1.assign(cols, 0.0f);
        param2.assign(cols, 0.0f);
        m2.assign(cols, 0.0);
    } else if (cols != param1.size()) {
        throw std::runtime_error("Scaler size mismatch");
    }
    // loaded from a file without running sums
    if (m2.size() != cols) {
        m2.assign(cols, 0.0);
        for (std::size_t c = 0; c < cols; ++c) {
            m2[c] = static_cast<double>(param2[c]) * param2[c] * static_cast<double>(count);
        }
    }

    for (std::size_t c = 0; c < cols; ++c) {
        if (mode == MINMAX) {
            float lo = d[c], hi = d[c];
            for (std::size_t r = 1; r < rows; ++r) {
                float v = d[r * cols + c];
                if (v < lo) lo = v;
                if (v > hi) hi = v;
            }
            if (count > 0) {
                lo = std::min(lo, param1[c]);
                hi = std::max(hi, param2[c]);
            }
            param1[c] = lo;
            param2[c] = hi;
        } else if (mode == STANDARD) {
            double sum = 0.0;
            for (std::size_t r = 0; r < rows; ++r) sum += d[r * cols + c];
            double batchMean = sum / rows;
            double batchM2 = 0.0;
            for (std::size_t r = 0; r < rows; ++r) {
                double diff = d[r * cols + c] - batchMean;
                batchM2 += diff * diff;
            }

            // Chan et al. merge of (count, mean, m2) with the batch
            double na = static_cast<double>(count);
            double nb = static_cast<double>(rows);
            double n = na + nb;
            double mean = param1[c];
            double delta = batchMean - mean;
            mean += delta * nb / n;
            m2[c] += batchM2 + delta * delta * na * nb / n;

            param1[c] = static_cast<float>(mean);
            param2[c] = static_cast<float>(std::sqrt(m2[c] / n));
        }
    }
    count += rows;
    fitted = true;
}

Tensor Scaler::transform(const Tensor& in) const {
    const auto& src = in.data();
    std::size_t cols = in.cols();
    if (fitted && mode != NONE && (cols != param1.size() || cols != param2.size())) {
        throw std::runtime_error("Scaler size mismatch");
    }

    std::vector<float> out(src.size());
    for (std::size_t i = 0; i < src.size(); ++i) {
        std::size_t c = i % cols;
        float v = src[i];
        if (fitted && mode == MINMAX) {
            float denom = param2[c] - param1[c];
            if (std::fabs(denom) < 1e-6f) denom = 1.0f;
            v = (v - param1[c]) / denom;
        } else if (fitted && mode == STANDARD) {
            float stdv = param2[c];
            if (std::fabs(stdv) < 1e-6f) stdv = 1.0f;
            v = (v - param1[c]) / stdv;
        }
        // clip
        if (v < clip_min) v = clip_min;
        if (v > clip_max) v = clip_max;
        out[i] = v;
    }
    return Tensor(in.rows(), cols, std::move(out));
}

Tensor Scaler::inverse(const Tensor& in) const {
    const auto& src = in.data();
    std::size_t cols = in.cols();
    if (!fitted || mode == NONE) return Tensor(in.rows(), cols, src);
    if (cols != param1.size()) throw std::runtime_error("Scaler size mismatch");

    std::vector<float> out(src.size());
    for (std::size_t i = 0; i < src.size(); ++i) {
        std::size_t c = i % cols;
        float scale = mode == MINMAX ? param2[c] - param1[c] : param2[c];
        if (std::fabs(scale) < 1e-6f) scale = 1.0f;
        out[i] = src[i] * scale + param1[c];
    }
    return Tensor(in.rows(), cols, std::move(out));
}

nlohmann::json Scaler::toJson() const {
    return nlohmann::json{{"mode", static_cast<int>(mode)},
                          {"param1", param1},
                          {"param2", param2},
                          {"clipMin", clip_min},
                          {"clipMax", clip_max},
                          {"m2", m2},
                          {"count", count},
                          {"fitted", fitted}};
}

Scaler Scaler::fromJson(const nlohmann::json& j) {
    Scaler s;
    s.mode     = static_cast<Mode>(j.at("mode").get<int>());
    s.param1   = j.at("param1").get<std::vector<float>>();
    s.param2   = j.at("param2").get<std::vector<float>>();
    s.clip_min = j.value("clipMin", s.clip_min);
    s.clip_max = j.value("clipMax", s.clip_max);
    s.fitted   = j.value("fitted", false);
    s.count    = j.value("count", std::size_t{s.fitted ? 1u : 0u});
    if (j.contains("m2")) s.m2 = j.at("m2").get<std::vector<double>>();
    return s;
}
