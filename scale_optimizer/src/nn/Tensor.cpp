#include "nn/Tensor.hpp"

#include <stdexcept>
#include <string>
#include <utility>

Tensor::Tensor(std::size_t rows, std::size_t cols, std::vector<float> data)
    : rows_(rows), cols_(cols), data_(std::move(data)) {}

Tensor Tensor::zeros(std::size_t rows, std::size_t cols) {
    return Tensor(rows, cols, std::vector<float>(rows * cols, 0.0f));
}

Tensor Tensor::fromRow(const std::vector<double>& values) {
    std::vector<float> buf(values.begin(), values.end());
    return Tensor(1, values.size(), std::move(buf));
}

Tensor Tensor::fromRows(const std::vector<std::vector<double>>& rows) {
    if (rows.empty()) return Tensor();

    std::size_t cols = rows.front().size();
    std::vector<float> buf;
    buf.reserve(rows.size() * cols);
    for (const auto& r : rows) {
        if (r.size() != cols) throw std::runtime_error("Tensor rows have different lengths");
        buf.insert(buf.end(), r.begin(), r.end());
    }
    return Tensor(rows.size(), cols, std::move(buf));
}

void Tensor::check() const {
    if (released_) throw std::runtime_error("tensor buffer has been released");
    if (data_.size() != rows_ * cols_) {
        throw std::runtime_error("tensor buffer holds " + std::to_string(data_.size()) +
                                 " values but shape is " + std::to_string(rows_) + "x" +
                                 std::to_string(cols_));
    }
}

const std::vector<float>& Tensor::data() const {
    check();
    return data_;
}

std::vector<float>& Tensor::data() {
    check();
    return data_;
}

float Tensor::at(std::size_t r, std::size_t c) const {
    check();
    if (r >= rows_ || c >= cols_) throw std::out_of_range("tensor index out of range");
    return data_[r * cols_ + c];
}

std::vector<float> Tensor::row(std::size_t r) const {
    check();
    if (r >= rows_) throw std::out_of_range("tensor row out of range");
    return std::vector<float>(data_.begin() + r * cols_, data_.begin() + (r + 1) * cols_);
}

void Tensor::release() {
    std::vector<float>().swap(data_);
    released_ = true;
}
