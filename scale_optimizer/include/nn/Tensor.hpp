#pragma once
#include <cstddef>
#include <vector>

// Row-major float buffer with a 2-D shape (rows x cols). Owns its storage;
// the buffer is freed on destruction or by release().
class Tensor {
public:
    Tensor() = default;
    Tensor(std::size_t rows, std::size_t cols, std::vector<float> data);

    static Tensor zeros(std::size_t rows, std::size_t cols);
    static Tensor fromRow(const std::vector<double>& values);
    static Tensor fromRows(const std::vector<std::vector<double>>& rows);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    std::size_t size() const { return rows_ * cols_; }

    // Throws std::runtime_error if the tensor was released or its buffer does
    // not match the shape.
    const std::vector<float>& data() const;
    std::vector<float>& data();

    float at(std::size_t r, std::size_t c) const;
    std::vector<float> row(std::size_t r) const;

    void release();
    bool released() const { return released_; }

private:
    void check() const;

    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::vector<float> data_;
    bool released_ = false;
};
