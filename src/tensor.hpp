#ifndef TENSOR_HPP
#define TENSOR_HPP
#include <torch/torch.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Row-major float buffer; the last dimension varies fastest.
// Every helper below returns a fresh buffer, inputs are never mutated.
struct Tensor {
    std::vector<float> data;
    std::vector<int64_t> shape;

    Tensor() = default;
    explicit Tensor(std::vector<int64_t> dims);
    Tensor(std::vector<float> values, std::vector<int64_t> dims);

    int64_t numel() const { return static_cast<int64_t>(data.size()); }
    int64_t dim() const { return static_cast<int64_t>(shape.size()); }
    int64_t size(int64_t axis) const;
    int64_t last_dim() const { return shape.empty() ? 0 : shape.back(); }

    // Product of every dimension except the last.
    int64_t outer_size() const;
};

struct ComplexTensor {
    Tensor real;
    Tensor imag;

    ComplexTensor() = default;
    ComplexTensor(Tensor re, Tensor im);
    explicit ComplexTensor(const std::vector<int64_t>& dims);

    const std::vector<int64_t>& shape() const { return real.shape; }
};

int64_t shape_numel(const std::vector<int64_t>& shape);
std::string shape_to_string(const std::vector<int64_t>& shape);

Tensor reshape(const Tensor& x, std::vector<int64_t> shape);
Tensor add(const Tensor& a, const Tensor& b);

// Zero-pads the trailing dimension.
Tensor pad_last(const Tensor& x, int64_t left, int64_t right);

// Keeps the first `length` samples of the trailing dimension.
Tensor crop_last(const Tensor& x, int64_t length);

// Copies [start, start + length) of the trailing dimension.
Tensor slice_last(const Tensor& x, int64_t start, int64_t length);

// Removes equal amounts from both ends of the trailing dimension so that it
// ends up `reference` long. The extra sample of an odd difference comes off
// the end.
Tensor center_trim(const Tensor& x, int64_t reference);

// Zero-pads the frequency (second to last) and time (last) dimensions.
ComplexTensor pad_complex(const ComplexTensor& z,
                          std::pair<int64_t, int64_t> freq_pad,
                          std::pair<int64_t, int64_t> time_pad);

torch::Tensor to_torch(const Tensor& x);
Tensor from_torch(const torch::Tensor& t);

#endif
