#include "tensor.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

int64_t shape_numel(const std::vector<int64_t>& shape) {
    int64_t n = 1;
    for (auto d : shape) n *= d;
    return n;
}

std::string shape_to_string(const std::vector<int64_t>& shape) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out << ", ";
        out << shape[i];
    }
    out << "]";
    return out.str();
}

Tensor::Tensor(std::vector<int64_t> dims) : shape(std::move(dims)) {
    for (auto d : shape) {
        if (d < 0) throw ShapeError("negative dimension in shape " + shape_to_string(shape));
    }
    data.assign(static_cast<size_t>(shape_numel(shape)), 0.0f);
}

Tensor::Tensor(std::vector<float> values, std::vector<int64_t> dims)
    : data(std::move(values)), shape(std::move(dims)) {
    if (static_cast<int64_t>(data.size()) != shape_numel(shape)) {
        throw ShapeError("buffer of " + std::to_string(data.size()) +
                         " elements does not match shape " + shape_to_string(shape));
    }
}

int64_t Tensor::size(int64_t axis) const {
    if (axis < 0) axis += dim();
    if (axis < 0 || axis >= dim()) {
        throw RangeError("axis " + std::to_string(axis) + " out of range for shape " + shape_to_string(shape));
    }
    return shape[axis];
}

int64_t Tensor::outer_size() const {
    int64_t n = 1;
    for (size_t i = 0; i + 1 < shape.size(); ++i) n *= shape[i];
    return n;
}

ComplexTensor::ComplexTensor(Tensor re, Tensor im) : real(std::move(re)), imag(std::move(im)) {
    if (real.shape != imag.shape) {
        throw ShapeError("real part " + shape_to_string(real.shape) +
                         " and imaginary part " + shape_to_string(imag.shape) + " differ");
    }
}

ComplexTensor::ComplexTensor(const std::vector<int64_t>& dims) : real(dims), imag(dims) {}

Tensor reshape(const Tensor& x, std::vector<int64_t> shape) {
    if (shape_numel(shape) != x.numel()) {
        throw ShapeError("cannot reshape " + shape_to_string(x.shape) + " to " + shape_to_string(shape));
    }
    return Tensor(x.data, std::move(shape));
}

Tensor add(const Tensor& a, const Tensor& b) {
    if (a.shape != b.shape) {
        throw ShapeError("cannot add tensors of shape " + shape_to_string(a.shape) +
                         " and " + shape_to_string(b.shape));
    }
    Tensor out(a.shape);
    for (size_t i = 0; i < out.data.size(); ++i) out.data[i] = a.data[i] + b.data[i];
    return out;
}

Tensor pad_last(const Tensor& x, int64_t left, int64_t right) {
    if (left < 0 || right < 0) throw RangeError("padding must be non-negative");
    const int64_t length = x.last_dim();
    const int64_t out_length = length + left + right;
    auto shape = x.shape;
    shape.back() = out_length;
    Tensor out(shape);
    const int64_t outer = x.outer_size();
    for (int64_t i = 0; i < outer; ++i) {
        std::copy(x.data.begin() + i * length, x.data.begin() + (i + 1) * length,
                  out.data.begin() + i * out_length + left);
    }
    return out;
}

Tensor slice_last(const Tensor& x, int64_t start, int64_t length) {
    const int64_t total = x.last_dim();
    if (start < 0 || length < 0 || start + length > total) {
        throw RangeError("slice [" + std::to_string(start) + ", " + std::to_string(start + length) +
                         ") outside trailing dimension of " + std::to_string(total));
    }
    auto shape = x.shape;
    shape.back() = length;
    Tensor out(shape);
    const int64_t outer = x.outer_size();
    for (int64_t i = 0; i < outer; ++i) {
        auto src = x.data.begin() + i * total + start;
        std::copy(src, src + length, out.data.begin() + i * length);
    }
    return out;
}

Tensor crop_last(const Tensor& x, int64_t length) {
    if (length >= x.last_dim()) return x;
    return slice_last(x, 0, length);
}

Tensor center_trim(const Tensor& x, int64_t reference) {
    const int64_t delta = x.last_dim() - reference;
    if (delta < 0) {
        throw RangeError("tensor must be larger than reference, delta is " + std::to_string(delta));
    }
    if (delta == 0) return x;
    return slice_last(x, delta / 2, reference);
}

ComplexTensor pad_complex(const ComplexTensor& z,
                          std::pair<int64_t, int64_t> freq_pad,
                          std::pair<int64_t, int64_t> time_pad) {
    const auto& shape = z.shape();
    if (shape.size() < 2) throw ShapeError("complex padding needs at least two dimensions");
    const size_t ndim = shape.size();
    const int64_t freqs = shape[ndim - 2];
    const int64_t frames = shape[ndim - 1];
    const int64_t new_freqs = freqs + freq_pad.first + freq_pad.second;
    const int64_t new_frames = frames + time_pad.first + time_pad.second;

    auto new_shape = shape;
    new_shape[ndim - 2] = new_freqs;
    new_shape[ndim - 1] = new_frames;
    ComplexTensor out(new_shape);

    const int64_t outer = z.real.numel() / std::max<int64_t>(1, freqs * frames);
    for (int64_t i = 0; i < outer; ++i) {
        for (int64_t f = 0; f < freqs; ++f) {
            const int64_t src = (i * freqs + f) * frames;
            const int64_t dst = (i * new_freqs + f + freq_pad.first) * new_frames + time_pad.first;
            std::copy(z.real.data.begin() + src, z.real.data.begin() + src + frames, out.real.data.begin() + dst);
            std::copy(z.imag.data.begin() + src, z.imag.data.begin() + src + frames, out.imag.data.begin() + dst);
        }
    }
    return out;
}

torch::Tensor to_torch(const Tensor& x) {
    // from_blob does not own the buffer, so clone before the Tensor goes away.
    return torch::from_blob(const_cast<float*>(x.data.data()), x.shape, torch::kFloat32).clone();
}

Tensor from_torch(const torch::Tensor& t) {
    auto contiguous_tensor = t.to(torch::kCPU, torch::kFloat32).contiguous();
    std::vector<int64_t> shape(contiguous_tensor.sizes().begin(), contiguous_tensor.sizes().end());
    const float* begin = contiguous_tensor.data_ptr<float>();
    return Tensor(std::vector<float>(begin, begin + contiguous_tensor.numel()), shape);
}
