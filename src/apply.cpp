#include "apply.hpp"
#include "errors.hpp"
#include "spectrogram.hpp"
#include <algorithm>
#include <cmath>

TensorChunk::TensorChunk(const Tensor& tensor, int64_t offset, int64_t length)
    : tensor_(tensor), offset_(offset) {
    const int64_t total_length = tensor.last_dim();
    if (offset < 0) throw RangeError("offset must be >= 0, got " + std::to_string(offset));
    if (offset >= total_length) {
        throw RangeError("offset " + std::to_string(offset) + " must be < total length " +
                         std::to_string(total_length));
    }
    length_ = length < 0 ? total_length - offset : std::min(total_length - offset, length);
}

Tensor TensorChunk::padded(int64_t target_length) const {
    const int64_t delta = target_length - length_;
    if (delta < 0) {
        throw RangeError("target length " + std::to_string(target_length) +
                         " is shorter than chunk length " + std::to_string(length_));
    }
    const int64_t total_length = tensor_.last_dim();
    const int64_t start = offset_ - delta / 2;
    const int64_t end = start + target_length;
    const int64_t correct_start = std::max<int64_t>(0, start);
    const int64_t correct_end = std::min(total_length, end);

    auto valid = slice_last(tensor_, correct_start, correct_end - correct_start);
    return pad_last(valid, correct_start - start, end - correct_end);
}

Accumulator::Accumulator(int64_t batch, int64_t sources, int64_t channels, int64_t length)
    : output_({batch, sources, channels, length}), weight_sum_(static_cast<size_t>(length), 0.0f) {}

void Accumulator::add(const Tensor& chunk_out, int64_t offset, const std::vector<float>& weight) {
    if (finalized_) {
        throw std::runtime_error("accumulator has already been finalized");
    }
    const auto& shape = output_.shape;
    if (chunk_out.dim() != 4 || !std::equal(shape.begin(), shape.end() - 1, chunk_out.shape.begin())) {
        throw ShapeError("chunk output " + shape_to_string(chunk_out.shape) +
                         " does not fit accumulator " + shape_to_string(shape));
    }
    const int64_t length = shape[3];
    const int64_t chunk_length = chunk_out.last_dim();
    if (offset < 0 || offset + chunk_length > length || chunk_length > static_cast<int64_t>(weight.size())) {
        throw RangeError("chunk of " + std::to_string(chunk_length) + " samples at offset " +
                         std::to_string(offset) + " exceeds output of " + std::to_string(length));
    }

    const int64_t rows = chunk_out.outer_size();
    for (int64_t r = 0; r < rows; ++r) {
        const float* src = chunk_out.data.data() + r * chunk_length;
        float* dst = output_.data.data() + r * length + offset;
        for (int64_t t = 0; t < chunk_length; ++t) {
            dst[t] += weight[t] * src[t];
        }
    }
    for (int64_t t = 0; t < chunk_length; ++t) {
        weight_sum_[offset + t] += weight[t];
    }
}

Tensor Accumulator::finalize() {
    if (finalized_) {
        throw std::runtime_error("accumulator has already been finalized");
    }
    finalized_ = true;
    const int64_t length = output_.last_dim();
    const int64_t rows = output_.outer_size();
    for (int64_t r = 0; r < rows; ++r) {
        float* row = output_.data.data() + r * length;
        for (int64_t t = 0; t < length; ++t) {
            row[t] /= weight_sum_[t];
        }
    }
    return std::move(output_);
}

std::vector<float> segment_weight(int64_t segment) {
    std::vector<float> weight(static_cast<size_t>(segment));
    const int64_t half = segment / 2;
    for (int64_t i = 0; i < segment; ++i) {
        weight[i] = static_cast<float>(i <= half ? i + 1 : segment - i);
    }
    const float max_weight = *std::max_element(weight.begin(), weight.end());
    for (auto& w : weight) w /= max_weight;
    return weight;
}

Tensor apply_inference(SeparationModel& model, const TensorChunk& chunk) {
    const int64_t length = chunk.length();
    const int64_t valid_length = model.valid_length(length);
    const int64_t training_length = model.training_length();

    auto padded_mix = chunk.padded(valid_length);
    if (padded_mix.last_dim() < training_length) {
        padded_mix = pad_last(padded_mix, 0, training_length - padded_mix.last_dim());
    }

    auto magspec = magnitude(spec(padded_mix));
    auto [mask_out, time_out] = model.forward(padded_mix, magspec);

    auto from_spec = ispec(mask(mask_out), training_length);
    auto out = crop_last(add(time_out, from_spec), valid_length);
    return center_trim(out, length);
}

Tensor apply_splits(SeparationModel& model, const Tensor& mix, const SeparationOptions& options) {
    if (mix.dim() != 3) {
        throw ShapeError("mix must be [batch, channels, length], got " + shape_to_string(mix.shape));
    }
    if (!(options.overlap >= 0.0 && options.overlap < 1.0)) {
        throw RangeError("overlap must be in [0, 1), got " + std::to_string(options.overlap));
    }
    const int64_t batch = mix.shape[0];
    const int64_t channels = mix.shape[1];
    const int64_t length = mix.shape[2];
    const int64_t sources = static_cast<int64_t>(model.sources().size());

    const int64_t segment = model.training_length();
    const int64_t stride = static_cast<int64_t>(std::floor((1.0 - options.overlap) * segment));
    if (stride <= 0) {
        throw RangeError("chunk stride must be positive, segment is " + std::to_string(segment));
    }
    const auto weight = segment_weight(segment);

    Accumulator accumulator(batch, sources, channels, length);
    const long total = static_cast<long>((length + stride - 1) / stride);
    if (options.progress) options.progress(0, total);

    long chunk_index = 0;
    for (int64_t offset = 0; offset < length; offset += stride) {
        if (options.cancel && options.cancel->load()) {
            throw SeparationCancelled();
        }
        TensorChunk chunk(mix, offset, segment);
        accumulator.add(apply_inference(model, chunk), offset, weight);
        ++chunk_index;
        if (options.progress) options.progress(chunk_index, total);
    }
    return accumulator.finalize();
}

Tensor apply_model(SeparationModel& model, const Tensor& mix, const SeparationOptions& options) {
    return apply_splits(model, mix, options);
}
