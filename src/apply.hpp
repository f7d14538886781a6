#ifndef APPLY_HPP
#define APPLY_HPP
#include "ml_processor.hpp"
#include "tensor.hpp"
#include <atomic>
#include <functional>
#include <vector>

using ProgressCallback = std::function<void(long step, long total)>;

struct SeparationOptions {
    double overlap = 0.25;
    ProgressCallback progress;
    const std::atomic<bool>* cancel = nullptr;  // checked between chunks
};

// Window [offset, offset + length) over the trailing dimension of a tensor.
// Holds a reference; the tensor must outlive the chunk.
class TensorChunk {
public:
    TensorChunk(const Tensor& tensor, int64_t offset = 0, int64_t length = -1);

    // Copy of the chunk, `target_length` long and centred on the chunk, taking
    // neighbouring samples from the source where they exist and zeros beyond
    // its bounds.
    Tensor padded(int64_t target_length) const;

    int64_t offset() const { return offset_; }
    int64_t length() const { return length_; }

private:
    const Tensor& tensor_;
    int64_t offset_;
    int64_t length_;
};

// Weighted sum of chunk outputs plus the per-sample sum of weights, owned by
// one apply_splits call.
// Single use: once finalize() has handed out the output, add() and
// finalize() throw.
class Accumulator {
public:
    Accumulator(int64_t batch, int64_t sources, int64_t channels, int64_t length);

    // chunk_out: [batch, sources, channels, chunk_length] placed at `offset`.
    void add(const Tensor& chunk_out, int64_t offset, const std::vector<float>& weight);

    // Divides every sample by its accumulated weight.
    Tensor finalize();

private:
    Tensor output_;
    std::vector<float> weight_sum_;
    bool finalized_ = false;
};

// Triangular window peaking at the midpoint, scaled to a maximum of 1.
std::vector<float> segment_weight(int64_t segment);

// Runs the network on one chunk and returns [1, sources, channels, chunk.length()].
Tensor apply_inference(SeparationModel& model, const TensorChunk& chunk);

// mix: [batch, channels, length] -> [batch, sources, channels, length]
Tensor apply_splits(SeparationModel& model, const Tensor& mix, const SeparationOptions& options = {});

// No random shifts; identical to apply_splits.
Tensor apply_model(SeparationModel& model, const Tensor& mix, const SeparationOptions& options = {});

#endif
