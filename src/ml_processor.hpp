#ifndef ML_PROCESSOR_HPP
#define ML_PROCESSOR_HPP
#include "tensor.hpp"
#include <torch/script.h>
#include <string>
#include <vector>

struct ModelConfig {
    std::string model_path = "htdemucs.pt";
    std::vector<std::string> sources = {"drums", "bass", "other", "vocals"};
    int audio_channels = 2;
    int samplerate = 44100;
    double segment = 7.8;  // seconds
};

struct ModelOutput {
    Tensor mask;  // [1, sources, 2 * channels, 2048, frames]
    Tensor time;  // [1, sources, channels, training_length]
};

// The separation network as seen by the chunking pipeline.
class SeparationModel {
public:
    virtual ~SeparationModel() = default;

    virtual const std::vector<std::string>& sources() const = 0;
    virtual int audio_channels() const = 0;
    virtual int samplerate() const = 0;
    virtual double segment() const = 0;

    // mix: [1, channels, training_length]
    // magspec: [1, 2 * channels, 2048, frames]
    virtual ModelOutput forward(const Tensor& mix, const Tensor& magspec) = 0;

    int64_t training_length() const;

    // Length a chunk of `length` samples must be padded to before inference.
    // Throws RangeError for chunks longer than the training length.
    int64_t valid_length(int64_t length) const;
};

// TorchScript export of the network, run on CPU.
class MLProcessor : public SeparationModel {
public:
    explicit MLProcessor(const ModelConfig& config);
    bool is_loaded() const;

    const std::vector<std::string>& sources() const override { return config_.sources; }
    int audio_channels() const override { return config_.audio_channels; }
    int samplerate() const override { return config_.samplerate; }
    double segment() const override { return config_.segment; }

    ModelOutput forward(const Tensor& mix, const Tensor& magspec) override;

private:
    ModelConfig config_;
    torch::jit::script::Module module_;
    bool model_loaded_ = false;
};

#endif
