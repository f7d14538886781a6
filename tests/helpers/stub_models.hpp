#ifndef STUB_MODELS_HPP
#define STUB_MODELS_HPP
#include "ml_processor.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace stub_models {

// Deterministic stand-ins for the separation network. The mask output has the
// shape the real network produces; `time` and `mask` contents are chosen per
// stub so the expected pipeline output is known in closed form.
class StubModel : public SeparationModel {
public:
    StubModel(int samplerate, double segment, int channels,
              std::vector<std::string> sources = {"drums", "bass", "other", "vocals"})
        : sources_(std::move(sources)), channels_(channels), samplerate_(samplerate), segment_(segment) {}

    const std::vector<std::string>& sources() const override { return sources_; }
    int audio_channels() const override { return channels_; }
    int samplerate() const override { return samplerate_; }
    double segment() const override { return segment_; }

    ModelOutput forward(const Tensor& mix, const Tensor& magspec) override {
        ++forward_calls;
        last_mix_shape = mix.shape;
        last_magspec_shape = magspec.shape;

        const int64_t sources = static_cast<int64_t>(sources_.size());
        Tensor mask_out({1, sources, magspec.shape[1], magspec.shape[2], magspec.shape[3]});
        Tensor time_out({1, sources, mix.shape[1], mix.shape[2]});
        fill(mix, magspec, mask_out, time_out);
        return {mask_out, time_out};
    }

    int forward_calls = 0;
    std::vector<int64_t> last_mix_shape;
    std::vector<int64_t> last_magspec_shape;

protected:
    virtual void fill(const Tensor& mix, const Tensor& magspec, Tensor& mask_out, Tensor& time_out) = 0;

private:
    std::vector<std::string> sources_;
    int channels_;
    int samplerate_;
    double segment_;
};

// Time branch = (s + 1) * mix, zero mask.
class ScaledMixModel : public StubModel {
public:
    using StubModel::StubModel;

protected:
    void fill(const Tensor& mix, const Tensor&, Tensor&, Tensor& time_out) override {
        const int64_t per_source = mix.numel();
        for (int64_t s = 0; s < time_out.shape[1]; ++s) {
            for (int64_t i = 0; i < per_source; ++i) {
                time_out.data[s * per_source + i] = static_cast<float>(s + 1) * mix.data[i];
            }
        }
    }
};

// Time branch = constant, zero mask.
class ConstantModel : public StubModel {
public:
    ConstantModel(int samplerate, double segment, int channels, float value)
        : StubModel(samplerate, segment, channels), value_(value) {}

protected:
    void fill(const Tensor&, const Tensor&, Tensor&, Tensor& time_out) override {
        std::fill(time_out.data.begin(), time_out.data.end(), value_);
    }

private:
    float value_;
};

// Frequency branch only: mask = gain_s * input spectrogram with gain_s = 0.5 * (s + 1).
class SpectralGainModel : public StubModel {
public:
    using StubModel::StubModel;

    static float gain(int64_t source) { return 0.5f * static_cast<float>(source + 1); }

protected:
    void fill(const Tensor&, const Tensor& magspec, Tensor& mask_out, Tensor&) override {
        const int64_t per_source = magspec.numel();
        for (int64_t s = 0; s < mask_out.shape[1]; ++s) {
            for (int64_t i = 0; i < per_source; ++i) {
                mask_out.data[s * per_source + i] = gain(s) * magspec.data[i];
            }
        }
    }
};

// Returns a time branch one sample short so the branches cannot be summed.
class MismatchedModel : public StubModel {
public:
    using StubModel::StubModel;

    ModelOutput forward(const Tensor& mix, const Tensor& magspec) override {
        auto out = StubModel::forward(mix, magspec);
        auto shape = out.time.shape;
        shape.back() -= 1;
        out.time = Tensor(shape);
        return out;
    }

protected:
    void fill(const Tensor&, const Tensor&, Tensor&, Tensor&) override {}
};

}  // namespace stub_models

#endif
