#ifndef DSP_UTILS_HPP
#define DSP_UTILS_HPP
#include "tensor.hpp"
#include <optional>
#include <utility>
#include <vector>

enum class PadMode { Constant, Reflect };

struct FftResult {
    std::vector<float> real;
    std::vector<float> imag;
};

// Iterative radix-2 Cooley-Tukey. Throws SizeError unless the length is a
// power of two. A missing imaginary part is treated as zeros.
FftResult fft(const std::vector<float>& real, const std::vector<float>* imag = nullptr);

// conj(fft(conj(x))) / n, so both directions share one code path.
FftResult ifft(const std::vector<float>& real, const std::vector<float>& imag);

// Periodic Hann window: 0.5 * (1 - cos(2 pi i / n)).
std::vector<float> hann_window(int n);

// Pads the trailing dimension of every outer slice. Reflect mode mirrors
// without repeating the edge sample; pads longer than the data first
// zero-extend it just enough to make the reflection valid.
Tensor pad1d(const Tensor& x, std::pair<int64_t, int64_t> paddings, PadMode mode = PadMode::Constant);

// [batch, length] -> [batch, n_fft / 2 + 1, frames]
ComplexTensor stft(const Tensor& x, int n_fft, int hop_length, const std::vector<float>& window,
                   bool normalized = true, bool center = true, PadMode pad_mode = PadMode::Reflect);

// [batch, n_fft / 2 + 1, frames] -> [batch, length]. Without a target length
// the output covers every frame, minus the centering pad when `center` is set.
Tensor istft(const ComplexTensor& z, int n_fft, int hop_length, const std::vector<float>& window,
             bool normalized = true, std::optional<int64_t> length = std::nullopt, bool center = true);

struct StftConfig {
    int n_fft = 512;
    std::optional<int> hop_length;  // n_fft / 4 when unset
    bool normalized = true;
    bool center = true;
    PadMode pad_mode = PadMode::Reflect;

    int effective_hop() const { return hop_length ? *hop_length : n_fft / 4; }
};

// Spectrogram over the trailing dimension of an arbitrarily shaped tensor,
// with a Hann window of n_fft samples.
class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(const StftConfig& config);
    SpectralAnalyzer(int n_fft, std::optional<int> hop_length);

    // [..., length] -> [..., n_fft / 2 + 1, frames]
    ComplexTensor analyze_spectrum(const Tensor& audio) const;

    // [..., freqs, frames] -> [..., length]. n_fft is fixed by the
    // analyzer; the frequency dimension must match it.
    Tensor reconstruct_audio(const ComplexTensor& spectrum, std::optional<int64_t> length = std::nullopt) const;

    int n_fft() const { return config_.n_fft; }
    int hop_length() const { return config_.effective_hop(); }
    const std::vector<float>& window() const { return window_; }

private:
    StftConfig config_;
    std::vector<float> window_;
};

#endif
