#include "dsp_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr float kWindowSumFloor = 1e-8f;

bool is_power_of_two(size_t n) {
    return n > 0 && (n & (n - 1)) == 0;
}

// Torch-style reflection of one slice; pads must not exceed length - 1.
void reflect_slice(const float* src, int64_t length, int64_t pad_left, int64_t pad_right, float* dst) {
    std::copy(src, src + length, dst + pad_left);
    for (int64_t i = 0; i < pad_left; ++i) {
        dst[i] = src[pad_left - i];
    }
    for (int64_t i = 0; i < pad_right; ++i) {
        dst[pad_left + length + i] = src[length - 2 - i];
    }
}

}  // namespace

FftResult fft(const std::vector<float>& real_in, const std::vector<float>* imag_in) {
    const size_t n = real_in.size();
    if (!is_power_of_two(n)) {
        throw SizeError("FFT size must be a power of 2, got " + std::to_string(n));
    }
    if (imag_in && imag_in->size() != n) {
        throw ShapeError("FFT real and imaginary inputs differ in length");
    }

    std::vector<double> re(real_in.begin(), real_in.end());
    std::vector<double> im = imag_in ? std::vector<double>(imag_in->begin(), imag_in->end())
                                     : std::vector<double>(n, 0.0);

    // Bit-reversal permutation
    size_t j = 0;
    for (size_t i = 0; i + 1 < n; ++i) {
        if (i < j) {
            std::swap(re[i], re[j]);
            std::swap(im[i], im[j]);
        }
        size_t k = n >> 1;
        while (k <= j) {
            j -= k;
            k >>= 1;
        }
        j += k;
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        const size_t half = len >> 1;
        const double angle = -2.0 * kPi / static_cast<double>(len);
        const double step_re = std::cos(angle);
        const double step_im = std::sin(angle);

        for (size_t i = 0; i < n; i += len) {
            double wr = 1.0, wi = 0.0;
            for (size_t m = 0; m < half; ++m) {
                const size_t a = i + m;
                const size_t b = a + half;
                const double tr = wr * re[b] - wi * im[b];
                const double ti = wr * im[b] + wi * re[b];
                re[b] = re[a] - tr;
                im[b] = im[a] - ti;
                re[a] += tr;
                im[a] += ti;

                const double w_prev = wr;
                wr = w_prev * step_re - wi * step_im;
                wi = w_prev * step_im + wi * step_re;
            }
        }
    }

    return {std::vector<float>(re.begin(), re.end()), std::vector<float>(im.begin(), im.end())};
}

FftResult ifft(const std::vector<float>& real_in, const std::vector<float>& imag_in) {
    const size_t n = real_in.size();
    if (imag_in.size() != n) {
        throw ShapeError("IFFT real and imaginary inputs differ in length");
    }
    std::vector<float> conj(n);
    for (size_t i = 0; i < n; ++i) conj[i] = -imag_in[i];

    auto result = fft(real_in, &conj);
    const float scale = 1.0f / static_cast<float>(n);
    for (size_t i = 0; i < n; ++i) {
        result.real[i] *= scale;
        result.imag[i] = -result.imag[i] * scale;
    }
    return result;
}

std::vector<float> hann_window(int n) {
    std::vector<float> w(std::max(n, 0));
    for (int i = 0; i < n; ++i) {
        w[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * kPi * i / n)));
    }
    return w;
}

Tensor pad1d(const Tensor& x, std::pair<int64_t, int64_t> paddings, PadMode mode) {
    auto [pad_left, pad_right] = paddings;
    if (pad_left < 0 || pad_right < 0) {
        throw RangeError("pad1d paddings must be non-negative");
    }
    if (pad_left == 0 && pad_right == 0) {
        return x;
    }
    const int64_t length = x.last_dim();
    // Nothing to mirror in an empty signal, so reflect degrades to zeros.
    if (mode == PadMode::Constant || length == 0) {
        return pad_last(x, pad_left, pad_right);
    }

    Tensor source = x;
    const int64_t max_pad = std::max(pad_left, pad_right);
    if (length <= max_pad) {
        // Too short to reflect: zero-extend by the deficit and reflect the rest.
        const int64_t extra_pad = max_pad - length + 1;
        const int64_t extra_pad_right = std::min(pad_right, extra_pad);
        const int64_t extra_pad_left = extra_pad - extra_pad_right;
        source = pad_last(x, extra_pad_left, extra_pad_right);
        pad_left -= extra_pad_left;
        pad_right -= extra_pad_right;
    }

    const int64_t current = source.last_dim();
    const int64_t out_length = current + pad_left + pad_right;
    auto shape = source.shape;
    shape.back() = out_length;
    Tensor out(shape);

    const int64_t outer = source.outer_size();
    for (int64_t i = 0; i < outer; ++i) {
        reflect_slice(source.data.data() + i * current, current, pad_left, pad_right,
                      out.data.data() + i * out_length);
    }
    return out;
}

ComplexTensor stft(const Tensor& x, int n_fft, int hop_length, const std::vector<float>& window,
                   bool normalized, bool center, PadMode pad_mode) {
    if (x.dim() != 2) {
        throw ShapeError("stft expects [batch, length], got " + shape_to_string(x.shape));
    }
    if (static_cast<int>(window.size()) != n_fft) {
        throw ShapeError("window length " + std::to_string(window.size()) +
                         " does not match n_fft " + std::to_string(n_fft));
    }
    if (hop_length <= 0) throw RangeError("hop length must be positive");

    const Tensor input = center ? pad1d(x, {n_fft / 2, n_fft / 2}, pad_mode) : x;
    const int64_t batch = input.shape[0];
    const int64_t input_length = input.shape[1];
    if (input_length < n_fft) {
        throw RangeError("stft input of " + std::to_string(input_length) +
                         " samples is shorter than n_fft " + std::to_string(n_fft));
    }

    const int64_t frames = (input_length - n_fft) / hop_length + 1;
    const int64_t freqs = n_fft / 2 + 1;
    const float norm = normalized ? 1.0f / std::sqrt(static_cast<float>(n_fft)) : 1.0f;

    ComplexTensor out({batch, freqs, frames});
    std::vector<float> frame(n_fft);

    for (int64_t b = 0; b < batch; ++b) {
        const float* row = input.data.data() + b * input_length;
        for (int64_t t = 0; t < frames; ++t) {
            const float* start = row + t * hop_length;
            for (int i = 0; i < n_fft; ++i) {
                frame[i] = start[i] * window[i] * norm;
            }
            auto spectrum = fft(frame);
            for (int64_t f = 0; f < freqs; ++f) {
                const int64_t idx = (b * freqs + f) * frames + t;
                out.real.data[idx] = spectrum.real[f];
                out.imag.data[idx] = spectrum.imag[f];
            }
        }
    }
    return out;
}

Tensor istft(const ComplexTensor& z, int n_fft, int hop_length, const std::vector<float>& window,
             bool normalized, std::optional<int64_t> length, bool center) {
    const auto& shape = z.shape();
    if (shape.size() != 3) {
        throw ShapeError("istft expects [batch, freqs, frames], got " + shape_to_string(shape));
    }
    const int64_t batch = shape[0];
    const int64_t freqs = shape[1];
    const int64_t frames = shape[2];
    if (2 * freqs - 2 != n_fft) {
        throw ShapeError("expected freqs = n_fft / 2 + 1, got freqs=" + std::to_string(freqs) +
                         ", n_fft=" + std::to_string(n_fft));
    }
    if (static_cast<int>(window.size()) != n_fft) {
        throw ShapeError("window length does not match n_fft");
    }

    const int64_t offset = center ? n_fft / 2 : 0;
    int64_t output_length = 0;
    if (length) {
        output_length = *length;
    } else {
        output_length = n_fft + (frames - 1) * hop_length - 2 * offset;
    }
    if (output_length < 0) throw RangeError("istft output length is negative");

    Tensor output({batch, output_length});
    std::vector<float> window_sum(static_cast<size_t>(batch * output_length), 0.0f);
    const float norm = normalized ? std::sqrt(static_cast<float>(n_fft)) : 1.0f;

    std::vector<float> full_re(n_fft);
    std::vector<float> full_im(n_fft);

    for (int64_t b = 0; b < batch; ++b) {
        for (int64_t t = 0; t < frames; ++t) {
            for (int64_t f = 0; f < freqs; ++f) {
                const int64_t idx = (b * freqs + f) * frames + t;
                full_re[f] = z.real.data[idx];
                full_im[f] = z.imag.data[idx];
            }
            // X[n - k] = conj(X[k])
            for (int64_t f = freqs; f < n_fft; ++f) {
                full_re[f] = full_re[n_fft - f];
                full_im[f] = -full_im[n_fft - f];
            }

            auto frame = ifft(full_re, full_im);
            const int64_t frame_start = t * hop_length - offset;
            for (int i = 0; i < n_fft; ++i) {
                const int64_t pos = frame_start + i;
                if (pos < 0 || pos >= output_length) continue;
                const int64_t idx = b * output_length + pos;
                output.data[idx] += frame.real[i] * window[i] * norm;
                window_sum[idx] += window[i] * window[i];
            }
        }
    }

    for (size_t i = 0; i < output.data.size(); ++i) {
        if (window_sum[i] > kWindowSumFloor) output.data[i] /= window_sum[i];
    }
    return output;
}

SpectralAnalyzer::SpectralAnalyzer(const StftConfig& config)
    : config_(config), window_(hann_window(config.n_fft)) {}

SpectralAnalyzer::SpectralAnalyzer(int n_fft, std::optional<int> hop_length)
    : SpectralAnalyzer(StftConfig{n_fft, hop_length}) {}

ComplexTensor SpectralAnalyzer::analyze_spectrum(const Tensor& audio) const {
    const int64_t length = audio.last_dim();
    auto flat = reshape(audio, {audio.outer_size(), length});
    auto z = stft(flat, config_.n_fft, hop_length(), window_, config_.normalized, config_.center, config_.pad_mode);

    auto shape = audio.shape;
    shape.back() = z.shape()[1];
    shape.push_back(z.shape()[2]);
    return ComplexTensor(reshape(z.real, shape), reshape(z.imag, shape));
}

Tensor SpectralAnalyzer::reconstruct_audio(const ComplexTensor& spectrum, std::optional<int64_t> length) const {
    const auto& shape = spectrum.shape();
    if (shape.size() < 2) {
        throw ShapeError("spectrum needs [..., freqs, frames], got " + shape_to_string(shape));
    }
    const int64_t freqs = shape[shape.size() - 2];
    const int64_t frames = shape[shape.size() - 1];
    const int64_t outer = spectrum.real.numel() / std::max<int64_t>(1, freqs * frames);

    ComplexTensor flat(reshape(spectrum.real, {outer, freqs, frames}),
                       reshape(spectrum.imag, {outer, freqs, frames}));
    auto x = istft(flat, config_.n_fft, hop_length(), window_, config_.normalized, length, config_.center);

    std::vector<int64_t> out_shape(shape.begin(), shape.end() - 2);
    out_shape.push_back(x.shape[1]);
    return reshape(x, out_shape);
}
