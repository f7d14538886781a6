#include "spectrogram.hpp"
#include "dsp_utils.hpp"
#include "errors.hpp"
#include <algorithm>

namespace {

const SpectralAnalyzer& model_analyzer() {
    static const SpectralAnalyzer analyzer(kSpecFft, kSpecHop);
    return analyzer;
}

}  // namespace

int64_t spec_frames(int64_t length) {
    return (length + kSpecHop - 1) / kSpecHop;
}

ComplexTensor spec(const Tensor& x) {
    const int64_t length = x.last_dim();
    const int64_t le = spec_frames(length);

    auto padded = pad1d(x, {kSpecPad, kSpecPad + le * kSpecHop - length}, PadMode::Reflect);
    auto z = model_analyzer().analyze_spectrum(padded);

    // Drop the Nyquist bin and keep frames [2, 2 + le).
    const auto& shape = z.shape();
    const size_t ndim = shape.size();
    const int64_t freqs = shape[ndim - 2];
    const int64_t frames = shape[ndim - 1];
    const int64_t kept_freqs = freqs - 1;
    if (frames < le + kSpecFrameOffset) {
        throw ShapeError("spectrogram has " + std::to_string(frames) + " frames, expected at least " +
                         std::to_string(le + kSpecFrameOffset));
    }

    auto out_shape = shape;
    out_shape[ndim - 2] = kept_freqs;
    out_shape[ndim - 1] = le;
    ComplexTensor out(out_shape);

    const int64_t outer = z.real.numel() / (freqs * frames);
    for (int64_t i = 0; i < outer; ++i) {
        for (int64_t f = 0; f < kept_freqs; ++f) {
            const int64_t src = (i * freqs + f) * frames + kSpecFrameOffset;
            const int64_t dst = (i * kept_freqs + f) * le;
            std::copy(z.real.data.begin() + src, z.real.data.begin() + src + le, out.real.data.begin() + dst);
            std::copy(z.imag.data.begin() + src, z.imag.data.begin() + src + le, out.imag.data.begin() + dst);
        }
    }
    return out;
}

Tensor ispec(const ComplexTensor& z, int64_t length) {
    auto padded = pad_complex(z, {0, 1}, {kSpecFrameOffset, kSpecFrameOffset});
    const int64_t le = kSpecHop * spec_frames(length) + 2 * kSpecPad;
    auto x = model_analyzer().reconstruct_audio(padded, le);
    return slice_last(x, kSpecPad, length);
}

Tensor magnitude(const ComplexTensor& z) {
    const auto& shape = z.shape();
    if (shape.size() != 4) {
        throw ShapeError("magnitude expects [B, C, Fr, T], got " + shape_to_string(shape));
    }
    const int64_t B = shape[0], C = shape[1], Fr = shape[2], T = shape[3];
    const int64_t plane = Fr * T;

    Tensor out({B, 2 * C, Fr, T});
    for (int64_t b = 0; b < B; ++b) {
        for (int64_t c = 0; c < C; ++c) {
            const int64_t src = (b * C + c) * plane;
            const int64_t dst_re = (b * 2 * C + 2 * c) * plane;
            const int64_t dst_im = dst_re + plane;
            std::copy(z.real.data.begin() + src, z.real.data.begin() + src + plane, out.data.begin() + dst_re);
            std::copy(z.imag.data.begin() + src, z.imag.data.begin() + src + plane, out.data.begin() + dst_im);
        }
    }
    return out;
}

ComplexTensor mask(const Tensor& m) {
    if (m.dim() != 5) {
        throw ShapeError("mask expects [B, S, C, Fr, T], got " + shape_to_string(m.shape));
    }
    const int64_t B = m.shape[0], S = m.shape[1], C = m.shape[2], Fr = m.shape[3], T = m.shape[4];
    if (C % 2 != 0) {
        throw ShapeError("mask channel dimension must be even, got " + std::to_string(C));
    }
    const int64_t half = C / 2;
    const int64_t plane = Fr * T;

    ComplexTensor out({B, S, half, Fr, T});
    for (int64_t bs = 0; bs < B * S; ++bs) {
        for (int64_t c = 0; c < half; ++c) {
            const int64_t src_re = (bs * C + 2 * c) * plane;
            const int64_t src_im = src_re + plane;
            const int64_t dst = (bs * half + c) * plane;
            std::copy(m.data.begin() + src_re, m.data.begin() + src_re + plane, out.real.data.begin() + dst);
            std::copy(m.data.begin() + src_im, m.data.begin() + src_im + plane, out.imag.data.begin() + dst);
        }
    }
    return out;
}
