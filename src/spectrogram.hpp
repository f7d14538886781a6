#ifndef SPECTROGRAM_HPP
#define SPECTROGRAM_HPP
#include "tensor.hpp"

// Framing constants the separation network was trained with. They are fixed
// by the trained weights and are not derived from each other.
constexpr int kSpecHop = 1024;
constexpr int kSpecFft = 4 * kSpecHop;
constexpr int kSpecPad = kSpecHop / 2 * 3;
constexpr int kSpecFrameOffset = 2;
constexpr int kModelBins = kSpecFft / 2;

// Number of frames `spec` produces for a signal of `length` samples.
int64_t spec_frames(int64_t length);

// [..., length] -> complex [..., 2048, ceil(length / 1024)]
ComplexTensor spec(const Tensor& x);

// Inverse of `spec`; the result is cropped to `length` samples.
Tensor ispec(const ComplexTensor& z, int64_t length);

// Complex [B, C, Fr, T] -> [B, 2C, Fr, T] with channels (re_0, im_0, re_1, im_1, ...).
Tensor magnitude(const ComplexTensor& z);

// [B, S, C, Fr, T] -> complex [B, S, C / 2, Fr, T], undoing `magnitude`'s
// channel interleaving. C must be even.
ComplexTensor mask(const Tensor& m);

#endif
