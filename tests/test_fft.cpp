#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "dsp_utils.hpp"
#include "errors.hpp"
#include "helpers/test_signals.hpp"

namespace
{

constexpr double kPi = 3.14159265358979323846;

class FftRoundTrip : public ::testing::TestWithParam<size_t>
{
};

}  // namespace

TEST_P(FftRoundTrip, InverseRecoversRealSignal)
{
    const size_t n = GetParam();
    auto x = test_signals::random_signal(n, static_cast<unsigned>(n));
    auto spectrum = fft(x);
    auto back = ifft(spectrum.real, spectrum.imag);

    for (size_t i = 0; i < n; ++i)
    {
        EXPECT_NEAR(back.real[i], x[i], 1e-5) << "sample " << i;
        EXPECT_NEAR(back.imag[i], 0.0f, 1e-5) << "sample " << i;
    }
}

INSTANTIATE_TEST_SUITE_P(PowerOfTwoSizes, FftRoundTrip, ::testing::Values(1, 2, 8, 64, 1024, 4096));

TEST(Fft, RejectsNonPowerOfTwo)
{
    EXPECT_THROW(fft(std::vector<float>(12, 0.0f)), SizeError);
    EXPECT_THROW(fft(std::vector<float>{}), SizeError);
    EXPECT_THROW(ifft(std::vector<float>(6, 0.0f), std::vector<float>(6, 0.0f)), SizeError);
}

TEST(Fft, ImpulseHasFlatSpectrum)
{
    std::vector<float> impulse(16, 0.0f);
    impulse[0] = 1.0f;
    auto spectrum = fft(impulse);
    for (size_t k = 0; k < 16; ++k)
    {
        EXPECT_NEAR(spectrum.real[k], 1.0f, 1e-6);
        EXPECT_NEAR(spectrum.imag[k], 0.0f, 1e-6);
    }
}

TEST(Fft, CosineLandsInItsBin)
{
    const size_t n = 64;
    std::vector<float> x(n);
    for (size_t i = 0; i < n; ++i)
        x[i] = static_cast<float>(std::cos(2.0 * kPi * 5.0 * i / n));

    auto spectrum = fft(x);
    EXPECT_NEAR(spectrum.real[5], n / 2.0, 1e-4);
    EXPECT_NEAR(spectrum.real[n - 5], n / 2.0, 1e-4);
    EXPECT_NEAR(spectrum.real[4], 0.0, 1e-4);
    EXPECT_NEAR(spectrum.imag[5], 0.0, 1e-4);
}

TEST(Fft, MatchesTorchForComplexInput)
{
    const size_t n = 256;
    auto re = test_signals::random_signal(n, 7);
    auto im = test_signals::random_signal(n, 8);
    auto ours = fft(re, &im);

    auto input = torch::complex(to_torch(Tensor(re, {static_cast<int64_t>(n)})),
                                to_torch(Tensor(im, {static_cast<int64_t>(n)})));
    auto reference = torch::fft::fft(input);
    auto ref_re = from_torch(torch::real(reference));
    auto ref_im = from_torch(torch::imag(reference));

    EXPECT_LT(test_signals::max_abs_difference(ours.real, ref_re.data), 1e-3);
    EXPECT_LT(test_signals::max_abs_difference(ours.imag, ref_im.data), 1e-3);
}

TEST(HannWindow, IsPeriodic)
{
    auto w = hann_window(8);
    ASSERT_EQ(w.size(), 8u);
    EXPECT_FLOAT_EQ(w[0], 0.0f);
    EXPECT_FLOAT_EQ(w[4], 1.0f);
    EXPECT_NEAR(w[2], 0.5f, 1e-6);
    EXPECT_NEAR(w[1], w[7], 1e-6);

    auto reference = from_torch(torch::hann_window(8));
    EXPECT_LT(test_signals::max_abs_difference(w, reference.data), 1e-6);
}
