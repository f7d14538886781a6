#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "audio_io.hpp"
#include "errors.hpp"
#include "helpers/test_signals.hpp"

namespace fs = std::filesystem;

namespace
{

class AudioIoTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("stem_separation_audio_io_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    RawAudio stereo(size_t frames) const
    {
        RawAudio audio;
        audio.sample_rate = 22050;
        audio.channel_data.push_back(test_signals::sine(frames, 440.0, 22050.0));
        audio.channel_data.push_back(test_signals::sine(frames, 660.0, 22050.0, 0.25f));
        return audio;
    }

    fs::path dir_;
};

}  // namespace

TEST_F(AudioIoTest, FloatWavRoundTripIsExact)
{
    auto audio = stereo(1000);
    auto path = (dir_ / "float.wav").string();
    save_audio(path, audio, true);

    auto loaded = load_audio(path);
    EXPECT_EQ(loaded.sample_rate, 22050);
    ASSERT_EQ(loaded.channels(), 2);
    ASSERT_EQ(loaded.frames(), 1000);
    EXPECT_EQ(loaded.channel_data[0], audio.channel_data[0]);
    EXPECT_EQ(loaded.channel_data[1], audio.channel_data[1]);
}

TEST_F(AudioIoTest, PcmWavKeepsChannelsWithinQuantisation)
{
    auto audio = stereo(1000);
    auto path = (dir_ / "pcm.wav").string();
    save_audio(path, audio);

    auto loaded = load_audio(path);
    ASSERT_EQ(loaded.channels(), 2);
    EXPECT_LT(test_signals::max_abs_difference(loaded.channel_data[0], audio.channel_data[0]), 1e-3);
    EXPECT_LT(test_signals::max_abs_difference(loaded.channel_data[1], audio.channel_data[1]), 1e-3);
}

TEST_F(AudioIoTest, PcmWavClipsOutOfRangeSamples)
{
    RawAudio audio;
    audio.sample_rate = 8000;
    audio.channel_data.push_back({2.0f, -3.0f, 0.5f});
    auto path = (dir_ / "clip.wav").string();
    save_audio(path, audio);

    auto loaded = load_audio(path);
    ASSERT_EQ(loaded.frames(), 3);
    EXPECT_NEAR(loaded.channel_data[0][0], 1.0f, 1e-3);
    EXPECT_NEAR(loaded.channel_data[0][1], -1.0f, 1e-3);
    EXPECT_NEAR(loaded.channel_data[0][2], 0.5f, 1e-3);
}

TEST_F(AudioIoTest, MissingFileThrows)
{
    EXPECT_THROW(load_audio((dir_ / "missing.wav").string()), std::runtime_error);
}

TEST(Planarize, ConcatenatesChannels)
{
    std::vector<std::vector<float>> channels{{1, 2, 3}, {4, 5, 6}};
    EXPECT_EQ(planarize(channels), (std::vector<float>{1, 2, 3, 4, 5, 6}));
}

TEST(Planarize, RejectsUnequalOrMissingChannels)
{
    EXPECT_THROW(planarize({}), ShapeError);
    EXPECT_THROW(planarize({{1, 2}, {3}}), ShapeError);
}
