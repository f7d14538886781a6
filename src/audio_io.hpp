#ifndef AUDIO_IO_HPP
#define AUDIO_IO_HPP
#include <string>
#include <vector>

// Planar audio: one equal-length sample vector per channel.
struct RawAudio {
    std::vector<std::vector<float>> channel_data;
    int sample_rate = 44100;

    int channels() const { return static_cast<int>(channel_data.size()); }
    long frames() const { return channel_data.empty() ? 0 : static_cast<long>(channel_data[0].size()); }
};

/**
 * @brief Loads an audio file with libsndfile, keeping every channel.
 * @throws std::runtime_error if the file cannot be opened or read.
 */
RawAudio load_audio(const std::string& path);

/**
 * @brief Writes planar audio as WAV, 16-bit PCM unless `as_float` is set.
 *
 * PCM output is clipped to [-1, 1] by libsndfile.
 * @throws std::runtime_error if the file cannot be written.
 */
void save_audio(const std::string& path, const RawAudio& audio, bool as_float = false);

// Concatenates the channels into one [channels * frames] buffer.
// Throws ShapeError for an empty channel list or unequal channel lengths.
std::vector<float> planarize(const std::vector<std::vector<float>>& channel_data);

#endif
