#include "audio_io.hpp"
#include "errors.hpp"
#include <sndfile.h>
#include <iostream>
#include <stdexcept>

RawAudio load_audio(const std::string& path) {
    SF_INFO sfinfo{};
    SNDFILE* infile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!infile) {
        throw std::runtime_error("could not open input file " + path + ": " + sf_strerror(nullptr));
    }

    std::vector<float> buffer(static_cast<size_t>(sfinfo.frames * sfinfo.channels));
    const sf_count_t read = sf_readf_float(infile, buffer.data(), sfinfo.frames);
    sf_close(infile);
    if (read != sfinfo.frames) {
        throw std::runtime_error("short read from " + path + ": got " + std::to_string(read) +
                                 " of " + std::to_string(sfinfo.frames) + " frames");
    }

    RawAudio audio;
    audio.sample_rate = sfinfo.samplerate;
    audio.channel_data.assign(sfinfo.channels, std::vector<float>(static_cast<size_t>(sfinfo.frames)));
    for (sf_count_t s = 0; s < sfinfo.frames; ++s) {
        for (int c = 0; c < sfinfo.channels; ++c) {
            audio.channel_data[c][s] = buffer[s * sfinfo.channels + c];
        }
    }

    std::cout << "Loaded audio file: " << path << " (" << sfinfo.frames << " samples, "
              << sfinfo.channels << " channels, " << sfinfo.samplerate << " Hz)" << std::endl;
    return audio;
}

void save_audio(const std::string& path, const RawAudio& audio, bool as_float) {
    const auto planar = planarize(audio.channel_data);
    const int channels = audio.channels();
    const long frames = audio.frames();

    SF_INFO sfinfo{};
    sfinfo.samplerate = audio.sample_rate;
    sfinfo.channels = channels;
    sfinfo.format = SF_FORMAT_WAV | (as_float ? SF_FORMAT_FLOAT : SF_FORMAT_PCM_16);

    SNDFILE* outfile = sf_open(path.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        throw std::runtime_error("could not open output file " + path + ": " + sf_strerror(nullptr));
    }
    if (!as_float) {
        sf_command(outfile, SFC_SET_CLIPPING, nullptr, SF_TRUE);
    }

    std::vector<float> interleaved(planar.size());
    for (long s = 0; s < frames; ++s) {
        for (int c = 0; c < channels; ++c) {
            interleaved[s * channels + c] = planar[c * frames + s];
        }
    }

    const sf_count_t written = sf_writef_float(outfile, interleaved.data(), frames);
    const std::string error = sf_strerror(outfile);
    sf_close(outfile);
    if (written != frames) {
        throw std::runtime_error("could not write " + path + ": " + error);
    }
}

std::vector<float> planarize(const std::vector<std::vector<float>>& channel_data) {
    if (channel_data.empty()) {
        throw ShapeError("audio has no channels");
    }
    const size_t samples = channel_data[0].size();
    std::vector<float> data;
    data.reserve(channel_data.size() * samples);
    for (size_t c = 0; c < channel_data.size(); ++c) {
        if (channel_data[c].size() != samples) {
            throw ShapeError("channel " + std::to_string(c) + " has " + std::to_string(channel_data[c].size()) +
                             " samples, expected " + std::to_string(samples));
        }
        data.insert(data.end(), channel_data[c].begin(), channel_data[c].end());
    }
    return data;
}
