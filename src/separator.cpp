#include "separator.hpp"
#include "errors.hpp"
#include <chrono>
#include <iostream>

void check_channels(const SeparationModel &model, const RawAudio &raw_audio)
{
    if (raw_audio.channels() != model.audio_channels())
    {
        throw ShapeError("input has " + std::to_string(raw_audio.channels()) + " channels, model expects " +
                         std::to_string(model.audio_channels()));
    }
}

std::map<std::string, RawAudio> separate_tracks(SeparationModel &model,
                                                const RawAudio &raw_audio,
                                                const SeparationOptions &options)
{
    check_channels(model, raw_audio);
    const int64_t channels = raw_audio.channels();
    const int64_t samples = raw_audio.frames();
    Tensor mix(planarize(raw_audio.channel_data), {1, channels, samples});

    Tensor result = apply_model(model, mix, options);

    const int64_t length = result.last_dim();
    const auto &sources = model.sources();
    if (result.size(1) != static_cast<int64_t>(sources.size()) || result.size(2) != channels)
    {
        throw ShapeError("separated output " + shape_to_string(result.shape) + " does not match " +
                         std::to_string(sources.size()) + " sources of " + std::to_string(channels) + " channels");
    }

    std::map<std::string, RawAudio> tracks;
    for (size_t s = 0; s < sources.size(); ++s)
    {
        RawAudio track;
        track.sample_rate = raw_audio.sample_rate;
        for (int64_t c = 0; c < channels; ++c)
        {
            auto begin = result.data.begin() + (static_cast<int64_t>(s) * channels + c) * length;
            track.channel_data.emplace_back(begin, begin + length);
        }
        tracks[sources[s]] = std::move(track);
    }
    return tracks;
}

StemSeparator::StemSeparator(const ModelConfig &config)
{
    auto processor = std::make_unique<MLProcessor>(config);
    initialized_ok_ = processor->is_loaded();
    model_ = std::move(processor);

    if (initialized_ok_)
    {
        std::cout << "Stem separator initialized with " << config.sources.size() << " sources." << std::endl;
    }
    else
    {
        std::cerr << "Stem separator failed to initialize: model could not be loaded." << std::endl;
    }
}

StemSeparator::StemSeparator(std::unique_ptr<SeparationModel> model)
    : model_(std::move(model)), initialized_ok_(model_ != nullptr)
{
}

bool StemSeparator::is_initialized() const
{
    return initialized_ok_;
}

std::map<std::string, RawAudio> StemSeparator::separate(const RawAudio &raw_audio, const SeparationOptions &options)
{
    if (!initialized_ok_)
    {
        throw std::runtime_error("stem separator is not initialized");
    }

    SeparationMetrics metrics;
    metrics.frames = raw_audio.frames();
    metrics.channels = raw_audio.channels();
    metrics.sources = static_cast<int>(model_->sources().size());

    // Track chunk counts while forwarding progress to the caller.
    SeparationOptions tracked = options;
    tracked.progress = [&metrics, &options](long step, long total)
    {
        metrics.chunks_processed = step;
        metrics.total_chunks = total;
        if (options.progress)
            options.progress(step, total);
    };

    auto start_time = std::chrono::high_resolution_clock::now();
    auto tracks = separate_tracks(*model_, raw_audio, tracked);
    auto end_time = std::chrono::high_resolution_clock::now();

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    metrics.processing_time_ms = duration.count() / 1000.0;
    last_metrics_ = metrics;

    return tracks;
}
