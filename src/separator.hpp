#ifndef SEPARATOR_HPP
#define SEPARATOR_HPP
#include "apply.hpp"
#include "audio_io.hpp"
#include "ml_processor.hpp"
#include <map>
#include <memory>
#include <string>

struct SeparationMetrics {
    double processing_time_ms = 0.0;
    long chunks_processed = 0;
    long total_chunks = 0;
    long frames = 0;
    int channels = 0;
    int sources = 0;
};

// Throws ShapeError unless the audio has exactly the model's channel count.
void check_channels(const SeparationModel& model, const RawAudio& raw_audio);

// Splits raw audio into one RawAudio per model source, keeping the input's
// sample rate and channel count.
std::map<std::string, RawAudio> separate_tracks(SeparationModel& model,
                                                const RawAudio& raw_audio,
                                                const SeparationOptions& options = {});

class StemSeparator {
public:
    explicit StemSeparator(const ModelConfig& config);
    explicit StemSeparator(std::unique_ptr<SeparationModel> model);

    bool is_initialized() const;
    const SeparationModel& model() const { return *model_; }

    std::map<std::string, RawAudio> separate(const RawAudio& raw_audio, const SeparationOptions& options = {});
    SeparationMetrics get_last_metrics() const { return last_metrics_; }

private:
    std::unique_ptr<SeparationModel> model_;
    bool initialized_ok_ = false;
    SeparationMetrics last_metrics_;
};

#endif
