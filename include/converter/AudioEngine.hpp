#ifndef CONVERTER_AUDIO_ENGINE_HPP
#define CONVERTER_AUDIO_ENGINE_HPP

#include <filesystem>
#include <functional>
#include <utility>

#include "container/SvxFormat.hpp"
#include "converter/ConversionPlan.hpp"

// A decodable audio source and what the engine learned about it.
struct SourceDescriptor {
    std::filesystem::path path;
    SourceInfo info;
};

// Synthetic test signal written by AudioEngine::Synthesize.
struct SignalSpec {
    enum class Waveform { Sine, Silence };
    enum class SampleFormat { S16, S24, F32 };

    Waveform waveform = Waveform::Sine;
    double frequency_hz = 440.0;
    double duration_s = 0.05;
    double gain_db = 0.0; // relative to full scale
    int sample_rate = 44100;
    int channels = 1;
    SampleFormat format = SampleFormat::S16;
};

// Performs the DSP work for a conversion plan. Implementations own all
// decoding, filtering and quantization; callers only decide which stages run.
// Every failure is reported as EngineFailure.
class AudioEngine {
public:
    using ProgressCallback = std::function<void(double)>;

    virtual ~AudioEngine() = default;

    // Reads stream properties of an existing file.
    virtual SourceDescriptor Inspect(const std::filesystem::path& path) = 0;

    // Writes a test signal to path as a WAV file and inspects it.
    virtual SourceDescriptor Synthesize(const SignalSpec& spec, const std::filesystem::path& path) = 0;

    // Runs plan over the source and returns mono 8-bit signed samples at the
    // plan's output rate.
    virtual SampleBuffer Process(const SourceDescriptor& source, const ConversionPlan& plan) = 0;

    // Optional progress reporting in [0, 1] while Process runs.
    void SetProgressCallback(ProgressCallback callback) { progress_cb_ = std::move(callback); }

protected:
    void ReportProgress(double progress) const {
        if (progress_cb_) {
            progress_cb_(progress > 1.0 ? 1.0 : progress);
        }
    }

private:
    ProgressCallback progress_cb_;
};

#endif // CONVERTER_AUDIO_ENGINE_HPP
