#ifndef CONVERTER_LIBAV_ENGINE_HPP
#define CONVERTER_LIBAV_ENGINE_HPP

#include <string>
#include <vector>

#include "converter/AudioEngine.hpp"

// Audio engine built on libav*. Sources are decoded with libavformat and
// libavcodec, converted to interleaved float with libswresample, and run
// through a libavfilter graph assembled from the plan stages.
class LibavEngine : public AudioEngine {
public:
    LibavEngine();
    ~LibavEngine() override = default;

    SourceDescriptor Inspect(const std::filesystem::path& path) override;
    SourceDescriptor Synthesize(const SignalSpec& spec, const std::filesystem::path& path) override;
    SampleBuffer Process(const SourceDescriptor& source, const ConversionPlan& plan) override;

    // Interleaved PCM moving between decode and filter passes.
    struct FloatPcm {
        std::vector<float> samples;
        int channels = 0;
        int sample_rate = 0;
    };

    // Filter graph text for one stage (exposed for diagnostics and preview).
    static std::string FilterFor(const ProcessingStage& stage);

private:
    FloatPcm DecodeToFloat(const SourceDescriptor& source);
    SampleBuffer RunPlan(const FloatPcm& decoded, const ConversionPlan& plan);
};

#endif // CONVERTER_LIBAV_ENGINE_HPP
