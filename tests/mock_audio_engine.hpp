#ifndef SVXCONV_MOCK_AUDIO_ENGINE_HPP
#define SVXCONV_MOCK_AUDIO_ENGINE_HPP

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <string>

#include "converter/AudioEngine.hpp"
#include "converter/Errors.hpp"

// Deterministic stand-in for LibavEngine. Sources are remembered by path and
// "decoded" by regenerating their signal at the plan's output rate.
class MockAudioEngine : public AudioEngine {
public:
    SourceDescriptor Inspect(const std::filesystem::path& path) override {
        ++inspect_calls;
        if (!std::filesystem::exists(path)) {
            throw IOError("Input file not found: " + path.string());
        }
        auto it = signals_.find(Key(path));
        if (it == signals_.end()) {
            throw EngineFailure("Unrecognized input: " + path.string(), {});
        }
        return SourceDescriptor{path, InfoFor(it->second)};
    }

    SourceDescriptor Synthesize(const SignalSpec& spec, const std::filesystem::path& path) override {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("Could not create " + path.string());
        }
        out << "RIFF";
        out.close();
        signals_[Key(path)] = spec;
        return Inspect(path);
    }

    SampleBuffer Process(const SourceDescriptor& source, const ConversionPlan& plan) override {
        ++process_calls;
        last_plan = plan;
        if (fail_process) {
            throw EngineFailure("Injected engine failure", plan);
        }

        const SignalSpec& spec = signals_.at(Key(source.path));
        const long long in_count = source.info.sample_count;
        const int out_rate = PlanOutputRate(plan, source.info.sample_rate);
        long long out_count = (in_count * out_rate + source.info.sample_rate - 1) / source.info.sample_rate;
        if (spec.waveform == SignalSpec::Waveform::Silence && PlanHas<TrimSilenceStage>(plan)) {
            // Nothing rises above the trim threshold.
            out_count = 0;
        }

        double amplitude = 0.0;
        if (spec.waveform == SignalSpec::Waveform::Sine) {
            double gain_db = spec.gain_db;
            for (const ProcessingStage& stage : plan) {
                if (const GainStage* gain = std::get_if<GainStage>(&stage)) {
                    gain_db += gain->gain_db;
                }
            }
            amplitude = PlanHas<NormalizeStage>(plan) ? 1.0 : std::pow(10.0, gain_db / 20.0);
            amplitude = std::min(amplitude, 1.0);
        }

        const double kTwoPi = 6.283185307179586;
        SampleBuffer samples(static_cast<std::size_t>(out_count));
        for (long long i = 0; i < out_count; ++i) {
            const double value = amplitude * std::sin(kTwoPi * spec.frequency_hz * static_cast<double>(i) / out_rate);
            samples[static_cast<std::size_t>(i)] = static_cast<int8_t>(std::lround(value * 127.0));
        }
        ReportProgress(1.0);
        return samples;
    }

    bool fail_process = false;
    int inspect_calls = 0;
    int process_calls = 0;
    ConversionPlan last_plan;

private:
    static std::string Key(const std::filesystem::path& path) { return path.lexically_normal().string(); }

    static SourceInfo InfoFor(const SignalSpec& spec) {
        SourceInfo info;
        info.sample_rate = spec.sample_rate;
        info.channels = spec.channels;
        switch (spec.format) {
        case SignalSpec::SampleFormat::S16:
            info.bits_per_sample = 16;
            break;
        case SignalSpec::SampleFormat::S24:
            info.bits_per_sample = 24;
            break;
        case SignalSpec::SampleFormat::F32:
            info.bits_per_sample = 32;
            break;
        }
        info.sample_count = std::llround(spec.duration_s * spec.sample_rate);
        return info;
    }

    std::map<std::string, SignalSpec> signals_;
};

#endif // SVXCONV_MOCK_AUDIO_ENGINE_HPP
