#include "converter/ConversionPlan.hpp"

#include <cmath>
#include <sstream>

#include "converter/Errors.hpp"

namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}

void ValidateConversionOptions(const ConversionOptions& options) {
    if (options.target_rate <= 0 || options.target_rate > kMaxContainerRate) {
        throw InvalidConfig("Target sample rate must be within 1-65535 Hz (got " +
                            std::to_string(options.target_rate) + ")");
    }
    if (options.gain_db.has_value() && !std::isfinite(*options.gain_db)) {
        throw InvalidConfig("Gain must be a finite number of dB");
    }
    if (options.lpf_cutoff_hz.has_value() &&
        (!std::isfinite(*options.lpf_cutoff_hz) || *options.lpf_cutoff_hz <= 0.0)) {
        throw InvalidConfig("Low-pass cutoff must be a positive frequency");
    }
}

ConversionPlan BuildConversionPlan(const ConversionOptions& options, const SourceInfo& source) {
    ValidateConversionOptions(options);
    if (source.sample_rate <= 0) {
        throw InvalidConfig("Source sample rate must be positive (got " + std::to_string(source.sample_rate) + ")");
    }
    if (source.channels < 1) {
        throw InvalidConfig("Source must have at least one channel (got " + std::to_string(source.channels) + ")");
    }

    ConversionPlan plan;

    if (source.channels > 1) {
        plan.push_back(MixToMonoStage{source.channels});
    }

    if (options.trim_silence) {
        plan.push_back(TrimSilenceStage{kTrimThresholdDb, kTrimMinDurationSeconds});
    }

    // Normalize wins over an explicit gain.
    if (options.normalize) {
        plan.push_back(NormalizeStage{0.0});
    } else if (options.gain_db.has_value()) {
        plan.push_back(GainStage{*options.gain_db});
    }

    if (source.sample_rate != options.target_rate) {
        plan.push_back(ResampleStage{source.sample_rate, options.target_rate});
    }

    // The two low-pass stages stack when both are requested.
    if (options.amiga_lpf) {
        plan.push_back(LowPassStage{kAmigaLowPassHz, LowPassStage::Origin::Amiga});
    }
    if (options.lpf_cutoff_hz.has_value()) {
        plan.push_back(LowPassStage{*options.lpf_cutoff_hz, LowPassStage::Origin::Manual});
    }

    if (options.dither) {
        plan.push_back(DitherStage{kTargetBits});
    } else {
        plan.push_back(TruncateStage{kTargetBits});
    }

    return plan;
}

int PlanOutputRate(const ConversionPlan& plan, int source_rate) {
    int rate = source_rate;
    for (const ProcessingStage& stage : plan) {
        if (const ResampleStage* resample = std::get_if<ResampleStage>(&stage)) {
            rate = resample->to_rate;
        }
    }
    return rate;
}

std::string DescribeStage(const ProcessingStage& stage) {
    std::ostringstream out;
    std::visit(Overloaded{
                   [&out](const MixToMonoStage& s) { out << "mix " << s.channels << " channels to mono"; },
                   [&out](const TrimSilenceStage& s) {
                       out << "trim silence below " << s.threshold_db << " dB at both ends";
                   },
                   [&out](const GainStage& s) { out << "gain " << s.gain_db << " dB"; },
                   [&out](const NormalizeStage& s) { out << "normalize to " << s.target_dbfs << " dBFS"; },
                   [&out](const ResampleStage& s) {
                       out << "resample " << s.from_rate << " Hz -> " << s.to_rate << " Hz";
                   },
                   [&out](const LowPassStage& s) {
                       out << (s.origin == LowPassStage::Origin::Amiga ? "A500-style low-pass " : "low-pass ")
                           << s.cutoff_hz << " Hz";
                   },
                   [&out](const DitherStage& s) { out << "TPDF dither to " << s.bits << "-bit"; },
                   [&out](const TruncateStage& s) { out << "truncate to " << s.bits << "-bit"; },
               },
               stage);
    return out.str();
}

std::string DescribePlan(const ConversionPlan& plan) {
    std::string text;
    for (const ProcessingStage& stage : plan) {
        if (!text.empty()) {
            text += ", ";
        }
        text += DescribeStage(stage);
    }
    return text;
}
