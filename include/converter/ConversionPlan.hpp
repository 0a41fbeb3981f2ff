#ifndef CONVERTER_CONVERSION_PLAN_HPP
#define CONVERTER_CONVERSION_PLAN_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Properties of a decoded source stream as reported by the audio engine.
struct SourceInfo {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    long long sample_count = 0; // per channel
};

// User-facing conversion options. Defaults match the stock converter profile.
struct ConversionOptions {
    int target_rate = 16726;
    bool normalize = false;
    std::optional<double> gain_db;
    std::optional<double> lpf_cutoff_hz;
    bool amiga_lpf = false;
    bool trim_silence = false;
    bool dither = true;
};

struct MixToMonoStage {
    int channels;
};

struct TrimSilenceStage {
    double threshold_db;
    double min_duration_s;
};

struct GainStage {
    double gain_db;
};

struct NormalizeStage {
    double target_dbfs;
};

struct ResampleStage {
    int from_rate;
    int to_rate;
};

struct LowPassStage {
    enum class Origin { Amiga, Manual };

    double cutoff_hz;
    Origin origin;
};

struct DitherStage {
    int bits;
};

struct TruncateStage {
    int bits;
};

using ProcessingStage = std::variant<MixToMonoStage,
                                     TrimSilenceStage,
                                     GainStage,
                                     NormalizeStage,
                                     ResampleStage,
                                     LowPassStage,
                                     DitherStage,
                                     TruncateStage>;

using ConversionPlan = std::vector<ProcessingStage>;

constexpr double kTrimThresholdDb = -48.0;
constexpr double kTrimMinDurationSeconds = 0.01;
constexpr double kAmigaLowPassHz = 3300.0;
constexpr int kTargetBits = 8;
constexpr int kMaxContainerRate = 65535;

// Checks the option fields that do not depend on the source. Throws InvalidConfig.
void ValidateConversionOptions(const ConversionOptions& options);

// Orders the processing stages for one conversion. The order is fixed:
// mixdown, trim, gain/normalize, resample, Amiga low-pass, manual low-pass,
// dither/truncate. Options only include, exclude or parameterize stages.
// Throws InvalidConfig for out-of-domain rates, channel counts, gain or cutoff.
ConversionPlan BuildConversionPlan(const ConversionOptions& options, const SourceInfo& source);

// Sample rate produced by the plan, or source_rate if it does not resample.
int PlanOutputRate(const ConversionPlan& plan, int source_rate);

template <typename Stage>
bool PlanHas(const ConversionPlan& plan) {
    for (const ProcessingStage& stage : plan) {
        if (std::holds_alternative<Stage>(stage)) {
            return true;
        }
    }
    return false;
}

std::string DescribeStage(const ProcessingStage& stage);
std::string DescribePlan(const ConversionPlan& plan);

#endif // CONVERTER_CONVERSION_PLAN_HPP
