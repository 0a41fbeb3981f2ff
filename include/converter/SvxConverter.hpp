#ifndef CONVERTER_SVX_CONVERTER_HPP
#define CONVERTER_SVX_CONVERTER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "converter/AudioEngine.hpp"
#include "converter/ConversionPlan.hpp"
#include "converter/SizeEstimator.hpp"

// What a conversion would do, without running the engine.
struct ConversionPreview {
    SourceDescriptor source;
    ConversionPlan plan;
    SizeEstimate estimate;
    std::vector<std::string> advisories;
};

struct ConversionResult {
    std::filesystem::path output;
    uint32_t samples = 0;
    std::uintmax_t file_bytes = 0;
    double duration_s = 0.0;
};

// Drives one engine through plan -> DSP -> 8SVX container for input files.
class SvxConverter {
public:
    using Feedback = std::function<void(const std::string&)>;

    // Throws InvalidConfig before any engine work if options are out of range.
    SvxConverter(AudioEngine& engine, ConversionOptions options);

    ConversionPreview Preview(const std::filesystem::path& input) const;
    // Previews each input that exists; missing ones are skipped with the batch warning.
    std::vector<ConversionPreview> PreviewBatch(const std::vector<std::filesystem::path>& inputs,
                                                const Feedback& feedback) const;

    // Convert a single input file to the provided output path.
    ConversionResult ConvertFile(const std::filesystem::path& input, const std::filesystem::path& output);

    // Converts each input into out_dir under a sanitized, collision-free name.
    // Missing inputs are skipped with a warning through feedback.
    std::vector<ConversionResult> ConvertBatch(const std::vector<std::filesystem::path>& inputs,
                                               const std::filesystem::path& out_dir,
                                               const Feedback& feedback);

    const ConversionOptions& Options() const { return options_; }

private:
    AudioEngine& engine_;
    ConversionOptions options_;
};

// More than an input and an output path always means batch mode.
inline bool IsBatchInvocation(bool batch_requested, std::size_t argument_count) {
    return batch_requested || argument_count > 2;
}

// Multi-line plan printout: source format, target format, estimate and stages.
std::string FormatPreview(const ConversionPreview& preview, const ConversionOptions& options);

// One-line summary of a finished conversion.
std::string FormatResult(const ConversionResult& result);

#endif // CONVERTER_SVX_CONVERTER_HPP
