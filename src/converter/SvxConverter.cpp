#include "converter/SvxConverter.hpp"

#include <cstdio>
#include <limits>
#include <sstream>
#include <utility>

#include "container/SvxEncoder.hpp"
#include "converter/Errors.hpp"
#include "converter/OutputNaming.hpp"

namespace {
bool SkipMissing(const std::filesystem::path& input, const SvxConverter::Feedback& feedback) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(input, ec)) {
        return false;
    }
    if (feedback) {
        feedback("Warning: Skipping (not found): " + input.string());
    }
    return true;
}

std::string Kilobytes(std::uintmax_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(bytes) / 1024.0);
    return buf;
}
}

SvxConverter::SvxConverter(AudioEngine& engine, ConversionOptions options)
    : engine_(engine), options_(std::move(options)) {
    ValidateConversionOptions(options_);
}

ConversionPreview SvxConverter::Preview(const std::filesystem::path& input) const {
    ConversionPreview preview;
    preview.source = engine_.Inspect(input);
    preview.plan = BuildConversionPlan(options_, preview.source.info);

    const long long source_samples = preview.source.info.sample_count > 0 ? preview.source.info.sample_count : 0;
    preview.estimate = EstimateSize(static_cast<uint64_t>(source_samples),
                                    static_cast<uint32_t>(preview.source.info.sample_rate),
                                    static_cast<uint32_t>(options_.target_rate));
    if (preview.estimate.advisory.has_value()) {
        preview.advisories.push_back(*preview.estimate.advisory);
    }
    if (std::optional<std::string> rate_advisory = SampleRateAdvisory(options_.target_rate)) {
        preview.advisories.push_back(*rate_advisory);
    }
    return preview;
}

std::vector<ConversionPreview> SvxConverter::PreviewBatch(const std::vector<std::filesystem::path>& inputs,
                                                          const Feedback& feedback) const {
    std::vector<ConversionPreview> previews;
    for (const std::filesystem::path& input : inputs) {
        if (!SkipMissing(input, feedback)) {
            previews.push_back(Preview(input));
        }
    }
    return previews;
}

ConversionResult SvxConverter::ConvertFile(const std::filesystem::path& input, const std::filesystem::path& output) {
    const SourceDescriptor source = engine_.Inspect(input);
    const ConversionPlan plan = BuildConversionPlan(options_, source.info);
    const int output_rate = PlanOutputRate(plan, source.info.sample_rate);
    if (output_rate > kMaxContainerRate) {
        throw InvalidConfig("Source rate " + std::to_string(output_rate) + " Hz does not fit an 8SVX header");
    }

    const SampleBuffer samples = engine_.Process(source, plan);
    if (samples.size() > std::numeric_limits<uint32_t>::max()) {
        throw EngineFailure("Engine produced more samples than an 8SVX BODY can hold", plan);
    }

    WriteSvxFile(output, samples, static_cast<uint16_t>(output_rate));

    ConversionResult result;
    result.output = output;
    result.samples = static_cast<uint32_t>(samples.size());
    std::error_code ec;
    result.file_bytes = std::filesystem::file_size(output, ec);
    if (ec) {
        throw IOError("Could not stat written file: " + output.string());
    }
    result.duration_s = static_cast<double>(result.samples) / static_cast<double>(output_rate);
    return result;
}

std::vector<ConversionResult> SvxConverter::ConvertBatch(const std::vector<std::filesystem::path>& inputs,
                                                         const std::filesystem::path& out_dir,
                                                         const Feedback& feedback) {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        throw IOError("Could not create output directory " + out_dir.string() + ": " + ec.message());
    }

    std::vector<ConversionResult> results;
    for (const std::filesystem::path& input : inputs) {
        if (SkipMissing(input, feedback)) {
            continue;
        }
        const std::filesystem::path output = UniqueOutputPath(out_dir, SanitizeBaseName(input));
        if (feedback) {
            feedback("Converting: " + input.filename().string());
        }
        results.push_back(ConvertFile(input, output));
        if (feedback) {
            feedback(FormatResult(results.back()));
        }
    }
    return results;
}

std::string FormatPreview(const ConversionPreview& preview, const ConversionOptions& options) {
    const SourceInfo& info = preview.source.info;
    std::ostringstream out;
    out << "Source: " << preview.source.path.filename().string() << "\n";
    out << "  Samples:     " << info.sample_count << "\n";
    out << "\n";
    out << "Conversion plan:\n";
    out << "  " << info.sample_rate << " Hz " << info.bits_per_sample << "-bit " << info.channels << "ch -> "
        << options.target_rate << " Hz 8-bit mono\n";
    out << "  Estimated output: ~" << preview.estimate.samples << " samples (" << Kilobytes(preview.estimate.bytes)
        << " KB)\n";
    out << "  Dither: " << (options.dither ? "TPDF" : "off (truncate)") << "\n";
    out << "  Normalize: " << (options.normalize ? "true" : "false") << "\n";
    if (options.gain_db.has_value()) {
        out << "  Gain: " << *options.gain_db << " dB\n";
    }
    if (options.lpf_cutoff_hz.has_value()) {
        out << "  LPF cutoff: " << *options.lpf_cutoff_hz << " Hz\n";
    }
    if (options.amiga_lpf) {
        out << "  A500-style LPF: yes (3.3 kHz)\n";
    }
    if (options.trim_silence) {
        out << "  Trim silence: yes\n";
    }
    out << "  Stages:\n";
    int index = 1;
    for (const ProcessingStage& stage : preview.plan) {
        out << "    " << index++ << ". " << DescribeStage(stage) << "\n";
    }
    for (const std::string& advisory : preview.advisories) {
        out << "Warning: " << advisory << "\n";
    }
    return out.str();
}

std::string FormatResult(const ConversionResult& result) {
    char duration[32];
    std::snprintf(duration, sizeof(duration), "%.2f", result.duration_s);
    return result.output.string() + " (" + Kilobytes(result.file_bytes) + " KB, " + duration + "s, " +
           std::to_string(result.samples) + " samples)";
}
