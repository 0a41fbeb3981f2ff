#include "converter/SizeEstimator.hpp"

#include <cstdio>

#include "converter/Errors.hpp"

SizeEstimate EstimateSize(uint64_t source_samples, uint32_t source_rate, uint32_t target_rate) {
    if (source_rate == 0) {
        throw InvalidConfig("Cannot estimate output size for a source rate of 0 Hz");
    }

    SizeEstimate estimate;
    const uint64_t scaled = source_samples * target_rate;
    estimate.samples = (scaled + source_rate - 1) / source_rate;
    estimate.bytes = estimate.samples;

    if (estimate.bytes > kChipRamAdvisoryBytes) {
        char kb[32];
        std::snprintf(kb, sizeof(kb), "%.1f", static_cast<double>(estimate.bytes) / 1024.0);
        estimate.advisory = std::string("Output (~") + kb +
                            " KB) exceeds 500 KB and will consume significant chip RAM on a stock Amiga";
    }
    return estimate;
}

std::optional<std::string> SampleRateAdvisory(int sample_rate) {
    if (sample_rate < kMinAmigaRate || sample_rate > kMaxAmigaRate) {
        return "Sample rate " + std::to_string(sample_rate) + " Hz is outside typical Amiga range (" +
               std::to_string(kMinAmigaRate) + "-" + std::to_string(kMaxAmigaRate) + " Hz)";
    }
    return std::nullopt;
}
