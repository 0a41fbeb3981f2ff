#ifndef CONVERTER_SIZE_ESTIMATOR_HPP
#define CONVERTER_SIZE_ESTIMATOR_HPP

#include <cstdint>
#include <optional>
#include <string>

// Chip RAM budget above which an output is flagged.
constexpr uint64_t kChipRamAdvisoryBytes = 512000;
// Playback rates a PAL Amiga handles comfortably.
constexpr int kMinAmigaRate = 2000;
constexpr int kMaxAmigaRate = 28867;

struct SizeEstimate {
    uint64_t samples = 0;
    uint64_t bytes = 0;
    std::optional<std::string> advisory;
};

// samples = ceil(source_samples * target_rate / source_rate), one byte each.
// Sets advisory when bytes exceed the chip RAM budget. Throws InvalidConfig
// for a zero source rate.
SizeEstimate EstimateSize(uint64_t source_samples, uint32_t source_rate, uint32_t target_rate);

// Warning text for rates outside the typical Amiga range, otherwise empty.
std::optional<std::string> SampleRateAdvisory(int sample_rate);

#endif // CONVERTER_SIZE_ESTIMATOR_HPP
