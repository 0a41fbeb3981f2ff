#ifndef CONTAINER_SVX_FORMAT_HPP
#define CONTAINER_SVX_FORMAT_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Mono 8-bit signed PCM as stored in an 8SVX BODY chunk.
using SampleBuffer = std::vector<int8_t>;

// IFF 8SVX layout:
//   FORM <size> 8SVX
//     VHDR <20> oneShotHiSamples repeatHiSamples samplesPerHiCycle
//               samplesPerSec ctOctave sCompression volume
//     BODY <size> <raw samples> [pad]
// All integers are big-endian.
namespace svx {

constexpr char kFormTag[4] = {'F', 'O', 'R', 'M'};
constexpr char kFormType[4] = {'8', 'S', 'V', 'X'};
constexpr char kHeaderTag[4] = {'V', 'H', 'D', 'R'};
constexpr char kBodyTag[4] = {'B', 'O', 'D', 'Y'};

constexpr uint32_t kHeaderChunkSize = 20;
constexpr uint8_t kOctaveCount = 1;
constexpr uint8_t kNoCompression = 0;
constexpr uint32_t kUnityVolume = 0x00010000; // 1.0 in 16.16 fixed point

// FORM tag + size + type + VHDR chunk + BODY tag + size.
constexpr std::size_t kFixedHeaderBytes = 12 + 8 + kHeaderChunkSize + 8;

} // namespace svx

// Contents of the VHDR chunk.
struct ContainerMetadata {
    uint32_t one_shot_samples = 0;
    uint32_t repeat_samples = 0;
    uint32_t samples_per_cycle = 0;
    uint16_t sample_rate = 0;
    uint8_t octave = svx::kOctaveCount;
    uint8_t compression = svx::kNoCompression;
    uint32_t volume = svx::kUnityVolume;

    bool operator==(const ContainerMetadata& other) const {
        return one_shot_samples == other.one_shot_samples && repeat_samples == other.repeat_samples &&
               samples_per_cycle == other.samples_per_cycle && sample_rate == other.sample_rate &&
               octave == other.octave && compression == other.compression && volume == other.volume;
    }
    bool operator!=(const ContainerMetadata& other) const { return !(*this == other); }
};

#endif // CONTAINER_SVX_FORMAT_HPP
