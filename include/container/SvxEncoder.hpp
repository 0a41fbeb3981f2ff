#ifndef CONTAINER_SVX_ENCODER_HPP
#define CONTAINER_SVX_ENCODER_HPP

#include <cstdint>
#include <filesystem>
#include <vector>

#include "container/SvxFormat.hpp"

// Metadata the encoder records for a buffer: one-shot length, no loop, unity volume.
ContainerMetadata MetadataFor(const SampleBuffer& samples, uint16_t sample_rate);

// Serializes samples into a complete IFF 8SVX file image. Odd-length bodies get
// a zero pad byte that the BODY size field does not count. The rate is stored
// as given; range checks belong to the caller.
std::vector<uint8_t> EncodeSvx(const SampleBuffer& samples, uint16_t sample_rate);

// Encodes and writes the container to path, replacing any existing file.
// Throws IOError if the location cannot be written.
void WriteSvxFile(const std::filesystem::path& path, const SampleBuffer& samples, uint16_t sample_rate);

#endif // CONTAINER_SVX_ENCODER_HPP
