#ifndef CONTAINER_SVX_DECODER_HPP
#define CONTAINER_SVX_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "container/SvxFormat.hpp"

// Parsed 8SVX container. form_size and file_size are kept for consistency checks.
struct DecodedSvx {
    ContainerMetadata metadata;
    SampleBuffer samples;
    uint32_t form_size = 0;
    uint32_t body_size = 0;
    std::size_t file_size = 0;
};

// Parses a container produced by EncodeSvx. Throws MalformedContainer on a
// short file, an unexpected tag, a VHDR size other than 20, or a BODY that
// runs past the end of the data. Trailing pad bytes are ignored.
DecodedSvx DecodeSvx(const std::vector<uint8_t>& bytes);

// Whole file contents. Throws IOError if the path is not a readable regular
// file or the read comes up short.
std::vector<uint8_t> ReadContainerBytes(const std::filesystem::path& path);

// Reads and decodes a file. Throws IOError if it cannot be read.
DecodedSvx ReadSvxFile(const std::filesystem::path& path);

// Largest absolute sample value, 0 for an empty buffer.
int PeakMagnitude(const SampleBuffer& samples);

#endif // CONTAINER_SVX_DECODER_HPP
