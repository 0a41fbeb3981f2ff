#include "container/SvxDecoder.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#include "converter/Errors.hpp"

namespace {
// Reads fields in order from a byte image; bounds are checked by the caller.
class BigEndianReader {
public:
    explicit BigEndianReader(const std::vector<uint8_t>& bytes) : bytes_(bytes), offset_(0) {}

    bool TagIs(const char (&tag)[4]) {
        const bool match = std::memcmp(bytes_.data() + offset_, tag, 4) == 0;
        offset_ += 4;
        return match;
    }

    uint32_t U32() {
        const uint32_t value = (static_cast<uint32_t>(bytes_[offset_]) << 24) |
                               (static_cast<uint32_t>(bytes_[offset_ + 1]) << 16) |
                               (static_cast<uint32_t>(bytes_[offset_ + 2]) << 8) |
                               static_cast<uint32_t>(bytes_[offset_ + 3]);
        offset_ += 4;
        return value;
    }

    uint16_t U16() {
        const uint16_t value = static_cast<uint16_t>((bytes_[offset_] << 8) | bytes_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint8_t U8() { return bytes_[offset_++]; }

    std::size_t Offset() const { return offset_; }

private:
    const std::vector<uint8_t>& bytes_;
    std::size_t offset_;
};
}

DecodedSvx DecodeSvx(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < svx::kFixedHeaderBytes) {
        throw MalformedContainer("File too short for an 8SVX header (" + std::to_string(bytes.size()) + " bytes)");
    }

    BigEndianReader reader(bytes);
    DecodedSvx decoded;
    decoded.file_size = bytes.size();

    if (!reader.TagIs(svx::kFormTag)) {
        throw MalformedContainer("Missing FORM tag");
    }
    decoded.form_size = reader.U32();
    if (!reader.TagIs(svx::kFormType)) {
        throw MalformedContainer("FORM type is not 8SVX");
    }

    if (!reader.TagIs(svx::kHeaderTag)) {
        throw MalformedContainer("Missing VHDR chunk");
    }
    const uint32_t header_size = reader.U32();
    if (header_size != svx::kHeaderChunkSize) {
        throw MalformedContainer("VHDR size is " + std::to_string(header_size) + ", expected 20");
    }

    ContainerMetadata& metadata = decoded.metadata;
    metadata.one_shot_samples = reader.U32();
    metadata.repeat_samples = reader.U32();
    metadata.samples_per_cycle = reader.U32();
    metadata.sample_rate = reader.U16();
    metadata.octave = reader.U8();
    metadata.compression = reader.U8();
    metadata.volume = reader.U32();

    if (!reader.TagIs(svx::kBodyTag)) {
        throw MalformedContainer("Missing BODY chunk");
    }
    decoded.body_size = reader.U32();

    const std::size_t body_start = reader.Offset();
    if (decoded.body_size > bytes.size() - body_start) {
        throw MalformedContainer("BODY size " + std::to_string(decoded.body_size) + " exceeds the " +
                                 std::to_string(bytes.size() - body_start) + " bytes available");
    }

    decoded.samples.resize(decoded.body_size);
    std::transform(bytes.begin() + static_cast<std::ptrdiff_t>(body_start),
                   bytes.begin() + static_cast<std::ptrdiff_t>(body_start + decoded.body_size),
                   decoded.samples.begin(),
                   [](uint8_t byte) { return static_cast<int8_t>(byte); });

    return decoded;
}

std::vector<uint8_t> ReadContainerBytes(const std::filesystem::path& path) {
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IOError("Could not stat container: " + path.string() + ": " + ec.message());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Could not open container: " + path.string());
    }
    std::vector<uint8_t> bytes(static_cast<std::size_t>(size));
    if (!bytes.empty()) {
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (in.bad() || in.gcount() != static_cast<std::streamsize>(bytes.size())) {
        throw IOError("Failed to read container: " + path.string());
    }
    return bytes;
}

DecodedSvx ReadSvxFile(const std::filesystem::path& path) {
    return DecodeSvx(ReadContainerBytes(path));
}

int PeakMagnitude(const SampleBuffer& samples) {
    int peak = 0;
    for (const int8_t sample : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(sample)));
    }
    return peak;
}
