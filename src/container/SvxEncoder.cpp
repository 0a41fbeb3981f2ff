#include "container/SvxEncoder.hpp"

#include <fstream>
#include <system_error>

#include "converter/Errors.hpp"

namespace {
void PutTag(std::vector<uint8_t>& out, const char (&tag)[4]) {
    out.insert(out.end(), tag, tag + 4);
}

void PutU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void PutU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}
}

ContainerMetadata MetadataFor(const SampleBuffer& samples, uint16_t sample_rate) {
    ContainerMetadata metadata;
    metadata.one_shot_samples = static_cast<uint32_t>(samples.size());
    metadata.sample_rate = sample_rate;
    return metadata;
}

std::vector<uint8_t> EncodeSvx(const SampleBuffer& samples, uint16_t sample_rate) {
    const ContainerMetadata metadata = MetadataFor(samples, sample_rate);
    const uint32_t body_size = static_cast<uint32_t>(samples.size());
    // IFF chunks must be even-length.
    const uint32_t body_pad = body_size % 2;
    const uint32_t form_size = 4 + (8 + svx::kHeaderChunkSize) + (8 + body_size + body_pad);

    std::vector<uint8_t> out;
    out.reserve(svx::kFixedHeaderBytes + body_size + body_pad);

    PutTag(out, svx::kFormTag);
    PutU32(out, form_size);
    PutTag(out, svx::kFormType);

    PutTag(out, svx::kHeaderTag);
    PutU32(out, svx::kHeaderChunkSize);
    PutU32(out, metadata.one_shot_samples);
    PutU32(out, metadata.repeat_samples);
    PutU32(out, metadata.samples_per_cycle);
    PutU16(out, metadata.sample_rate);
    out.push_back(metadata.octave);
    out.push_back(metadata.compression);
    PutU32(out, metadata.volume);

    PutTag(out, svx::kBodyTag);
    PutU32(out, body_size);
    for (const int8_t sample : samples) {
        out.push_back(static_cast<uint8_t>(sample));
    }
    if (body_pad != 0) {
        out.push_back(0);
    }

    return out;
}

void WriteSvxFile(const std::filesystem::path& path, const SampleBuffer& samples, uint16_t sample_rate) {
    const std::vector<uint8_t> bytes = EncodeSvx(samples, sample_rate);

    // Write beside the target and rename so readers never see a partial file.
    std::filesystem::path temp_path = path;
    temp_path += ".part";

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("Could not open output file: " + path.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw IOError("Failed to write output file: " + path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw IOError("Could not move output into place: " + path.string() + " (" + ec.message() + ")");
    }
}
