#include "converter/SelfTest.hpp"

#include <cmath>
#include <system_error>
#include <utility>

#include "container/SvxEncoder.hpp"
#include "converter/Errors.hpp"
#include "converter/OutputNaming.hpp"
#include "converter/SvxConverter.hpp"

namespace {
std::string TagAt(const std::vector<uint8_t>& bytes, std::size_t offset) {
    return std::string(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                       bytes.begin() + static_cast<std::ptrdiff_t>(offset + 4));
}

uint32_t U32At(const std::vector<uint8_t>& bytes, std::size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 24) | (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 8) | static_cast<uint32_t>(bytes[offset + 3]);
}

// Conversion profile shared by the scenarios: no dither so sizes and peaks are exact.
ConversionOptions PlainOptions(int target_rate) {
    ConversionOptions options;
    options.target_rate = target_rate;
    options.dither = false;
    return options;
}
}

SelfTestOracle::SelfTestOracle(AudioEngine& engine, std::filesystem::path scratch_dir, std::ostream& report)
    : engine_(engine), scratch_dir_(std::move(scratch_dir)), report_(report) {}

int SelfTestOracle::Failed() const {
    int failed = 0;
    for (const CheckResult& result : results_) {
        if (!result.passed) {
            ++failed;
        }
    }
    return failed;
}

template <typename Body>
void SelfTestOracle::RunScenario(const std::string& title, Body body) {
    Section(title);
    try {
        body();
    } catch (const std::exception& e) {
        // Recorded as a failed check; the next scenario still runs.
        Expect(false, title, title + " aborted: " + e.what());
    }
    report_ << "\n";
}

int SelfTestOracle::Run() {
    results_.clear();

    std::error_code ec;
    std::filesystem::create_directories(scratch_dir_, ec);
    if (ec) {
        throw IOError("Could not create self-test directory " + scratch_dir_.string() + ": " + ec.message());
    }

    report_ << "Running self-tests...\n\n";

    RunScenario("Test 1: Basic stereo WAV -> IFF 8SVX", [this] { BasicStereoConversion(); });
    RunScenario("Test 2: Sample rate accuracy", [this] { SampleRateAccuracy(); });
    RunScenario("Test 3: Normalization", [this] { Normalization(); });
    RunScenario("Test 4: IFF pad byte for odd-length BODY", [this] { OddBodyPadding(); });
    RunScenario("Test 5: Extreme input format (192kHz/32-bit float)", [this] { ExtremeInputFormat(); });
    RunScenario("Test 6: DC signal -> 8-bit signed encoding", [this] { SilenceEncoding(); });
    RunScenario("Test 7: Filename sanitization", [this] { LongFileName(); });

    const int failed = Failed();
    const int total = static_cast<int>(results_.size());
    report_ << "----------------------------\n";
    if (failed == 0) {
        report_ << "All " << total << " tests passed\n";
    } else {
        report_ << failed << "/" << total << " tests failed\n";
    }
    return failed;
}

void SelfTestOracle::Section(const std::string& title) {
    report_ << title << "\n";
}

void SelfTestOracle::Expect(bool condition, const std::string& pass_text, const std::string& fail_text) {
    results_.push_back(CheckResult{condition ? pass_text : fail_text, condition});
    report_ << "  " << (condition ? "✓ " : "✗ ") << (condition ? pass_text : fail_text) << "\n";
}

std::filesystem::path SelfTestOracle::ConvertSignal(const SignalSpec& spec,
                                                    const std::string& stem,
                                                    const ConversionOptions& options) {
    const SourceDescriptor source = engine_.Synthesize(spec, scratch_dir_ / (stem + ".wav"));
    const std::filesystem::path output = scratch_dir_ / (stem + ".iff");
    SvxConverter converter(engine_, options);
    converter.ConvertFile(source.path, output);
    return output;
}

SelfTestOracle::RawHeader SelfTestOracle::ReadRawHeader(const std::filesystem::path& path) const {
    const std::vector<uint8_t> bytes = ReadContainerBytes(path);
    if (bytes.size() < svx::kFixedHeaderBytes) {
        throw MalformedContainer(path.string() + " is only " + std::to_string(bytes.size()) + " bytes");
    }

    RawHeader header;
    header.file_size = bytes.size();
    header.form_tag = TagAt(bytes, 0);
    header.form_size = U32At(bytes, 4);
    header.type_tag = TagAt(bytes, 8);
    header.vhdr_tag = TagAt(bytes, 12);
    header.vhdr_size = U32At(bytes, 16);
    header.body_tag = TagAt(bytes, 40);
    header.body_size = U32At(bytes, 44);
    return header;
}

void SelfTestOracle::BasicStereoConversion() {
    SignalSpec spec;
    spec.frequency_hz = 440.0;
    spec.duration_s = 0.05;
    spec.sample_rate = 44100;
    spec.channels = 2;
    spec.format = SignalSpec::SampleFormat::S16;

    const std::filesystem::path output = ConvertSignal(spec, "t1", PlainOptions(16726));
    const RawHeader raw = ReadRawHeader(output);

    Expect(raw.form_tag == "FORM", "FORM tag", "FORM tag");
    Expect(raw.type_tag == "8SVX", "8SVX type", "8SVX type");
    Expect(raw.vhdr_tag == "VHDR", "VHDR chunk", "VHDR chunk");
    Expect(raw.vhdr_size == 20, "VHDR size = 20", "VHDR size = 20 (got " + std::to_string(raw.vhdr_size) + ")");
    Expect(raw.body_tag == "BODY", "BODY chunk", "BODY chunk");

    const DecodedSvx decoded = ReadSvxFile(output);
    const ContainerMetadata& meta = decoded.metadata;
    Expect(meta.sample_rate == 16726, "Sample rate = 16726",
           "Sample rate (got " + std::to_string(meta.sample_rate) + ")");
    Expect(meta.compression == 0, "No compression", "Compression flag");
    Expect(meta.volume == 65536, "Volume = 1.0 (0x10000)", "Volume field");
    Expect(meta.repeat_samples == 0, "No loop", "Loop field");

    const std::string body = std::to_string(raw.body_size);
    const std::string one_shot = std::to_string(meta.one_shot_samples);
    Expect(raw.body_size == meta.one_shot_samples, "BODY size = oneShotHiSamples (" + body + ")",
           "BODY/oneShot mismatch (" + body + " vs " + one_shot + ")");

    // 0.05 s at 16726 Hz is about 836 samples.
    Expect(raw.body_size > 750 && raw.body_size < 920, "Output length plausible (~836 samples, got " + body + ")",
           "Output length unexpected (expected ~836, got " + body + ")");

    const std::string form = std::to_string(raw.form_size);
    const std::string file = std::to_string(raw.file_size);
    Expect(raw.form_size == raw.file_size - 8, "FORM size consistent with file size",
           "FORM size inconsistent (" + form + " != " + file + " - 8)");
}

void SelfTestOracle::SampleRateAccuracy() {
    for (const int rate : {8363, 16726, 22050}) {
        SignalSpec spec;
        spec.frequency_hz = 1000.0;
        spec.duration_s = 0.1;
        spec.sample_rate = 48000;
        spec.channels = 1;
        spec.format = SignalSpec::SampleFormat::S24;

        const std::string rate_text = std::to_string(rate);
        const DecodedSvx decoded = ReadSvxFile(ConvertSignal(spec, "t2_" + rate_text, PlainOptions(rate)));

        Expect(decoded.metadata.sample_rate == rate, "Rate " + rate_text + " Hz stored correctly",
               "Rate " + rate_text + " Hz (got " + std::to_string(decoded.metadata.sample_rate) + ")");

        // Body should track 0.1 s x rate within 10%.
        const int expected = rate / 10;
        const int lo = expected * 90 / 100;
        const int hi = expected * 110 / 100;
        const long long body = decoded.body_size;
        Expect(body >= lo && body <= hi,
               "Body size at " + rate_text + " Hz plausible (" + std::to_string(body) + " ~ " +
                   std::to_string(expected) + ")",
               "Body size at " + rate_text + " Hz unexpected (" + std::to_string(body) + ", expected ~" +
                   std::to_string(expected) + ")");
    }
}

void SelfTestOracle::Normalization() {
    SignalSpec spec;
    spec.frequency_hz = 440.0;
    spec.duration_s = 0.05;
    spec.gain_db = -40.0;
    spec.sample_rate = 44100;
    spec.channels = 1;

    const std::filesystem::path quiet_path = ConvertSignal(spec, "t3_quiet", PlainOptions(16726));

    ConversionOptions normalize = PlainOptions(16726);
    normalize.normalize = true;
    const std::filesystem::path norm_path = ConvertSignal(spec, "t3_norm", normalize);

    const int quiet_peak = PeakMagnitude(ReadSvxFile(quiet_path).samples);
    const int norm_peak = PeakMagnitude(ReadSvxFile(norm_path).samples);
    const std::string quiet = std::to_string(quiet_peak);
    const std::string norm = std::to_string(norm_peak);

    Expect(norm_peak > quiet_peak, "Normalized peak (" + norm + ") > quiet peak (" + quiet + ")",
           "Normalize didn't boost signal (" + norm + " vs " + quiet + ")");
    Expect(norm_peak > 100, "Normalized signal uses most of 8-bit range (peak=" + norm + "/127)",
           "Normalized signal still quiet (peak=" + norm + "/127)");
}

void SelfTestOracle::OddBodyPadding() {
    const SampleBuffer odd(127, 0);
    const std::filesystem::path odd_path = scratch_dir_ / "t4_odd.iff";
    WriteSvxFile(odd_path, odd, 16726);

    const RawHeader odd_raw = ReadRawHeader(odd_path);
    Expect(odd_raw.body_size == 127, "Odd BODY size preserved (127)",
           "BODY size wrong (expected 127, got " + std::to_string(odd_raw.body_size) + ")");
    // 12 (FORM+size+8SVX) + 28 (VHDR chunk) + 8 (BODY header) + 127 + 1 pad.
    Expect(odd_raw.file_size == 176, "File size includes pad byte (176)",
           "File size wrong (expected 176, got " + std::to_string(odd_raw.file_size) + ")");
    Expect(ReadSvxFile(odd_path).samples == odd, "Odd BODY decodes to the original samples",
           "Odd BODY decode differs from the original samples");

    const SampleBuffer even(128, 0);
    const std::filesystem::path even_path = scratch_dir_ / "t4_even.iff";
    WriteSvxFile(even_path, even, 16726);

    const RawHeader even_raw = ReadRawHeader(even_path);
    Expect(even_raw.file_size == 176, "Even BODY - no unnecessary pad (176)",
           "Even BODY file size wrong (expected 176, got " + std::to_string(even_raw.file_size) + ")");
}

void SelfTestOracle::ExtremeInputFormat() {
    SignalSpec spec;
    spec.frequency_hz = 440.0;
    spec.duration_s = 0.02;
    spec.sample_rate = 192000;
    spec.channels = 1;
    spec.format = SignalSpec::SampleFormat::F32;

    ConversionOptions options = PlainOptions(8363);
    options.normalize = true;
    const std::filesystem::path output = ConvertSignal(spec, "t5", options);

    const RawHeader raw = ReadRawHeader(output);
    Expect(raw.form_tag == "FORM", "192kHz/32-float -> valid FORM", "192kHz input failed");
    const DecodedSvx decoded = ReadSvxFile(output);
    Expect(decoded.metadata.sample_rate == 8363, "Downsampled to 8363 Hz", "Wrong output rate");
}

void SelfTestOracle::SilenceEncoding() {
    SignalSpec spec;
    spec.waveform = SignalSpec::Waveform::Silence;
    spec.duration_s = 0.01;
    spec.sample_rate = 16726;
    spec.channels = 1;

    const DecodedSvx decoded = ReadSvxFile(ConvertSignal(spec, "t6", PlainOptions(16726)));
    const int peak = PeakMagnitude(decoded.samples);
    Expect(peak <= 1, "Silence -> near-zero samples (peak=" + std::to_string(peak) + ")",
           "Silence produced non-zero samples (peak=" + std::to_string(peak) + ")");
}

void SelfTestOracle::LongFileName() {
    SignalSpec spec;
    spec.waveform = SignalSpec::Waveform::Silence;
    spec.duration_s = 0.01;
    spec.sample_rate = 16726;
    spec.channels = 1;

    const std::filesystem::path input =
        scratch_dir_ / "this is a very long sample name with spaces and stuff.wav";
    const SourceDescriptor source = engine_.Synthesize(spec, input);

    const std::filesystem::path out_dir = scratch_dir_ / "sanitized";
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        throw IOError("Could not create " + out_dir.string() + ": " + ec.message());
    }
    const std::filesystem::path output = out_dir / (SanitizeBaseName(input) + ".iff");

    SvxConverter converter(engine_, PlainOptions(16726));
    converter.ConvertFile(source.path, output);

    const RawHeader raw = ReadRawHeader(output);
    Expect(raw.form_tag == "FORM", "Long filename -> valid output (" + output.filename().string() + ")",
           "Long filename output corrupt");
}
