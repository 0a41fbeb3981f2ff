#include "../test_config.h"

#include "container/SvxDecoder.hpp"
#include "converter/LibavEngine.hpp"
#include "converter/SvxConverter.hpp"

TEST(LibavEngineFilterTest, MixdownWeightsChannelsEqually) {
    EXPECT_EQ(LibavEngine::FilterFor(MixToMonoStage{2}), "pan=mono|c0=0.5*c0+0.5*c1");
}

TEST(LibavEngineFilterTest, TrimRemovesSilenceFromBothEnds) {
    const std::string leading = "silenceremove=start_periods=1:start_duration=0.01:start_threshold=-48dB";
    EXPECT_EQ(LibavEngine::FilterFor(TrimSilenceStage{kTrimThresholdDb, kTrimMinDurationSeconds}),
              leading + ",areverse," + leading + ",areverse");
}

TEST(LibavEngineFilterTest, GainResampleAndLowPass) {
    EXPECT_EQ(LibavEngine::FilterFor(GainStage{-6.0}), "volume=-6dB");
    EXPECT_EQ(LibavEngine::FilterFor(ResampleStage{44100, 16726}), "aresample=16726:filter_size=64:cutoff=0.95");
    EXPECT_EQ(LibavEngine::FilterFor(LowPassStage{kAmigaLowPassHz, LowPassStage::Origin::Amiga}),
              "lowpass=f=3300:p=1");
}

TEST(LibavEngineFilterTest, QuantizerDitherSelection) {
    EXPECT_EQ(LibavEngine::FilterFor(DitherStage{kTargetBits}), "aresample=osf=u8:dither_method=triangular");
    EXPECT_EQ(LibavEngine::FilterFor(TruncateStage{kTargetBits}), "aresample=osf=u8:dither_method=0");
}

class LibavEngineTest : public ::testing::Test {
protected:
    std::filesystem::path SilentStereo(const std::string& name) {
        SignalSpec spec;
        spec.waveform = SignalSpec::Waveform::Silence;
        spec.channels = 2;
        spec.duration_s = 0.1;
        return engine.Synthesize(spec, scratch.Path() / name).path;
    }

    ScratchDirectory scratch;
    LibavEngine engine;
};

TEST_F(LibavEngineTest, TrimmedSilentStereoBecomesEmptyContainer) {
    const std::filesystem::path input = SilentStereo("silence.wav");
    const std::filesystem::path output = scratch.Path() / "silence.iff";

    ConversionOptions options;
    options.trim_silence = true;
    SvxConverter converter(engine, options);
    const ConversionResult result = converter.ConvertFile(input, output);

    EXPECT_EQ(result.samples, 0u);
    EXPECT_EQ(result.file_bytes, 48u);
    EXPECT_TRUE(ReadSvxFile(output).samples.empty());
}

TEST_F(LibavEngineTest, TrimmedSilenceSurvivesNormalization) {
    const std::filesystem::path input = SilentStereo("silence.wav");
    const std::filesystem::path output = scratch.Path() / "silence.iff";

    ConversionOptions options;
    options.trim_silence = true;
    options.normalize = true;
    SvxConverter converter(engine, options);

    EXPECT_EQ(converter.ConvertFile(input, output).samples, 0u);
}
