#include "../test_config.h"

#include <fstream>

#include "converter/ConverterConfig.hpp"
#include "converter/Errors.hpp"

class ConverterConfigTest : public ::testing::Test {
protected:
    std::filesystem::path WriteConfig(const std::string& text) {
        const std::filesystem::path path = scratch.Path() / "converter.yml";
        std::ofstream out(path);
        out << text;
        return path;
    }

    ScratchDirectory scratch;
    ConverterConfig config;
};

TEST_F(ConverterConfigTest, ParsesKeyValueLinesAndSkipsComments) {
    ASSERT_TRUE(config.LoadFromFile(WriteConfig("# comment\n\n  sample_rate : 8363 \nnot a pair\ndither: no\n")));

    EXPECT_EQ(config.GetInt("sample_rate", 0), 8363);
    EXPECT_FALSE(config.GetBool("dither", true));
    EXPECT_FALSE(config.Has("not a pair"));
    EXPECT_EQ(config.GetString("output_folder", "fallback"), "fallback");
}

TEST_F(ConverterConfigTest, MissingFileLoadsNothing) {
    EXPECT_FALSE(config.LoadFromFile(scratch.Path() / "absent.yml"));
    EXPECT_FALSE(config.Has(config_keys::kSampleRate));
}

TEST_F(ConverterConfigTest, MalformedIntFallsBack) {
    config.SetString("sample_rate", "fast");
    EXPECT_EQ(config.GetInt("sample_rate", 22050), 22050);
}

TEST_F(ConverterConfigTest, DefaultsWhenKeysAbsent) {
    const ConversionOptions options = OptionsFromConfig(config);

    EXPECT_EQ(options.target_rate, 16726);
    EXPECT_FALSE(options.normalize);
    EXPECT_FALSE(options.gain_db.has_value());
    EXPECT_FALSE(options.lpf_cutoff_hz.has_value());
    EXPECT_FALSE(options.amiga_lpf);
    EXPECT_FALSE(options.trim_silence);
    EXPECT_TRUE(options.dither);
}

TEST_F(ConverterConfigTest, ReadsEveryOption) {
    ASSERT_TRUE(config.LoadFromFile(WriteConfig("sample_rate: 8363\n"
                                                "normalize: true\n"
                                                "gain_db: -3.5\n"
                                                "lpf_cutoff_hz: 4000\n"
                                                "amiga_lpf: yes\n"
                                                "trim_silence: on\n"
                                                "dither: false\n")));
    const ConversionOptions options = OptionsFromConfig(config);

    EXPECT_EQ(options.target_rate, 8363);
    EXPECT_TRUE(options.normalize);
    ASSERT_TRUE(options.gain_db.has_value());
    EXPECT_DOUBLE_EQ(*options.gain_db, -3.5);
    ASSERT_TRUE(options.lpf_cutoff_hz.has_value());
    EXPECT_DOUBLE_EQ(*options.lpf_cutoff_hz, 4000.0);
    EXPECT_TRUE(options.amiga_lpf);
    EXPECT_TRUE(options.trim_silence);
    EXPECT_FALSE(options.dither);
}

TEST_F(ConverterConfigTest, EmptyGainAndCutoffMeanUnset) {
    ASSERT_TRUE(config.LoadFromFile(WriteConfig("gain_db:\nlpf_cutoff_hz:\n")));
    const ConversionOptions options = OptionsFromConfig(config);

    EXPECT_FALSE(options.gain_db.has_value());
    EXPECT_FALSE(options.lpf_cutoff_hz.has_value());
}

TEST_F(ConverterConfigTest, MalformedValuesAreRejected) {
    config.SetString(config_keys::kSampleRate, "16k");
    EXPECT_THROW(OptionsFromConfig(config), InvalidConfig);

    config = ConverterConfig{};
    config.SetString(config_keys::kNormalize, "maybe");
    EXPECT_THROW(OptionsFromConfig(config), InvalidConfig);

    config = ConverterConfig{};
    config.SetString(config_keys::kGainDb, "loud");
    EXPECT_THROW(OptionsFromConfig(config), InvalidConfig);

    config = ConverterConfig{};
    config.SetInt(config_keys::kSampleRate, 0);
    EXPECT_THROW(OptionsFromConfig(config), InvalidConfig);
}

TEST_F(ConverterConfigTest, StoreAndSaveRoundTrip) {
    ConversionOptions options;
    options.target_rate = 22050;
    options.gain_db = 6.0;
    options.amiga_lpf = true;
    StoreOptions(options, config);
    config.SetString(config_keys::kOutputFolder, kDefaultOutputFolder);

    const std::filesystem::path path = scratch.Path() / "saved.yml";
    ASSERT_TRUE(config.SaveToFile(path));

    ConverterConfig reloaded;
    ASSERT_TRUE(reloaded.LoadFromFile(path));
    const ConversionOptions restored = OptionsFromConfig(reloaded);

    EXPECT_EQ(restored.target_rate, 22050);
    ASSERT_TRUE(restored.gain_db.has_value());
    EXPECT_DOUBLE_EQ(*restored.gain_db, 6.0);
    EXPECT_FALSE(restored.lpf_cutoff_hz.has_value());
    EXPECT_TRUE(restored.amiga_lpf);
    EXPECT_TRUE(restored.dither);
    EXPECT_EQ(reloaded.GetString(config_keys::kOutputFolder, ""), "amiga_samples");
}
