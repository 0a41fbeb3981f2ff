#ifndef CONVERTER_CONVERTER_CONFIG_HPP
#define CONVERTER_CONVERTER_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include "converter/ConversionPlan.hpp"

// Lightweight YAML-like loader for converter options.
// Parses simple "key: value" lines, ignoring comments (#) and blank lines.
class ConverterConfig {
public:
    bool LoadFromFile(const std::filesystem::path& path);

    // Accessors with defaults.
    std::string GetString(const std::string& key, const std::string& fallback) const;
    int GetInt(const std::string& key, int fallback) const;
    bool GetBool(const std::string& key, bool fallback) const;
    bool Has(const std::string& key) const;

    // Mutators.
    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetBool(const std::string& key, bool value);

    // Persist the current values to disk (simple key: value format).
    bool SaveToFile(const std::filesystem::path& path) const;

private:
    std::unordered_map<std::string, std::string> values_;
};

namespace config_keys {
constexpr const char* kSampleRate = "sample_rate";
constexpr const char* kNormalize = "normalize";
constexpr const char* kGainDb = "gain_db";
constexpr const char* kLpfCutoffHz = "lpf_cutoff_hz";
constexpr const char* kAmigaLpf = "amiga_lpf";
constexpr const char* kTrimSilence = "trim_silence";
constexpr const char* kDither = "dither";
constexpr const char* kOutputFolder = "output_folder";
} // namespace config_keys

constexpr const char* kDefaultOutputFolder = "amiga_samples";

// Builds explicit conversion options from the config. Missing keys take the
// ConversionOptions defaults; an empty gain or cutoff means "not set".
// Throws InvalidConfig for values that are present but not numbers/booleans.
ConversionOptions OptionsFromConfig(const ConverterConfig& config);

// Writes options back using the same keys.
void StoreOptions(const ConversionOptions& options, ConverterConfig& config);

#endif // CONVERTER_CONVERTER_CONFIG_HPP
