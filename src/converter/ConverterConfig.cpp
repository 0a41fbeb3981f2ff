#include "converter/ConverterConfig.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>

#include "converter/Errors.hpp"

namespace {
std::string Trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string Lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

std::optional<bool> ParseBool(const std::string& raw) {
    const std::string v = Lower(raw);
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<int> ParseInt(const std::string& raw) {
    int value = 0;
    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();
    const std::from_chars_result parsed = std::from_chars(begin, end, value);
    if (parsed.ec != std::errc() || parsed.ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> ParseDouble(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(raw.c_str(), &end);
    if (end != raw.c_str() + raw.size()) {
        return std::nullopt;
    }
    return value;
}

std::string FormatDouble(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", value);
    return buf;
}

bool RequireBool(const ConverterConfig& config, const char* key, bool fallback) {
    if (!config.Has(key)) {
        return fallback;
    }
    const std::string raw = config.GetString(key, "");
    const std::optional<bool> value = ParseBool(raw);
    if (!value.has_value()) {
        throw InvalidConfig(std::string("Config key '") + key + "' expects true/false, got '" + raw + "'");
    }
    return *value;
}

std::optional<double> OptionalDouble(const ConverterConfig& config, const char* key) {
    const std::string raw = config.GetString(key, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    const std::optional<double> value = ParseDouble(raw);
    if (!value.has_value()) {
        throw InvalidConfig(std::string("Config key '") + key + "' expects a number, got '" + raw + "'");
    }
    return value;
}
}

bool ConverterConfig::LoadFromFile(const std::filesystem::path& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = Trim(trimmed.substr(0, colon));
        std::string value = Trim(trimmed.substr(colon + 1));
        values_[key] = value;
    }

    return true;
}

std::string ConverterConfig::GetString(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    return it->second;
}

int ConverterConfig::GetInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    return ParseInt(it->second).value_or(fallback);
}

bool ConverterConfig::GetBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    return ParseBool(it->second).value_or(fallback);
}

bool ConverterConfig::Has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConverterConfig::SetString(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void ConverterConfig::SetInt(const std::string& key, int value) {
    values_[key] = std::to_string(value);
}

void ConverterConfig::SetBool(const std::string& key, bool value) {
    values_[key] = value ? "true" : "false";
}

bool ConverterConfig::SaveToFile(const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }
    // Sorted so saved files diff cleanly.
    const std::map<std::string, std::string> sorted(values_.begin(), values_.end());
    for (const auto& kv : sorted) {
        out << kv.first << ": " << kv.second << "\n";
    }
    return static_cast<bool>(out);
}

ConversionOptions OptionsFromConfig(const ConverterConfig& config) {
    ConversionOptions options;

    if (config.Has(config_keys::kSampleRate)) {
        const std::string raw = config.GetString(config_keys::kSampleRate, "");
        const std::optional<int> rate = ParseInt(raw);
        if (!rate.has_value()) {
            throw InvalidConfig("Config key 'sample_rate' expects an integer, got '" + raw + "'");
        }
        options.target_rate = *rate;
    }
    options.normalize = RequireBool(config, config_keys::kNormalize, options.normalize);
    options.gain_db = OptionalDouble(config, config_keys::kGainDb);
    options.lpf_cutoff_hz = OptionalDouble(config, config_keys::kLpfCutoffHz);
    options.amiga_lpf = RequireBool(config, config_keys::kAmigaLpf, options.amiga_lpf);
    options.trim_silence = RequireBool(config, config_keys::kTrimSilence, options.trim_silence);
    options.dither = RequireBool(config, config_keys::kDither, options.dither);

    ValidateConversionOptions(options);
    return options;
}

void StoreOptions(const ConversionOptions& options, ConverterConfig& config) {
    config.SetInt(config_keys::kSampleRate, options.target_rate);
    config.SetBool(config_keys::kNormalize, options.normalize);
    config.SetString(config_keys::kGainDb, options.gain_db.has_value() ? FormatDouble(*options.gain_db) : "");
    config.SetString(config_keys::kLpfCutoffHz,
                     options.lpf_cutoff_hz.has_value() ? FormatDouble(*options.lpf_cutoff_hz) : "");
    config.SetBool(config_keys::kAmigaLpf, options.amiga_lpf);
    config.SetBool(config_keys::kTrimSilence, options.trim_silence);
    config.SetBool(config_keys::kDither, options.dither);
}
