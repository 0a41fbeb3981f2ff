#ifndef CONVERTER_OUTPUT_NAMING_HPP
#define CONVERTER_OUTPUT_NAMING_HPP

#include <cstddef>
#include <filesystem>
#include <string>

// Amiga file names stay short and free of spaces.
constexpr std::size_t kMaxBaseNameLength = 24;

// Stem of input with spaces replaced by '_' and cut to 24 characters.
std::string SanitizeBaseName(const std::filesystem::path& input);

// dir/base.iff, or the first free dir/base_N.iff (N >= 2) if that exists.
// Looks at the file system; callers converting in parallel must serialize it.
std::filesystem::path UniqueOutputPath(const std::filesystem::path& dir, const std::string& base);

#endif // CONVERTER_OUTPUT_NAMING_HPP
