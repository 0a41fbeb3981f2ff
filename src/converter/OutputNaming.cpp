#include "converter/OutputNaming.hpp"

#include <algorithm>

std::string SanitizeBaseName(const std::filesystem::path& input) {
    std::string base = input.stem().string();
    std::replace(base.begin(), base.end(), ' ', '_');
    if (base.size() > kMaxBaseNameLength) {
        base.resize(kMaxBaseNameLength);
    }
    return base;
}

std::filesystem::path UniqueOutputPath(const std::filesystem::path& dir, const std::string& base) {
    std::filesystem::path candidate = dir / (base + ".iff");
    if (!std::filesystem::exists(candidate)) {
        return candidate;
    }
    for (int suffix = 2;; ++suffix) {
        candidate = dir / (base + "_" + std::to_string(suffix) + ".iff");
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
}
