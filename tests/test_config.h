#ifndef SVXCONV_TEST_CONFIG_H
#define SVXCONV_TEST_CONFIG_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include "gtest/gtest.h"

// Per-test temporary directory, removed with everything in it on destruction.
class ScratchDirectory {
public:
    ScratchDirectory() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("svxconv_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~ScratchDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

#endif // SVXCONV_TEST_CONFIG_H
