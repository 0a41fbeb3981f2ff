#include "tui/FileBrowser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

namespace {
constexpr std::array<const char*, 10> kAudioExtensions{
    ".wav", ".aif", ".aiff", ".flac", ".mp3", ".ogg", ".opus", ".m4a", ".aac", ".8svx"};
}

FileBrowser::FileBrowser()
    : current_path_(std::filesystem::current_path()),
      selected_index_(0) {
    Refresh();
}

bool FileBrowser::Load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return false;
    }
    current_path_ = path;
    Refresh();
    return true;
}

void FileBrowser::MoveSelectionUp() {
    if (entries_.empty()) {
        return;
    }
    if (selected_index_ == 0) {
        selected_index_ = entries_.size() - 1;
    } else {
        --selected_index_;
    }
}

void FileBrowser::MoveSelectionDown() {
    if (entries_.empty()) {
        return;
    }
    selected_index_ = (selected_index_ + 1) % entries_.size();
}

void FileBrowser::ActivateSelection() {
    if (entries_.empty()) {
        return;
    }

    const Entry& entry = entries_[selected_index_];
    if (entry.name == "..") {
        if (current_path_.has_parent_path()) {
            current_path_ = current_path_.parent_path();
            Refresh();
        }
        return;
    }

    if (!entry.is_dir) {
        return;
    }

    current_path_ /= entry.name;
    Refresh();
}

std::filesystem::path FileBrowser::SelectedPath() const {
    if (entries_.empty() || selected_index_ >= entries_.size()) {
        return {};
    }
    const Entry& entry = entries_[selected_index_];
    if (entry.name == "..") {
        return current_path_.parent_path();
    }
    return current_path_ / entry.name;
}

bool FileBrowser::IsAudioFile(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find_if(kAudioExtensions.begin(), kAudioExtensions.end(), [&ext](const char* known) {
               return ext == known;
           }) != kAudioExtensions.end();
}

std::vector<std::filesystem::path> FileBrowser::AudioFilesIn(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && IsAudioFile(it->path())) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

void FileBrowser::Refresh() {
    entries_.clear();

    if (current_path_.has_parent_path()) {
        entries_.push_back(Entry{"..", true, false});
    }

    std::vector<Entry> dirs;
    std::vector<Entry> files;

    // Unreadable directories show up empty apart from "..".
    std::error_code ec;
    for (std::filesystem::directory_iterator it(current_path_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            dirs.push_back(Entry{name, true, false});
        } else {
            files.push_back(Entry{name, false, IsAudioFile(it->path())});
        }
    }

    auto sorter = [](const Entry& a, const Entry& b) {
        return a.name < b.name;
    };
    std::sort(dirs.begin(), dirs.end(), sorter);
    std::sort(files.begin(), files.end(), sorter);

    entries_.insert(entries_.end(), dirs.begin(), dirs.end());
    entries_.insert(entries_.end(), files.begin(), files.end());

    selected_index_ = 0;
}
