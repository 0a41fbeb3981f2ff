#include "../test_config.h"

#include <fstream>

#include "tui/FileBrowser.hpp"

namespace {
void Touch(const std::filesystem::path& path) {
    std::ofstream(path) << "x";
}
}

TEST(FileBrowserTest, RecognizesAudioExtensionsCaseInsensitively) {
    EXPECT_TRUE(FileBrowser::IsAudioFile("kick.wav"));
    EXPECT_TRUE(FileBrowser::IsAudioFile("pad.AIFF"));
    EXPECT_TRUE(FileBrowser::IsAudioFile("vox.Flac"));
    EXPECT_FALSE(FileBrowser::IsAudioFile("notes.txt"));
    EXPECT_FALSE(FileBrowser::IsAudioFile("wav"));
}

TEST(FileBrowserTest, ListsDirectoriesBeforeFilesAndSkipsHidden) {
    ScratchDirectory scratch;
    std::filesystem::create_directory(scratch.Path() / "zeta");
    std::filesystem::create_directory(scratch.Path() / ".cache");
    Touch(scratch.Path() / "b.wav");
    Touch(scratch.Path() / "a.txt");
    Touch(scratch.Path() / ".hidden.wav");

    FileBrowser browser;
    ASSERT_TRUE(browser.Load(scratch.Path()));

    const std::vector<FileBrowser::Entry>& entries = browser.Entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "..");
    EXPECT_EQ(entries[1].name, "zeta");
    EXPECT_TRUE(entries[1].is_dir);
    EXPECT_EQ(entries[2].name, "a.txt");
    EXPECT_FALSE(entries[2].is_audio);
    EXPECT_EQ(entries[3].name, "b.wav");
    EXPECT_TRUE(entries[3].is_audio);
}

TEST(FileBrowserTest, LoadRejectsNonDirectories) {
    ScratchDirectory scratch;
    Touch(scratch.Path() / "file.wav");

    FileBrowser browser;
    EXPECT_FALSE(browser.Load(scratch.Path() / "file.wav"));
    EXPECT_FALSE(browser.Load(scratch.Path() / "missing"));
}

TEST(FileBrowserTest, SelectionWrapsAndActivatesDirectories) {
    ScratchDirectory scratch;
    std::filesystem::create_directory(scratch.Path() / "sub");
    Touch(scratch.Path() / "sub" / "inner.wav");

    FileBrowser browser;
    ASSERT_TRUE(browser.Load(scratch.Path()));
    ASSERT_EQ(browser.Entries().size(), 2u);

    browser.MoveSelectionUp();
    EXPECT_EQ(browser.SelectedIndex(), 1u);
    EXPECT_EQ(browser.SelectedPath().filename().string(), "sub");

    browser.ActivateSelection();
    EXPECT_EQ(browser.CurrentPath().filename().string(), "sub");
    ASSERT_EQ(browser.Entries().size(), 2u);
    EXPECT_EQ(browser.Entries()[1].name, "inner.wav");

    // ".." leads back up.
    browser.ActivateSelection();
    EXPECT_EQ(browser.CurrentPath().filename().string(), scratch.Path().filename().string());
}

TEST(FileBrowserTest, AudioFilesInReturnsSortedAudioOnly) {
    ScratchDirectory scratch;
    Touch(scratch.Path() / "snare.wav");
    Touch(scratch.Path() / "kick.mp3");
    Touch(scratch.Path() / "readme.md");
    std::filesystem::create_directory(scratch.Path() / "nested.wav");

    const std::vector<std::filesystem::path> files = FileBrowser::AudioFilesIn(scratch.Path());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "kick.mp3");
    EXPECT_EQ(files[1].filename().string(), "snare.wav");
}
