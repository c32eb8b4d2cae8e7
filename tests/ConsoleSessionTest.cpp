#include "memotrak/app/ConsoleSession.hpp"

#include "MemotrakTestHelpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

namespace memotrak::app {
namespace {

using test_helpers::FakeDecoder;
using test_helpers::FakeOutput;
using test_helpers::FakeOutputState;
using test_helpers::makeConstant;
using test_helpers::ScopedTempDir;
using test_helpers::touchFile;

struct ConsoleFixture {
    explicit ConsoleFixture(const std::string& name)
        : dir(name), output(std::make_shared<FakeOutputState>()) {
        touchFile(dir.path() / "240315_1400.mp3");
        touchFile(dir.path() / "240315_0930.mp3");
        touchFile(dir.path() / "231231_2359.wav");
        touchFile(dir.path() / "notes.txt");

        auto decoder = std::make_unique<FakeDecoder>();
        decoder->add(dir.path() / "240315_1400.mp3", makeConstant(96000, 48000, 0.5f));
        decoder->add(dir.path() / "240315_0930.mp3", makeConstant(48000, 48000, 0.5f));
        // 231231_2359.wav is deliberately undecodable.
        engine = std::make_unique<audio::PlaybackEngine>(std::move(decoder), std::make_unique<FakeOutput>(output));
        console = std::make_unique<ConsoleSession>(*engine, store, settings, out, dir.path() / "transcripts.json");
    }

    std::string takeOutput() {
        std::string text = out.str();
        out.str(std::string());
        return text;
    }

    ScopedTempDir dir;
    std::shared_ptr<FakeOutputState> output;
    transcript::TranscriptStore store;
    AppSettings settings;
    std::ostringstream out;
    std::unique_ptr<audio::PlaybackEngine> engine;
    std::unique_ptr<ConsoleSession> console;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(ConsoleSessionTest, OpenDirectoryListsRecordingsGroupedNewestFirst) {
    ConsoleFixture fx("console-open");

    ASSERT_TRUE(fx.console->openDirectory(fx.dir.path()));
    ASSERT_EQ(fx.console->rows().size(), 3u);
    EXPECT_EQ(fx.console->rows()[0].label, "240315_1400.mp3");
    EXPECT_EQ(fx.console->rows()[2].label, "231231_2359.wav");
    ASSERT_TRUE(fx.settings.lastDirectory.has_value());

    const std::string text = fx.takeOutput();
    EXPECT_TRUE(contains(text, "2024\n"));
    EXPECT_TRUE(contains(text, "March"));
    EXPECT_TRUE(contains(text, "[1] 240315_1400.mp3  14:00"));
    EXPECT_TRUE(contains(text, "[3] 231231_2359.wav  23:59"));
    EXPECT_FALSE(contains(text, "notes.txt"));
}

TEST(ConsoleSessionTest, MissingDirectoryIsReported) {
    ConsoleFixture fx("console-missing-dir");
    EXPECT_FALSE(fx.console->openDirectory(fx.dir.path() / "nope"));
    EXPECT_FALSE(fx.console->directory().has_value());
}

TEST(ConsoleSessionTest, ToggleLoadsSelectionThenAlternates) {
    ConsoleFixture fx("console-toggle");
    ASSERT_TRUE(fx.console->openDirectory(fx.dir.path()));
    fx.takeOutput();

    EXPECT_TRUE(fx.console->execute("select 2"));
    ASSERT_TRUE(fx.console->selection().has_value());
    EXPECT_EQ(*fx.console->selection(), 1u);

    fx.console->execute("toggle");
    EXPECT_TRUE(fx.engine->isPlaying());
    ASSERT_TRUE(fx.engine->currentFile().has_value());
    EXPECT_EQ(fx.engine->currentFile()->filename().string(), "240315_0930.mp3");
    const std::string text = fx.takeOutput();
    EXPECT_TRUE(contains(text, "Loaded 240315_0930.mp3 (00:01)"));
    EXPECT_TRUE(contains(text, "Playing"));

    fx.console->execute("toggle");
    EXPECT_FALSE(fx.engine->isPlaying());
    EXPECT_TRUE(contains(fx.takeOutput(), "Paused"));
}

TEST(ConsoleSessionTest, TransportCommandsDriveEngine) {
    ConsoleFixture fx("console-transport");
    ASSERT_TRUE(fx.console->openDirectory(fx.dir.path()));
    fx.takeOutput();

    fx.console->execute("load 1");
    EXPECT_DOUBLE_EQ(fx.engine->duration(), 2.0);
    fx.console->execute("play");
    EXPECT_TRUE(fx.engine->isPlaying());

    fx.console->execute("seek 1.5");
    EXPECT_DOUBLE_EQ(fx.engine->position(), 1.5);
    EXPECT_TRUE(contains(fx.takeOutput(), "00:01 / 00:02 (playing)"));

    fx.console->execute("stop");
    EXPECT_FALSE(fx.engine->isPlaying());
    EXPECT_DOUBLE_EQ(fx.engine->position(), 0.0);

    fx.console->execute("seek later");
    EXPECT_TRUE(contains(fx.takeOutput(), "Usage: seek <seconds>"));
}

TEST(ConsoleSessionTest, VolumeIsClampedAndRemembered) {
    ConsoleFixture fx("console-volume");

    fx.console->execute("vol 170");
    EXPECT_FLOAT_EQ(fx.engine->volume(), 1.0f);
    EXPECT_FLOAT_EQ(fx.settings.volume, 1.0f);
    EXPECT_TRUE(contains(fx.takeOutput(), "Volume 100%"));

    fx.console->execute("vol 40");
    EXPECT_FLOAT_EQ(fx.engine->volume(), 0.4f);
    EXPECT_FLOAT_EQ(fx.settings.volume, 0.4f);
    EXPECT_TRUE(contains(fx.takeOutput(), "Volume 40%"));
}

TEST(ConsoleSessionTest, LoadFailureKeepsPreviousFile) {
    ConsoleFixture fx("console-load-failure");
    ASSERT_TRUE(fx.console->openDirectory(fx.dir.path()));
    fx.console->execute("load 1");
    fx.takeOutput();

    fx.console->execute("load 3");
    EXPECT_TRUE(contains(fx.takeOutput(), "Could not load audio file:"));
    ASSERT_TRUE(fx.engine->currentFile().has_value());
    EXPECT_EQ(fx.engine->currentFile()->filename().string(), "240315_1400.mp3");

    fx.console->execute("load 9");
    EXPECT_TRUE(contains(fx.takeOutput(), "Nothing selected"));
}

TEST(ConsoleSessionTest, ShortSearchShowsEverythingLongerSearchShowsHits) {
    ConsoleFixture fx("console-search");
    ASSERT_TRUE(fx.console->openDirectory(fx.dir.path()));
    fx.store.add(fx.dir.path() / "240315_0930.mp3", "Call the dentist about Tuesday");
    fx.takeOutput();

    fx.console->execute("search de");
    EXPECT_EQ(fx.console->rows().size(), 3u);

    fx.console->execute("search DENT");
    ASSERT_EQ(fx.console->rows().size(), 1u);
    EXPECT_EQ(fx.console->rows()[0].label, "240315_0930.mp3");
    EXPECT_TRUE(contains(fx.takeOutput(), "[1] 240315_0930.mp3  Call the dentist about Tuesday"));

    fx.console->execute("search nothing-like-this");
    EXPECT_TRUE(fx.console->rows().empty());
    EXPECT_TRUE(contains(fx.takeOutput(), "No matches"));
}

TEST(ConsoleSessionTest, TranscriptCommandsStoreShowAndExport) {
    ConsoleFixture fx("console-transcript");
    ASSERT_TRUE(fx.console->openDirectory(fx.dir.path()));
    fx.takeOutput();

    fx.console->execute("show 1");
    EXPECT_TRUE(contains(fx.takeOutput(), "No transcription available for this file."));

    fx.console->execute("transcript 1 buy milk and eggs");
    EXPECT_TRUE(fx.console->rows()[0].transcribed);
    EXPECT_TRUE(fx.store.hasTranscript(fx.dir.path() / "240315_1400.mp3"));
    EXPECT_TRUE(std::filesystem::exists(fx.dir.path() / "transcripts.json"));

    fx.console->execute("show");
    EXPECT_TRUE(contains(fx.takeOutput(), "buy milk and eggs"));

    fx.console->execute("export 1");
    EXPECT_TRUE(std::filesystem::exists(fx.dir.path() / "240315_1400.txt"));
    EXPECT_TRUE(contains(fx.takeOutput(), "Transcription saved to"));

    fx.console->execute("export 2");
    EXPECT_TRUE(contains(fx.takeOutput(), "No transcription available for"));
}

TEST(ConsoleSessionTest, QuitStopsTheLoopAndUnknownCommandsAreReported) {
    ConsoleFixture fx("console-quit");

    EXPECT_TRUE(fx.console->execute(""));
    EXPECT_TRUE(fx.console->execute("dance"));
    EXPECT_TRUE(contains(fx.takeOutput(), "Unknown command 'dance'"));
    EXPECT_FALSE(fx.console->execute("quit"));
    EXPECT_FALSE(fx.console->execute("  exit  "));
}

}  // namespace
}  // namespace memotrak::app
