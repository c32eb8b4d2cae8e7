#include "memotrak/transcript/TranscriptStore.hpp"

#include "MemotrakTestHelpers.hpp"

#include <gtest/gtest.h>

#include <expected>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace memotrak::transcript {
namespace {

using test_helpers::ScopedTempDir;
using test_helpers::touchFile;

std::vector<std::string> paths(const std::vector<TranscriptMatch>& matches) {
    std::vector<std::string> result;
    for (const auto& match : matches) {
        result.push_back(match.path);
    }
    return result;
}

TEST(TranscriptStoreTest, AddThenGetReturnsCompletedText) {
    TranscriptStore store;
    store.add("a.mp3", "Budget review with the team");

    const auto text = store.get("a.mp3");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Budget review with the team");
    EXPECT_TRUE(store.hasTranscript("a.mp3"));
    EXPECT_FALSE(store.get("b.mp3").has_value());

    const auto entry = store.entry("a.mp3");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, TranscriptStatus::Completed);
}

TEST(TranscriptStoreTest, SearchIsCaseInsensitiveSubstringOverWords) {
    TranscriptStore store;
    store.add("a.mp3", "Budget review with the team");
    store.add("b.mp3", "Call the plumber about the BATHROOM");
    store.add("c.mp3", "nothing relevant");

    EXPECT_EQ(paths(store.search("BUDG")), std::vector<std::string>{"a.mp3"});
    EXPECT_EQ(paths(store.search("throo")), std::vector<std::string>{"b.mp3"});
    EXPECT_TRUE(store.search("zebra").empty());
    // Words are matched one at a time.
    EXPECT_TRUE(store.search("budget review").empty());
}

TEST(TranscriptStoreTest, SearchReturnsEachPathOnceNewestFirst) {
    TranscriptStore store;
    store.add("old.mp3", "meeting meeting meeting");
    store.add("new.mp3", "another meeting");

    const auto matches = store.search("meet");
    EXPECT_EQ(paths(matches), (std::vector<std::string>{"new.mp3", "old.mp3"}));
    EXPECT_EQ(matches[0].text, "another meeting");
}

TEST(TranscriptStoreTest, PendingEntriesAreHidden) {
    TranscriptStore store;
    store.markPending("a.mp3");

    ASSERT_TRUE(store.entry("a.mp3").has_value());
    EXPECT_EQ(store.entry("a.mp3")->status, TranscriptStatus::Pending);
    EXPECT_FALSE(store.get("a.mp3").has_value());
    EXPECT_FALSE(store.hasTranscript("a.mp3"));

    store.add("a.mp3", "finished text");
    EXPECT_EQ(store.get("a.mp3"), std::optional<std::string>("finished text"));
    EXPECT_EQ(store.size(), 1u);
}

TEST(TranscriptStoreTest, ReplacingTranscriptReindexesWords) {
    TranscriptStore store;
    store.add("a.mp3", "apples and oranges");
    store.add("a.mp3", "bananas only");

    EXPECT_TRUE(store.search("apple").empty());
    EXPECT_EQ(paths(store.search("banana")), std::vector<std::string>{"a.mp3"});
}

TEST(TranscriptStoreTest, RemoveDropsEntryAndIndex) {
    TranscriptStore store;
    store.add("a.mp3", "apples");
    EXPECT_TRUE(store.remove("a.mp3"));
    EXPECT_FALSE(store.remove("a.mp3"));
    EXPECT_TRUE(store.search("apple").empty());
    EXPECT_EQ(store.size(), 0u);
}

TEST(TranscriptStoreTest, RecordsLastModifiedForExistingFiles) {
    ScopedTempDir dir("store-mtime");
    const auto audio = dir.path() / "240101_0800.mp3";
    touchFile(audio);

    TranscriptStore store;
    store.add(audio, "hello");
    store.add("not-on-disk.mp3", "hello");

    ASSERT_TRUE(store.entry(audio).has_value());
    EXPECT_TRUE(store.entry(audio)->lastModified.has_value());
    EXPECT_FALSE(store.entry("not-on-disk.mp3")->lastModified.has_value());
}

TEST(TranscriptStoreTest, SnapshotSurvivesSaveAndLoad) {
    ScopedTempDir dir("store-snapshot");
    const auto file = dir.path() / "state" / "transcripts.json";

    TranscriptStore store;
    store.add("first.mp3", "Quarterly numbers");
    store.add("second.mp3", "Numbers again");
    store.markPending("third.mp3");
    ASSERT_TRUE(store.saveTo(file).has_value());

    TranscriptStore reloaded;
    const auto loaded = reloaded.loadFrom(file);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(reloaded.size(), 3u);
    EXPECT_EQ(paths(reloaded.search("numbers")), (std::vector<std::string>{"second.mp3", "first.mp3"}));
    EXPECT_FALSE(reloaded.get("third.mp3").has_value());

    // New entries keep sorting after the reloaded ones.
    reloaded.add("fourth.mp3", "more numbers");
    EXPECT_EQ(paths(reloaded.search("numbers")).front(), "fourth.mp3");
}

TEST(TranscriptStoreTest, MissingSnapshotLoadsEmpty) {
    ScopedTempDir dir("store-missing");
    TranscriptStore store;
    store.add("a.mp3", "text");

    EXPECT_TRUE(store.loadFrom(dir.path() / "none.json").has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(TranscriptStoreTest, MalformedSnapshotIsRejectedAndKeepsContents) {
    ScopedTempDir dir("store-malformed");
    const auto file = dir.path() / "transcripts.json";
    touchFile(file, "{ not valid json");

    TranscriptStore store;
    store.add("a.mp3", "text");
    EXPECT_FALSE(store.loadFrom(file).has_value());
    EXPECT_TRUE(store.hasTranscript("a.mp3"));

    touchFile(file, R"({"format":"something_else","version":1,"entries":[]})");
    const auto wrongFormat = store.loadFrom(file);
    ASSERT_FALSE(wrongFormat.has_value());
    EXPECT_NE(wrongFormat.error().find("something_else"), std::string::npos);
}

TEST(TranscriptStoreTest, MistypedSnapshotFieldsAreErrorsNotExceptions) {
    ScopedTempDir dir("store-mistyped");
    const auto file = dir.path() / "transcripts.json";

    const char* documents[] = {
        R"({"format":5,"version":1,"entries":[]})",
        R"({"format":"memotrak_transcripts","version":"1","entries":[]})",
        R"({"format":"memotrak_transcripts","version":1,"entries":{}})",
        R"({"format":"memotrak_transcripts","version":1,"nextSequence":"7","entries":[]})",
        R"({"format":"memotrak_transcripts","version":1,"nextSequence":-1,"entries":[]})",
        R"({"format":"memotrak_transcripts","version":1,"entries":[{"path":"a.mp3","text":42}]})",
        R"({"format":"memotrak_transcripts","version":1,"entries":[{"path":"a.mp3","status":true}]})",
        R"({"format":"memotrak_transcripts","version":1,"entries":[{"path":"a.mp3","sequence":"3"}]})",
        R"({"format":"memotrak_transcripts","version":1,"entries":[{"path":7}]})",
        R"({"format":"memotrak_transcripts","version":1,"entries":[{"path":"a.mp3","status":"archived"}]})",
    };

    for (const char* document : documents) {
        touchFile(file, document);

        TranscriptStore store;
        store.add("keep.mp3", "still here");
        std::expected<void, std::string> loaded;
        EXPECT_NO_THROW(loaded = store.loadFrom(file)) << document;
        EXPECT_FALSE(loaded.has_value()) << document;
        EXPECT_TRUE(store.hasTranscript("keep.mp3")) << document;
        EXPECT_EQ(store.size(), 1u) << document;
    }
}

TEST(TranscriptStoreTest, ExportWritesTextNextToAudioByDefault) {
    ScopedTempDir dir("store-export");
    const auto audio = dir.path() / "240101_0800.mp3";

    TranscriptStore store;
    store.add(audio, "Remember the milk");

    const auto written = exportTranscriptText(store, audio);
    ASSERT_TRUE(written.has_value()) << written.error();
    EXPECT_EQ(written->string(), (dir.path() / "240101_0800.txt").string());

    std::ifstream in(*written);
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "Remember the milk");

    const auto custom = exportTranscriptText(store, audio, dir.path() / "custom.txt");
    ASSERT_TRUE(custom.has_value());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "custom.txt"));
}

TEST(TranscriptStoreTest, ExportWithoutTranscriptFails) {
    ScopedTempDir dir("store-export-missing");
    TranscriptStore store;
    store.markPending(dir.path() / "a.mp3");

    EXPECT_FALSE(exportTranscriptText(store, dir.path() / "a.mp3").has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "a.txt"));
}

TEST(TranscriptStoreTest, TokenizerLowercasesAndSplitsOnWhitespace) {
    const auto words = tokenizeTranscript("  Hello\tWORLD\nagain  ");
    EXPECT_EQ(words, (std::vector<std::string>{"hello", "world", "again"}));
}

}  // namespace
}  // namespace memotrak::transcript
