#pragma once

#include "memotrak/audio/AudioDecoder.hpp"
#include "memotrak/audio/AudioOutput.hpp"
#include "memotrak/audio/PlaybackSession.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace memotrak::audio {

struct PlaybackEngineOptions {
    /// Rate the output stream is opened at before anything is loaded.
    uint32_t initialSampleRate = 48000;
    /// Reopen the output stream at the loaded buffer's rate when the two differ.
    bool followBufferSampleRate = true;
};

/// Control API for file playback.
///
/// Owns the decoder, the transport session and the output stream. The output is opened in the
/// constructor; if that fails the engine keeps working silently and reports the failure through
/// deviceError(). All methods are meant for a single control thread.
class PlaybackEngine {
public:
    PlaybackEngine(std::unique_ptr<AudioDecoder> decoder, std::unique_ptr<AudioOutput> output,
                   PlaybackEngineOptions options = {});
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    /// Decode `path` and make it the current file, stopped at frame 0.
    /// On failure nothing about the current session changes.
    std::expected<void, std::string> loadFile(const std::filesystem::path& path);

    void play();
    void pause();
    void stop();
    void seek(double seconds);
    void setVolume(float level);

    double position() const;
    double duration() const;
    float volume() const;
    bool isPlaying() const;
    bool isLoaded() const;
    std::optional<std::filesystem::path> currentFile() const;

    /// Set when the output stream could not be opened. The engine is silent in that case.
    const std::optional<std::string>& deviceError() const { return deviceError_; }
    bool hasOutput() const;

    /// Close the output stream and release the loaded buffer. Safe to call more than once.
    void shutdown();

    PlaybackSession& session() { return session_; }
    const PlaybackSession& session() const { return session_; }

private:
    void reopenOutput(uint32_t sampleRate);

    PlaybackEngineOptions options_;
    std::unique_ptr<AudioDecoder> decoder_;
    // Declared before the output so it outlives any in-flight render call during teardown.
    PlaybackSession session_;
    std::unique_ptr<AudioOutput> output_;
    std::optional<std::string> deviceError_;
};

}  // namespace memotrak::audio
