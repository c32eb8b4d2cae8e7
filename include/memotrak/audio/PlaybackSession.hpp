#pragma once

#include "memotrak/audio/AudioBuffer.hpp"
#include "memotrak/audio/AudioOutput.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>

namespace memotrak::audio {

/// Transport state shared between the control thread and the audio thread.
///
/// Every field lives behind one mutex. All control-side critical sections are O(1): decoding
/// happens before install() is called, which only swaps the buffer pointer in.
class PlaybackSession final : public AudioRenderer {
public:
    PlaybackSession() = default;

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    /// Replace the buffer, rewind to frame 0 and stop. The previous buffer is released here
    /// unless the caller still holds it.
    void install(AudioBufferPtr buffer, std::filesystem::path path);

    /// Drop the buffer and current file, returning to the idle state.
    void clear();

    void play();
    void pause();
    void stop();
    void seek(double seconds);
    void setVolume(float volume);

    double position() const;
    double duration() const;
    size_t positionFrames() const;
    size_t frameCount() const;
    uint32_t sampleRate() const;
    float volume() const;
    bool isPlaying() const;
    bool isLoaded() const;
    std::optional<std::filesystem::path> currentFile() const;

    // AudioRenderer
    void render(std::span<float> output, uint32_t frameCount) noexcept override;
    void onStreamFinished() noexcept override;

    /// Frame index for `seconds` in a buffer of `frameCount` frames at `sampleRate`:
    /// round(seconds * sampleRate) clamped to [0, frameCount]. NaN maps to 0.
    static size_t secondsToFrame(double seconds, uint32_t sampleRate, size_t frameCount);

    /// `volume` clamped to [0, 1]. NaN maps to 0.
    static float clampVolume(float volume);

private:
    struct State {
        AudioBufferPtr buffer;
        std::optional<std::filesystem::path> currentFile;
        size_t position = 0;
        bool playing = false;
        float volume = 1.0f;
    };

    mutable std::mutex mutex_;
    State state_;
};

}  // namespace memotrak::audio
