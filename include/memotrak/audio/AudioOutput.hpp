#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace memotrak::audio {

/// Produces output samples for an AudioOutput.
/// Both methods run on the audio thread and must neither block for long nor allocate.
class AudioRenderer {
public:
    virtual ~AudioRenderer() = default;

    /// Fill `output` with exactly `frameCount` interleaved stereo frames (L, R, L, R, ...).
    virtual void render(std::span<float> output, uint32_t frameCount) noexcept = 0;

    /// The device stream stopped without being asked to (device lost, backend ended the stream).
    virtual void onStreamFinished() noexcept = 0;
};

/// A platform output stream pulling stereo float frames from an AudioRenderer.
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    /// Open and start the stream. The renderer must outlive the open stream.
    virtual std::expected<void, std::string> open(AudioRenderer& renderer, uint32_t sampleRate) = 0;

    /// Stop and release the stream. No renderer call is in flight once this returns.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// Rate the renderer is driven at. Only meaningful while open.
    virtual uint32_t sampleRate() const = 0;
};

}  // namespace memotrak::audio
