#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace memotrak::audio {

/// Decoded PCM held fully in memory.
/// Samples are interleaved stereo floats (L, R, L, R, ...); the channel count is always 2.
class AudioBuffer {
public:
    static constexpr uint32_t kChannels = 2;

    /// Build a buffer from interleaved stereo samples.
    /// Fails when the sample rate is zero or the sample count is not a whole number of frames.
    static std::expected<AudioBuffer, std::string> fromStereo(std::vector<float> samples, uint32_t sampleRate);

    /// Build a buffer from interleaved samples with 1 or 2 channels.
    /// Mono input is upmixed by copying each sample into both channels.
    static std::expected<AudioBuffer, std::string> fromInterleaved(std::span<const float> samples, uint32_t channels,
                                                                   uint32_t sampleRate);

    uint32_t sampleRate() const { return sampleRate_; }
    size_t frameCount() const { return samples_.size() / kChannels; }
    double durationSeconds() const;

    std::span<const float> samples() const { return samples_; }

    /// Samples of `count` frames starting at `frame`. The range must lie inside the buffer.
    std::span<const float> frames(size_t frame, size_t count) const {
        return std::span<const float>(samples_).subspan(frame * kChannels, count * kChannels);
    }

private:
    AudioBuffer(std::vector<float> samples, uint32_t sampleRate)
        : samples_(std::move(samples)), sampleRate_(sampleRate) {}

    std::vector<float> samples_;
    uint32_t sampleRate_ = 0;
};

using AudioBufferPtr = std::shared_ptr<const AudioBuffer>;

}  // namespace memotrak::audio
