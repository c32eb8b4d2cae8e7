#include "memotrak/audio/AudioBuffer.hpp"

#include <format>
#include <utility>

namespace memotrak::audio {

std::expected<AudioBuffer, std::string> AudioBuffer::fromStereo(std::vector<float> samples, uint32_t sampleRate) {
    if (sampleRate == 0) {
        return std::unexpected("Sample rate must be positive");
    }
    if (samples.size() % kChannels != 0) {
        return std::unexpected(std::format("Stereo sample count {} is not a whole number of frames", samples.size()));
    }
    return AudioBuffer(std::move(samples), sampleRate);
}

std::expected<AudioBuffer, std::string> AudioBuffer::fromInterleaved(std::span<const float> samples, uint32_t channels,
                                                                     uint32_t sampleRate) {
    if (channels == kChannels) {
        return fromStereo(std::vector<float>(samples.begin(), samples.end()), sampleRate);
    }
    if (channels != 1) {
        return std::unexpected(std::format("Unsupported channel count {} (expected 1 or 2)", channels));
    }

    std::vector<float> stereo;
    stereo.reserve(samples.size() * kChannels);
    for (const float sample : samples) {
        stereo.push_back(sample);
        stereo.push_back(sample);
    }
    return fromStereo(std::move(stereo), sampleRate);
}

double AudioBuffer::durationSeconds() const {
    if (sampleRate_ == 0) {
        return 0.0;
    }
    return static_cast<double>(frameCount()) / static_cast<double>(sampleRate_);
}

}  // namespace memotrak::audio
