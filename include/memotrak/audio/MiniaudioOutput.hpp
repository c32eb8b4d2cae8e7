#pragma once

#include "memotrak/audio/AudioOutput.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace memotrak::audio {

/// Default playback device through miniaudio.
/// The stream is opened with the renderer's sample rate; miniaudio resamples to the hardware rate.
class MiniaudioOutput final : public AudioOutput {
public:
    struct Impl;

    MiniaudioOutput();
    ~MiniaudioOutput() override;

    MiniaudioOutput(const MiniaudioOutput&) = delete;
    MiniaudioOutput& operator=(const MiniaudioOutput&) = delete;

    std::expected<void, std::string> open(AudioRenderer& renderer, uint32_t sampleRate) override;
    void close() override;
    bool isOpen() const override;
    uint32_t sampleRate() const override;

private:
    std::unique_ptr<Impl> impl_;
};

}  // namespace memotrak::audio
