#pragma once

#include "memotrak/audio/AudioBuffer.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace memotrak::audio {

/// Turns a file into a fully decoded stereo AudioBuffer.
/// Called from the control thread only; implementations may block on I/O.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual std::expected<AudioBuffer, std::string> decode(const std::filesystem::path& path) = 0;
};

/// Decodes any format miniaudio's built-in decoders understand (WAV, FLAC, MP3).
/// Output keeps the file's native sample rate. Mono is upmixed, layouts wider than stereo are
/// downmixed by miniaudio's channel converter.
class MiniaudioDecoder final : public AudioDecoder {
public:
    std::expected<AudioBuffer, std::string> decode(const std::filesystem::path& path) override;
};

}  // namespace memotrak::audio
