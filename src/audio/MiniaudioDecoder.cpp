#include "memotrak/audio/AudioDecoder.hpp"

#include <miniaudio.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <vector>

namespace memotrak::audio {
namespace {

constexpr ma_uint64 kChunkFrames = 4096;

struct DecodedPcm {
    std::vector<float> samples;
    uint32_t channels = 0;
    uint32_t sampleRate = 0;
};

std::expected<DecodedPcm, std::string> readAll(const std::string& path, ma_uint32 channels) {
    // Zero channels / sample rate keep the file's native format.
    ma_decoder_config decoderConfig = ma_decoder_config_init(ma_format_f32, channels, 0);
    ma_decoder decoder{};

    const ma_result initResult = ma_decoder_init_file(path.c_str(), &decoderConfig, &decoder);
    if (initResult != MA_SUCCESS) {
        return std::unexpected(
            std::format("Failed to open audio file '{}': {}", path, ma_result_description(initResult)));
    }

    DecodedPcm pcm;
    pcm.channels = decoder.outputChannels;
    pcm.sampleRate = decoder.outputSampleRate;
    if (pcm.channels == 0 || pcm.sampleRate == 0) {
        ma_decoder_uninit(&decoder);
        return std::unexpected(std::format("Audio file '{}' reports an empty format", path));
    }

    ma_uint64 totalFrames = 0;
    if (ma_decoder_get_length_in_pcm_frames(&decoder, &totalFrames) == MA_SUCCESS && totalFrames > 0) {
        pcm.samples.reserve(static_cast<size_t>(totalFrames * pcm.channels));
    }

    std::vector<float> chunk(static_cast<size_t>(kChunkFrames * pcm.channels));
    while (true) {
        ma_uint64 framesRead = 0;
        const ma_result readResult = ma_decoder_read_pcm_frames(&decoder, chunk.data(), kChunkFrames, &framesRead);
        if (readResult != MA_SUCCESS && readResult != MA_AT_END) {
            ma_decoder_uninit(&decoder);
            return std::unexpected(
                std::format("Error while decoding '{}': {}", path, ma_result_description(readResult)));
        }

        if (framesRead == 0) {
            break;
        }

        pcm.samples.insert(pcm.samples.end(), chunk.begin(),
                           chunk.begin() + static_cast<std::ptrdiff_t>(framesRead * pcm.channels));
        if (readResult == MA_AT_END) {
            break;
        }
    }

    ma_decoder_uninit(&decoder);
    return pcm;
}

}  // namespace

std::expected<AudioBuffer, std::string> MiniaudioDecoder::decode(const std::filesystem::path& path) {
    const std::string pathString = path.string();

    auto pcm = readAll(pathString, 0);
    if (!pcm.has_value()) {
        return std::unexpected(pcm.error());
    }

    if (pcm->channels > AudioBuffer::kChannels) {
        // Let miniaudio's channel converter fold surround layouts down to stereo.
        pcm = readAll(pathString, AudioBuffer::kChannels);
        if (!pcm.has_value()) {
            return std::unexpected(pcm.error());
        }
    }

    if (pcm->samples.empty()) {
        return std::unexpected(std::format("Audio file '{}' contains no samples", pathString));
    }

    auto buffer = AudioBuffer::fromInterleaved(pcm->samples, pcm->channels, pcm->sampleRate);
    if (!buffer.has_value()) {
        return std::unexpected(std::format("Audio file '{}': {}", pathString, buffer.error()));
    }
    return buffer;
}

}  // namespace memotrak::audio
