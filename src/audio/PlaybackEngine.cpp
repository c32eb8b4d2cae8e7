#include "memotrak/audio/PlaybackEngine.hpp"

#include "memotrak/common/Logger.hpp"

#include <format>
#include <utility>

namespace memotrak::audio {

PlaybackEngine::PlaybackEngine(std::unique_ptr<AudioDecoder> decoder, std::unique_ptr<AudioOutput> output,
                               PlaybackEngineOptions options)
    : options_(options), decoder_(std::move(decoder)), output_(std::move(output)) {
    if (!output_) {
        deviceError_ = "No audio output backend available";
        common::Logger::logError(*deviceError_);
        return;
    }

    common::Logger::log(std::format("Opening audio output at {} Hz...", options_.initialSampleRate));
    reopenOutput(options_.initialSampleRate);
    if (output_) {
        common::Logger::log(std::format("Audio output ready ({} Hz)", output_->sampleRate()));
    }
}

PlaybackEngine::~PlaybackEngine() {
    shutdown();
}

std::expected<void, std::string> PlaybackEngine::loadFile(const std::filesystem::path& path) {
    if (!decoder_) {
        return std::unexpected("No audio decoder configured");
    }

    // Decode before touching the session so the audio thread never waits on file I/O.
    auto decoded = decoder_->decode(path);
    if (!decoded.has_value()) {
        common::Logger::logError(std::format("Could not load '{}': {}", path.string(), decoded.error()));
        return std::unexpected(decoded.error());
    }

    auto buffer = std::make_shared<const AudioBuffer>(std::move(*decoded));
    const uint32_t bufferRate = buffer->sampleRate();
    const size_t frames = buffer->frameCount();

    const bool reconfigure = options_.followBufferSampleRate && output_ && output_->isOpen() &&
                             output_->sampleRate() != bufferRate;
    if (reconfigure) {
        output_->close();
    }

    session_.install(std::move(buffer), path);

    if (reconfigure) {
        common::Logger::log(std::format("Reopening audio output at {} Hz", bufferRate));
        reopenOutput(bufferRate);
    }

    common::Logger::log(std::format("Loaded '{}' ({} frames @ {} Hz)", path.string(), frames, bufferRate));
    return {};
}

void PlaybackEngine::play() {
    session_.play();
}

void PlaybackEngine::pause() {
    session_.pause();
}

void PlaybackEngine::stop() {
    session_.stop();
}

void PlaybackEngine::seek(double seconds) {
    session_.seek(seconds);
}

void PlaybackEngine::setVolume(float level) {
    session_.setVolume(level);
}

double PlaybackEngine::position() const {
    return session_.position();
}

double PlaybackEngine::duration() const {
    return session_.duration();
}

float PlaybackEngine::volume() const {
    return session_.volume();
}

bool PlaybackEngine::isPlaying() const {
    return session_.isPlaying();
}

bool PlaybackEngine::isLoaded() const {
    return session_.isLoaded();
}

std::optional<std::filesystem::path> PlaybackEngine::currentFile() const {
    return session_.currentFile();
}

bool PlaybackEngine::hasOutput() const {
    return output_ && output_->isOpen();
}

void PlaybackEngine::shutdown() {
    if (output_) {
        output_->close();
        output_.reset();
        common::Logger::log("Audio output closed");
    }
    session_.clear();
}

void PlaybackEngine::reopenOutput(uint32_t sampleRate) {
    auto opened = output_->open(session_, sampleRate);
    if (!opened.has_value()) {
        deviceError_ = opened.error();
        common::Logger::logError(std::format("Audio output unavailable, playback will be silent: {}", opened.error()));
        output_.reset();
    }
}

}  // namespace memotrak::audio
