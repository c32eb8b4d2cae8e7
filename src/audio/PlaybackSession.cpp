#include "memotrak/audio/PlaybackSession.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>
#include <utility>

namespace memotrak::audio {
namespace {

void fillSilence(std::span<float> output) noexcept {
    std::fill(output.begin(), output.end(), 0.0f);
}

}  // namespace

void PlaybackSession::install(AudioBufferPtr buffer, std::filesystem::path path) {
    AudioBufferPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(state_.buffer, std::move(buffer));
        state_.currentFile = std::move(path);
        state_.position = 0;
        state_.playing = false;
    }
    // `previous` is freed here, outside the lock, so the audio thread never waits on a deallocation.
}

void PlaybackSession::clear() {
    AudioBufferPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(state_.buffer, nullptr);
        state_.currentFile.reset();
        state_.position = 0;
        state_.playing = false;
    }
}

void PlaybackSession::play() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.buffer) {
        state_.playing = true;
    }
}

void PlaybackSession::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.playing = false;
}

void PlaybackSession::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.playing = false;
    state_.position = 0;
}

void PlaybackSession::seek(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.buffer) {
        return;
    }
    state_.position = secondsToFrame(seconds, state_.buffer->sampleRate(), state_.buffer->frameCount());
}

void PlaybackSession::setVolume(float volume) {
    const float clamped = clampVolume(volume);
    std::lock_guard<std::mutex> lock(mutex_);
    state_.volume = clamped;
}

double PlaybackSession::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.buffer) {
        return 0.0;
    }
    return static_cast<double>(state_.position) / static_cast<double>(state_.buffer->sampleRate());
}

double PlaybackSession::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.buffer) {
        return 0.0;
    }
    return state_.buffer->durationSeconds();
}

size_t PlaybackSession::positionFrames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.position;
}

size_t PlaybackSession::frameCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.buffer ? state_.buffer->frameCount() : 0;
}

uint32_t PlaybackSession::sampleRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.buffer ? state_.buffer->sampleRate() : 0;
}

float PlaybackSession::volume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.volume;
}

bool PlaybackSession::isPlaying() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.playing;
}

bool PlaybackSession::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.buffer != nullptr;
}

std::optional<std::filesystem::path> PlaybackSession::currentFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.currentFile;
}

void PlaybackSession::render(std::span<float> output, uint32_t frameCount) noexcept {
    const size_t requestedSamples = static_cast<size_t>(frameCount) * AudioBuffer::kChannels;
    std::span<float> out = output.first(std::min(output.size(), requestedSamples));
    const size_t requestedFrames = out.size() / AudioBuffer::kChannels;

    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    try {
        lock.lock();
    } catch (const std::system_error&) {
        fillSilence(out);
        return;
    }

    if (!state_.buffer || !state_.playing) {
        fillSilence(out);
        return;
    }

    const size_t totalFrames = state_.buffer->frameCount();
    if (state_.position >= totalFrames) {
        state_.playing = false;
        fillSilence(out);
        return;
    }

    const size_t valid = std::min(requestedFrames, totalFrames - state_.position);
    const auto source = state_.buffer->frames(state_.position, valid);
    const float gain = state_.volume;
    std::transform(source.begin(), source.end(), out.begin(), [gain](float sample) { return sample * gain; });
    fillSilence(out.subspan(source.size()));

    state_.position += valid;
    if (state_.position >= totalFrames) {
        // The tail was just delivered; report stopped now instead of one period later.
        state_.playing = false;
    }
}

void PlaybackSession::onStreamFinished() noexcept {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    try {
        lock.lock();
    } catch (const std::system_error&) {
        return;
    }
    state_.playing = false;
    state_.position = 0;
}

size_t PlaybackSession::secondsToFrame(double seconds, uint32_t sampleRate, size_t frameCount) {
    const double frame = std::round(seconds * static_cast<double>(sampleRate));
    if (std::isnan(frame) || frame <= 0.0) {
        return 0;
    }
    if (frame >= static_cast<double>(frameCount)) {
        return frameCount;
    }
    return static_cast<size_t>(frame);
}

float PlaybackSession::clampVolume(float volume) {
    if (std::isnan(volume)) {
        return 0.0f;
    }
    return std::clamp(volume, 0.0f, 1.0f);
}

}  // namespace memotrak::audio
