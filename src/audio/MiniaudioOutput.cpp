#include "memotrak/audio/MiniaudioOutput.hpp"

#include <atomic>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <span>

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

namespace memotrak::audio {

struct MiniaudioOutput::Impl {
    ma_device device{};
    uint32_t sample_rate = 0;
    bool initialized = false;

    AudioRenderer* renderer = nullptr;
    std::atomic<bool> closing{false};
};

namespace {

constexpr uint32_t kPeriodMilliseconds = 10;

void dataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frame_count) {
    auto* impl = static_cast<MiniaudioOutput::Impl*>(device->pUserData);
    auto* out = static_cast<float*>(output);
    const size_t sampleCount = static_cast<size_t>(frame_count) * 2;

    if (!impl || !impl->renderer) {
        std::memset(out, 0, sampleCount * sizeof(float));
        return;
    }

    impl->renderer->render(std::span<float>(out, sampleCount), frame_count);
}

void notificationCallback(const ma_device_notification* notification) {
    if (notification->type != ma_device_notification_type_stopped) {
        return;
    }

    auto* impl = static_cast<MiniaudioOutput::Impl*>(notification->pDevice->pUserData);
    if (!impl || !impl->renderer || impl->closing.load()) {
        return;
    }
    impl->renderer->onStreamFinished();
}

}  // namespace

MiniaudioOutput::MiniaudioOutput() : impl_(std::make_unique<Impl>()) {}

MiniaudioOutput::~MiniaudioOutput() {
    close();
}

std::expected<void, std::string> MiniaudioOutput::open(AudioRenderer& renderer, uint32_t sampleRate) {
    close();

    ma_device_config config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = 2;
    config.sampleRate = sampleRate;
    config.periodSizeInMilliseconds = kPeriodMilliseconds;
    config.dataCallback = dataCallback;
    config.notificationCallback = notificationCallback;
    config.pUserData = impl_.get();

    impl_->renderer = &renderer;
    impl_->closing = false;

    const ma_result initResult = ma_device_init(nullptr, &config, &impl_->device);
    if (initResult != MA_SUCCESS) {
        impl_->renderer = nullptr;
        return std::unexpected(
            std::format("Failed to initialize playback device: {}", ma_result_description(initResult)));
    }

    impl_->initialized = true;
    impl_->sample_rate = impl_->device.sampleRate;

    const ma_result startResult = ma_device_start(&impl_->device);
    if (startResult != MA_SUCCESS) {
        close();
        return std::unexpected(std::format("Failed to start playback device: {}", ma_result_description(startResult)));
    }

    return {};
}

void MiniaudioOutput::close() {
    if (impl_ && impl_->initialized) {
        impl_->closing = true;
        ma_device_uninit(&impl_->device);
        impl_->initialized = false;
        impl_->renderer = nullptr;
    }
}

bool MiniaudioOutput::isOpen() const {
    return impl_->initialized;
}

uint32_t MiniaudioOutput::sampleRate() const {
    return impl_->sample_rate;
}

}  // namespace memotrak::audio
