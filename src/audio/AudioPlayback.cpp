// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayback.hpp"

#include <audio/MiniaudioErrors.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <format>
#include <mutex>
#include <utility>
#include <vector>

namespace voicetutor
{

struct MiniaudioPlayback::Impl
{
    ma_device device {};
    bool initialized = false;
    unsigned sampleRate = 0;
    unsigned channels = 0;

    // Buffer state shared with the device callback
    std::mutex mutex;
    std::vector<float> buffer;
    std::size_t readPos = 0;
    DrainedCallback onDrained;

    auto ensureDevice(unsigned rate, unsigned channelCount) -> VoidResult
    {
        if (initialized && sampleRate == rate && channels == channelCount)
            return {};

        if (initialized)
        {
            ma_device_uninit(&device);
            initialized = false;
        }

        auto config = ma_device_config_init(ma_device_type_playback);
        config.playback.format = ma_format_f32;
        config.playback.channels = channelCount;
        config.sampleRate = rate;
        config.dataCallback = playbackDataCallback;
        config.pUserData = this;

        auto const result = ma_device_init(nullptr, &config, &device);
        if (result != MA_SUCCESS)
            return makeError(classifyDeviceResult(result),
                             std::format("Failed to initialize playback device: {}", ma_result_description(result)));

        initialized = true;
        sampleRate = rate;
        channels = channelCount;
        log::debug("Audio playback initialized ({} Hz, {} channel(s), f32)", rate, channelCount);
        return {};
    }

    static void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const totalSamples = static_cast<std::size_t>(frameCount) * device->playback.channels;

        auto drained = DrainedCallback {};
        {
            auto lock = std::lock_guard(impl->mutex);
            auto const remaining = impl->buffer.size() - impl->readPos;
            auto const toCopy = std::min(totalSamples, remaining);

            if (toCopy > 0)
            {
                std::copy_n(impl->buffer.data() + impl->readPos, toCopy, out);
                impl->readPos += toCopy;
            }

            // Zero-fill any remaining output frames
            if (toCopy < totalSamples)
                std::fill_n(out + toCopy, totalSamples - toCopy, 0.0f);

            if (impl->readPos >= impl->buffer.size() && impl->onDrained)
                drained = std::exchange(impl->onDrained, DrainedCallback {});
        }

        if (drained)
            drained();
    }
};

MiniaudioPlayback::MiniaudioPlayback(): _impl(std::make_unique<Impl>())
{
}

MiniaudioPlayback::~MiniaudioPlayback()
{
    release();
}

auto MiniaudioPlayback::play(const AudioClip& clip, DrainedCallback onDrained) -> VoidResult
{
    if (clip.empty())
    {
        if (onDrained)
            onDrained();
        return {};
    }

    stop();

    auto deviceResult = _impl->ensureDevice(clip.sampleRate, clip.channels);
    if (!deviceResult)
        return deviceResult;

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->buffer = clip.samples;
        _impl->readPos = 0;
        _impl->onDrained = std::move(onDrained);
    }

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start playback: {}", ma_result_description(startResult)));

    return {};
}

void MiniaudioPlayback::stop()
{
    if (!_impl->initialized)
        return;

    // ma_device_stop blocks until the data callback has returned for the last time.
    ma_device_stop(&_impl->device);

    auto lock = std::lock_guard(_impl->mutex);
    _impl->buffer.clear();
    _impl->readPos = 0;
    _impl->onDrained = {};
}

void MiniaudioPlayback::release()
{
    stop();
    if (_impl->initialized)
    {
        ma_device_uninit(&_impl->device);
        _impl->initialized = false;
        log::debug("Audio playback device released");
    }
}

} // namespace voicetutor
