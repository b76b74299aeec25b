// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <audio/MiniaudioErrors.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace voicetutor
{

struct MiniaudioCapture::Impl
{
    CaptureConfig config;
    ma_context context {};
    ma_device device {};
    FrameCallback onFrame;
    CaptureErrorCallback onError;
    std::atomic<float> peakLevel { 0.0f };
    bool contextInitialized = false;
    bool deviceInitialized = false;
    std::atomic<bool> capturing { false };

    // Only touched from the device callback.
    std::vector<float> pending;
    std::size_t samplesPerFrame = 1600;
    std::optional<TimePoint> pendingStart;

    void deliver(const float* samples, std::size_t count)
    {
        auto const now = SteadyClock::now();
        auto offset = std::size_t { 0 };
        while (offset < count)
        {
            if (!pendingStart)
            {
                // Back-date to the first sample of the frame.
                auto const backlog = Millis { static_cast<Millis::rep>(offset * 1000 / config.sampleRate) };
                auto const callbackSpan = Millis { static_cast<Millis::rep>(count * 1000 / config.sampleRate) };
                pendingStart = now - callbackSpan + backlog;
            }

            auto const take = std::min(samplesPerFrame - pending.size(), count - offset);
            pending.insert(pending.end(), samples + offset, samples + offset + take);
            offset += take;

            if (pending.size() == samplesPerFrame)
            {
                auto frame = AudioFrame {
                    .timestamp = *pendingStart,
                    .samples = std::move(pending),
                    .sampleRate = config.sampleRate,
                    .channels = 1,
                };
                pending = {};
                pending.reserve(samplesPerFrame);
                pendingStart.reset();
                onFrame(std::move(frame));
            }
        }
    }
};

namespace
{

    void captureDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MiniaudioCapture::Impl*>(device->pUserData);
        if (!impl || !impl->onFrame || !input)
            return;

        auto const* samples = static_cast<const float*>(input);

        // Peak amplitude for level meters (lock-free)
        auto peak = 0.0f;
        for (auto i = ma_uint32 { 0 }; i < frameCount; ++i)
            peak = std::max(peak, std::abs(samples[i]));
        impl->peakLevel.store(peak, std::memory_order_relaxed);

        impl->deliver(samples, frameCount);
    }

    void captureNotificationCallback(const ma_device_notification* notification)
    {
        if (notification->type != ma_device_notification_type_stopped)
            return;

        auto* impl = static_cast<MiniaudioCapture::Impl*>(notification->pDevice->pUserData);
        // A stop we did not ask for means the device went away underneath us.
        if (impl && impl->capturing && impl->onError)
            impl->onError(Error { ErrorCode::DeviceError, "Capture device stopped unexpectedly" });
    }

    auto lowercase(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

} // namespace

MiniaudioCapture::MiniaudioCapture(CaptureConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    if (_impl->config.sampleRate == 0)
        _impl->config.sampleRate = 16000;
    if (_impl->config.frameMs <= 0)
        _impl->config.frameMs = 100;
    _impl->samplesPerFrame =
        static_cast<std::size_t>(_impl->config.sampleRate) * static_cast<std::size_t>(_impl->config.frameMs) / 1000;
}

MiniaudioCapture::~MiniaudioCapture()
{
    close();
}

auto MiniaudioCapture::open(FrameCallback onFrame, CaptureErrorCallback onError) -> VoidResult
{
    if (_impl->capturing)
        return makeError(ErrorCode::ConcurrencyError, "Capture stream is already open");

    _impl->onFrame = std::move(onFrame);
    _impl->onError = std::move(onError);
    _impl->pending.clear();
    _impl->pendingStart.reset();

    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(classifyDeviceResult(ctxResult),
                         std::format("Failed to initialize audio context: {}", ma_result_description(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        if (captureCount == 0)
        {
            close();
            return makeError(ErrorCode::NotFoundError, "No audio input device found");
        }

        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, pCaptureDevices[i].name);

        auto const& deviceName = _impl->config.deviceName;
        if (!deviceName.empty())
        {
            auto const target = lowercase(deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (lowercase(pCaptureDevices[i].name).find(target) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", pCaptureDevices[i].name, deviceName);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }

            if (!matchedDeviceId)
                log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        // Monitor sources are loopbacks of the output, which would feed our own voice back in.
        if (!matchedDeviceId)
        {
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!lowercase(pCaptureDevices[i].name).starts_with("monitor"))
                {
                    log::debug("Auto-selected capture device '{}'", pCaptureDevices[i].name);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }
        }
    }
    else
    {
        log::warning("Failed to enumerate capture devices ({}), using default", ma_result_description(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.capture.shareMode = ma_share_mode_shared;
    deviceConfig.sampleRate = _impl->config.sampleRate;
    deviceConfig.dataCallback = captureDataCallback;
    deviceConfig.notificationCallback = captureNotificationCallback;
    deviceConfig.pUserData = _impl.get();
    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const initResult = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (initResult != MA_SUCCESS)
    {
        close();
        return makeError(classifyDeviceResult(initResult),
                         std::format("Failed to open capture device: {}", ma_result_description(initResult)));
    }
    _impl->deviceInitialized = true;

    // Mark as capturing before starting so an immediate stop notification is reported.
    _impl->capturing = true;
    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
    {
        _impl->capturing = false;
        close();
        return makeError(classifyDeviceResult(startResult),
                         std::format("Failed to start audio capture: {}", ma_result_description(startResult)));
    }

    log::info("Audio capture started on '{}' ({} Hz, mono, {} ms frames)",
              _impl->device.capture.name,
              _impl->config.sampleRate,
              _impl->config.frameMs);
    return {};
}

void MiniaudioCapture::close()
{
    auto const wasCapturing = _impl->capturing.exchange(false);

    if (_impl->deviceInitialized)
    {
        // ma_device_uninit stops the device and waits for the callback to return.
        ma_device_uninit(&_impl->device);
        _impl->deviceInitialized = false;
    }
    if (_impl->contextInitialized)
    {
        ma_context_uninit(&_impl->context);
        _impl->contextInitialized = false;
    }

    if (wasCapturing)
        log::info("Audio capture stopped");
}

auto MiniaudioCapture::isOpen() const -> bool
{
    return _impl->capturing;
}

auto MiniaudioCapture::capabilities() const -> CaptureCapabilities
{
    return CaptureCapabilities {
        .nativeStreamingAsr = true,
        .scriptLevelPcmAccess = true,
        .mediaRecorderChunking = false,
    };
}

auto MiniaudioCapture::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

} // namespace voicetutor
