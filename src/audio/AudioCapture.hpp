// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <string>

namespace voicetutor
{

/// @brief What a capture binding and its platform offer to the transcription layer.
struct CaptureCapabilities
{
    /// @brief A low-latency streaming recognizer can run next to this source.
    bool nativeStreamingAsr = false;

    /// @brief Raw PCM frames are delivered to the engine.
    bool scriptLevelPcmAccess = false;

    /// @brief The source can hand out encoded chunks for batch upload.
    bool mediaRecorderChunking = false;
};

/// @brief Called from the capture thread with each complete frame.
using FrameCallback = std::function<void(AudioFrame frame)>;

/// @brief Called from the capture thread when the stream fails after open().
using CaptureErrorCallback = std::function<void(Error error)>;

/// @brief A continuous microphone stream, delivered as timestamped frames.
///
/// open() fails with DeviceError on permission denial, NotFoundError when no
/// input device exists and ConcurrencyError when the device is held elsewhere.
/// The stream keeps delivering frames until close(); close() is idempotent.
class AudioCaptureSource
{
  public:
    virtual ~AudioCaptureSource() = default;

    [[nodiscard]] virtual auto open(FrameCallback onFrame, CaptureErrorCallback onError) -> VoidResult = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;
    [[nodiscard]] virtual auto capabilities() const -> CaptureCapabilities = 0;
};

/// @brief Capture device settings.
struct CaptureConfig
{
    /// @brief Case-insensitive substring of the device name; empty selects automatically.
    std::string deviceName;
    unsigned sampleRate = 16000;
    int frameMs = 100;
};

/// @brief Captures float32 mono PCM from a microphone using miniaudio.
///
/// Device callbacks of arbitrary size are regrouped into frames of exactly
/// @c frameMs milliseconds before they are handed on.
class MiniaudioCapture final: public AudioCaptureSource
{
  public:
    explicit MiniaudioCapture(CaptureConfig config);
    ~MiniaudioCapture() override;

    MiniaudioCapture(const MiniaudioCapture&) = delete;
    MiniaudioCapture& operator=(const MiniaudioCapture&) = delete;

    [[nodiscard]] auto open(FrameCallback onFrame, CaptureErrorCallback onError) -> VoidResult override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;
    [[nodiscard]] auto capabilities() const -> CaptureCapabilities override;

    /// @brief Returns the current peak level (0.0 to 1.0). Safe to call from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
