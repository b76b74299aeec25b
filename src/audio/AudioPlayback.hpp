// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>

#include <functional>
#include <memory>

namespace voicetutor
{

/// @brief Called once from the device thread when a clip has been fully played.
using DrainedCallback = std::function<void()>;

/// @brief The audio output device as seen by the playback queue.
///
/// One clip plays at a time. play() returns as soon as output has started;
/// stop() returns only once the device has stopped producing the clip's samples.
class AudioSink
{
  public:
    virtual ~AudioSink() = default;

    /// @brief Starts playing @p clip, replacing anything that is still playing.
    /// @param onDrained Invoked after the last sample has been handed to the device.
    [[nodiscard]] virtual auto play(const AudioClip& clip, DrainedCallback onDrained) -> VoidResult = 0;

    /// @brief Silences output synchronously. A no-op when nothing plays.
    virtual void stop() = 0;

    /// @brief Releases the output device.
    virtual void release() = 0;
};

/// @brief Plays float32 PCM through the default playback device using miniaudio.
///
/// The device is (re)initialized whenever a clip with a different format arrives,
/// and is held until release().
class MiniaudioPlayback final: public AudioSink
{
  public:
    MiniaudioPlayback();
    ~MiniaudioPlayback() override;

    MiniaudioPlayback(const MiniaudioPlayback&) = delete;
    MiniaudioPlayback& operator=(const MiniaudioPlayback&) = delete;

    [[nodiscard]] auto play(const AudioClip& clip, DrainedCallback onDrained) -> VoidResult override;
    void stop() override;
    void release() override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
