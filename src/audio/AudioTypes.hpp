// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voicetutor
{

/// @brief A timestamped block of float32 PCM samples in [-1, 1].
struct AudioFrame
{
    TimePoint timestamp {};
    std::vector<float> samples;
    unsigned sampleRate = 16000;
    unsigned channels = 1;

    /// @brief Playback duration of the frame.
    [[nodiscard]] auto duration() const -> Millis
    {
        if (sampleRate == 0 || channels == 0)
            return Millis { 0 };
        return Millis { static_cast<Millis::rep>(samples.size() * 1000 / (sampleRate * channels)) };
    }

    /// @brief Size of the frame when encoded as 16-bit PCM.
    [[nodiscard]] auto byteSize() const -> std::size_t { return samples.size() * sizeof(std::int16_t); }

    [[nodiscard]] auto endTime() const -> TimePoint { return timestamp + duration(); }
};

/// @brief Loudness of a sequence of frames, one RMS value (in percent) per frame.
struct LoudnessEnvelope
{
    TimePoint start {};
    Millis frameDuration { 100 };
    std::vector<float> values;
};

/// @brief The frames between one speech start and the matching speech end.
///
/// Owned by the voice activity detector while open; immutable once handed on.
struct SpeechSpan
{
    std::uint64_t id = 0;
    std::vector<AudioFrame> frames;
    TimePoint startedAt {};
    TimePoint endedAt {};

    /// @brief Time from the first to the end of the last voiced frame.
    Millis speechDuration { 0 };
    float peakLoudness = 0.0f;
    float averageLoudness = 0.0f;

    /// @brief Opened while assistant audio was playing (an interruption candidate).
    bool guarded = false;

    [[nodiscard]] auto sampleRate() const -> unsigned { return frames.empty() ? 16000 : frames.front().sampleRate; }

    [[nodiscard]] auto byteSize() const -> std::size_t
    {
        auto total = std::size_t { 0 };
        for (auto const& frame: frames)
            total += frame.byteSize();
        return total;
    }

    /// @brief Concatenates the samples of all frames.
    [[nodiscard]] auto samples() const -> std::vector<float>
    {
        auto result = std::vector<float> {};
        auto total = std::size_t { 0 };
        for (auto const& frame: frames)
            total += frame.samples.size();
        result.reserve(total);
        for (auto const& frame: frames)
            result.insert(result.end(), frame.samples.begin(), frame.samples.end());
        return result;
    }
};

/// @brief Decoded audio ready for playback.
struct AudioClip
{
    std::vector<float> samples;
    unsigned sampleRate = 22050;
    unsigned channels = 1;

    [[nodiscard]] auto duration() const -> Millis
    {
        if (sampleRate == 0 || channels == 0)
            return Millis { 0 };
        return Millis { static_cast<Millis::rep>(samples.size() * 1000 / (sampleRate * channels)) };
    }

    [[nodiscard]] auto empty() const -> bool { return samples.empty(); }
};

} // namespace voicetutor
