// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <variant>
#include <vector>

namespace voicetutor
{

/// @brief Tunables of the loudness-based voice activity detector.
///
/// Loudness is the RMS of a frame in percent of full scale, smoothed over the
/// last @c smoothingWindow frames.
struct VadConfig
{
    float speechThreshold = 1.5f;
    float interruptionThreshold = 3.0f;
    int interruptionConfirmFrames = 3;
    int smoothingWindow = 10;
    Millis silenceDuration { 1500 };
    Millis minSpeechDuration { 500 };
    std::size_t minAudioSize = 5000;
    int preRollFrames = 3;
    Millis maxSpanDuration { 30000 };
};

/// @brief A span opened. Guarded spans are interruption candidates raised while assistant audio plays.
struct SpeechStarted
{
    std::uint64_t spanId = 0;
    TimePoint at {};
    bool guarded = false;

    /// @brief Pre-roll, confirmation and trigger frames the span opened with.
    std::vector<AudioFrame> initialFrames;
};

/// @brief A span closed with enough speech to be worth transcribing.
struct SpeechEnded
{
    SpeechSpan span;
};

enum class DiscardReason : std::uint8_t
{
    TooShort,
    TooSmall,
};

/// @brief A span closed but was dropped as breath noise or a click.
struct SpeechDiscarded
{
    std::uint64_t spanId = 0;
    Millis speechDuration { 0 };
    std::size_t byteSize = 0;
    DiscardReason reason = DiscardReason::TooShort;
};

using VadEvent = std::variant<SpeechStarted, SpeechEnded, SpeechDiscarded>;

/// @brief Energy-based voice activity detection with hysteresis.
///
/// Every SpeechStarted is followed by exactly one SpeechEnded or SpeechDiscarded
/// for the same span before the next SpeechStarted, unless the open span is
/// dropped through rejectCandidate() or reset().
///
/// In guarded mode (assistant audio playing) a span opens only after
/// @c interruptionConfirmFrames consecutive frames above the higher
/// @c interruptionThreshold, and is flagged as guarded.
class VoiceActivityDetector
{
  public:
    explicit VoiceActivityDetector(VadConfig config = {});

    /// @brief Consumes one captured frame.
    /// @return A span boundary event, if this frame produced one.
    [[nodiscard]] auto process(const AudioFrame& frame) -> std::optional<VadEvent>;

    /// @brief Switches between normal and guarded (barge-in) detection.
    void setGuarded(bool guarded);

    [[nodiscard]] auto isGuarded() const noexcept -> bool { return _guarded; }

    /// @brief Drops the open guarded span without emitting an end event.
    void rejectCandidate();

    /// @brief Turns the open guarded span into an ordinary span.
    void promoteCandidate();

    /// @brief Drops any open span, the pre-roll and the smoothing history.
    void reset();

    [[nodiscard]] auto inSpeech() const noexcept -> bool { return _span.has_value(); }

    /// @brief Id of the open span, if any.
    [[nodiscard]] auto openSpanId() const -> std::optional<std::uint64_t>;

    /// @brief The current smoothed loudness in percent.
    [[nodiscard]] auto smoothedLoudness() const -> float;

    [[nodiscard]] auto config() const noexcept -> const VadConfig& { return _config; }

  private:
    struct OpenSpan
    {
        SpeechSpan span;
        TimePoint firstVoiced {};
        TimePoint lastVoicedEnd {};
        std::optional<TimePoint> silentSince;
        double loudnessSum = 0.0;
    };

    [[nodiscard]] auto openSpan(const AudioFrame& frame) -> SpeechStarted;
    [[nodiscard]] auto closeSpan(TimePoint endedAt) -> VadEvent;
    static void account(OpenSpan& open, float level);

    VadConfig _config;
    bool _guarded = false;
    int _confirmFrames = 0;
    bool _awaitingQuiet = false;
    std::uint64_t _nextSpanId = 0;
    std::deque<float> _history;
    std::deque<AudioFrame> _preRoll;
    std::optional<OpenSpan> _span;
};

} // namespace voicetutor
