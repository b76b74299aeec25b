// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioPlayback.hpp>
#include <audio/AudioTypes.hpp>
#include <core/GenerationToken.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace voicetutor
{

enum class SegmentState : std::uint8_t
{
    Queued,
    Playing,
    Finished,
    Aborted,
};

[[nodiscard]] constexpr auto segmentStateName(SegmentState state) -> std::string_view
{
    switch (state)
    {
        case SegmentState::Queued: return "queued";
        case SegmentState::Playing: return "playing";
        case SegmentState::Finished: return "finished";
        case SegmentState::Aborted: return "aborted";
    }
    return "unknown";
}

/// @brief Synthesized audio for one piece of assistant text.
struct TtsSegment
{
    std::uint64_t id = 0;
    GenerationToken token = 0;

    /// @brief The text the audio was synthesized from, for echo comparison.
    std::string sourceText;

    /// @brief The reply text the segment voices, when it differs from sourceText (formulas spelled out).
    std::string writtenText;
    AudioClip clip;
    SegmentState state = SegmentState::Queued;
};

/// @brief Observers of segment lifecycle changes, all invoked on the conversation thread.
struct PlaybackCallbacks
{
    std::function<void(const TtsSegment&)> onStarted;

    /// @brief A segment reached Finished or Aborted.
    std::function<void(const TtsSegment&)> onEnded;

    /// @brief The last queued segment finished and nothing else is queued.
    std::function<void()> onIdle;
};

/// @brief Hands a drained-notification from the device thread back to the conversation thread.
using DrainPoster = std::function<void(std::uint64_t segmentId)>;

/// @brief Plays synthesized segments back to back through one audio sink.
///
/// Lives on the conversation thread and is the only owner of the output
/// device. Segments play strictly in enqueue order. flush() silences output
/// before it returns and aborts everything pending.
class PlaybackQueue
{
  public:
    PlaybackQueue(AudioSink& sink, DrainPoster postDrained, PlaybackCallbacks callbacks = {});

    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    /// @brief Appends a segment; starts playback right away when idle.
    /// @return The id assigned to the segment.
    auto enqueue(std::string sourceText, AudioClip clip, GenerationToken token, std::string writtenText = {})
        -> std::uint64_t;

    /// @brief Stops the playing segment and drops the queue, firing onEnded(Aborted) for each.
    /// @return The number of segments aborted. Zero (and no side effect) when idle.
    auto flush() -> std::size_t;

    /// @brief The sink finished playing @p segmentId. Notifications for aborted segments are ignored.
    void onSinkDrained(std::uint64_t segmentId);

    /// @brief Flushes and releases the output device.
    void release();

    [[nodiscard]] auto isPlaying() const -> bool { return _current.has_value(); }
    [[nodiscard]] auto queuedCount() const -> std::size_t { return _queue.size(); }
    [[nodiscard]] auto current() const -> const TtsSegment* { return _current ? &*_current : nullptr; }

    void setCallbacks(PlaybackCallbacks callbacks) { _callbacks = std::move(callbacks); }

  private:
    void startNext();
    void end(TtsSegment segment, SegmentState state);

    AudioSink& _sink;
    DrainPoster _postDrained;
    PlaybackCallbacks _callbacks;

    std::optional<TtsSegment> _current;
    std::deque<TtsSegment> _queue;
    std::uint64_t _nextSegmentId = 0;
};

} // namespace voicetutor
