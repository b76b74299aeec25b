// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Executor.hpp>
#include <core/GenerationToken.hpp>
#include <speech/Recognizer.hpp>
#include <speech/TranscriptDeduplicator.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace voicetutor
{

/// @brief Tunables of the transcription stage.
struct TranscriptionConfig
{
    bool preferNative = true;

    /// @brief Failed final decodes of one span before switching to the other strategy.
    int retryCeiling = 3;

    /// @brief New span audio between two interim decodes (streaming strategy only).
    Millis interimInterval { 1000 };

    /// @brief How long a final may lag behind the span end before the last interim
    ///        is promoted in its place. Zero disables promotion.
    Millis interimPromotion { 1500 };

    DedupConfig dedup;
};

/// @brief Result of a background recognizer call, delivered back on the conversation thread.
struct RecognitionOutcome
{
    std::uint64_t requestId = 0;
    GenerationToken token = 0;
    bool isFinal = false;
    Result<TranscriptionResult> result;
};

/// @brief Hands a finished recognizer call back to the conversation thread.
using RecognitionPoster = std::function<void(RecognitionOutcome)>;

/// @brief A final transcript accepted for the turn controller.
struct FinalTranscript
{
    TranscriptionResult result;
    std::uint64_t spanId = 0;

    /// @brief The span was an interruption candidate.
    bool guarded = false;
    TimePoint spanStart {};
    TimePoint spanEnd {};

    /// @brief Loudness envelope of the span audio, for the acoustic echo check.
    LoudnessEnvelope envelope;
};

/// @brief What one step of the transcription stage produced.
struct TranscriptionUpdate
{
    /// @brief New advisory text of the span in flight.
    std::optional<std::string> interim;

    /// @brief A genuinely new utterance.
    std::optional<FinalTranscript> final;

    /// @brief A longer re-emission of the previous final; it replaces that text, it is not a new turn.
    std::optional<std::string> revision;

    /// @brief The span could not be transcribed by any strategy.
    std::optional<Error> failure;

    [[nodiscard]] auto empty() const -> bool { return !interim && !final && !revision && !failure; }
};

/// @brief Turns speech spans into deduplicated final transcripts.
///
/// Runs on the conversation thread; recognizer calls run on the executor and
/// come back through handleOutcome(). At most one span is in flight: a span
/// that starts while the previous one still awaits its final extends it, and
/// the earlier request is superseded.
///
/// The strategy is chosen once per session from the capture capabilities and
/// switches to the other recognizer when the active one keeps failing.
class TranscriptionService
{
  public:
    /// @param native Streaming on-device recognizer; may be null.
    /// @param cloud Batch cloud recognizer; may be null.
    TranscriptionService(TranscriptionConfig config,
                         Recognizer* native,
                         Recognizer* cloud,
                         Executor& executor,
                         const GenerationTokenManager& tokens,
                         const Clock& clock,
                         RecognitionPoster post);

    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    /// @brief Picks the strategy for this session.
    /// @return NotFoundError if neither recognizer can be used.
    [[nodiscard]] auto selectStrategy(const CaptureCapabilities& capabilities) -> VoidResult;

    [[nodiscard]] auto activeSource() const -> std::optional<TranscriptSource>;

    void onSpeechStarted(const SpeechStarted& started);
    void onFrame(const AudioFrame& frame);
    void onSpeechEnded(const SpeechSpan& span);

    /// @brief The open span was discarded or rejected before it ended.
    void onSpeechDropped(std::uint64_t spanId);

    /// @brief Consumes a recognizer result. Results of superseded requests or stale generations are ignored.
    [[nodiscard]] auto handleOutcome(RecognitionOutcome outcome) -> TranscriptionUpdate;

    /// @brief Promotes a lingering interim result when the final is overdue.
    [[nodiscard]] auto poll(TimePoint now) -> TranscriptionUpdate;

    /// @brief Drops the span in flight; pending results will be ignored.
    void cancel();

    /// @brief Forgets the previous final used for deduplication.
    void resetDeduplication();

    [[nodiscard]] auto hasSpanInFlight() const -> bool { return _inFlight.has_value(); }

    /// @brief Id of the span in flight, if any.
    [[nodiscard]] auto spanInFlight() const -> std::optional<std::uint64_t>;

  private:
    struct InFlight
    {
        std::uint64_t spanId = 0;
        bool guarded = false;
        bool ended = false;
        TimePoint startedAt {};
        TimePoint endedAt {};

        /// @brief Audio of earlier spans this one extends.
        std::vector<AudioFrame> carried;
        std::vector<AudioFrame> frames;

        std::uint64_t finalRequest = 0;
        std::uint64_t interimRequest = 0;
        Millis audioSinceInterim { 0 };

        std::string lastInterim;
        float lastInterimConfidence = 0.0f;
        TimePoint lastInterimChange {};

        int attempts = 0;
        bool fellBack = false;
    };

    [[nodiscard]] auto active() const -> Recognizer*;
    [[nodiscard]] auto alternate() const -> Recognizer*;
    void submit(bool isFinal);
    [[nodiscard]] auto handleFailure(const Error& error) -> TranscriptionUpdate;
    [[nodiscard]] auto commit(TranscriptionResult result) -> TranscriptionUpdate;

    TranscriptionConfig _config;
    Recognizer* _native;
    Recognizer* _cloud;
    Executor& _executor;
    const GenerationTokenManager& _tokens;
    const Clock& _clock;
    RecognitionPoster _post;

    std::optional<TranscriptSource> _active;
    std::optional<InFlight> _inFlight;
    std::uint64_t _nextRequestId = 0;
    TranscriptDeduplicator _dedup;
};

} // namespace voicetutor
