// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>
#include <audio/AudioPlayback.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Executor.hpp>
#include <core/GenerationToken.hpp>
#include <engine/ConversationLog.hpp>
#include <engine/EchoGuard.hpp>
#include <engine/Events.hpp>
#include <engine/PlaybackQueue.hpp>
#include <engine/SentenceSplitter.hpp>
#include <engine/SessionState.hpp>
#include <llm/ResponseProvider.hpp>
#include <llm/ResponseRequester.hpp>
#include <speech/Recognizer.hpp>
#include <speech/Synthesizer.hpp>
#include <speech/TranscriptionService.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace voicetutor
{

/// @brief Session-level behaviour of the turn controller.
struct SessionConfig
{
    /// @brief Spoken right after the session starts; empty disables the greeting.
    std::string greeting = "Привет! Я твой репетитор. О чём поговорим сегодня?";

    /// @brief Barge-ins closer together than this collapse into one.
    Millis interruptionDebounce { 1000 };

    /// @brief Barge in on the loudness check alone, without waiting for the candidate's text.
    bool acousticBargeIn = false;

    /// @brief Additional synthesis attempts per sentence.
    int synthesisRetries = 2;

    /// @brief Rewrite formulas and numbers as Russian words before synthesis.
    bool convertMath = true;

    /// @brief Request sent when the user cuts in; {previous} and {current} are substituted.
    std::string bridgingTemplate = "Предыдущий контекст: \"{previous}\". Новый вопрос: \"{current}\"";
};

/// @brief All tunables of one conversation.
struct TurnControllerConfig
{
    VadConfig vad;
    TranscriptionConfig transcription;
    EchoConfig echo;
    ResponsePolicy response;
    SessionConfig session;
};

/// @brief The external pieces a turn controller drives. All must outlive it.
struct TurnCollaborators
{
    AudioCaptureSource& capture;
    AudioSink& sink;
    ResponseProvider& responder;
    Executor& executor;
    const Clock& clock;

    /// @brief Streaming on-device recognizer; may be null.
    Recognizer* nativeRecognizer = nullptr;

    /// @brief Batch cloud recognizer; may be null.
    Recognizer* cloudRecognizer = nullptr;

    /// @brief May be null, in which case every assistant turn is text-only.
    Synthesizer* synthesizer = nullptr;

    /// @brief Pause between model retries; empty sleeps for real.
    Sleeper sleep;
};

/// @brief Observers of the session, all invoked on the conversation thread.
struct SessionCallbacks
{
    std::function<void(const PhaseTransition&)> onPhaseChanged;

    /// @brief Advisory text of the utterance being spoken.
    std::function<void(std::string_view)> onInterim;

    std::function<void(const ConversationTurn&)> onTurnCommitted;

    /// @brief A failure the user should hear about; raised at most once per category and turn.
    std::function<void(const Error&)> onNotification;
};

/// @brief The conversation state machine.
///
/// Owns the session state and is its only writer. Every input (captured
/// frames, recognizer results, model replies, synthesized audio, playback
/// progress and host commands) arrives as a VoiceEvent through handle(), on
/// one conversation thread. Work that blocks is posted to the executor tagged
/// with the current generation token, and its result comes back as an event
/// that is dropped if the token has moved on in between.
///
/// The cycle is Idle, Listening, Transcribing, AwaitingResponse, Speaking and
/// back to Listening. Speech detected while the assistant speaks is checked
/// against the played audio and text; genuine speech is a barge-in, which
/// advances the token, silences playback and hands the new utterance on
/// together with the interrupted turn.
class TurnController
{
  public:
    /// @param post Delivers events back to the conversation thread (device callbacks and background results).
    TurnController(TurnControllerConfig config,
                   TurnCollaborators collaborators,
                   EventPoster post,
                   SessionCallbacks callbacks = {});
    ~TurnController();

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    /// @brief Processes one event. Must only be called from the conversation thread.
    void handle(VoiceEvent event);

    /// @brief Time-driven work: promotes overdue interim transcripts.
    void tick(TimePoint now);

    /// @brief Acquires the microphone and starts listening (Idle to Listening), then greets.
    void startSession();

    /// @brief Stops capture, aborts pending work, flushes playback and returns to Idle.
    void endSession();

    /// @brief Returns to Idle from any phase, including Error.
    void reset();

    /// @brief Mutes or unmutes the microphone without leaving the current phase.
    void setMicEnabled(bool enabled);

    /// @brief With sound disabled, assistant turns are text-only.
    void setSoundEnabled(bool enabled);

    [[nodiscard]] auto state() const -> const VoiceSessionState& { return _state; }
    [[nodiscard]] auto phase() const -> Phase { return _state.phase; }
    [[nodiscard]] auto history() const -> const std::vector<PhaseTransition>& { return _history; }
    [[nodiscard]] auto conversation() const -> const ConversationLog& { return _conversation; }
    [[nodiscard]] auto tokens() const -> const GenerationTokenManager& { return _tokens; }
    [[nodiscard]] auto playback() const -> const PlaybackQueue& { return _playback; }
    [[nodiscard]] auto echoGuard() const -> const EchoGuard& { return _echo; }

  private:
    /// @brief The assistant turn being produced and spoken.
    struct AssistantTurn
    {
        GenerationToken token = 0;
        TimePoint startedAt {};

        /// @brief Everything the assistant said so far (streamed or complete).
        std::string text;

        /// @brief Text of the segments that have started playing.
        std::string spokenText;

        /// @brief Spoken form of the sentences that math conversion rewrote.
        std::string convertedSpeech;

        bool receivedDeltas = false;
        bool responseComplete = false;

        std::uint64_t nextSentence = 0;
        std::uint64_t nextToEnqueue = 0;
        int pendingSyntheses = 0;

        /// @brief Finished syntheses waiting for their predecessors; nullopt marks a skipped sentence.
        std::map<std::uint64_t, std::optional<SynthesisCompleted>> ready;
    };

    void onFrame(const AudioFrame& frame);
    void onSpeechStarted(SpeechStarted started);
    void applyTranscription(TranscriptionUpdate update);
    void onFinalTranscript(const FinalTranscript& transcript);
    void acceptUtterance(const FinalTranscript& transcript);
    void bargeIn(std::string_view reason);
    [[nodiscard]] auto bridge(std::string_view previous, std::string_view current) const -> std::string;

    void requestResponse(ResponseRequest request);
    void onResponseDelta(const ResponseDelta& delta);
    void onResponseCompleted(ResponseCompleted completed);

    void beginAssistantTurn();
    void feedAssistantText(std::string_view text);
    void completeAssistantText();
    void speakSentence(std::string sentence);
    void onSynthesisCompleted(SynthesisCompleted completed);
    void enqueueReadySegments();
    void commitAssistantTurn(bool interrupted);
    void maybeFinishTurn();

    void onSegmentStarted(const TtsSegment& segment);
    void onSegmentEnded(const TtsSegment& segment);

    [[nodiscard]] auto speaksAloud() const -> bool;
    auto transition(Phase to, std::string_view reason) -> bool;
    void advanceToken(std::string_view reason);
    void notify(const Error& error);
    void fail(const Error& error);
    void teardown(std::string_view reason);

    TurnControllerConfig _config;
    AudioCaptureSource& _capture;
    ResponseProvider& _responder;
    Executor& _executor;
    const Clock& _clock;
    Synthesizer* _synthesizer;
    EventPoster _post;
    SessionCallbacks _callbacks;

    GenerationTokenManager _tokens;
    VoiceActivityDetector _vad;
    TranscriptionService _transcription;
    EchoGuard _echo;
    PlaybackQueue _playback;
    ResponseRequester _requester;
    SentenceSplitter _splitter;
    ConversationLog _conversation;

    VoiceSessionState _state;
    std::vector<PhaseTransition> _history;
    std::optional<AssistantTurn> _assistant;

    /// @brief The user text of the request in flight, for bridging when it is superseded.
    std::optional<std::string> _pendingUtterance;

    /// @brief What the assistant had said when it was cut off, bridged into the next request.
    std::optional<std::string> _interruptedTurn;

    std::optional<TimePoint> _lastBargeIn;
    std::set<ErrorCode> _notified;
};

} // namespace voicetutor
