// SPDX-License-Identifier: Apache-2.0
#include "TurnController.hpp"

#include <audio/Loudness.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <speech/SpeechText.hpp>

#include <format>
#include <utility>
#include <variant>

namespace voicetutor
{

namespace
{

    /// @brief Resolution of the loudness envelopes recorded for played segments.
    constexpr auto PlaybackEnvelopeResolution = Millis { 100 };

    /// @brief What the echo guard matches short repeats against: the reply as written and as spoken.
    auto echoReference(std::string_view written, std::string_view converted) -> std::string
    {
        if (converted.empty())
            return std::string(written);
        return std::format("{} {}", written, converted);
    }

} // namespace

TurnController::TurnController(TurnControllerConfig config,
                               TurnCollaborators collaborators,
                               EventPoster post,
                               SessionCallbacks callbacks):
    _config(std::move(config)),
    _capture(collaborators.capture),
    _responder(collaborators.responder),
    _executor(collaborators.executor),
    _clock(collaborators.clock),
    _synthesizer(collaborators.synthesizer),
    _post(std::move(post)),
    _callbacks(std::move(callbacks)),
    _vad(_config.vad),
    _transcription(_config.transcription,
                   collaborators.nativeRecognizer,
                   collaborators.cloudRecognizer,
                   collaborators.executor,
                   _tokens,
                   collaborators.clock,
                   [post = _post](RecognitionOutcome outcome) {
                       post(RecognitionCompleted { .outcome = std::move(outcome) });
                   }),
    _echo(_config.echo, collaborators.clock),
    _playback(collaborators.sink,
              [post = _post](std::uint64_t segmentId) { post(SegmentDrained { .segmentId = segmentId }); }),
    _requester(_config.response, collaborators.responder, std::move(collaborators.sleep))
{
    _playback.setCallbacks(PlaybackCallbacks {
        .onStarted = [this](const TtsSegment& segment) { onSegmentStarted(segment); },
        .onEnded = [this](const TtsSegment& segment) { onSegmentEnded(segment); },
        .onIdle = [this] { maybeFinishTurn(); },
    });
}

TurnController::~TurnController()
{
    if (_state.phase != Phase::Idle)
    {
        _capture.close();
        _playback.release();
    }
}

void TurnController::handle(VoiceEvent event)
{
    if (auto const* captured = std::get_if<FrameCaptured>(&event))
        onFrame(captured->frame);
    else if (auto const* drained = std::get_if<SegmentDrained>(&event))
        _playback.onSinkDrained(drained->segmentId);
    else if (auto* recognition = std::get_if<RecognitionCompleted>(&event))
        applyTranscription(_transcription.handleOutcome(std::move(recognition->outcome)));
    else if (auto const* delta = std::get_if<ResponseDelta>(&event))
        onResponseDelta(*delta);
    else if (auto* response = std::get_if<ResponseCompleted>(&event))
        onResponseCompleted(std::move(*response));
    else if (auto* synthesized = std::get_if<SynthesisCompleted>(&event))
        onSynthesisCompleted(std::move(*synthesized));
    else if (auto const* failed = std::get_if<CaptureFailed>(&event))
    {
        if (_state.phase != Phase::Idle && _state.phase != Phase::Error)
            fail(failed->error);
    }
    else if (std::holds_alternative<StartSession>(event))
        startSession();
    else if (std::holds_alternative<EndSession>(event))
        endSession();
    else if (std::holds_alternative<ResetSession>(event))
        reset();
    else if (auto const* mic = std::get_if<SetMicEnabled>(&event))
        setMicEnabled(mic->enabled);
    else if (auto const* sound = std::get_if<SetSoundEnabled>(&event))
        setSoundEnabled(sound->enabled);
}

void TurnController::tick(TimePoint now)
{
    if (_state.phase == Phase::Idle || _state.phase == Phase::Error)
        return;
    applyTranscription(_transcription.poll(now));
}

void TurnController::startSession()
{
    if (_state.phase != Phase::Idle)
    {
        log::warning("Cannot start a session in phase {}", phaseName(_state.phase));
        return;
    }

    advanceToken("session start");
    _notified.clear();
    _lastBargeIn.reset();
    _transcription.resetDeduplication();

    if (auto selected = _transcription.selectStrategy(_capture.capabilities()); !selected)
    {
        fail(selected.error());
        return;
    }

    auto opened = _capture.open([post = _post](AudioFrame frame) { post(FrameCaptured { .frame = std::move(frame) }); },
                                [post = _post](Error error) { post(CaptureFailed { .error = std::move(error) }); });
    if (!opened)
    {
        fail(opened.error());
        return;
    }

    _vad.reset();
    transition(Phase::Listening, "session started");

    if (!_config.session.greeting.empty())
    {
        beginAssistantTurn();
        transition(Phase::AwaitingResponse, "greeting");
        feedAssistantText(_config.session.greeting);
        completeAssistantText();
    }
}

void TurnController::endSession()
{
    if (_state.phase == Phase::Idle)
        return;

    log::info("Ending voice session");
    teardown("session ended");
    transition(Phase::Idle, "session ended");
}

void TurnController::reset()
{
    if (_state.phase != Phase::Idle)
    {
        teardown("reset");
        transition(Phase::Idle, "reset");
    }
    _notified.clear();
    _lastBargeIn.reset();
    _transcription.resetDeduplication();
}

void TurnController::setMicEnabled(bool enabled)
{
    if (_state.micEnabled == enabled)
        return;

    _state.micEnabled = enabled;
    log::info("Microphone {}", enabled ? "enabled" : "muted");

    if (!enabled)
    {
        if (auto const span = _vad.openSpanId())
            _transcription.onSpeechDropped(*span);
        _vad.reset();
        _vad.setGuarded(_state.phase == Phase::Speaking);
        _state.pendingInterimText.clear();
    }
}

void TurnController::setSoundEnabled(bool enabled)
{
    if (_state.soundEnabled == enabled)
        return;

    _state.soundEnabled = enabled;
    log::info("Sound {}", enabled ? "enabled" : "disabled");

    if (!enabled)
    {
        (void) _playback.flush();
        if (_assistant)
            _assistant->ready.clear();
        maybeFinishTurn();
    }
}

void TurnController::teardown(std::string_view reason)
{
    advanceToken(reason);
    _transcription.cancel();
    _responder.abort();
    _playback.release();
    if (_assistant)
        commitAssistantTurn(true);
    _capture.close();
    _vad.reset();
    _vad.setGuarded(false);
    _splitter.reset();
    _echo.clear();
    _pendingUtterance.reset();
    _interruptedTurn.reset();
    _state.pendingInterimText.clear();
}

void TurnController::fail(const Error& error)
{
    log::error("Voice session failed: {}", error);
    notify(error);
    teardown("session failed");
    transition(Phase::Error, error.message);
}

void TurnController::onFrame(const AudioFrame& frame)
{
    if (_state.phase == Phase::Idle || _state.phase == Phase::Error || !_state.micEnabled)
        return;

    auto event = _vad.process(frame);
    if (!event)
    {
        if (_vad.inSpeech())
            _transcription.onFrame(frame);
        return;
    }

    if (auto* started = std::get_if<SpeechStarted>(&*event))
        onSpeechStarted(std::move(*started));
    else if (auto const* ended = std::get_if<SpeechEnded>(&*event))
        _transcription.onSpeechEnded(ended->span);
    else if (auto const* discarded = std::get_if<SpeechDiscarded>(&*event))
        _transcription.onSpeechDropped(discarded->spanId);
}

void TurnController::onSpeechStarted(SpeechStarted started)
{
    if (started.guarded)
    {
        auto const verdict = _echo.classifyAudio(envelopeOf(started.initialFrames));
        if (verdict.isEcho)
        {
            log::debug("Interruption candidate {} follows the played audio ({:.2f}), ignoring",
                       started.spanId,
                       verdict.confidence);
            _vad.rejectCandidate();
            return;
        }

        if (_lastBargeIn && _clock.now() - *_lastBargeIn < _config.session.interruptionDebounce)
        {
            log::debug("Interruption candidate {} within {} ms of the last barge-in, ignoring",
                       started.spanId,
                       _config.session.interruptionDebounce.count());
            _vad.rejectCandidate();
            return;
        }

        if (_config.session.acousticBargeIn && _state.phase == Phase::Speaking)
        {
            bargeIn("loud speech over playback");
            _vad.promoteCandidate();
            started.guarded = false;
        }
    }

    _transcription.onSpeechStarted(started);
}

void TurnController::applyTranscription(TranscriptionUpdate update)
{
    if (update.interim)
    {
        _state.pendingInterimText = std::move(*update.interim);
        if (_callbacks.onInterim)
            _callbacks.onInterim(_state.pendingInterimText);
    }

    if (update.revision)
    {
        _state.pendingInterimText.clear();
        if (_conversation.reviseLastUserTurn(*update.revision))
            log::debug("User turn revised: \"{}\"", *update.revision);
        if (_pendingUtterance)
            _pendingUtterance = std::move(*update.revision);
    }

    if (update.failure)
    {
        _state.pendingInterimText.clear();
        if (isFatal(update.failure->code))
        {
            fail(*update.failure);
            return;
        }
        notify(*update.failure);
    }

    if (update.final)
        onFinalTranscript(*update.final);
}

void TurnController::onFinalTranscript(const FinalTranscript& transcript)
{
    _state.pendingInterimText.clear();
    if (_state.phase == Phase::Idle || _state.phase == Phase::Error)
        return;

    auto const& text = transcript.result.text;
    auto const spokenAt = transcript.spanEnd == TimePoint {} ? _clock.now() : transcript.spanEnd;
    if (transcript.guarded || _echo.inWindow(spokenAt))
    {
        auto const verdict = _echo.classify(text, &transcript.envelope, spokenAt);
        if (verdict.isEcho)
        {
            log::info("Ignoring echo of the assistant ({}, {:.2f}): \"{}\"",
                      echoReasonName(verdict.reason),
                      verdict.confidence,
                      text);
            return;
        }
    }

    acceptUtterance(transcript);
}

void TurnController::acceptUtterance(const FinalTranscript& transcript)
{
    auto const& text = transcript.result.text;
    auto request = ResponseRequest { .content = text };

    if (_state.phase == Phase::Speaking)
        bargeIn("user speech");

    if (_state.phase == Phase::Transcribing || _state.phase == Phase::AwaitingResponse)
    {
        // Only one request runs at a time; the new utterance replaces the one in flight.
        advanceToken("superseded by a new utterance");
        _responder.abort();
        _assistant.reset();
        _splitter.reset();
        if (_pendingUtterance)
        {
            log::info("New utterance supersedes \"{}\"", *_pendingUtterance);
            request.content = bridge(*_pendingUtterance, text);
            request.interrupted = true;
        }
    }
    else if (_interruptedTurn)
    {
        request.content = bridge(*_interruptedTurn, text);
        request.interrupted = true;
    }
    _interruptedTurn.reset();
    _notified.clear();

    auto turn = ConversationTurn {
        .role = Role::User,
        .text = text,
        .startedAt = transcript.spanStart,
        .endedAt = transcript.spanEnd,
    };
    _conversation.append(turn);
    if (_callbacks.onTurnCommitted)
        _callbacks.onTurnCommitted(turn);
    _pendingUtterance = text;

    if (_state.phase == Phase::Listening)
        transition(Phase::Transcribing, "final transcript accepted");
    else if (_state.phase == Phase::AwaitingResponse)
        transition(Phase::Transcribing, "superseding utterance");

    requestResponse(std::move(request));
}

void TurnController::bargeIn(std::string_view reason)
{
    advanceToken("barge-in");
    log::info("Barge-in ({}), generation {}", reason, _state.activeToken);

    (void) _playback.flush();
    _responder.abort();
    if (_assistant)
        commitAssistantTurn(true);
    _splitter.reset();
    _lastBargeIn = _clock.now();

    transition(Phase::Listening, "barge-in");
}

auto TurnController::bridge(std::string_view previous, std::string_view current) const -> std::string
{
    constexpr auto PreviousPlaceholder = std::string_view { "{previous}" };
    constexpr auto CurrentPlaceholder = std::string_view { "{current}" };

    // One pass over the template, so placeholder text inside the substituted values stays literal.
    auto const pattern = std::string_view { _config.session.bridgingTemplate };
    auto bridged = std::string {};
    auto pos = std::size_t { 0 };
    while (pos < pattern.size())
    {
        auto const rest = pattern.substr(pos);
        if (rest.starts_with(PreviousPlaceholder))
        {
            bridged += previous;
            pos += PreviousPlaceholder.size();
        }
        else if (rest.starts_with(CurrentPlaceholder))
        {
            bridged += current;
            pos += CurrentPlaceholder.size();
        }
        else
            bridged += pattern[pos++];
    }
    return bridged;
}

void TurnController::requestResponse(ResponseRequest request)
{
    beginAssistantTurn();

    auto const token = _state.activeToken;
    auto const streaming = _responder.isStreaming();
    log::debug("Requesting a reply (generation {}{}): \"{}\"",
               token,
               request.interrupted ? ", interrupted" : "",
               request.content);

    _executor.post([requester = &_requester, tokens = &_tokens, post = _post, token, streaming, request] {
        auto const isCancelled = [tokens, token] { return !tokens->isCurrent(token); };

        auto onDelta = ResponseDeltaCallback {};
        if (streaming)
        {
            onDelta = [&post, token](std::string_view delta) {
                post(ResponseDelta { .token = token, .text = std::string(delta) });
                return true;
            };
        }

        auto outcome = requester->request(request, isCancelled, onDelta);
        post(ResponseCompleted { .token = token, .outcome = std::move(outcome) });
    });
}

void TurnController::onResponseDelta(const ResponseDelta& delta)
{
    if (!_tokens.isCurrent(delta.token) || !_assistant || _assistant->token != delta.token)
    {
        log::trace("Dropping reply increment of generation {}", delta.token);
        return;
    }

    _assistant->receivedDeltas = true;
    if (_state.phase == Phase::Transcribing)
        transition(Phase::AwaitingResponse, "reply streaming");
    feedAssistantText(delta.text);
}

void TurnController::onResponseCompleted(ResponseCompleted completed)
{
    if (!_tokens.isCurrent(completed.token) || !_assistant || _assistant->token != completed.token)
    {
        log::trace("Dropping reply of generation {}", completed.token);
        return;
    }

    if (!completed.outcome)
    {
        auto const& error = completed.outcome.error();
        if (error.code == ErrorCode::Cancelled)
        {
            log::trace("Reply of generation {} was cancelled", completed.token);
            return;
        }
        if (isFatal(error.code))
        {
            fail(error);
            return;
        }

        log::warning("No reply: {}", error);
        notify(error);
        _assistant.reset();
        _pendingUtterance.reset();
        transition(Phase::Listening, "no reply");
        return;
    }

    auto& outcome = *completed.outcome;
    if (outcome.error)
        notify(*outcome.error);
    _pendingUtterance.reset();

    if (_state.phase == Phase::Transcribing)
        transition(Phase::AwaitingResponse, outcome.fallback ? "fallback reply" : "reply received");

    if (!_assistant->receivedDeltas || outcome.fallback)
        feedAssistantText(outcome.text);
    completeAssistantText();
}

void TurnController::beginAssistantTurn()
{
    _assistant = AssistantTurn {
        .token = _state.activeToken,
        .startedAt = _clock.now(),
    };
    _splitter.reset();
}

void TurnController::feedAssistantText(std::string_view text)
{
    _assistant->text += text;
    for (auto& sentence: _splitter.feed(text))
        speakSentence(std::move(sentence));
}

void TurnController::completeAssistantText()
{
    _assistant->responseComplete = true;
    for (auto& sentence: _splitter.finish())
        speakSentence(std::move(sentence));

    _echo.setLastAssistantTurn(echoReference(_assistant->text, _assistant->convertedSpeech));
    maybeFinishTurn();
}

void TurnController::speakSentence(std::string sentence)
{
    if (!speaksAloud())
        return;

    auto speech = _config.session.convertMath ? prepareForSpeech(sentence) : sentence;
    if (text::trim(speech).empty())
        return;

    if (speech != sentence)
    {
        if (!_assistant->convertedSpeech.empty())
            _assistant->convertedSpeech += ' ';
        _assistant->convertedSpeech += speech;
    }

    auto const index = _assistant->nextSentence++;
    ++_assistant->pendingSyntheses;

    _executor.post([synthesizer = _synthesizer,
                    tokens = &_tokens,
                    post = _post,
                    token = _assistant->token,
                    retries = _config.session.synthesisRetries,
                    index,
                    sentence = std::move(sentence),
                    speech = std::move(speech)] {
        auto clip = synthesizeWithRetries(*synthesizer, speech, retries, [tokens, token] {
            return !tokens->isCurrent(token);
        });
        post(SynthesisCompleted {
            .token = token,
            .index = index,
            .text = sentence,
            .speech = speech,
            .clip = std::move(clip),
        });
    });
}

void TurnController::onSynthesisCompleted(SynthesisCompleted completed)
{
    if (!_tokens.isCurrent(completed.token) || !_assistant || _assistant->token != completed.token)
    {
        log::trace("Dropping synthesized sentence {} of generation {}", completed.index, completed.token);
        return;
    }

    --_assistant->pendingSyntheses;
    if (!completed.clip)
    {
        if (completed.clip.error().code != ErrorCode::Cancelled)
        {
            log::warning("Sentence {} stays text-only: {}", completed.index, completed.clip.error());
            notify(completed.clip.error());
        }
        _assistant->ready.emplace(completed.index, std::nullopt);
    }
    else if (speaksAloud())
    {
        auto const index = completed.index;
        _assistant->ready.emplace(index, std::move(completed));
    }

    if (!speaksAloud())
        _assistant->ready.clear();

    enqueueReadySegments();
    maybeFinishTurn();
}

void TurnController::enqueueReadySegments()
{
    while (_assistant)
    {
        auto it = _assistant->ready.find(_assistant->nextToEnqueue);
        if (it == _assistant->ready.end())
            return;

        auto entry = std::move(it->second);
        _assistant->ready.erase(it);
        ++_assistant->nextToEnqueue;

        if (!entry)
            continue;

        if (entry->speech.empty())
            entry->speech = entry->text;
        (void) _playback.enqueue(std::move(entry->speech),
                                 std::move(*entry->clip),
                                 _assistant->token,
                                 std::move(entry->text));
    }
}

void TurnController::commitAssistantTurn(bool interrupted)
{
    auto const& said = interrupted && !_assistant->spokenText.empty() ? _assistant->spokenText : _assistant->text;
    auto turn = ConversationTurn {
        .role = Role::Assistant,
        .text = std::string(text::trim(said)),
        .startedAt = _assistant->startedAt,
        .endedAt = _clock.now(),
        .interrupted = interrupted,
    };
    auto const converted = std::move(_assistant->convertedSpeech);
    _assistant.reset();

    if (turn.text.empty())
        return;

    if (interrupted)
        _interruptedTurn = turn.text;
    _echo.setLastAssistantTurn(echoReference(turn.text, converted));
    _conversation.append(turn);
    if (_callbacks.onTurnCommitted)
        _callbacks.onTurnCommitted(turn);
}

void TurnController::maybeFinishTurn()
{
    if (!_assistant || !_assistant->responseComplete)
        return;
    if (_assistant->pendingSyntheses > 0 || !_assistant->ready.empty())
        return;
    if (_playback.isPlaying() || _playback.queuedCount() > 0)
        return;

    commitAssistantTurn(false);

    switch (_state.phase)
    {
        case Phase::Transcribing:
        case Phase::AwaitingResponse:
        case Phase::Speaking: transition(Phase::Listening, "assistant turn complete"); break;
        default: break;
    }
}

void TurnController::onSegmentStarted(const TtsSegment& segment)
{
    _echo.segmentStarted(segment.id,
                         segment.sourceText,
                         computeEnvelope(segment.clip.samples,
                                         segment.clip.sampleRate,
                                         segment.clip.channels,
                                         _clock.now(),
                                         PlaybackEnvelopeResolution));

    if (_assistant && _assistant->token == segment.token)
    {
        if (!_assistant->spokenText.empty())
            _assistant->spokenText += ' ';
        _assistant->spokenText += segment.writtenText.empty() ? segment.sourceText : segment.writtenText;
    }

    if (_state.phase == Phase::AwaitingResponse)
        transition(Phase::Speaking, "playback started");
}

void TurnController::onSegmentEnded(const TtsSegment& segment)
{
    _echo.segmentEnded(segment.id);
}

auto TurnController::speaksAloud() const -> bool
{
    return _state.soundEnabled && _synthesizer && _synthesizer->isAvailable();
}

auto TurnController::transition(Phase to, std::string_view reason) -> bool
{
    auto const from = _state.phase;
    if (!isAllowedTransition(from, to))
    {
        log::warning("Rejected phase transition {} -> {} ({})", phaseName(from), phaseName(to), reason);
        return false;
    }

    auto record = PhaseTransition {
        .from = from,
        .to = to,
        .reason = std::string(reason),
        .at = _clock.now(),
    };
    _state.phase = to;
    _vad.setGuarded(to == Phase::Speaking);
    log::info("Phase {} -> {} ({})", phaseName(from), phaseName(to), reason);

    _history.push_back(record);
    if (_callbacks.onPhaseChanged)
        _callbacks.onPhaseChanged(record);
    return true;
}

void TurnController::advanceToken(std::string_view reason)
{
    _state.activeToken = _tokens.advance(reason);
}

void TurnController::notify(const Error& error)
{
    if (error.code == ErrorCode::Cancelled)
        return;

    if (!_notified.insert(error.code).second)
    {
        log::debug("Already notified about {} this turn", errorCodeName(error.code));
        return;
    }

    if (_callbacks.onNotification)
        _callbacks.onNotification(error);
}

} // namespace voicetutor
