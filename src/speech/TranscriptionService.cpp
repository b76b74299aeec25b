// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionService.hpp"

#include <audio/Loudness.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <speech/HallucinationFilter.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace voicetutor
{

TranscriptionService::TranscriptionService(TranscriptionConfig config,
                                           Recognizer* native,
                                           Recognizer* cloud,
                                           Executor& executor,
                                           const GenerationTokenManager& tokens,
                                           const Clock& clock,
                                           RecognitionPoster post):
    _config(config),
    _native(native),
    _cloud(cloud),
    _executor(executor),
    _tokens(tokens),
    _clock(clock),
    _post(std::move(post)),
    _dedup(config.dedup)
{
    _config.retryCeiling = std::max(_config.retryCeiling, 1);
}

auto TranscriptionService::selectStrategy(const CaptureCapabilities& capabilities) -> VoidResult
{
    auto const nativeUsable = _native && capabilities.nativeStreamingAsr && _native->isAvailable();
    auto const cloudUsable = _cloud && _cloud->isAvailable()
                             && (capabilities.scriptLevelPcmAccess || capabilities.mediaRecorderChunking);

    if (nativeUsable && (_config.preferNative || !cloudUsable))
        _active = TranscriptSource::Native;
    else if (cloudUsable)
        _active = TranscriptSource::Cloud;
    else
        return makeError(ErrorCode::NotFoundError, "No speech recognizer is available for this capture source");

    log::info("Transcription strategy: {}", sourceName(*_active));
    return {};
}

auto TranscriptionService::activeSource() const -> std::optional<TranscriptSource>
{
    return _active;
}

auto TranscriptionService::active() const -> Recognizer*
{
    if (!_active)
        return nullptr;
    return *_active == TranscriptSource::Native ? _native : _cloud;
}

auto TranscriptionService::alternate() const -> Recognizer*
{
    if (!_active)
        return nullptr;
    auto* other = *_active == TranscriptSource::Native ? _cloud : _native;
    if (!other || !other->isAvailable())
        return nullptr;
    return other;
}

void TranscriptionService::onSpeechStarted(const SpeechStarted& started)
{
    if (_inFlight && _inFlight->ended)
    {
        auto& f = *_inFlight;
        log::debug("Transcription: span {} extends span {} awaiting its final", started.spanId, f.spanId);
        f.carried.insert(f.carried.end(), std::make_move_iterator(f.frames.begin()), std::make_move_iterator(f.frames.end()));
        f.frames = started.initialFrames;
        f.spanId = started.spanId;
        f.guarded = started.guarded;
        f.ended = false;
        f.finalRequest = 0;
        f.interimRequest = 0;
        f.audioSinceInterim = Millis { 0 };
        f.attempts = 0;
        return;
    }

    if (_inFlight)
        log::warning("Transcription: span {} started while span {} is still open", started.spanId, _inFlight->spanId);

    auto f = InFlight {};
    f.spanId = started.spanId;
    f.guarded = started.guarded;
    f.startedAt = started.initialFrames.empty() ? started.at : started.initialFrames.front().timestamp;
    f.frames = started.initialFrames;
    _inFlight = std::move(f);
}

void TranscriptionService::onFrame(const AudioFrame& frame)
{
    if (!_inFlight || _inFlight->ended)
        return;

    auto& f = *_inFlight;
    f.frames.push_back(frame);

    auto const* recognizer = active();
    if (!recognizer || !recognizer->isStreaming())
        return;

    f.audioSinceInterim += frame.duration();
    if (f.audioSinceInterim >= _config.interimInterval && f.interimRequest == 0)
    {
        f.audioSinceInterim = Millis { 0 };
        submit(false);
    }
}

void TranscriptionService::onSpeechEnded(const SpeechSpan& span)
{
    if (!_inFlight || _inFlight->spanId != span.id)
    {
        if (_inFlight)
            log::warning("Transcription: span {} ended while span {} was in flight", span.id, _inFlight->spanId);
        auto f = InFlight {};
        f.spanId = span.id;
        f.startedAt = span.startedAt;
        _inFlight = std::move(f);
    }

    auto& f = *_inFlight;
    f.frames = span.frames;
    f.guarded = span.guarded;
    f.ended = true;
    f.endedAt = span.endedAt;
    submit(true);
}

void TranscriptionService::onSpeechDropped(std::uint64_t spanId)
{
    if (!_inFlight || _inFlight->spanId != spanId || _inFlight->ended)
        return;

    auto& f = *_inFlight;
    if (f.carried.empty())
    {
        _inFlight.reset();
        return;
    }

    // The extension turned out to be noise; finish the utterance it was extending.
    f.frames.clear();
    f.ended = true;
    f.endedAt = _clock.now();
    submit(true);
}

void TranscriptionService::submit(bool isFinal)
{
    auto* recognizer = active();
    if (!recognizer)
    {
        log::error("Transcription: no recognizer selected, dropping span {}", _inFlight->spanId);
        _inFlight.reset();
        return;
    }

    auto& f = *_inFlight;
    auto samples = std::vector<float> {};
    auto sampleRate = 16000u;
    for (auto const* frames: { &f.carried, &f.frames })
    {
        for (auto const& frame: *frames)
        {
            samples.insert(samples.end(), frame.samples.begin(), frame.samples.end());
            sampleRate = frame.sampleRate;
        }
    }

    auto const requestId = ++_nextRequestId;
    if (isFinal)
        f.finalRequest = requestId;
    else
        f.interimRequest = requestId;

    log::trace("Transcription: {} request {} for span {} ({} samples, {})",
               isFinal ? "final" : "interim",
               requestId,
               f.spanId,
               samples.size(),
               sourceName(recognizer->source()));

    _executor.post([recognizer,
                    samples = std::move(samples),
                    sampleRate,
                    isFinal,
                    requestId,
                    token = _tokens.current(),
                    post = _post]() {
        auto result = recognizer->transcribe(samples, sampleRate, isFinal);
        post(RecognitionOutcome {
            .requestId = requestId,
            .token = token,
            .isFinal = isFinal,
            .result = std::move(result),
        });
    });
}

auto TranscriptionService::handleOutcome(RecognitionOutcome outcome) -> TranscriptionUpdate
{
    if (!_tokens.isCurrent(outcome.token))
    {
        log::trace("Transcription: dropping result of generation {}", outcome.token);
        return {};
    }

    if (!_inFlight)
    {
        log::trace("Transcription: dropping result of request {}, no span in flight", outcome.requestId);
        return {};
    }

    auto& f = *_inFlight;
    if (!outcome.isFinal)
    {
        if (outcome.requestId != f.interimRequest)
            return {};
        f.interimRequest = 0;

        if (!outcome.result)
        {
            log::debug("Interim decode failed: {}", outcome.result.error());
            return {};
        }

        auto text = std::string(text::trim(outcome.result->text));
        if (text.empty() || text == f.lastInterim)
            return {};

        f.lastInterim = text;
        f.lastInterimConfidence = outcome.result->confidence;
        f.lastInterimChange = _clock.now();
        return TranscriptionUpdate { .interim = std::move(text) };
    }

    if (outcome.requestId != f.finalRequest)
    {
        log::trace("Transcription: request {} was superseded", outcome.requestId);
        return {};
    }
    f.finalRequest = 0;

    if (!outcome.result)
        return handleFailure(outcome.result.error());

    return commit(std::move(*outcome.result));
}

auto TranscriptionService::handleFailure(const Error& error) -> TranscriptionUpdate
{
    auto& f = *_inFlight;

    if (isFatal(error.code))
    {
        log::error("Transcription failed: {}", error);
        _inFlight.reset();
        return TranscriptionUpdate { .failure = error };
    }

    ++f.attempts;
    auto const* current = active();
    if (f.attempts < _config.retryCeiling && current && current->isAvailable())
    {
        log::warning("Transcription attempt {}/{} failed ({}), retrying", f.attempts, _config.retryCeiling, error);
        submit(true);
        return {};
    }

    if (auto const* next = alternate(); next && !f.fellBack)
    {
        log::warning("{} recognizer failed {} time(s), falling back to {}",
                     sourceName(*_active),
                     f.attempts,
                     sourceName(next->source()));
        _active = next->source();
        f.fellBack = true;
        f.attempts = 0;
        submit(true);
        return {};
    }

    log::warning("Giving up on span {}: {}", f.spanId, error);
    _inFlight.reset();
    return TranscriptionUpdate {
        .failure = Error { ErrorCode::TranscriptionError, std::format("Speech could not be transcribed: {}", error.message) },
    };
}

auto TranscriptionService::commit(TranscriptionResult result) -> TranscriptionUpdate
{
    auto f = std::move(*_inFlight);
    _inFlight.reset();

    result.isFinal = true;
    result.text = std::string(text::trim(result.text));
    if (result.text.empty())
    {
        log::debug("Transcription: no speech recognized in span {}", f.spanId);
        return {};
    }

    auto filtered = filterHallucination(result.text);
    if (!filtered)
    {
        log::debug("Transcription: rejected \"{}\" as recognizer noise", result.text);
        return {};
    }
    result.text = std::move(*filtered);

    auto const now = _clock.now();
    auto const verdict = _dedup.classify(result.text, now);
    switch (verdict)
    {
        case DedupVerdict::New: break;
        case DedupVerdict::Extension:
            log::debug("Transcription: \"{}\" revises the previous final", result.text);
            _dedup.remember(result.text, now);
            return TranscriptionUpdate { .revision = std::move(result.text) };
        case DedupVerdict::ExactRepeat:
        case DedupVerdict::MinorVariation:
            log::debug("Transcription: suppressed {} \"{}\"", dedupVerdictName(verdict), result.text);
            return {};
    }

    _dedup.remember(result.text, now);

    auto frames = std::move(f.carried);
    frames.insert(frames.end(), std::make_move_iterator(f.frames.begin()), std::make_move_iterator(f.frames.end()));

    log::info("Final transcript ({}, span {}): \"{}\"", sourceName(result.source), f.spanId, result.text);
    return TranscriptionUpdate {
        .final =
            FinalTranscript {
                .result = std::move(result),
                .spanId = f.spanId,
                .guarded = f.guarded,
                .spanStart = f.startedAt,
                .spanEnd = f.endedAt,
                .envelope = envelopeOf(frames),
            },
    };
}

auto TranscriptionService::poll(TimePoint now) -> TranscriptionUpdate
{
    if (!_inFlight || _config.interimPromotion.count() <= 0)
        return {};

    auto& f = *_inFlight;
    if (!f.ended || f.lastInterim.empty() || !_active)
        return {};

    auto const quietSince = std::max(f.endedAt, f.lastInterimChange);
    if (now - quietSince < _config.interimPromotion)
        return {};

    log::debug("Transcription: final for span {} overdue, promoting interim \"{}\"", f.spanId, f.lastInterim);
    return commit(TranscriptionResult {
        .text = f.lastInterim,
        .isFinal = true,
        .confidence = f.lastInterimConfidence,
        .source = *_active,
    });
}

void TranscriptionService::cancel()
{
    if (_inFlight)
        log::trace("Transcription: cancelled span {}", _inFlight->spanId);
    _inFlight.reset();
}

void TranscriptionService::resetDeduplication()
{
    _dedup.reset();
}

auto TranscriptionService::spanInFlight() const -> std::optional<std::uint64_t>
{
    if (!_inFlight)
        return std::nullopt;
    return _inFlight->spanId;
}

} // namespace voicetutor
