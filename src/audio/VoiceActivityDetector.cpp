// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <audio/Loudness.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <numeric>

namespace voicetutor
{

VoiceActivityDetector::VoiceActivityDetector(VadConfig config): _config(config)
{
    _config.smoothingWindow = std::max(_config.smoothingWindow, 1);
    _config.interruptionConfirmFrames = std::max(_config.interruptionConfirmFrames, 1);
    _config.preRollFrames = std::max(_config.preRollFrames, 0);
}

auto VoiceActivityDetector::process(const AudioFrame& frame) -> std::optional<VadEvent>
{
    auto const level = rmsPercent(frame.samples);
    _history.push_back(level);
    while (_history.size() > static_cast<std::size_t>(_config.smoothingWindow))
        _history.pop_front();

    auto const average = smoothedLoudness();

    if (!_span)
    {
        auto ready = false;
        if (_guarded)
        {
            // After a rejected candidate, the loudness has to dip before the next one can open.
            if (_awaitingQuiet && average <= _config.interruptionThreshold)
                _awaitingQuiet = false;
            _confirmFrames = average > _config.interruptionThreshold && !_awaitingQuiet ? _confirmFrames + 1 : 0;
            ready = _confirmFrames >= _config.interruptionConfirmFrames;
        }
        else
        {
            ready = average > _config.speechThreshold;
        }

        if (!ready)
        {
            _preRoll.push_back(frame);
            auto const capacity = static_cast<std::size_t>(_config.preRollFrames)
                                  + (_guarded ? static_cast<std::size_t>(_config.interruptionConfirmFrames) : 0);
            while (_preRoll.size() > capacity)
                _preRoll.pop_front();
            return std::nullopt;
        }

        return openSpan(frame);
    }

    auto& open = *_span;
    open.span.frames.push_back(frame);
    account(open, level);

    if (average > _config.speechThreshold)
    {
        open.lastVoicedEnd = frame.endTime();
        open.silentSince.reset();
    }
    else if (!open.silentSince)
    {
        open.silentSince = frame.timestamp;
    }

    auto const silenceElapsed = open.silentSince && frame.endTime() - *open.silentSince >= _config.silenceDuration;
    auto const tooLong = frame.endTime() - open.span.startedAt >= _config.maxSpanDuration;

    if (tooLong && !silenceElapsed)
        log::debug("VAD: span {} reached the {} ms limit, closing", open.span.id, _config.maxSpanDuration.count());

    if (silenceElapsed || tooLong)
        return closeSpan(frame.endTime());

    return std::nullopt;
}

auto VoiceActivityDetector::openSpan(const AudioFrame& frame) -> SpeechStarted
{
    auto open = OpenSpan {};
    open.span.id = ++_nextSpanId;
    open.span.guarded = _guarded;
    open.span.frames.assign(std::make_move_iterator(_preRoll.begin()), std::make_move_iterator(_preRoll.end()));
    open.span.frames.push_back(frame);
    open.span.startedAt = open.span.frames.front().timestamp;
    open.firstVoiced = frame.timestamp;
    open.lastVoicedEnd = frame.endTime();
    _preRoll.clear();
    _confirmFrames = 0;

    for (auto const& f: open.span.frames)
        account(open, rmsPercent(f.samples));

    auto started = SpeechStarted {
        .spanId = open.span.id,
        .at = frame.timestamp,
        .guarded = open.span.guarded,
        .initialFrames = open.span.frames,
    };

    log::debug("VAD: speech started (span {}, {}, loudness {:.2f}%)",
               open.span.id,
               open.span.guarded ? "guarded" : "normal",
               smoothedLoudness());

    _span = std::move(open);
    return started;
}

void VoiceActivityDetector::account(OpenSpan& open, float level)
{
    open.span.peakLoudness = std::max(open.span.peakLoudness, level);
    open.loudnessSum += level;
}

auto VoiceActivityDetector::closeSpan(TimePoint endedAt) -> VadEvent
{
    auto open = std::move(*_span);
    _span.reset();

    auto& span = open.span;
    span.endedAt = endedAt;
    span.speechDuration = millisBetween(open.firstVoiced, open.lastVoicedEnd);
    if (!span.frames.empty())
        span.averageLoudness = static_cast<float>(open.loudnessSum / static_cast<double>(span.frames.size()));

    auto const bytes = span.byteSize();
    if (span.speechDuration < _config.minSpeechDuration)
    {
        log::debug("VAD: span {} discarded, {} ms of speech", span.id, span.speechDuration.count());
        return SpeechDiscarded {
            .spanId = span.id, .speechDuration = span.speechDuration, .byteSize = bytes, .reason = DiscardReason::TooShort
        };
    }
    if (bytes < _config.minAudioSize)
    {
        log::debug("VAD: span {} discarded, {} bytes of audio", span.id, bytes);
        return SpeechDiscarded {
            .spanId = span.id, .speechDuration = span.speechDuration, .byteSize = bytes, .reason = DiscardReason::TooSmall
        };
    }

    log::debug("VAD: speech ended (span {}, {} ms, avg {:.2f}%, peak {:.2f}%)",
               span.id,
               span.speechDuration.count(),
               span.averageLoudness,
               span.peakLoudness);
    return SpeechEnded { .span = std::move(span) };
}

void VoiceActivityDetector::setGuarded(bool guarded)
{
    if (_guarded == guarded)
        return;
    _guarded = guarded;
    _confirmFrames = 0;
    _awaitingQuiet = false;
}

void VoiceActivityDetector::rejectCandidate()
{
    if (!_span || !_span->span.guarded)
        return;
    log::debug("VAD: interruption candidate {} rejected", _span->span.id);
    _span.reset();
    _confirmFrames = 0;
    _preRoll.clear();
    _awaitingQuiet = true;
}

void VoiceActivityDetector::promoteCandidate()
{
    if (_span)
        _span->span.guarded = false;
}

void VoiceActivityDetector::reset()
{
    _span.reset();
    _history.clear();
    _preRoll.clear();
    _confirmFrames = 0;
    _awaitingQuiet = false;
}

auto VoiceActivityDetector::openSpanId() const -> std::optional<std::uint64_t>
{
    if (!_span)
        return std::nullopt;
    return _span->span.id;
}

auto VoiceActivityDetector::smoothedLoudness() const -> float
{
    if (_history.empty())
        return 0.0f;
    return std::accumulate(_history.begin(), _history.end(), 0.0f) / static_cast<float>(_history.size());
}

} // namespace voicetutor
