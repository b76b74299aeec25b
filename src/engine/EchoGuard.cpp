// SPDX-License-Identifier: Apache-2.0
#include "EchoGuard.hpp"

#include <audio/Loudness.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace voicetutor
{

namespace
{

    /// @brief Echo reaches the microphone a little after it is played; lags up to this many frames are tried.
    constexpr auto MaxLagFrames = 3;

    /// @brief Fewer overlapping frames than this say nothing about correlation.
    constexpr auto MinOverlapFrames = std::size_t { 3 };

} // namespace

auto compareWithPlayedText(std::string_view candidate, std::string_view played, const EchoConfig& config)
    -> EchoVerdict
{
    auto const normalizedCandidate = text::normalize(candidate);
    auto const normalizedPlayed = text::normalize(played);

    if (normalizedCandidate.empty() || normalizedPlayed.empty())
        return {};

    if (normalizedPlayed.find(normalizedCandidate) != std::string::npos)
        return EchoVerdict { .isEcho = true, .confidence = 1.0f, .reason = EchoReason::Substring };

    auto const playedWords = [&] {
        auto const words = text::words(normalizedPlayed);
        return std::unordered_set<std::string>(words.begin(), words.end());
    }();

    auto significant = std::size_t { 0 };
    auto matched = std::size_t { 0 };
    for (auto const& word: text::words(normalizedCandidate))
    {
        if (text::codepointCount(word) < config.minWordLength)
            continue;
        ++significant;
        if (playedWords.contains(word))
            ++matched;
    }

    if (significant == 0)
        return {};

    auto const overlap = static_cast<float>(matched) / static_cast<float>(significant);
    return EchoVerdict {
        .isEcho = overlap >= config.wordOverlapThreshold,
        .confidence = overlap,
        .reason = overlap >= config.wordOverlapThreshold ? EchoReason::WordOverlap : EchoReason::None,
    };
}

auto envelopeCorrelation(const LoudnessEnvelope& candidate, const LoudnessEnvelope& played) -> std::optional<float>
{
    if (candidate.values.empty() || played.values.empty() || played.frameDuration.count() <= 0)
        return std::nullopt;

    auto best = std::optional<float> {};
    auto a = std::vector<float> {};
    auto b = std::vector<float> {};

    for (auto lag = 0; lag <= MaxLagFrames; ++lag)
    {
        a.clear();
        b.clear();
        for (auto i = std::size_t { 0 }; i < candidate.values.size(); ++i)
        {
            auto const heardAt = candidate.start + candidate.frameDuration * static_cast<Millis::rep>(i)
                                 - candidate.frameDuration * lag;
            if (heardAt < played.start)
                continue;
            auto const j = static_cast<std::size_t>(millisBetween(played.start, heardAt) / played.frameDuration);
            if (j >= played.values.size())
                break;
            a.push_back(candidate.values[i]);
            b.push_back(played.values[j]);
        }

        if (a.size() < MinOverlapFrames)
            continue;

        auto const r = correlation(a, b);
        if (!best || r > *best)
            best = r;
    }

    return best;
}

EchoGuard::EchoGuard(EchoConfig config, const Clock& clock): _config(config), _clock(clock)
{
}

void EchoGuard::segmentStarted(std::uint64_t segmentId, std::string_view text, LoudnessEnvelope envelope)
{
    auto const now = _clock.now();
    prune(now);

    _profiles.push_back(EchoProfile {
        .segmentId = segmentId,
        .normalizedText = text::normalize(text),
        .envelope = std::move(envelope),
        .startedAt = now,
    });

    while (_profiles.size() > std::max<std::size_t>(_config.profileLimit, 1))
        _profiles.pop_front();
}

void EchoGuard::segmentEnded(std::uint64_t segmentId)
{
    auto const it = std::ranges::find(_profiles, segmentId, &EchoProfile::segmentId);
    if (it != _profiles.end() && !it->endedAt)
        it->endedAt = _clock.now();
}

void EchoGuard::setLastAssistantTurn(std::string_view text)
{
    _lastAssistantTurn = text::normalize(text);
}

auto EchoGuard::isRelevant(const EchoProfile& profile, TimePoint spokenAt) const -> bool
{
    if (profile.startedAt > spokenAt)
        return false;
    return !profile.endedAt || spokenAt - *profile.endedAt <= _config.cooldown;
}

auto EchoGuard::inWindow(TimePoint spokenAt) const -> bool
{
    return std::ranges::any_of(_profiles, [&](auto const& profile) { return isRelevant(profile, spokenAt); });
}

auto EchoGuard::playedText(TimePoint spokenAt) const -> std::string
{
    auto played = std::string {};
    for (auto const& profile: _profiles)
    {
        if (!isRelevant(profile, spokenAt))
            continue;
        if (!played.empty())
            played += ' ';
        played += profile.normalizedText;
    }
    return played;
}

auto EchoGuard::classify(std::string_view candidateText, const LoudnessEnvelope* candidateAudio, TimePoint spokenAt) const
    -> EchoVerdict
{
    if (!inWindow(spokenAt))
        return {};

    auto verdict = compareWithPlayedText(candidateText, playedText(spokenAt), _config);
    if (verdict.isEcho)
        return verdict;

    auto const normalized = text::normalize(candidateText);
    if (!normalized.empty() && text::codepointCount(normalized) <= _config.shortEchoMaxChars
        && _lastAssistantTurn.find(normalized) != std::string::npos)
        return EchoVerdict { .isEcho = true, .confidence = 1.0f, .reason = EchoReason::ShortRepeat };

    if (candidateAudio)
    {
        auto const acoustic = classifyAudio(*candidateAudio);
        if (acoustic.isEcho)
            return acoustic;
        verdict.confidence = std::max(verdict.confidence, acoustic.confidence);
    }

    return verdict;
}

auto EchoGuard::classifyAudio(const LoudnessEnvelope& candidateAudio) const -> EchoVerdict
{
    auto const spokenAt =
        candidateAudio.start + candidateAudio.frameDuration * static_cast<Millis::rep>(candidateAudio.values.size());

    auto best = 0.0f;
    for (auto const& profile: _profiles)
    {
        if (!isRelevant(profile, spokenAt))
            continue;
        if (auto const r = envelopeCorrelation(candidateAudio, profile.envelope); r && *r > best)
            best = *r;
    }

    if (best >= _config.audioCorrelationThreshold)
    {
        log::debug("Acoustic echo: loudness correlation {:.2f}", best);
        return EchoVerdict { .isEcho = true, .confidence = best, .reason = EchoReason::Acoustic };
    }
    return EchoVerdict { .confidence = best };
}

void EchoGuard::clear()
{
    _profiles.clear();
    _lastAssistantTurn.clear();
}

void EchoGuard::prune(TimePoint now)
{
    std::erase_if(_profiles, [&](auto const& profile) {
        return profile.endedAt && now - *profile.endedAt > _config.profileMaxAge;
    });
}

} // namespace voicetutor
