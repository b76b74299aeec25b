// SPDX-License-Identifier: Apache-2.0
#include "TranscriptDeduplicator.hpp"

#include <core/TextUtils.hpp>

#include <algorithm>

namespace voicetutor
{

auto compareTranscripts(std::string_view previous, std::string_view next, const DedupConfig& config) -> DedupVerdict
{
    auto const prev = text::normalize(previous);
    auto const cur = text::normalize(next);

    if (prev.empty() || cur.empty())
        return DedupVerdict::New;

    if (prev == cur)
        return DedupVerdict::ExactRepeat;

    auto const prevLength = text::codepointCount(prev);
    auto const curLength = text::codepointCount(cur);

    if (cur.starts_with(prev) && curLength - prevLength > config.extensionMinChars)
        return DedupVerdict::Extension;

    auto const longer = std::max(prevLength, curLength);
    auto const lengthDifference = prevLength > curLength ? prevLength - curLength : curLength - prevLength;
    auto const distance = text::editDistance(prev, cur);

    if (static_cast<float>(distance) < config.minorVariationRatio * static_cast<float>(longer)
        && lengthDifference < config.maxVariationChars)
        return DedupVerdict::MinorVariation;

    return DedupVerdict::New;
}

TranscriptDeduplicator::TranscriptDeduplicator(DedupConfig config): _config(config)
{
}

auto TranscriptDeduplicator::classify(std::string_view text, TimePoint now) const -> DedupVerdict
{
    if (!_lastAt || now - *_lastAt > _config.window)
        return DedupVerdict::New;
    return compareTranscripts(_lastText, text, _config);
}

void TranscriptDeduplicator::remember(std::string text, TimePoint now)
{
    _lastText = std::move(text);
    _lastAt = now;
}

void TranscriptDeduplicator::reset()
{
    _lastText.clear();
    _lastAt.reset();
}

auto TranscriptDeduplicator::lastText() const -> std::optional<std::string_view>
{
    if (!_lastAt)
        return std::nullopt;
    return std::string_view { _lastText };
}

} // namespace voicetutor
