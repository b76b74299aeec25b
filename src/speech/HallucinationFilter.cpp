// SPDX-License-Identifier: Apache-2.0
#include "HallucinationFilter.hpp"

#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <algorithm>
#include <array>

namespace voicetutor
{

namespace
{
    // Phrases matched anywhere in the lowercased text.
    constexpr auto HallucinationPhrases = std::array {
        std::string_view { "продолжение следует" },
        std::string_view { "с вами был" },
        std::string_view { "до свидания" },
        std::string_view { "до новых встреч" },
        std::string_view { "спасибо за внимание" },
        std::string_view { "закончили" },
        std::string_view { "субтитры" },
        std::string_view { "подписывайтесь" },
        std::string_view { "ставьте лайк" },
        std::string_view { "благодарю за просмотр" },
    };

    // Phrases matched only at the end of the text.
    constexpr auto HallucinationEndings = std::array {
        std::string_view { "конец" },
    };

    constexpr auto FillerLetters = std::u32string_view { U"эмауо" };

    auto consistsOnlyOf(std::string_view text, char ch) -> bool
    {
        return !text.empty() && std::ranges::all_of(text, [ch](char c) { return c == ch; });
    }

    auto fragmentCount(std::string_view text) -> std::size_t
    {
        auto count = std::size_t { 0 };
        auto start = std::size_t { 0 };
        while (start <= text.size())
        {
            auto end = text.find_first_of(".!?", start);
            if (end == std::string_view::npos)
                end = text.size();
            if (!text::trim(text.substr(start, end - start)).empty())
                ++count;
            start = end + 1;
        }
        return count;
    }
} // namespace

auto matchesHallucinationPattern(std::string_view text) -> bool
{
    auto const lower = text::toLower(text::trim(text));

    for (auto const phrase: HallucinationPhrases)
        if (lower.find(phrase) != std::string::npos)
            return true;

    for (auto const ending: HallucinationEndings)
        if (lower.ends_with(ending))
            return true;

    auto const stripped = text::trim(text);
    return consistsOnlyOf(stripped, '.') || consistsOnlyOf(stripped, ',');
}

auto isMeaninglessSound(std::string_view text) -> bool
{
    auto const codepoints = text::decodeUtf8(text::toLower(text::trim(text)));
    if (codepoints.empty())
        return true;

    auto const allLetters = std::ranges::all_of(codepoints, text::isLetter);
    if (!allLetters)
        return false;

    if (codepoints.size() <= 2)
        return true;

    // A single filler vowel or hum held for a while: "эээ", "ммм".
    auto const first = codepoints.front();
    return FillerLetters.find(first) != std::u32string_view::npos
           && std::ranges::all_of(codepoints, [first](char32_t cp) { return cp == first; });
}

auto filterHallucination(std::string_view text) -> std::optional<std::string>
{
    auto const trimmed = text::trim(text);
    if (trimmed.empty())
        return std::nullopt;

    if (matchesHallucinationPattern(trimmed))
    {
        log::debug("Filter: hallucination pattern in \"{}\"", trimmed);
        return std::nullopt;
    }

    auto const length = text::graphemeCount(trimmed);
    if (length < MinTranscriptLength || length > MaxTranscriptLength)
    {
        log::debug("Filter: length {} out of bounds for \"{}\"", length, trimmed);
        return std::nullopt;
    }

    if (fragmentCount(trimmed) > MaxTranscriptFragments)
    {
        log::debug("Filter: too many sentence fragments in \"{}\"", trimmed);
        return std::nullopt;
    }

    if (isMeaninglessSound(trimmed))
    {
        log::debug("Filter: meaningless sound \"{}\"", trimmed);
        return std::nullopt;
    }

    return std::string(trimmed);
}

} // namespace voicetutor
