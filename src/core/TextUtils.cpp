// SPDX-License-Identifier: Apache-2.0
#include "TextUtils.hpp"

#include <libunicode/utf8_grapheme_segmenter.h>

#include <algorithm>
#include <numeric>

namespace voicetutor::text
{

namespace
{
    constexpr auto ReplacementCharacter = char32_t { 0xFFFD };

    auto isContinuation(unsigned char c) -> bool
    {
        return (c & 0xC0) == 0x80;
    }

    auto lowerCodepoint(char32_t cp) -> char32_t
    {
        if (cp >= U'A' && cp <= U'Z')
            return cp + 0x20;
        if (cp >= 0x0410 && cp <= 0x042F) // А..Я
            return cp + 0x20;
        if (cp >= 0x0400 && cp <= 0x040F) // Ѐ..Џ, including Ё
            return cp + 0x50;
        return cp;
    }

    auto isSpace(char32_t cp) -> bool
    {
        return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v'
               || cp == 0x00A0;
    }
} // namespace

auto decodeUtf8(std::string_view input) -> std::u32string
{
    auto output = std::u32string {};
    output.reserve(input.size());

    auto i = std::size_t { 0 };
    while (i < input.size())
    {
        auto const lead = static_cast<unsigned char>(input[i]);
        auto length = std::size_t { 0 };
        auto cp = char32_t { 0 };

        if (lead < 0x80)
        {
            output.push_back(lead);
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            cp = lead & 0x07;
        }
        else
        {
            output.push_back(ReplacementCharacter);
            ++i;
            continue;
        }

        if (i + length > input.size())
        {
            output.push_back(ReplacementCharacter);
            break;
        }

        auto valid = true;
        for (auto k = std::size_t { 1 }; k < length; ++k)
        {
            auto const c = static_cast<unsigned char>(input[i + k]);
            if (!isContinuation(c))
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (c & 0x3F);
        }

        if (!valid)
        {
            output.push_back(ReplacementCharacter);
            ++i;
            continue;
        }

        output.push_back(cp);
        i += length;
    }

    return output;
}

auto encodeUtf8(std::u32string_view input) -> std::string
{
    auto output = std::string {};
    output.reserve(input.size());

    for (auto const cp: input)
    {
        if (cp < 0x80)
        {
            output.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            output.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            output.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            output.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            output.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            output.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    return output;
}

auto toLower(std::string_view input) -> std::string
{
    auto codepoints = decodeUtf8(input);
    std::ranges::transform(codepoints, codepoints.begin(), lowerCodepoint);
    return encodeUtf8(codepoints);
}

auto trim(std::string_view input) -> std::string_view
{
    auto const start = input.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos)
        return {};
    auto const end = input.find_last_not_of(" \t\n\r\f\v");
    return input.substr(start, end - start + 1);
}

auto isPunctuation(char32_t cp) -> bool
{
    if (cp < 0x80)
        return (cp >= U'!' && cp <= U'/') || (cp >= U':' && cp <= U'@') || (cp >= U'[' && cp <= U'`')
               || (cp >= U'{' && cp <= U'~');

    switch (cp)
    {
        case 0x00AB: // «
        case 0x00BB: // »
        case 0x2026: // …
        case 0x2039:
        case 0x203A: return true;
        default: break;
    }

    // Dashes and typographic quotes.
    return (cp >= 0x2010 && cp <= 0x2015) || (cp >= 0x2018 && cp <= 0x201F);
}

auto isLetter(char32_t cp) -> bool
{
    return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= 0x0400 && cp <= 0x04FF);
}

auto normalize(std::string_view input) -> std::string
{
    auto const codepoints = decodeUtf8(input);
    auto output = std::u32string {};
    output.reserve(codepoints.size());

    auto pendingSpace = false;
    for (auto const cp: codepoints)
    {
        if (isPunctuation(cp) || isSpace(cp))
        {
            pendingSpace = !output.empty();
            continue;
        }
        if (pendingSpace)
        {
            output.push_back(U' ');
            pendingSpace = false;
        }
        output.push_back(lowerCodepoint(cp));
    }

    return encodeUtf8(output);
}

auto words(std::string_view input) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto pos = std::size_t { 0 };
    while (pos < input.size())
    {
        auto const start = input.find_first_not_of(" \t\n\r", pos);
        if (start == std::string_view::npos)
            break;
        auto end = input.find_first_of(" \t\n\r", start);
        if (end == std::string_view::npos)
            end = input.size();
        result.emplace_back(input.substr(start, end - start));
        pos = end;
    }
    return result;
}

auto graphemeCount(std::string_view input) -> std::size_t
{
    auto segmenter = unicode::utf8_grapheme_segmenter(input);
    auto count = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        ++count;
    return count;
}

auto codepointCount(std::string_view input) -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count_if(input, [](char c) { return !isContinuation(static_cast<unsigned char>(c)); }));
}

auto editDistance(std::string_view a, std::string_view b) -> std::size_t
{
    auto const lhs = decodeUtf8(a);
    auto const rhs = decodeUtf8(b);

    if (lhs.empty())
        return rhs.size();
    if (rhs.empty())
        return lhs.size();

    // Two-row dynamic programming table.
    auto previous = std::vector<std::size_t>(rhs.size() + 1);
    auto current = std::vector<std::size_t>(rhs.size() + 1);
    std::iota(previous.begin(), previous.end(), std::size_t { 0 });

    for (auto i = std::size_t { 1 }; i <= lhs.size(); ++i)
    {
        current[0] = i;
        for (auto j = std::size_t { 1 }; j <= rhs.size(); ++j)
        {
            auto const substitution = previous[j - 1] + (lhs[i - 1] == rhs[j - 1] ? 0 : 1);
            current[j] = std::min({ previous[j] + 1, current[j - 1] + 1, substitution });
        }
        std::swap(previous, current);
    }

    return previous[rhs.size()];
}

auto replaceAll(std::string input, std::string_view from, std::string_view to) -> std::string
{
    if (from.empty())
        return input;

    auto pos = std::size_t { 0 };
    while ((pos = input.find(from, pos)) != std::string::npos)
    {
        input.replace(pos, from.size(), to);
        pos += to.size();
    }
    return input;
}

} // namespace voicetutor::text
