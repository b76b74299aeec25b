// SPDX-License-Identifier: Apache-2.0
#include "SentenceSplitter.hpp"

#include <core/TextUtils.hpp>

namespace voicetutor
{

namespace
{

    constexpr auto Ellipsis = std::string_view { "…" };

    /// @brief Returns the index one past the first sentence boundary, or npos.
    auto findBoundary(std::string_view text) -> std::size_t
    {
        for (auto i = std::size_t { 0 }; i < text.size(); ++i)
        {
            auto const ch = text[i];
            if (ch == '\n')
                return i + 1;

            if ((ch == '.' || ch == '!' || ch == '?') && i + 1 < text.size() && text[i + 1] == ' ')
                return i + 1;

            if (text.substr(i).starts_with(Ellipsis) && i + Ellipsis.size() < text.size()
                && text[i + Ellipsis.size()] == ' ')
                return i + Ellipsis.size();
        }
        return std::string_view::npos;
    }

} // namespace

auto SentenceSplitter::feed(std::string_view text) -> std::vector<std::string>
{
    _buffer += text;

    auto sentences = std::vector<std::string> {};
    for (auto end = findBoundary(_buffer); end != std::string_view::npos; end = findBoundary(_buffer))
    {
        auto const sentence = text::trim(std::string_view { _buffer }.substr(0, end));
        if (!sentence.empty())
            sentences.emplace_back(sentence);
        _buffer.erase(0, end);
    }
    return sentences;
}

auto SentenceSplitter::finish() -> std::vector<std::string>
{
    auto sentences = std::vector<std::string> {};
    if (auto const rest = text::trim(_buffer); !rest.empty())
        sentences.emplace_back(rest);
    _buffer.clear();
    return sentences;
}

} // namespace voicetutor
