// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace voicetutor::text
{

/// @brief Decodes UTF-8 into code points. Malformed sequences decode to U+FFFD.
[[nodiscard]] auto decodeUtf8(std::string_view input) -> std::u32string;

/// @brief Encodes code points as UTF-8.
[[nodiscard]] auto encodeUtf8(std::u32string_view input) -> std::string;

/// @brief Lowercases Latin and Cyrillic letters, leaving everything else untouched.
[[nodiscard]] auto toLower(std::string_view input) -> std::string;

/// @brief Strips leading and trailing ASCII whitespace.
[[nodiscard]] auto trim(std::string_view input) -> std::string_view;

/// @brief Returns true for ASCII and common typographic punctuation (quotes, dashes, ellipsis).
[[nodiscard]] auto isPunctuation(char32_t cp) -> bool;

/// @brief Returns true for Latin or Cyrillic letters.
[[nodiscard]] auto isLetter(char32_t cp) -> bool;

/// @brief Lowercases, replaces punctuation with spaces and collapses whitespace runs.
///
/// The result is the canonical form used for all transcript comparisons.
[[nodiscard]] auto normalize(std::string_view input) -> std::string;

/// @brief Splits whitespace-separated words.
[[nodiscard]] auto words(std::string_view input) -> std::vector<std::string>;

/// @brief Counts user-perceived characters (extended grapheme clusters).
[[nodiscard]] auto graphemeCount(std::string_view input) -> std::size_t;

/// @brief Counts code points.
[[nodiscard]] auto codepointCount(std::string_view input) -> std::size_t;

/// @brief Levenshtein distance over code points.
[[nodiscard]] auto editDistance(std::string_view a, std::string_view b) -> std::size_t;

/// @brief Replaces every occurrence of @p from in @p input with @p to.
[[nodiscard]] auto replaceAll(std::string input, std::string_view from, std::string_view to) -> std::string;

} // namespace voicetutor::text
