// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Spells out an integer in Russian words.
///
/// Values below one million are read as numbers ("двадцать одна тысяча пять"),
/// larger ones digit by digit. Negative values get a "минус" prefix.
[[nodiscard]] auto numberToWords(long long value) -> std::string;

/// @brief Spells a decimal like "3.14" or "2,5" as "три целых один четыре".
[[nodiscard]] auto decimalToWords(std::string_view digits) -> std::string;

/// @brief Rewrites tutor text so a speech synthesizer can read it aloud.
///
/// LaTeX markup is unwrapped, math symbols and numbers become Russian words,
/// emoji, brackets and markup characters are removed and whitespace is collapsed.
[[nodiscard]] auto prepareForSpeech(std::string_view text) -> std::string;

} // namespace voicetutor
