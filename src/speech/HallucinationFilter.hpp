// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Shortest accepted transcript, in user-perceived characters.
constexpr auto MinTranscriptLength = std::size_t { 2 };

/// @brief Longest accepted transcript, in user-perceived characters.
constexpr auto MaxTranscriptLength = std::size_t { 200 };

/// @brief Most sentence-like fragments a single utterance may contain.
constexpr auto MaxTranscriptFragments = std::size_t { 4 };

/// @brief Rejects final transcripts that a recognizer produced from silence or noise.
///
/// Rejected are the closing remarks cloud ASR invents on silence ("продолжение следует",
/// "субтитры", ...), punctuation-only strings, strings outside the length bounds,
/// run-on strings with too many sentence fragments, and filler sounds.
///
/// @return The trimmed text, or std::nullopt when the text must be ignored.
[[nodiscard]] auto filterHallucination(std::string_view text) -> std::optional<std::string>;

/// @brief Returns true if the text matches one of the known hallucination phrases.
[[nodiscard]] auto matchesHallucinationPattern(std::string_view text) -> bool;

/// @brief Returns true for filler sounds and one- or two-letter fragments.
[[nodiscard]] auto isMeaninglessSound(std::string_view text) -> bool;

} // namespace voicetutor
