// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Thresholds for recognizing re-emitted transcripts.
struct DedupConfig
{
    /// @brief A longer version of the previous text counts as a revision only above this many extra characters.
    std::size_t extensionMinChars = 10;

    /// @brief Edit distance below this share of the longer text is a minor variation.
    float minorVariationRatio = 0.2f;

    /// @brief Length differences at or above this many characters are never minor variations.
    std::size_t maxVariationChars = 100;

    /// @brief Previous finals older than this are not compared against.
    Millis window { 4000 };
};

/// @brief How a new final transcript relates to the previous one.
enum class DedupVerdict : std::uint8_t
{
    New,
    ExactRepeat,
    Extension,
    MinorVariation,
};

[[nodiscard]] constexpr auto dedupVerdictName(DedupVerdict verdict) -> std::string_view
{
    switch (verdict)
    {
        case DedupVerdict::New: return "new";
        case DedupVerdict::ExactRepeat: return "exact repeat";
        case DedupVerdict::Extension: return "extension";
        case DedupVerdict::MinorVariation: return "minor variation";
    }
    return "unknown";
}

/// @brief Compares two transcripts, ignoring case, punctuation and spacing.
[[nodiscard]] auto compareTranscripts(std::string_view previous, std::string_view next, const DedupConfig& config)
    -> DedupVerdict;

/// @brief Remembers the last accepted final and classifies new finals against it.
class TranscriptDeduplicator
{
  public:
    explicit TranscriptDeduplicator(DedupConfig config = {});

    /// @brief Classifies @p text against the last remembered final, if still inside the window.
    [[nodiscard]] auto classify(std::string_view text, TimePoint now) const -> DedupVerdict;

    /// @brief Records @p text as the latest final.
    void remember(std::string text, TimePoint now);

    /// @brief Forgets the remembered final.
    void reset();

    [[nodiscard]] auto lastText() const -> std::optional<std::string_view>;

  private:
    DedupConfig _config;
    std::string _lastText;
    std::optional<TimePoint> _lastAt;
};

} // namespace voicetutor
