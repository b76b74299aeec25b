// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Clock.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Echo detection tunables.
struct EchoConfig
{
    /// @brief Share of the candidate's significant words found in the played text that marks an echo.
    float wordOverlapThreshold = 0.7f;

    /// @brief Words shorter than this (in characters) are ignored by the overlap check.
    std::size_t minWordLength = 3;

    /// @brief Loudness correlation with a played segment that marks an acoustic echo.
    float audioCorrelationThreshold = 0.7f;

    /// @brief How long after playback ends candidates are still checked.
    Millis cooldown { 1000 };

    std::size_t profileLimit = 10;
    Millis profileMaxAge { 30000 };

    /// @brief Finals up to this many characters contained in the last assistant turn count as echo.
    std::size_t shortEchoMaxChars = 15;
};

enum class EchoReason : std::uint8_t
{
    None,
    Substring,
    WordOverlap,
    Acoustic,
    ShortRepeat,
};

[[nodiscard]] constexpr auto echoReasonName(EchoReason reason) -> std::string_view
{
    switch (reason)
    {
        case EchoReason::None: return "none";
        case EchoReason::Substring: return "substring";
        case EchoReason::WordOverlap: return "word overlap";
        case EchoReason::Acoustic: return "acoustic";
        case EchoReason::ShortRepeat: return "short repeat";
    }
    return "unknown";
}

struct EchoVerdict
{
    bool isEcho = false;

    /// @brief Strength of the strongest signal in [0, 1], echo or not.
    float confidence = 0.0f;
    EchoReason reason = EchoReason::None;
};

/// @brief What was played for one TTS segment, kept for comparison with later candidates.
struct EchoProfile
{
    std::uint64_t segmentId = 0;
    std::string normalizedText;
    LoudnessEnvelope envelope;
    TimePoint startedAt {};
    std::optional<TimePoint> endedAt;
};

/// @brief Text-only echo check of @p candidate against @p played.
///
/// Echo if the normalized candidate is a substring of the normalized played
/// text, or if enough of its significant words occur in it.
[[nodiscard]] auto compareWithPlayedText(std::string_view candidate, std::string_view played, const EchoConfig& config)
    -> EchoVerdict;

/// @brief Best loudness correlation between @p candidate and @p played, allowing a short acoustic delay.
/// @return The correlation, or std::nullopt if the two barely overlap in time.
[[nodiscard]] auto envelopeCorrelation(const LoudnessEnvelope& candidate, const LoudnessEnvelope& played)
    -> std::optional<float>;

/// @brief Decides whether recognized speech is the assistant's own voice.
///
/// Lives on the conversation thread. The playback queue reports segment
/// start and end; a candidate is compared against the segments that were
/// audible while it was spoken, or had ended less than @c cooldown before.
class EchoGuard
{
  public:
    EchoGuard(EchoConfig config, const Clock& clock);

    /// @brief Records a segment that starts playing now.
    /// @param envelope Loudness of the synthesized audio, starting at the playback start.
    void segmentStarted(std::uint64_t segmentId, std::string_view text, LoudnessEnvelope envelope);

    /// @brief Records the end (finished or aborted) of a playing segment.
    void segmentEnded(std::uint64_t segmentId);

    /// @brief Remembers the full text of the last assistant turn for the short-repeat check.
    void setLastAssistantTurn(std::string_view text);

    /// @brief True if speech at @p spokenAt may have picked up assistant audio: a segment
    ///        was playing then, or had ended less than @c cooldown before.
    [[nodiscard]] auto inWindow(TimePoint spokenAt) const -> bool;

    /// @brief Full check of a recognized candidate: text first, then audio when given.
    /// @param spokenAt When the candidate speech ended.
    [[nodiscard]] auto classify(std::string_view candidateText,
                                const LoudnessEnvelope* candidateAudio,
                                TimePoint spokenAt) const -> EchoVerdict;

    /// @brief Audio-only check, used before a guarded span is transcribed.
    [[nodiscard]] auto classifyAudio(const LoudnessEnvelope& candidateAudio) const -> EchoVerdict;

    /// @brief Forgets every profile.
    void clear();

    [[nodiscard]] auto profileCount() const -> std::size_t { return _profiles.size(); }
    [[nodiscard]] auto config() const -> const EchoConfig& { return _config; }

  private:
    [[nodiscard]] auto isRelevant(const EchoProfile& profile, TimePoint spokenAt) const -> bool;
    [[nodiscard]] auto playedText(TimePoint spokenAt) const -> std::string;
    void prune(TimePoint now);

    EchoConfig _config;
    const Clock& _clock;
    std::deque<EchoProfile> _profiles;
    std::string _lastAssistantTurn;
};

} // namespace voicetutor
