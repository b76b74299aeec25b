// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Which recognizer strategy produced a transcript.
enum class TranscriptSource : std::uint8_t
{
    Native,
    Cloud,
};

[[nodiscard]] constexpr auto sourceName(TranscriptSource source) -> std::string_view
{
    switch (source)
    {
        case TranscriptSource::Native: return "native";
        case TranscriptSource::Cloud: return "cloud";
    }
    return "unknown";
}

/// @brief Text recognized from a speech span.
///
/// Interim (non-final) results are advisory only and never drive a turn.
struct TranscriptionResult
{
    std::string text;
    bool isFinal = false;
    float confidence = 0.0f;
    TranscriptSource source = TranscriptSource::Native;
};

/// @brief A speech-to-text strategy.
///
/// Streaming recognizers are asked for interim decodes over the growing span
/// audio and for one final decode when the span ends; batch recognizers only
/// receive the final request. transcribe() blocks and runs on a background task.
class Recognizer
{
  public:
    virtual ~Recognizer() = default;

    [[nodiscard]] virtual auto source() const -> TranscriptSource = 0;

    /// @brief Returns true if the recognizer produces interim results.
    [[nodiscard]] virtual auto isStreaming() const -> bool = 0;

    /// @brief Returns false when the recognizer cannot work at all (no model, no endpoint).
    [[nodiscard]] virtual auto isAvailable() const -> bool = 0;

    /// @brief Transcribes mono float32 samples.
    /// @param samples The span audio so far (interim) or in full (final).
    /// @param sampleRate Sample rate of @p samples in Hz.
    /// @param isFinal True for the decode that closes the span.
    [[nodiscard]] virtual auto transcribe(std::span<const float> samples, unsigned sampleRate, bool isFinal)
        -> Result<TranscriptionResult> = 0;
};

} // namespace voicetutor
