// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/Recognizer.hpp>

#include <memory>
#include <span>
#include <string>

namespace voicetutor
{

/// @brief Configuration for the whisper.cpp recognizer.
struct WhisperConfig
{
    std::string modelPath;
    std::string language = "ru";
    int threads = 4;
};

/// @brief On-device streaming speech recognition using whisper.cpp.
///
/// Interim results are produced by re-decoding the growing span audio.
/// Calls are serialized; the whisper context is not reentrant.
class WhisperRecognizer final: public Recognizer
{
  public:
    WhisperRecognizer();
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    /// @brief Loads the whisper model.
    /// @return ModelLoadError if the model cannot be loaded.
    [[nodiscard]] auto initialize(const WhisperConfig& config) -> VoidResult;

    [[nodiscard]] auto source() const -> TranscriptSource override { return TranscriptSource::Native; }
    [[nodiscard]] auto isStreaming() const -> bool override { return true; }
    [[nodiscard]] auto isAvailable() const -> bool override;

    /// @param samples Float32 PCM audio at 16 kHz mono.
    [[nodiscard]] auto transcribe(std::span<const float> samples, unsigned sampleRate, bool isFinal)
        -> Result<TranscriptionResult> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
