// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/HttpClient.hpp>
#include <speech/Recognizer.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace voicetutor
{

struct CloudRecognizerConfig
{
    /// @brief Transcription endpoint accepting a multipart "audio" upload.
    std::string url;
    std::string authToken;
    std::string language = "ru";
    std::chrono::milliseconds timeout { 8000 };
};

/// @brief Parses the transcription endpoint's JSON reply ({"text": ..., "language": ...}).
[[nodiscard]] auto parseTranscriptionResponse(std::string_view body) -> Result<TranscriptionResult>;

/// @brief Batch recognizer that uploads each finished span as a WAV file.
class CloudRecognizer final: public Recognizer
{
  public:
    CloudRecognizer(CloudRecognizerConfig config, HttpClient& http);

    [[nodiscard]] auto source() const -> TranscriptSource override { return TranscriptSource::Cloud; }
    [[nodiscard]] auto isStreaming() const -> bool override { return false; }
    [[nodiscard]] auto isAvailable() const -> bool override { return !_config.url.empty(); }

    [[nodiscard]] auto transcribe(std::span<const float> samples, unsigned sampleRate, bool isFinal)
        -> Result<TranscriptionResult> override;

  private:
    CloudRecognizerConfig _config;
    HttpClient& _http;
};

} // namespace voicetutor
