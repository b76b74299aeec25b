// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <net/HttpClient.hpp>
#include <speech/Synthesizer.hpp>

#include <chrono>
#include <string>

namespace voicetutor
{

struct HttpSynthesizerConfig
{
    /// @brief Endpoint taking {"text", "voice", "speed"} and answering with an encoded audio file.
    std::string url;
    std::string authToken;
    std::string voice = "nova";
    float speed = 0.95f;
    std::chrono::milliseconds timeout { 15000 };
};

/// @brief Cloud text-to-speech over HTTP.
class HttpSynthesizer final: public Synthesizer
{
  public:
    HttpSynthesizer(HttpSynthesizerConfig config, HttpClient& http);

    [[nodiscard]] auto name() const -> std::string_view override { return "cloud"; }
    [[nodiscard]] auto isAvailable() const -> bool override { return !_config.url.empty(); }
    [[nodiscard]] auto synthesize(std::string_view text) -> Result<AudioClip> override;

  private:
    HttpSynthesizerConfig _config;
    HttpClient& _http;
};

} // namespace voicetutor
