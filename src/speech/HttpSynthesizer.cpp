// SPDX-License-Identifier: Apache-2.0
#include "HttpSynthesizer.hpp"

#include <audio/AudioCodec.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>

namespace voicetutor
{

HttpSynthesizer::HttpSynthesizer(HttpSynthesizerConfig config, HttpClient& http):
    _config(std::move(config)), _http(http)
{
}

auto HttpSynthesizer::synthesize(std::string_view text) -> Result<AudioClip>
{
    if (_config.url.empty())
        return makeError(ErrorCode::NotFoundError, "No speech synthesis endpoint configured");

    auto const body = nlohmann::json {
        { "text", text },
        { "voice", _config.voice },
        { "speed", _config.speed },
    };

    auto request = HttpRequest { .url = _config.url, .body = body.dump(), .timeout = _config.timeout };
    if (!_config.authToken.empty())
        request.headers.push_back(std::format("Authorization: Bearer {}", _config.authToken));

    auto response = _http.post(request);
    if (!response)
        return std::unexpected(response.error());

    if (!response->ok())
    {
        auto error = httpStatusError(*response, "Speech synthesis");
        if (error.code == ErrorCode::NetworkError)
            error.code = ErrorCode::SynthesisError;
        return std::unexpected(std::move(error));
    }

    if (response->body.empty() || response->contentType.starts_with("application/json"))
        return makeError(ErrorCode::SynthesisError,
                         std::format("Speech synthesis returned no audio ({})", response->contentType));

    auto const* bytes = reinterpret_cast<const std::uint8_t*>(response->body.data());
    auto clip = decodeAudio(std::span { bytes, response->body.size() });
    if (!clip)
        return makeError(ErrorCode::SynthesisError, std::format("Undecodable synthesized audio: {}", clip.error().message));

    log::debug("Synthesized {} ms of speech for {} characters",
               clip->duration().count(),
               text.size());
    return clip;
}

} // namespace voicetutor
