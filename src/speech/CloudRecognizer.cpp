// SPDX-License-Identifier: Apache-2.0
#include "CloudRecognizer.hpp"

#include <audio/AudioCodec.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <format>

namespace voicetutor
{

auto parseTranscriptionResponse(std::string_view body) -> Result<TranscriptionResult>
{
    auto parsed = json::parse(body);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (!parsed->is_object())
        return makeError(ErrorCode::ProtocolError, "Transcription response is not an object");

    if (parsed->contains("error"))
        return makeError(ErrorCode::TranscriptionError,
                         std::format("{} {}",
                                     json::getStringOr(*parsed, "error", "Transcription failed"),
                                     json::getStringOr(*parsed, "details", "")));

    auto text = json::getString(*parsed, "text");
    if (!text)
        return std::unexpected(text.error());

    return TranscriptionResult {
        .text = std::string(text::trim(*text)),
        .isFinal = true,
        .confidence = json::getFloatOr(*parsed, "confidence", 1.0f),
        .source = TranscriptSource::Cloud,
    };
}

CloudRecognizer::CloudRecognizer(CloudRecognizerConfig config, HttpClient& http):
    _config(std::move(config)), _http(http)
{
}

auto CloudRecognizer::transcribe(std::span<const float> samples, unsigned sampleRate, bool /*isFinal*/)
    -> Result<TranscriptionResult>
{
    if (_config.url.empty())
        return makeError(ErrorCode::NotFoundError, "No transcription endpoint configured");

    auto wav = encodeWav(samples, sampleRate, 1);
    if (!wav)
        return std::unexpected(wav.error());

    auto request = HttpRequest { .url = _config.url, .timeout = _config.timeout };
    if (!_config.authToken.empty())
        request.headers.push_back(std::format("Authorization: Bearer {}", _config.authToken));

    auto const parts = std::vector<MultipartPart> {
        MultipartPart {
            .name = "audio",
            .data = std::string(wav->begin(), wav->end()),
            .filename = "recording.wav",
            .contentType = "audio/wav",
        },
        MultipartPart { .name = "language", .data = _config.language },
    };

    log::debug("Uploading {} bytes of audio for transcription", wav->size());
    auto response = _http.postMultipart(request, parts);
    if (!response)
        return std::unexpected(response.error());

    if (!response->ok())
    {
        auto error = httpStatusError(*response, "Transcription");
        if (error.code == ErrorCode::NetworkError)
            error.code = ErrorCode::TranscriptionError;
        return std::unexpected(std::move(error));
    }

    return parseTranscriptionResponse(response->body);
}

} // namespace voicetutor
