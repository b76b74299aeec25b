// SPDX-License-Identifier: Apache-2.0
#include <speech/CloudRecognizer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

#include "TestDoubles.hpp"

using namespace voicetutor;
using namespace voicetutor::test;

TEST_CASE("parseTranscriptionResponse reads text and confidence", "[cloud]")
{
    auto const result = parseTranscriptionResponse(R"({"text": "  Привет, учитель  ", "language": "ru"})");
    REQUIRE(result.has_value());
    CHECK(result->text == "Привет, учитель");
    CHECK(result->isFinal);
    CHECK(result->confidence == 1.0f);
    CHECK(result->source == TranscriptSource::Cloud);

    auto const withConfidence = parseTranscriptionResponse(R"({"text": "да", "confidence": 0.4})");
    REQUIRE(withConfidence.has_value());
    CHECK(withConfidence->confidence == 0.4f);
}

TEST_CASE("parseTranscriptionResponse reports service errors", "[cloud]")
{
    auto const error = parseTranscriptionResponse(R"({"error": "Bad audio", "details": "too short"})");
    REQUIRE_FALSE(error.has_value());
    CHECK(error.error().code == ErrorCode::TranscriptionError);
    CHECK(error.error().message == "Bad audio too short");

    CHECK(parseTranscriptionResponse(R"({"language": "ru"})").error().code == ErrorCode::ProtocolError);
    CHECK(parseTranscriptionResponse("oops").error().code == ErrorCode::ProtocolError);
}

TEST_CASE("CloudRecognizer uploads the span as WAV", "[cloud]")
{
    auto http = FakeHttpClient {};
    http.queueResponse(200, R"({"text": "Сколько будет пять на шесть?"})");
    auto recognizer = CloudRecognizer {
        CloudRecognizerConfig { .url = "https://stt.example", .authToken = "tok", .language = "ru" },
        http,
    };

    auto const samples = std::vector<float>(16000, 0.1f);
    auto const result = recognizer.transcribe(samples, 16000, true);
    REQUIRE(result.has_value());
    CHECK(result->text == "Сколько будет пять на шесть?");
    CHECK_FALSE(recognizer.isStreaming());

    REQUIRE(http.lastParts.size() == 2);
    auto const& audio = http.lastParts[0];
    CHECK(audio.name == "audio");
    CHECK(audio.filename == "recording.wav");
    CHECK(audio.contentType == "audio/wav");
    CHECK(audio.data.starts_with("RIFF"));
    CHECK(audio.data.size() > 32000);
    CHECK(http.lastParts[1].name == "language");
    CHECK(http.lastParts[1].data == "ru");
    CHECK(std::ranges::find(http.requests[0].headers, "Authorization: Bearer tok") != http.requests[0].headers.end());
}

TEST_CASE("CloudRecognizer maps failures", "[cloud]")
{
    auto http = FakeHttpClient {};
    auto recognizer = CloudRecognizer { CloudRecognizerConfig { .url = "https://stt.example" }, http };
    auto const samples = std::vector<float>(1600, 0.1f);

    SECTION("server error is a transcription error")
    {
        http.queueResponse(502, "bad gateway");
        CHECK(recognizer.transcribe(samples, 16000, true).error().code == ErrorCode::TranscriptionError);
    }

    SECTION("forbidden stays an auth error")
    {
        http.queueResponse(403, "");
        CHECK(recognizer.transcribe(samples, 16000, true).error().code == ErrorCode::AuthError);
    }

    SECTION("no endpoint")
    {
        auto unconfigured = CloudRecognizer { CloudRecognizerConfig {}, http };
        CHECK_FALSE(unconfigured.isAvailable());
        CHECK(unconfigured.transcribe(samples, 16000, true).error().code == ErrorCode::NotFoundError);
    }
}
