// SPDX-License-Identifier: Apache-2.0
#include <voicetutor/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace voicetutor;

namespace
{
    auto writeTempConfig(std::string_view name, std::string_view content) -> std::filesystem::path
    {
        auto const path = std::filesystem::temp_directory_path() / std::string(name);
        auto file = std::ofstream(path);
        file << content;
        return path;
    }
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
    REQUIRE(path.starts_with(defaultConfigDir()));
}

TEST_CASE("defaultWhisperModelPath lies under the data directory", "[config]")
{
    auto const path = defaultWhisperModelPath();
    REQUIRE(path.starts_with(defaultDataDir()));
    REQUIRE(path.ends_with(".bin"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.capture.sampleRate == 16000);
    CHECK(config.capture.frameMs == 100);
    CHECK(config.vad.speechThreshold == 1.5f);
    CHECK(config.vad.interruptionThreshold == 3.0f);
    CHECK(config.vad.silenceDuration == Millis { 1500 });
    CHECK(config.transcription.language == "ru");
    CHECK(config.transcription.preferNative == true);
    CHECK(config.synthesis.backend == SynthesisBackend::Http);
    CHECK(config.synthesis.voiceId == "nova");
    CHECK(config.synthesis.speed == 0.95f);
    CHECK(config.model.maxRetries == 3);
    CHECK(config.echo.wordOverlapThreshold == 0.7f);
    CHECK(config.session.interruptionDebounceMs == 1000);
    CHECK(config.session.rephrasings.size() == 5);
    CHECK(config.logLevel == "info");
    CHECK_FALSE(config.soundDisabled);
    CHECK_FALSE(config.cloudOnly);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("voicetutor_test_config.json", R"({
        "capture": { "deviceName": "USB", "frameMs": 50 },
        "vad": { "speechThreshold": 2.0, "interruptionThreshold": 4.0, "silenceDurationMs": 900 },
        "transcription": {
            "preferNative": false,
            "cloudUrl": "https://stt.example/transcribe",
            "retryCeiling": 2,
            "minorVariationRatio": 0.1
        },
        "synthesis": { "backend": "piper", "piperModelPath": "/tmp/ru.onnx", "convertMath": false },
        "model": { "url": "https://tutor.example/chat", "streaming": true, "maxRetries": 1 },
        "echo": { "cooldownMs": 500 },
        "session": {
            "greeting": "",
            "courseId": "algebra-7",
            "acousticBargeIn": true,
            "rephrasings": ["Объясни:"]
        },
        "logLevel": "debug"
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Capture and VAD")
    {
        CHECK(config.capture.deviceName == "USB");
        CHECK(config.capture.frameMs == 50);
        CHECK(config.capture.sampleRate == 16000);
        CHECK(config.vad.speechThreshold == 2.0f);
        CHECK(config.vad.interruptionThreshold == 4.0f);
        CHECK(config.vad.silenceDuration == Millis { 900 });
        CHECK(config.vad.minSpeechDuration == Millis { 500 });
    }

    SECTION("Transcription")
    {
        CHECK(config.transcription.preferNative == false);
        CHECK(config.transcription.cloudUrl == "https://stt.example/transcribe");
        CHECK(config.transcription.retryCeiling == 2);
        CHECK(config.transcription.minorVariationRatio == 0.1f);
        CHECK(config.transcription.language == "ru");
    }

    SECTION("Synthesis and model")
    {
        CHECK(config.synthesis.backend == SynthesisBackend::Piper);
        CHECK(config.synthesis.piperModelPath == "/tmp/ru.onnx");
        CHECK(config.synthesis.convertMath == false);
        CHECK(config.model.url == "https://tutor.example/chat");
        CHECK(config.model.streaming == true);
        CHECK(config.model.maxRetries == 1);
    }

    SECTION("Echo and session")
    {
        CHECK(config.echo.cooldown == Millis { 500 });
        CHECK(config.session.greeting.empty());
        CHECK(config.session.courseId == "algebra-7");
        CHECK(config.session.acousticBargeIn == true);
        REQUIRE(config.session.rephrasings.size() == 1);
        CHECK(config.session.rephrasings[0] == "Объясни:");
        CHECK(config.logLevel == "debug");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for an empty object", "[config]")
{
    auto const tempPath = writeTempConfig("voicetutor_test_empty.json", "{}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->session.greeting == AppConfig {}.session.greeting);
    CHECK(result->synthesis.backend == SynthesisBackend::Http);
    CHECK(result->transcription.whisperModelPath.empty());

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("voicetutor_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects invalid values", "[config]")
{
    SECTION("Unknown synthesis backend")
    {
        auto const tempPath = writeTempConfig("voicetutor_test_backend.json", R"({"synthesis": {"backend": "sapi"}})");
        auto result = loadConfigFromFile(tempPath.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        std::filesystem::remove(tempPath);
    }

    SECTION("Unknown log level")
    {
        auto const tempPath = writeTempConfig("voicetutor_test_level.json", R"({"logLevel": "chatty"})");
        auto result = loadConfigFromFile(tempPath.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        std::filesystem::remove(tempPath);
    }

    SECTION("Interruption threshold below speech threshold")
    {
        auto const tempPath = writeTempConfig("voicetutor_test_vad.json",
                                              R"({"vad": {"speechThreshold": 3.0, "interruptionThreshold": 2.0}})");
        auto result = loadConfigFromFile(tempPath.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        std::filesystem::remove(tempPath);
    }
}

TEST_CASE("saveConfigToFile writes a valid config that can be loaded back", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "voicetutor_test_save";
    auto const tempPath = tempDir / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = AppConfig {};
    config.capture.deviceName = "Headset";
    config.vad.preRollFrames = 5;
    config.transcription.cloudUrl = "https://stt.example";
    config.transcription.dedupWindowMs = 2500;
    config.synthesis.backend = SynthesisBackend::Piper;
    config.synthesis.espeakDataPath = "/opt/espeak-ng-data";
    config.model.url = "https://tutor.example";
    config.model.emptyRetryBaseMs = 250;
    config.echo.profileLimit = 4;
    config.session.authToken = "secret";
    config.session.networkFallback = "Нет связи.";
    config.logLevel = "trace";

    auto saveResult = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saveResult.has_value());

    auto loadResult = loadConfigFromFile(tempPath.string());
    REQUIRE(loadResult.has_value());

    auto const& loaded = *loadResult;
    CHECK(loaded.capture.deviceName == "Headset");
    CHECK(loaded.vad.preRollFrames == 5);
    CHECK(loaded.transcription.cloudUrl == "https://stt.example");
    CHECK(loaded.transcription.dedupWindowMs == 2500);
    CHECK(loaded.synthesis.backend == SynthesisBackend::Piper);
    CHECK(loaded.synthesis.espeakDataPath == "/opt/espeak-ng-data");
    CHECK(loaded.model.url == "https://tutor.example");
    CHECK(loaded.model.emptyRetryBaseMs == 250);
    CHECK(loaded.echo.profileLimit == 4);
    CHECK(loaded.session.authToken == "secret");
    CHECK(loaded.session.networkFallback == "Нет связи.");
    CHECK(loaded.session.rephrasings == config.session.rephrasings);
    CHECK(loaded.logLevel == "trace");

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("toEngineConfig carries the sections into the engine tunables", "[config]")
{
    auto config = AppConfig {};
    config.transcription.interimPromotionMs = 0;
    config.transcription.extensionMinChars = 6;
    config.model.retryBackoffMs = 200;
    config.synthesis.retries = 1;
    config.session.interruptionDebounceMs = 700;
    config.session.greeting = "Здравствуй!";

    auto const engine = toEngineConfig(config);
    CHECK(engine.turn.transcription.preferNative == true);
    CHECK(engine.turn.transcription.interimPromotion == Millis { 0 });
    CHECK(engine.turn.transcription.dedup.extensionMinChars == 6);
    CHECK(engine.turn.response.retryBackoff == Millis { 200 });
    CHECK(engine.turn.response.maxRetries == 3);
    CHECK(engine.turn.session.synthesisRetries == 1);
    CHECK(engine.turn.session.interruptionDebounce == Millis { 700 });
    CHECK(engine.turn.session.greeting == "Здравствуй!");

    SECTION("cloud-only disables the on-device strategy")
    {
        config.cloudOnly = true;
        CHECK(toEngineConfig(config).turn.transcription.preferNative == false);
    }
}
