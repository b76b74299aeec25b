// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Error.hpp>
#include <engine/EchoGuard.hpp>
#include <engine/TurnController.hpp>
#include <engine/VoiceEngine.hpp>
#include <llm/ResponseRequester.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voicetutor
{

/// @brief Speech synthesis backend.
enum class SynthesisBackend : std::uint8_t
{
    Http,
    Piper,
};

/// @brief Transcription configuration section.
struct TranscriptionSettings
{
    bool preferNative = true;

    /// @brief whisper.cpp model; empty uses the default model if it has been installed.
    std::string whisperModelPath;
    std::string language = "ru";
    int threads = 4;

    /// @brief Cloud transcription endpoint; empty disables the cloud recognizer.
    std::string cloudUrl;

    int retryCeiling = 3;
    int interimIntervalMs = 1000;
    int interimPromotionMs = 1500;
    int extensionMinChars = 10;
    float minorVariationRatio = 0.2f;
    int dedupWindowMs = 4000;
    int timeoutMs = 8000;
};

/// @brief Speech synthesis configuration section.
struct SynthesisSettings
{
    SynthesisBackend backend = SynthesisBackend::Http;
    std::string url;
    std::string voiceId = "nova";
    float speed = 0.95f;
    int retries = 2;
    std::string piperModelPath;
    std::string espeakDataPath;
    bool convertMath = true;
};

/// @brief Conversational-response service configuration section.
struct ModelSettings
{
    std::string url;
    bool streaming = false;
    int timeoutMs = 30000;
    int maxRetries = 3;
    int retryBackoffMs = 1000;
    int emptyRetryBaseMs = 500;
};

/// @brief Session configuration section.
struct SessionSettings
{
    std::string greeting = SessionConfig {}.greeting;
    std::string authToken;
    std::string courseId;
    int interruptionDebounceMs = 1000;
    bool acousticBargeIn = false;
    std::vector<std::string> rephrasings = ResponsePolicy {}.rephrasings;
    std::string defaultRephrasing = ResponsePolicy {}.defaultRephrasing;
    std::string emptyFallback = ResponsePolicy {}.emptyFallback;
    std::string networkFallback = ResponsePolicy {}.networkFallback;
    std::string bridgingTemplate = SessionConfig {}.bridgingTemplate;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    CaptureConfig capture;
    VadConfig vad;
    TranscriptionSettings transcription;
    SynthesisSettings synthesis;
    ModelSettings model;
    EchoConfig echo;
    SessionSettings session;
    std::string logLevel = "info";

    /// @brief Start with sound disabled (set via --no-sound).
    bool soundDisabled = false;

    /// @brief Never use the on-device recognizer (set via --cloud-only).
    bool cloudOnly = false;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing default file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @return ConfigError if the file is missing or holds invalid values.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/voicetutor or ~/.local/share/voicetutor
/// On macOS: ~/Library/Application Support/voicetutor
/// On Windows: %APPDATA%\voicetutor
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default whisper model file path (a multilingual model, for Russian speech).
[[nodiscard]] auto defaultWhisperModelPath() -> std::string;

/// @brief Builds the engine tunables from the configuration.
[[nodiscard]] auto toEngineConfig(const AppConfig& config) -> VoiceEngineConfig;

} // namespace voicetutor
