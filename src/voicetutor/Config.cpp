// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace voicetutor
{

namespace
{

    constexpr auto DefaultWhisperModelFilename = std::string_view { "ggml-small.bin" };

    auto backendName(SynthesisBackend backend) -> std::string_view
    {
        return backend == SynthesisBackend::Piper ? "piper" : "http";
    }

    auto toMillis(int value) -> Millis
    {
        return Millis { value };
    }

    auto validate(const AppConfig& config) -> VoidResult
    {
        if (config.capture.sampleRate == 0)
            return makeError(ErrorCode::ConfigError, "capture.sampleRate must be positive");
        if (config.capture.frameMs <= 0)
            return makeError(ErrorCode::ConfigError, "capture.frameMs must be positive");
        if (config.vad.speechThreshold <= 0.0f || config.vad.interruptionThreshold < config.vad.speechThreshold)
            return makeError(ErrorCode::ConfigError,
                             "vad.interruptionThreshold must be at least vad.speechThreshold, which must be positive");
        if (config.echo.wordOverlapThreshold <= 0.0f || config.echo.wordOverlapThreshold > 1.0f)
            return makeError(ErrorCode::ConfigError, "echo.wordOverlapThreshold must be within (0, 1]");
        if (config.transcription.minorVariationRatio < 0.0f || config.transcription.minorVariationRatio >= 1.0f)
            return makeError(ErrorCode::ConfigError, "transcription.minorVariationRatio must be within [0, 1)");
        if (!log::levelFromString(config.logLevel))
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.logLevel));
        return {};
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voicetutor";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voicetutor";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/voicetutor";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voicetutor";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voicetutor";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voicetutor";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/voicetutor";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/voicetutor";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultWhisperModelPath() -> std::string
{
    return defaultDataDir() + "/models/" + std::string(DefaultWhisperModelFilename);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top level must be an object", path));

    auto config = AppConfig {};

    // Capture section
    auto const capture = json::getObjectOr(root, "capture");
    config.capture.deviceName = json::getStringOr(capture, "deviceName", "");
    config.capture.sampleRate = static_cast<unsigned>(json::getIntOr(capture, "sampleRate", 16000));
    config.capture.frameMs = json::getIntOr(capture, "frameMs", 100);

    // VAD section
    auto const vad = json::getObjectOr(root, "vad");
    config.vad.speechThreshold = json::getFloatOr(vad, "speechThreshold", 1.5f);
    config.vad.interruptionThreshold = json::getFloatOr(vad, "interruptionThreshold", 3.0f);
    config.vad.interruptionConfirmFrames = json::getIntOr(vad, "interruptionConfirmFrames", 3);
    config.vad.smoothingWindow = json::getIntOr(vad, "smoothingWindow", 10);
    config.vad.silenceDuration = json::getMillisOr(vad, "silenceDurationMs", Millis { 1500 });
    config.vad.minSpeechDuration = json::getMillisOr(vad, "minSpeechDurationMs", Millis { 500 });
    config.vad.minAudioSize = static_cast<std::size_t>(json::getIntOr(vad, "minAudioSize", 5000));
    config.vad.preRollFrames = json::getIntOr(vad, "preRollFrames", 3);
    config.vad.maxSpanDuration = json::getMillisOr(vad, "maxSpanMs", Millis { 30000 });

    // Transcription section
    auto const transcription = json::getObjectOr(root, "transcription");
    auto& t = config.transcription;
    t.preferNative = json::getBoolOr(transcription, "preferNative", true);
    t.whisperModelPath = json::getStringOr(transcription, "whisperModelPath", "");
    t.language = json::getStringOr(transcription, "language", "ru");
    t.threads = json::getIntOr(transcription, "threads", 4);
    t.cloudUrl = json::getStringOr(transcription, "cloudUrl", "");
    t.retryCeiling = json::getIntOr(transcription, "retryCeiling", 3);
    t.interimIntervalMs = json::getIntOr(transcription, "interimIntervalMs", 1000);
    t.interimPromotionMs = json::getIntOr(transcription, "interimPromotionMs", 1500);
    t.extensionMinChars = json::getIntOr(transcription, "extensionMinChars", 10);
    t.minorVariationRatio = json::getFloatOr(transcription, "minorVariationRatio", 0.2f);
    t.dedupWindowMs = json::getIntOr(transcription, "dedupWindowMs", 4000);
    t.timeoutMs = json::getIntOr(transcription, "timeoutMs", 8000);

    // Synthesis section
    auto const synthesis = json::getObjectOr(root, "synthesis");
    auto& s = config.synthesis;
    auto const backend = json::getStringOr(synthesis, "backend", "http");
    if (backend == "piper")
        s.backend = SynthesisBackend::Piper;
    else if (backend == "http")
        s.backend = SynthesisBackend::Http;
    else
        return makeError(ErrorCode::ConfigError, std::format("Unknown synthesis backend '{}'", backend));
    s.url = json::getStringOr(synthesis, "url", "");
    s.voiceId = json::getStringOr(synthesis, "voiceId", "nova");
    s.speed = json::getFloatOr(synthesis, "speed", 0.95f);
    s.retries = json::getIntOr(synthesis, "retries", 2);
    s.piperModelPath = json::getStringOr(synthesis, "piperModelPath", "");
    s.espeakDataPath = json::getStringOr(synthesis, "espeakDataPath", "");
    s.convertMath = json::getBoolOr(synthesis, "convertMath", true);

    // Model section
    auto const model = json::getObjectOr(root, "model");
    config.model.url = json::getStringOr(model, "url", "");
    config.model.streaming = json::getBoolOr(model, "streaming", false);
    config.model.timeoutMs = json::getIntOr(model, "timeoutMs", 30000);
    config.model.maxRetries = json::getIntOr(model, "maxRetries", 3);
    config.model.retryBackoffMs = json::getIntOr(model, "retryBackoffMs", 1000);
    config.model.emptyRetryBaseMs = json::getIntOr(model, "emptyRetryBaseMs", 500);

    // Echo section
    auto const echo = json::getObjectOr(root, "echo");
    config.echo.wordOverlapThreshold = json::getFloatOr(echo, "wordOverlapThreshold", 0.7f);
    config.echo.minWordLength = static_cast<std::size_t>(json::getIntOr(echo, "minWordLength", 3));
    config.echo.audioCorrelationThreshold = json::getFloatOr(echo, "audioCorrelationThreshold", 0.7f);
    config.echo.cooldown = json::getMillisOr(echo, "cooldownMs", Millis { 1000 });
    config.echo.profileLimit = static_cast<std::size_t>(json::getIntOr(echo, "profileLimit", 10));
    config.echo.profileMaxAge = json::getMillisOr(echo, "profileMaxAgeMs", Millis { 30000 });

    // Session section
    auto const session = json::getObjectOr(root, "session");
    auto const defaults = SessionSettings {};
    auto& e = config.session;
    e.greeting = json::getStringOr(session, "greeting", defaults.greeting);
    e.authToken = json::getStringOr(session, "authToken", "");
    e.courseId = json::getStringOr(session, "courseId", "");
    e.interruptionDebounceMs = json::getIntOr(session, "interruptionDebounceMs", 1000);
    e.acousticBargeIn = json::getBoolOr(session, "acousticBargeIn", false);
    e.rephrasings = json::getStringArrayOr(session, "rephrasings", defaults.rephrasings);
    e.defaultRephrasing = json::getStringOr(session, "defaultRephrasing", defaults.defaultRephrasing);
    e.emptyFallback = json::getStringOr(session, "emptyFallback", defaults.emptyFallback);
    e.networkFallback = json::getStringOr(session, "networkFallback", defaults.networkFallback);
    e.bridgingTemplate = json::getStringOr(session, "bridgingTemplate", defaults.bridgingTemplate);

    config.logLevel = json::getStringOr(root, "logLevel", "info");

    if (auto valid = validate(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto capture = nlohmann::json::object();
    if (!config.capture.deviceName.empty())
        capture["deviceName"] = config.capture.deviceName;
    capture["sampleRate"] = config.capture.sampleRate;
    capture["frameMs"] = config.capture.frameMs;
    root["capture"] = std::move(capture);

    auto vad = nlohmann::json::object();
    vad["speechThreshold"] = config.vad.speechThreshold;
    vad["interruptionThreshold"] = config.vad.interruptionThreshold;
    vad["interruptionConfirmFrames"] = config.vad.interruptionConfirmFrames;
    vad["smoothingWindow"] = config.vad.smoothingWindow;
    vad["silenceDurationMs"] = config.vad.silenceDuration.count();
    vad["minSpeechDurationMs"] = config.vad.minSpeechDuration.count();
    vad["minAudioSize"] = config.vad.minAudioSize;
    vad["preRollFrames"] = config.vad.preRollFrames;
    vad["maxSpanMs"] = config.vad.maxSpanDuration.count();
    root["vad"] = std::move(vad);

    auto const& t = config.transcription;
    auto transcription = nlohmann::json::object();
    transcription["preferNative"] = t.preferNative;
    if (!t.whisperModelPath.empty())
        transcription["whisperModelPath"] = t.whisperModelPath;
    transcription["language"] = t.language;
    transcription["threads"] = t.threads;
    if (!t.cloudUrl.empty())
        transcription["cloudUrl"] = t.cloudUrl;
    transcription["retryCeiling"] = t.retryCeiling;
    transcription["interimIntervalMs"] = t.interimIntervalMs;
    transcription["interimPromotionMs"] = t.interimPromotionMs;
    transcription["extensionMinChars"] = t.extensionMinChars;
    transcription["minorVariationRatio"] = t.minorVariationRatio;
    transcription["dedupWindowMs"] = t.dedupWindowMs;
    transcription["timeoutMs"] = t.timeoutMs;
    root["transcription"] = std::move(transcription);

    auto const& s = config.synthesis;
    auto synthesis = nlohmann::json::object();
    synthesis["backend"] = backendName(s.backend);
    if (!s.url.empty())
        synthesis["url"] = s.url;
    synthesis["voiceId"] = s.voiceId;
    synthesis["speed"] = s.speed;
    synthesis["retries"] = s.retries;
    if (!s.piperModelPath.empty())
        synthesis["piperModelPath"] = s.piperModelPath;
    if (!s.espeakDataPath.empty())
        synthesis["espeakDataPath"] = s.espeakDataPath;
    synthesis["convertMath"] = s.convertMath;
    root["synthesis"] = std::move(synthesis);

    auto model = nlohmann::json::object();
    if (!config.model.url.empty())
        model["url"] = config.model.url;
    model["streaming"] = config.model.streaming;
    model["timeoutMs"] = config.model.timeoutMs;
    model["maxRetries"] = config.model.maxRetries;
    model["retryBackoffMs"] = config.model.retryBackoffMs;
    model["emptyRetryBaseMs"] = config.model.emptyRetryBaseMs;
    root["model"] = std::move(model);

    auto echo = nlohmann::json::object();
    echo["wordOverlapThreshold"] = config.echo.wordOverlapThreshold;
    echo["minWordLength"] = config.echo.minWordLength;
    echo["audioCorrelationThreshold"] = config.echo.audioCorrelationThreshold;
    echo["cooldownMs"] = config.echo.cooldown.count();
    echo["profileLimit"] = config.echo.profileLimit;
    echo["profileMaxAgeMs"] = config.echo.profileMaxAge.count();
    root["echo"] = std::move(echo);

    auto const& e = config.session;
    auto session = nlohmann::json::object();
    session["greeting"] = e.greeting;
    if (!e.authToken.empty())
        session["authToken"] = e.authToken;
    if (!e.courseId.empty())
        session["courseId"] = e.courseId;
    session["interruptionDebounceMs"] = e.interruptionDebounceMs;
    session["acousticBargeIn"] = e.acousticBargeIn;
    session["rephrasings"] = e.rephrasings;
    session["defaultRephrasing"] = e.defaultRephrasing;
    session["emptyFallback"] = e.emptyFallback;
    session["networkFallback"] = e.networkFallback;
    session["bridgingTemplate"] = e.bridgingTemplate;
    root["session"] = std::move(session);

    root["logLevel"] = config.logLevel;

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toEngineConfig(const AppConfig& config) -> VoiceEngineConfig
{
    auto engine = VoiceEngineConfig {};
    auto& turn = engine.turn;

    turn.vad = config.vad;
    turn.echo = config.echo;

    auto const& t = config.transcription;
    turn.transcription = TranscriptionConfig {
        .preferNative = t.preferNative && !config.cloudOnly,
        .retryCeiling = t.retryCeiling,
        .interimInterval = toMillis(t.interimIntervalMs),
        .interimPromotion = toMillis(t.interimPromotionMs),
        .dedup =
            DedupConfig {
                .extensionMinChars = static_cast<std::size_t>(t.extensionMinChars),
                .minorVariationRatio = t.minorVariationRatio,
                .window = toMillis(t.dedupWindowMs),
            },
    };

    auto const& e = config.session;
    turn.response = ResponsePolicy {
        .maxRetries = config.model.maxRetries,
        .retryBackoff = toMillis(config.model.retryBackoffMs),
        .emptyRetryBase = toMillis(config.model.emptyRetryBaseMs),
        .rephrasings = e.rephrasings,
        .defaultRephrasing = e.defaultRephrasing,
        .emptyFallback = e.emptyFallback,
        .networkFallback = e.networkFallback,
    };

    turn.session = SessionConfig {
        .greeting = e.greeting,
        .interruptionDebounce = toMillis(e.interruptionDebounceMs),
        .acousticBargeIn = e.acousticBargeIn,
        .synthesisRetries = config.synthesis.retries,
        .convertMath = config.synthesis.convertMath,
        .bridgingTemplate = e.bridgingTemplate,
    };

    return engine;
}

} // namespace voicetutor
