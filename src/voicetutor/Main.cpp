// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioCapture.hpp>
#include <audio/AudioPlayback.hpp>
#include <core/Log.hpp>
#include <engine/VoiceEngine.hpp>
#include <llm/HttpResponseClient.hpp>
#include <net/HttpClient.hpp>
#include <speech/CloudRecognizer.hpp>
#include <speech/HttpSynthesizer.hpp>
#include <speech/PiperSynthesizer.hpp>
#include <speech/WhisperRecognizer.hpp>
#include <voicetutor/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>

namespace
{
    volatile std::sig_atomic_t gInterrupted = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void interruptHandler(int /*sig*/)
    {
        gInterrupted = 1;
    }

    // No SA_RESTART: a pending read on stdin returns so the command loop can exit.
    void installInterruptHandlers()
    {
        struct sigaction sa {};
        sa.sa_handler = interruptHandler;
        sa.sa_flags = 0;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    }

    void printHelp()
    {
        std::println("Commands: mic on|off, sound on|off, reset, quit");
    }
} // namespace

int main(int argc, char** argv)
{
    using namespace voicetutor;

    auto app = CLI::App { "voicetutor: spoken Russian tutoring conversations" };

    auto configPath = std::string {};
    auto deviceName = std::string {};
    auto whisperModel = std::string {};
    auto logLevel = std::string {};
    auto cloudOnly = false;
    auto noSound = false;
    auto verbose = false;
    auto writeConfig = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-d,--device", deviceName, "Capture device (substring of its name)");
    app.add_option("--whisper-model", whisperModel, "Path to a whisper.cpp GGML model");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_option("--write-config", writeConfig, "Write the effective configuration to a file and exit");
    app.add_flag("--cloud-only", cloudOnly, "Never use on-device transcription");
    app.add_flag("--no-sound", noSound, "Start with spoken replies disabled");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!deviceName.empty())
        config.capture.deviceName = deviceName;
    if (!whisperModel.empty())
        config.transcription.whisperModelPath = whisperModel;
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (verbose)
        config.logLevel = "debug";
    config.cloudOnly = cloudOnly;
    config.soundDisabled = noSound;

    if (auto const level = log::levelFromString(config.logLevel))
        log::setLevel(*level);
    else
    {
        log::error("Unknown log level '{}'", config.logLevel);
        return 1;
    }

    if (!writeConfig.empty())
    {
        if (auto saved = saveConfigToFile(writeConfig, config); !saved)
        {
            log::error("Failed to write config: {}", saved.error());
            return 1;
        }
        std::println("Configuration written to {}", writeConfig);
        return 0;
    }

    if (config.model.url.empty())
    {
        log::error("No response service configured (model.url)");
        return 1;
    }

    // Transfers of the response service are aborted on barge-in; speech services keep their own client.
    auto speechHttp = CurlHttpClient {};
    auto modelHttp = CurlHttpClient {};

    auto responder = HttpResponseClient(
        HttpResponseClientConfig {
            .url = config.model.url,
            .authToken = config.session.authToken,
            .courseId = config.session.courseId,
            .streaming = config.model.streaming,
            .timeout = std::chrono::milliseconds(config.model.timeoutMs),
        },
        modelHttp);

    auto whisper = WhisperRecognizer {};
    auto* nativeRecognizer = static_cast<Recognizer*>(nullptr);
    if (!config.cloudOnly && config.transcription.preferNative)
    {
        auto modelPath = config.transcription.whisperModelPath.empty() ? defaultWhisperModelPath()
                                                                        : config.transcription.whisperModelPath;
        if (!std::filesystem::exists(modelPath))
            log::warning("Whisper model not found at {}, on-device transcription disabled", modelPath);
        else if (auto loaded = whisper.initialize(WhisperConfig {
                     .modelPath = modelPath,
                     .language = config.transcription.language,
                     .threads = config.transcription.threads,
                 });
                 !loaded)
            log::warning("On-device transcription unavailable: {}", loaded.error());
        else
            nativeRecognizer = &whisper;
    }

    auto cloud = CloudRecognizer(
        CloudRecognizerConfig {
            .url = config.transcription.cloudUrl,
            .authToken = config.session.authToken,
            .language = config.transcription.language,
            .timeout = std::chrono::milliseconds(config.transcription.timeoutMs),
        },
        speechHttp);

    if (!nativeRecognizer && !cloud.isAvailable())
    {
        log::error("No speech recognizer available: configure transcription.cloudUrl or a whisper model");
        return 1;
    }

    auto synthesizer = std::unique_ptr<Synthesizer> {};
    if (config.synthesis.backend == SynthesisBackend::Piper)
    {
        auto piper = std::make_unique<PiperSynthesizer>();
        if (auto loaded = piper->initialize(PiperConfig {
                .modelPath = config.synthesis.piperModelPath,
                .espeakDataPath = config.synthesis.espeakDataPath,
                .speed = config.synthesis.speed,
            });
            !loaded)
            log::warning("Speech synthesis unavailable, replies are text only: {}", loaded.error());
        else
            synthesizer = std::move(piper);
    }
    else
    {
        synthesizer = std::make_unique<HttpSynthesizer>(
            HttpSynthesizerConfig {
                .url = config.synthesis.url,
                .authToken = config.session.authToken,
                .voice = config.synthesis.voiceId,
                .speed = config.synthesis.speed,
            },
            speechHttp);
    }

    auto capture = MiniaudioCapture(config.capture);
    auto playback = MiniaudioPlayback {};

    auto callbacks = SessionCallbacks {
        .onPhaseChanged =
            [](const PhaseTransition& transition) {
                log::debug("[{}] {}", phaseName(transition.to), transition.reason);
            },
        .onInterim = [](std::string_view text) { std::println("  … {}", text); },
        .onTurnCommitted =
            [](const ConversationTurn& turn) {
                std::println("{}{}: {}", roleName(turn.role), turn.interrupted ? " (interrupted)" : "", turn.text);
            },
        .onNotification = [](const Error& error) { std::println("! {}", error.message); },
    };

    auto engine = VoiceEngine(toEngineConfig(config),
                              VoiceEngineBindings {
                                  .capture = capture,
                                  .sink = playback,
                                  .responder = responder,
                                  .nativeRecognizer = nativeRecognizer,
                                  .cloudRecognizer = cloud.isAvailable() ? &cloud : nullptr,
                                  .synthesizer = synthesizer.get(),
                              },
                              std::move(callbacks));

    installInterruptHandlers();
    engine.start();
    if (config.soundDisabled)
        engine.setSoundEnabled(false);
    engine.startSession();
    printHelp();

    auto line = std::string {};
    while (!gInterrupted && std::getline(std::cin, line))
    {
        if (line == "quit" || line == "exit")
            break;
        else if (line == "mic on")
            engine.setMicEnabled(true);
        else if (line == "mic off")
            engine.setMicEnabled(false);
        else if (line == "sound on")
            engine.setSoundEnabled(true);
        else if (line == "sound off")
            engine.setSoundEnabled(false);
        else if (line == "reset")
        {
            engine.reset();
            engine.startSession();
        }
        else if (!line.empty())
            printHelp();
    }

    engine.stop();
    return 0;
}
