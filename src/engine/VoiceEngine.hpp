// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>
#include <audio/AudioPlayback.hpp>
#include <engine/Events.hpp>
#include <engine/SessionState.hpp>
#include <engine/TurnController.hpp>
#include <llm/ResponseProvider.hpp>
#include <speech/Recognizer.hpp>
#include <speech/Synthesizer.hpp>

#include <cstddef>
#include <memory>

namespace voicetutor
{

/// @brief Configuration of the running engine.
struct VoiceEngineConfig
{
    TurnControllerConfig turn;

    /// @brief Threads for recognition, model requests and synthesis.
    std::size_t workerThreads = 4;

    /// @brief Longest wait for an event before time-driven work runs.
    Millis tickInterval { 50 };
};

/// @brief Devices and services the engine drives. All must outlive the engine.
struct VoiceEngineBindings
{
    AudioCaptureSource& capture;
    AudioSink& sink;
    ResponseProvider& responder;
    Recognizer* nativeRecognizer = nullptr;
    Recognizer* cloudRecognizer = nullptr;
    Synthesizer* synthesizer = nullptr;
};

/// @brief Runs a turn controller on its own conversation thread.
///
/// Owns the event channel, the conversation thread and the worker pool.
/// Callbacks passed in are invoked on the conversation thread.
class VoiceEngine
{
  public:
    VoiceEngine(VoiceEngineConfig config, VoiceEngineBindings bindings, SessionCallbacks callbacks = {});
    ~VoiceEngine();

    VoiceEngine(const VoiceEngine&) = delete;
    VoiceEngine& operator=(const VoiceEngine&) = delete;

    /// @brief Starts the conversation thread. The session itself starts with startSession().
    ///
    /// An engine runs once; start() after stop() does nothing.
    void start();

    /// @brief Ends the session, stops the conversation thread and joins the workers.
    void stop();

    /// @brief Queues an event for the conversation thread. Safe from any thread.
    void post(VoiceEvent event);

    void startSession() { post(StartSession {}); }
    void endSession() { post(EndSession {}); }
    void reset() { post(ResetSession {}); }
    void setMicEnabled(bool enabled) { post(SetMicEnabled { .enabled = enabled }); }
    void setSoundEnabled(bool enabled) { post(SetSoundEnabled { .enabled = enabled }); }

    /// @brief A copy of the session state as of the last processed event.
    [[nodiscard]] auto snapshot() const -> VoiceSessionState;

    [[nodiscard]] auto isRunning() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
