// SPDX-License-Identifier: Apache-2.0
#include "VoiceEngine.hpp"

#include <core/Clock.hpp>
#include <core/EventChannel.hpp>
#include <core/Executor.hpp>
#include <core/Log.hpp>

#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace voicetutor
{

struct VoiceEngine::Impl
{
    VoiceEngineConfig config;
    SystemClock clock;
    ThreadPoolExecutor executor;
    EventChannel<VoiceEvent> events;
    std::unique_ptr<TurnController> controller;
    std::jthread thread;
    bool stopped = false;

    mutable std::mutex snapshotMutex;
    VoiceSessionState snapshot;

    Impl(VoiceEngineConfig engineConfig, VoiceEngineBindings bindings, SessionCallbacks callbacks):
        config(std::move(engineConfig)), executor(config.workerThreads)
    {
        controller = std::make_unique<TurnController>(
            config.turn,
            TurnCollaborators {
                .capture = bindings.capture,
                .sink = bindings.sink,
                .responder = bindings.responder,
                .executor = executor,
                .clock = clock,
                .nativeRecognizer = bindings.nativeRecognizer,
                .cloudRecognizer = bindings.cloudRecognizer,
                .synthesizer = bindings.synthesizer,
            },
            [this](VoiceEvent event) { (void) events.post(std::move(event)); },
            std::move(callbacks));
    }

    void publish()
    {
        auto lock = std::lock_guard(snapshotMutex);
        snapshot = controller->state();
    }

    void run(const std::stop_token& stopToken)
    {
        log::debug("Conversation thread started");
        while (!stopToken.stop_requested())
        {
            if (auto event = events.waitPopFor(stopToken, config.tickInterval))
                controller->handle(std::move(*event));
            controller->tick(clock.now());
            publish();
        }

        controller->endSession();
        publish();
        log::debug("Conversation thread stopped");
    }
};

VoiceEngine::VoiceEngine(VoiceEngineConfig config, VoiceEngineBindings bindings, SessionCallbacks callbacks):
    _impl(std::make_unique<Impl>(std::move(config), bindings, std::move(callbacks)))
{
}

VoiceEngine::~VoiceEngine()
{
    stop();
}

void VoiceEngine::start()
{
    if (_impl->thread.joinable() || _impl->stopped)
        return;

    _impl->thread = std::jthread([this](const std::stop_token& stopToken) { _impl->run(stopToken); });
}

void VoiceEngine::stop()
{
    if (_impl->thread.joinable())
    {
        _impl->thread.request_stop();
        _impl->thread.join();
    }

    // Tasks still running see a stale generation and finish quickly; their results are discarded.
    _impl->executor.shutdown();
    _impl->events.close();
    _impl->stopped = true;
}

void VoiceEngine::post(VoiceEvent event)
{
    if (!_impl->events.post(std::move(event)))
        log::debug("Voice engine is stopped, event dropped");
}

auto VoiceEngine::snapshot() const -> VoiceSessionState
{
    auto lock = std::lock_guard(_impl->snapshotMutex);
    return _impl->snapshot;
}

auto VoiceEngine::isRunning() const -> bool
{
    return _impl->thread.joinable();
}

} // namespace voicetutor
