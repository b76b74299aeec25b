// SPDX-License-Identifier: Apache-2.0
#include <core/EventChannel.hpp>
#include <engine/TurnController.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include "TestDoubles.hpp"

using namespace voicetutor;
using namespace voicetutor::test;

namespace
{
    constexpr auto Loud = 0.1f;
    constexpr auto Quiet = 0.0f;

    auto testConfig() -> TurnControllerConfig
    {
        auto config = TurnControllerConfig {};
        config.vad = VadConfig {
            .speechThreshold = 1.5f,
            .interruptionThreshold = 3.0f,
            .interruptionConfirmFrames = 2,
            .smoothingWindow = 1,
            .silenceDuration = Millis { 300 },
            .minSpeechDuration = Millis { 300 },
            .minAudioSize = 0,
            .preRollFrames = 0,
        };
        config.session.greeting.clear();
        return config;
    }

    /// A conversation wired to test doubles. Background work runs only when settle() is called.
    struct Session
    {
        ManualExecutor executor;
        ManualClock clock;
        FakeCapture capture;
        FakeSink sink;
        FakeResponseProvider responder;
        FakeRecognizer native { TranscriptSource::Native, true };
        FakeRecognizer cloud { TranscriptSource::Cloud };
        FakeSynthesizer synthesizer;
        EventChannel<VoiceEvent> events;

        std::vector<ConversationTurn> turns;
        std::vector<Error> notifications;
        std::vector<Millis> pauses;
        TimePoint nextFrame = clock.now();

        TurnController controller;

        explicit Session(TurnControllerConfig config = testConfig()):
            controller(std::move(config),
                       TurnCollaborators {
                           .capture = capture,
                           .sink = sink,
                           .responder = responder,
                           .executor = executor,
                           .clock = clock,
                           .nativeRecognizer = &native,
                           .cloudRecognizer = &cloud,
                           .synthesizer = &synthesizer,
                           .sleep = [this](Millis pause) { pauses.push_back(pause); },
                       },
                       [this](VoiceEvent event) { events.post(std::move(event)); },
                       SessionCallbacks {
                           .onTurnCommitted = [this](const ConversationTurn& turn) { turns.push_back(turn); },
                           .onNotification = [this](const Error& error) { notifications.push_back(error); },
                       })
        {
        }

        /// Delivers posted events to the controller.
        void pump()
        {
            while (auto event = events.tryPop())
                controller.handle(std::move(*event));
        }

        /// Runs background work and delivers its results until nothing is left to do.
        void settle()
        {
            do
                pump();
            while (executor.runNext());
        }

        void frames(std::initializer_list<float> amplitudes)
        {
            for (auto const amplitude: amplitudes)
            {
                auto frame = makeFrame(nextFrame, amplitude);
                nextFrame += Millis { 100 };
                clock.set(nextFrame);
                capture.emit(std::move(frame));
                settle();
            }
        }

        /// Delivers frames without running any background work.
        void feed(std::initializer_list<float> amplitudes)
        {
            for (auto const amplitude: amplitudes)
            {
                auto frame = makeFrame(nextFrame, amplitude);
                nextFrame += Millis { 100 };
                clock.set(nextFrame);
                capture.emit(std::move(frame));
                pump();
            }
        }

        /// Speaks an utterance the recognizer will transcribe as @p text.
        void say(std::string text)
        {
            native.queueFinal(std::move(text));
            frames({ Loud, Loud, Loud, Loud, Loud, Quiet, Quiet, Quiet, Quiet });
        }

        /// Like say(), but the decode stays queued on the executor.
        void sayWithoutSettling(std::string text)
        {
            native.queueFinal(std::move(text));
            feed({ Loud, Loud, Loud, Loud, Loud, Quiet, Quiet, Quiet, Quiet });
        }

        /// Plays every queued segment to the end.
        void drainAll()
        {
            while (sink.drain())
                settle();
        }

        [[nodiscard]] auto phases() const -> std::vector<Phase>
        {
            auto result = std::vector<Phase> {};
            for (auto const& transition: controller.history())
                result.push_back(transition.to);
            return result;
        }
    };
} // namespace

TEST_CASE("TurnController runs a full conversation turn", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    REQUIRE(s.controller.phase() == Phase::Listening);
    CHECK(s.capture.openCount == 1);
    CHECK(s.controller.tokens().current() == 1);

    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");

    CHECK(s.controller.phase() == Phase::Speaking);
    REQUIRE(s.responder.requests.size() == 1);
    CHECK(s.responder.requests[0].content == "Привет");
    CHECK_FALSE(s.responder.requests[0].interrupted);
    CHECK(s.synthesizer.texts.size() == 2);
    CHECK(s.sink.played.size() == 1);
    CHECK(s.controller.playback().queuedCount() == 1);

    s.sink.drain();
    s.settle();
    CHECK(s.controller.phase() == Phase::Speaking);
    CHECK(s.sink.played.size() == 2);

    s.sink.drain();
    s.settle();
    CHECK(s.controller.phase() == Phase::Listening);

    CHECK(s.phases()
          == std::vector<Phase> {
              Phase::Listening, Phase::Transcribing, Phase::AwaitingResponse, Phase::Speaking, Phase::Listening });

    auto const& turns = s.controller.conversation().turns();
    REQUIRE(turns.size() == 2);
    CHECK(turns[0].role == Role::User);
    CHECK(turns[0].text == "Привет");
    CHECK(turns[1].role == Role::Assistant);
    CHECK(turns[1].text == "Привет! Готов начать урок?");
    CHECK_FALSE(turns[1].interrupted);
    CHECK(s.turns.size() == 2);
    CHECK(s.notifications.empty());
}

TEST_CASE("TurnController handles a barge-in", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");
    REQUIRE(s.controller.phase() == Phase::Speaking);
    REQUIRE(s.controller.tokens().current() == 1);

    s.responder.queueReply("Хорошо, жду.");
    s.say("подожди минуту");

    CHECK(s.controller.tokens().current() == 2);
    CHECK(s.sink.stopCount == 1);
    CHECK(s.responder.abortCount >= 1);

    auto const& history = s.controller.history();
    auto const bargeIn = std::ranges::find_if(history, [](auto const& transition) {
        return transition.from == Phase::Speaking && transition.to == Phase::Listening;
    });
    REQUIRE(bargeIn != history.end());
    CHECK(bargeIn->reason == "barge-in");

    SECTION("the cut-off turn keeps what was heard")
    {
        auto const& turns = s.controller.conversation().turns();
        REQUIRE(turns.size() == 3);
        CHECK(turns[1].role == Role::Assistant);
        CHECK(turns[1].text == "Привет!");
        CHECK(turns[1].interrupted);
        CHECK(turns[2].text == "подожди минуту");
    }

    SECTION("the next request bridges the interrupted turn")
    {
        REQUIRE(s.responder.requests.size() == 2);
        auto const& request = s.responder.requests[1];
        CHECK(request.interrupted);
        CHECK(request.content.find("Привет!") != std::string::npos);
        CHECK(request.content.find("подожди минуту") != std::string::npos);
    }

    SECTION("the new reply is spoken")
    {
        CHECK(s.controller.phase() == Phase::Speaking);
        REQUIRE(s.sink.played.size() == 2);
        s.drainAll();
        CHECK(s.controller.phase() == Phase::Listening);
        CHECK(s.controller.conversation().turns().back().text == "Хорошо, жду.");
    }

    SECTION("results of the old generation are dropped")
    {
        auto const played = s.sink.played.size();
        auto const turns = s.controller.conversation().size();

        auto clip = AudioClip {};
        clip.samples.assign(8000, 0.2f);
        clip.sampleRate = 16000;
        s.controller.handle(
            SynthesisCompleted { .token = 1, .index = 1, .text = "Готов начать урок?", .clip = std::move(clip) });
        s.controller.handle(ResponseCompleted { .token = 1, .outcome = ResponseOutcome { .text = "Старый ответ." } });
        s.settle();

        CHECK(s.sink.played.size() == played);
        CHECK(s.controller.conversation().size() == turns);
        CHECK(s.controller.tokens().current() == 2);
    }
}

TEST_CASE("TurnController ignores the assistant's own voice", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");
    s.drainAll();
    REQUIRE(s.controller.phase() == Phase::Listening);
    auto const transitions = s.controller.history().size();

    s.say("Готов начать урок");

    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.responder.requests.size() == 1);
    CHECK(s.controller.conversation().size() == 2);
    CHECK(s.controller.history().size() == transitions);

    SECTION("after the cooldown the same words are the user's")
    {
        s.nextFrame += Millis { 5000 };
        s.responder.queueReply("Отлично.");
        s.say("Готов начать урок");
        CHECK(s.responder.requests.size() == 2);
        CHECK(s.controller.conversation().size() == 3);
    }
}

TEST_CASE("TurnController with the microphone muted", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.controller.setMicEnabled(false);
    CHECK_FALSE(s.controller.state().micEnabled);

    s.frames({ Loud, Loud, Loud, Loud, Loud, Quiet, Quiet, Quiet, Quiet });
    CHECK(s.native.calls.empty());
    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.controller.conversation().size() == 0);

    s.controller.setMicEnabled(true);
    s.responder.queueReply("Слушаю.");
    s.say("Теперь слышно?");
    CHECK(s.responder.requests.size() == 1);
    CHECK(s.responder.requests[0].content == "Теперь слышно?");
}

TEST_CASE("TurnController with sound disabled answers in text", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();

    SECTION("before the reply")
    {
        s.controller.setSoundEnabled(false);
        s.responder.queueReply("Четыре. Проверим?");
        s.say("Сколько будет два плюс два?");

        CHECK(s.synthesizer.texts.empty());
        CHECK(s.sink.played.empty());
        CHECK(s.controller.phase() == Phase::Listening);
        CHECK(s.phases()
              == std::vector<Phase> {
                  Phase::Listening, Phase::Transcribing, Phase::AwaitingResponse, Phase::Listening });
        REQUIRE(s.controller.conversation().size() == 2);
        CHECK(s.controller.conversation().turns()[1].text == "Четыре. Проверим?");
    }

    SECTION("while speaking")
    {
        s.responder.queueReply("Четыре. Проверим?");
        s.say("Сколько будет два плюс два?");
        REQUIRE(s.controller.phase() == Phase::Speaking);

        s.controller.setSoundEnabled(false);
        CHECK(s.sink.stopCount == 1);
        CHECK(s.controller.phase() == Phase::Listening);
        REQUIRE(s.controller.conversation().size() == 2);
        CHECK_FALSE(s.controller.conversation().turns()[1].interrupted);
    }
}

TEST_CASE("TurnController speaks the greeting first", "[turn]")
{
    auto config = testConfig();
    config.session.greeting = "Здравствуй! Начнём?";
    auto s = Session { config };

    s.controller.startSession();
    s.settle();
    CHECK(s.controller.phase() == Phase::Speaking);

    s.drainAll();
    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.phases()
          == std::vector<Phase> { Phase::Listening, Phase::AwaitingResponse, Phase::Speaking, Phase::Listening });
    REQUIRE(s.controller.conversation().size() == 1);
    CHECK(s.controller.conversation().turns()[0].role == Role::Assistant);
    CHECK(s.responder.requests.empty());
}

TEST_CASE("TurnController fails when the microphone cannot be opened", "[turn]")
{
    auto s = Session {};
    s.capture.openError = Error { ErrorCode::DeviceError, "no microphone" };

    s.controller.startSession();
    CHECK(s.controller.phase() == Phase::Error);
    REQUIRE(s.notifications.size() == 1);
    CHECK(s.notifications[0].code == ErrorCode::DeviceError);

    SECTION("frames are ignored in the error phase")
    {
        s.say("Привет");
        CHECK(s.native.calls.empty());
    }

    SECTION("reset leads back to a working session")
    {
        s.controller.reset();
        CHECK(s.controller.phase() == Phase::Idle);

        s.capture.openError.reset();
        s.controller.startSession();
        CHECK(s.controller.phase() == Phase::Listening);
    }
}

TEST_CASE("TurnController fails without any recognizer", "[turn]")
{
    auto s = Session {};
    s.native.available = false;
    s.cloud.available = false;

    s.controller.startSession();
    CHECK(s.controller.phase() == Phase::Error);
    REQUIRE(s.notifications.size() == 1);
    CHECK(s.notifications[0].code == ErrorCode::NotFoundError);
    CHECK(s.capture.openCount == 0);
}

TEST_CASE("TurnController fails when capture breaks", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.capture.fail(Error { ErrorCode::DeviceError, "device unplugged" });
    s.settle();

    CHECK(s.controller.phase() == Phase::Error);
    CHECK(s.capture.closeCount == 1);
    REQUIRE(s.notifications.size() == 1);
    CHECK(s.notifications[0].code == ErrorCode::DeviceError);
}

TEST_CASE("TurnController treats an authentication failure as fatal", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueError(ErrorCode::AuthError, "401");
    s.say("Привет");

    CHECK(s.controller.phase() == Phase::Error);
    REQUIRE(s.notifications.size() == 1);
    CHECK(s.notifications[0].code == ErrorCode::AuthError);
}

TEST_CASE("TurnController speaks the fallback when the service stays down", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    for (auto i = 0; i < 4; ++i)
        s.responder.queueError(ErrorCode::NetworkError);
    s.say("Привет");

    CHECK(s.responder.requests.size() == 4);
    CHECK(s.pauses.size() == 3);
    REQUIRE(s.notifications.size() == 1);
    CHECK(s.notifications[0].code == ErrorCode::NetworkError);
    CHECK(s.controller.phase() == Phase::Speaking);

    s.drainAll();
    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.controller.conversation().turns().back().text == ResponsePolicy {}.networkFallback);
}

TEST_CASE("TurnController ends the session", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");
    REQUIRE(s.controller.phase() == Phase::Speaking);

    s.controller.endSession();
    CHECK(s.controller.phase() == Phase::Idle);
    CHECK(s.capture.closeCount == 1);
    CHECK(s.sink.releaseCount == 1);
    CHECK(s.controller.tokens().current() == 2);
    REQUIRE(s.controller.conversation().size() == 2);
    CHECK(s.controller.conversation().turns()[1].interrupted);

    SECTION("frames after the end are ignored")
    {
        auto const calls = s.native.calls.size();
        s.say("Ещё вопрос");
        CHECK(s.native.calls.size() == calls);
    }
}

TEST_CASE("TurnController recognizes a spoken formula as its own voice", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("2 + 2 = 4");
    s.say("Сколько будет два плюс два?");
    REQUIRE(s.controller.phase() == Phase::Speaking);
    REQUIRE(s.synthesizer.texts == std::vector<std::string> { "два плюс два равно четыре" });
    REQUIRE(s.controller.playback().current() != nullptr);
    CHECK(s.controller.playback().current()->sourceText == "два плюс два равно четыре");

    SECTION("the microphone hears the formula read out")
    {
        s.say("два плюс два равно четыре");

        CHECK(s.controller.phase() == Phase::Speaking);
        CHECK(s.controller.tokens().current() == 1);
        CHECK(s.responder.requests.size() == 1);
        CHECK(s.sink.stopCount == 0);
    }

    SECTION("part of the formula heard right after playback")
    {
        s.drainAll();
        REQUIRE(s.controller.phase() == Phase::Listening);

        s.say("равно четыре");
        CHECK(s.responder.requests.size() == 1);
        CHECK(s.controller.conversation().size() == 2);
    }

    SECTION("the conversation keeps the written reply")
    {
        s.drainAll();
        CHECK(s.controller.conversation().turns().back().text == "2 + 2 = 4");
    }
}

TEST_CASE("TurnController replaces a request still in flight", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("Шесть.");

    s.sayWithoutSettling("Сколько будет два плюс два");
    REQUIRE(s.executor.runLast());
    s.pump();
    REQUIRE(s.controller.phase() == Phase::Transcribing);
    REQUIRE(s.executor.pending() == 1);

    s.sayWithoutSettling("А если три плюс три?");
    REQUIRE(s.executor.runLast());
    s.pump();

    CHECK(s.controller.phase() == Phase::Transcribing);
    CHECK(s.controller.tokens().current() == 2);
    CHECK(s.responder.abortCount >= 1);

    s.settle();

    // The first request was cancelled before it reached the service.
    REQUIRE(s.responder.requests.size() == 1);
    auto const& request = s.responder.requests[0];
    CHECK(request.interrupted);
    CHECK(request.content.find("Сколько будет два плюс два") != std::string::npos);
    CHECK(request.content.find("А если три плюс три?") != std::string::npos);

    CHECK(s.controller.phase() == Phase::Speaking);
    s.drainAll();
    CHECK(s.controller.phase() == Phase::Listening);

    auto const& turns = s.controller.conversation().turns();
    REQUIRE(turns.size() == 3);
    CHECK(turns[0].role == Role::User);
    CHECK(turns[1].role == Role::User);
    CHECK(turns[2].text == "Шесть.");
}

TEST_CASE("TurnController collapses barge-ins close together", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");
    s.responder.queueReply("Хорошо, жду.");
    s.say("подожди минуту");
    REQUIRE(s.controller.tokens().current() == 2);
    REQUIRE(s.controller.phase() == Phase::Speaking);
    REQUIRE(s.sink.stopCount == 1);

    s.say("ещё раз подожди");

    CHECK(s.controller.tokens().current() == 2);
    CHECK(s.sink.stopCount == 1);
    CHECK(s.responder.requests.size() == 2);
    CHECK(s.controller.phase() == Phase::Speaking);

    SECTION("after the debounce interval a new barge-in goes through")
    {
        s.native.finals.clear();
        s.nextFrame += Millis { 2000 };
        s.responder.queueReply("Слушаю.");
        s.say("стоп, у меня вопрос");

        CHECK(s.controller.tokens().current() == 3);
        CHECK(s.sink.stopCount == 2);
        CHECK(s.responder.requests.size() == 3);
    }
}

TEST_CASE("TurnController barges in on loudness alone when configured", "[turn]")
{
    auto config = testConfig();
    config.session.acousticBargeIn = true;
    auto s = Session { config };
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");
    REQUIRE(s.controller.phase() == Phase::Speaking);

    s.native.queueFinal("подожди минуту");
    s.responder.queueReply("Хорошо, жду.");
    auto const decodes = s.native.calls.size();

    // Two loud frames confirm the interruption before anything is transcribed.
    s.frames({ Loud, Loud });
    CHECK(s.controller.tokens().current() == 2);
    CHECK(s.sink.stopCount == 1);
    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.native.calls.size() == decodes);
    REQUIRE(s.controller.conversation().size() == 2);
    CHECK(s.controller.conversation().turns()[1].interrupted);

    // The rest of the utterance is an ordinary user span.
    s.frames({ Loud, Loud, Loud, Quiet, Quiet, Quiet, Quiet });
    REQUIRE(s.responder.requests.size() == 2);
    CHECK(s.responder.requests[1].interrupted);
    CHECK(s.responder.requests[1].content.find("подожди минуту") != std::string::npos);
    CHECK(s.controller.tokens().current() == 2);
    CHECK(s.controller.conversation().turns().back().text == "подожди минуту");
}

TEST_CASE("TurnController speaks a streamed reply and drops stale increments", "[turn]")
{
    auto s = Session {};
    s.responder.streaming = true;
    s.responder.deltas = { "Привет! ", "Готов начать урок?" };
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");

    CHECK(s.controller.phase() == Phase::Speaking);
    CHECK(s.synthesizer.texts.size() == 2);
    auto const& history = s.controller.history();
    CHECK(std::ranges::any_of(history, [](auto const& transition) { return transition.reason == "reply streaming"; }));

    s.responder.deltas = { "Хорошо, жду." };
    s.responder.queueReply("Хорошо, жду.");
    s.say("подожди минуту");
    REQUIRE(s.controller.tokens().current() == 2);

    auto const synthesized = s.synthesizer.texts.size();
    s.controller.handle(ResponseDelta { .token = 1, .text = "Старый ответ. " });
    s.settle();
    CHECK(s.synthesizer.texts.size() == synthesized);

    s.drainAll();
    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.controller.conversation().turns().back().text == "Хорошо, жду.");
}

TEST_CASE("TurnController answers in text when synthesis keeps failing", "[turn]")
{
    auto s = Session {};
    s.synthesizer.failuresLeft = 100;
    s.synthesizer.failureCode = ErrorCode::SynthesisError;
    s.controller.startSession();
    s.responder.queueReply("Привет! Готов начать урок?");
    s.say("Привет");

    // Two sentences, each tried once plus its retries.
    CHECK(s.synthesizer.texts.size() == 6);
    CHECK(s.sink.played.empty());
    CHECK(s.controller.phase() == Phase::Listening);
    CHECK(s.phases()
          == std::vector<Phase> { Phase::Listening, Phase::Transcribing, Phase::AwaitingResponse, Phase::Listening });

    REQUIRE(s.notifications.size() == 1);
    CHECK(s.notifications[0].code == ErrorCode::SynthesisError);

    REQUIRE(s.controller.conversation().size() == 2);
    auto const& reply = s.controller.conversation().turns()[1];
    CHECK(reply.text == "Привет! Готов начать урок?");
    CHECK_FALSE(reply.interrupted);
}

TEST_CASE("TurnController promotes an interim transcript whose final is overdue", "[turn]")
{
    auto config = testConfig();
    config.transcription.interimInterval = Millis { 200 };
    auto s = Session { config };
    s.controller.startSession();
    s.responder.queueReply("Четыре.");
    s.native.queueInterim("Сколько будет два плюс два");

    s.feed({ Loud, Loud, Loud, Loud, Loud, Quiet, Quiet, Quiet, Quiet });
    REQUIRE(s.executor.pending() == 2);

    // Only the interim decode comes back; the final one stays queued.
    REQUIRE(s.executor.runNext());
    s.pump();
    CHECK(s.controller.state().pendingInterimText == "Сколько будет два плюс два");

    s.clock.advance(Millis { 1000 });
    s.controller.tick(s.clock.now());
    CHECK(s.controller.phase() == Phase::Listening);

    s.clock.advance(Millis { 600 });
    s.controller.tick(s.clock.now());
    CHECK(s.controller.phase() == Phase::Transcribing);
    CHECK(s.controller.state().pendingInterimText.empty());

    s.settle();
    REQUIRE(s.responder.requests.size() == 1);
    CHECK(s.responder.requests[0].content == "Сколько будет два плюс два");
    REQUIRE(s.controller.conversation().size() == 1);
    CHECK(s.controller.conversation().turns()[0].text == "Сколько будет два плюс два");
    CHECK(s.controller.phase() == Phase::Speaking);
}

TEST_CASE("TurnController bridges text containing placeholder names literally", "[turn]")
{
    auto s = Session {};
    s.controller.startSession();
    s.responder.queueReply("Шаблон {current} готов.");
    s.say("Привет");
    REQUIRE(s.controller.phase() == Phase::Speaking);

    s.responder.queueReply("Хорошо.");
    s.say("подожди минуту");

    REQUIRE(s.responder.requests.size() == 2);
    CHECK(s.responder.requests[1].content
          == "Предыдущий контекст: \"Шаблон {current} готов.\". Новый вопрос: \"подожди минуту\"");
}
