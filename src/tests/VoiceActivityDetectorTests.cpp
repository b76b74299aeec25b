// SPDX-License-Identifier: Apache-2.0
#include <audio/VoiceActivityDetector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <random>
#include <vector>

#include "TestDoubles.hpp"

using namespace voicetutor;
using namespace voicetutor::test;

namespace
{
    constexpr auto Loud = 0.1f;  // 10 %
    constexpr auto Quiet = 0.0f;

    auto testConfig() -> VadConfig
    {
        return VadConfig {
            .speechThreshold = 1.5f,
            .interruptionThreshold = 3.0f,
            .interruptionConfirmFrames = 2,
            .smoothingWindow = 1,
            .silenceDuration = Millis { 300 },
            .minSpeechDuration = Millis { 300 },
            .minAudioSize = 0,
            .preRollFrames = 0,
        };
    }

    /// Feeds 100 ms frames of the given amplitudes and collects the events.
    struct Feeder
    {
        VoiceActivityDetector& vad;
        TimePoint next = TimePoint {} + std::chrono::hours(1);
        std::vector<VadEvent> events;

        void feed(std::initializer_list<float> amplitudes)
        {
            for (auto const amplitude: amplitudes)
                feedOne(amplitude);
        }

        void feedOne(float amplitude)
        {
            if (auto event = vad.process(makeFrame(next, amplitude)))
                events.push_back(std::move(*event));
            next += Millis { 100 };
        }
    };
} // namespace

TEST_CASE("VoiceActivityDetector opens and closes a span", "[vad]")
{
    auto vad = VoiceActivityDetector { testConfig() };
    auto feeder = Feeder { .vad = vad };

    feeder.feed({ Quiet, Loud });
    REQUIRE(feeder.events.size() == 1);
    auto const* started = std::get_if<SpeechStarted>(&feeder.events[0]);
    REQUIRE(started != nullptr);
    CHECK(started->spanId == 1);
    CHECK_FALSE(started->guarded);
    CHECK(vad.inSpeech());
    CHECK(vad.openSpanId() == std::optional<std::uint64_t> { 1 });

    feeder.feed({ Loud, Loud, Loud, Loud, Quiet, Quiet });
    CHECK(feeder.events.size() == 1);

    feeder.feed({ Quiet });
    REQUIRE(feeder.events.size() == 2);
    auto const* ended = std::get_if<SpeechEnded>(&feeder.events[1]);
    REQUIRE(ended != nullptr);
    CHECK(ended->span.id == 1);
    CHECK(ended->span.speechDuration == Millis { 500 });
    CHECK(ended->span.frames.size() == 8);
    CHECK(ended->span.peakLoudness > 9.9f);
    CHECK_FALSE(vad.inSpeech());
}

TEST_CASE("VoiceActivityDetector discards short and small spans", "[vad]")
{
    SECTION("too short")
    {
        auto vad = VoiceActivityDetector { testConfig() };
        auto feeder = Feeder { .vad = vad };
        feeder.feed({ Loud, Loud, Quiet, Quiet, Quiet });
        REQUIRE(feeder.events.size() == 2);
        auto const* discarded = std::get_if<SpeechDiscarded>(&feeder.events[1]);
        REQUIRE(discarded != nullptr);
        CHECK(discarded->spanId == 1);
        CHECK(discarded->reason == DiscardReason::TooShort);
        CHECK(discarded->speechDuration == Millis { 200 });
    }

    SECTION("too small")
    {
        auto config = testConfig();
        config.minAudioSize = 100000;
        auto vad = VoiceActivityDetector { config };
        auto feeder = Feeder { .vad = vad };
        feeder.feed({ Loud, Loud, Loud, Loud, Quiet, Quiet, Quiet });
        REQUIRE(feeder.events.size() == 2);
        auto const* discarded = std::get_if<SpeechDiscarded>(&feeder.events[1]);
        REQUIRE(discarded != nullptr);
        CHECK(discarded->reason == DiscardReason::TooSmall);
    }
}

TEST_CASE("VoiceActivityDetector keeps pre-roll frames", "[vad]")
{
    auto config = testConfig();
    config.preRollFrames = 2;
    auto vad = VoiceActivityDetector { config };
    auto feeder = Feeder { .vad = vad };

    feeder.feed({ Quiet, Quiet, Quiet, Loud });
    REQUIRE(feeder.events.size() == 1);
    auto const* started = std::get_if<SpeechStarted>(&feeder.events[0]);
    REQUIRE(started != nullptr);
    CHECK(started->initialFrames.size() == 3);
}

TEST_CASE("VoiceActivityDetector smooths out single clicks", "[vad]")
{
    auto config = testConfig();
    config.smoothingWindow = 4;
    config.speechThreshold = 5.0f;
    auto vad = VoiceActivityDetector { config };
    auto feeder = Feeder { .vad = vad };

    feeder.feed({ Quiet, Quiet, Quiet, Loud, Quiet, Quiet });
    CHECK(feeder.events.empty());
}

TEST_CASE("VoiceActivityDetector closes spans at the length limit", "[vad]")
{
    auto config = testConfig();
    config.maxSpanDuration = Millis { 1000 };
    auto vad = VoiceActivityDetector { config };
    auto feeder = Feeder { .vad = vad };

    for (auto i = 0; i < 10; ++i)
        feeder.feedOne(Loud);

    REQUIRE(feeder.events.size() == 2);
    CHECK(std::holds_alternative<SpeechEnded>(feeder.events[1]));
    CHECK_FALSE(vad.inSpeech());
}

TEST_CASE("VoiceActivityDetector in guarded mode", "[vad]")
{
    auto vad = VoiceActivityDetector { testConfig() };
    vad.setGuarded(true);
    auto feeder = Feeder { .vad = vad };

    SECTION("ordinary speech level does not open a span")
    {
        feeder.feed({ 0.02f, 0.02f, 0.02f, 0.02f });
        CHECK(feeder.events.empty());
    }

    SECTION("a confirmed loud span is an interruption candidate")
    {
        feeder.feed({ 0.05f });
        CHECK(feeder.events.empty());
        feeder.feed({ 0.05f });
        REQUIRE(feeder.events.size() == 1);
        auto const* started = std::get_if<SpeechStarted>(&feeder.events[0]);
        REQUIRE(started != nullptr);
        CHECK(started->guarded);
        CHECK(started->initialFrames.size() == 2);
    }

    SECTION("a rejected candidate needs quiet before the next one")
    {
        feeder.feed({ 0.05f, 0.05f });
        REQUIRE(feeder.events.size() == 1);
        vad.rejectCandidate();
        CHECK_FALSE(vad.inSpeech());

        feeder.feed({ 0.05f, 0.05f, 0.05f });
        CHECK(feeder.events.size() == 1);

        feeder.feed({ Quiet, 0.05f, 0.05f });
        CHECK(feeder.events.size() == 2);
    }

    SECTION("a promoted candidate ends as an ordinary span")
    {
        feeder.feed({ 0.05f, 0.05f });
        vad.promoteCandidate();
        vad.setGuarded(false);
        feeder.feed({ Loud, Loud, Loud, Quiet, Quiet, Quiet });
        REQUIRE(feeder.events.size() == 2);
        auto const* ended = std::get_if<SpeechEnded>(&feeder.events[1]);
        REQUIRE(ended != nullptr);
        CHECK_FALSE(ended->span.guarded);
    }
}

TEST_CASE("VoiceActivityDetector reset drops the open span", "[vad]")
{
    auto vad = VoiceActivityDetector { testConfig() };
    auto feeder = Feeder { .vad = vad };

    feeder.feed({ Loud, Loud });
    REQUIRE(vad.inSpeech());
    vad.reset();
    CHECK_FALSE(vad.inSpeech());
    CHECK_FALSE(vad.openSpanId().has_value());
    CHECK(vad.smoothedLoudness() == 0.0f);
}

TEST_CASE("VoiceActivityDetector pairs every start with one end", "[vad]")
{
    auto config = testConfig();
    config.smoothingWindow = 3;
    auto vad = VoiceActivityDetector { config };
    auto feeder = Feeder { .vad = vad };

    auto rng = std::mt19937 { 42 };
    auto coin = std::uniform_int_distribution<int> { 0, 99 };
    auto loud = false;
    for (auto i = 0; i < 2000; ++i)
    {
        // Runs of loud and quiet frames of random length.
        if (coin(rng) < 20)
            loud = !loud;
        feeder.feedOne(loud ? Loud : Quiet);
    }

    auto open = std::optional<std::uint64_t> {};
    auto lastId = std::uint64_t { 0 };
    for (auto const& event: feeder.events)
    {
        if (auto const* started = std::get_if<SpeechStarted>(&event))
        {
            REQUIRE_FALSE(open.has_value());
            CHECK(started->spanId > lastId);
            open = started->spanId;
            lastId = started->spanId;
        }
        else if (auto const* ended = std::get_if<SpeechEnded>(&event))
        {
            REQUIRE(open == std::optional { ended->span.id });
            open.reset();
        }
        else if (auto const* discarded = std::get_if<SpeechDiscarded>(&event))
        {
            REQUIRE(open == std::optional { discarded->spanId });
            open.reset();
        }
    }
    CHECK(lastId > 0);
}
