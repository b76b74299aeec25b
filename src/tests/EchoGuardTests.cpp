// SPDX-License-Identifier: Apache-2.0
#include <audio/Loudness.hpp>
#include <engine/EchoGuard.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "TestDoubles.hpp"

using namespace voicetutor;
using namespace voicetutor::test;
using Catch::Matchers::WithinAbs;

namespace
{
    auto makeEnvelope(TimePoint start, std::vector<float> values) -> LoudnessEnvelope
    {
        return LoudnessEnvelope { .start = start, .frameDuration = Millis { 100 }, .values = std::move(values) };
    }
} // namespace

TEST_CASE("compareWithPlayedText recognizes a substring of played speech", "[echo]")
{
    auto const verdict = compareWithPlayedText("продолжим урок", "Давай продолжим урок", EchoConfig {});
    CHECK(verdict.isEcho);
    CHECK(verdict.reason == EchoReason::Substring);
    CHECK(verdict.confidence == 1.0f);
}

TEST_CASE("compareWithPlayedText recognizes overlapping words", "[echo]")
{
    auto const verdict =
        compareWithPlayedText("урок продолжим сегодня", "Сегодня мы продолжим наш урок", EchoConfig {});
    CHECK(verdict.isEcho);
    CHECK(verdict.reason == EchoReason::WordOverlap);
}

TEST_CASE("compareWithPlayedText keeps genuine interruptions", "[echo]")
{
    auto const verdict = compareWithPlayedText("стоп подожди", "Один плюс один равно двум", EchoConfig {});
    CHECK_FALSE(verdict.isEcho);
    CHECK(verdict.reason == EchoReason::None);
    CHECK(verdict.confidence == 0.0f);
}

TEST_CASE("compareWithPlayedText ignores short words", "[echo]")
{
    // Only "не" and "да" occur in both, and neither is significant.
    auto const verdict = compareWithPlayedText("да не знаю", "да не", EchoConfig {});
    CHECK_FALSE(verdict.isEcho);
}

TEST_CASE("envelopeCorrelation finds delayed copies", "[echo]")
{
    auto const t0 = TimePoint {} + std::chrono::hours(1);
    auto const played = makeEnvelope(t0, { 1, 8, 2, 9, 3, 7, 1, 6 });

    SECTION("aligned")
    {
        auto const r = envelopeCorrelation(makeEnvelope(t0, { 1, 8, 2, 9, 3, 7 }), played);
        REQUIRE(r.has_value());
        CHECK_THAT(*r, WithinAbs(1.0, 1e-4));
    }

    SECTION("heard 200 ms late")
    {
        auto const r = envelopeCorrelation(makeEnvelope(t0 + Millis { 200 }, { 1, 8, 2, 9, 3, 7 }), played);
        REQUIRE(r.has_value());
        CHECK_THAT(*r, WithinAbs(1.0, 1e-4));
    }

    SECTION("no overlap")
    {
        auto const r = envelopeCorrelation(makeEnvelope(t0 + Millis { 5000 }, { 1, 8, 2 }), played);
        CHECK_FALSE(r.has_value());
    }
}

TEST_CASE("EchoGuard compares only against recently audible segments", "[echo]")
{
    auto clock = ManualClock {};
    auto guard = EchoGuard { EchoConfig {}, clock };
    auto const start = clock.now();

    guard.segmentStarted(1, "Давай продолжим урок", makeEnvelope(start, { 20, 20, 20 }));
    CHECK(guard.profileCount() == 1);

    SECTION("while the segment plays")
    {
        clock.advance(Millis { 500 });
        CHECK(guard.inWindow(clock.now()));
        CHECK(guard.classify("продолжим урок", nullptr, clock.now()).isEcho);
        CHECK_FALSE(guard.classify("стоп подожди", nullptr, clock.now()).isEcho);
    }

    SECTION("within the cooldown")
    {
        clock.advance(Millis { 1500 });
        guard.segmentEnded(1);
        clock.advance(Millis { 800 });
        CHECK(guard.inWindow(clock.now()));
        CHECK(guard.classify("продолжим урок", nullptr, clock.now()).isEcho);
    }

    SECTION("after the cooldown")
    {
        clock.advance(Millis { 1500 });
        guard.segmentEnded(1);
        clock.advance(Millis { 1200 });
        CHECK_FALSE(guard.inWindow(clock.now()));
        CHECK_FALSE(guard.classify("продолжим урок", nullptr, clock.now()).isEcho);
    }

    SECTION("speech before the segment started")
    {
        CHECK_FALSE(guard.inWindow(start - Millis { 100 }));
    }
}

TEST_CASE("EchoGuard flags short repeats of the last assistant turn", "[echo]")
{
    auto clock = ManualClock {};
    auto guard = EchoGuard { EchoConfig {}, clock };

    guard.segmentStarted(1, "Какой ответ?", makeEnvelope(clock.now(), { 10, 10 }));
    guard.setLastAssistantTurn("Хорошо. Какой ответ?");

    clock.advance(Millis { 300 });
    auto const verdict = guard.classify("хорошо", nullptr, clock.now());
    CHECK(verdict.isEcho);
    CHECK(verdict.reason == EchoReason::ShortRepeat);
}

TEST_CASE("EchoGuard detects acoustic echo from loudness", "[echo]")
{
    auto clock = ManualClock {};
    auto guard = EchoGuard { EchoConfig {}, clock };
    auto const start = clock.now();

    guard.segmentStarted(1, "Сегодня дроби", makeEnvelope(start, { 2, 12, 4, 15, 3, 11, 2, 14 }));
    clock.advance(Millis { 800 });

    auto const heard = makeEnvelope(start + Millis { 100 }, { 1, 6, 2, 7, 1, 5 });
    auto const verdict = guard.classifyAudio(heard);
    CHECK(verdict.isEcho);
    CHECK(verdict.reason == EchoReason::Acoustic);

    auto const flat = makeEnvelope(start + Millis { 100 }, { 30, 30, 30, 30 });
    CHECK_FALSE(guard.classifyAudio(flat).isEcho);
}

TEST_CASE("EchoGuard keeps a bounded number of profiles", "[echo]")
{
    auto clock = ManualClock {};
    auto guard = EchoGuard { EchoConfig { .profileLimit = 3 }, clock };

    for (auto id = std::uint64_t { 1 }; id <= 5; ++id)
        guard.segmentStarted(id, "фраза", makeEnvelope(clock.now(), { 1 }));
    CHECK(guard.profileCount() == 3);

    guard.clear();
    CHECK(guard.profileCount() == 0);
}

TEST_CASE("computeEnvelope yields one value per window", "[echo]")
{
    auto const samples = std::vector<float>(1600 * 3 + 800, 0.5f);
    auto const envelope = computeEnvelope(samples, 16000, 1, TimePoint {}, Millis { 100 });
    REQUIRE(envelope.values.size() == 4);
    CHECK_THAT(envelope.values[0], WithinAbs(50.0, 1e-3));
    CHECK_THAT(envelope.values[3], WithinAbs(50.0, 1e-3));
}
