// SPDX-License-Identifier: Apache-2.0
#include <speech/TranscriptDeduplicator.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voicetutor;

TEST_CASE("compareTranscripts ignores case and punctuation", "[dedup]")
{
    auto const config = DedupConfig {};
    CHECK(compareTranscripts("Привет как дела", "привет, как дела!", config) == DedupVerdict::ExactRepeat);
}

TEST_CASE("compareTranscripts detects extensions", "[dedup]")
{
    auto const config = DedupConfig {};
    CHECK(compareTranscripts("сколько будет", "Сколько будет семь на восемь?", config) == DedupVerdict::Extension);

    SECTION("a few extra characters are not an extension")
    {
        CHECK(compareTranscripts("сколько будет", "сколько будет два", config) == DedupVerdict::New);
    }
}

TEST_CASE("compareTranscripts detects minor variations", "[dedup]")
{
    auto const config = DedupConfig {};
    CHECK(compareTranscripts("расскажи про дроби", "расскажи про дробь", config) == DedupVerdict::MinorVariation);
    CHECK(compareTranscripts("как дела", "сколько времени", config) == DedupVerdict::New);
}

TEST_CASE("compareTranscripts treats empty text as new", "[dedup]")
{
    auto const config = DedupConfig {};
    CHECK(compareTranscripts("", "привет", config) == DedupVerdict::New);
    CHECK(compareTranscripts("привет", "...", config) == DedupVerdict::New);
}

TEST_CASE("TranscriptDeduplicator only compares inside its window", "[dedup]")
{
    auto dedup = TranscriptDeduplicator { DedupConfig { .window = Millis { 4000 } } };
    auto const t0 = TimePoint {} + std::chrono::hours(1);

    CHECK(dedup.classify("привет", t0) == DedupVerdict::New);
    CHECK_FALSE(dedup.lastText().has_value());

    dedup.remember("привет", t0);
    REQUIRE(dedup.lastText().has_value());
    CHECK(*dedup.lastText() == "привет");

    CHECK(dedup.classify("Привет!", t0 + Millis { 3000 }) == DedupVerdict::ExactRepeat);
    CHECK(dedup.classify("Привет!", t0 + Millis { 5000 }) == DedupVerdict::New);

    dedup.reset();
    CHECK(dedup.classify("привет", t0 + Millis { 100 }) == DedupVerdict::New);
}
