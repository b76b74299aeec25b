// SPDX-License-Identifier: Apache-2.0
#include <speech/HallucinationFilter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace voicetutor;

TEST_CASE("filterHallucination accepts ordinary utterances", "[hallucination]")
{
    auto const result = filterHallucination("  Привет, как дела?  ");
    REQUIRE(result.has_value());
    CHECK(*result == "Привет, как дела?");

    CHECK(filterHallucination("2+2").has_value());
    CHECK(filterHallucination("Сколько будет семь на восемь?").has_value());
}

TEST_CASE("filterHallucination rejects known silence phrases", "[hallucination]")
{
    CHECK_FALSE(filterHallucination("Продолжение следует...").has_value());
    CHECK_FALSE(filterHallucination("Субтитры сделал DimaTorzok").has_value());
    CHECK_FALSE(filterHallucination("Спасибо за внимание!").has_value());
    CHECK_FALSE(filterHallucination("Подписывайтесь на канал").has_value());
    CHECK_FALSE(filterHallucination("Вот и конец").has_value());
}

TEST_CASE("filterHallucination rejects punctuation-only text", "[hallucination]")
{
    CHECK_FALSE(filterHallucination("...").has_value());
    CHECK_FALSE(filterHallucination(",,,").has_value());
    CHECK_FALSE(filterHallucination("   ").has_value());
}

TEST_CASE("filterHallucination enforces length bounds", "[hallucination]")
{
    CHECK_FALSE(filterHallucination("а").has_value());

    auto longText = std::string {};
    while (longText.size() < 500)
        longText += "слово ";
    CHECK_FALSE(filterHallucination(longText).has_value());
}

TEST_CASE("filterHallucination rejects run-on fragments", "[hallucination]")
{
    CHECK_FALSE(filterHallucination("Раз. Два. Три. Четыре. Пять.").has_value());
    CHECK(filterHallucination("Раз. Два. Три.").has_value());
}

TEST_CASE("filterHallucination rejects filler sounds", "[hallucination]")
{
    CHECK_FALSE(filterHallucination("эээ").has_value());
    CHECK_FALSE(filterHallucination("Ммм").has_value());
    CHECK(isMeaninglessSound("ааа"));
    CHECK(isMeaninglessSound("да"));
    CHECK_FALSE(isMeaninglessSound("нет"));
    CHECK_FALSE(isMeaninglessSound("12"));
}

TEST_CASE("matchesHallucinationPattern is case-insensitive", "[hallucination]")
{
    CHECK(matchesHallucinationPattern("ПРОДОЛЖЕНИЕ СЛЕДУЕТ"));
    CHECK(matchesHallucinationPattern("до свидания"));
    CHECK_FALSE(matchesHallucinationPattern("давай продолжим"));
}
