// SPDX-License-Identifier: Apache-2.0
#include <core/TextUtils.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voicetutor;

TEST_CASE("text::toLower handles Latin and Cyrillic", "[text]")
{
    CHECK(text::toLower("ПРИВЕТ World") == "привет world");
    CHECK(text::toLower("Ёлка") == "ёлка");
    CHECK(text::toLower("123 + x") == "123 + x");
}

TEST_CASE("text::trim strips surrounding whitespace", "[text]")
{
    CHECK(text::trim("  урок \n") == "урок");
    CHECK(text::trim("\t\t").empty());
    CHECK(text::trim("") == "");
}

TEST_CASE("text::normalize canonicalizes transcripts", "[text]")
{
    CHECK(text::normalize("Давай, продолжим   урок!") == "давай продолжим урок");
    CHECK(text::normalize("«Привет» — сказал он…") == "привет сказал он");
    CHECK(text::normalize("  ...  ").empty());
}

TEST_CASE("text::words splits on whitespace", "[text]")
{
    auto const words = text::words("один  два\tтри");
    REQUIRE(words.size() == 3);
    CHECK(words[0] == "один");
    CHECK(words[2] == "три");
}

TEST_CASE("text::codepointCount and graphemeCount count characters, not bytes", "[text]")
{
    CHECK(text::codepointCount("урок") == 4);
    CHECK(text::graphemeCount("урок") == 4);
    CHECK(text::graphemeCount("") == 0);
}

TEST_CASE("text::editDistance works on code points", "[text]")
{
    CHECK(text::editDistance("кот", "кот") == 0);
    CHECK(text::editDistance("кот", "код") == 1);
    CHECK(text::editDistance("", "мир") == 3);
}

TEST_CASE("text::decodeUtf8 and encodeUtf8 agree", "[text]")
{
    auto const decoded = text::decodeUtf8("ж😊");
    REQUIRE(decoded.size() == 2);
    CHECK(decoded[0] == U'ж');
    CHECK(decoded[1] == U'\U0001F60A');
    CHECK(text::encodeUtf8(decoded) == "ж😊");
}

TEST_CASE("text::replaceAll replaces every occurrence", "[text]")
{
    CHECK(text::replaceAll("a+b+c", "+", " плюс ") == "a плюс b плюс c");
    CHECK(text::replaceAll("abc", "", "x") == "abc");
}
