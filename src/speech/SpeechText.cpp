// SPDX-License-Identifier: Apache-2.0
#include "SpeechText.hpp"

#include <core/TextUtils.hpp>

#include <array>
#include <charconv>
#include <format>
#include <regex>
#include <string>

namespace voicetutor
{

namespace
{

    constexpr auto Units = std::array<std::string_view, 20> {
        "ноль",       "один",         "два",         "три",          "четыре",
        "пять",       "шесть",        "семь",        "восемь",       "девять",
        "десять",     "одиннадцать",  "двенадцать",  "тринадцать",   "четырнадцать",
        "пятнадцать", "шестнадцать",  "семнадцать",  "восемнадцать", "девятнадцать",
    };

    constexpr auto Tens = std::array<std::string_view, 10> {
        "", "", "двадцать", "тридцать", "сорок", "пятьдесят", "шестьдесят", "семьдесят", "восемьдесят", "девяносто",
    };

    constexpr auto Hundreds = std::array<std::string_view, 10> {
        "", "сто", "двести", "триста", "четыреста", "пятьсот", "шестьсот", "семьсот", "восемьсот", "девятьсот",
    };

    constexpr auto LargestSpelledNumber = 999'999ULL;

    struct SymbolWord
    {
        std::string_view symbol;
        std::string_view word;
    };

    // '-' and '–' are only replaced in arithmetic context, see replaceMinus().
    constexpr auto SymbolWords = std::array {
        SymbolWord { "−", " минус " },
        SymbolWord { "+", " плюс " },
        SymbolWord { "*", " умножить на " },
        SymbolWord { "×", " умножить на " },
        SymbolWord { "·", " умножить на " },
        SymbolWord { "/", " разделить на " },
        SymbolWord { "÷", " разделить на " },
        SymbolWord { "≠", " не равно " },
        SymbolWord { "≈", " приблизительно равно " },
        SymbolWord { "≤", " меньше или равно " },
        SymbolWord { "≥", " больше или равно " },
        SymbolWord { "=", " равно " },
        SymbolWord { "<", " меньше " },
        SymbolWord { ">", " больше " },
        SymbolWord { "±", " плюс-минус " },
        SymbolWord { "%", " процентов " },
        SymbolWord { "°", " градусов " },
        SymbolWord { "√", " квадратный корень из " },
        SymbolWord { "∛", " кубический корень из " },
        SymbolWord { "∞", " бесконечность " },
        SymbolWord { "²", " в квадрате " },
        SymbolWord { "³", " в кубе " },
        SymbolWord { "π", " пи " },
        SymbolWord { "α", " альфа " },
        SymbolWord { "β", " бета " },
        SymbolWord { "γ", " гамма " },
        SymbolWord { "δ", " дельта " },
        SymbolWord { "θ", " тета " },
        SymbolWord { "λ", " лямбда " },
        SymbolWord { "μ", " мю " },
        SymbolWord { "σ", " сигма " },
        SymbolWord { "φ", " фи " },
        SymbolWord { "ω", " омега " },
    };

    auto digitsToWords(std::string_view digits) -> std::string
    {
        auto words = std::string {};
        for (auto const ch: digits)
        {
            if (ch < '0' || ch > '9')
                continue;
            if (!words.empty())
                words += ' ';
            words += Units[static_cast<std::size_t>(ch - '0')];
        }
        return words;
    }

    auto spell(unsigned long long n) -> std::string
    {
        if (n < 20)
            return std::string(Units[n]);

        if (n < 100)
        {
            auto words = std::string(Tens[n / 10]);
            if (n % 10 != 0)
                words += std::format(" {}", Units[n % 10]);
            return words;
        }

        if (n < 1000)
        {
            auto words = std::string(Hundreds[n / 100]);
            if (n % 100 != 0)
                words += ' ' + spell(n % 100);
            return words;
        }

        if (n <= LargestSpelledNumber)
        {
            auto const thousands = n / 1000;
            auto const remainder = n % 1000;
            auto const lastDigit = thousands % 10;
            auto const lastTwoDigits = thousands % 100;

            auto words = std::string {};
            if (thousands == 1)
                words = "одна тысяча";
            else if (thousands == 2)
                words = "две тысячи";
            else if (thousands <= 4)
                words = spell(thousands) + " тысячи";
            else if (thousands <= 20 || (lastTwoDigits >= 11 && lastTwoDigits <= 19))
                words = spell(thousands) + " тысяч";
            else if (lastDigit == 1)
                words = spell(thousands - 1) + " одна тысяча";
            else if (lastDigit == 2)
                words = spell(thousands - 2) + " две тысячи";
            else if (lastDigit == 3 || lastDigit == 4)
                words = spell(thousands) + " тысячи";
            else
                words = spell(thousands) + " тысяч";

            if (remainder != 0)
                words += ' ' + spell(remainder);
            return words;
        }

        return digitsToWords(std::to_string(n));
    }

    template <typename Replacement>
    auto replaceMatches(const std::string& input, const std::regex& pattern, Replacement&& replacement)
        -> std::string
    {
        auto output = std::string {};
        auto last = input.cbegin();
        for (auto it = std::sregex_iterator(input.cbegin(), input.cend(), pattern); it != std::sregex_iterator {};
             ++it)
        {
            auto const& match = *it;
            output.append(last, match[0].first);
            output += replacement(match);
            last = match[0].second;
        }
        output.append(last, input.cend());
        return output;
    }

    auto unwrapLatex(std::string text) -> std::string
    {
        static auto const displayMath = std::regex { R"(\$\$(.*?)\$\$)" };
        static auto const inlineMath = std::regex { R"(\$(.*?)\$)" };
        static auto const fraction = std::regex { R"(\\frac\{([^}]+)\}\{([^}]+)\})" };
        static auto const squareRoot = std::regex { R"(\\sqrt\{([^}]+)\})" };
        static auto const power = std::regex { R"(\^(\d+))" };
        static auto const command = std::regex { R"(\\[a-zA-Z]+)" };

        text = std::regex_replace(text, displayMath, " $1 ");
        text = std::regex_replace(text, inlineMath, " $1 ");
        text = std::regex_replace(text, fraction, " $1 разделить на $2 ");
        text = std::regex_replace(text, squareRoot, " квадратный корень из $1 ");
        text = replaceMatches(text, power, [](const std::smatch& match) -> std::string {
            auto const exponent = match[1].str();
            if (exponent == "2")
                return " в квадрате";
            if (exponent == "3")
                return " в кубе";
            return std::format(" в степени {}", decimalToWords(exponent));
        });
        return std::regex_replace(text, command, "");
    }

    /// @brief Reads hyphens and dashes as "минус" between operands and before a leading number.
    auto replaceMinus(std::string text) -> std::string
    {
        static auto const binary = std::regex { R"(([0-9a-zA-Z)])\s*(?:-|–)\s*(?=[0-9a-zA-Z(]))" };
        static auto const leading = std::regex { R"((^|[\s(=])(?:-|–)(?=[0-9]))" };

        text = std::regex_replace(text, binary, "$1 минус ");
        return std::regex_replace(text, leading, "$1минус ");
    }

    auto replaceNumbers(std::string text) -> std::string
    {
        static auto const decimal = std::regex { R"((\d+)[.,](\d+))" };
        static auto const integer = std::regex { R"(\b(\d+)\b)" };

        text = replaceMatches(
            text, decimal, [](const std::smatch& match) { return std::format(" {} ", decimalToWords(match.str())); });
        return replaceMatches(
            text, integer, [](const std::smatch& match) { return std::format(" {} ", decimalToWords(match.str())); });
    }

    auto removeEmoji(std::string_view text) -> std::string
    {
        auto codepoints = text::decodeUtf8(text);
        std::erase_if(codepoints, [](char32_t cp) { return cp >= 0x1F300 && cp <= 0x1F9FF; });
        return text::encodeUtf8(codepoints);
    }

} // namespace

auto numberToWords(long long value) -> std::string
{
    if (value < 0)
        return "минус " + spell(0ULL - static_cast<unsigned long long>(value));
    return spell(static_cast<unsigned long long>(value));
}

auto decimalToWords(std::string_view digits) -> std::string
{
    auto const separator = digits.find_first_of(".,");
    auto const integerPart = digits.substr(0, separator);

    auto value = 0ULL;
    auto const [end, ec] = std::from_chars(integerPart.data(), integerPart.data() + integerPart.size(), value);
    auto words = ec == std::errc {} && end == integerPart.data() + integerPart.size() && value <= LargestSpelledNumber
                     ? spell(value)
                     : digitsToWords(integerPart);

    if (separator == std::string_view::npos)
        return words;

    return std::format("{} целых {}", words, digitsToWords(digits.substr(separator + 1)));
}

auto prepareForSpeech(std::string_view input) -> std::string
{
    static auto const emphasis = std::regex { R"(\*{2,}|_{2,})" };
    static auto const brackets = std::regex { R"([()\[\]{}])" };
    static auto const markup = std::regex { R"([#@&*_~`|\\])" };
    static auto const whitespace = std::regex { R"(\s+)" };

    if (input.empty())
        return {};

    auto text = std::regex_replace(std::string(input), emphasis, "");
    text = unwrapLatex(std::move(text));
    text = replaceMinus(std::move(text));
    for (auto const& [symbol, word]: SymbolWords)
        text = text::replaceAll(std::move(text), symbol, word);
    text = replaceNumbers(std::move(text));
    text = removeEmoji(text);
    text = std::regex_replace(text, brackets, " ");
    text = std::regex_replace(text, markup, " ");
    text = std::regex_replace(text, whitespace, " ");
    return std::string(text::trim(text));
}

} // namespace voicetutor
