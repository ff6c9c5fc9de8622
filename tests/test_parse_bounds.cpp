#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "bytes/bytes.hpp"
#include "parser/radix.hpp"
#include "parser/parse_error.hpp"
#include "parser/parse_bounds.hpp"

using sfx::Bytes;
using sfx::ParseErrorKind;
using sfx::Radix;

namespace {
    // "-int|frac" for a successful scan, the error message otherwise.
    template <Radix radix = Radix::dec>
    std::string bounds (std::string_view text, bool can_be_neg = true) {
        const auto result = sfx::parser::parse_bounds<radix>(Bytes{text}, can_be_neg);
        if (!result) {
            return std::string{result.error().msg()};
        }
        return std::string{result->neg ? "-" : ""}
            + std::string{result->int_digits.to_string_view()}
            + "|"
            + std::string{result->frac_digits.to_string_view()};
    }
}

TEST(ParseBounds, TrimsInsignificantZeros) {
    EXPECT_EQ(bounds("0012.3400"), "12|34");
    EXPECT_EQ(bounds("12"), "12|");
    EXPECT_EQ(bounds(".5"), "|5");
    EXPECT_EQ(bounds("5."), "5|");
    EXPECT_EQ(bounds("000.000"), "|");
    EXPECT_EQ(bounds("0"), "|");
    EXPECT_EQ(bounds("100.001"), "100|001");
}

TEST(ParseBounds, Signs) {
    EXPECT_EQ(bounds("-1.5"), "-1|5");
    EXPECT_EQ(bounds("+1.5"), "1|5");
    EXPECT_EQ(bounds("+1.5", false), "1|5");
    EXPECT_EQ(bounds("-1.5", false), "invalid digit found in string");
    EXPECT_EQ(bounds("--1"), "invalid digit found in string");
    EXPECT_EQ(bounds("1-"), "invalid digit found in string");
}

TEST(ParseBounds, NoDigits) {
    EXPECT_EQ(bounds(""), "string has no digits");
    EXPECT_EQ(bounds("-"), "string has no digits");
    EXPECT_EQ(bounds("+"), "string has no digits");
    EXPECT_EQ(bounds("."), "string has no digits");
    EXPECT_EQ(bounds("-."), "string has no digits");
}

TEST(ParseBounds, TooManyPoints) {
    EXPECT_EQ(bounds("1.2.3"), "more than one decimal point found in string");
    EXPECT_EQ(bounds(".."), "more than one decimal point found in string");
    EXPECT_EQ(bounds("0.0."), "more than one decimal point found in string");
}

TEST(ParseBounds, InvalidDigits) {
    EXPECT_EQ(bounds("1a"), "invalid digit found in string");
    EXPECT_EQ(bounds("1.5e3"), "invalid digit found in string");
    EXPECT_EQ(bounds("1_000"), "invalid digit found in string");
    EXPECT_EQ(bounds(" 1"), "invalid digit found in string");
    EXPECT_EQ(bounds(std::string_view{"1\0", 2}), "invalid digit found in string");
    EXPECT_EQ(bounds(std::string_view{"\0", 1}), "invalid digit found in string");
}

TEST(ParseBounds, FirstErrorWins) {
    EXPECT_EQ(bounds("1x.2.3"), "invalid digit found in string");
    EXPECT_EQ(bounds("1.2.x"), "more than one decimal point found in string");
}

TEST(ParseBounds, RadixDigits) {
    EXPECT_EQ(bounds<Radix::bin>("10.01"), "10|01");
    EXPECT_EQ(bounds<Radix::bin>("102"), "invalid digit found in string");
    EXPECT_EQ(bounds<Radix::oct>("777.7"), "777|7");
    EXPECT_EQ(bounds<Radix::oct>("8"), "invalid digit found in string");
    EXPECT_EQ(bounds<Radix::hex>("0aF.C0"), "aF|C");
    EXPECT_EQ(bounds<Radix::hex>("g"), "invalid digit found in string");
    EXPECT_EQ(bounds<Radix::dec>("a"), "invalid digit found in string");
}

TEST(ParseBounds, ScansSubviewOnly) {
    constexpr std::string_view text = "12.5junk";
    EXPECT_EQ(bounds(text.substr(0, 4)), "12|5");
}
