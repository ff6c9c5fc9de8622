#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "bytes/bytes.hpp"
#include "bytes/digit_run.hpp"
#include "bytes/exp_digits.hpp"

using sfx::Bytes;
using sfx::DigitRun;
using sfx::ExpDigits;

namespace {
    DigitRun run_of (std::string_view text) {
        return DigitRun{Bytes{text}};
    }

    std::string collect (ExpDigits digits) {
        std::string out;
        while (const auto first = digits.split_first()) {
            out += first->first;
            digits = first->second;
        }
        return out;
    }

    // Integer and fraction streams of int.frac shifted by exp, as "int|frac".
    std::string shifted (std::string_view int_text, std::string_view frac_text, int32_t exp) {
        const auto streams = ExpDigits::new_int_frac(run_of(int_text), run_of(frac_text), exp);
        if (!streams) return "overflow";
        return collect(streams->first) + "|" + collect(streams->second);
    }
}

TEST(ExpDigits, New1CountsZeros) {
    const ExpDigits digits = ExpDigits::new1(run_of("0012300"));
    EXPECT_EQ(digits.leading_zero_count(), 2U);
    EXPECT_EQ(digits.trailing_zero_count(), 2U);
    EXPECT_EQ(digits.size(), 7U);
    EXPECT_EQ(collect(digits), "0012300");
}

TEST(ExpDigits, New2JoinsRuns) {
    const ExpDigits digits = ExpDigits::new2(run_of("00"), run_of("0450"));
    EXPECT_EQ(digits.leading_zero_count(), 3U);
    EXPECT_EQ(digits.trailing_zero_count(), 1U);
    EXPECT_EQ(collect(digits), "000450");

    const ExpDigits split_zeros = ExpDigits::new2(run_of("120"), run_of("00"));
    EXPECT_EQ(split_zeros.trailing_zero_count(), 3U);
    EXPECT_EQ(collect(split_zeros), "12000");
}

TEST(ExpDigits, NoShift) {
    EXPECT_EQ(shifted("0012", "3400", 0), "12|34");
    EXPECT_EQ(shifted("000", "000", 0), "|");
}

TEST(ExpDigits, ShiftLeftMovesFractionDigits) {
    EXPECT_EQ(shifted("1", "25", 1), "12|5");
    EXPECT_EQ(shifted("1", "25", 2), "125|");
    EXPECT_EQ(shifted("1", "25", 5), "125000|");
    EXPECT_EQ(shifted("", "05", 2), "5|");
}

TEST(ExpDigits, ShiftRightMovesIntegerDigits) {
    EXPECT_EQ(shifted("12", "5", -1), "1|25");
    EXPECT_EQ(shifted("12", "5", -2), "|125");
    EXPECT_EQ(shifted("12", "5", -4), "|00125");
    EXPECT_EQ(shifted("1_000", "", -3), "1|");
}

TEST(ExpDigits, SeparatorsAreIgnored) {
    EXPECT_EQ(shifted("1_2", "3_4", 1), "123|4");
}

TEST(ExpDigits, SplitAcrossParts) {
    const ExpDigits digits = ExpDigits::new2(run_of("0012"), run_of("3400"));
    const auto [head, tail] = digits.split(3);
    EXPECT_EQ(collect(head), "001");
    EXPECT_EQ(collect(tail), "23400");

    const auto [into_zeros, rest] = digits.split(7);
    EXPECT_EQ(collect(into_zeros), "0012340");
    EXPECT_EQ(collect(rest), "0");
}

TEST(ExpDigits, HugeShiftStaysImplicit) {
    const auto streams = ExpDigits::new_int_frac(run_of("1"), DigitRun{}, std::numeric_limits<int32_t>::min());
    ASSERT_TRUE(streams.has_value());
    EXPECT_TRUE(streams->first.empty());
    EXPECT_EQ(streams->second.size(), size_t{1} << 31);
    EXPECT_EQ(streams->second.leading_zero_count(), (size_t{1} << 31) - 1);
}
