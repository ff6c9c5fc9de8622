#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "helper/int_traits.hpp"
#include "parser/parse_error.hpp"
#include "fixed/lit.hpp"
#include "fixed/fixed.hpp"
#include "./test_support.hpp"

using sfx::ParseErrorKind;
using sfx_test::describe;

namespace {
    template <sfx::fixed_bits Bits>
    std::string lit (std::string_view text, uint32_t frac_nbits) {
        return describe(sfx::lit_bits<Bits>(text, frac_nbits));
    }
}

TEST(LitBits, PrefixesAndSeparators) {
    EXPECT_EQ(lit<int16_t>("-0x1_F.8", 8), "0xe080");
    EXPECT_EQ(lit<uint16_t>("1_2_3.4_5", 4), "0x7b7");
    EXPECT_EQ(lit<uint8_t>("0o17", 0), "0xf");
    EXPECT_EQ(lit<uint8_t>("0b1010", 0), "0xa");
    EXPECT_EQ(lit<uint16_t>("0x1e2", 0), "0x1e2");
    EXPECT_EQ(lit<uint8_t>("_1_", 0), "0x1");
    EXPECT_EQ(lit<uint8_t>("+1.", 0), "0x1");
    EXPECT_EQ(lit<int16_t>("-1", 15), "0x8000");
}

TEST(LitBits, Exponents) {
    EXPECT_EQ(lit<uint32_t>("1.5e-3", 32), "0x624dd3");
    EXPECT_EQ(lit<uint16_t>("1e-3", 16), "0x42");
    EXPECT_EQ(lit<uint8_t>("125e-2", 2), "0x5");
    EXPECT_EQ(lit<uint8_t>("1E2", 0), "0x64");
    EXPECT_EQ(lit<uint8_t>("0.01e+2", 0), "0x1");
    EXPECT_EQ(lit<uint8_t>("0x1.8@1", 0), "0x18");
    EXPECT_EQ(lit<uint8_t>("0b101@-3", 8), "0xa0");
    EXPECT_EQ(lit<uint8_t>("1e-1_000", 8), "0x0");
    EXPECT_EQ(lit<uint8_t>("0e99", 0), "0x0");
    EXPECT_EQ(lit<uint8_t>("1e-2147483647", 0), "0x0");
    EXPECT_EQ(lit<uint8_t>("1e-2147483648", 0), "0x0");
    EXPECT_EQ(lit<uint8_t>("1e-2_147_483_648", 8), "0x0");
}

TEST(LitBits, MatchesPlainNumerals) {
    EXPECT_EQ(lit<int32_t>("-3141592653589793e-15", 29), "0x9b7812af");
    EXPECT_EQ(lit<int32_t>("-3.141592653589793", 29), "0x9b7812af");
    EXPECT_EQ(lit<uint8_t>("25e-1", 0), "0x2");
    EXPECT_EQ(lit<uint8_t>("35e-1", 0), "0x4");
}

TEST(LitBits, Errors) {
    EXPECT_EQ(lit<uint8_t>("", 0), "string has no digits");
    EXPECT_EQ(lit<uint8_t>(".", 0), "string has no digits");
    EXPECT_EQ(lit<uint8_t>("0x", 0), "string has no digits");
    EXPECT_EQ(lit<uint8_t>("1e", 0), "string has no digits");
    EXPECT_EQ(lit<uint8_t>("1e+", 0), "string has no digits");
    EXPECT_EQ(lit<uint8_t>("1ex", 0), "invalid digit found in string");
    EXPECT_EQ(lit<uint8_t>("0x1p3", 0), "invalid digit found in string");
    EXPECT_EQ(lit<uint8_t>("0o8", 0), "invalid digit found in string");
    EXPECT_EQ(lit<uint8_t>("-1", 0), "invalid digit found in string");
    EXPECT_EQ(lit<uint8_t>("1.2.3", 0), "more than one decimal point found in string");
    EXPECT_EQ(lit<uint8_t>("1e99999999999", 0), "overflow");
    EXPECT_EQ(lit<uint8_t>("1e1000", 0), "overflow");
    EXPECT_EQ(lit<uint8_t>("1e2147483648", 0), "overflow");
    EXPECT_EQ(lit<uint8_t>("1e-2147483649", 0), "overflow");
    EXPECT_EQ(lit<int8_t>("0x80", 0), "overflow");
    EXPECT_EQ(lit<int8_t>("-0x80", 0), "0x80");
}

TEST(LitBits, ConstantEvaluation) {
    constexpr auto bits = sfx::lit_bits<int16_t>("-0x1_F.8", 8);
    static_assert(bits.has_value() && *bits == -0x1f80);
    constexpr auto error = sfx::lit_bits<uint8_t>("1.2.3", 0);
    static_assert(!error.has_value() && error.error().kind() == ParseErrorKind::too_many_points);
    SUCCEED();
}

TEST(Fixed, Literal) {
    constexpr auto value = sfx::FixedI16<8>::lit<"-0x1_F.8">();
    static_assert(value.to_bits() == -0x1f80);
    static_assert(sfx::FixedU8<4>::lit<"0.40625">() == sfx::FixedU8<4>::from_bits(6));
    static_assert(sfx::FixedU128<0>::lit<"340_282_366_920_938_463_463_374_607_431_768_211_455">().to_bits() == ~sfx::u128{0});
    SUCCEED();
}

TEST(Fixed, FromStr) {
    const auto value = sfx::FixedU8<0>::from_str("127.5");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->to_bits(), 0x80);

    const auto error = sfx::FixedI8<7>::from_str("1");
    ASSERT_FALSE(error.has_value());
    EXPECT_EQ(error.error().kind(), ParseErrorKind::overflow);

    const auto hex = sfx::FixedU16<8>::from_str_radix("7F.FF8", sfx::Radix::hex);
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(*hex, sfx::FixedU16<8>::from_bits(0x8000));
}

TEST(Fixed, BitCounts) {
    static_assert(sfx::FixedI32<20>::INT_NBITS == 12);
    static_assert(sfx::FixedI32<20>::FRAC_NBITS == 20);
    static_assert(sfx::FixedU128<128>::INT_NBITS == 0);
    static_assert(sfx::FixedU8<0>::INT_NBITS == 8);
    SUCCEED();
}
