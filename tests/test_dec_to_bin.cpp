#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

#include "helper/int_traits.hpp"
#include "math/wide.hpp"
#include "math/dec_to_bin.hpp"

using sfx::u128;
using sfx::math::Round;
using sfx::math::dec_to_bin;
namespace wide = sfx::math::wide;

namespace {
    constexpr u128 make_u128 (uint64_t hi, uint64_t lo) {
        return (u128{hi} << 64) | lo;
    }
}

// Packed values below are val / 1000 for 8 bit storage.

TEST(DecToBin, ScalesExactValues) {
    EXPECT_EQ(dec_to_bin<uint8_t>(500, 1, Round::nearest), 1);
    EXPECT_EQ(dec_to_bin<uint8_t>(500, 8, Round::nearest), 128);
    EXPECT_EQ(dec_to_bin<uint8_t>(125, 3, Round::nearest), 1);
    EXPECT_EQ(dec_to_bin<uint8_t>(0, 8, Round::nearest), 0);
}

TEST(DecToBin, FloorTruncates) {
    EXPECT_EQ(dec_to_bin<uint8_t>(999, 8, Round::floor), 255);
    EXPECT_EQ(dec_to_bin<uint8_t>(251, 1, Round::floor), 0);
    EXPECT_EQ(dec_to_bin<uint8_t>(999, 0, Round::floor), 0);
}

TEST(DecToBin, TiesGoToEven) {
    EXPECT_EQ(dec_to_bin<uint8_t>(250, 1, Round::nearest), 0);
    EXPECT_EQ(dec_to_bin<uint8_t>(750, 1, Round::nearest), std::nullopt);
    EXPECT_EQ(dec_to_bin<uint8_t>(375, 2, Round::nearest), 2);
    EXPECT_EQ(dec_to_bin<uint8_t>(625, 2, Round::nearest), 2);
}

TEST(DecToBin, DroppedBitsBreakTies) {
    // 0.251 * 2 lies above the half, the bit shifted out must not be lost.
    EXPECT_EQ(dec_to_bin<uint8_t>(251, 1, Round::nearest), 1);
    EXPECT_EQ(dec_to_bin<uint8_t>(249, 1, Round::nearest), 0);
}

TEST(DecToBin, ZeroBitsHalfRoundsDown) {
    EXPECT_EQ(dec_to_bin<uint8_t>(500, 0, Round::nearest), 0);
    EXPECT_EQ(dec_to_bin<uint8_t>(400, 0, Round::nearest), 0);
    EXPECT_EQ(dec_to_bin<uint8_t>(501, 0, Round::nearest), std::nullopt);
}

TEST(DecToBin, CarryOutOfBitsIsNothing) {
    EXPECT_EQ(dec_to_bin<uint8_t>(999, 8, Round::nearest), std::nullopt);
    EXPECT_EQ(dec_to_bin<uint8_t>(998, 8, Round::nearest), 255);
}

TEST(DecToBin, SixteenBits) {
    // 0.1 * 2^16 = 6553.6
    EXPECT_EQ(dec_to_bin<uint16_t>(100000, 16, Round::nearest), 6554);
    EXPECT_EQ(dec_to_bin<uint16_t>(100000, 16, Round::floor), 6553);
}

TEST(DecToBin, SixtyFourBits) {
    // 0.1 with 27 digits, 0.1 * 2^64 = 1844674407370955161.6
    const u128 tenth = u128{100'000'000'000'000'000ULL} * 1'000'000'000ULL;
    EXPECT_EQ(dec_to_bin<uint64_t>(tenth, 64, Round::nearest), 0x199999999999999aULL);
    EXPECT_EQ(dec_to_bin<uint64_t>(tenth, 64, Round::floor), 0x1999999999999999ULL);
}

TEST(DecToBin, WideOneTwentyEightBits) {
    // 0.123456789012345678901234567987654321098765432109876543 packed in 54 digits
    const wide::pair<u128> val{
        .hi = 0x149f8901b4fa6ULL,
        .lo = make_u128(0x80c05d4ade76b08cULL, 0xc1e791a8d523453fULL)
    };
    const auto nearest = dec_to_bin<u128>(val, 128, Round::nearest);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_TRUE(*nearest == make_u128(0x1f9add3746f65f1cULL, 0x3f968ac5ab7f1bb8ULL));

    const auto floor = dec_to_bin<u128>(val, 128, Round::floor);
    ASSERT_TRUE(floor.has_value());
    EXPECT_TRUE(*floor == make_u128(0x1f9add3746f65f1cULL, 0x3f968ac5ab7f1bb7ULL));
}
