#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "helper/int_traits.hpp"
#include "parser/from_str.hpp"

using sfx::u128;

namespace {
    // Nearest value of 0.digits * 2^frac_nbits with ties to even, computed
    // with plain 128 bit arithmetic. Nothing when it does not fit 16 bits,
    // a fraction rounding up to one carries into the integer bits.
    std::optional<uint16_t> reference (const std::string& digits, uint32_t frac_nbits) {
        u128 numer = 0;
        u128 denom = 1;
        for (const char c : digits) {
            numer = numer * 10 + static_cast<uint32_t>(c - '0');
            denom *= 10;
        }
        numer <<= frac_nbits;
        u128 quot = numer / denom;
        const u128 rem = numer % denom;
        if (rem * 2 > denom || (rem * 2 == denom && (quot & 1) != 0)) {
            ++quot;
        }
        if (quot > 0xffff) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(quot);
    }

    std::optional<uint16_t> convert (const std::string& digits, uint32_t frac_nbits) {
        const auto result = sfx::from_str<uint16_t>("0." + digits, frac_nbits);
        if (!result) {
            EXPECT_EQ(result.error().kind(), sfx::ParseErrorKind::overflow) << digits;
            return std::nullopt;
        }
        return *result;
    }

    // Decimal digits of (2k + 1) / 2^(frac_nbits + 1), exactly halfway between two steps.
    std::string halfway (uint64_t k, uint32_t frac_nbits) {
        uint64_t fives = 1;
        for (uint32_t i = 0; i <= frac_nbits; ++i) fives *= 5;
        std::string digits = std::to_string((2 * k + 1) * fives);
        digits.insert(0, frac_nbits + 1 - digits.size(), '0');
        return digits;
    }

    std::string decrement (std::string digits) {
        size_t i = digits.size();
        while (digits[--i] == '0') digits[i] = '9';
        --digits[i];
        return digits;
    }
}

TEST(ExactDecimal, HalfwayPointsRoundToEven) {
    for (uint32_t frac_nbits = 0; frac_nbits <= 16; ++frac_nbits) {
        const uint64_t steps = uint64_t{1} << frac_nbits;
        for (uint64_t k = 0; k < steps; k += 1 + steps / 64) {
            const std::string tie = halfway(k, frac_nbits);
            EXPECT_EQ(convert(tie, frac_nbits), reference(tie, frac_nbits)) << tie << " F=" << frac_nbits;

            // Just above, with the deciding digit far beyond the packed prefix.
            const std::string above = tie + "000000000000000000001";
            EXPECT_EQ(convert(above, frac_nbits), reference(tie + "1", frac_nbits)) << above;

            const std::string below = decrement(tie) + "99999999999999999999";
            EXPECT_EQ(convert(below, frac_nbits), reference(decrement(tie), frac_nbits)) << below;
        }
    }
}

TEST(ExactDecimal, RandomDigitsMatchReference) {
    std::mt19937_64 rng{20240611};
    std::uniform_int_distribution<uint32_t> length_dist{1, 20};
    std::uniform_int_distribution<uint32_t> digit_dist{0, 9};
    std::uniform_int_distribution<uint32_t> frac_dist{0, 16};
    for (int i = 0; i < 20000; ++i) {
        std::string digits;
        const uint32_t length = length_dist(rng);
        for (uint32_t j = 0; j < length; ++j) {
            digits += static_cast<char>('0' + digit_dist(rng));
        }
        const uint32_t frac_nbits = frac_dist(rng);
        EXPECT_EQ(convert(digits, frac_nbits), reference(digits, frac_nbits)) << digits << " F=" << frac_nbits;
    }
}

TEST(ExactDecimal, TruncatedPrefixIsNotATie) {
    // The digits run out before the half way expansion does.
    EXPECT_EQ(sfx::from_str<uint8_t>("0.0058593", 8), uint8_t{1});
    EXPECT_EQ(sfx::from_str<uint8_t>("0.251", 1), uint8_t{1});
}
