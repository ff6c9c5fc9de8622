#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <gsl/util>

#include "../helper/int_traits.hpp"
#include "../bytes/bytes.hpp"
#include "./radix.hpp"
#include "./parse_error.hpp"
#include "./parse_int.hpp"
#include "./parse_frac.hpp"


namespace sfx::parser {

    // Trimmed fraction digits are exactly one half when they are the single digit radix / 2.
    template <Radix radix, digit_sequence Digits>
    [[nodiscard]] constexpr bool frac_is_half (const Digits& digits) {
        if (digits.size() != 1) return false;
        const auto first = digits.split_first();
        return unchecked_digit_value(first->first) == static_cast<uint8_t>(radix) / 2;
    }

    /**
     * @brief Joins integer and fraction bits into the magnitude
     * @param int_digits Integer digits without leading zeros
     * @param frac_digits Fraction digits without trailing zeros
     * @param int_nbits Integer bits I
     * @param frac_nbits Fractional bits F, I + F = N
     * @return The unsigned magnitude or Overflow
     */
    template <Radix radix, unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr ParseResult<T> get_int_frac (
        const Digits& int_digits,
        const Digits& frac_digits,
        uint32_t int_nbits,
        uint32_t frac_nbits
    ) {
        CSSERT(int_nbits + frac_nbits, ==, nbits<T>);
        const std::optional<T> int_val = get_int<radix, T>(int_digits, int_nbits);
        if (!int_val) {
            return parse_error(ParseErrorKind::overflow);
        }
        const std::optional<T> frac_val = get_frac<radix, T>(frac_digits, frac_nbits);
        const bool frac_overflow = !frac_val.has_value();
        if (frac_overflow && int_nbits == 0) {
            return parse_error(ParseErrorKind::overflow);
        }
        const T val = gsl::narrow_cast<T>(*int_val | frac_val.value_or(T{0}));
        // With F == 0 an odd integer plus exactly one half rounds up to even.
        if (frac_overflow || (is_odd(*int_val) && frac_nbits == 0 && frac_is_half<radix>(frac_digits))) {
            const auto carried = checked_add(val, sfx::shl(T{1}, frac_nbits));
            if (!carried) {
                return parse_error(ParseErrorKind::overflow);
            }
            return *carried;
        }
        return val;
    }

    /**
     * @brief Applies the sign and checks the magnitude against the storage range
     * @param neg Whether a leading minus was seen, only for signed Bits
     * @param abs The magnitude
     * @return Two's complement bits, or Overflow above 2^(N-1) for negative and
     *         above 2^(N-1) - 1 for positive signed values
     */
    template <fixed_bits Bits>
    [[nodiscard]] constexpr ParseResult<Bits> apply_sign (bool neg, unsigned_t<Bits> abs) {
        using U = unsigned_t<Bits>;
        if constexpr (int_traits<Bits>::is_signed) {
            constexpr U msb = sfx::shl(U{1}, nbits<Bits> - 1);
            if (neg) {
                if (abs > msb) {
                    return parse_error(ParseErrorKind::overflow);
                }
                return static_cast<Bits>(gsl::narrow_cast<U>(U{0} - abs));
            }
            if (abs > msb - 1) {
                return parse_error(ParseErrorKind::overflow);
            }
            return static_cast<Bits>(abs);
        } else {
            BSSERT(!neg);
            return abs;
        }
    }
}
