#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <algorithm>
#include <gsl/util>

#include "../helper/int_traits.hpp"
#include "../util/logger.hpp"
#include "../fast_math/pow.hpp"
#include "../math/wide.hpp"
#include "../math/dec_to_bin.hpp"
#include "../bytes/bytes.hpp"
#include "./radix.hpp"
#include "./parse_int.hpp"


namespace sfx::parser {

    /**
     * @brief Fraction digits of a power of two radix to nbits bits
     * @param digits Non empty run without trailing zeros
     * @param nbits Number of fractional bits F
     * @return The nearest F bit value, ties to even, or nothing if rounding
     *         carries out of the F bits
     */
    template <uint32_t bits, unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::optional<T> pow2_str_frac_to_bin (Digits digits, uint32_t nbits) {
        BSSERT(!digits.empty());
        const uint32_t dump_bits = sfx::nbits<T> - nbits;
        uint32_t rem_bits = nbits;
        T acc = 0;
        while (const auto first = digits.split_first()) {
            const uint8_t val = unchecked_digit_value(first->first);
            digits = first->second;
            if (rem_bits < bits) {
                // The digit straddles the last kept bit, its next bit is the half bit.
                acc = gsl::narrow_cast<T>(sfx::shl(acc, rem_bits) + (val >> (bits - rem_bits)));
                const uint8_t half = gsl::narrow_cast<uint8_t>(1U << (bits - 1 - rem_bits));
                if ((val & half) != 0) {
                    if ((val & (half - 1)) != 0 || !digits.empty() || is_odd(acc)) {
                        const auto rounded = checked_add(acc, T{1});
                        if (!rounded) return std::nullopt;
                        acc = *rounded;
                    }
                }
                if (dump_bits != 0 && sfx::shr(acc, nbits) != 0) {
                    return std::nullopt;
                }
                return acc;
            }
            acc = gsl::narrow_cast<T>(sfx::shl(acc, bits) | val);
            rem_bits -= bits;
        }
        return sfx::shl(acc, rem_bits);
    }

    /**
     * @brief Packs the first D fraction digits into one double width value
     * @return The packed value val / 10^D, zero padded when fewer digits
     *         exist, and whether no digit was left out
     */
    template <unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::pair<double_width_t<T>, bool> pack_dec_digits (Digits digits) {
        constexpr uint32_t dec = int_traits<T>::dec_digits;
        if constexpr (has_native_double_width<T>) {
            using D = double_width_t<T>;
            if (digits.size() <= dec) {
                const auto pad = fast_math::pow<10, D>(gsl::narrow_cast<uint32_t>(dec - digits.size()));
                return {gsl::narrow_cast<D>(dec_digits_to_int<D>(digits) * pad), true};
            }
            return {dec_digits_to_int<D>(digits.split(dec).first), false};
        } else {
            // hi * 10^(D/2) + lo, each half fits one word.
            constexpr uint32_t half = dec / 2;
            constexpr T scale = fast_math::pow<10, T>(half);
            const auto [hi_digits, rest] = digits.split(std::min<size_t>(digits.size(), half));
            const T hi = gsl::narrow_cast<T>(
                dec_digits_to_int<T>(hi_digits) * fast_math::pow<10, T>(gsl::narrow_cast<uint32_t>(half - hi_digits.size()))
            );
            T lo;
            bool is_short;
            if (rest.size() <= half) {
                lo = gsl::narrow_cast<T>(
                    dec_digits_to_int<T>(rest) * fast_math::pow<10, T>(gsl::narrow_cast<uint32_t>(half - rest.size()))
                );
                is_short = true;
            } else {
                lo = dec_digits_to_int<T>(rest.split(half).first);
                is_short = false;
            }
            return {math::wide::add(math::wide::mul_hi_lo(hi, scale), lo), is_short};
        }
    }

    /**
     * @brief Decimal fraction digits to nbits bits, correctly rounded
     *
     * Up to D digits the packed value is rounded directly. Longer inputs get
     * the floor from the packed prefix, then the digits are compared one by
     * one with the decimal expansion of floor + 1/2 ulp to decide between
     * floor and floor + 1.
     *
     * @param digits Non empty run without trailing zeros
     * @param nbits Number of fractional bits F
     * @return The nearest F bit value, ties to even, or nothing if rounding
     *         carries out of the F bits
     */
    template <unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::optional<T> dec_str_frac_to_bin (Digits digits, uint32_t nbits) {
        constexpr uint32_t N = sfx::nbits<T>;
        const auto [val, is_short] = pack_dec_digits<T>(digits);
        const uint32_t dump_bits = N - nbits;

        const auto floor = math::dec_to_bin<T>(val, nbits, is_short ? math::Round::nearest : math::Round::floor);
        if (is_short || !floor) {
            return floor;
        }

        // boundary / 2^N is floor + 1/2 ulp, add_5 supplies the half when no bit is dumped.
        T boundary;
        bool add_5 = false;
        if (nbits == 0) {
            boundary = sfx::shl(T{1}, N - 1);
        } else if (dump_bits == 0) {
            boundary = *floor;
            add_5 = true;
        } else {
            boundary = gsl::narrow_cast<T>(sfx::shl(*floor, dump_bits) + sfx::shl(T{1}, dump_bits - 1));
        }

        bool above = false;
        while (const auto first = digits.split_first()) {
            digits = first->second;
            if (!add_5 && boundary == 0) {
                // Trailing zeros are trimmed, so the rest holds a non zero digit.
                above = true;
                break;
            }
            const auto [digit_word, rest_word] = math::wide::mul_hi_lo(boundary, T{10});
            T boundary_digit = digit_word;
            boundary = rest_word;
            if (add_5) {
                const auto sum = checked_add(boundary, T{5});
                boundary = gsl::narrow_cast<T>(boundary + 5);
                if (!sum) {
                    ++boundary_digit;
                }
                add_5 = false;
            }
            const uint8_t digit = unchecked_digit_value(first->first);
            if (digit < boundary_digit) {
                return floor;
            }
            if (digit > boundary_digit) {
                above = true;
                break;
            }
        }
        if (!above) {
            if (boundary != 0 || add_5) {
                // Input ran out first, it lies below the boundary.
                return floor;
            }
            if (!is_odd(*floor)) {
                return floor;
            }
        }
        const auto next_up = checked_add(*floor, T{1});
        if (!next_up || (dump_bits != 0 && sfx::shr(*next_up, nbits) != 0)) {
            return std::nullopt;
        }
        return next_up;
    }

    /**
     * @brief Fraction digits to the low F bits of an N bit storage
     * @param digits Fraction digits without trailing zeros
     * @param nbits Number of fractional bits F
     * @return Nothing when the rounded fraction does not fit F bits, which the
     *         caller turns into a carry into the integer part
     */
    template <Radix radix, unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::optional<T> get_frac (Digits digits, uint32_t nbits) {
        if (digits.empty()) {
            return T{0};
        }
        if constexpr (radix == Radix::dec) {
            return dec_str_frac_to_bin<T>(digits, nbits);
        } else {
            return pow2_str_frac_to_bin<bits_per_digit<radix>, T>(digits, nbits);
        }
    }
}
