#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <gsl/util>

#include "../helper/int_traits.hpp"
#include "../util/logger.hpp"
#include "../bytes/bytes.hpp"
#include "./radix.hpp"


namespace sfx::parser {

    /**
     * @brief Decimal digits to an integer without overflow checks
     * @note Only for runs short enough to fit T, e.g. the packed fraction digits.
     */
    template <unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr T dec_digits_to_int (Digits digits) {
        T acc = 0;
        while (const auto first = digits.split_first()) {
            acc = gsl::narrow_cast<T>(acc * 10 + unchecked_digit_value(first->first));
            digits = first->second;
        }
        return acc;
    }

    template <unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::optional<T> dec_str_int_to_bin (Digits digits) {
        T acc = 0;
        while (const auto first = digits.split_first()) {
            const auto scaled = checked_mul(acc, T{10});
            if (!scaled) return std::nullopt;
            const auto sum = checked_add(*scaled, T{unchecked_digit_value(first->first)});
            if (!sum) return std::nullopt;
            acc = *sum;
            digits = first->second;
        }
        return acc;
    }

    /**
     * @brief Digits of a power of two radix to an integer
     * @param digits Non empty run starting with a non zero digit
     * @return The value, or nothing if it needs more than N bits
     * @note The leading zero budget of the accumulator runs out before a
     *       shift could push set bits out of T.
     */
    template <uint32_t bits, unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::optional<T> pow2_str_int_to_bin (Digits digits) {
        auto first = digits.split_first();
        BSSERT(first.has_value());
        T acc = unchecked_digit_value(first->first);
        uint32_t budget = leading_zeros(acc);
        digits = first->second;
        while ((first = digits.split_first())) {
            if (budget < bits) return std::nullopt;
            budget -= bits;
            acc = gsl::narrow_cast<T>(sfx::shl(acc, bits) | unchecked_digit_value(first->first));
            digits = first->second;
        }
        return acc;
    }

    /**
     * @brief Integer digits to the integer bits of an N bit storage
     * @param digits Integer digits without leading zeros
     * @param int_nbits Number of integer bits I
     * @return The value shifted to the top I bits, or nothing if it needs
     *         more than I bits
     */
    template <Radix radix, unsigned_bits T, digit_sequence Digits>
    [[nodiscard]] constexpr std::optional<T> get_int (Digits digits, uint32_t int_nbits) {
        if (digits.empty()) {
            return T{0};
        }
        if (int_nbits == 0) {
            return std::nullopt;
        }
        std::optional<T> parsed;
        if constexpr (radix == Radix::dec) {
            parsed = dec_str_int_to_bin<T>(digits);
        } else {
            parsed = pow2_str_int_to_bin<bits_per_digit<radix>, T>(digits);
        }
        if (!parsed) {
            return std::nullopt;
        }
        const uint32_t remove_bits = nbits<T> - int_nbits;
        if (remove_bits > 0 && sfx::shr(*parsed, int_nbits) != 0) {
            return std::nullopt;
        }
        return sfx::shl(*parsed, remove_bits);
    }
}
