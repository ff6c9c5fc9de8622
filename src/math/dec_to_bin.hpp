#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <gsl/util>

#include "../helper/int_traits.hpp"
#include "../fast_math/pow.hpp"
#include "../util/logger.hpp"
#include "./wide.hpp"


namespace sfx::math {

    enum class Round : uint8_t {
        nearest,
        floor
    };

    namespace {
        // Double width helpers, native wider integer or manual word pair.

        template <unsigned_bits D>
        [[gnu::always_inline]] constexpr D _shift (D value, int32_t shift) {
            return shift >= 0 ? sfx::shl(value, gsl::narrow_cast<uint32_t>(shift))
                              : sfx::shr(value, gsl::narrow_cast<uint32_t>(-shift));
        }

        template <unsigned_bits T>
        [[gnu::always_inline]] constexpr wide::pair<T> _shift (wide::pair<T> value, int32_t shift) {
            return shift >= 0 ? wide::shl(value, gsl::narrow_cast<uint32_t>(shift))
                              : wide::shr(value, gsl::narrow_cast<uint32_t>(-shift));
        }

        template <unsigned_bits T, unsigned_bits D>
        [[gnu::always_inline]] constexpr D _add (D value, T addend) {
            return gsl::narrow_cast<D>(value + addend);
        }

        template <unsigned_bits T>
        [[gnu::always_inline]] constexpr wide::pair<T> _add (wide::pair<T> value, T addend) {
            return wide::add(value, addend);
        }

        // (value >> shift) >= limit
        template <unsigned_bits T, unsigned_bits D>
        [[gnu::always_inline]] constexpr bool _shifted_ge (D value, uint32_t shift, T limit) {
            return sfx::shr(value, shift) >= limit;
        }

        template <unsigned_bits T>
        [[gnu::always_inline]] constexpr bool _shifted_ge (wide::pair<T> value, uint32_t shift, T limit) {
            const wide::pair<T> shifted = wide::shr(value, shift);
            return shifted.hi != 0 || shifted.lo >= limit;
        }

        template <unsigned_bits T, unsigned_bits D>
        [[gnu::always_inline]] constexpr wide::div_result<T> _div_rem (D numer, T denom) {
            return {
                .quot = gsl::narrow_cast<T>(numer / denom),
                .rem = gsl::narrow_cast<T>(numer % denom)
            };
        }

        template <unsigned_bits T>
        [[gnu::always_inline]] constexpr wide::div_result<T> _div_rem (wide::pair<T> numer, T denom) {
            return wide::div_rem(numer, denom);
        }

        template <unsigned_bits T>
        consteval double_width_t<T> _half () {
            constexpr uint32_t dec = int_traits<T>::dec_digits;
            constexpr T fives = fast_math::pow<5, T>(dec);
            if constexpr (has_native_double_width<T>) {
                return _shift(double_width_t<T>{fives}, gsl::narrow_cast<int32_t>(dec - 1));
            } else {
                return _shift(wide::pair<T>{.hi = 0, .lo = fives}, gsl::narrow_cast<int32_t>(dec - 1));
            }
        }
    }

    /**
     * @brief Scales a packed decimal fraction to binary
     * @param val D packed decimal digits, the value val / 10^D, val < 10^D
     * @param nbits Number of result bits, at most N
     * @param round Floor or round to nearest with ties to even
     * @return floor or nearest of val * 2^nbits / 10^D, or nothing when the
     *         rounded value needs more than nbits bits
     * @note With nbits == 0 an exact half rounds to 0 instead of not fitting.
     */
    template <unsigned_bits T>
    [[nodiscard]] constexpr std::optional<T> dec_to_bin (double_width_t<T> val, uint32_t nbits, Round round) {
        using D = double_width_t<T>;
        constexpr uint32_t bin = int_traits<T>::nbits;
        constexpr uint32_t dec = int_traits<T>::dec_digits;
        constexpr T fives = fast_math::pow<5, T>(dec);
        constexpr T denom = gsl::narrow_cast<T>(fives * 2);
        static_assert(dec < bin, "packed digits have to be scaled up");

        CSSERT(nbits, <=, bin);

        // val * 2^(bin - dec + 1) fits D, shifting back down by (bin - nbits)
        // may drop bits. Those are tracked so a dropped remainder never
        // passes for an exact tie.
        const int32_t shift = gsl::narrow_cast<int32_t>(nbits) - gsl::narrow_cast<int32_t>(dec - 1);
        D numer = _shift(val, shift);
        const bool inexact = shift < 0 && !(_shift(numer, -shift) == val);

        if (round == Round::nearest) {
            numer = _add(numer, fives);
            if (_shifted_ge(numer, nbits, denom)) {
                if (nbits == 0 && val == _half<T>()) {
                    return T{0};
                }
                return std::nullopt;
            }
        }
        auto [quot, rem] = _div_rem(numer, denom);
        if (round == Round::nearest && rem == 0 && !inexact && is_odd(quot)) {
            --quot;
        }
        return quot;
    }
}
