#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/util>

#include "../helper/int_traits.hpp"
#include "../util/logger.hpp"


namespace sfx::math::wide {

    // Two word unsigned integer, value = hi * 2^N + lo.
    template <typename T>
    struct pair {
        T hi;
        T lo;

        [[nodiscard]] constexpr bool operator == (const pair&) const = default;
    };

    template <unsigned_bits T>
    struct div_result {
        T quot;
        T rem;
    };

    /**
     * @brief Full product of two words from four half word partial products
     * @param lhs The multiplicand
     * @param rhs The multiplier
     * @return The 2N bit product as {hi, lo}
     */
    template <unsigned_bits T>
    [[nodiscard]] constexpr pair<T> mul_hi_lo (T lhs, T rhs) {
        constexpr uint32_t half = nbits<T> / 2;
        constexpr T lo_mask = low_mask<T>(half);

        const T lhs_hi = sfx::shr(lhs, half);
        const T lhs_lo = gsl::narrow_cast<T>(lhs & lo_mask);
        const T rhs_hi = sfx::shr(rhs, half);
        const T rhs_lo = gsl::narrow_cast<T>(rhs & lo_mask);

        const T ll = gsl::narrow_cast<T>(lhs_lo * rhs_lo);
        const T lh = gsl::narrow_cast<T>(lhs_lo * rhs_hi);
        const T hl = gsl::narrow_cast<T>(lhs_hi * rhs_lo);
        const T hh = gsl::narrow_cast<T>(lhs_hi * rhs_hi);

        // hl + (ll >> half) can not overflow, adding lh can.
        const T partial_middle = gsl::narrow_cast<T>(hl + sfx::shr(ll, half));
        const T middle = gsl::narrow_cast<T>(partial_middle + lh);
        const T carry = middle < partial_middle ? sfx::shl(T{1}, half) : T{0};

        return {
            .hi = gsl::narrow_cast<T>(hh + sfx::shr(middle, half) + carry),
            .lo = gsl::narrow_cast<T>(sfx::shl(middle, half) | (ll & lo_mask))
        };
    }

    template <unsigned_bits T>
    [[nodiscard]] constexpr pair<T> add (pair<T> lhs, T rhs) {
        const T lo = gsl::narrow_cast<T>(lhs.lo + rhs);
        const T carry = lo < rhs ? 1 : 0;
        return {.hi = gsl::narrow_cast<T>(lhs.hi + carry), .lo = lo};
    }

    /**
     * @brief Left shift over both words
     * @param value The shifted value
     * @param shift Bit count, has to be less than 2N
     */
    template <unsigned_bits T>
    [[nodiscard]] constexpr pair<T> shl (pair<T> value, uint32_t shift) {
        constexpr uint32_t N = nbits<T>;
        CSSERT(shift, <, 2 * N);
        if (shift == 0) return value;
        if (shift >= N) {
            return {.hi = sfx::shl(value.lo, shift - N), .lo = 0};
        }
        return {
            .hi = gsl::narrow_cast<T>(sfx::shl(value.hi, shift) | sfx::shr(value.lo, N - shift)),
            .lo = sfx::shl(value.lo, shift)
        };
    }

    /**
     * @brief Logical right shift over both words
     * @param value The shifted value
     * @param shift Bit count, up to and including 2N
     */
    template <unsigned_bits T>
    [[nodiscard]] constexpr pair<T> shr (pair<T> value, uint32_t shift) {
        constexpr uint32_t N = nbits<T>;
        CSSERT(shift, <=, 2 * N);
        if (shift == 0) return value;
        if (shift == 2 * N) return {.hi = 0, .lo = 0};
        if (shift >= N) {
            return {.hi = 0, .lo = sfx::shr(value.hi, shift - N)};
        }
        return {
            .hi = sfx::shr(value.hi, shift),
            .lo = gsl::narrow_cast<T>(sfx::shr(value.lo, shift) | sfx::shl(value.hi, N - shift))
        };
    }

    /**
     * @brief Divides a two word dividend by a one word divisor
     * @param dividend The dividend, its high word has to be less than the divisor
     * @param divisor The non zero divisor
     * @return Quotient (fits one word by the precondition) and remainder
     * @note Knuth's algorithm D specialised to two half word quotient digits
     */
    template <unsigned_bits T>
    [[nodiscard]] constexpr div_result<T> div_rem (pair<T> dividend, T divisor) {
        constexpr uint32_t N = nbits<T>;
        constexpr uint32_t half = N / 2;
        constexpr T base = sfx::shl(T{1}, half);
        constexpr T lo_mask = low_mask<T>(half);

        BSSERT(divisor != 0);
        CSSERT(dividend.hi, <, divisor);

        if (dividend.hi == 0) {
            return {
                .quot = gsl::narrow_cast<T>(dividend.lo / divisor),
                .rem = gsl::narrow_cast<T>(dividend.lo % divisor)
            };
        }

        // Normalize so the divisor has its top bit set.
        const uint32_t s = leading_zeros(divisor);
        const T v = sfx::shl(divisor, s);
        const pair<T> u = shl(dividend, s);

        const T vn1 = sfx::shr(v, half);
        const T vn0 = gsl::narrow_cast<T>(v & lo_mask);
        const T un32 = u.hi;
        const T un1 = sfx::shr(u.lo, half);
        const T un0 = gsl::narrow_cast<T>(u.lo & lo_mask);

        T q1 = gsl::narrow_cast<T>(un32 / vn1);
        T rhat = gsl::narrow_cast<T>(un32 - q1 * vn1);
        while (q1 >= base || gsl::narrow_cast<T>(q1 * vn0) > gsl::narrow_cast<T>(sfx::shl(rhat, half) | un1)) {
            --q1;
            rhat = gsl::narrow_cast<T>(rhat + vn1);
            if (rhat >= base) break;
        }

        // Partial remainder is below v, so wrapping arithmetic is exact.
        const T un21 = gsl::narrow_cast<T>(sfx::shl(un32, half) + un1 - q1 * v);

        T q0 = gsl::narrow_cast<T>(un21 / vn1);
        rhat = gsl::narrow_cast<T>(un21 - q0 * vn1);
        while (q0 >= base || gsl::narrow_cast<T>(q0 * vn0) > gsl::narrow_cast<T>(sfx::shl(rhat, half) | un0)) {
            --q0;
            rhat = gsl::narrow_cast<T>(rhat + vn1);
            if (rhat >= base) break;
        }

        const T rem = gsl::narrow_cast<T>(sfx::shl(un21, half) + un0 - q0 * v);
        return {
            .quot = gsl::narrow_cast<T>(sfx::shl(q1, half) | q0),
            .rem = sfx::shr(rem, s)
        };
    }
}
