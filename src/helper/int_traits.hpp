#pragma once

#include <cstddef>
#include <cstdint>
#include <concepts>
#include <optional>
#include <gsl/util>

#include "../fast_math/log.hpp"


namespace sfx {

    using u128 = unsigned __int128;
    using i128 = __int128;

    namespace math::wide {
        template <typename T>
        struct pair;
    }

    template <typename T>
    concept unsigned_bits =
           std::same_as<T, uint8_t>
        || std::same_as<T, uint16_t>
        || std::same_as<T, uint32_t>
        || std::same_as<T, uint64_t>
        || std::same_as<T, u128>;

    template <typename T>
    concept signed_bits =
           std::same_as<T, int8_t>
        || std::same_as<T, int16_t>
        || std::same_as<T, int32_t>
        || std::same_as<T, int64_t>
        || std::same_as<T, i128>;

    template <typename T>
    concept fixed_bits = unsigned_bits<T> || signed_bits<T>;

    /**
     * @brief Integer width capability used by the conversion engine.
     *
     * `dec_digits` is the number of decimal digits D packed into one value
     * before scaling, chosen so that `5^D` and `2 * 5^D` fit the storage and
     * `10^D << (N - D + 1)` fits the double width. `double_type` is the next
     * wider native type, or a manual two word pair where none exists.
     */
    template <fixed_bits T>
    struct int_traits;

    #define INT_TRAITS(UNSIGNED, SIGNED, DOUBLE, DEC_DIGITS)    \
    template <>                                                 \
    struct int_traits<UNSIGNED> {                               \
        using unsigned_type = UNSIGNED;                         \
        using signed_type = SIGNED;                             \
        using double_type = DOUBLE;                             \
        static constexpr bool is_signed = false;                \
        static constexpr uint32_t nbits = sizeof(UNSIGNED) * 8; \
        static constexpr uint32_t dec_digits = DEC_DIGITS;      \
    };                                                          \
    template <>                                                 \
    struct int_traits<SIGNED> : int_traits<UNSIGNED> {          \
        static constexpr bool is_signed = true;                 \
    };

    INT_TRAITS(uint8_t,  int8_t,  uint16_t,               3 )
    INT_TRAITS(uint16_t, int16_t, uint32_t,               6 )
    INT_TRAITS(uint32_t, int32_t, uint64_t,               13)
    INT_TRAITS(uint64_t, int64_t, u128,                   27)
    INT_TRAITS(u128,     i128,    math::wide::pair<u128>, 54)

    #undef INT_TRAITS

    template <fixed_bits T>
    constexpr uint32_t nbits = int_traits<T>::nbits;

    template <fixed_bits T>
    using unsigned_t = typename int_traits<T>::unsigned_type;

    template <unsigned_bits T>
    using double_width_t = typename int_traits<T>::double_type;

    template <unsigned_bits T>
    constexpr bool has_native_double_width = unsigned_bits<double_width_t<T>>;

    template <unsigned_bits T>
    constexpr T max_value = gsl::narrow_cast<T>(~T{0});

    template <unsigned_bits T>
    [[nodiscard]] constexpr std::optional<T> checked_add (T lhs, T rhs) {
        T result {};
        if (__builtin_add_overflow(lhs, rhs, &result)) {
            return std::nullopt;
        }
        return result;
    }

    template <unsigned_bits T>
    [[nodiscard]] constexpr std::optional<T> checked_sub (T lhs, T rhs) {
        T result {};
        if (__builtin_sub_overflow(lhs, rhs, &result)) {
            return std::nullopt;
        }
        return result;
    }

    template <unsigned_bits T>
    [[nodiscard]] constexpr std::optional<T> checked_mul (T lhs, T rhs) {
        T result {};
        if (__builtin_mul_overflow(lhs, rhs, &result)) {
            return std::nullopt;
        }
        return result;
    }

    // Shift that stays in T, small widths would otherwise promote to int.
    template <unsigned_bits T>
    [[nodiscard, gnu::always_inline]] constexpr T shl (T value, uint32_t shift) {
        return gsl::narrow_cast<T>(value << shift);
    }

    template <unsigned_bits T>
    [[nodiscard, gnu::always_inline]] constexpr T shr (T value, uint32_t shift) {
        return gsl::narrow_cast<T>(value >> shift);
    }

    template <unsigned_bits T>
    [[nodiscard, gnu::always_inline]] constexpr T low_mask (uint32_t bits) {
        return bits >= nbits<T> ? max_value<T> : gsl::narrow_cast<T>(shl(T{1}, bits) - 1);
    }

    template <unsigned_bits T>
    [[nodiscard, gnu::always_inline]] constexpr bool is_odd (T value) {
        return (value & 1) != 0;
    }

    template <unsigned_bits T>
    [[nodiscard, gnu::always_inline]] constexpr uint32_t leading_zeros (T value) {
        return value == 0 ? nbits<T> : fast_math::countl_zero(value);
    }
}
