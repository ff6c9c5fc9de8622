#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <array>
#include <type_traits>
#include <concepts>

#include "../helper/ce.hpp"


namespace fast_math {

    // Leading zero count for every unsigned width, the argument must not be zero.
    #define METHOD_countl_zero(TYPE, CLZ, CLZ_ARG_TYPE)                                                                     \
    [[gnu::always_inline]] constexpr uint32_t countl_zero (TYPE x) {                                                        \
        constexpr uint32_t padding = std::numeric_limits< std::make_unsigned_t<CLZ_ARG_TYPE> >::digits                      \
                                   - std::numeric_limits<TYPE>::digits;                                                     \
        return static_cast<uint32_t>(CLZ(x)) - padding;                                                                     \
    }

    METHOD_countl_zero(unsigned long long, __builtin_clzll, unsigned long long)
    METHOD_countl_zero(unsigned long,      __builtin_clzl , unsigned long     )
    METHOD_countl_zero(unsigned int,       __builtin_clz  , int               )
    METHOD_countl_zero(unsigned short,     __builtin_clz  , int               )
    METHOD_countl_zero(unsigned char,      __builtin_clz  , int               )

    #undef METHOD_countl_zero

    [[gnu::always_inline]] constexpr uint32_t countl_zero (unsigned __int128 x) {
        const auto hi = static_cast<unsigned long long>(x >> 64);
        if (hi != 0) {
            return countl_zero(hi);
        }
        return 64 + countl_zero(static_cast<unsigned long long>(x));
    }

    namespace {

        template<std::unsigned_integral T, T base>
        consteval auto _make_next_pow_table () {
            constexpr size_t length = ce::max_exponent<T, base>;
            std::array<T, length> table {};
            T v = base;
            for (T& entry : table) {
                entry = v;
                v *= base;
            }
            return table;
        }

        template <std::unsigned_integral T>
        [[gnu::always_inline]] constexpr uint32_t _log2 (T x) {
            return std::numeric_limits<T>::digits - 1 - countl_zero(x);
        }
    }

    template <size_t base, std::unsigned_integral T>
    constexpr uint8_t log_unsafe (T value) {
        static_assert(base <= std::numeric_limits<T>::max(), "max input smaller then base");
        uint8_t log2 = _log2(value);
        if constexpr (base == 2) {
            return log2;
        } else if constexpr (ce::is_power_of_two<base>) {
            constexpr size_t base_log2 = ce::log2<base>;
            if constexpr (ce::is_power_of_two<base_log2>) {
                return log2 >> ce::log2<base_log2>;
            } else {
                return log2 / base_log2;
            }
        } else {
            constexpr uint8_t s = 8;
            constexpr size_t d = 1 << s;
            static_assert(d > std::numeric_limits<T>::digits - 1, "Error from compentsation ratio would be to big");
            constexpr uint8_t m = static_cast<uint8_t>(d / ce::log2f<ce::Double{base}>);
            uint8_t estimate = static_cast<uint16_t>(log2 * m) >> s;
            constexpr auto next_pow_table = _make_next_pow_table<T, base>();
            if (estimate >= next_pow_table.size()) {
                return estimate;
            }
            return estimate + (value >= next_pow_table[estimate]);
        }
    }
}
