#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <array>

#include "../helper/ce.hpp"
#include "../util/logger.hpp"


namespace fast_math {

    namespace {
        template <std::unsigned_integral T, size_t base>
        consteval auto make_pow_table () {
            constexpr size_t length = ce::max_exponent<T, base> + 1;
            std::array<T, length> table {};
            T v = 1;
            for (size_t i = 0; i < length; ++i) {
                table[i] = v;
                if (i + 1 < length) {
                    v = gsl::narrow_cast<T>(v * base);
                }
            }
            return table;
        }
    }

    // base^n from a table holding every power that fits ReturnT.
    template <size_t base, std::unsigned_integral ReturnT = uint64_t>
    [[gnu::always_inline]] constexpr ReturnT pow (uint32_t n) {
        static_assert(base <= std::numeric_limits<ReturnT>::max(), "base exceedes return type capacity");
        constexpr auto table = make_pow_table<ReturnT, base>();
        CSSERT(n, <, table.size());
        return table[n];
    }
}
