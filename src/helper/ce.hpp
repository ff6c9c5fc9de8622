#pragma once

#include <cstddef>
#include <cstdint>
#include <bit>
#include <numbers>
#include <utility>
#include <gsl/util>


namespace ce {

    // Facbook Infer bug workaround
    template <typename T>
    struct Wrapped {
        consteval explicit Wrapped (T value) : value(value) {}
        T value;
    };

    using Double = Wrapped<double>;


    template <typename T, T... Values, typename F>
    constexpr void for_(F&& lambda, std::integer_sequence<T, Values...> /*unused*/) {
        (std::forward<F>(lambda).template operator()<Values>(), ...);
    }

    namespace {

        // Works for every unsigned width including unsigned __int128, which
        // can not be a size_t template argument without truncation.
        template <size_t base, typename T>
        consteval size_t _log (T value) {
            static_assert(base > 1, "log base has to be greater than one");
            size_t result = 0;
            while (value >= base) {
                value /= base;
                ++result;
            }
            return result;
        }

        template <typename T, size_t base>
        consteval size_t _max_exponent () {
            size_t exponent = 0;
            T value = 1;
            while (value <= static_cast<T>(~T{0}) / base) {
                value = gsl::narrow_cast<T>(value * base);
                ++exponent;
            }
            return exponent;
        }
    }

    template <size_t base, auto value>
    constexpr size_t log = _log<base>(value);

    template <auto value>
    constexpr size_t log10 = log<10, value>;

    template <auto value>
    constexpr size_t log2 = log<2, value>;

    // Largest exponent e with base^e representable in the unsigned type T.
    template <typename T, size_t base>
    constexpr size_t max_exponent = _max_exponent<T, base>();

    namespace {

        template <size_t i>
        constexpr double _log2f_coefficient = gsl::narrow_cast<double>(
            ((i % 2 == 0) ? 1.0L : -1.0L)
            / ((i + 1) * std::numbers::ln2_v<long double>)
        );

        template <Double x>
        consteval double _log2f () {
            static_assert(x.value > 0, "log2(x) undefined for non-positive x");

            constexpr size_t double_digits = 64;
            constexpr size_t sign_digits = 1;
            constexpr size_t mantissa_digits = 52;
            constexpr size_t exponent_digits = double_digits - mantissa_digits - sign_digits;
            constexpr size_t exponent_bias = 1023;
            static_assert(exponent_bias < (size_t{1} << exponent_digits), "Bias shouldn't exceed exponent space");

            constexpr uint64_t mantissa_mask = ((uint64_t{1} << mantissa_digits) - 1);

            constexpr uint64_t bits = std::bit_cast<uint64_t>(x.value);
            constexpr int64_t exp = ((bits >> mantissa_digits) & mantissa_mask) - exponent_bias;
            constexpr uint64_t mantissa_bits = bits & mantissa_mask;
            constexpr double mantissa = 1.0 + (double{mantissa_bits} / double{uint64_t{1} << mantissa_digits});

            // y = M - 1 in [0,1)
            constexpr double y = mantissa - 1.0;

            double y_pow = y;
            double log2_mantissa = 0.0;
            for_([&]<size_t i>() {
                log2_mantissa += _log2f_coefficient<i> * y_pow;
                y_pow *= y;
            }, std::make_index_sequence<13>{});

            return exp + log2_mantissa;
        }
    }

    template <Double value>
    constexpr double log2f = _log2f<value>();

    template <size_t N>
    constexpr bool is_power_of_two = (N != 0) && ((N & (N - 1)) == 0);
}
