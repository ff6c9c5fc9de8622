#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "../helper/ce.hpp"


namespace sfx {

    enum class Radix : uint8_t {
        bin = 2,
        oct = 8,
        dec = 10,
        hex = 16
    };

    template <Radix radix>
    constexpr bool is_pow2_radix = ce::is_power_of_two<static_cast<size_t>(radix)>;

    template <Radix radix>
    requires (is_pow2_radix<radix>)
    constexpr uint32_t bits_per_digit = ce::log2<static_cast<size_t>(radix)>;

    // Value of an ASCII digit if it is valid for the radix, hex digits in either case.
    [[nodiscard]] constexpr std::optional<uint8_t> digit_value (char c, Radix radix) {
        uint8_t value;
        if (c >= '0' && c <= '9') {
            value = static_cast<uint8_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value = static_cast<uint8_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value = static_cast<uint8_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
        if (value >= static_cast<uint8_t>(radix)) {
            return std::nullopt;
        }
        return value;
    }

    // For digits already validated by a scanner.
    [[nodiscard, gnu::always_inline]] constexpr uint8_t unchecked_digit_value (char c) {
        if (c <= '9') return static_cast<uint8_t>(c - '0');
        return static_cast<uint8_t>((c | 0x20) - 'a' + 10);
    }
}
