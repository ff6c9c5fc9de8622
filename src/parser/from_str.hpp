#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "../helper/int_traits.hpp"
#include "../util/logger.hpp"
#include "../bytes/bytes.hpp"
#include "./radix.hpp"
#include "./parse_error.hpp"
#include "./assemble.hpp"
// Generated by re2c from parse_bounds.re2c.hpp
#include "parser/parse_bounds.hpp"


namespace sfx::parser {

    template <signed_bits Bits, Radix radix>
    [[nodiscard]] inline ParseResult<Bits> from_str_signed (Bytes bytes, uint32_t frac_nbits) {
        using U = unsigned_t<Bits>;
        const auto bounds = parse_bounds<radix>(bytes, true);
        if (!bounds) {
            return std::unexpected{bounds.error()};
        }
        return get_int_frac<radix, U>(bounds->int_digits, bounds->frac_digits, nbits<Bits> - frac_nbits, frac_nbits)
            .and_then([neg = bounds->neg](U abs) { return apply_sign<Bits>(neg, abs); });
    }

    template <unsigned_bits Bits, Radix radix>
    [[nodiscard]] inline ParseResult<Bits> from_str_unsigned (Bytes bytes, uint32_t frac_nbits) {
        const auto bounds = parse_bounds<radix>(bytes, false);
        if (!bounds) {
            return std::unexpected{bounds.error()};
        }
        return get_int_frac<radix, Bits>(bounds->int_digits, bounds->frac_digits, nbits<Bits> - frac_nbits, frac_nbits);
    }

    template <fixed_bits Bits, Radix radix>
    [[nodiscard]] inline ParseResult<Bits> from_str (Bytes bytes, uint32_t frac_nbits) {
        if constexpr (int_traits<Bits>::is_signed) {
            return from_str_signed<Bits, radix>(bytes, frac_nbits);
        } else {
            return from_str_unsigned<Bits, radix>(bytes, frac_nbits);
        }
    }
}

namespace sfx {

    /**
     * @brief Converts a numeral to the bits of a fixed point number
     * @param text Optional sign, digits of the radix and at most one point
     * @param radix Radix of the digits
     * @param frac_nbits Fractional bits F, at most N
     * @return The two's complement storage bits scaled by 2^F, or the reason
     *         the text could not be converted
     */
    template <fixed_bits Bits>
    [[nodiscard]] inline ParseResult<Bits> from_str_radix (std::string_view text, Radix radix, uint32_t frac_nbits) {
        CSSERT(frac_nbits, <=, nbits<Bits>);
        const Bytes bytes{text};
        switch (radix) {
            case Radix::bin: return parser::from_str<Bits, Radix::bin>(bytes, frac_nbits);
            case Radix::oct: return parser::from_str<Bits, Radix::oct>(bytes, frac_nbits);
            case Radix::dec: return parser::from_str<Bits, Radix::dec>(bytes, frac_nbits);
            case Radix::hex: return parser::from_str<Bits, Radix::hex>(bytes, frac_nbits);
        }
        std::unreachable();
    }

    template <fixed_bits Bits>
    [[nodiscard]] inline ParseResult<Bits> from_str (std::string_view text, uint32_t frac_nbits) {
        return from_str_radix<Bits>(text, Radix::dec, frac_nbits);
    }
}
