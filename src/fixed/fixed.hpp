#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../helper/int_traits.hpp"
#include "../util/string_literal.hpp"
#include "../parser/radix.hpp"
#include "../parser/parse_error.hpp"
#include "../parser/from_str.hpp"
#include "./lit.hpp"


namespace sfx {

    /**
     * @brief Fixed point number stored as Bits scaled by 2^-frac_nbits
     *
     * Only construction is provided, from raw bits, from text at run time and
     * from a literal at compile time.
     */
    template <fixed_bits Bits, uint32_t frac_nbits>
    class Fixed {
        static_assert(frac_nbits <= nbits<Bits>, "More fractional bits than storage bits");

    public:
        using bits_type = Bits;

        static constexpr uint32_t INT_NBITS = nbits<Bits> - frac_nbits;
        static constexpr uint32_t FRAC_NBITS = frac_nbits;

    private:
        constexpr explicit Fixed (Bits bits) : bits(bits) {}

        Bits bits;

    public:
        [[nodiscard]] static constexpr Fixed from_bits (Bits bits) {
            return Fixed{bits};
        }

        [[nodiscard]] constexpr Bits to_bits () const {
            return bits;
        }

        [[nodiscard]] static ParseResult<Fixed> from_str (std::string_view text) {
            return sfx::from_str<Bits>(text, frac_nbits).transform(from_bits);
        }

        [[nodiscard]] static ParseResult<Fixed> from_str_radix (std::string_view text, Radix radix) {
            return sfx::from_str_radix<Bits>(text, radix, frac_nbits).transform(from_bits);
        }

        /*
         * Literal converted during compilation, e.g. FixedI16<8>::lit<"-0x1_F.8">().
         * Malformed or out of range literals do not compile.
         */
        template <StringLiteral text>
        [[nodiscard]] static consteval Fixed lit () {
            const auto result = lit_bits<Bits>(text.to_string_view(), frac_nbits);
            if (!result) throw; // Literal rejected, see result.error().msg()
            return Fixed{*result};
        }

        [[nodiscard]] constexpr bool operator == (const Fixed&) const = default;
    };

    template <uint32_t frac_nbits> using FixedI8   = Fixed<int8_t,   frac_nbits>;
    template <uint32_t frac_nbits> using FixedI16  = Fixed<int16_t,  frac_nbits>;
    template <uint32_t frac_nbits> using FixedI32  = Fixed<int32_t,  frac_nbits>;
    template <uint32_t frac_nbits> using FixedI64  = Fixed<int64_t,  frac_nbits>;
    template <uint32_t frac_nbits> using FixedI128 = Fixed<i128,     frac_nbits>;
    template <uint32_t frac_nbits> using FixedU8   = Fixed<uint8_t,  frac_nbits>;
    template <uint32_t frac_nbits> using FixedU16  = Fixed<uint16_t, frac_nbits>;
    template <uint32_t frac_nbits> using FixedU32  = Fixed<uint32_t, frac_nbits>;
    template <uint32_t frac_nbits> using FixedU64  = Fixed<uint64_t, frac_nbits>;
    template <uint32_t frac_nbits> using FixedU128 = Fixed<u128,     frac_nbits>;
}
