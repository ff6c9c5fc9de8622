#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>
#include <gsl/util>

#include "../helper/int_traits.hpp"
#include "../util/logger.hpp"
#include "../bytes/bytes.hpp"
#include "../bytes/digit_run.hpp"
#include "../bytes/exp_digits.hpp"
#include "../parser/radix.hpp"
#include "../parser/parse_error.hpp"
#include "../parser/assemble.hpp"


namespace sfx {

    namespace {

        struct _LitParts {
            bool neg;
            Radix radix;
            DigitRun int_digits;
            DigitRun frac_digits;
            int32_t exp;
        };

        [[nodiscard]] constexpr bool _is_lit_digit (char c, Radix radix) {
            return c == '_' || digit_value(c, radix).has_value();
        }

        /*
         * Splits a literal into sign, radix, digit runs and exponent.
         *
         *   literal  = [sign] [prefix] digits ["." digits] [exponent]
         *   prefix   = "0b" | "0o" | "0x"
         *   exponent = ("e" | "E" | "@") [sign] dec_digits
         *
         * "e" and "E" only mark an exponent for decimal literals, "@" for any
         * radix. Underscores may appear anywhere between digits.
         */
        [[nodiscard]] constexpr ParseResult<_LitParts> _split_lit (std::string_view text, bool can_be_neg) {
            const size_t length = text.size();
            size_t i = 0;

            bool neg = false;
            if (i < length && (text[i] == '+' || text[i] == '-')) {
                if (text[i] == '-') {
                    if (!can_be_neg) return parse_error(ParseErrorKind::invalid_digit);
                    neg = true;
                }
                ++i;
            }

            Radix radix = Radix::dec;
            if (length - i >= 2 && text[i] == '0') {
                switch (text[i + 1]) {
                    case 'b': radix = Radix::bin; i += 2; break;
                    case 'o': radix = Radix::oct; i += 2; break;
                    case 'x': radix = Radix::hex; i += 2; break;
                    default: break;
                }
            }

            const size_t int_begin = i;
            while (i < length && _is_lit_digit(text[i], radix)) ++i;
            const DigitRun int_digits{Bytes{text.data() + int_begin, i - int_begin}};

            DigitRun frac_digits;
            if (i < length && text[i] == '.') {
                const size_t frac_begin = ++i;
                while (i < length && _is_lit_digit(text[i], radix)) ++i;
                frac_digits = DigitRun{Bytes{text.data() + frac_begin, i - frac_begin}};
                if (i < length && text[i] == '.') {
                    return parse_error(ParseErrorKind::too_many_points);
                }
            }

            int32_t exp = 0;
            bool exp_overflow = false;
            if (i < length && (text[i] == '@' || (radix == Radix::dec && (text[i] == 'e' || text[i] == 'E')))) {
                ++i;
                bool exp_neg = false;
                if (i < length && (text[i] == '+' || text[i] == '-')) {
                    exp_neg = text[i] == '-';
                    ++i;
                }
                bool has_exp_digits = false;
                int64_t magnitude = 0;
                for (; i < length; ++i) {
                    const char c = text[i];
                    if (c == '_') continue;
                    if (c < '0' || c > '9') break;
                    has_exp_digits = true;
                    if (magnitude <= std::numeric_limits<int32_t>::max()) {
                        magnitude = magnitude * 10 + (c - '0');
                    }
                }
                if (!has_exp_digits) {
                    return parse_error(i < length ? ParseErrorKind::invalid_digit : ParseErrorKind::no_digits);
                }
                // -2^31 has no positive counterpart
                const int64_t max_magnitude = int64_t{std::numeric_limits<int32_t>::max()} + (exp_neg ? 1 : 0);
                if (magnitude > max_magnitude) {
                    exp_overflow = true;
                } else {
                    exp = gsl::narrow_cast<int32_t>(exp_neg ? -magnitude : magnitude);
                }
            }

            if (i != length) {
                return parse_error(ParseErrorKind::invalid_digit);
            }
            if (int_digits.empty() && frac_digits.empty()) {
                return parse_error(ParseErrorKind::no_digits);
            }
            if (exp_overflow) {
                return parse_error(ParseErrorKind::overflow);
            }
            return _LitParts{
                .neg = neg,
                .radix = radix,
                .int_digits = int_digits,
                .frac_digits = frac_digits,
                .exp = exp
            };
        }
    }

    /**
     * @brief Converts a literal with prefixes, separators and exponent
     * @param text e.g. "-0x1_F.8", "1.5e-3", "0b1@4"
     * @param frac_nbits Fractional bits F, at most N
     * @return The storage bits or the reason the literal is rejected
     * @note Usable in constant expressions, see Fixed::lit.
     */
    template <fixed_bits Bits>
    [[nodiscard]] constexpr ParseResult<Bits> lit_bits (std::string_view text, uint32_t frac_nbits) {
        using U = unsigned_t<Bits>;
        CSSERT(frac_nbits, <=, nbits<Bits>);
        const auto parts = _split_lit(text, int_traits<Bits>::is_signed);
        if (!parts) {
            return std::unexpected{parts.error()};
        }
        const auto streams = ExpDigits::new_int_frac(parts->int_digits, parts->frac_digits, parts->exp);
        if (!streams) {
            return parse_error(ParseErrorKind::overflow);
        }
        const auto& [int_stream, frac_stream] = *streams;
        const uint32_t int_nbits = nbits<Bits> - frac_nbits;

        ParseResult<U> abs = parse_error(ParseErrorKind::invalid_digit);
        switch (parts->radix) {
            case Radix::bin: abs = parser::get_int_frac<Radix::bin, U>(int_stream, frac_stream, int_nbits, frac_nbits); break;
            case Radix::oct: abs = parser::get_int_frac<Radix::oct, U>(int_stream, frac_stream, int_nbits, frac_nbits); break;
            case Radix::dec: abs = parser::get_int_frac<Radix::dec, U>(int_stream, frac_stream, int_nbits, frac_nbits); break;
            case Radix::hex: abs = parser::get_int_frac<Radix::hex, U>(int_stream, frac_stream, int_nbits, frac_nbits); break;
        }
        return abs.and_then([neg = parts->neg](U value) { return parser::apply_sign<Bits>(neg, value); });
    }
}
