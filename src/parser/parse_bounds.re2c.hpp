#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

// Included relative to src/, the generated copy of this file lives in the build tree.
#include "bytes/bytes.hpp"
#include "parser/parse_error.hpp"
#include "parser/radix.hpp"

/*!re2c
    re2c:yyfill:enable = 0;
    re2c:define:YYCTYPE = "unsigned char";

    re2c:api = generic;
    re2c:api:style = free-form;

    re2c:define:YYPEEK       = "_peek(bytes, YYCURSOR)";
    re2c:define:YYSKIP       = "++YYCURSOR;";

    zero = "0";
    non_zero = [1-9a-fA-F];
    nul = [\x00];
*/

namespace sfx::parser {

    struct ParseBounds {
        bool neg;
        Bytes int_digits;
        Bytes frac_digits;
    };

    namespace {
        // Past the end reads as NUL, a NUL action tells both apart by the cursor.
        [[gnu::always_inline]] inline unsigned char _peek (const Bytes& bytes, size_t cursor) {
            return cursor < bytes.size() ? static_cast<unsigned char>(bytes.get(cursor)) : 0;
        }
    }

    /**
     * @brief Validates a numeral and locates its significant digits
     * @param bytes The numeral, optional sign, digits and at most one point
     * @param can_be_neg Whether a leading minus is accepted
     * @return Sign, integer digits without leading zeros and fraction digits
     *         without trailing zeros, or the first structural error
     */
    template <Radix radix>
    [[nodiscard]] inline ParseResult<ParseBounds> parse_bounds (const Bytes bytes, const bool can_be_neg) {
        const size_t YYLIMIT = bytes.size();
        size_t YYCURSOR = 0;

        bool neg = false;
        bool has_digits = false;
        size_t int_begin = 0;
        size_t int_end = 0;
        size_t frac_begin = 0;
        size_t frac_end = 0;

        /*!local:re2c
            "+"         { goto after_sign; }
            "-"         {
                if (!can_be_neg) return parse_error(ParseErrorKind::invalid_digit);
                neg = true;
                goto after_sign;
            }
            "."         { frac_begin = frac_end = YYCURSOR; goto fraction; }
            zero        { has_digits = true; goto int_zeros; }
            non_zero    {
                if (!digit_value(static_cast<char>(yych), radix)) return parse_error(ParseErrorKind::invalid_digit);
                has_digits = true;
                int_begin = YYCURSOR - 1;
                goto int_digits;
            }
            nul         {
                if (YYCURSOR > YYLIMIT) return parse_error(ParseErrorKind::no_digits);
                return parse_error(ParseErrorKind::invalid_digit);
            }
            *           { return parse_error(ParseErrorKind::invalid_digit); }
        */
        std::unreachable();

        after_sign: {
            /*!local:re2c
                "."         { frac_begin = frac_end = YYCURSOR; goto fraction; }
                zero        { has_digits = true; goto int_zeros; }
                non_zero    {
                    if (!digit_value(static_cast<char>(yych), radix)) return parse_error(ParseErrorKind::invalid_digit);
                    has_digits = true;
                    int_begin = YYCURSOR - 1;
                    goto int_digits;
                }
                nul         {
                    if (YYCURSOR > YYLIMIT) return parse_error(ParseErrorKind::no_digits);
                    return parse_error(ParseErrorKind::invalid_digit);
                }
                *           { return parse_error(ParseErrorKind::invalid_digit); }
            */
        }
        std::unreachable();

        int_zeros: {
            /*!local:re2c
                zero        { goto int_zeros; }
                non_zero    {
                    if (!digit_value(static_cast<char>(yych), radix)) return parse_error(ParseErrorKind::invalid_digit);
                    int_begin = YYCURSOR - 1;
                    goto int_digits;
                }
                "."         { frac_begin = frac_end = YYCURSOR; goto fraction; }
                nul         {
                    if (YYCURSOR > YYLIMIT) goto done;
                    return parse_error(ParseErrorKind::invalid_digit);
                }
                *           { return parse_error(ParseErrorKind::invalid_digit); }
            */
        }
        std::unreachable();

        int_digits: {
            /*!local:re2c
                zero        { goto int_digits; }
                non_zero    {
                    if (!digit_value(static_cast<char>(yych), radix)) return parse_error(ParseErrorKind::invalid_digit);
                    goto int_digits;
                }
                "."         {
                    int_end = YYCURSOR - 1;
                    frac_begin = frac_end = YYCURSOR;
                    goto fraction;
                }
                nul         {
                    if (YYCURSOR > YYLIMIT) {
                        int_end = YYLIMIT;
                        goto done;
                    }
                    return parse_error(ParseErrorKind::invalid_digit);
                }
                *           { return parse_error(ParseErrorKind::invalid_digit); }
            */
        }
        std::unreachable();

        fraction: {
            /*!local:re2c
                zero        { has_digits = true; goto fraction; }
                non_zero    {
                    if (!digit_value(static_cast<char>(yych), radix)) return parse_error(ParseErrorKind::invalid_digit);
                    has_digits = true;
                    frac_end = YYCURSOR;
                    goto fraction;
                }
                "."         { return parse_error(ParseErrorKind::too_many_points); }
                nul         {
                    if (YYCURSOR > YYLIMIT) goto done;
                    return parse_error(ParseErrorKind::invalid_digit);
                }
                *           { return parse_error(ParseErrorKind::invalid_digit); }
            */
        }
        std::unreachable();

        done:
        if (!has_digits) {
            return parse_error(ParseErrorKind::no_digits);
        }
        return ParseBounds{
            .neg = neg,
            .int_digits = Bytes{bytes.data() + int_begin, int_end - int_begin},
            .frac_digits = Bytes{bytes.data() + frac_begin, frac_end - frac_begin}
        };
    }
}
