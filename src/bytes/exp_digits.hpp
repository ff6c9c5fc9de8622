#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <gsl/util>

#include "../util/logger.hpp"
#include "./digit_run.hpp"


namespace sfx {

    /**
     * @brief Digit stream shifted by a power of the radix
     *
     * Implicit leading zeros, up to two digit runs and implicit trailing
     * zeros. The padding an exponent introduces is only counted, never
     * materialized.
     */
    class ExpDigits {
    private:
        size_t leading_zeros = 0;
        DigitRun part1;
        DigitRun part2;
        size_t trailing_zeros = 0;

        constexpr ExpDigits (size_t leading_zeros, DigitRun part1, DigitRun part2, size_t trailing_zeros)
        : leading_zeros(leading_zeros), part1(part1), part2(part2), trailing_zeros(trailing_zeros) {}

    public:
        constexpr ExpDigits () = default;

        // One run with its leading and trailing zeros counted out.
        [[nodiscard]] static constexpr ExpDigits new1 (DigitRun digits) {
            const auto [leading, rest] = digits.split_leading_zeros();
            const auto [middle, trailing] = rest.split_trailing_zeros();
            return ExpDigits{leading, middle, DigitRun{}, trailing};
        }

        // Two adjacent runs read as one.
        [[nodiscard]] static constexpr ExpDigits new2 (DigitRun digits1, DigitRun digits2) {
            auto [leading, first] = digits1.split_leading_zeros();
            DigitRun second = digits2;
            if (first.empty()) {
                const auto [more_leading, rest] = digits2.split_leading_zeros();
                leading += more_leading;
                first = rest;
                second = DigitRun{};
            }
            auto [second_rest, trailing] = second.split_trailing_zeros();
            if (second_rest.empty()) {
                const auto [first_rest, more_trailing] = first.split_trailing_zeros();
                trailing += more_trailing;
                first = first_rest;
            }
            return ExpDigits{leading, first, second_rest, trailing};
        }

        /**
         * @brief Integer and fraction digits of int.frac * radix^exp
         * @param int_digits Digits before the point
         * @param frac_digits Digits after the point
         * @param exp Power of the radix to shift by
         * @return The integer stream without leading zeros and the fraction
         *         stream without trailing zeros, nothing if a length does not
         *         fit size_t
         */
        [[nodiscard]] static constexpr std::optional<std::pair<ExpDigits, ExpDigits>> new_int_frac (
            DigitRun int_digits,
            DigitRun frac_digits,
            int32_t exp
        ) {
            constexpr size_t max_size = std::numeric_limits<size_t>::max();
            ExpDigits int_part;
            ExpDigits frac_part;
            if (exp == 0) {
                int_part = new1(int_digits);
                frac_part = new1(frac_digits);
            } else if (exp < 0) {
                const size_t abs_exp = size_t{0} - gsl::narrow_cast<size_t>(static_cast<int64_t>(exp));
                if (abs_exp > max_size - frac_digits.size()) {
                    return std::nullopt;
                }
                if (abs_exp < int_digits.size()) {
                    const auto [int_head, int_tail] = int_digits.split(int_digits.size() - abs_exp);
                    int_part = new1(int_head);
                    frac_part = new2(int_tail, frac_digits);
                } else {
                    frac_part = new2(int_digits, frac_digits);
                    frac_part.leading_zeros += abs_exp - int_digits.size();
                }
            } else {
                const size_t abs_exp = gsl::narrow_cast<size_t>(exp);
                if (abs_exp > max_size - int_digits.size()) {
                    return std::nullopt;
                }
                if (abs_exp < frac_digits.size()) {
                    const auto [frac_head, frac_tail] = frac_digits.split(abs_exp);
                    int_part = new2(int_digits, frac_head);
                    frac_part = new1(frac_tail);
                } else {
                    int_part = new2(int_digits, frac_digits);
                    int_part.trailing_zeros += abs_exp - frac_digits.size();
                }
            }

            int_part.leading_zeros = 0;
            if (int_part.part1.empty() && int_part.part2.empty()) {
                int_part.trailing_zeros = 0;
            }
            frac_part.trailing_zeros = 0;
            if (frac_part.part1.empty() && frac_part.part2.empty()) {
                frac_part.leading_zeros = 0;
            }
            return std::pair<ExpDigits, ExpDigits>{int_part, frac_part};
        }

        [[nodiscard]] constexpr size_t size () const {
            return leading_zeros + part1.size() + part2.size() + trailing_zeros;
        }

        [[nodiscard]] constexpr bool empty () const { return size() == 0; }

        [[nodiscard]] constexpr size_t leading_zero_count () const { return leading_zeros; }

        [[nodiscard]] constexpr size_t trailing_zero_count () const { return trailing_zeros; }

        [[nodiscard]] constexpr std::pair<ExpDigits, ExpDigits> split (size_t digit_index) const {
            if (digit_index <= leading_zeros) {
                return {
                    ExpDigits{digit_index, DigitRun{}, DigitRun{}, 0},
                    ExpDigits{leading_zeros - digit_index, part1, part2, trailing_zeros}
                };
            }
            digit_index -= leading_zeros;
            if (digit_index <= part1.size()) {
                const auto [head, tail] = part1.split(digit_index);
                return {
                    ExpDigits{leading_zeros, head, DigitRun{}, 0},
                    ExpDigits{0, tail, part2, trailing_zeros}
                };
            }
            digit_index -= part1.size();
            if (digit_index <= part2.size()) {
                const auto [head, tail] = part2.split(digit_index);
                return {
                    ExpDigits{leading_zeros, part1, head, 0},
                    ExpDigits{0, DigitRun{}, tail, trailing_zeros}
                };
            }
            digit_index -= part2.size();
            CSSERT(digit_index, <=, trailing_zeros);
            return {
                ExpDigits{leading_zeros, part1, part2, digit_index},
                ExpDigits{trailing_zeros - digit_index, DigitRun{}, DigitRun{}, 0}
            };
        }

        // Leading and trailing zero counts are not renormalized afterwards.
        [[nodiscard]] constexpr std::optional<std::pair<char, ExpDigits>> split_first () const {
            if (leading_zeros > 0) {
                return std::pair<char, ExpDigits>{'0', ExpDigits{leading_zeros - 1, part1, part2, trailing_zeros}};
            }
            if (const auto first = part1.split_first()) {
                return std::pair<char, ExpDigits>{first->first, ExpDigits{0, first->second, part2, trailing_zeros}};
            }
            if (const auto first = part2.split_first()) {
                return std::pair<char, ExpDigits>{first->first, ExpDigits{0, part1, first->second, trailing_zeros}};
            }
            if (trailing_zeros > 0) {
                return std::pair<char, ExpDigits>{'0', ExpDigits{0, part1, part2, trailing_zeros - 1}};
            }
            return std::nullopt;
        }
    };

    static_assert(digit_sequence<ExpDigits>);
}
