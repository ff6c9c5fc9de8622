#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../util/logger.hpp"
#include "./bytes.hpp"


namespace sfx {

    /**
     * @brief Digits interleaved with a separator byte
     *
     * Neither the first nor the last byte of the run is a separator. Indices
     * passed to split count digits only, separators are skipped.
     */
    template <char sep>
    class SeparatedRun {
    private:
        constexpr SeparatedRun (const char* ptr, size_t digits, size_t seps) : ptr(ptr), digits(digits), seps(seps) {}

        const char* ptr = nullptr;
        size_t digits = 0;
        size_t seps = 0;

        [[nodiscard]] constexpr Bytes bytes () const {
            return Bytes{ptr, digits + seps};
        }

    public:
        constexpr SeparatedRun () = default;

        // Trims separators at both ends of the byte range.
        constexpr explicit SeparatedRun (Bytes bytes) : ptr(bytes.data()) {
            size_t pending_seps = 0;
            for (const char c : bytes) {
                if (c == sep) {
                    ++pending_seps;
                    continue;
                }
                if (digits == 0) {
                    ptr += pending_seps;
                } else {
                    seps += pending_seps;
                }
                ++digits;
                pending_seps = 0;
            }
        }

        [[nodiscard]] constexpr size_t size () const { return digits; }

        [[nodiscard]] constexpr bool empty () const { return digits == 0; }

        [[nodiscard]] constexpr size_t separator_count () const { return seps; }

        [[nodiscard]] constexpr std::pair<SeparatedRun, SeparatedRun> split (size_t digit_index) const {
            CSSERT(digit_index, <=, digits);
            const size_t last_digits = digits - digit_index;
            if (last_digits == 0) {
                return {*this, SeparatedRun{}};
            }

            const Bytes all = bytes();
            size_t remaining_digits = digit_index;
            size_t first_seps = 0;
            size_t index = 0;
            while (remaining_digits > 0) {
                if (all.get(index) != sep) {
                    --remaining_digits;
                } else {
                    ++first_seps;
                }
                ++index;
            }

            // Separators between both halves belong to neither.
            size_t last_seps = seps - first_seps;
            while (all.get(index) == sep) {
                --last_seps;
                ++index;
            }
            return {
                SeparatedRun{ptr, digit_index, first_seps},
                SeparatedRun{ptr + index, last_digits, last_seps}
            };
        }

        [[nodiscard]] constexpr std::optional<std::pair<char, SeparatedRun>> split_first () const {
            if (empty()) {
                return std::nullopt;
            }
            const Bytes all = bytes();
            const char first = all.get(0);
            const size_t rest_digits = digits - 1;
            if (rest_digits == 0) {
                return std::pair<char, SeparatedRun>{first, SeparatedRun{}};
            }
            size_t index = 1;
            size_t rest_seps = seps;
            while (all.get(index) == sep) {
                --rest_seps;
                ++index;
            }
            return std::pair<char, SeparatedRun>{first, SeparatedRun{ptr + index, rest_digits, rest_seps}};
        }

        [[nodiscard]] constexpr std::optional<std::pair<SeparatedRun, char>> split_last () const {
            if (empty()) {
                return std::nullopt;
            }
            const Bytes all = bytes();
            const char last = all.get(all.size() - 1);
            const size_t rest_digits = digits - 1;
            if (rest_digits == 0) {
                return std::pair<SeparatedRun, char>{SeparatedRun{}, last};
            }
            size_t index = all.size() - 2;
            size_t rest_seps = seps;
            while (all.get(index) == sep) {
                --rest_seps;
                --index;
            }
            return std::pair<SeparatedRun, char>{SeparatedRun{ptr, rest_digits, rest_seps}, last};
        }

        [[nodiscard]] constexpr std::pair<size_t, SeparatedRun> split_leading_zeros () const {
            size_t zeros = 0;
            SeparatedRun rest = *this;
            while (true) {
                const auto first = rest.split_first();
                if (!first || first->first != '0') break;
                ++zeros;
                rest = first->second;
            }
            return {zeros, rest};
        }

        [[nodiscard]] constexpr std::pair<SeparatedRun, size_t> split_trailing_zeros () const {
            size_t zeros = 0;
            SeparatedRun rest = *this;
            while (true) {
                const auto last = rest.split_last();
                if (!last || last->second != '0') break;
                ++zeros;
                rest = last->first;
            }
            return {rest, zeros};
        }
    };

    using DigitRun = SeparatedRun<'_'>;

    static_assert(digit_sequence<DigitRun>);
}
