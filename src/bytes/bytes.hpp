#pragma once

#include <cstddef>
#include <cstdint>
#include <concepts>
#include <optional>
#include <string_view>
#include <utility>

#include "../util/logger.hpp"


namespace sfx {

    /*
     * Anything the digit converters can walk: a count of digits, an
     * emptiness check, a split at a digit index and a split of the first
     * digit. Separators and implicit zero padding stay hidden behind these.
     */
    template <typename T>
    concept digit_sequence = requires (const T t, size_t index) {
        { t.size() } -> std::same_as<size_t>;
        { t.empty() } -> std::same_as<bool>;
        { t.split(index) } -> std::same_as<std::pair<T, T>>;
        { t.split_first() } -> std::same_as<std::optional<std::pair<char, T>>>;
    };

    // Non owning view of a byte range, every access is bounds checked.
    class Bytes {
    public:
        constexpr Bytes () = default;
        constexpr Bytes (const char* ptr, size_t length) : ptr(ptr), length(length) {}
        constexpr explicit Bytes (std::string_view text) : ptr(text.data()), length(text.size()) {}

    private:
        const char* ptr = nullptr;
        size_t length = 0;

    public:
        [[nodiscard]] constexpr size_t size () const { return length; }

        [[nodiscard]] constexpr bool empty () const { return length == 0; }

        [[nodiscard]] constexpr const char* data () const { return ptr; }

        [[nodiscard]] constexpr const char* begin () const { return ptr; }

        [[nodiscard]] constexpr const char* end () const { return ptr + length; }

        [[nodiscard]] constexpr char get (size_t index) const {
            CSSERT(index, <, length);
            return ptr[index];
        }

        [[nodiscard]] constexpr std::pair<Bytes, Bytes> split (size_t index) const {
            CSSERT(index, <=, length);
            return {Bytes{ptr, index}, Bytes{ptr + index, length - index}};
        }

        [[nodiscard]] constexpr std::optional<std::pair<char, Bytes>> split_first () const {
            if (empty()) {
                return std::nullopt;
            }
            return std::pair<char, Bytes>{ptr[0], Bytes{ptr + 1, length - 1}};
        }

        [[nodiscard]] constexpr std::string_view to_string_view () const {
            return {ptr, length};
        }
    };

    static_assert(digit_sequence<Bytes>);
}
