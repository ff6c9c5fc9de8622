#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>

#include "../util/logger.hpp"


namespace sfx {

    enum class ParseErrorKind : uint8_t {
        invalid_digit,
        no_digits,
        too_many_points,
        overflow
    };

    [[nodiscard]] constexpr std::string_view error_message (ParseErrorKind kind) {
        switch (kind) {
            case ParseErrorKind::invalid_digit:   return "invalid digit found in string";
            case ParseErrorKind::no_digits:       return "string has no digits";
            case ParseErrorKind::too_many_points: return "more than one decimal point found in string";
            case ParseErrorKind::overflow:        return "overflow";
        }
        std::unreachable();
    }

    // Why a string could not be converted, no position or other payload.
    class ParseFixedError {
    public:
        constexpr explicit ParseFixedError (ParseErrorKind kind) : _kind(kind) {}

    private:
        ParseErrorKind _kind;

    public:
        [[nodiscard]] constexpr ParseErrorKind kind () const { return _kind; }

        [[nodiscard]] constexpr std::string_view msg () const { return error_message(_kind); }

        [[nodiscard]] constexpr bool operator == (const ParseFixedError&) const = default;

        template <typename writer_params>
        void log (const logger::writer<writer_params>& lw) const {
            lw.template write<true, true>(msg());
        }
    };

    template <typename T>
    using ParseResult = std::expected<T, ParseFixedError>;

    [[nodiscard]] constexpr std::unexpected<ParseFixedError> parse_error (ParseErrorKind kind) {
        return std::unexpected{ParseFixedError{kind}};
    }
}
