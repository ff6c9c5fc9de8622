#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <gsl/util>
#include <string_view>
#include <utility>
#include <type_traits>
#include <limits>
#include <concepts>
#include <boost/preprocessor/stringize.hpp>
#include <nameof.hpp>

#include "../util/string_literal.hpp"
#include "../helper/ce.hpp"
#include "../fast_math/log.hpp"

#include <unistd.h>
#include <poll.h>


namespace escape_sequences::colors::bright::foreground {
    constexpr auto red     = "91"_sl;
    constexpr auto green   = "92"_sl;
} // namespace escape_sequences::colors::bright::foreground

namespace logger_detail {
    template <bool outer_is_first_, bool outer_is_last_>
    struct writer_params {
        static constexpr bool outer_is_first = outer_is_first_;
        static constexpr bool outer_is_last = outer_is_last_;
    };

    template <typename ParamsT>
    class writer;
}

template <typename T> 
concept trivially_loggable =
       std::is_same_v<std::string_view, T>
    || std::is_constructible_v<std::string_view, T> 
    || std::is_integral_v<T>
    || (std::is_array_v<T> && std::is_same_v<std::remove_extent_t<T>, const char>)
    || is_string_literal_v<T>;

template <typename T>
concept custom_loggable = requires (T t) {
    { t.log(std::declval<logger_detail::writer<logger_detail::writer_params<false, false>>>()) } -> std::same_as<void>;
    { t.log(std::declval<logger_detail::writer<logger_detail::writer_params<false, true >>>()) } -> std::same_as<void>;
    { t.log(std::declval<logger_detail::writer<logger_detail::writer_params<true , false>>>()) } -> std::same_as<void>;
    { t.log(std::declval<logger_detail::writer<logger_detail::writer_params<true , true >>>()) } -> std::same_as<void>;
};


template <typename T>
concept loggable = trivially_loggable<T> || custom_loggable<T>;

class logger {
public:
    template <typename ParamsT>
    friend class logger_detail::writer;
    template <typename ParamsT>
    using writer = logger_detail::writer<ParamsT>;

    static constexpr size_t buffer_size = 1 << 12;
    static constexpr size_t buffer_alignment = std::max(buffer_size, 4096UL);

    template <StringLiteral name, StringLiteral color_code>
    static constexpr auto log_level = "\033["_sl + color_code + "m["_sl + name + "]\033[0m "_sl;

    static constexpr auto info_prefix = log_level<"INFO", escape_sequences::colors::bright::foreground::green>;
    static constexpr auto error_prefix = log_level<"ERROR", escape_sequences::colors::bright::foreground::red>;
    
private:
    alignas(64) char _buffer_a[buffer_size] {};
    alignas(64) char _buffer_b[buffer_size] {};

    char* buffer = _buffer_a;
    char* other_buffer = _buffer_b;

    char* buffer_end = buffer + buffer_size;
    char* buffer_dst = buffer;

    struct ::pollfd output_pollfd;

public:
    /*
     * Writes to an already open fd, the fd is not closed. A non blocking fd
     * is polled for up to 10s before the write gives up.
     */
    explicit logger (const int output_fd)
    : output_pollfd({
        .fd = output_fd,
        .events = POLLOUT,
        .revents = 0
    }) {}

    logger (const logger&) = delete;
    logger (logger&&) = delete;
    logger& operator = (const logger&) = delete;
    logger& operator = (logger&&) = delete;

private:
    void _handled_write (const char* src, size_t size) {
        size_t left = size;
        try_write:
        auto write_result = ::write(output_pollfd.fd, src, left);
        if (write_result >= 0) {
            if (gsl::narrow_cast<size_t>(write_result) == left) return;
            left -= write_result;
            src += write_result;
            goto try_write;
        }
        if (write_result == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                auto poll_result = ::poll(&output_pollfd, 1, 10000);
                if (poll_result == 1) [[likely]] goto try_write;
                if (poll_result == 0) {
                    std::puts("[logger::_handled_write] poll timed out.");
                } else if (poll_result == -1) {
                    std::perror("[logger::_handled_write] poll failed.");
                } else {
                    std::puts("[logger::_handled_write] poll unexpected result.");
                }
            } else {
                std::perror("[logger::_handled_write] write failed.");
            }
        } else {
            std::puts("[logger::_handled_write] write unexpected result.");
        }
        std::exit(1);
    }

    void flush_buffer (size_t size) {
        _handled_write(buffer, size);
        std::swap(buffer, other_buffer);
        buffer_end = buffer + buffer_size;
        // buffer_dst has to be manualy set after calling this function - enables some micro optimizations
    }

    template <bool is_first, bool is_last>
    requires (is_first)
    void write_string_view (const char* begin, size_t length) {
        if constexpr (is_last) {
            _handled_write(begin, length);
        } else {
            if (length >= buffer_size) {
                _handled_write(begin, length);
            } else {
                std::memcpy(buffer, begin, length);
                buffer_dst += length;
            }
        }
    }

    template <bool is_first, bool is_last>
    requires (!is_first) 
    void write_string_view (const char* begin, size_t length) {
        if (buffer_dst == buffer) {
            return write_string_view<true, is_last>(begin, length);
        }
        size_t free_space = buffer_end - buffer_dst;
        if (free_space >= length) {
            if constexpr (is_last) {
                std::memcpy(buffer_dst, begin, length);
                flush_buffer(buffer_dst - buffer + length);
                buffer_dst = buffer;
            } else /* if constexpr (!is_last) */ {
                std::memcpy(buffer_dst, begin, length);
                buffer_dst += length;
            }
        } else {
            if constexpr (is_last) {
                flush_buffer(buffer_dst - buffer);
                buffer_dst = buffer;
                _handled_write(begin, length);
            } else {
                std::memcpy(buffer_dst, begin, free_space);
                flush_buffer(buffer_size);
                size_t remaining = length - free_space;
                if (remaining >= buffer_size) {
                    _handled_write(begin + free_space, remaining);
                    buffer_dst = buffer;
                } else {
                    std::memcpy(buffer, begin + free_space, remaining);
                    buffer_dst = buffer + remaining;
                }
            }
        }
    }

    template <bool is_first, bool is_last>
    [[gnu::always_inline]] void write (const std::string_view& msg) {
        return write_string_view<is_first, is_last>(msg.data(), msg.size());
    }
    template <bool is_first, bool is_last, size_t N>
    [[gnu::always_inline]] void write (const char (&value)[N]) {
        return write_string_view<is_first, is_last>(static_cast<const char*>(value), N - 1);
    }
    template <bool is_first, bool is_last, size_t N>
    [[gnu::always_inline]] void write (const StringLiteral<N>& value) {
        return write_string_view<is_first, is_last>(static_cast<const char*>(value.data), N - 1);
    }
    template <bool is_first, bool is_last, typename T>
    requires (!trivially_loggable<std::remove_cvref_t<T>>)
    [[gnu::always_inline]] void write (const T& loggable) {
        loggable.log(writer<logger_detail::writer_params<is_first, is_last>>{*this});
    }

    template <bool is_first, bool is_last, char C>
    [[gnu::always_inline]] void write_char () {
        if constexpr (is_last) {
            if constexpr (is_first) {
                constexpr char char_buffer[1] = {C};
                _handled_write(char_buffer, 1);
            } else {
                *(buffer_dst++) = C;
                flush_buffer(buffer_dst - buffer);
                buffer_dst = buffer;
            }
        } else /* if constexpr (!is_last) */ {
            *(buffer_dst++) = C;
            if constexpr (!is_first || buffer_size <= 1) {
                if (buffer_dst == buffer_end) {
                    flush_buffer(buffer_size);
                    buffer_dst = buffer;
                }
            }
        }
    }

    template <bool is_first, bool is_last, bool is_negative, std::unsigned_integral T>
    void write_nonzero (T value) {
        uint8_t log10_of_value = fast_math::log_unsafe<10>(value);
        constexpr size_t sign_size = is_negative ? 1 : 0;
        if constexpr (is_negative) {
            *(buffer_dst++) = '-';
        }
        size_t length = log10_of_value + 1;
        char* end; // End is only initialized if !is_first
        if constexpr (!is_first || buffer_size <= (ce::log10<std::numeric_limits<T>::max()> + 1 + sign_size)) {
            end = buffer_dst + length;
            if (end >= buffer_end) {
                flush_buffer(buffer_dst - buffer);
                buffer_dst = buffer;
                end = buffer_dst + length;
            }
        }
        buffer_dst += log10_of_value;
        *(buffer_dst--) = '0' + (value % 10);
        value /= 10;
        while (value > 0) {
            *(buffer_dst--) = '0' + (value % 10);
            value /= 10;
        }
        if constexpr (is_last) {
            if constexpr (is_first) {
                flush_buffer(length);
            } else /* if constexpr (!is_first) */ {
                flush_buffer(end - buffer);
            }
            buffer_dst = buffer;
        } else {
            if constexpr (is_first) {
                buffer_dst = buffer + length;
            } else {
                buffer_dst = end;
            }
        }
    }

    template <bool is_first, bool is_last, std::unsigned_integral T>
    [[gnu::always_inline]] void write (T value) {
        if (value == 0) {
            write_char<is_first, is_last, '0'>();
        } else {
            write_nonzero<is_first, is_last, false>(value);
        }
    }

    template <bool is_first, bool is_last, std::signed_integral T>
    [[gnu::always_inline]] void write (T value) {
        using U = std::make_unsigned_t<T>;
        if (value == 0) {
            write_char<is_first, is_last, '0'>();
        } else if (value < 0) {
            write_nonzero<false, is_last, true>(U{0} - static_cast<U>(value));
        } else {
            write_nonzero<false, is_last, false>(static_cast<U>(value));
        }
    }

    template <StringLiteral value, bool has_buffered, bool buffered, bool no_newline>
    [[gnu::always_inline]] void _write_value () {
        if constexpr (no_newline) {
            write<!has_buffered, !buffered>(value);
        } else {
            write<!has_buffered, !buffered>(value + "\n"_sl);
        }
    }

    template <StringLiteral value, bool buffered, bool no_newline = false>
    [[gnu::always_inline]] void write_values () {
        if (buffer_dst == buffer) {
            _write_value<value, false, buffered, no_newline>();
        } else {
            _write_value<value, true, buffered, no_newline>();
        }
    }

    template <StringLiteral prefix, bool has_buffered, bool buffered, bool no_newline, typename... T>
    requires (sizeof...(T) > 0 && !no_newline)
    [[gnu::always_inline]] void _write_values (T&&... values) {
        write<!has_buffered, false>(std::move(prefix));
        (write<false, false>(std::forward<T>(values)), ...);
        write_char<false, !buffered, '\n'>();
    }

    template <bool buffered, typename FirstT, typename... RestT>
    [[gnu::always_inline]] void _write_rest_values (FirstT&& first, RestT&&... rest) {
        if constexpr (sizeof...(RestT) > 0) {
            write<false, false>(std::forward<FirstT>(first));
            _write_rest_values<buffered>(std::forward<RestT>(rest)...);
        } else {
            write<false, !buffered>(std::forward<FirstT>(first));
        }
    }

    template <StringLiteral prefix, bool has_buffered, bool buffered, bool no_newline, typename... T>
    requires (sizeof...(T) > 0 && no_newline)
    [[gnu::always_inline]] void _write_values (T&&... values) {
        write<!has_buffered, false>(std::move(prefix));
        _write_rest_values<buffered>(std::forward<T>(values)...);
    }

    template <StringLiteral prefix, bool buffered, bool no_newline = false, typename... T>
    requires (sizeof...(T) > 0)
    [[gnu::always_inline]] void write_values (T&&... values) {
        if (buffer_dst == buffer) {
            _write_values<prefix, false, buffered, no_newline>(std::forward<T>(values)...);
        } else {
            _write_values<prefix, true, buffered, no_newline>(std::forward<T>(values)...);
        }
    }

public:
    template <bool no_newline = false, bool buffered = false, StringLiteral first_value, typename... T>
    void log (T&&... values) {
        write_values<first_value, buffered, no_newline>(std::forward<T>(values)...);
    }
    template <bool no_newline = false, bool buffered = false, typename... T>
    void log (T&&... values) {
        write_values<"", buffered, no_newline>(std::forward<T>(values)...);
    }

    template <bool buffered = false, StringLiteral first_value, typename... T>
    void info (T&&... values) {
        write_values<info_prefix + first_value, buffered>(std::forward<T>(values)...);
    }
    template <bool buffered = false, typename... T>
    void info (T&&... values) {
        write_values<info_prefix, buffered>(std::forward<T>(values)...);
    }

    template <bool buffered = false, StringLiteral first_value, typename... T>
    void error (T&&... values) {
        write_values<error_prefix + first_value, buffered>(std::forward<T>(values)...);
    }
    template <bool buffered = false, typename... T>
    void error (T&&... values) {
        write_values<error_prefix, buffered>(std::forward<T>(values)...);
    }

    void flush () {
        if (buffer_dst == buffer) return;
        flush_buffer(buffer_dst - buffer);
        buffer_dst = buffer;
    }
};

namespace logger_detail {
    template <typename ParamsT>
    class writer {
    public:
        friend class ::logger;

        writer (const writer&) = delete;
        writer (writer&&) = delete;
        writer& operator = (const writer&) = delete;
        writer& operator = (writer&&) = delete;
    private:
        static constexpr bool outer_is_first = ParamsT::outer_is_first;
        static constexpr bool outer_is_last = ParamsT::outer_is_last;
        logger& target;

        [[gnu::always_inline]] constexpr explicit writer (logger& target) : target(target) {}

    public:
        template <bool is_first, bool is_last, typename FirstT, typename... RestT>
        [[gnu::always_inline]] void write (FirstT&& first, RestT&&... rest) const {
            constexpr bool has_rest = sizeof...(RestT) > 0;
            target.write<
                outer_is_first && is_first,
                outer_is_last && is_last && !has_rest
            >(std::forward<FirstT>(first));
            if constexpr (has_rest) {
                write<false, is_last>(std::forward<RestT>(rest)...);
            }
        }
    };
}

// Results go to stdout, errors and failed assertions to stderr.
static logger console{STDOUT_FILENO};
static logger diagnostics{STDERR_FILENO};

/*
 * Loggable that prints an unsigned value as 0x prefixed lower case hex,
 * wide enough for 128 bit bit patterns.
 */
template <std::unsigned_integral T>
struct hex {
    T value;

    template <typename writer_params>
    void log (const logger::writer<writer_params>& lw) const {
        char digits[2 + sizeof(T) * 2];
        char* const end = digits + sizeof(digits);
        char* begin = end;
        T rest = value;
        do {
            *(--begin) = "0123456789abcdef"[static_cast<size_t>(rest & 0xF)];
            rest >>= 4;
        } while (rest != 0);
        *(--begin) = 'x';
        *(--begin) = '0';
        lw.template write<true, true>(std::string_view{begin, gsl::narrow_cast<size_t>(end - begin)});
    }
};

template <typename T>
hex(T) -> hex<T>;

template <StringLiteral auto_msg, typename... ArgsT>
[[noreturn, gnu::noinline, gnu::cold]] void bssert_fail (ArgsT&&... args) {
    if constexpr (sizeof...(ArgsT) > 0) {
        diagnostics.error<false, auto_msg + " with "_sl>(std::forward<ArgsT>(args)...);
    } else {
        diagnostics.error<false, auto_msg>();
    }
    console.flush();
    std::exit(1);
}

#define BSSERT(EXPR, ...)                                                                                   \
/* NOLINTNEXTLINE(readability-simplify-boolean-expr) */                                                     \
if (!(EXPR)) {                                                                                              \
    bssert_fail<"Assertion `" #EXPR "` at " __FILE__ ":" BOOST_PP_STRINGIZE(__LINE__) " failed">(__VA_ARGS__); \
}

template<StringLiteral auto_msg, StringLiteral op, typename T, typename U, typename... ArgsT>
[[noreturn, gnu::noinline, gnu::cold]] void cssert_fail (T&& lhs, U&& rhs, ArgsT&&... args) {
    diagnostics.log<true, true, logger::error_prefix + auto_msg>();
    if constexpr (loggable<std::remove_cvref_t<T>>) {
        diagnostics.log<true, true>(std::forward<T>(lhs), op);
    } else {
        static constexpr auto lhs_type_name = string_literal::from_([](){ return nameof::nameof_type<T>(); });
        diagnostics.log<true, true, lhs_type_name + "{?}"_sl + op>();
    }
    if constexpr (loggable<std::remove_cvref_t<U>>) {
        if constexpr (sizeof...(ArgsT) > 0) {
            diagnostics.log<false, false>(std::forward<U>(rhs), "` and ", std::forward<ArgsT>(args)...);
        } else {
            diagnostics.log<true, false>(std::forward<U>(rhs), "`\n");
        }
    } else {
        static constexpr auto rhs_type_name = string_literal::from_([](){ return nameof::nameof_type<U>(); });
        if constexpr (sizeof...(ArgsT) > 0) {
            diagnostics.log<false, false, rhs_type_name + "{?}` and "_sl>(std::forward<ArgsT>(args)...);
        } else {
            diagnostics.log<true, false, rhs_type_name + "{?}`\n"_sl>();
        }
    }
    console.flush();
    std::exit(1);
}

#define CSSERT(LHS, OP, RHS, ...)                                                                                                                              \
/* NOLINTNEXTLINE(readability-simplify-boolean-expr) */                                                                                                        \
if (!(LHS OP RHS)) {                                                                                                                                           \
    cssert_fail<"Assertion `" #LHS " " #OP " " #RHS "` at " __FILE__ ":" BOOST_PP_STRINGIZE(__LINE__) " failed with `", " " #OP " ">(LHS, RHS, ##__VA_ARGS__); \
}
