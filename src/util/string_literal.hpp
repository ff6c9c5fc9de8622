#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <type_traits>


template<size_t N>
struct StringLiteral {
    template <size_t>
    friend struct StringLiteral; // Gives + operator access to private ctor which it needs

private:
    template<size_t L, size_t M, size_t ...Indecies1, size_t ...Indecies2>
    consteval StringLiteral(const char (&str1)[L], const char (&str2)[M], std::index_sequence<Indecies1...> /*unused*/, std::index_sequence<Indecies2...> /*unused*/)
    : data{str1[Indecies1]..., str2[Indecies2]...}
    {}

    template<size_t M, size_t ...Indecies>
    consteval StringLiteral(const char (&str)[M], std::index_sequence<Indecies...> /*unused*/)
    : data{str[Indecies]...}
    {}

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    consteval StringLiteral(const char (&str)[N])
    : StringLiteral{str, std::make_index_sequence<N - 1>{}}
    {
        if(str[N - 1] != 0) throw; // Null termination expected
    }

    char data[N];

    [[nodiscard]] constexpr size_t size () const { return N - 1; }

    [[nodiscard]] constexpr const char& operator [] (size_t index) const {
        return data[index];
    }

    [[nodiscard]] constexpr const char* begin () const {
        return data;
    }

    [[nodiscard]] constexpr const char* end () const {
        return data + size();
    }

    [[nodiscard]] constexpr std::string_view to_string_view () const {
        return {data, size()};
    }

    template <size_t M>
    [[nodiscard]] consteval StringLiteral<N + M - 1> operator + (const StringLiteral<M>& other) const {
        return StringLiteral<N + M - 1>{data, other.data, std::make_index_sequence<N - 1>{}, std::make_index_sequence<M - 1>{}};
    }
};

template <size_t N>
StringLiteral(const char (&str)[N]) -> StringLiteral<N>;

template<StringLiteral str>
consteval decltype(str) operator ""_sl () {
    return str;
}

template <typename T>
struct is_string_literal : std::false_type {};
template <size_t N>
struct is_string_literal<StringLiteral<N>> : std::true_type {};

template <typename T>
constexpr bool is_string_literal_v = is_string_literal<T>::value;

namespace string_literal {
    namespace {
        template <typename SourceT, size_t N, size_t... Indecies>
        consteval StringLiteral<N + 1> _from_ (std::index_sequence<Indecies...> /*unused*/) {
            constexpr std::string_view view = SourceT{}();
            return {{view[Indecies]..., '\0'}};
        }
    }

    /*
     * Freezes the string_view returned by a captureless constexpr lambda,
     * e.g. a nameof result, into a StringLiteral usable as template argument.
     */
    template <typename SourceT>
    consteval auto from_ (SourceT /*source*/) {
        constexpr size_t length = SourceT{}().size();
        return _from_<SourceT, length>(std::make_index_sequence<length>{});
    }
}
