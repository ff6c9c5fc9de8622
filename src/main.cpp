#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "./util/logger.hpp"
#include "./helper/int_traits.hpp"
#include "./bytes/bytes.hpp"
#include "./parser/radix.hpp"
#include "./parser/parse_error.hpp"
#include "./parser/parse_int.hpp"
#include "./parser/from_str.hpp"


namespace {

    template <sfx::fixed_bits Bits>
    int convert_all (uint32_t frac_nbits, sfx::Radix radix, std::span<const char* const> literals) {
        if (frac_nbits > sfx::nbits<Bits>) {
            diagnostics.error("frac-bits ", frac_nbits, " exceeds the ", sfx::nbits<Bits>, " storage bits");
            return 1;
        }
        int status = 0;
        for (const char* const literal : literals) {
            const std::string_view text {literal};
            const auto result = sfx::from_str_radix<Bits>(text, radix, frac_nbits);
            if (result) {
                console.info(text, " -> ", hex{static_cast<sfx::unsigned_t<Bits>>(*result)});
            } else {
                diagnostics.error(text, ": ", result.error());
                status = 1;
            }
        }
        return status;
    }

    // Plain decimal digits only, no sign and no point.
    sfx::ParseResult<uint32_t> parse_count (std::string_view text) {
        if (text.empty()) {
            return sfx::parse_error(sfx::ParseErrorKind::no_digits);
        }
        for (const char c : text) {
            if (c < '0' || c > '9') return sfx::parse_error(sfx::ParseErrorKind::invalid_digit);
        }
        const auto value = sfx::parser::dec_str_int_to_bin<uint32_t>(sfx::Bytes{text});
        if (!value) {
            return sfx::parse_error(sfx::ParseErrorKind::overflow);
        }
        return *value;
    }

    std::optional<sfx::Radix> parse_radix (std::string_view text) {
        const auto value = parse_count(text);
        if (!value) return std::nullopt;
        switch (*value) {
            case 2:  return sfx::Radix::bin;
            case 8:  return sfx::Radix::oct;
            case 10: return sfx::Radix::dec;
            case 16: return sfx::Radix::hex;
            default: return std::nullopt;
        }
    }

    int run (int argc, const char** argv) {
        if (argc < 5) {
            diagnostics.error("usage: sfx <i8|i16|i32|i64|i128|u8|u16|u32|u64|u128> <frac-bits> <2|8|10|16> <literal>...");
            return 1;
        }
        const std::string_view type {argv[1]};

        const auto frac_nbits = parse_count(argv[2]);
        if (!frac_nbits) {
            diagnostics.error("frac-bits: ", frac_nbits.error());
            return 1;
        }
        const auto radix = parse_radix(argv[3]);
        if (!radix) {
            diagnostics.error("radix must be one of 2, 8, 10, 16, got ", std::string_view{argv[3]});
            return 1;
        }
        const std::span<const char* const> literals {argv + 4, static_cast<size_t>(argc - 4)};

        if (type == "i8")   return convert_all<int8_t>(*frac_nbits, *radix, literals);
        if (type == "i16")  return convert_all<int16_t>(*frac_nbits, *radix, literals);
        if (type == "i32")  return convert_all<int32_t>(*frac_nbits, *radix, literals);
        if (type == "i64")  return convert_all<int64_t>(*frac_nbits, *radix, literals);
        if (type == "i128") return convert_all<sfx::i128>(*frac_nbits, *radix, literals);
        if (type == "u8")   return convert_all<uint8_t>(*frac_nbits, *radix, literals);
        if (type == "u16")  return convert_all<uint16_t>(*frac_nbits, *radix, literals);
        if (type == "u32")  return convert_all<uint32_t>(*frac_nbits, *radix, literals);
        if (type == "u64")  return convert_all<uint64_t>(*frac_nbits, *radix, literals);
        if (type == "u128") return convert_all<sfx::u128>(*frac_nbits, *radix, literals);

        diagnostics.error("unknown type: ", type);
        return 1;
    }
}

int main (int argc, const char** argv) {
    const int status = run(argc, argv);
    console.flush();
    diagnostics.flush();
    return status;
}
