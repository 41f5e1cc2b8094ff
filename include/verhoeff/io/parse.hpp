// include/verhoeff/io/parse.hpp - Conversion of decimal text into digit sequences.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <verhoeff/core/error.hpp>

namespace verhoeff {

    using digit = std::uint8_t;
    using digit_sequence = std::vector<digit>;

} // namespace verhoeff

namespace verhoeff::io {

    constexpr bool is_ascii_digit(char ch) noexcept {
        return ch >= '0' && ch <= '9';
    }

    inline bool is_digit_string(std::string_view text) noexcept {
        return !text.empty() && std::all_of(text.begin(), text.end(), is_ascii_digit);
    }

    // Digits come back in input order. Throws checksum_error on the first non-digit byte.
    inline digit_sequence parse_digits(std::string_view text) {
        if (text.empty()) {
            throw checksum_error::empty_input();
        }
        digit_sequence digits;
        digits.reserve(text.size());
        for (std::size_t index = 0; index < text.size(); ++index) {
            const char ch = text[index];
            if (!is_ascii_digit(ch)) {
                throw checksum_error::invalid_character(ch, index);
            }
            digits.push_back(static_cast<digit>(ch - '0'));
        }
        return digits;
    }

} // namespace verhoeff::io
