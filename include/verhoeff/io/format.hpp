// include/verhoeff/io/format.hpp - Rendering of digits and digit sequences as text.

#pragma once

#include <stdexcept>
#include <string>

#include <verhoeff/io/parse.hpp>

namespace verhoeff::io {

    inline char digit_char(digit value) {
        if (value > 9) {
            throw std::out_of_range("digit value must be in 0..9");
        }
        return static_cast<char>('0' + value);
    }

    inline std::string to_string(const digit_sequence &digits) {
        std::string text;
        text.reserve(digits.size());
        for (const auto value : digits) {
            text.push_back(digit_char(value));
        }
        return text;
    }

} // namespace verhoeff::io
