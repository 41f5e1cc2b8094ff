#pragma once

#include <ostream>

#include <verhoeff/core/error.hpp>
#include <verhoeff/io/format.hpp>
#include <verhoeff/io/parse.hpp>

namespace verhoeff::util {

inline std::ostream& dump(std::ostream& os, const digit_sequence& digits) {
    return os << "digits[" << digits.size() << "](" << io::to_string(digits) << ')';
}

inline std::ostream& dump(std::ostream& os, const checksum_error& error) {
    os << "checksum_error(" << error.code();
    switch (error.code()) {
    case errc::invalid_character:
        os << ", position=" << error.position();
        break;
    case errc::invalid_length:
        os << ", length=" << error.length() << ", expected=" << error.expected_length();
        break;
    case errc::empty_input:
        break;
    }
    return os << "): " << error.what();
}

} // namespace verhoeff::util
