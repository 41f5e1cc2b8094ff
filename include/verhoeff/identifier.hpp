// include/verhoeff/identifier.hpp - Fixed-length (12 digit) identifier validation.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <verhoeff/core/error.hpp>

namespace verhoeff {

    // Eleven body digits followed by one Verhoeff check digit.
    inline constexpr std::size_t IDENTIFIER_LENGTH = 12;
    inline constexpr std::size_t IDENTIFIER_BODY_LENGTH = IDENTIFIER_LENGTH - 1;

    // Checks that `input` is exactly IDENTIFIER_LENGTH decimal digits whose check digit
    // matches. Returns false for a check digit mismatch. Throws checksum_error with
    // errc::empty_input or errc::invalid_character for malformed text, and
    // errc::invalid_length when the digit count is wrong.
    //
    // A true result only means the digits are arithmetically consistent; it says nothing
    // about whether the identifier was ever issued.
    bool validate_identifier(std::string_view input);

    // Builds an identifier from IDENTIFIER_BODY_LENGTH body digits.
    // Throws checksum_error (errc::invalid_length with the expected body length) otherwise.
    std::string make_identifier(std::string_view body);

} // namespace verhoeff
