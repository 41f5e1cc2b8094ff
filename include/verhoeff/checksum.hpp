// include/verhoeff/checksum.hpp - Public checksum operations over decimal text.

#pragma once

#include <string>
#include <string_view>

#include <verhoeff/core/error.hpp>
#include <verhoeff/io/parse.hpp>

namespace verhoeff {

    // Check digit (0..9) to append to `input`.
    // Throws checksum_error with errc::empty_input or errc::invalid_character.
    digit calculate_checksum(std::string_view input);

    // Same digit as calculate_checksum, rendered as '0'..'9'.
    char checksum_char(std::string_view input);

    // `input` with its check digit appended. Fails like calculate_checksum.
    std::string append_checksum(std::string_view input);

    // Verdict for `input` including its trailing check digit. A wrong check digit yields
    // false; malformed input throws checksum_error instead.
    bool validate_strict(std::string_view input);

    // Like validate_strict, but malformed input also yields false, so callers cannot tell
    // a malformed string from a mismatching one. Use validate_strict when that matters.
    bool validate(std::string_view input);

} // namespace verhoeff
