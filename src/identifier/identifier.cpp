#include <verhoeff/checksum.hpp>
#include <verhoeff/core/engine.hpp>
#include <verhoeff/identifier.hpp>
#include <verhoeff/io/parse.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace verhoeff {

namespace {

inline void require_length(const digit_sequence &digits, std::size_t expected) {
    if (digits.size() != expected) {
        throw checksum_error::invalid_length(digits.size(), expected);
    }
}

} // namespace

bool validate_identifier(std::string_view input) {
    const auto digits = io::parse_digits(input);
    require_length(digits, IDENTIFIER_LENGTH);
    return core::is_valid(digits);
}

std::string make_identifier(std::string_view body) {
    const auto digits = io::parse_digits(body);
    require_length(digits, IDENTIFIER_BODY_LENGTH);
    return append_checksum(body);
}

} // namespace verhoeff
