#include <verhoeff/checksum.hpp>
#include <verhoeff/core/engine.hpp>
#include <verhoeff/io/format.hpp>
#include <verhoeff/io/parse.hpp>

#include <string>
#include <string_view>

namespace verhoeff {

digit calculate_checksum(std::string_view input) {
    const auto digits = io::parse_digits(input);
    return core::check_digit(digits);
}

char checksum_char(std::string_view input) {
    return io::digit_char(calculate_checksum(input));
}

std::string append_checksum(std::string_view input) {
    const char check = checksum_char(input);
    std::string result;
    result.reserve(input.size() + 1);
    result.append(input);
    result.push_back(check);
    return result;
}

bool validate_strict(std::string_view input) {
    const auto digits = io::parse_digits(input);
    return core::is_valid(digits);
}

bool validate(std::string_view input) {
    if (!io::is_digit_string(input)) {
        return false;
    }
    return validate_strict(input);
}

} // namespace verhoeff
