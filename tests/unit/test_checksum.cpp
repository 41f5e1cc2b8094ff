// tests/unit/test_checksum.cpp - Unit tests for checksum generation, validation and appending.

#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <verhoeff/verhoeff.hpp>

namespace {

using verhoeff::checksum_error;
using verhoeff::errc;

template <typename Fn>
bool throws_code(Fn&& fn, errc code) {
    try {
        fn();
    } catch (const checksum_error& error) {
        return error.code() == code;
    }
    return false;
}

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const std::string& message) {
        if (!condition) {
            all_good = false;
            std::cerr << "checksum test failed: " << message << '\n';
        }
    };

    // Fixtures recorded from the canonical tables.
    const std::vector<std::pair<std::string_view, int>> vectors = {
        {"236", 3},         {"12345", 1},       {"142857", 0},      {"12345678901", 0},
        {"0", 4},           {"9", 1},           {"987654321", 7},   {"98765432109", 6},
        {"55555555555", 1}, {"1111111111", 4},  {"19900101000", 6}, {"75872", 2},
    };
    for (const auto& [input, expected] : vectors) {
        expect(verhoeff::calculate_checksum(input) == expected,
               "checksum mismatch for " + std::string(input));
        expect(verhoeff::checksum_char(input) == static_cast<char>('0' + expected),
               "checksum_char mismatch for " + std::string(input));
        const auto appended = verhoeff::append_checksum(input);
        expect(appended == std::string(input) + static_cast<char>('0' + expected),
               "append_checksum mismatch for " + std::string(input));
        expect(verhoeff::validate(appended), "appended value must validate: " + appended);
    }

    expect(verhoeff::append_checksum("12345678901") == "123456789010",
           "append_checksum must extend an eleven digit body");

    for (const std::string_view valid : {"2363", "123451", "1428570", "9876543217", "123456789010"}) {
        expect(verhoeff::validate(valid), "expected valid: " + std::string(valid));
        expect(verhoeff::validate_strict(valid), "expected strictly valid: " + std::string(valid));
    }
    for (const std::string_view invalid :
         {"2364", "123450", "1428571", "9876543210", "123456789013", "123461", "124351"}) {
        expect(!verhoeff::validate(invalid), "expected invalid: " + std::string(invalid));
        expect(!verhoeff::validate_strict(invalid),
               "mismatch must be false, not an error: " + std::string(invalid));
    }

    // A lone digit is valid input and only the identity digit validates on its own.
    expect(verhoeff::validate("0"), "\"0\" folds to the identity");
    for (char ch = '1'; ch <= '9'; ++ch) {
        expect(!verhoeff::validate(std::string(1, ch)), "single non-zero digit must not validate");
    }

    expect(throws_code([] { (void)verhoeff::calculate_checksum(""); }, errc::empty_input),
           "calculate_checksum(\"\") must report empty input");
    try {
        (void)verhoeff::calculate_checksum("12a45");
        expect(false, "calculate_checksum(\"12a45\") must throw");
    } catch (const checksum_error& error) {
        expect(error.code() == errc::invalid_character, "letter must be an invalid character");
        expect(error.character() == 'a', "invalid character must report 'a'");
    }
    expect(throws_code([] { (void)verhoeff::append_checksum("12 3"); }, errc::invalid_character),
           "append_checksum must reject whitespace");
    expect(throws_code([] { (void)verhoeff::append_checksum(""); }, errc::empty_input),
           "append_checksum must reject empty input");
    expect(throws_code([] { (void)verhoeff::validate_strict("12345a"); }, errc::invalid_character),
           "validate_strict must reject letters");
    expect(throws_code([] { (void)verhoeff::validate_strict(""); }, errc::empty_input),
           "validate_strict must reject empty input");

    try {
        (void)verhoeff::validate_strict("12345a");
    } catch (const std::invalid_argument& error) {
        expect(std::string(error.what()).find("position 5") != std::string::npos,
               "checksum_error must be catchable as std::invalid_argument");
    }

    expect(!verhoeff::validate(""), "validate must treat empty input as invalid");
    expect(!verhoeff::validate("12345a"), "validate must treat letters as invalid");
    expect(!verhoeff::validate("1234 51"), "validate must treat whitespace as invalid");

    // The engine is shared by both surfaces; generation and validation differ only by offset.
    const auto digits = verhoeff::io::parse_digits("12345");
    expect(verhoeff::core::check_digit(digits) == 1, "engine check digit must match the API");
    expect(verhoeff::core::fold(digits, verhoeff::core::GENERATION_OFFSET) == 4,
           "generation fold must be the inverse of the check digit");
    auto with_check = digits;
    with_check.push_back(verhoeff::core::check_digit(digits));
    expect(verhoeff::core::fold(with_check, verhoeff::core::VALIDATION_OFFSET) == 0,
           "validation fold must reach the identity");
    expect(verhoeff::core::is_valid(with_check), "is_valid must agree with the fold");

    // Swapping the offsets produces a digit the validation path rejects.
    auto swapped = digits;
    swapped.push_back(verhoeff::core::detail::INVERSE[verhoeff::core::fold(digits, 0)]);
    expect(!verhoeff::core::is_valid(swapped), "offset zero must not generate a valid check digit");

    for (const std::string_view text : {"123", "456789", "000", "999999999"}) {
        expect(verhoeff::append_checksum(text) == verhoeff::append_checksum(text),
               "append_checksum must be deterministic");
    }

    if (!all_good) {
        std::cerr << "checksum tests failed\n";
        return 1;
    }
    std::cout << "checksum tests passed\n";
    return 0;
}
