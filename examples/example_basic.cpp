// examples/example_basic.cpp - Walks through check digit generation, validation and error reporting.

#include <array>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include <verhoeff/verhoeff.hpp>

namespace {

void report_identifier(std::string_view identifier) {
    std::cout << "   " << identifier << " -> ";
    try {
        std::cout << (verhoeff::validate_identifier(identifier) ? "valid" : "checksum mismatch") << "\n";
    } catch (const verhoeff::checksum_error &err) {
        verhoeff::util::dump(std::cout, err) << "\n";
    }
}

} // namespace

int
main() {
    std::cout << "1. Calculating check digits\n";
    for (const std::string_view number : {"12345", "987654321", "1111111111"}) {
        std::cout << "   " << number << " -> " << static_cast<int>(verhoeff::calculate_checksum(number))
                  << "\n";
    }

    std::cout << "2. Validating\n";
    const std::array<std::pair<std::string_view, bool>, 4> samples = {{
        {"123451", true},
        {"123450", false},
        {"9876543217", true},
        {"9876543210", false},
    }};
    for (const auto &[number, expected] : samples) {
        std::cout << "   " << number << " -> " << (verhoeff::validate(number) ? "valid" : "invalid")
                  << " (expected " << (expected ? "valid" : "invalid") << ")\n";
    }

    std::cout << "3. Appending\n";
    for (const std::string_view body : {"12345678901", "98765432109", "55555555555"}) {
        std::cout << "   " << body << " -> " << verhoeff::append_checksum(body) << "\n";
    }

    std::cout << "4. Identifiers\n";
    report_identifier(verhoeff::make_identifier("12345678901"));
    report_identifier("123456789019");
    report_identifier("12345");
    report_identifier("1234-5678-90");

    std::cout << "5. Error detection\n";
    const auto complete = verhoeff::append_checksum("12345");
    std::string substituted = complete;
    substituted[2] = '9';
    std::string transposed = complete;
    std::swap(transposed[1], transposed[2]);
    for (const auto &mutated : {substituted, transposed}) {
        std::cout << "   " << complete << " -> " << mutated << ": "
                  << (verhoeff::validate(mutated) ? "missed" : "detected") << "\n";
    }
    return 0;
}
