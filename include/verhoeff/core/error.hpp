// include/verhoeff/core/error.hpp - Error codes and the exception raised for malformed input.

#pragma once

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace verhoeff {

    enum class errc {
        empty_input,
        invalid_character,
        invalid_length,
    };

    inline std::string_view to_string(errc code) noexcept {
        switch (code) {
        case errc::empty_input:
            return "empty_input";
        case errc::invalid_character:
            return "invalid_character";
        case errc::invalid_length:
            return "invalid_length";
        }
        return "unknown";
    }

    inline std::ostream &operator<<(std::ostream &os, errc code) {
        return os << to_string(code);
    }

    namespace detail {

        inline std::string describe_character(char ch) {
            const auto byte = static_cast<unsigned char>(ch);
            if (byte >= 0x20 && byte < 0x7f) {
                return std::string(1, ch);
            }
            constexpr char HEX[] = "0123456789abcdef";
            std::string escaped = "\\x";
            escaped.push_back(HEX[byte >> 4]);
            escaped.push_back(HEX[byte & 0x0f]);
            return escaped;
        }

    } // namespace detail

    // Raised for input that cannot be folded at all. A checksum mismatch is never reported this way.
    class checksum_error : public std::invalid_argument {
      public:
        static checksum_error empty_input() {
            return checksum_error(errc::empty_input, "input cannot be empty");
        }

        static checksum_error invalid_character(char ch, std::size_t position) {
            checksum_error error(errc::invalid_character,
                                 "invalid character '" + detail::describe_character(ch) +
                                     "' at position " + std::to_string(position) +
                                     " - only digits allowed");
            error.character_ = ch;
            error.position_ = position;
            return error;
        }

        static checksum_error invalid_length(std::size_t actual, std::size_t expected) {
            checksum_error error(errc::invalid_length,
                                 "identifier must be " + std::to_string(expected) +
                                     " digits, got " + std::to_string(actual) + " digits");
            error.length_ = actual;
            error.expected_length_ = expected;
            return error;
        }

        errc code() const noexcept {
            return code_;
        }

        // Offending byte; only meaningful for errc::invalid_character.
        char character() const noexcept {
            return character_;
        }

        std::size_t position() const noexcept {
            return position_;
        }

        // Actual digit count; only meaningful for errc::invalid_length.
        std::size_t length() const noexcept {
            return length_;
        }

        std::size_t expected_length() const noexcept {
            return expected_length_;
        }

      private:
        checksum_error(errc code, const std::string &message)
            : std::invalid_argument(message), code_(code) {}

        errc code_;
        char character_ = '\0';
        std::size_t position_ = 0;
        std::size_t length_ = 0;
        std::size_t expected_length_ = 0;
    };

} // namespace verhoeff
