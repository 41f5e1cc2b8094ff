// include/verhoeff/core/engine.hpp - Verhoeff fold over a digit sequence.

#pragma once

#include <cstddef>
#include <span>

#include <verhoeff/core/detail/lut.hpp>
#include <verhoeff/io/parse.hpp>

namespace verhoeff::core {

    using detail::PERMUTATION_CYCLE;

    // The check digit sits at reverse position 0 once appended, so generation starts one
    // permutation further along than validation.
    inline constexpr std::size_t VALIDATION_OFFSET = 0;
    inline constexpr std::size_t GENERATION_OFFSET = 1;

    // Folds the digits right to left through the group, permuting the digit at reverse
    // position i with PERMUTATION[(i + offset) % 8]. Digits must be in 0..9.
    inline digit fold(std::span<const digit> digits, std::size_t offset) noexcept {
        digit accumulator = detail::IDENTITY;
        std::size_t position = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++position) {
            const auto permuted = detail::PERMUTATION[(position + offset) % PERMUTATION_CYCLE][*it];
            accumulator = detail::MULTIPLICATION[accumulator][permuted];
        }
        return accumulator;
    }

    inline digit check_digit(std::span<const digit> digits) noexcept {
        return detail::INVERSE[fold(digits, GENERATION_OFFSET)];
    }

    inline bool is_valid(std::span<const digit> digits) noexcept {
        return fold(digits, VALIDATION_OFFSET) == detail::IDENTITY;
    }

} // namespace verhoeff::core
