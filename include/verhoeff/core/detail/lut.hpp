// include/verhoeff/core/detail/lut.hpp - Dihedral group D5 tables used by the Verhoeff fold.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace verhoeff::core::detail {

    inline constexpr std::size_t RADIX = 10;
    inline constexpr std::size_t PERMUTATION_CYCLE = 8;

    using table_row = std::array<std::uint8_t, RADIX>;

    // MULTIPLICATION[a][b] is a * b in D5, with 0..4 the rotations and 5..9 the reflections.
    inline constexpr std::array<table_row, RADIX> MULTIPLICATION = {{
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
        {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
        {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
        {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
        {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
        {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
        {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
        {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
        {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
        {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
    }};

    // Row i is applied to the digit at reverse position i (mod 8). Row i equals row 1 composed i times.
    inline constexpr std::array<table_row, PERMUTATION_CYCLE> PERMUTATION = {{
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
        {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
        {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
        {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
        {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
        {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
        {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
        {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
    }};

    inline constexpr table_row INVERSE = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

    inline constexpr std::uint8_t IDENTITY = 0;

    constexpr bool is_permutation(const table_row &row) noexcept {
        std::array<bool, RADIX> seen{};
        for (const auto value : row) {
            if (static_cast<std::size_t>(value) >= RADIX || seen[value]) {
                return false;
            }
            seen[value] = true;
        }
        return true;
    }

    template <std::size_t Rows>
    constexpr bool rows_are_permutations(const std::array<table_row, Rows> &table) noexcept {
        for (const auto &row : table) {
            if (!is_permutation(row)) {
                return false;
            }
        }
        return true;
    }

    constexpr bool columns_are_permutations(const std::array<table_row, RADIX> &table) noexcept {
        for (std::size_t column = 0; column < RADIX; ++column) {
            table_row values{};
            for (std::size_t row = 0; row < RADIX; ++row) {
                values[row] = table[row][column];
            }
            if (!is_permutation(values)) {
                return false;
            }
        }
        return true;
    }

    constexpr bool has_identity(const std::array<table_row, RADIX> &table) noexcept {
        for (std::size_t index = 0; index < RADIX; ++index) {
            if (static_cast<std::size_t>(table[IDENTITY][index]) != index ||
                static_cast<std::size_t>(table[index][IDENTITY]) != index) {
                return false;
            }
        }
        return true;
    }

    constexpr bool inverse_cancels(const std::array<table_row, RADIX> &table,
                                   const table_row &inverse) noexcept {
        for (std::size_t index = 0; index < RADIX; ++index) {
            if (table[index][inverse[index]] != IDENTITY) {
                return false;
            }
        }
        return true;
    }

    constexpr bool permutations_are_powers(const std::array<table_row, PERMUTATION_CYCLE> &table) noexcept {
        for (std::size_t power = 1; power < PERMUTATION_CYCLE; ++power) {
            for (std::size_t value = 0; value < RADIX; ++value) {
                if (table[power][value] != table[1][table[power - 1][value]]) {
                    return false;
                }
            }
        }
        return true;
    }

    static_assert(rows_are_permutations(MULTIPLICATION), "multiplication rows must be permutations");
    static_assert(columns_are_permutations(MULTIPLICATION), "multiplication table must be a Latin square");
    static_assert(has_identity(MULTIPLICATION), "0 must be the group identity");
    static_assert(rows_are_permutations(PERMUTATION), "permutation rows must be permutations");
    static_assert(permutations_are_powers(PERMUTATION), "permutation rows must be powers of row 1");
    static_assert(is_permutation(INVERSE), "inverse table must be a permutation");
    static_assert(inverse_cancels(MULTIPLICATION, INVERSE), "inverse table must cancel under multiplication");

} // namespace verhoeff::core::detail
