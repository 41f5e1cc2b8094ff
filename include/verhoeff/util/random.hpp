#pragma once

#include <cstddef>
#include <random>
#include <string>

namespace verhoeff::util {

inline char random_digit_char(std::mt19937_64& generator) {
    std::uniform_int_distribution<int> digit_dist(0, 9);
    return static_cast<char>('0' + digit_dist(generator));
}

inline std::string random_digit_string(std::mt19937_64& generator, std::size_t length) {
    std::string result;
    result.reserve(length);
    for (std::size_t index = 0; index < length; ++index) {
        result.push_back(random_digit_char(generator));
    }
    return result;
}

} // namespace verhoeff::util
