// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILS_UTILS_H
#define SHARDKEEP_SRC_UTILS_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <type_traits>

template<std::integral T>
constexpr T div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

[[noreturn]] void throw_not_divisible(long long dividend, long long divisor);

template<std::integral T>
constexpr T div_exact(T dividend, T divisor) {
    if(dividend % divisor != 0) {
        throw_not_divisible(dividend, divisor);
    }
    return dividend / divisor;
}

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (input > std::numeric_limits<Dst>::max())
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

bool iequals(std::string_view lhs, std::string_view rhs);

//! Case-insensitive prefix test
bool istarts_with(std::string_view text, std::string_view prefix);

#endif //SHARDKEEP_SRC_UTILS_UTILS_H
