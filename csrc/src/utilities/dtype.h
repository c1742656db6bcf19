// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILITIES_DTYPE_H
#define SHARDKEEP_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

enum class ETensorDType : int {
    FP32,
    FP64,
    BF16,
    FP16,
    INT8,
    INT32,
    INT64,
    BYTE,
    BOOL
};

//! Size in bytes of a single element of `dtype`.
constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP64:
        case ETensorDType::INT64:
            return 8;
        case ETensorDType::FP32:
        case ETensorDType::INT32:
            return 4;
        case ETensorDType::BF16:
        case ETensorDType::FP16:
            return 2;
        case ETensorDType::INT8:
        case ETensorDType::BYTE:
        case ETensorDType::BOOL:
            return 1;
    }
    return 0;
}

//! Safetensors-compatible name of the dtype ("F32", "BF16", ...)
const char* dtype_to_str(ETensorDType dtype);

//! Parses both safetensors names ("F32") and lower-case aliases ("fp32", "bf16").
ETensorDType dtype_from_str(std::string_view name);

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;
template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<double> = ETensorDType::FP64;
template<> inline constexpr ETensorDType dtype_from_type<std::int8_t> = ETensorDType::INT8;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int64_t> = ETensorDType::INT64;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;
template<> inline constexpr ETensorDType dtype_from_type<bool> = ETensorDType::BOOL;

// 16-bit float helpers; host-side emulation only
float bf16_bits_to_float(std::uint16_t bits);
std::uint16_t float_to_bf16_bits(float value);
float fp16_bits_to_float(std::uint16_t bits);
std::uint16_t float_to_fp16_bits(float value);

#endif //SHARDKEEP_SRC_UTILITIES_DTYPE_H
