// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

/**
 * @brief Convert a dtype to the name used in safetensors headers.
 *
 * @param dtype Element type.
 * @return Static string, e.g. "F32" or "BF16".
 */
const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32:  return "F32";
        case ETensorDType::FP64:  return "F64";
        case ETensorDType::BF16:  return "BF16";
        case ETensorDType::FP16:  return "F16";
        case ETensorDType::INT8:  return "I8";
        case ETensorDType::INT32: return "I32";
        case ETensorDType::INT64: return "I64";
        case ETensorDType::BYTE:  return "U8";
        case ETensorDType::BOOL:  return "BOOL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a dtype name.
 *
 * Accepts the safetensors spelling as well as the lower-case aliases used on the
 * command line and in option files.
 *
 * @param name Dtype name.
 * @return Parsed dtype.
 *
 * @throws std::invalid_argument If @p name is not a known dtype.
 */
ETensorDType dtype_from_str(std::string_view name) {
    if (name == "F32" || name == "fp32" || name == "float32") return ETensorDType::FP32;
    if (name == "F64" || name == "fp64" || name == "float64") return ETensorDType::FP64;
    if (name == "BF16" || name == "bf16") return ETensorDType::BF16;
    if (name == "F16" || name == "fp16" || name == "float16") return ETensorDType::FP16;
    if (name == "I8" || name == "int8") return ETensorDType::INT8;
    if (name == "I32" || name == "int32") return ETensorDType::INT32;
    if (name == "I64" || name == "int64") return ETensorDType::INT64;
    if (name == "U8" || name == "byte" || name == "uint8") return ETensorDType::BYTE;
    if (name == "BOOL" || name == "bool") return ETensorDType::BOOL;
    throw std::invalid_argument(fmt::format("Unknown dtype `{}`", name));
}

float bf16_bits_to_float(std::uint16_t bits) {
    std::uint32_t u = static_cast<std::uint32_t>(bits) << 16;
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

std::uint16_t float_to_bf16_bits(float value) {
    if (std::isnan(value)) {
        return 0x7FC0u;
    }
    std::uint32_t u;
    std::memcpy(&u, &value, sizeof(u));
    // round to nearest even on the cut at 16 LSBs
    std::uint32_t lsb = (u >> 16) & 1u;
    u += 0x7FFFu + lsb;
    return static_cast<std::uint16_t>(u >> 16);
}

float fp16_bits_to_float(std::uint16_t bits) {
    const std::uint32_t sign = (bits >> 15) & 1u;
    const std::uint32_t exponent = (bits >> 10) & 0x1Fu;
    const std::uint32_t mantissa = bits & 0x3FFu;

    if (exponent == 0) {
        float magnitude = std::ldexp(static_cast<float>(mantissa), -24);
        return sign ? -magnitude : magnitude;
    }

    std::uint32_t u;
    if (exponent == 0x1F) {
        u = (sign << 31) | 0x7F800000u | (mantissa << 13);
    } else {
        u = (sign << 31) | ((exponent + 112u) << 23) | (mantissa << 13);
    }
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

std::uint16_t float_to_fp16_bits(float value) {
    std::uint32_t x;
    std::memcpy(&x, &value, sizeof(x));
    const std::uint32_t sign = (x >> 16) & 0x8000u;
    std::uint32_t mantissa = x & 0x7FFFFFu;
    const int exponent = static_cast<int>((x >> 23) & 0xFFu);

    if (exponent == 0xFF) {
        return static_cast<std::uint16_t>(sign | 0x7C00u | (mantissa ? 0x200u : 0u));
    }

    int e = exponent - 127 + 15;
    if (e >= 0x1F) {
        return static_cast<std::uint16_t>(sign | 0x7C00u);
    }

    if (e <= 0) {
        if (e < -10) {
            return static_cast<std::uint16_t>(sign);
        }
        mantissa |= 0x800000u;
        const int shift = 14 - e;
        std::uint32_t half = mantissa >> shift;
        const std::uint32_t rem = mantissa & ((1u << shift) - 1u);
        const std::uint32_t halfway = 1u << (shift - 1);
        if (rem > halfway || (rem == halfway && (half & 1u))) {
            ++half;
        }
        return static_cast<std::uint16_t>(sign | half);
    }

    std::uint32_t half = sign | (static_cast<std::uint32_t>(e) << 10) | (mantissa >> 13);
    const std::uint32_t rem = mantissa & 0x1FFFu;
    // a carry out of the mantissa correctly bumps the exponent
    if (rem > 0x1000u || (rem == 0x1000u && (half & 1u))) {
        ++half;
    }
    return static_cast<std::uint16_t>(half);
}
