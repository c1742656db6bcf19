// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILITIES_TENSOR_H
#define SHARDKEEP_SRC_UTILITIES_TENSOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous view on host memory that is associated
//! with a specific data type and shape.
//! \details Tensors created through `allocate` / `zeros` / `clone` keep their buffer alive
//! through `Storage`; copies of a Tensor share that buffer. Tensors created through
//! `from_pointer` are non-owning views.
struct Tensor {
    ETensorDType DType = ETensorDType::BYTE;
    std::array<long, MAX_TENSOR_DIM> Sizes{1, 1, 1, 1, 1};
    std::byte* Data = nullptr;
    int Rank = 0;
    std::shared_ptr<std::byte[]> Storage;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }

    [[nodiscard]] std::vector<long> shape() const {
        return std::vector<long>(Sizes.begin(), Sizes.begin() + Rank);
    }

    //! Shape and dtype only, no buffer.
    static Tensor empty(ETensorDType dtype, const std::vector<long>& shape);

    //! Allocates an owned, zero-initialized buffer.
    static Tensor zeros(ETensorDType dtype, const std::vector<long>& shape);

    //! Deep copy into a freshly allocated buffer.
    [[nodiscard]] Tensor clone() const;

    template<class TargetType>
    [[nodiscard]] const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }
};

//! Copies the bytes of `src` into `dst`; dtype and shape must match.
void copy_tensor(Tensor& dst, const Tensor& src);

//! True if both tensors have identical dtype, shape and bytes.
bool tensors_equal(const Tensor& a, const Tensor& b);

std::string shape_to_str(const Tensor& tensor);

#endif //SHARDKEEP_SRC_UTILITIES_TENSOR_H
