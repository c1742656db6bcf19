// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <algorithm>
#include <cstring>

#include <fmt/core.h>
#include <fmt/ranges.h>

Tensor Tensor::empty(ETensorDType dtype, const std::vector<long>& shape) {
    if (shape.size() > MAX_TENSOR_DIM) throw std::runtime_error("Tensor rank too large");
    Tensor t;
    t.DType = dtype;
    t.Rank = (int)shape.size();
    for (int i = 0; i < t.Rank; ++i) t.Sizes[i] = shape[i];
    for (int i = t.Rank; i < MAX_TENSOR_DIM; ++i) t.Sizes[i] = 1;
    return t;
}

/**
 * @brief Allocate a host tensor and fill it with zeros.
 *
 * @param dtype Element type.
 * @param shape Tensor shape; every dimension must be non-negative.
 * @return Owning tensor whose buffer is zero-initialized.
 *
 * @throws std::runtime_error If the rank exceeds MAX_TENSOR_DIM.
 * @throws std::invalid_argument If a dimension is negative.
 */
Tensor Tensor::zeros(ETensorDType dtype, const std::vector<long>& shape) {
    for (long dim : shape) {
        if (dim < 0) {
            throw std::invalid_argument(fmt::format("Negative dimension in shape [{}]", fmt::join(shape, ", ")));
        }
    }
    Tensor t = empty(dtype, shape);
    // allocate at least one byte so that zero-sized tensors still have a valid Data pointer
    std::size_t size = std::max<std::size_t>(t.bytes(), 1);
    t.Storage = std::shared_ptr<std::byte[]>(new std::byte[size]());
    t.Data = t.Storage.get();
    return t;
}

Tensor Tensor::clone() const {
    Tensor copy = zeros(DType, shape());
    if (bytes() > 0) {
        std::memcpy(copy.Data, Data, bytes());
    }
    return copy;
}

/**
 * @brief Copy the contents of @p src into @p dst.
 *
 * @throws std::logic_error If dtype or shape of the tensors differ, or @p dst has no buffer.
 */
void copy_tensor(Tensor& dst, const Tensor& src) {
    if (dst.DType != src.DType) {
        throw std::logic_error(fmt::format("DType mismatch: target has {}, source has {}",
                                           dtype_to_str(dst.DType), dtype_to_str(src.DType)));
    }
    if (dst.shape() != src.shape()) {
        throw std::logic_error(fmt::format("Shape mismatch: target has {}, source has {}",
                                           shape_to_str(dst), shape_to_str(src)));
    }
    if (dst.bytes() == 0) return;
    if (dst.is_null()) {
        throw std::logic_error("Cannot copy into a tensor without buffer");
    }
    std::memcpy(dst.Data, src.Data, src.bytes());
}

bool tensors_equal(const Tensor& a, const Tensor& b) {
    if (a.DType != b.DType || a.shape() != b.shape()) {
        return false;
    }
    if (a.bytes() == 0) {
        return true;
    }
    return std::memcmp(a.Data, b.Data, a.bytes()) == 0;
}

std::string shape_to_str(const Tensor& tensor) {
    return fmt::format("[{}]", fmt::join(tensor.shape(), ", "));
}
