// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "test_utils.h"
#include "utilities/dtype.h"
#include "utilities/tensor.h"
#include "utilities/utils.h"

using namespace testing_utils;

TEST_CASE("dtype names round-trip through their safetensors spelling", "[utilities][dtype]") {
    for (auto dtype : {ETensorDType::FP32, ETensorDType::FP64, ETensorDType::BF16, ETensorDType::FP16,
                       ETensorDType::INT8, ETensorDType::INT32, ETensorDType::INT64, ETensorDType::BYTE,
                       ETensorDType::BOOL}) {
        REQUIRE(dtype_from_str(dtype_to_str(dtype)) == dtype);
    }
    REQUIRE(dtype_from_str("bf16") == ETensorDType::BF16);
    REQUIRE(dtype_from_str("fp32") == ETensorDType::FP32);
    REQUIRE_THROWS_AS(dtype_from_str("fp8"), std::invalid_argument);
}

TEST_CASE("Tensor::zeros allocates an owned, zeroed buffer", "[utilities][tensor]") {
    Tensor t = Tensor::zeros(ETensorDType::FP32, {3, 4});
    REQUIRE(t.Rank == 2);
    REQUIRE(t.nelem() == 12);
    REQUIRE(t.bytes() == 48);
    REQUIRE(t.shape() == std::vector<long>{3, 4});
    REQUIRE(t.Storage != nullptr);
    const float* data = t.get<float>();
    for (int i = 0; i < 12; ++i) {
        REQUIRE(data[i] == 0.f);
    }
    REQUIRE_THROWS_AS(t.get<double>(), std::logic_error);
}

TEST_CASE("Tensor::clone is independent of the original", "[utilities][tensor]") {
    Tensor original = make_float_tensor({8}, 1.f);
    Tensor copy = original.clone();
    REQUIRE(tensors_equal(original, copy));

    original.get<float>()[0] = -3.f;
    REQUIRE_FALSE(tensors_equal(original, copy));
    REQUIRE(copy.get<float>()[0] == 1.f);
}

TEST_CASE("copy_tensor requires matching dtype and shape", "[utilities][tensor]") {
    Tensor src = make_float_tensor({2, 3}, 2.f);
    Tensor dst = Tensor::zeros(ETensorDType::FP32, {2, 3});
    copy_tensor(dst, src);
    REQUIRE(tensors_equal(dst, src));

    Tensor wrong_shape = Tensor::zeros(ETensorDType::FP32, {3, 2});
    REQUIRE_THROWS_AS(copy_tensor(wrong_shape, src), std::logic_error);

    Tensor wrong_dtype = Tensor::zeros(ETensorDType::INT32, {2, 3});
    REQUIRE_THROWS_AS(copy_tensor(wrong_dtype, src), std::logic_error);
}

TEST_CASE("integer helpers", "[utilities]") {
    REQUIRE(div_ceil(10, 3) == 4);
    REQUIRE(div_ceil(9, 3) == 3);
    REQUIRE(div_exact(12, 4) == 3);
    REQUIRE_THROWS(div_exact(10, 4));
    REQUIRE(narrow<int>(42L) == 42);
    REQUIRE_THROWS_AS(narrow<unsigned>(-1), std::out_of_range);
    REQUIRE(iequals("Checkpoint", "CHECKPOINT"));
    REQUIRE(istarts_with("S3://bucket/ckpt", "s3://"));
    REQUIRE_FALSE(istarts_with("/data/s3://", "s3://"));
}
