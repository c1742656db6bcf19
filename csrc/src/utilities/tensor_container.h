// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILITIES_TENSOR_CONTAINER_H
#define SHARDKEEP_SRC_UTILITIES_TENSOR_CONTAINER_H

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "tensor.h"

//! \brief Anything that owns a set of named tensors (model weights, optimizer moments, ...).
//! \details Tensors are views, so callers may write into the buffers of the tensors they are handed.
class ITensorContainer {
public:
    virtual ~ITensorContainer() = default;
    virtual void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) = 0;
};

//! Simple container holding an ordered list of named tensors.
class NamedTensors : public ITensorContainer {
public:
    NamedTensors() = default;
    explicit NamedTensors(std::vector<std::pair<std::string, Tensor>> tensors) : mTensors(std::move(tensors)) {}

    void add(std::string name, Tensor tensor) { mTensors.emplace_back(std::move(name), std::move(tensor)); }

    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override {
        for (const auto& [name, tensor] : mTensors) {
            callback(name, tensor);
        }
    }

    [[nodiscard]] const Tensor& get(const std::string& name) const {
        for (const auto& [n, tensor] : mTensors) {
            if (n == name) return tensor;
        }
        throw std::out_of_range("Tensor not found: " + name);
    }

    [[nodiscard]] std::size_t size() const { return mTensors.size(); }

private:
    std::vector<std::pair<std::string, Tensor>> mTensors;
};

#endif //SHARDKEEP_SRC_UTILITIES_TENSOR_CONTAINER_H
