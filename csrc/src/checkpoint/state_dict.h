// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_STATE_DICT_H
#define SHARDKEEP_SRC_CHECKPOINT_STATE_DICT_H

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utilities/tensor.h"

//! Key of the JSON object that stands in for a tensor inside a structure.
inline constexpr const char* TENSOR_REFERENCE_KEY = "__tensor__";

//! Reference to a tensor produced while saving, with the side information needed to
//! allocate a receive buffer without reading the tensor file.
struct InternalTensorReference {
    long Id;
    std::vector<long> Shape;
    ETensorDType DType;
};

//! `{"__tensor__": id}`
nlohmann::json make_tensor_reference(long id);
bool is_tensor_reference(const nlohmann::json& value);
//! Throws std::invalid_argument if `value` is not a tensor reference.
long tensor_reference_id(const nlohmann::json& value);

//! Calls `callback` for every tensor reference in `structure`, depth first, in key order.
void visit_tensor_references(const nlohmann::json& structure, const std::function<void(const nlohmann::json&)>& callback);
//! Replaces every tensor reference in `structure` by `callback(reference)`.
void rewrite_tensor_references(nlohmann::json& structure, const std::function<nlohmann::json(const nlohmann::json&)>& callback);

/*!
 * \brief A nested, named snapshot of some state.
 * \details `Structure` is an arbitrary JSON document in which each tensor is replaced by a
 * tensor reference `{"__tensor__": id}`; `Tensors[id]` holds the tensor.
 * Tensors may be views into the live state (as returned by `IStatePayload::state_dict`);
 * use `clone()` to obtain an independent snapshot.
 */
struct StateDict {
    nlohmann::json Structure = nlohmann::json::object();
    std::vector<Tensor> Tensors;

    //! Appends `tensor` and returns its reference.
    nlohmann::json add_tensor(Tensor tensor);

    //! Tensor for a reference.
    //! \throws std::out_of_range on a dangling reference.
    [[nodiscard]] const Tensor& tensor(const nlohmann::json& reference) const;

    //! Ids referenced by `Structure`, in traversal order (may contain repeats).
    [[nodiscard]] std::vector<long> referenced_ids() const;

    //! Inserts or replaces the top-level keys of `other`; tensors are re-numbered.
    void merge(const StateDict& other);

    //! Drops tensors that are no longer referenced and re-numbers the rest.
    void compact();

    [[nodiscard]] StateDict clone() const;

    [[nodiscard]] std::size_t bytes() const;
};

#endif //SHARDKEEP_SRC_CHECKPOINT_STATE_DICT_H
