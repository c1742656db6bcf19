// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/state_dict.h"

#include <map>
#include <stdexcept>

#include <fmt/core.h>

nlohmann::json make_tensor_reference(long id) {
    return nlohmann::json::object({{TENSOR_REFERENCE_KEY, id}});
}

bool is_tensor_reference(const nlohmann::json& value) {
    return value.is_object() && value.size() == 1 && value.contains(TENSOR_REFERENCE_KEY) &&
           value[TENSOR_REFERENCE_KEY].is_number_integer();
}

long tensor_reference_id(const nlohmann::json& value) {
    if (!is_tensor_reference(value)) {
        throw std::invalid_argument(fmt::format("Not a tensor reference: {}", value.dump()));
    }
    return value[TENSOR_REFERENCE_KEY].get<long>();
}

void visit_tensor_references(const nlohmann::json& structure, const std::function<void(const nlohmann::json&)>& callback) {
    if (is_tensor_reference(structure)) {
        callback(structure);
    } else if (structure.is_object() || structure.is_array()) {
        for (const auto& child : structure) {
            visit_tensor_references(child, callback);
        }
    }
}

void rewrite_tensor_references(nlohmann::json& structure, const std::function<nlohmann::json(const nlohmann::json&)>& callback) {
    if (is_tensor_reference(structure)) {
        structure = callback(structure);
    } else if (structure.is_object() || structure.is_array()) {
        for (auto& child : structure) {
            rewrite_tensor_references(child, callback);
        }
    }
}

nlohmann::json StateDict::add_tensor(Tensor tensor) {
    long id = static_cast<long>(Tensors.size());
    Tensors.push_back(std::move(tensor));
    return make_tensor_reference(id);
}

const Tensor& StateDict::tensor(const nlohmann::json& reference) const {
    long id = tensor_reference_id(reference);
    if (id < 0 || id >= static_cast<long>(Tensors.size())) {
        throw std::out_of_range(fmt::format("Tensor reference {} out of range; state holds {} tensors", id, Tensors.size()));
    }
    return Tensors[id];
}

std::vector<long> StateDict::referenced_ids() const {
    std::vector<long> ids;
    visit_tensor_references(Structure, [&ids](const nlohmann::json& ref) {
        ids.push_back(tensor_reference_id(ref));
    });
    return ids;
}

/**
 * @brief Merge the top-level entries of @p other into this state.
 *
 * Entries with the same key are replaced. Tensors of @p other are appended and its references
 * shifted accordingly; tensors only referenced by replaced entries are dropped afterwards.
 *
 * @throws std::invalid_argument If either structure is not a JSON object.
 */
void StateDict::merge(const StateDict& other) {
    if (!Structure.is_object() || !other.Structure.is_object()) {
        throw std::invalid_argument("Only object-shaped state dicts can be merged");
    }
    const long offset = static_cast<long>(Tensors.size());
    for (const auto& item : other.Structure.items()) {
        nlohmann::json value = item.value();
        rewrite_tensor_references(value, [offset](const nlohmann::json& ref) {
            return make_tensor_reference(tensor_reference_id(ref) + offset);
        });
        Structure[item.key()] = std::move(value);
    }
    Tensors.insert(Tensors.end(), other.Tensors.begin(), other.Tensors.end());
    compact();
}

void StateDict::compact() {
    std::map<long, long> remap;
    std::vector<Tensor> kept;
    rewrite_tensor_references(Structure, [&](const nlohmann::json& ref) {
        long old_id = tensor_reference_id(ref);
        auto found = remap.find(old_id);
        if (found == remap.end()) {
            const Tensor& t = tensor(ref);
            found = remap.emplace(old_id, static_cast<long>(kept.size())).first;
            kept.push_back(t);
        }
        return make_tensor_reference(found->second);
    });
    Tensors = std::move(kept);
}

StateDict StateDict::clone() const {
    StateDict copy;
    copy.Structure = Structure;
    copy.Tensors.reserve(Tensors.size());
    for (const auto& t : Tensors) {
        copy.Tensors.push_back(t.is_null() ? t : t.clone());
    }
    return copy;
}

std::size_t StateDict::bytes() const {
    std::size_t total = 0;
    for (const auto& t : Tensors) {
        total += t.bytes();
    }
    return total;
}
