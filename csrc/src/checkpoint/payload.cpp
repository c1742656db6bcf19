// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/payload.h"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "utilities/tensor_container.h"

namespace {

StateDict container_state(ITensorContainer& container) {
    StateDict state;
    container.iterate_tensors([&state](std::string name, const Tensor& tensor) {
        state.Structure[name] = state.add_tensor(tensor);
    });
    return state;
}

/**
 * @brief Copy the tensors named in @p entries into the matching tensors of @p container.
 *
 * @param entries JSON object mapping names to tensor references into @p state.
 * @param strict If true, names present on only one side are an error.
 *
 * @throws std::logic_error On missing/unexpected keys (strict) or dtype/shape mismatches.
 */
void load_into_container(ITensorContainer& container, const StateDict& state, const nlohmann::json& entries,
                         bool strict, const char* what) {
    if (!entries.is_object()) {
        throw std::logic_error(fmt::format("Invalid {} checkpoint: expected an object of tensors, got {}", what, entries.type_name()));
    }

    std::map<std::string, Tensor> targets;
    container.iterate_tensors([&targets](std::string name, const Tensor& tensor) {
        targets.emplace(std::move(name), tensor);
    });

    std::vector<std::string> unexpected;
    for (const auto& item : entries.items()) {
        if (!targets.contains(item.key()) || !is_tensor_reference(item.value())) {
            unexpected.push_back(item.key());
        }
    }

    std::vector<std::string> missing;
    for (const auto& [name, tensor] : targets) {
        if (!entries.contains(name)) {
            missing.push_back(name);
        }
    }

    if (strict && (!missing.empty() || !unexpected.empty())) {
        throw std::logic_error(fmt::format("Error loading {} state: missing keys [{}], unexpected keys [{}]",
                                           what, fmt::join(missing, ", "), fmt::join(unexpected, ", ")));
    }

    for (const auto& item : entries.items()) {
        auto found = targets.find(item.key());
        if (found == targets.end() || !is_tensor_reference(item.value())) {
            continue;
        }
        try {
            copy_tensor(found->second, state.tensor(item.value()));
        } catch (const std::logic_error& e) {
            throw std::logic_error(fmt::format("Error loading {} tensor `{}`: {}", what, item.key(), e.what()));
        }
    }
}

} // namespace

StateDict TensorContainerPayload::state_dict() {
    return container_state(mContainer);
}

void TensorContainerPayload::load_state_dict(const StateDict& state, bool strict) {
    load_into_container(mContainer, state, state.Structure, strict, "model");
}

StateDict OptimizerPayload::state_dict() {
    StateDict inner = container_state(mState);
    StateDict state;
    state.Structure["state"] = std::move(inner.Structure);
    state.Structure["hyper_params"] = mHyperParams;
    state.Tensors = std::move(inner.Tensors);
    return state;
}

void OptimizerPayload::load_state_dict(const StateDict& state, bool strict) {
    if (!state.Structure.is_object() || !state.Structure.contains("state")) {
        throw std::logic_error("Invalid optimizer checkpoint: missing `state`");
    }
    load_into_container(mState, state, state.Structure["state"], strict, "optimizer");
    if (auto found = state.Structure.find("hyper_params"); found != state.Structure.end()) {
        mHyperParams = *found;
    }
}

void MappingPayload::load_state_dict(const StateDict& state, bool /*strict*/) {
    mMapping.merge(state);
}
