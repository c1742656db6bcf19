// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_PAYLOAD_H
#define SHARDKEEP_SRC_CHECKPOINT_PAYLOAD_H

#include <optional>

#include <nlohmann/json.hpp>

#include "checkpoint/state_dict.h"

class ITensorContainer;

//! \brief Something whose state can be checkpointed.
class IStatePayload {
public:
    virtual ~IStatePayload() = default;

    //! Snapshot of the current state. Tensors may be views into the live state.
    [[nodiscard]] virtual StateDict state_dict() = 0;

    //! Replace the current state by `state`.
    virtual void load_state_dict(const StateDict& state, bool strict) = 0;

    //! Whether the state differs between data-parallel replicas; nullopt if unknown.
    [[nodiscard]] virtual std::optional<bool> data_parallel_sharded() const { return std::nullopt; }
};

/*!
 * \brief Model weights exposed through an ITensorContainer.
 * \details The structure is a flat object mapping tensor names to tensor references. Loading copies
 * into the container's existing buffers, so dtype and shape must match.
 */
class TensorContainerPayload : public IStatePayload {
public:
    explicit TensorContainerPayload(ITensorContainer& container) : mContainer(container) {}

    [[nodiscard]] StateDict state_dict() override;
    void load_state_dict(const StateDict& state, bool strict) override;

    //! Model replicas are identical across data-parallel ranks.
    [[nodiscard]] std::optional<bool> data_parallel_sharded() const override { return false; }

private:
    ITensorContainer& mContainer;
};

/*!
 * \brief Optimizer state: named state tensors plus JSON hyper-parameters.
 * \details Stored as `{"state": {name: tensor}, "hyper_params": {...}}`. With ZeRO-1, every
 * data-parallel rank holds a different slice of the state.
 */
class OptimizerPayload : public IStatePayload {
public:
    OptimizerPayload(ITensorContainer& state, nlohmann::json& hyper_params, bool zero1) :
        mState(state), mHyperParams(hyper_params), mZero1(zero1) {}

    [[nodiscard]] StateDict state_dict() override;
    void load_state_dict(const StateDict& state, bool strict) override;
    [[nodiscard]] std::optional<bool> data_parallel_sharded() const override { return mZero1; }

private:
    ITensorContainer& mState;
    nlohmann::json& mHyperParams;
    bool mZero1;
};

//! A raw state dict; loading inserts or replaces top-level keys.
class MappingPayload : public IStatePayload {
public:
    explicit MappingPayload(StateDict& mapping) : mMapping(mapping) {}

    [[nodiscard]] StateDict state_dict() override { return mMapping; }
    void load_state_dict(const StateDict& state, bool strict) override;

private:
    StateDict& mMapping;
};

#endif //SHARDKEEP_SRC_CHECKPOINT_PAYLOAD_H
