// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/parallel_state.h"

#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

ParallelState ParallelState::create(int world_size, int rank, int tp_size, int pp_size) {
    if (world_size < 1 || rank < 0 || rank >= world_size) {
        throw std::invalid_argument(fmt::format("Invalid rank {} for world size {}", rank, world_size));
    }
    if (tp_size < 1 || pp_size < 1) {
        throw std::invalid_argument(fmt::format("Invalid parallel sizes tp={} pp={}", tp_size, pp_size));
    }
    if (world_size % (tp_size * pp_size) != 0) {
        throw std::invalid_argument(fmt::format("World size {} is not divisible by tp={} x pp={}",
                                                world_size, tp_size, pp_size));
    }

    ParallelState state;
    state.Rank = rank;
    state.WorldSize = world_size;
    state.TPSize = tp_size;
    state.PPSize = pp_size;
    state.DPSize = div_exact(world_size, tp_size * pp_size);
    state.TPRank = rank % tp_size;
    state.DPRank = (rank / tp_size) % state.DPSize;
    state.PPRank = rank / (tp_size * state.DPSize);
    return state;
}

RankGroups ParallelState::data_parallel_groups() const {
    RankGroups groups;
    groups.reserve(PPSize * TPSize);
    for (int pp = 0; pp < PPSize; ++pp) {
        for (int tp = 0; tp < TPSize; ++tp) {
            std::vector<int> group;
            group.reserve(DPSize);
            for (int dp = 0; dp < DPSize; ++dp) {
                group.push_back(pp * TPSize * DPSize + dp * TPSize + tp);
            }
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

std::string ParallelState::shard_key(bool with_dp) const {
    return fmt::format("dp_rank_{:02d}_tp_rank_{:02d}_pp_rank_{:02d}.pt", with_dp ? DPRank : 0, TPRank, PPRank);
}
