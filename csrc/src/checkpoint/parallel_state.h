// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_PARALLEL_STATE_H
#define SHARDKEEP_SRC_CHECKPOINT_PARALLEL_STATE_H

#include <string>

#include "utilities/comm.h"

//! Position of one rank in a (data, tensor, pipeline)-parallel layout.
//! Ranks are laid out tensor-parallel fastest, then data-parallel, then pipeline-parallel.
struct ParallelState {
    int Rank = 0;
    int WorldSize = 1;
    int TPSize = 1;
    int PPSize = 1;
    int DPSize = 1;

    int TPRank = 0;
    int DPRank = 0;
    int PPRank = 0;

    //! \throws std::invalid_argument if `world_size` is not a multiple of `tp_size * pp_size`.
    static ParallelState create(int world_size, int rank, int tp_size = 1, int pp_size = 1);

    //! For each (pipeline, tensor) position, the ranks that only differ in their data-parallel rank.
    [[nodiscard]] RankGroups data_parallel_groups() const;

    //! `dp_rank_XX_tp_rank_XX_pp_rank_XX.pt`; the dp rank is written as 00 unless `with_dp`.
    [[nodiscard]] std::string shard_key(bool with_dp) const;
};

#endif //SHARDKEEP_SRC_CHECKPOINT_PARALLEL_STATE_H
