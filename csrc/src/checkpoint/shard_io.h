// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_SHARD_IO_H
#define SHARDKEEP_SRC_CHECKPOINT_SHARD_IO_H

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "checkpoint/state_dict.h"
#include "utilities/comm.h"

class ICheckpointStorage;
class CheckpointIOState;
class IStatePayload;

//! Suffix of the directory holding one file per tensor of a sharded payload.
inline constexpr const char* TENSORS_DIR_SUFFIX = ".tensors";
//! Suffix of the id -> {dtype, shape} table of a sharded payload.
inline constexpr const char* TENSOR_INFO_SUFFIX = ".info.pt";

//! `(rank_in_group, group_size)` of `rank`.
//! \throws std::runtime_error if `rank` is in none of the groups.
std::pair<int, int> get_my_group_info(const RankGroups& groups, int rank);

//! `<path>.tensors/tensor_<id>.pt`
std::string tensor_file_path(const std::string& path, long id);

//! Info table `{ "<id>": {"dtype", "shape"} }` for the tensors of `state`.
nlohmann::json make_tensor_info(const StateDict& state);

//! Parses one entry of an info table.
InternalTensorReference parse_tensor_info(const nlohmann::json& info, long id);

/*!
 * \brief Queue a payload in the one-file-per-tensor format.
 * \details When `groups` is given, all members of this rank's group hold an identical `state` and call
 * this function with the same `path`. The tensors are bin-packed over the group, and each member only
 * writes the tensors of its own bin. The group's first member also writes the structure and the info
 * table. Without groups, every rank writes everything.
 */
void save_sharded(ICheckpointStorage& storage, CheckpointIOState& io, const Communicator& comm,
                  const StateDict& state, const std::string& path, const std::optional<RankGroups>& groups);

/*!
 * \brief Read a payload written by save_sharded.
 * \details With groups and an info table present, tensor `id` is read from disk only by the member
 * `id % group_size`; the others start from zeros and a sum all-reduce over the group distributes the value.
 * This is a collective over the group: all members must call it with the same `path`. Without info table
 * (older checkpoints) or without groups every rank reads all tensors itself.
 */
StateDict load_sharded(ICheckpointStorage& storage, Communicator& comm, const std::string& path,
                       const std::optional<RankGroups>& groups);

//! Queue a payload as a single blob; only the first member of each group writes.
void save_whole(CheckpointIOState& io, const Communicator& comm, const StateDict& state,
                const std::string& path, const std::optional<RankGroups>& groups);

/*!
 * \brief Load a single-blob payload into `target`, at most `num_workers` local ranks at a time.
 * \details Collective over all ranks: every wave ends with a barrier.
 */
void load_whole(ICheckpointStorage& storage, Communicator& comm, IStatePayload& target,
                const std::string& path, int num_workers, bool strict);

//! Picks save_sharded or save_whole.
void save_payload(ICheckpointStorage& storage, CheckpointIOState& io, const Communicator& comm,
                  IStatePayload& payload, const std::string& path, const std::optional<RankGroups>& groups,
                  bool sharded);

//! Picks load_sharded or load_whole.
void load_payload(ICheckpointStorage& storage, Communicator& comm, IStatePayload& target,
                  const std::string& path, const std::optional<RankGroups>& groups, bool sharded,
                  int num_workers, bool strict);

#endif //SHARDKEEP_SRC_CHECKPOINT_SHARD_IO_H
