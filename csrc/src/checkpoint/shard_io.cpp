// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/shard_io.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <tuple>

#include <fmt/core.h>

#include "checkpoint/bin_packing.h"
#include "checkpoint/io_state.h"
#include "checkpoint/payload.h"
#include "checkpoint/storage.h"
#include "utilities/utils.h"

std::pair<int, int> get_my_group_info(const RankGroups& groups, int rank) {
    for (const auto& group : groups) {
        auto found = std::find(group.begin(), group.end(), rank);
        if (found != group.end()) {
            return {narrow<int>(std::distance(group.begin(), found)), narrow<int>(group.size())};
        }
    }
    throw std::runtime_error(fmt::format("Error: global rank {} is not in groups", rank));
}

std::string tensor_file_path(const std::string& path, long id) {
    return fmt::format("{}{}/tensor_{}.pt", path, TENSORS_DIR_SUFFIX, id);
}

nlohmann::json make_tensor_info(const StateDict& state) {
    nlohmann::json info = nlohmann::json::object();
    for (std::size_t id = 0; id < state.Tensors.size(); ++id) {
        const Tensor& t = state.Tensors[id];
        if (t.is_null()) continue;
        info[std::to_string(id)] = {{"dtype", dtype_to_str(t.DType)}, {"shape", t.shape()}};
    }
    return info;
}

InternalTensorReference parse_tensor_info(const nlohmann::json& info, long id) {
    auto entry = info.find(std::to_string(id));
    if (entry == info.end()) {
        throw std::runtime_error(fmt::format("Tensor {} is missing from the tensor info table", id));
    }
    return InternalTensorReference{id,
                                   entry->at("shape").get<std::vector<long>>(),
                                   dtype_from_str(entry->at("dtype").get<std::string>())};
}

void save_sharded(ICheckpointStorage& storage, CheckpointIOState& io, const Communicator& comm,
                  const StateDict& state, const std::string& path, const std::optional<RankGroups>& groups) {
    int rank_in_group = 0;
    int group_size = 1;
    if (groups.has_value()) {
        std::tie(rank_in_group, group_size) = get_my_group_info(*groups, comm.rank());
    }

    storage.create_shared_dir(path + TENSORS_DIR_SUFFIX);

    // every member computes the same partition from the same sizes, no communication needed
    auto bins = assign_tensors_to_bins(state.Tensors, group_size);
    for (int id : bins.at(rank_in_group)) {
        // empty slots have no file; load_sharded leaves them empty
        if (state.Tensors[id].is_null()) continue;
        io.add_save_task(state.Tensors[id], tensor_file_path(path, id));
    }

    if (rank_in_group == 0) {
        io.add_save_task(state.Structure, path);
        io.add_save_task(make_tensor_info(state), path + TENSOR_INFO_SUFFIX);
    }
}

StateDict load_sharded(ICheckpointStorage& storage, Communicator& comm, const std::string& path,
                       const std::optional<RankGroups>& groups) {
    StateDict result;
    result.Structure = storage.load_json(path);

    // older checkpoints have no info table; they are still loadable, just without the shared reads
    std::optional<nlohmann::json> info;
    if (storage.file_exists(path + TENSOR_INFO_SUFFIX)) {
        info = storage.load_json(path + TENSOR_INFO_SUFFIX);
    }

    std::vector<int> my_group;
    int rank_in_group = 0;
    int group_size = 1;
    if (groups.has_value()) {
        std::tie(rank_in_group, group_size) = get_my_group_info(*groups, comm.rank());
        for (const auto& group : *groups) {
            if (std::find(group.begin(), group.end(), comm.rank()) != group.end()) {
                my_group = group;
                break;
            }
        }
    }

    // ascending ids, so that all members enter the group reductions in the same order
    auto ids = result.referenced_ids();
    std::set<long> unique_ids(ids.begin(), ids.end());
    if (!unique_ids.empty() && *unique_ids.begin() < 0) {
        throw std::runtime_error(fmt::format("Negative tensor id {} in `{}`", *unique_ids.begin(), path));
    }
    result.Tensors.resize(unique_ids.empty() ? 0 : static_cast<std::size_t>(*unique_ids.rbegin()) + 1);

    for (long id : unique_ids) {
        if (info.has_value() && groups.has_value()) {
            Tensor loaded;
            if (id % group_size == rank_in_group) {
                loaded = storage.load_tensor(tensor_file_path(path, id));
            } else {
                InternalTensorReference ref = parse_tensor_info(*info, id);
                loaded = Tensor::zeros(ref.DType, ref.Shape);
            }
            comm.all_reduce_sum(loaded, my_group);
            result.Tensors[id] = std::move(loaded);
        } else {
            result.Tensors[id] = storage.load_tensor(tensor_file_path(path, id));
        }
    }
    return result;
}

void save_whole(CheckpointIOState& io, const Communicator& comm, const StateDict& state,
                const std::string& path, const std::optional<RankGroups>& groups) {
    if (groups.has_value()) {
        if (get_my_group_info(*groups, comm.rank()).first != 0) return;
    }
    io.add_save_task(state, path);
}

void load_whole(ICheckpointStorage& storage, Communicator& comm, IStatePayload& target,
                const std::string& path, int num_workers, bool strict) {
    if (num_workers < 1) {
        throw std::invalid_argument(fmt::format("num_workers must be at least 1, got {}", num_workers));
    }
    int waves = div_ceil(comm.local_world_size(), num_workers);
    for (int wave = 0; wave < waves; ++wave) {
        if (comm.local_rank() / num_workers == wave) {
            StateDict state = storage.load_state_dict(path);
            target.load_state_dict(state, strict);
        }
        comm.barrier(fmt::format("worker-{}: checkpoint loaded", wave));
    }
    comm.barrier("load checkpoint done");
}

void save_payload(ICheckpointStorage& storage, CheckpointIOState& io, const Communicator& comm,
                  IStatePayload& payload, const std::string& path, const std::optional<RankGroups>& groups,
                  bool sharded) {
    StateDict state = payload.state_dict();
    if (sharded) {
        save_sharded(storage, io, comm, state, path, groups);
    } else {
        save_whole(io, comm, state, path, groups);
    }
}

void load_payload(ICheckpointStorage& storage, Communicator& comm, IStatePayload& target,
                  const std::string& path, const std::optional<RankGroups>& groups, bool sharded,
                  int num_workers, bool strict) {
    if (sharded) {
        StateDict state = load_sharded(storage, comm, path, groups);
        target.load_state_dict(state, strict);
    } else {
        load_whole(storage, comm, target, path, num_workers, strict);
    }
}
