// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "checkpoint/io_state.h"
#include "checkpoint/payload.h"
#include "checkpoint/shard_io.h"
#include "checkpoint/storage.h"
#include "testing/utilities/test_config.h"
#include "testing/utilities/test_utils.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

using namespace testing_utils;

namespace {
//! Counts the tensor files read through it.
class CountingStorage : public FilesystemCheckpointStorage {
public:
    using FilesystemCheckpointStorage::FilesystemCheckpointStorage;

    Tensor load_tensor(const std::string& path) override {
        ++TensorLoads;
        return FilesystemCheckpointStorage::load_tensor(path);
    }

    int TensorLoads = 0;
};

int num_tensors() {
    return testing_config::get_test_config().NumTensors;
}

const RankGroups GROUPS = {{0, 1}, {2, 3}};

int group_of(int rank) {
    return rank / 2;
}

StateDict make_group_state(int group) {
    StateDict state;
    nlohmann::json layers = nlohmann::json::array();
    for (int i = 0; i < num_tensors(); ++i) {
        layers.push_back(state.add_tensor(make_byte_tensor(10 * (i + 1), group * 10 + i)));
    }
    state.Structure["layers"] = layers;
    // a tensor referenced twice is stored once
    state.Structure["tied"] = layers[0];
    state.Structure["meta"] = {{"group", group}};
    return state;
}

bool states_equal(const StateDict& a, const StateDict& b) {
    if (a.Structure != b.Structure) return false;
    for (long id : a.referenced_ids()) {
        if (!tensors_equal(a.Tensors.at(id), b.Tensors.at(id))) return false;
    }
    return true;
}

//! One synchronous cycle in which every group writes its own state to `g<group>/model.pt`.
void write_groups(Communicator& comm, ICheckpointStorage& storage, bool sharded) {
    CheckpointIOState io(comm, false);
    io.begin(storage, "tag");
    StateDict state = make_group_state(group_of(comm.rank()));
    MappingPayload payload(state);
    save_payload(storage, io, comm, payload, fmt::format("tag/g{}/model.pt", group_of(comm.rank())), GROUPS, sharded);
    io.end(std::nullopt);
}
} // namespace

TEST_CASE("group info locates a rank in its group", "[checkpoint][shard-io]") {
    REQUIRE(get_my_group_info(GROUPS, 0) == std::pair<int, int>{0, 2});
    REQUIRE(get_my_group_info(GROUPS, 3) == std::pair<int, int>{1, 2});
    REQUIRE(get_my_group_info({{4, 2, 7}}, 7) == std::pair<int, int>{2, 3});
    REQUIRE_THROWS_AS(get_my_group_info(GROUPS, 5), std::runtime_error);
}

TEST_CASE("tensor info table describes every tensor", "[checkpoint][shard-io]") {
    StateDict state;
    state.add_tensor(make_float_tensor({2, 3}, 0.f));
    state.add_tensor(make_byte_tensor(7, 1));
    nlohmann::json info = make_tensor_info(state);
    REQUIRE(info.size() == 2);

    InternalTensorReference ref = parse_tensor_info(info, 0);
    REQUIRE(ref.Id == 0);
    REQUIRE(ref.Shape == std::vector<long>{2, 3});
    REQUIRE(ref.DType == ETensorDType::FP32);
    REQUIRE(parse_tensor_info(info, 1).DType == ETensorDType::BYTE);
    REQUIRE_THROWS_AS(parse_tensor_info(info, 2), std::runtime_error);

    REQUIRE(tensor_file_path("t/model/x.pt", 3) == "t/model/x.pt.tensors/tensor_3.pt");
}

TEST_CASE("empty tensor slots are skipped by sharded saves", "[checkpoint][shard-io]") {
    TempDir dir("shard_io_empty_slots");
    std::atomic<bool> ok{true};
    const RankGroups pair = {{0, 1}};

    Communicator::run_communicators(2, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, false);

        StateDict state;
        state.Tensors.emplace_back();
        state.Structure["w"] = state.add_tensor(make_byte_tensor(6, 1));
        state.Tensors.emplace_back();
        if (make_tensor_info(state).size() != 1) ok = false;

        io.begin(storage, "tag");
        save_sharded(storage, io, comm, state, "tag/model.pt", pair);
        io.end(std::nullopt);

        StateDict loaded = load_sharded(storage, comm, "tag/model.pt", pair);
        if (!states_equal(loaded, state) || !loaded.Tensors.at(0).is_null()) ok = false;
        if (storage.file_exists(tensor_file_path("tag/model.pt", 0))) ok = false;
        if (storage.file_exists(tensor_file_path("tag/model.pt", 2))) ok = false;
    });

    REQUIRE(ok);
}

TEST_CASE("sharded payloads split the reads over the group", "[checkpoint][shard-io]") {
    TempDir dir("shard_io_sharded");
    std::atomic<bool> values_ok{true};
    std::atomic<bool> reads_ok{true};

    Communicator::run_communicators(4, [&](Communicator& comm) {
        CountingStorage storage(dir.str());
        write_groups(comm, storage, true);

        const std::string path = fmt::format("tag/g{}/model.pt", group_of(comm.rank()));
        StateDict loaded = load_sharded(storage, comm, path, GROUPS);
        if (!states_equal(loaded, make_group_state(group_of(comm.rank())))) values_ok = false;

        const int group_size = 2;
        if (storage.TensorLoads > div_ceil(num_tensors(), group_size)) reads_ok = false;
    });

    REQUIRE(values_ok);
    REQUIRE(reads_ok);

    // the writers together produced every tensor file, plus structure and info table once per group
    FilesystemCheckpointStorage storage(dir.str());
    for (int group = 0; group < 2; ++group) {
        const std::string path = fmt::format("tag/g{}/model.pt", group);
        REQUIRE(storage.file_exists(path));
        REQUIRE(storage.file_exists(path + TENSOR_INFO_SUFFIX));
        REQUIRE(storage.list_dir(path + TENSORS_DIR_SUFFIX).size() == static_cast<std::size_t>(num_tensors()));
    }
    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"tag"});
}

TEST_CASE("sharded payloads without info table are read by every rank", "[checkpoint][shard-io]") {
    TempDir dir("shard_io_no_info");
    std::atomic<bool> values_ok{true};
    std::atomic<bool> reads_ok{true};

    Communicator::run_communicators(4, [&](Communicator& comm) {
        CountingStorage storage(dir.str());
        write_groups(comm, storage, true);
        if (comm.rank() == 0) {
            storage.remove_files({"tag/g0/model.pt.info.pt", "tag/g1/model.pt.info.pt"});
        }
        comm.barrier("info removed");

        const std::string path = fmt::format("tag/g{}/model.pt", group_of(comm.rank()));
        StateDict loaded = load_sharded(storage, comm, path, GROUPS);
        if (!states_equal(loaded, make_group_state(group_of(comm.rank())))) values_ok = false;
        if (storage.TensorLoads != num_tensors()) reads_ok = false;
    });

    REQUIRE(values_ok);
    REQUIRE(reads_ok);
}

TEST_CASE("whole payloads are written once per group and loaded in waves", "[checkpoint][shard-io]") {
    TempDir dir("shard_io_whole");
    std::atomic<bool> values_ok{true};

    Communicator::run_communicators(4, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        write_groups(comm, storage, false);

        StateDict restored;
        MappingPayload target(restored);
        const std::string path = fmt::format("tag/g{}/model.pt", group_of(comm.rank()));
        load_payload(storage, comm, target, path, GROUPS, false, 1, true);
        if (!states_equal(restored, make_group_state(group_of(comm.rank())))) values_ok = false;
    });

    REQUIRE(values_ok);
    FilesystemCheckpointStorage storage(dir.str());
    REQUIRE(storage.list_dir("tag/g0") == std::vector<std::string>{"model.pt"});
    REQUIRE_FALSE(storage.is_checkpoint_sharded("tag"));
}

TEST_CASE("whole loading needs at least one worker", "[checkpoint][shard-io]") {
    TempDir dir("shard_io_workers");
    REQUIRE_THROWS_AS(Communicator::run_communicators(1, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        StateDict restored;
        MappingPayload target(restored);
        load_whole(storage, comm, target, "tag/model.pt", 0, true);
    }), std::invalid_argument);
}
