// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>

#include "checkpoint/storage.h"
#include "testing/utilities/test_utils.h"

using namespace testing_utils;
namespace fs = std::filesystem;

TEST_CASE("filesystem storage round-trips every object kind", "[checkpoint][storage]") {
    TempDir dir("storage_objects");
    FilesystemCheckpointStorage storage(dir.str());

    storage.save_text("hello", "tag/notes.txt");
    REQUIRE(storage.load_text("tag/notes.txt") == "hello");

    nlohmann::json doc = {{"lr", 0.5}, {"steps", {1, 2, 3}}};
    storage.save_object(doc, "tag/scheduler.pt");
    REQUIRE(storage.load_json("tag/scheduler.pt") == doc);

    Tensor t = make_float_tensor({2, 2}, 4.f);
    storage.save_object(t, "tag/model/x.pt.tensors/tensor_0.pt");
    REQUIRE(tensors_equal(storage.load_tensor("tag/model/x.pt.tensors/tensor_0.pt"), t));

    StateDict state;
    state.Structure["w"] = state.add_tensor(make_float_tensor({3}, 1.f));
    state.Structure["inner"] = {{"b", state.add_tensor(make_byte_tensor(9, 2))}, {"flag", true}};
    storage.save_object(state, "tag/model/blob.pt");
    StateDict loaded = storage.load_state_dict("tag/model/blob.pt");
    REQUIRE(loaded.Structure == state.Structure);
    REQUIRE(loaded.Tensors.size() == 2);
    REQUIRE(tensors_equal(loaded.tensor(loaded.Structure["w"]), state.Tensors[0]));
    REQUIRE(tensors_equal(loaded.tensor(loaded.Structure["inner"]["b"]), state.Tensors[1]));

    // no temporary files are left behind
    for (const auto& entry : fs::recursive_directory_iterator(dir.path())) {
        REQUIRE(entry.path().extension() != ".tmp");
    }
}

TEST_CASE("empty tensor slots are not written", "[checkpoint][storage]") {
    TempDir dir("storage_empty_slots");
    FilesystemCheckpointStorage storage(dir.str());

    StateDict state;
    state.Tensors.emplace_back();
    state.Structure["w"] = state.add_tensor(make_byte_tensor(5, 3));
    state.Tensors.emplace_back();
    storage.save_object(state, "tag/blob.pt");

    StateDict loaded = storage.load_state_dict("tag/blob.pt");
    REQUIRE(loaded.Structure["w"] == make_tensor_reference(1));
    REQUIRE(loaded.Tensors.size() == 2);
    REQUIRE(loaded.Tensors[0].is_null());
    REQUIRE(tensors_equal(loaded.Tensors[1], state.Tensors[1]));

    REQUIRE_THROWS_AS(storage.save_tensor(Tensor{}, "tag/empty.pt"), std::invalid_argument);
    REQUIRE_FALSE(storage.file_exists("tag/empty.pt"));
}

TEST_CASE("filesystem storage directory operations", "[checkpoint][storage]") {
    TempDir dir("storage_dirs");
    FilesystemCheckpointStorage storage(dir.str(), 3);

    storage.create_dir("a/b");
    REQUIRE_THROWS_AS(storage.create_dir("a/b", false), std::runtime_error);
    storage.create_shared_dir("a/b/c.tensors");
    storage.create_shared_dir("a/b/c.tensors");
    REQUIRE(fs::is_directory(dir.path() / "a/b/c.tensors"));

    for (int i = 0; i < 10; ++i) {
        storage.save_text("x", "a/file_" + std::to_string(i));
    }
    REQUIRE(storage.list_dir("a").size() == 11);
    REQUIRE(storage.list_dir("a").front() == "b");
    REQUIRE(storage.list_dir("does/not/exist").empty());

    std::vector<std::string> victims = {"a/b", "a/missing"};
    for (int i = 0; i < 10; ++i) {
        victims.push_back("a/file_" + std::to_string(i));
    }
    storage.remove_files(victims);
    REQUIRE(storage.list_dir("a").empty());

    storage.remove_file("a/never-existed");
    storage.remove_dirs({"a"});
    REQUIRE_FALSE(storage.file_exists("a"));

    REQUIRE_THROWS_AS(storage.save_text("x", "/etc/abs"), std::invalid_argument);
}

TEST_CASE("checkpoint tags are ordered by their marker key", "[checkpoint][storage]") {
    TempDir dir("storage_tags");
    FilesystemCheckpointStorage storage(dir.str());

    storage.save_text("300", "zeta/checkpoint");
    storage.save_text("100", "beta/checkpoint");
    storage.save_text("200", "alpha/checkpoint");
    storage.create_dir("not-a-checkpoint");
    storage.save_text("1", "beta/done");
    storage.save_text("1", "zeta/done");

    REQUIRE(storage.list_checkpoint_tags() == std::vector<std::string>{"beta", "alpha", "zeta"});
    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"beta", "zeta"});

    REQUIRE(parse_checkpoint_ordering_key(" 42\n") == 42);
    REQUIRE(parse_checkpoint_ordering_key("") == 0);
    REQUIRE(parse_checkpoint_ordering_key("abc") == 0);
}

TEST_CASE("sharded checkpoints are recognized by their tensor directories", "[checkpoint][storage]") {
    TempDir dir("storage_sharded");
    FilesystemCheckpointStorage storage(dir.str());

    storage.create_shared_dir("sharded/model/dp_rank_00_tp_rank_00_pp_rank_00.pt.tensors");
    storage.save_text("{}", "whole/model/dp_rank_00_tp_rank_00_pp_rank_00.pt");
    storage.create_shared_dir("optim_only/optim/dp_rank_00_tp_rank_00_pp_rank_00.pt.tensors");

    REQUIRE(storage.is_checkpoint_sharded("sharded"));
    REQUIRE_FALSE(storage.is_checkpoint_sharded("whole"));
    REQUIRE(storage.is_checkpoint_sharded("optim_only"));
    REQUIRE_FALSE(storage.is_checkpoint_sharded("missing"));
}

TEST_CASE("storage factory rejects unsupported locations", "[checkpoint][storage]") {
    REQUIRE_THROWS_AS(create_checkpoint_storage("s3://bucket/run"), std::invalid_argument);
    REQUIRE_THROWS_AS(create_checkpoint_storage("S3://bucket/run"), std::invalid_argument);
    REQUIRE_THROWS_AS(create_checkpoint_storage(""), std::invalid_argument);
    REQUIRE(create_checkpoint_storage("/tmp/shardkeep-unused")->root() == "/tmp/shardkeep-unused");
}
