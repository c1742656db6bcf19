// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "checkpoint/io_state.h"
#include "checkpoint/retention.h"
#include "checkpoint/storage.h"
#include "testing/utilities/test_config.h"
#include "testing/utilities/test_utils.h"
#include "utilities/comm.h"

using namespace testing_utils;
namespace fs = std::filesystem;

namespace {
//! Fails every payload write, as a full disk would.
class FailingStorage : public FilesystemCheckpointStorage {
public:
    using FilesystemCheckpointStorage::FilesystemCheckpointStorage;

    void save_json(const nlohmann::json&, const std::string& path) override {
        throw std::runtime_error(fmt::format("No space left on device: `{}`", path));
    }
};

//! Fails every file removal, as a read-only mount would.
class RemoveFailingStorage : public FilesystemCheckpointStorage {
public:
    using FilesystemCheckpointStorage::FilesystemCheckpointStorage;

    void remove_files(const std::vector<std::string>& paths) override {
        throw std::runtime_error(fmt::format("Read-only file system: cannot remove {} files", paths.size()));
    }
};

void save_cycle(CheckpointIOState& io, ICheckpointStorage& storage, Communicator& comm,
                const std::string& tag, std::optional<int> keep) {
    io.begin(storage, tag);
    io.add_save_task(nlohmann::json{{"rank", comm.rank()}, {"tag", tag}}, fmt::format("{}/rank_{}.json", tag, comm.rank()));
    io.add_save_task(make_byte_tensor(64, comm.rank()), fmt::format("{}/model/tensor_{}.pt", tag, comm.rank()));
    io.end(keep);
}

void require_tag_complete(const TempDir& dir, const std::string& tag, int nranks) {
    REQUIRE(fs::exists(dir.path() / tag / "done"));
    REQUIRE(fs::exists(dir.path() / tag / "checkpoint"));
    for (int r = 0; r < nranks; ++r) {
        REQUIRE(fs::exists(dir.path() / tag / fmt::format("rank_{}.json", r)));
    }
}
} // namespace

TEST_CASE("synchronous cycles mark tags done and retire old ones", "[checkpoint][io-state]") {
    const int nranks = testing_config::get_test_config().Ranks;
    TempDir dir("io_state_sync");
    std::atomic<bool> ok{true};

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, false);

        save_cycle(io, storage, comm, "step_1", 1);
        // complete as soon as end() returns
        if (!storage.file_exists("step_1/done")) ok = false;
        if (io.phase() != ECheckpointPhase::IDLE) ok = false;
        comm.barrier("first cycle checked");

        save_cycle(io, storage, comm, "step_2", 1);
        if (storage.file_exists("step_1")) ok = false;
        if (io.relative_paths().size() != 2) ok = false;
        if (!io.relative_paths().contains(fmt::format("rank_{}.json", comm.rank()))) ok = false;
        io.wait_all();
    });

    REQUIRE(ok);
    require_tag_complete(dir, "step_2", nranks);
    REQUIRE_FALSE(fs::exists(dir.path() / "step_1"));
}

TEST_CASE("asynchronous cycles complete at the next drain", "[checkpoint][io-state]") {
    const int nranks = testing_config::get_test_config().Ranks;
    TempDir dir("io_state_async");
    std::atomic<bool> ok{true};

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, true);

        save_cycle(io, storage, comm, "step_1", 1);
        // nothing marks the tag done before the drain
        if (storage.file_exists("step_1/done")) ok = false;
        comm.barrier("first cycle checked");

        save_cycle(io, storage, comm, "step_2", 1);
        if (!storage.file_exists("step_1/done")) ok = false;
        if (storage.file_exists("step_2/done")) ok = false;
        comm.barrier("second cycle checked");

        save_cycle(io, storage, comm, "step_3", 1);
        io.wait_all();
        if (io.save_in_flight() || io.remove_in_flight()) ok = false;
        if (io.phase() != ECheckpointPhase::IDLE) ok = false;
    });

    REQUIRE(ok);
    require_tag_complete(dir, "step_3", nranks);
    REQUIRE_FALSE(fs::exists(dir.path() / "step_1"));
    REQUIRE_FALSE(fs::exists(dir.path() / "step_2"));
}

TEST_CASE("a cycle that is never drained stays incomplete and is cleaned up later", "[checkpoint][io-state]") {
    const int nranks = testing_config::get_test_config().Ranks;
    TempDir dir("io_state_crash");

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, true);
        save_cycle(io, storage, comm, "interrupted", 2);
        // no wait_all(): the job goes away here
    });

    FilesystemCheckpointStorage storage(dir.str());
    REQUIRE(storage.list_checkpoint_tags() == std::vector<std::string>{"interrupted"});
    REQUIRE(storage.list_completed_checkpoint_tags().empty());

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage rank_storage(dir.str());
        CheckpointIOState io(comm, false);
        save_cycle(io, rank_storage, comm, "resumed", 2);
    });

    REQUIRE(storage.list_checkpoint_tags() == std::vector<std::string>{"resumed"});
    require_tag_complete(dir, "resumed", nranks);
}

TEST_CASE("removing a tag twice is harmless", "[checkpoint][io-state]") {
    const int nranks = testing_config::get_test_config().Ranks;
    TempDir dir("io_state_remove_twice");

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, false);
        save_cycle(io, storage, comm, "a", std::nullopt);
        save_cycle(io, storage, comm, "b", std::nullopt);

        io.submit_remove(std::nullopt, false, {"a"});
        io.submit_remove(std::nullopt, false, {"a"});
        io.submit_remove(std::nullopt, true, {"a"});
        io.wait_remove();
    });

    FilesystemCheckpointStorage storage(dir.str());
    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"b"});
    REQUIRE_FALSE(fs::exists(dir.path() / "a"));
}

TEST_CASE("saving a completed tag again clears its done marker first", "[checkpoint][io-state]") {
    const int nranks = testing_config::get_test_config().Ranks;
    const bool async_save = GENERATE(false, true);
    TempDir dir("io_state_resave");
    std::atomic<bool> ok{true};

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, async_save);
        save_cycle(io, storage, comm, "step_1", std::nullopt);
        io.wait_all();
        if (storage.list_completed_checkpoint_tags() != std::vector<std::string>{"step_1"}) ok = false;
        comm.barrier("first save checked");

        io.begin(storage, "step_1");
        io.add_save_task(nlohmann::json{{"rank", comm.rank()}, {"again", true}}, fmt::format("step_1/rank_{}.json", comm.rank()));
        // the payload is being rewritten, the tag must not look complete
        if (storage.file_exists("step_1/done")) ok = false;
        if (!storage.list_completed_checkpoint_tags().empty()) ok = false;
        comm.barrier("rewrite checked");

        io.end(std::nullopt);
        io.wait_all();
        if (storage.list_completed_checkpoint_tags() != std::vector<std::string>{"step_1"}) ok = false;
    });

    REQUIRE(ok);
    require_tag_complete(dir, "step_1", nranks);
}

TEST_CASE("new tags sort after the newest tag on disk", "[checkpoint][io-state]") {
    TempDir dir("io_state_clock");
    FilesystemCheckpointStorage storage(dir.str());
    // written by a run whose clock was far ahead
    const long long future_key = 4'000'000'000'000'000'000LL;
    storage.create_dir("step_9");
    storage.save_text(std::to_string(future_key), "step_9/checkpoint");
    storage.save_text("1", "step_9/done");
    REQUIRE(newest_checkpoint_ordering_key(storage) == future_key);

    Communicator::run_communicators(1, [&](Communicator& comm) {
        FilesystemCheckpointStorage rank_storage(dir.str());
        CheckpointIOState io(comm, false);
        save_cycle(io, rank_storage, comm, "step_10", std::nullopt);
    });

    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"step_9", "step_10"});
    REQUIRE(newest_checkpoint_ordering_key(storage) > future_key);
    REQUIRE(next_checkpoint_ordering_key(future_key) > future_key);
}

TEST_CASE("an interrupted deletion is finished by the next retirement", "[checkpoint][io-state]") {
    const int nranks = testing_config::get_test_config().Ranks;
    TempDir dir("io_state_interrupted_delete");

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, false);
        save_cycle(io, storage, comm, "step_1", std::nullopt);
        save_cycle(io, storage, comm, "step_2", std::nullopt);
    });

    // a deletion of step_1 that stopped after `done` and part of the payload were gone
    fs::remove(dir.path() / "step_1" / "done");
    fs::remove(dir.path() / "step_1" / "rank_0.json");
    fs::remove_all(dir.path() / "step_1" / "model");
    REQUIRE(fs::is_directory(dir.path() / "step_1"));

    FilesystemCheckpointStorage storage(dir.str());
    REQUIRE(storage.list_checkpoint_tags() == std::vector<std::string>{"step_1", "step_2"});
    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"step_2"});
    REQUIRE(determine_remove_tags(storage, std::nullopt) == std::vector<std::string>{"step_1"});

    Communicator::run_communicators(nranks, [&](Communicator& comm) {
        FilesystemCheckpointStorage rank_storage(dir.str());
        CheckpointIOState io(comm, false);
        save_cycle(io, rank_storage, comm, "step_3", std::nullopt);
    });

    REQUIRE_FALSE(fs::exists(dir.path() / "step_1"));
    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"step_2", "step_3"});
}

TEST_CASE("a failed background removal is raised when draining", "[checkpoint][io-state]") {
    TempDir dir("io_state_remove_failure");
    std::atomic<bool> removal_queued{false};

    REQUIRE_THROWS_AS(Communicator::run_communicators(1, [&](Communicator& comm) {
        RemoveFailingStorage storage(dir.str());
        CheckpointIOState io(comm, true);
        save_cycle(io, storage, comm, "step_1", 1);
        save_cycle(io, storage, comm, "step_2", 1);
        // draining step_2 retires step_1 in the background
        save_cycle(io, storage, comm, "step_3", 1);
        removal_queued = io.remove_in_flight();
        io.wait_all();
    }), std::runtime_error);

    REQUIRE(removal_queued);
    // `done` was cleared before the files, so step_1 no longer counts as complete
    FilesystemCheckpointStorage storage(dir.str());
    REQUIRE(fs::is_directory(dir.path() / "step_1"));
    REQUIRE_FALSE(fs::exists(dir.path() / "step_1" / "done"));
    REQUIRE(storage.list_completed_checkpoint_tags() == std::vector<std::string>{"step_2", "step_3"});
}

TEST_CASE("a failed background save is raised when draining", "[checkpoint][io-state]") {
    TempDir dir("io_state_failure");
    std::atomic<bool> queued_ok{false};

    REQUIRE_THROWS_AS(Communicator::run_communicators(1, [&](Communicator& comm) {
        FailingStorage storage(dir.str());
        CheckpointIOState io(comm, true);
        io.begin(storage, "broken");
        io.add_save_task(nlohmann::json{{"x", 1}}, "broken/meta.json");
        io.end(std::nullopt);
        queued_ok = io.save_in_flight();
        io.wait_save(false);
    }), std::runtime_error);

    REQUIRE(queued_ok);
    REQUIRE(fs::exists(dir.path() / "broken" / "checkpoint"));
    REQUIRE_FALSE(fs::exists(dir.path() / "broken" / "done"));
}

TEST_CASE("cycle misuse is rejected", "[checkpoint][io-state]") {
    TempDir dir("io_state_misuse");
    std::atomic<int> rejected{0};

    Communicator::run_communicators(1, [&](Communicator& comm) {
        FilesystemCheckpointStorage storage(dir.str());
        CheckpointIOState io(comm, false);

        try {
            io.add_save_task(nlohmann::json::object(), "t/x.json");
        } catch (const std::logic_error&) {
            rejected += 1;
        }
        try {
            io.end(std::nullopt);
        } catch (const std::logic_error&) {
            rejected += 1;
        }
        for (const char* tag : {"", "a/b", ".", ".."}) {
            try {
                io.begin(storage, tag);
            } catch (const std::invalid_argument&) {
                rejected += 1;
            }
        }

        io.begin(storage, "t");
        try {
            io.add_save_task(nlohmann::json::object(), "other/x.json");
        } catch (const std::logic_error&) {
            rejected += 1;
        }
        try {
            io.add_save_task(nlohmann::json::object(), "t/");
        } catch (const std::logic_error&) {
            rejected += 1;
        }
        io.end(std::nullopt);
        try {
            io.end(std::nullopt);
        } catch (const std::logic_error&) {
            rejected += 1;
        }
        io.wait_all();
    });

    REQUIRE(rejected == 9);
}

TEST_CASE("ordering keys are strictly increasing", "[checkpoint][io-state]") {
    long long previous = next_checkpoint_ordering_key();
    for (int i = 0; i < 1000; ++i) {
        long long key = next_checkpoint_ordering_key();
        REQUIRE(key > previous);
        previous = key;
    }
    REQUIRE(std::string(phase_to_str(ECheckpointPhase::RETIRING)) == "retiring");
}
