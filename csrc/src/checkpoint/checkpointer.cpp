// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/checkpointer.h"

#include <chrono>
#include <utility>

#include <fmt/core.h>

#include "checkpoint/payload.h"
#include "checkpoint/shard_io.h"
#include "training/logging.h"
#include "utilities/comm.h"

namespace {
std::string payload_path(const std::string& tag, const char* kind, const std::string& shard_key) {
    return fmt::format("{}/{}/{}", tag, kind, shard_key);
}
} // namespace

Checkpointer::Checkpointer(const std::string& root, Communicator& comm, const ParallelState& layout,
                           CheckpointOptions options, CheckpointLogger* logger) :
    mComm(comm), mLayout(layout), mOptions(std::move(options)), mLogger(logger),
    mStorage(create_checkpoint_storage(root)), mIOState(comm, mOptions.AsyncSave, logger)
{
    mOptions.validate();
    if (mLayout.Rank != comm.rank() || mLayout.WorldSize != comm.world_size()) {
        throw std::invalid_argument(fmt::format("Parallel layout (rank {} of {}) does not match communicator (rank {} of {})",
                                                mLayout.Rank, mLayout.WorldSize, comm.rank(), comm.world_size()));
    }
}

Checkpointer::~Checkpointer() = default;

/**
 * @brief Write a checkpoint under @p tag.
 *
 * Model state is identical across data-parallel replicas, so it is stored once per (tp, pp) position and
 * split over the replicas. Optimizer state is handled the same way, unless it is ZeRO-1 partitioned, in
 * which case every rank writes its own file. Scheduler and user content are written by rank 0.
 *
 * In asynchronous mode this returns as soon as the payloads are queued; the checkpoint only becomes
 * complete at the next save() or at finalize().
 */
void Checkpointer::save(const std::string& tag, const SaveRequest& request) {
    if (mComm.rank() == 0) {
        mStorage->create_dir(".");
    }
    mIOState.begin(*mStorage, tag);

    const RankGroups dp_groups = mLayout.data_parallel_groups();

    if (request.Model) {
        if (mComm.rank() == 0) {
            mStorage->create_dir(tag + "/model");
        }
        save_payload(*mStorage, mIOState, mComm, *request.Model,
                     payload_path(tag, "model", mLayout.shard_key(false)), dp_groups, mOptions.UseShardedFormat);
    }

    if (request.Optimizer) {
        if (mComm.rank() == 0) {
            mStorage->create_dir(tag + "/optim");
        }
        bool zero1 = request.Optimizer->data_parallel_sharded().value_or(mOptions.Zero1Optimizer);
        std::optional<RankGroups> groups;
        if (!zero1) {
            groups = dp_groups;
        }
        save_payload(*mStorage, mIOState, mComm, *request.Optimizer,
                     payload_path(tag, "optim", mLayout.shard_key(zero1)), groups, mOptions.UseShardedFormat);
    }

    if (mComm.rank() == 0) {
        if (request.Scheduler) {
            mIOState.add_save_task(*request.Scheduler, tag + "/scheduler.pt");
        }
        if (request.UserContent) {
            mIOState.add_save_task(*request.UserContent, tag + "/user_content.pt");
        }
    }

    mIOState.end(mOptions.NumKept);
}

/**
 * @brief Restore the payloads of a checkpoint.
 *
 * @param tag Checkpoint to load; the newest completed one if not given.
 * @param request Payloads to restore.
 * @return The checkpoint's user content, if it has any.
 *
 * @throws CheckpointNotFound If no tag was given and there is no completed checkpoint.
 */
std::optional<nlohmann::json> Checkpointer::load(const std::optional<std::string>& tag, const LoadRequest& request) {
    auto start = std::chrono::steady_clock::now();

    std::string ckpt_tag;
    if (tag.has_value()) {
        ckpt_tag = *tag;
    } else {
        auto tags = mStorage->list_completed_checkpoint_tags();
        if (tags.empty()) {
            throw CheckpointNotFound(fmt::format("Error: no checkpoint under directory `{}`", mStorage->root()));
        }
        ckpt_tag = tags.back();
    }

    const bool sharded = mStorage->is_checkpoint_sharded(ckpt_tag);
    if (mComm.rank() == 0 && mLogger) {
        mLogger->log_message(ckpt_tag, fmt::format("loading checkpoint from {} ({} format)", ckpt_tag, sharded ? "sharded" : "whole"));
    }

    const RankGroups dp_groups = mLayout.data_parallel_groups();

    if (request.Model) {
        load_payload(*mStorage, mComm, *request.Model, payload_path(ckpt_tag, "model", mLayout.shard_key(false)),
                     dp_groups, sharded, mOptions.NumWorkers, mOptions.Strict);
    }

    if (request.Optimizer) {
        std::optional<bool> hint = request.Optimizer->data_parallel_sharded();
        // ZeRO-1 checkpoints carry one optimizer file per data-parallel rank
        bool zero1 = hint.has_value() ? *hint
                                      : mStorage->file_exists(ckpt_tag + "/optim/dp_rank_01_tp_rank_00_pp_rank_00.pt");
        std::optional<RankGroups> groups;
        if (!zero1) {
            groups = dp_groups;
        }
        load_payload(*mStorage, mComm, *request.Optimizer, payload_path(ckpt_tag, "optim", mLayout.shard_key(zero1)),
                     groups, sharded, mOptions.NumWorkers, true);
    }

    if (request.Scheduler) {
        *request.Scheduler = mStorage->load_json(ckpt_tag + "/scheduler.pt");
    }

    std::optional<nlohmann::json> user_content;
    if (mStorage->file_exists(ckpt_tag + "/user_content.pt")) {
        user_content = mStorage->load_json(ckpt_tag + "/user_content.pt");
    }

    if (mComm.rank() == 0 && mLogger) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        mLogger->log_load(ckpt_tag, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    }
    mComm.barrier("load all checkpoints done");
    return user_content;
}

bool Checkpointer::has_checkpoint() {
    return !mStorage->list_completed_checkpoint_tags().empty();
}

void Checkpointer::finalize() {
    mIOState.wait_all();
}

bool has_checkpoint(const std::string& root) {
    auto storage = create_checkpoint_storage(root);
    return !storage->list_completed_checkpoint_tags().empty();
}
