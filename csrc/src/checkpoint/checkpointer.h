// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_CHECKPOINTER_H
#define SHARDKEEP_SRC_CHECKPOINT_CHECKPOINTER_H

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "checkpoint/io_state.h"
#include "checkpoint/parallel_state.h"
#include "checkpoint/storage.h"
#include "training/checkpoint_options.h"

class Communicator;
class CheckpointLogger;
class IStatePayload;

//! Thrown by Checkpointer::load if no tag was given and no completed checkpoint exists.
class CheckpointNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! What to write into a checkpoint. Null / empty members are skipped.
struct SaveRequest {
    IStatePayload* Model = nullptr;
    IStatePayload* Optimizer = nullptr;
    std::optional<nlohmann::json> Scheduler;
    std::optional<nlohmann::json> UserContent;
};

//! What to restore from a checkpoint. Null members are skipped.
struct LoadRequest {
    IStatePayload* Model = nullptr;
    IStatePayload* Optimizer = nullptr;
    nlohmann::json* Scheduler = nullptr;
};

/*!
 * \brief Save and load entry points for the checkpoints below one root directory.
 * \details One instance per rank. All ranks must make the same sequence of calls. `finalize()` has to be
 * called before the instance goes away; otherwise the last asynchronous checkpoint is never marked done.
 */
class Checkpointer {
public:
    Checkpointer(const std::string& root, Communicator& comm, const ParallelState& layout,
                 CheckpointOptions options, CheckpointLogger* logger = nullptr);
    ~Checkpointer();

    Checkpointer(const Checkpointer&) = delete;
    Checkpointer& operator=(const Checkpointer&) = delete;

    void save(const std::string& tag, const SaveRequest& request);

    //! Loads `tag`, or the newest completed tag. Returns the user content, if the checkpoint has one.
    std::optional<nlohmann::json> load(const std::optional<std::string>& tag, const LoadRequest& request);

    [[nodiscard]] bool has_checkpoint();
    //! Blocks until all outstanding writes and removals are finished.
    void finalize();

    [[nodiscard]] ICheckpointStorage& storage() { return *mStorage; }
    [[nodiscard]] const CheckpointIOState& io_state() const { return mIOState; }
    [[nodiscard]] const CheckpointOptions& options() const { return mOptions; }

private:
    Communicator& mComm;
    ParallelState mLayout;
    CheckpointOptions mOptions;
    CheckpointLogger* mLogger;
    // must outlive mIOState, whose background tasks write through it
    std::unique_ptr<ICheckpointStorage> mStorage;
    CheckpointIOState mIOState;
};

//! Whether `root` holds at least one completed checkpoint.
bool has_checkpoint(const std::string& root);

#endif //SHARDKEEP_SRC_CHECKPOINT_CHECKPOINTER_H
