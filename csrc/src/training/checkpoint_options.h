// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_TRAINING_CHECKPOINT_OPTIONS_H
#define SHARDKEEP_SRC_TRAINING_CHECKPOINT_OPTIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Checkpointing options used by the CLI driver and the Checkpointer.
struct CheckpointOptions {
    bool AsyncSave = false;           ///< Write payloads and retire old tags on a background thread
    bool UseShardedFormat = true;     ///< One file per tensor, split across replicas; otherwise one blob per rank
    std::optional<int> NumKept;       ///< Completed checkpoints to keep; unset or negative keeps all
    int NumWorkers = 8;               ///< Local ranks reading a non-sharded checkpoint concurrently
    bool Zero1Optimizer = false;      ///< Optimizer state is unique per data-parallel rank
    bool Strict = true;               ///< Reject missing/unexpected keys when loading the model

    //! Throws std::invalid_argument if a value is out of range.
    void validate() const;

    [[nodiscard]] std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>> to_log_options() const;
};

//! Reads options from a JSON object file. Keys missing from the file keep their defaults.
CheckpointOptions load_checkpoint_options(const std::string& file_name);

#endif //SHARDKEEP_SRC_TRAINING_CHECKPOINT_OPTIONS_H
