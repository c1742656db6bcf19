// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_RETENTION_H
#define SHARDKEEP_SRC_CHECKPOINT_RETENTION_H

#include <optional>
#include <string>
#include <vector>

class ICheckpointStorage;

//! Classification of the tags below a checkpoint root.
struct RetentionPlan {
    //! Incomplete tags older than every completed tag; left over from an interrupted deletion.
    std::vector<std::string> Corrupted;
    //! Completed tags beyond the newest `keep`, oldest first.
    std::vector<std::string> Excess;

    //! Corrupted tags followed by excess tags.
    [[nodiscard]] std::vector<std::string> remove_tags() const;
};

/*!
 * \brief Decide which tags to delete so that at most `keep` completed checkpoints remain.
 * \details Incomplete tags that come after a completed tag are kept: they belong to a save that was
 * interrupted and will be overwritten once training resumes. `keep` unset or negative keeps all
 * completed tags.
 */
RetentionPlan plan_retention(ICheckpointStorage& storage, std::optional<int> keep);

//! `plan_retention(storage, keep).remove_tags()`
std::vector<std::string> determine_remove_tags(ICheckpointStorage& storage, std::optional<int> keep);

#endif //SHARDKEEP_SRC_CHECKPOINT_RETENTION_H
