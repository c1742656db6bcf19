// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/retention.h"

#include "checkpoint/storage.h"

std::vector<std::string> RetentionPlan::remove_tags() const {
    std::vector<std::string> tags = Corrupted;
    tags.insert(tags.end(), Excess.begin(), Excess.end());
    return tags;
}

RetentionPlan plan_retention(ICheckpointStorage& storage, std::optional<int> keep) {
    RetentionPlan plan;
    std::vector<std::string> completed;
    for (auto& tag : storage.list_checkpoint_tags()) {
        if (storage.file_exists(tag + "/" + DONE_MARKER)) {
            completed.push_back(std::move(tag));
        } else if (completed.empty()) {
            plan.Corrupted.push_back(std::move(tag));
        }
    }

    if (keep.has_value() && *keep >= 0 && completed.size() > static_cast<std::size_t>(*keep)) {
        std::size_t excess = completed.size() - static_cast<std::size_t>(*keep);
        plan.Excess.assign(completed.begin(), completed.begin() + static_cast<std::ptrdiff_t>(excess));
    }
    return plan;
}

std::vector<std::string> determine_remove_tags(ICheckpointStorage& storage, std::optional<int> keep) {
    return plan_retention(storage, keep).remove_tags();
}
