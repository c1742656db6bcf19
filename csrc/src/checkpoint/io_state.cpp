// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/io_state.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "checkpoint/retention.h"
#include "training/logging.h"
#include "utilities/comm.h"

namespace {

std::size_t object_bytes(const StoredObject& object) {
    return std::visit([](const auto& value) -> std::size_t {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, nlohmann::json>) {
            return 0;
        } else {
            return value.bytes();
        }
    }, object);
}

//! Deep copy, so the caller may keep modifying its state while the copy is being written.
StoredObject snapshot(const StoredObject& object) {
    return std::visit([](const auto& value) -> StoredObject {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Tensor>) {
            return value.is_null() ? value : value.clone();
        } else if constexpr (std::is_same_v<T, StateDict>) {
            return value.clone();
        } else {
            return value;
        }
    }, object);
}

std::string join_path(const std::string& tag, const std::string& relative) {
    return tag + "/" + relative;
}

} // namespace

const char* phase_to_str(ECheckpointPhase phase) {
    switch (phase) {
        case ECheckpointPhase::IDLE: return "idle";
        case ECheckpointPhase::BEGUN: return "begun";
        case ECheckpointPhase::SAVING: return "saving";
        case ECheckpointPhase::DONE_MARKED: return "done-marked";
        case ECheckpointPhase::RETIRING: return "retiring";
    }
    return "unknown";
}

long long next_checkpoint_ordering_key(long long newest_on_disk) {
    static std::atomic<long long> last{0};
    long long now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    long long previous = last.load();
    long long next;
    do {
        next = std::max({now, previous + 1, newest_on_disk + 1});
    } while (!last.compare_exchange_weak(previous, next));
    return next;
}

long long newest_checkpoint_ordering_key(ICheckpointStorage& storage) {
    // tags are listed by key, so the last one carries the largest
    std::vector<std::string> tags = storage.list_checkpoint_tags();
    if (tags.empty()) {
        return 0;
    }
    return parse_checkpoint_ordering_key(storage.load_text(join_path(tags.back(), CHECKPOINT_MARKER)));
}

CheckpointIOState::CheckpointIOState(Communicator& comm, bool async_save, CheckpointLogger* logger) :
    mComm(comm), mAsyncSave(async_save), mLogger(logger), mRunner(fmt::format("checkpoint-io-{}", comm.rank()))
{
}

// Not draining here: queued writes still complete when the runner is joined, but without
// the barriers of a drain no `done` marker is written and the tag stays incomplete.
CheckpointIOState::~CheckpointIOState() = default;

void CheckpointIOState::require_storage() const {
    if (!mStorage) {
        throw std::logic_error("No checkpoint storage: begin() has not been called");
    }
}

/**
 * @brief Start a checkpoint cycle for @p tag.
 *
 * A previous cycle that is still pending (never ended, or ended asynchronously and not yet drained)
 * is drained first, allowing its retirement to proceed in the background. Rank 0 then creates the tag
 * directory, removes a stale `done` marker and writes the `checkpoint` marker holding the tag's
 * ordering key. No rank returns before the marker is written.
 *
 * @param storage Storage the tag lives in; must outlive this state (or the next begin()).
 * @param tag Name of the new checkpoint.
 *
 * @throws std::invalid_argument If @p tag is empty or contains a path separator.
 */
void CheckpointIOState::begin(ICheckpointStorage& storage, const std::string& tag) {
    if (tag.empty() || tag.find('/') != std::string::npos || tag == "." || tag == "..") {
        throw std::invalid_argument(fmt::format("Invalid checkpoint tag `{}`", tag));
    }

    if (mCurrentTag.has_value()) {
        drain(true);
    }
    if (std::find(mRemoveTags.begin(), mRemoveTags.end(), tag) != mRemoveTags.end()) {
        // the tag is being retired in the background; let that finish before it is written again
        wait_remove();
    }

    mStorage = &storage;
    mCurrentTag = tag;
    mEnded = false;
    mPendingDone = false;
    mPendingRetention = false;
    mNumKept.reset();
    mCycleFiles = 0;
    mCycleBytes = 0;
    mCycleStart = std::chrono::steady_clock::now();

    if (mComm.rank() == 0) {
        if (mLogger) {
            mLogger->log_message(tag, fmt::format("{} saving of checkpoint {} began", mAsyncSave ? "async" : "synced", tag));
        }
        mStorage->create_dir(tag);
        // a tag that is saved again must not count as complete while its payload is rewritten
        const std::string done_file = join_path(tag, DONE_MARKER);
        if (mStorage->file_exists(done_file)) {
            mStorage->remove_file(done_file);
        }
        // marks the directory as a checkpoint, distinguishing it from other data below the root
        long long key = next_checkpoint_ordering_key(newest_checkpoint_ordering_key(*mStorage));
        mStorage->save_text(std::to_string(key), join_path(tag, CHECKPOINT_MARKER));
    }
    mComm.barrier("checkpoint begun");
    mPhase = ECheckpointPhase::BEGUN;
}

/**
 * @brief Record a payload file of the current cycle.
 *
 * In synchronous mode the object is written immediately. In asynchronous mode a deep copy is
 * queued and written by the background thread after end().
 *
 * @throws std::logic_error If no cycle is open, or @p path is not inside the current tag.
 */
void CheckpointIOState::add_save_task(StoredObject object, const std::string& path) {
    if (!mCurrentTag || mEnded) {
        throw std::logic_error(fmt::format("Cannot save `{}`: no checkpoint cycle is open", path));
    }
    const std::string prefix = *mCurrentTag + "/";
    if (!path.starts_with(prefix) || path.size() == prefix.size()) {
        throw std::logic_error(fmt::format("Path `{}` is not inside the current checkpoint `{}`", path, *mCurrentTag));
    }

    mRelativePaths.insert(path.substr(prefix.size()));
    mCycleFiles += 1;
    mCycleBytes += object_bytes(object);

    if (mAsyncSave) {
        mSaveItems.emplace_back(snapshot(object), path);
    } else {
        mStorage->save_object(object, path);
    }
    mPhase = ECheckpointPhase::SAVING;
}

/**
 * @brief Close the current cycle.
 *
 * Synchronous mode: all ranks meet, rank 0 writes `done`, and old tags are retired synchronously.
 * Asynchronous mode: the queued items are handed to the background thread as one task and the call
 * returns; the remaining steps happen at the next drain.
 *
 * @throws std::logic_error If no cycle is open, or a background save is still unresolved.
 */
void CheckpointIOState::end(std::optional<int> keep) {
    if (!mCurrentTag || mEnded) {
        throw std::logic_error("Cannot end checkpoint: no checkpoint cycle is open");
    }
    mEnded = true;
    mNumKept = keep;

    if (mAsyncSave) {
        if (!mSaveItems.empty()) {
            if (mSaveTask.valid()) {
                throw std::logic_error("A checkpoint save task is already in flight");
            }
            ICheckpointStorage* storage = mStorage;
            mSaveTask = mRunner.submit([storage, items = std::move(mSaveItems)]() {
                for (const auto& [object, path] : items) {
                    storage->save_object(object, path);
                }
            });
            mSaveItems.clear();
            mPhase = ECheckpointPhase::SAVING;
        }
        mPendingDone = true;
        mPendingRetention = true;
        if (mComm.rank() == 0 && mLogger) {
            mLogger->log_message(*mCurrentTag, fmt::format("async saving of checkpoint {} requested", *mCurrentTag));
        }
    } else {
        mComm.barrier("saving checkpoint done");
        mPendingDone = true;
        mark_done();
        mComm.barrier("mark checkpoint as done");
        submit_remove(keep, false);
    }
}

void CheckpointIOState::mark_done() {
    if (!mPendingDone) return;
    mPendingDone = false;
    if (mComm.rank() == 0) {
        mStorage->save_text("1", join_path(*mCurrentTag, DONE_MARKER));
        if (mLogger) {
            auto elapsed = std::chrono::steady_clock::now() - mCycleStart;
            mLogger->log_save(*mCurrentTag, mCycleFiles, mCycleBytes,
                              std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
        }
    }
    mPhase = ECheckpointPhase::DONE_MARKED;
}

/**
 * @brief Wait for the background save of the current cycle, mark it done and retire old tags.
 *
 * Only has an effect in asynchronous mode. A failure of the background save is re-raised here; the
 * tag is then left without `done`.
 *
 * @param async_remove Whether the file removal of the retirement may run in the background.
 */
void CheckpointIOState::wait_save(bool async_remove) {
    if (!mAsyncSave || !mCurrentTag) {
        return;
    }

    if (mSaveTask.valid()) {
        std::future<void> task = std::move(mSaveTask);
        try {
            task.get();
        } catch (...) {
            mPendingDone = false;
            mPendingRetention = false;
            throw;
        }
    }

    mComm.barrier("async saving checkpoint done");
    mark_done();
    mComm.barrier("mark checkpoint as done");

    if (mComm.rank() == 0 && mLogger && mPendingRetention) {
        mLogger->log_message(*mCurrentTag, fmt::format("async saving of checkpoint {} completed", *mCurrentTag));
    }

    wait_remove();
    if (mPendingRetention) {
        mPendingRetention = false;
        submit_remove(mNumKept, async_remove);
    }
}

/**
 * @brief Retire old checkpoint tags.
 *
 * 1. all ranks determine the tags to remove (or use @p remove_tags) and meet;
 * 2. rank 0 deletes `done` of every tag to be removed, so an interrupted deletion never leaves a
 *    tag that looks complete;
 * 3. every rank deletes the files it wrote itself in those tags (possibly in the background);
 * 4. once all ranks are finished, rank 0 removes the tag directories.
 *
 * @throws std::logic_error If a removal is already in flight.
 */
void CheckpointIOState::submit_remove(std::optional<int> keep, bool async_remove, const std::vector<std::string>& remove_tags) {
    require_storage();
    if (mRemoveTask.valid()) {
        throw std::logic_error("A checkpoint removal task is already in flight");
    }

    std::vector<std::string> tags = remove_tags.empty() ? determine_remove_tags(*mStorage, keep) : remove_tags;
    mComm.barrier("determine remove tags done");
    if (tags.empty()) {
        if (mComm.rank() == 0 && mLogger) {
            mLogger->log_debug(mCurrentTag.value_or(""), "no checkpoints to remove");
        }
        mPhase = ECheckpointPhase::IDLE;
        return;
    }

    mPhase = ECheckpointPhase::RETIRING;
    if (mComm.rank() == 0) {
        std::vector<std::string> completed;
        for (const auto& tag : tags) {
            std::string done_file = join_path(tag, DONE_MARKER);
            if (mStorage->file_exists(done_file)) {
                mStorage->remove_file(done_file);
                completed.push_back(tag);
            }
        }
        if (mLogger) {
            mLogger->log_message(mCurrentTag.value_or(""), fmt::format("removing previous checkpoints [{}]", fmt::join(tags, ", ")));
            mLogger->log_debug(mCurrentTag.value_or(""), fmt::format("done markers of [{}] cleared", fmt::join(completed, ", ")));
        }
    }

    std::vector<std::string> files;
    files.reserve(tags.size() * mRelativePaths.size());
    for (const auto& tag : tags) {
        for (const auto& relative : mRelativePaths) {
            files.push_back(join_path(tag, relative));
        }
    }

    if (async_remove) {
        ICheckpointStorage* storage = mStorage;
        mRemoveTags = tags;
        mRemoveTask = mRunner.submit([storage, files = std::move(files)]() {
            storage->remove_files(files);
        });
        if (mComm.rank() == 0 && mLogger) {
            mLogger->log_debug(mCurrentTag.value_or(""), fmt::format("async removal of [{}] requested", fmt::join(tags, ", ")));
        }
    } else {
        mStorage->remove_files(files);
        mComm.barrier("remove files done");
        // everyone deleted the files they wrote; rank 0 deletes what is left
        if (mComm.rank() == 0) {
            mStorage->remove_dirs(tags);
            if (mLogger) {
                mLogger->log_removal(tags);
            }
        }
        mComm.barrier("remove dirs done");
        mPhase = ECheckpointPhase::IDLE;
    }
}

/**
 * @brief Wait for an outstanding background removal and finish it.
 *
 * Always ends with a barrier, so that no rank starts listing tags for the next retirement while
 * another one is still deleting.
 */
void CheckpointIOState::wait_remove() {
    if (mRemoveTask.valid()) {
        std::future<void> task = std::move(mRemoveTask);
        task.get();

        mComm.barrier("remove files done");
        if (mComm.rank() == 0) {
            mStorage->remove_dirs(mRemoveTags);
            if (mLogger) {
                mLogger->log_removal(mRemoveTags);
            }
        }
        mRemoveTags.clear();
        if (mPhase == ECheckpointPhase::RETIRING) {
            mPhase = ECheckpointPhase::IDLE;
        }
    }
    mComm.barrier("wait for all workers to come from deletion");
}

void CheckpointIOState::drain(bool async_remove) {
    if (mCurrentTag && !mEnded) {
        end(mNumKept);
    }
    wait_save(async_remove);
}

void CheckpointIOState::wait_all() {
    if (!mCurrentTag) {
        return;
    }
    drain(false);
    // synchronous mode never leaves a removal behind; asynchronous mode has just retired synchronously
    if (mRemoveTask.valid()) {
        wait_remove();
    }
}
