// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_IO_STATE_H
#define SHARDKEEP_SRC_CHECKPOINT_IO_STATE_H

#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "checkpoint/storage.h"
#include "utilities/task_runner.h"

class Communicator;
class CheckpointLogger;

enum class ECheckpointPhase {
    IDLE,
    BEGUN,          ///< tag directory and `checkpoint` marker exist
    SAVING,         ///< payload writes recorded or in flight
    DONE_MARKED,    ///< `done` written for the current tag
    RETIRING        ///< old tags are being removed
};

const char* phase_to_str(ECheckpointPhase phase);

/*!
 * \brief Lifecycle of checkpoint generations on one rank: begin, save, mark done, retire.
 * \details Every rank owns one instance and must call the same sequence of operations, since most of
 * them contain barriers. Marker files and directory deletions are only touched by rank 0.
 *
 * In asynchronous mode, payload writes of a cycle are queued and handed to a background thread by
 * end(); the `done` marker for that cycle is written by the next drain (the next begin(), or
 * wait_save() / wait_all()). At most one save and one removal task are in flight at any time.
 *
 * Crash consistency: a tag is complete iff `done` exists. `done` is only written after all ranks
 * finished writing, and it is the first file removed when a tag is retired.
 */
class CheckpointIOState {
public:
    CheckpointIOState(Communicator& comm, bool async_save, CheckpointLogger* logger = nullptr);
    ~CheckpointIOState();

    CheckpointIOState(const CheckpointIOState&) = delete;
    CheckpointIOState& operator=(const CheckpointIOState&) = delete;

    //! Start a new cycle for `tag`, draining the previous one first.
    void begin(ICheckpointStorage& storage, const std::string& tag);

    //! Record `object` to be written at `path`, which must lie inside the current tag.
    void add_save_task(StoredObject object, const std::string& path);

    //! Close the current cycle; `keep` is the number of completed tags to retain.
    void end(std::optional<int> keep);

    //! Drain: wait for background saving, mark the tag done, then retire old tags.
    void wait_save(bool async_remove);

    //! Retire tags; if `remove_tags` is empty they are chosen by the retention policy.
    void submit_remove(std::optional<int> keep, bool async_remove, const std::vector<std::string>& remove_tags = {});

    void wait_remove();

    //! Shutdown drain; removal is always synchronous.
    void wait_all();

    [[nodiscard]] ECheckpointPhase phase() const { return mPhase; }
    [[nodiscard]] bool async_save() const { return mAsyncSave; }
    [[nodiscard]] const std::optional<std::string>& current_tag() const { return mCurrentTag; }
    //! Paths (relative to their tag) this rank has written in any cycle so far.
    [[nodiscard]] const std::set<std::string>& relative_paths() const { return mRelativePaths; }
    [[nodiscard]] bool save_in_flight() const { return mSaveTask.valid(); }
    [[nodiscard]] bool remove_in_flight() const { return mRemoveTask.valid(); }

private:
    //! Ends a cycle that was begun but never ended, then drains it.
    void drain(bool async_remove);
    void mark_done();
    void require_storage() const;

    Communicator& mComm;
    bool mAsyncSave;
    CheckpointLogger* mLogger;

    ICheckpointStorage* mStorage = nullptr;
    std::optional<std::string> mCurrentTag;
    std::set<std::string> mRelativePaths;
    ECheckpointPhase mPhase = ECheckpointPhase::IDLE;

    // current cycle
    bool mEnded = false;
    bool mPendingDone = false;
    bool mPendingRetention = false;
    std::optional<int> mNumKept;
    std::vector<std::pair<StoredObject, std::string>> mSaveItems;
    int mCycleFiles = 0;
    std::size_t mCycleBytes = 0;
    std::chrono::steady_clock::time_point mCycleStart;

    std::future<void> mSaveTask;
    std::future<void> mRemoveTask;
    std::vector<std::string> mRemoveTags;

    // declared last: joined before the state that queued tasks refer to goes away
    BackgroundTaskRunner mRunner;
};

//! Strictly increasing key written into the `checkpoint` marker; never below @p newest_on_disk + 1.
long long next_checkpoint_ordering_key(long long newest_on_disk = 0);

//! Largest ordering key among the tags in @p storage (0 if there are none).
long long newest_checkpoint_ordering_key(ICheckpointStorage& storage);

#endif //SHARDKEEP_SRC_CHECKPOINT_IO_STATE_H
