// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "task_runner.h"

#include <stdexcept>
#include <utility>

BackgroundTaskRunner::BackgroundTaskRunner(std::string name) :
    mName(std::move(name)),
    mThread([this](std::stop_token stop) { worker_loop(stop); })
{
}

/**
 * @brief Queue @p task for execution on the worker thread.
 *
 * @param task Callable to run; exceptions it throws are stored in the returned future.
 * @return Future that becomes ready once the task finished (or failed).
 *
 * @throws std::logic_error If the runner is already shutting down.
 */
std::future<void> BackgroundTaskRunner::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    std::future<void> result = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mThread.get_stop_token().stop_requested()) {
            throw std::logic_error("Cannot submit to background runner `" + mName + "` after shutdown");
        }
        mQueue.push_back(std::move(packaged));
    }
    mCv.notify_all();
    return result;
}

std::size_t BackgroundTaskRunner::queued() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mQueue.size();
}

void BackgroundTaskRunner::worker_loop(std::stop_token stop) {
    while (true) {
        std::unique_lock<std::mutex> lock(mMutex);
        mCv.wait(lock, stop, [this] { return !mQueue.empty(); });
        // on shutdown, keep draining whatever is still queued
        if (mQueue.empty()) {
            return;
        }
        std::packaged_task<void()> task = std::move(mQueue.front());
        mQueue.pop_front();
        lock.unlock();

        task();
    }
}
