// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILITIES_TASK_RUNNER_H
#define SHARDKEEP_SRC_UTILITIES_TASK_RUNNER_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

/*!
 * \brief Single-worker background executor.
 * \details Tasks run one at a time, in submission order, on a dedicated thread. Each submission returns a
 * future that captures the task's exception, so failures surface wherever the future is waited on.
 * On destruction, already queued tasks still run to completion before the thread is joined.
 */
class BackgroundTaskRunner {
public:
    explicit BackgroundTaskRunner(std::string name);
    ~BackgroundTaskRunner() = default;

    BackgroundTaskRunner(const BackgroundTaskRunner&) = delete;
    BackgroundTaskRunner& operator=(const BackgroundTaskRunner&) = delete;

    std::future<void> submit(std::function<void()> task);

    //! Number of tasks that have been submitted but not yet started.
    [[nodiscard]] std::size_t queued() const;

    [[nodiscard]] const std::string& name() const { return mName; }

private:
    void worker_loop(std::stop_token stop);

    std::string mName;
    std::deque<std::packaged_task<void()>> mQueue;
    mutable std::mutex mMutex;
    std::condition_variable_any mCv;

    // declared last: stopped and joined before the queue goes away
    std::jthread mThread;
};

#endif //SHARDKEEP_SRC_UTILITIES_TASK_RUNNER_H
