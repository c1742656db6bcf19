// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "utilities/task_runner.h"

TEST_CASE("background runner executes tasks in submission order", "[utilities][task-runner]") {
    std::mutex mutex;
    std::vector<int> order;
    std::vector<std::future<void>> futures;
    {
        BackgroundTaskRunner runner("order");
        REQUIRE(runner.name() == "order");
        for (int i = 0; i < 5; ++i) {
            futures.push_back(runner.submit([&, i]() {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }));
        }
        for (auto& f : futures) {
            f.get();
        }
    }
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("task exceptions surface through the future", "[utilities][task-runner]") {
    BackgroundTaskRunner runner("errors");
    auto failing = runner.submit([]() { throw std::runtime_error("disk full"); });
    auto fine = runner.submit([]() {});
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
    // the worker survives a failing task
    REQUIRE_NOTHROW(fine.get());
}

TEST_CASE("queued tasks still run when the runner is destroyed", "[utilities][task-runner]") {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    int executed = 0;
    std::future<void> last;
    {
        BackgroundTaskRunner runner("drain");
        runner.submit([opened]() { opened.wait(); });
        runner.submit([&executed]() { ++executed; });
        last = runner.submit([&executed]() { ++executed; });
        REQUIRE(runner.queued() >= 1);
        gate.set_value();
    }
    REQUIRE(last.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    REQUIRE(executed == 2);
}
