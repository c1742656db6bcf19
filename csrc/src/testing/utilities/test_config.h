// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

struct TestSizeConfig {
    int Ranks = 4;
    int NumTensors = 7;
    bool KeepFiles = false;
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if(cfg.Ranks < 2 || cfg.Ranks % 2 != 0) {
        fprintf(stderr, "ERROR: Ranks must be an even number >= 2\n");
        exit(EXIT_FAILURE);
    }
    if(cfg.NumTensors < 1) {
        fprintf(stderr, "ERROR: NumTensors must be positive\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
