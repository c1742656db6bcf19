// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "testing/utilities/test_utils.h"
#include "training/logging.h"

using namespace testing_utils;

namespace {
nlohmann::json read_log(const std::string& file_name) {
    std::ifstream file(file_name);
    return nlohmann::json::parse(file);
}
} // namespace

TEST_CASE("log file is always a valid JSON array", "[training][logging]") {
    TempDir dir("logging_file");
    const std::string file_name = (dir.path() / "logs" / "checkpoint.json").string();
    CheckpointLogger logger(file_name, 0, CheckpointLogger::SILENT);

    REQUIRE(read_log(file_name).empty());

    logger.log_message("step_1", "saving \"step_1\"");
    logger.log_save("step_1", 4, 1234, 17);
    REQUIRE(read_log(file_name).size() == 2);

    logger.log_load("step_1", 5);
    logger.log_removal({"step_0"});
    {
        auto section = logger.log_section_start("step_1", "verifying");
    }

    auto log = read_log(file_name);
    REQUIRE(log.is_array());
    REQUIRE(log.size() == 5);
    REQUIRE(log[0]["log"] == "info");
    REQUIRE(log[0]["message"] == "saving \"step_1\"");
    REQUIRE(log[1]["log"] == "save");
    REQUIRE(log[1]["files"] == 4);
    REQUIRE(log[1]["bytes"] == 1234);
    REQUIRE(log[2]["log"] == "load");
    REQUIRE(log[3]["tags"] == nlohmann::json::array({"step_0"}));
    REQUIRE(log[4].contains("duration_ms"));
}

TEST_CASE("callback receives every log line", "[training][logging]") {
    CheckpointLogger logger("", 0, CheckpointLogger::SILENT);
    std::vector<std::string> lines;
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });

    const char* argv[] = {"shardkeep-bench", "--ranks", "4"};
    logger.log_cmd(3, argv);
    logger.log_options({{"async_save", true}, {"num_workers", std::int64_t{8}}});
    logger.log_debug("step_2", "no checkpoints to remove");

    REQUIRE(lines.size() == 4);
    REQUIRE(nlohmann::json::parse(lines[0])["cmd"].size() == 3);
    REQUIRE(nlohmann::json::parse(lines[1])["name"] == "async_save");
    REQUIRE(nlohmann::json::parse(lines[2])["value"] == 8);
    REQUIRE(nlohmann::json::parse(lines[3])["log"] == "debug");
}

TEST_CASE("only rank 0 logs", "[training][logging]") {
    TempDir dir("logging_rank");
    const std::string file_name = (dir.path() / "rank1.json").string();
    CheckpointLogger logger(file_name, 1, CheckpointLogger::DEFAULT);
    int calls = 0;
    logger.set_callback([&](std::string_view) { ++calls; });

    logger.log_message("step_1", "hello");
    logger.log_save("step_1", 1, 1, 1);
    logger.log_removal({"step_0"});

    REQUIRE(calls == 0);
    REQUIRE_FALSE(std::filesystem::exists(file_name));
}
