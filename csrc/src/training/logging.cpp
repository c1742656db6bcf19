// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

namespace {
//! JSON string literal (quoted and escaped).
std::string quoted(std::string_view text) {
    return nlohmann::json(std::string(text)).dump();
}

std::string format_bytes(std::size_t bytes) {
    if (bytes < 10'000) {
        return fmt::format("{} B", bytes);
    } else if (bytes < 10'000'000) {
        return fmt::format("{:.1f} kB", double(bytes) / 1'000.0);
    } else if (bytes < 10'000'000'000) {
        return fmt::format("{:.1f} MB", double(bytes) / 1'000'000.0);
    } else {
        return fmt::format("{:.1f} GB", double(bytes) / 1'000'000'000.0);
    }
}
} // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty to disable the file.
 * @param rank Rank of the calling worker; only rank 0 writes the JSON file and prints.
 * @param verbosity Verbosity level controlling stdout printing.
 */
CheckpointLogger::CheckpointLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("Could not open log file `{}`", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

CheckpointLogger::~CheckpointLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void CheckpointLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void CheckpointLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += ::quoted(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line and, in verbose mode, printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void CheckpointLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if(mRank != 0) return;

    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    for(auto& [name, value]: options) {
        auto log = [&, &name = name](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, ::quoted(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if (mVerbosity >= VERBOSE) {
                printf("  %-*s : %s\n", option_length, std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
}

void CheckpointLogger::log_message(std::string_view tag, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= DEFAULT) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "tag": {}, "message": {}}})",
                         std::chrono::system_clock::now(), ::quoted(tag), ::quoted(msg)));
}

void CheckpointLogger::log_debug(std::string_view tag, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= VERBOSE) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "debug", "time": "{}", "tag": {}, "message": {}}})",
                         std::chrono::system_clock::now(), ::quoted(tag), ::quoted(msg)));
}

/**
 * @brief Record the completion of a checkpoint save on this rank's view (rank 0 only).
 *
 * @param tag Checkpoint tag.
 * @param num_files Number of files this rank wrote.
 * @param bytes Total number of tensor bytes this rank wrote.
 * @param duration_ms Wall time of the save in milliseconds.
 */
void CheckpointLogger::log_save(std::string_view tag, int num_files, std::size_t bytes, long duration_ms) {
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "save", "time": "{}", "tag": {}, "files": {}, "bytes": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), ::quoted(tag), num_files, bytes, duration_ms));
    if(mVerbosity >= DEFAULT) {
        printf("[Checkpoint] saved %-16s %5d files %10s  in %ld ms\n",
               std::string(tag).c_str(), num_files, format_bytes(bytes).c_str(), duration_ms);
    }
}

void CheckpointLogger::log_load(std::string_view tag, long duration_ms) {
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "load", "time": "{}", "tag": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), ::quoted(tag), duration_ms));
    if(mVerbosity >= DEFAULT) {
        printf("[Checkpoint] loaded %s in %ld ms\n", std::string(tag).c_str(), duration_ms);
    }
}

void CheckpointLogger::log_removal(const std::vector<std::string>& tags) {
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "remove", "time": "{}", "tags": {}}})",
                         std::chrono::system_clock::now(), nlohmann::json(tags).dump()));
    if(mVerbosity >= VERBOSE) {
        for (const auto& tag : tags) {
            printf("[Checkpoint] removed %s\n", tag.c_str());
        }
    }
}

/**
 * @brief Append one JSON object to the log array, keeping the file a valid JSON document.
 */
void CheckpointLogger::log_line(std::string_view line) {
    std::lock_guard<std::mutex> lock(mMutex);
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open()) return;
    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

/**
 * @brief Begin a timed logging section (rank 0 only).
 *
 * Stores section metadata in the logger and returns an RAII handle that will
 * call log_section_end() on destruction (when constructed with a valid logger).
 *
 * @param tag Checkpoint tag associated with this section.
 * @param info Human-readable description printed to stdout and stored in JSON.
 * @return RAII_Section handle; on non-zero ranks, contains nullptr and is a no-op.
 */
CheckpointLogger::RAII_Section CheckpointLogger::log_section_start(std::string_view tag, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionTag = std::string(tag);
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= DEFAULT) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration (rank 0 only).
 */
void CheckpointLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "tag": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), ::quoted(mSectionTag), ::quoted(mSectionInfo), milliseconds ));

    if(mVerbosity >= DEFAULT) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}
