// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_TRAINING_LOGGING_H
#define SHARDKEEP_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/*!
 * \brief Rank-aware event log for checkpoint activity.
 * \details Only rank 0 writes. Events go to an (optional) JSON file that always holds a valid
 * JSON array, to stdout depending on verbosity, and to an optional callback.
 */
class CheckpointLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    //! An empty `file_name` disables the JSON log file.
    CheckpointLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~CheckpointLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);

    void log_message(std::string_view tag, const std::string& msg);
    //! Like log_message, but only printed in verbose mode.
    void log_debug(std::string_view tag, const std::string& msg);
    void log_save(std::string_view tag, int num_files, std::size_t bytes, long duration_ms);
    void log_load(std::string_view tag, long duration_ms);
    void log_removal(const std::vector<std::string>& tags);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(CheckpointLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        CheckpointLogger* mLogger;

        friend class CheckpointLogger;
    };

    RAII_Section log_section_start(std::string_view tag, const std::string& info);
    void log_section_end();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;
    std::mutex mMutex;

    int mRank;
    EVerbosity mVerbosity;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    std::string mSectionTag;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //SHARDKEEP_SRC_TRAINING_LOGGING_H
