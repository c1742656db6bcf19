// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/storage.h"

#include <algorithm>
#include <charconv>
#include <exception>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <tuple>
#include <type_traits>

#include <fmt/core.h>

#include "utilities/safetensors.h"
#include "utilities/tensor_container.h"
#include "utilities/utils.h"

namespace fs = std::filesystem;

namespace {
constexpr const char* SINGLE_TENSOR_NAME = "tensor";
constexpr const char* STRUCTURE_METADATA_KEY = "structure";

std::string blob_tensor_name(long id) {
    return fmt::format("tensor_{}", id);
}

//! Exposes the tensors of a state dict as `tensor_<id>` for the safetensors writer.
class StateDictTensors : public ITensorContainer {
public:
    explicit StateDictTensors(const StateDict& state) : mState(state) {}

    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override {
        for (std::size_t i = 0; i < mState.Tensors.size(); ++i) {
            // empty slots are not stored; they come back empty on load
            if (mState.Tensors[i].is_null()) continue;
            callback(blob_tensor_name(static_cast<long>(i)), mState.Tensors[i]);
        }
    }

private:
    const StateDict& mState;
};
} // namespace

void ICheckpointStorage::save_object(const StoredObject& object, const std::string& path) {
    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Tensor>) {
            save_tensor(value, path);
        } else if constexpr (std::is_same_v<T, nlohmann::json>) {
            save_json(value, path);
        } else {
            save_state_dict(value, path);
        }
    }, object);
}

std::vector<std::string> ICheckpointStorage::list_completed_checkpoint_tags() {
    std::vector<std::string> completed;
    for (auto& tag : list_checkpoint_tags()) {
        if (file_exists(tag + "/" + DONE_MARKER)) {
            completed.push_back(std::move(tag));
        }
    }
    return completed;
}

bool ICheckpointStorage::is_checkpoint_sharded(const std::string& tag) {
    for (const char* sub : {"model", "optim"}) {
        for (const auto& name : list_dir(tag + "/" + sub)) {
            if (name.ends_with(".tensors")) {
                return true;
            }
        }
    }
    return false;
}

long long parse_checkpoint_ordering_key(const std::string& marker_content) {
    auto begin = marker_content.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return 0;
    auto end = marker_content.find_last_not_of(" \t\r\n") + 1;
    long long key = 0;
    auto [ptr, ec] = std::from_chars(marker_content.data() + begin, marker_content.data() + end, key);
    if (ec != std::errc{} || ptr != marker_content.data() + end) {
        return 0;
    }
    return key;
}

// ============================================================================
// Filesystem backend
// ============================================================================

FilesystemCheckpointStorage::FilesystemCheckpointStorage(std::string root, int num_remove_threads) :
    mRoot(std::move(root)), mNumRemoveThreads(std::max(1, num_remove_threads))
{
}

fs::path FilesystemCheckpointStorage::resolve(const std::string& path) const {
    if (path.empty() || path == ".") {
        return mRoot;
    }
    fs::path relative(path);
    if (relative.is_absolute()) {
        throw std::invalid_argument(fmt::format("Checkpoint paths must be relative to the root, got `{}`", path));
    }
    return mRoot / relative;
}

/**
 * @brief Write @p content to @p target through a temporary sibling file and an atomic rename.
 *
 * @throws std::runtime_error If the temporary file cannot be written.
 * @throws std::filesystem::filesystem_error If the directory cannot be created or the rename fails.
 */
void FilesystemCheckpointStorage::write_file(const fs::path& target, const std::string& content) const {
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("Could not open `{}` for writing", temp.string()));
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            throw std::runtime_error(fmt::format("Error writing `{}`", temp.string()));
        }
    }
    fs::rename(temp, target);
}

void FilesystemCheckpointStorage::create_dir(const std::string& path, bool exist_ok) {
    auto target = resolve(path);
    if (!exist_ok && fs::exists(target)) {
        throw std::runtime_error(fmt::format("Directory `{}` already exists", target.string()));
    }
    fs::create_directories(target);
}

void FilesystemCheckpointStorage::create_shared_dir(const std::string& path) {
    auto target = resolve(path);
    std::error_code ec;
    fs::create_directories(target, ec);
    // another rank may have won the race
    if (ec && !fs::is_directory(target)) {
        throw fs::filesystem_error("Could not create shared directory", target, ec);
    }
}

void FilesystemCheckpointStorage::save_text(const std::string& text, const std::string& path) {
    write_file(resolve(path), text);
}

void FilesystemCheckpointStorage::save_tensor(const Tensor& tensor, const std::string& path) {
    if (tensor.is_null()) {
        throw std::invalid_argument(fmt::format("Cannot save an empty tensor to `{}`", path));
    }
    auto target = resolve(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    NamedTensors single;
    single.add(SINGLE_TENSOR_NAME, tensor);
    write_safetensors(target.string(), single);
}

void FilesystemCheckpointStorage::save_json(const nlohmann::json& document, const std::string& path) {
    write_file(resolve(path), document.dump());
}

/**
 * @brief Save a complete state dict as a single safetensors blob.
 *
 * Tensors are stored as `tensor_<id>`; the structure goes into the `structure` entry of the
 * safetensors metadata.
 */
void FilesystemCheckpointStorage::save_state_dict(const StateDict& state, const std::string& path) {
    auto target = resolve(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    StateDictTensors tensors(state);
    write_safetensors(target.string(), tensors, {{STRUCTURE_METADATA_KEY, state.Structure.dump()}});
}

std::string FilesystemCheckpointStorage::load_text(const std::string& path) {
    auto target = resolve(path);
    std::ifstream file(target, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Could not open `{}`", target.string()));
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

Tensor FilesystemCheckpointStorage::load_tensor(const std::string& path) {
    SafeTensorsReader reader(resolve(path).string());
    return reader.find_entry(SINGLE_TENSOR_NAME).to_tensor();
}

nlohmann::json FilesystemCheckpointStorage::load_json(const std::string& path) {
    auto target = resolve(path);
    std::ifstream file(target);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Could not open `{}`", target.string()));
    }
    return nlohmann::json::parse(file);
}

/**
 * @brief Load a state dict written by save_state_dict().
 *
 * @throws std::runtime_error If the file lacks the structure metadata or holds unexpected tensors.
 */
StateDict FilesystemCheckpointStorage::load_state_dict(const std::string& path) {
    auto target = resolve(path).string();
    SafeTensorsReader reader(target);
    auto found = reader.metadata().find(STRUCTURE_METADATA_KEY);
    if (found == reader.metadata().end()) {
        throw std::runtime_error(fmt::format("`{}` is not a state dict file: missing structure metadata", target));
    }

    StateDict state;
    state.Structure = nlohmann::json::parse(found->second);

    std::vector<long> ids;
    ids.reserve(reader.entries().size());
    for (const auto& entry : reader.entries()) {
        long id = -1;
        const auto& name = entry.name();
        if (name.starts_with("tensor_")) {
            auto [ptr, ec] = std::from_chars(name.data() + 7, name.data() + name.size(), id);
            if (ec != std::errc{} || ptr != name.data() + name.size()) id = -1;
        }
        if (id < 0) {
            throw std::runtime_error(fmt::format("Unexpected tensor `{}` in state dict file `{}`", name, target));
        }
        ids.push_back(id);
    }

    // slots without an entry were empty when saved
    for (long referenced : state.referenced_ids()) {
        if (referenced >= 0) ids.push_back(referenced);
    }
    long size = ids.empty() ? 0 : *std::max_element(ids.begin(), ids.end()) + 1;
    state.Tensors.resize(static_cast<std::size_t>(size));
    ids.resize(reader.entries().size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        state.Tensors[ids[i]] = reader.entries()[i].to_tensor();
    }
    return state;
}

bool FilesystemCheckpointStorage::file_exists(const std::string& path) {
    return fs::exists(resolve(path));
}

std::vector<std::string> FilesystemCheckpointStorage::list_dir(const std::string& path) {
    std::vector<std::string> names;
    auto target = resolve(path);
    if (!fs::is_directory(target)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(target)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void FilesystemCheckpointStorage::remove_file(const std::string& path) {
    fs::remove(resolve(path));
}

/**
 * @brief Remove many files in parallel.
 *
 * Work is split round-robin over up to `num_remove_threads` threads. Missing files are ignored;
 * directories in the list are removed recursively. The first error is re-thrown once all threads
 * have finished.
 */
void FilesystemCheckpointStorage::remove_files(const std::vector<std::string>& paths) {
    if (paths.empty()) return;

    std::vector<fs::path> targets;
    targets.reserve(paths.size());
    for (const auto& p : paths) {
        targets.push_back(resolve(p));
    }

    std::mutex error_mutex;
    std::exception_ptr first_error;
    const int num_threads = std::min<int>(mNumRemoveThreads, static_cast<int>(targets.size()));
    {
        std::vector<std::jthread> threads;
        threads.reserve(num_threads);
        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&, t]() {
                for (std::size_t i = t; i < targets.size(); i += num_threads) {
                    try {
                        fs::remove_all(targets[i]);
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error) first_error = std::current_exception();
                    }
                }
            });
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void FilesystemCheckpointStorage::remove_dirs(const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        fs::remove_all(resolve(p));
    }
}

/**
 * @brief List all checkpoint tags below the root, oldest first.
 *
 * A tag is a direct sub-directory holding a `checkpoint` marker. Tags are ordered by the key stored
 * in the marker, then by the marker's modification time, then by name.
 */
std::vector<std::string> FilesystemCheckpointStorage::list_checkpoint_tags() {
    struct sTagOrder {
        long long Key;
        fs::file_time_type Time;
        std::string Name;
    };

    std::vector<sTagOrder> found;
    if (!fs::is_directory(mRoot)) {
        return {};
    }
    for (const auto& entry : fs::directory_iterator(mRoot)) {
        if (!entry.is_directory()) continue;
        fs::path marker = entry.path() / CHECKPOINT_MARKER;
        std::error_code ec;
        auto time = fs::last_write_time(marker, ec);
        // also skips tags deleted concurrently by another rank
        if (ec) continue;
        std::string name = entry.path().filename().string();
        std::string content;
        {
            std::ifstream file(marker);
            if (!file.is_open()) continue;
            std::getline(file, content, '\0');
        }
        found.push_back({parse_checkpoint_ordering_key(content), time, std::move(name)});
    }

    std::sort(found.begin(), found.end(), [](const sTagOrder& a, const sTagOrder& b) {
        return std::tie(a.Key, a.Time, a.Name) < std::tie(b.Key, b.Time, b.Name);
    });

    std::vector<std::string> tags;
    tags.reserve(found.size());
    for (auto& t : found) {
        tags.push_back(std::move(t.Name));
    }
    return tags;
}

std::unique_ptr<ICheckpointStorage> create_checkpoint_storage(const std::string& root) {
    if (istarts_with(root, "s3://")) {
        throw std::invalid_argument(fmt::format("Object store checkpoint locations are not supported: `{}`", root));
    }
    if (root.empty()) {
        throw std::invalid_argument("Checkpoint root must not be empty");
    }
    return std::make_unique<FilesystemCheckpointStorage>(root);
}
