// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_STORAGE_H
#define SHARDKEEP_SRC_CHECKPOINT_STORAGE_H

#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "checkpoint/state_dict.h"
#include "utilities/tensor.h"

//! Anything that can be queued for saving into a checkpoint.
using StoredObject = std::variant<Tensor, nlohmann::json, StateDict>;

//! Name of the marker file that identifies a directory as a checkpoint.
inline constexpr const char* CHECKPOINT_MARKER = "checkpoint";
//! Name of the marker file whose presence makes a checkpoint complete.
inline constexpr const char* DONE_MARKER = "done";

/*!
 * \brief Storage backend holding a set of checkpoints below one root.
 * \details All paths are relative to the root; checkpoint tags are the root's direct sub-directories.
 * Implementations must be usable from the owning rank's main and background threads concurrently,
 * as long as the two never touch the same path.
 */
class ICheckpointStorage {
public:
    virtual ~ICheckpointStorage() = default;

    [[nodiscard]] virtual std::string root() const = 0;

    virtual void create_dir(const std::string& path, bool exist_ok = true) = 0;
    //! Creates a directory that several ranks may create concurrently.
    virtual void create_shared_dir(const std::string& path) = 0;

    virtual void save_text(const std::string& text, const std::string& path) = 0;
    virtual void save_tensor(const Tensor& tensor, const std::string& path) = 0;
    virtual void save_json(const nlohmann::json& document, const std::string& path) = 0;
    virtual void save_state_dict(const StateDict& state, const std::string& path) = 0;

    //! Dispatches to the matching save_* function.
    void save_object(const StoredObject& object, const std::string& path);

    [[nodiscard]] virtual std::string load_text(const std::string& path) = 0;
    [[nodiscard]] virtual Tensor load_tensor(const std::string& path) = 0;
    [[nodiscard]] virtual nlohmann::json load_json(const std::string& path) = 0;
    [[nodiscard]] virtual StateDict load_state_dict(const std::string& path) = 0;

    [[nodiscard]] virtual bool file_exists(const std::string& path) = 0;
    //! Names of the entries of a directory, sorted; empty if it does not exist.
    [[nodiscard]] virtual std::vector<std::string> list_dir(const std::string& path) = 0;

    //! Missing files are ignored.
    virtual void remove_file(const std::string& path) = 0;
    //! Missing files are ignored.
    virtual void remove_files(const std::vector<std::string>& paths) = 0;
    //! Recursively removes whole directories.
    virtual void remove_dirs(const std::vector<std::string>& paths) = 0;

    //! All checkpoint tags (completed or not), oldest first.
    [[nodiscard]] virtual std::vector<std::string> list_checkpoint_tags() = 0;

    //! Tags that carry a done marker, oldest first.
    [[nodiscard]] std::vector<std::string> list_completed_checkpoint_tags();

    //! Whether `tag` was written in the one-file-per-tensor format.
    [[nodiscard]] bool is_checkpoint_sharded(const std::string& tag);
};

/*!
 * \brief Checkpoint storage on a (possibly shared) POSIX filesystem.
 * \details Files are first written as `<name>.tmp` and renamed into place, so a file either
 * exists completely or not at all.
 */
class FilesystemCheckpointStorage : public ICheckpointStorage {
public:
    explicit FilesystemCheckpointStorage(std::string root, int num_remove_threads = 8);

    [[nodiscard]] std::string root() const override { return mRoot.string(); }

    void create_dir(const std::string& path, bool exist_ok = true) override;
    void create_shared_dir(const std::string& path) override;

    void save_text(const std::string& text, const std::string& path) override;
    void save_tensor(const Tensor& tensor, const std::string& path) override;
    void save_json(const nlohmann::json& document, const std::string& path) override;
    void save_state_dict(const StateDict& state, const std::string& path) override;

    [[nodiscard]] std::string load_text(const std::string& path) override;
    [[nodiscard]] Tensor load_tensor(const std::string& path) override;
    [[nodiscard]] nlohmann::json load_json(const std::string& path) override;
    [[nodiscard]] StateDict load_state_dict(const std::string& path) override;

    [[nodiscard]] bool file_exists(const std::string& path) override;
    [[nodiscard]] std::vector<std::string> list_dir(const std::string& path) override;

    void remove_file(const std::string& path) override;
    void remove_files(const std::vector<std::string>& paths) override;
    void remove_dirs(const std::vector<std::string>& paths) override;

    [[nodiscard]] std::vector<std::string> list_checkpoint_tags() override;

private:
    [[nodiscard]] std::filesystem::path resolve(const std::string& path) const;
    void write_file(const std::filesystem::path& target, const std::string& content) const;

    std::filesystem::path mRoot;
    int mNumRemoveThreads;
};

//! Creates the storage backend for a checkpoint root; object store URLs are rejected.
std::unique_ptr<ICheckpointStorage> create_checkpoint_storage(const std::string& root);

//! Parses the content of a checkpoint marker into its ordering key (0 if unreadable).
long long parse_checkpoint_ordering_key(const std::string& marker_content);

#endif //SHARDKEEP_SRC_CHECKPOINT_STORAGE_H
