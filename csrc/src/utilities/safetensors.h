// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILITIES_SAFETENSORS_H
#define SHARDKEEP_SRC_UTILITIES_SAFETENSORS_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dtype.h"

struct Tensor;
class ITensorContainer;
class FileRef;

//! One tensor stored in a safetensors file.
class SafeTensorEntry {
public:
    SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                    std::shared_ptr<FileRef> handle, std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }

    //! Reads into an existing tensor of identical dtype and shape.
    void read_tensor(Tensor& target) const;

    //! Allocates a new tensor and reads the entry into it.
    [[nodiscard]] Tensor to_tensor() const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    std::shared_ptr<FileRef> mHandle;
    std::ptrdiff_t mDataBegin;
    std::ptrdiff_t mDataEnd;
};

class SafeTensorsReader {
public:
    explicit SafeTensorsReader(const std::string& file_name);

    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;
    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }

    //! Contents of the `__metadata__` header section (string to string, as per the format).
    [[nodiscard]] const std::map<std::string, std::string>& metadata() const { return mMetaData; }

private:
    std::vector<SafeTensorEntry> mEntries;
    std::map<std::string, std::string> mMetaData;
};

/*!
 * \brief Writes a safetensors file through a memory-mapped temporary file.
 * \details Usage: register all tensors, call prepare_metadata(), write every registered tensor,
 * then finalize(), which renames `<file>.tmp` to the final name. A writer that is destroyed
 * before finalize() removes its temporary file, so readers never observe a partial file.
 */
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);
    ~SafeTensorWriter();

    SafeTensorWriter(const SafeTensorWriter&) = delete;
    SafeTensorWriter& operator=(const SafeTensorWriter&) = delete;

    void register_tensor(const std::string& name, const Tensor& tensor);
    void prepare_metadata(const std::map<std::string, std::string>& user_metadata = {});
    void write_tensor(const std::string& name, const Tensor& tensor);
    void finalize();

private:
    struct sRegisteredTensor {
        ETensorDType DType;
        std::vector<long> Shape;
        long Begin;
        long Size;
        bool Done = false;
    };

    std::string mFileName;
    std::map<std::string, sRegisteredTensor> mRegisteredTensors;
    bool mMetaFinalized = false;
    int mFileDescriptor = -1;
    std::byte* mMappedFile = nullptr;
    std::size_t mTotalSize = 0;
    std::size_t mHeaderSize = 0;
};

void write_safetensors(const std::string& file_name, ITensorContainer& tensors,
                       const std::map<std::string, std::string>& metadata = {});

#endif //SHARDKEEP_SRC_UTILITIES_SAFETENSORS_H
