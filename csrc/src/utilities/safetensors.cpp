// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "tensor.h"
#include "tensor_container.h"

//! Read-only POSIX file handle shared by all entries of one file.
class FileRef {
public:
    explicit FileRef(std::string file_name) : mFileName(std::move(file_name)) {
        mFd = open(mFileName.c_str(), O_RDONLY | O_CLOEXEC);
        if (mFd < 0) {
            throw std::runtime_error(fmt::format("posix open error ({}) for file {}: {}", errno, mFileName, strerror(errno)));
        }
    }

    ~FileRef() {
        if (mFd >= 0) {
            close(mFd);
        }
    }

    FileRef(const FileRef&) = delete;
    FileRef& operator=(const FileRef&) = delete;

    /**
     * @brief Read the byte range [begin, end) of the file into @p target.
     *
     * @throws std::logic_error If @p end < @p begin.
     * @throws std::runtime_error On pread() failure or if the file is shorter than expected.
     */
    void read_bytes(std::byte* target, std::ptrdiff_t begin, std::ptrdiff_t end) const {
        if (end < begin) {
            throw std::logic_error(fmt::format("Invalid range {} - {} in read_bytes for {}", begin, end, mFileName));
        }
        const auto nbytes = static_cast<std::size_t>(end - begin);
        std::size_t done = 0;
        while (done < nbytes) {
            const off_t off = static_cast<off_t>(begin + done);
            ssize_t r = ::pread(mFd, target + done, nbytes - done, off);
            if (r < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(fmt::format("posix pread error ({}) for {}, range {} - {}",
                                                     errno, mFileName, off, end));
            }
            if (r == 0) {
                throw std::runtime_error(fmt::format("Unexpected end of file {}: read {} of {} bytes",
                                                     mFileName, done, nbytes));
            }
            done += static_cast<std::size_t>(r);
        }
    }

private:
    std::string mFileName;
    int mFd = -1;
};

/**
 * @brief Parsed SafeTensors header data.
 *
 * The SafeTensors file starts with an 8-byte little-endian unsigned integer
 * indicating the JSON header size in bytes, followed by the JSON header.
 */
struct sSafeTensorsHeader {
    /** @brief Size of the JSON header (bytes), not including this 8-byte length field. */
    std::uint64_t HeaderSize;
    /** @brief Parsed JSON metadata for all tensor entries and optional "__metadata__". */
    nlohmann::json MetaData;
};

/**
 * @brief Read and parse the SafeTensors JSON header from a file.
 *
 * @param file_name Path to the `.safetensors` file.
 * @return A struct containing the header size (bytes) and parsed JSON metadata.
 *
 * @throws std::runtime_error If the file cannot be read or the header is invalid.
 */
static sSafeTensorsHeader read_safetensors_header(const std::string& file_name) {
    std::uint64_t header_size = 0;
    std::ifstream file(file_name, std::ios_base::binary);
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw std::runtime_error("Error opening safetensors file '" + file_name + "'");
    }

    auto file_size = std::filesystem::file_size(file_name);
    if (header_size > file_size - sizeof(header_size)) {
        throw std::runtime_error(fmt::format("Corrupted safetensors file '{}': header of {} bytes in file of {} bytes",
                                             file_name, header_size, file_size));
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header_size));
    if (!file) {
        throw std::runtime_error("Error reading safetensors header of '" + file_name + "'");
    }
    auto parsed = nlohmann::json::parse(header.begin(), header.end());
    return {header_size, std::move(parsed)};
}

// SafeTensorEntry implementation

SafeTensorEntry::SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                                 std::shared_ptr<FileRef> handle, std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(name), mShape(shape), mDType(dtype), mHandle(std::move(handle)),
      mDataBegin(data_begin), mDataEnd(data_end) {
}

/**
 * @brief Read the full tensor for this entry into @p target, validating dtype, rank and shape.
 *
 * @param target Destination host tensor whose dtype, rank and sizes must match this entry.
 *
 * @throws std::runtime_error On dtype/rank/shape mismatch or if the stored byte range is inconsistent.
 */
void SafeTensorEntry::read_tensor(Tensor& target) const {
    if (mDType != target.DType)
        throw std::runtime_error(fmt::format("DType mismatch for tensor `{}`: tensor has {}, file has {}",
                                             mName, dtype_to_str(target.DType), dtype_to_str(mDType)));

    if (target.Rank != static_cast<int>(mShape.size()))
        throw std::runtime_error(fmt::format("Rank mismatch for tensor `{}`: expected {}, got {}",
                                             mName, mShape.size(), target.Rank));

    for (int i = 0; i < target.Rank; ++i)
        if (mShape[i] != target.Sizes[i])
            throw std::runtime_error(fmt::format("Shape mismatch for tensor `{}` at dim {}: expected {}, got {}",
                                                 mName, i, mShape[i], target.Sizes[i]));

    if (static_cast<std::size_t>(mDataEnd - mDataBegin) != target.bytes())
        throw std::runtime_error(fmt::format("Size mismatch for tensor `{}`: file stores {} bytes, expected {}",
                                             mName, mDataEnd - mDataBegin, target.bytes()));

    if (target.bytes() == 0) return;
    mHandle->read_bytes(target.Data, mDataBegin, mDataEnd);
}

Tensor SafeTensorEntry::to_tensor() const {
    Tensor result = Tensor::zeros(mDType, mShape);
    read_tensor(result);
    return result;
}

// SafeTensorsReader implementation

/**
 * @brief Parse a single `.safetensors` file.
 *
 * Reads the JSON header, computes the absolute data offsets (including the
 * header length field and JSON header), and stores entries referencing the file.
 * The string-valued `__metadata__` section is kept separately.
 *
 * @throws std::runtime_error / nlohmann::json exceptions on I/O or parse failures.
 */
SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    auto [HeaderSize, MetaData] = read_safetensors_header(file_name);
    std::ptrdiff_t offset = static_cast<std::ptrdiff_t>(HeaderSize + sizeof(HeaderSize));
    auto handle = std::make_shared<FileRef>(file_name);
    for (const auto& el : MetaData.items()) {
        const std::string& name = el.key();
        if (name == "__metadata__") {
            for (const auto& meta : el.value().items()) {
                mMetaData[meta.key()] = meta.value().get<std::string>();
            }
            continue;
        }

        ETensorDType dtype = dtype_from_str(el.value()["dtype"].get<std::string>());
        auto shape = el.value()["shape"].get<std::vector<long>>();
        auto begin = el.value()["data_offsets"][0].get<std::ptrdiff_t>();
        auto end = el.value()["data_offsets"][1].get<std::ptrdiff_t>();

        mEntries.emplace_back(name, shape, dtype, handle, begin + offset, end + offset);
    }
}

/**
 * @brief Find an entry by tensor name.
 *
 * @throws std::out_of_range If no entry with this name exists.
 */
const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return entry;
    throw std::out_of_range(fmt::format("Entry not found: {}", name));
}

// SafeTensorWriter implementation

SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

/**
 * @brief Destroy the writer; an unfinished temporary file is unmapped, closed and removed.
 */
SafeTensorWriter::~SafeTensorWriter() {
    if (mFileDescriptor >= 0) {
        std::string temp_name = mFileName + ".tmp";
        if (mMappedFile) {
            if (munmap(mMappedFile, mTotalSize) != 0) {
                fprintf(stderr, "[SafeTensorWriter] WARNING: error unmapping %s: %s\n", temp_name.c_str(), strerror(errno));
            }
        }
        close(mFileDescriptor);
        unlink(temp_name.c_str());
    }
}

/**
 * @brief Register a tensor for later writing. Must be called before prepare_metadata().
 *
 * @throws std::logic_error If metadata has already been finalized or the name is taken.
 */
void SafeTensorWriter::register_tensor(const std::string& name, const Tensor& tensor) {
    if (mMetaFinalized)
        throw std::logic_error("Cannot register tensor after metadata has been finalized");
    if (name == "__metadata__")
        throw std::invalid_argument("`__metadata__` is reserved and cannot be used as a tensor name");
    auto [it, inserted] = mRegisteredTensors.insert({name, {tensor.DType, tensor.shape(), 0, static_cast<long>(tensor.bytes())}});
    if (!inserted)
        throw std::logic_error("Tensor " + name + " has already been registered");
}

/**
 * @brief Build the header, create and map the temporary output file, and write the header into it.
 *
 * @param user_metadata Extra string entries to store in the `__metadata__` section.
 *
 * @throws std::system_error On file open/truncate/mmap failures.
 */
void SafeTensorWriter::prepare_metadata(const std::map<std::string, std::string>& user_metadata) {
    if (mMetaFinalized)
        throw std::logic_error("Metadata has already been finalized");

    nlohmann::json meta_data;
    meta_data["__metadata__"] = nlohmann::json::object({{"format", "pt"},
                                                        {"writer", "shardkeep"}});
    for (const auto& [key, value] : user_metadata) {
        meta_data["__metadata__"][key] = value;
    }

    long offset = 0;
    for (auto& [name, tensor] : mRegisteredTensors) {
        meta_data[name]["dtype"] = dtype_to_str(tensor.DType);
        meta_data[name]["shape"] = tensor.Shape;
        tensor.Begin = offset;
        meta_data[name]["data_offsets"] = std::vector<long>{offset, offset + tensor.Size};
        offset += tensor.Size;
    }

    std::string header = meta_data.dump();
    std::uint64_t header_size = header.size();
    mHeaderSize = header_size + sizeof(header_size);

    std::string temp_name = mFileName + ".tmp";
    mFileDescriptor = open(temp_name.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP);
    if (mFileDescriptor == -1)
        throw std::system_error(errno, std::system_category(), "Error opening file '" + temp_name + "' for writing");
    mTotalSize = mHeaderSize + offset;
    if (ftruncate(mFileDescriptor, static_cast<off_t>(mTotalSize)) < 0)
        throw std::system_error(errno, std::system_category(), "Error truncating file " + temp_name);

    auto* host_ptr = static_cast<std::byte*>(mmap(nullptr, mTotalSize, PROT_WRITE, MAP_SHARED, mFileDescriptor, 0));
    if (host_ptr == MAP_FAILED)
        throw std::system_error(errno, std::system_category(), "Error memory-mapping file " + temp_name);

    std::memcpy(host_ptr, &header_size, sizeof(header_size));
    std::memcpy(host_ptr + sizeof(header_size), header.data(), header_size);

    mMappedFile = host_ptr;
    mMetaFinalized = true;
}

/**
 * @brief Copy a registered tensor into its slot of the mapped file.
 *
 * @throws std::logic_error If metadata is not finalized, the tensor was already written, or it does not
 * match its registration.
 * @throws std::out_of_range If @p name was not registered.
 */
void SafeTensorWriter::write_tensor(const std::string& name, const Tensor& tensor) {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot write tensor before metadata has been finalized");

    auto found = mRegisteredTensors.find(name);
    if (found == mRegisteredTensors.end())
        throw std::out_of_range("Invalid tensor " + name);

    auto& slot = found->second;
    if (slot.Done)
        throw std::logic_error("Tensor " + name + " has already been written");

    if (slot.DType != tensor.DType || slot.Shape != tensor.shape())
        throw std::logic_error(fmt::format("Tensor {} does not match its registration", name));

    if (slot.Size > 0) {
        std::memcpy(mMappedFile + mHeaderSize + slot.Begin, tensor.Data, slot.Size);
    }
    slot.Done = true;
}

/**
 * @brief Flush the mapped file and atomically rename it to its final name.
 *
 * @throws std::logic_error If any registered tensor has not been written.
 * @throws std::system_error On msync/munmap/close/rename failures.
 */
void SafeTensorWriter::finalize() {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot finalize before metadata has been finalized");

    for (const auto& [name, tensor] : mRegisteredTensors) {
        if (!tensor.Done)
            throw std::logic_error("Tensor " + name + " has not been written");
    }

    std::string temp_name = mFileName + ".tmp";
    if (msync(mMappedFile, mTotalSize, MS_SYNC) != 0)
        throw std::system_error(errno, std::system_category(), "Error syncing file " + temp_name);
    if (munmap(mMappedFile, mTotalSize) != 0)
        throw std::system_error(errno, std::system_category(), "Error unmapping file " + temp_name);
    mMappedFile = nullptr;

    int fd = mFileDescriptor;
    mFileDescriptor = -1;
    if (close(fd) != 0)
        throw std::system_error(errno, std::system_category(), "Error closing file " + temp_name);

    if (rename(temp_name.c_str(), mFileName.c_str()) != 0)
        throw std::system_error(errno, std::system_category(), "Error renaming " + temp_name + " to " + mFileName);
}

/**
 * @brief Convenience function to write all tensors from a container into a SafeTensors file.
 *
 * @param file_name Output `.safetensors` path.
 * @param tensors Tensor container providing named tensors to serialize.
 * @param metadata Extra `__metadata__` entries.
 */
void write_safetensors(const std::string& file_name, ITensorContainer& tensors,
                       const std::map<std::string, std::string>& metadata) {
    SafeTensorWriter writer(file_name);
    tensors.iterate_tensors([&writer](std::string name, const Tensor& tensor) {
        writer.register_tensor(name, tensor);
    });
    writer.prepare_metadata(metadata);
    tensors.iterate_tensors([&writer](std::string name, const Tensor& tensor) {
        writer.write_tensor(name, tensor);
    });
    writer.finalize();
}
