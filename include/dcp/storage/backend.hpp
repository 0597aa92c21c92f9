#pragma once

#include "dcp/core/result.hpp"
#include "dcp/storage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace dcp::storage {

/**
 * @brief Sequential byte source opened from a backend
 */
class InputStream {
public:
    virtual ~InputStream() = default;

    /// Reads up to @p size bytes; 0 means end of stream
    virtual dcp::Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) = 0;
};

/**
 * @brief Sequential byte sink created on a backend
 *
 * Content is only guaranteed to be durable once close() succeeded.
 */
class OutputStream {
public:
    virtual ~OutputStream() = default;

    virtual dcp::Result<void> write(const std::uint8_t* data, std::size_t size) = 0;
    virtual dcp::Result<void> close() = 0;
};

/**
 * @brief Storage capability the copy engine runs against
 *
 * WHAT IT MODELS:
 * A distributed filesystem: paths, per-file replication and block size,
 * native content checksums and single-path atomic rename.
 *
 * RENAME SEMANTICS:
 * rename() fails when the destination already exists or its parent is
 * missing. It never replaces an existing file.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual dcp::Result<std::unique_ptr<InputStream>> open(const std::filesystem::path& path) = 0;

    virtual dcp::Result<std::unique_ptr<OutputStream>> create(const std::filesystem::path& path,
                                                              bool overwrite,
                                                              std::size_t buffer_size,
                                                              std::int16_t replication,
                                                              std::uint64_t block_size) = 0;

    virtual dcp::Result<bool> exists(const std::filesystem::path& path) = 0;

    /// Fails when the path is missing or is a non-empty directory and !recursive
    virtual dcp::Result<void> remove(const std::filesystem::path& path, bool recursive) = 0;

    /// Creates the directory and all missing parents
    virtual dcp::Result<void> mkdirs(const std::filesystem::path& path) = 0;

    virtual dcp::Result<void> rename(const std::filesystem::path& from,
                                     const std::filesystem::path& to) = 0;

    virtual dcp::Result<FileStatus> status(const std::filesystem::path& path) = 0;

    /// std::nullopt when the backend exposes no checksum for the path
    virtual dcp::Result<std::optional<FileChecksum>> checksum(const std::filesystem::path& path) = 0;

    virtual std::int16_t default_replication() const = 0;
    virtual std::uint64_t default_block_size() const = 0;
};

} // namespace dcp::storage
