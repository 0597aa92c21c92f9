#pragma once

#include "dcp/storage/backend.hpp"

#include <cstdint>
#include <filesystem>

namespace dcp::storage {

/**
 * @brief StorageBackend over the local POSIX filesystem
 *
 * Paths are used as given. Replication is always reported as 1 and the
 * block size is the configured default; create() accepts and ignores both.
 */
class LocalStorage : public StorageBackend {
public:
    static constexpr std::uint64_t kDefaultBlockSize = 32ULL * 1024 * 1024;

    struct Options {
        ChecksumType checksum_type = ChecksumType::Crc32;
        std::uint64_t block_size = kDefaultBlockSize;
    };

    LocalStorage() = default;
    explicit LocalStorage(Options options);

    dcp::Result<std::unique_ptr<InputStream>> open(const std::filesystem::path& path) override;

    dcp::Result<std::unique_ptr<OutputStream>> create(const std::filesystem::path& path,
                                                      bool overwrite,
                                                      std::size_t buffer_size,
                                                      std::int16_t replication,
                                                      std::uint64_t block_size) override;

    dcp::Result<bool> exists(const std::filesystem::path& path) override;
    dcp::Result<void> remove(const std::filesystem::path& path, bool recursive) override;
    dcp::Result<void> mkdirs(const std::filesystem::path& path) override;
    dcp::Result<void> rename(const std::filesystem::path& from,
                             const std::filesystem::path& to) override;
    dcp::Result<FileStatus> status(const std::filesystem::path& path) override;
    dcp::Result<std::optional<FileChecksum>> checksum(const std::filesystem::path& path) override;

    std::int16_t default_replication() const override { return 1; }
    std::uint64_t default_block_size() const override { return options_.block_size; }

private:
    Options options_;
};

} // namespace dcp::storage
