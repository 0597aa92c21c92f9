#pragma once

#include "dcp/storage/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dcp::storage {

/**
 * @brief Thread-safe in-memory StorageBackend
 *
 * Keeps per-file replication and block size so layout preservation can be
 * observed. Files become visible at create() and receive their content on
 * close(). The root directory "/" always exists; create() makes missing
 * parents like a distributed filesystem does.
 */
class MemoryStorage : public StorageBackend {
public:
    struct Options {
        ChecksumType checksum_type = ChecksumType::BlockCrc32;
        std::int16_t default_replication = 3;
        std::uint64_t default_block_size = 128ULL * 1024 * 1024;
    };

    MemoryStorage();
    explicit MemoryStorage(Options options);

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

    std::int16_t default_replication() const override { return options_.default_replication; }
    std::uint64_t default_block_size() const override { return options_.default_block_size; }

    /// Writes a whole file in one step, creating parents
    dcp::Result<void> put(const std::filesystem::path& path,
                          const std::string& content,
                          std::int16_t replication = 0,
                          std::uint64_t block_size = 0);

    /// Returns the whole content of a file
    dcp::Result<std::string> get(const std::filesystem::path& path) const;

    /// All paths currently known (files and directories), sorted
    std::vector<std::string> list() const;

private:
    struct Node {
        bool is_directory = false;
        std::int16_t replication = 0;
        std::uint64_t block_size = 0;
        std::shared_ptr<const std::vector<std::uint8_t>> data;
    };

    class Writer;

    static std::string key(const std::filesystem::path& path);
    static std::string parent_key(const std::string& key);

    void make_parents_locked(const std::string& key);
    bool has_children_locked(const std::string& key) const;
    dcp::Result<void> commit(const std::string& key, std::vector<std::uint8_t> data);

    Options options_;
    mutable std::mutex mutex_;
    std::map<std::string, Node> nodes_;
};

} // namespace dcp::storage
