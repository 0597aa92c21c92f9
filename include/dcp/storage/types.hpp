#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace dcp::storage {

/**
 * @brief Metadata snapshot of a stored object
 *
 * Mirrors what a distributed filesystem reports for a path: the byte length
 * plus the layout parameters (replication, block size) the copy engine may
 * preserve on the destination.
 */
struct FileStatus {
    std::filesystem::path path;
    std::uint64_t length = 0;
    std::int16_t replication = 1;
    std::uint64_t block_size = 0;
    bool is_directory = false;
};

enum class ChecksumType {
    None,       ///< Backend exposes no checksum
    Crc32,      ///< CRC-32 over the whole content, layout independent
    BlockCrc32  ///< CRC-32 over the per-block CRC-32 values, depends on block size
};

const char* checksum_type_name(ChecksumType type) noexcept;

/**
 * @brief Backend-native content checksum
 *
 * Two checksums are only comparable when algorithm and block_size agree.
 */
struct FileChecksum {
    std::string algorithm;
    std::uint64_t block_size = 0; ///< 0 when the value does not depend on the block layout
    std::string value;            ///< Lower-case hex

    bool comparable_with(const FileChecksum& other) const noexcept {
        return algorithm == other.algorithm && block_size == other.block_size;
    }

    std::string to_string() const;
};

} // namespace dcp::storage
