#pragma once

#include "dcp/storage/types.hpp"

#include <boost/crc.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace dcp::storage {

/**
 * @brief Incremental builder for the checksums backends expose
 *
 * Feed content with update() in any chunking, then call finish(). For
 * BlockCrc32 the content is cut at block_size boundaries regardless of how
 * the updates were chunked.
 */
class ChecksumBuilder {
public:
    ChecksumBuilder(ChecksumType type, std::uint64_t block_size);

    void update(const std::uint8_t* data, std::size_t size);

    /// Returns std::nullopt for ChecksumType::None
    std::optional<FileChecksum> finish();

private:
    void close_block();

    ChecksumType type_;
    std::uint64_t block_size_;
    std::uint64_t block_fill_ = 0;
    boost::crc_32_type whole_;
    boost::crc_32_type block_;
    boost::crc_32_type block_digests_;
};

std::optional<FileChecksum> compute_checksum(ChecksumType type,
                                             std::uint64_t block_size,
                                             const std::uint8_t* data,
                                             std::size_t size);

} // namespace dcp::storage
