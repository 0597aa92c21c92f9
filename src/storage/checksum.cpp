#include "dcp/storage/checksum.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace dcp::storage {
namespace {

std::string crc_to_hex(std::uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return oss.str();
}

} // namespace

const char* checksum_type_name(ChecksumType type) noexcept {
    switch (type) {
        case ChecksumType::None: return "NONE";
        case ChecksumType::Crc32: return "CRC32";
        case ChecksumType::BlockCrc32: return "BLOCK-CRC32";
    }
    return "UNKNOWN";
}

std::string FileChecksum::to_string() const {
    std::ostringstream oss;
    oss << algorithm;
    if (block_size != 0) {
        oss << '(' << block_size << ')';
    }
    oss << ':' << value;
    return oss.str();
}

ChecksumBuilder::ChecksumBuilder(ChecksumType type, std::uint64_t block_size)
    : type_(type), block_size_(block_size) {
    if (type_ == ChecksumType::BlockCrc32 && block_size_ == 0) {
        type_ = ChecksumType::Crc32;
    }
}

void ChecksumBuilder::update(const std::uint8_t* data, std::size_t size) {
    switch (type_) {
        case ChecksumType::None:
            return;
        case ChecksumType::Crc32:
            whole_.process_bytes(data, size);
            return;
        case ChecksumType::BlockCrc32:
            while (size > 0) {
                const auto room = block_size_ - block_fill_;
                const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(room, size));
                block_.process_bytes(data, take);
                block_fill_ += take;
                data += take;
                size -= take;
                if (block_fill_ == block_size_) {
                    close_block();
                }
            }
            return;
    }
}

void ChecksumBuilder::close_block() {
    const std::uint32_t digest = block_.checksum();
    // Big-endian so the value does not depend on host byte order
    const std::array<std::uint8_t, 4> bytes{
        static_cast<std::uint8_t>(digest >> 24),
        static_cast<std::uint8_t>(digest >> 16),
        static_cast<std::uint8_t>(digest >> 8),
        static_cast<std::uint8_t>(digest)};
    block_digests_.process_bytes(bytes.data(), bytes.size());
    block_.reset();
    block_fill_ = 0;
}

std::optional<FileChecksum> ChecksumBuilder::finish() {
    FileChecksum checksum;
    checksum.algorithm = checksum_type_name(type_);
    switch (type_) {
        case ChecksumType::None:
            return std::nullopt;
        case ChecksumType::Crc32:
            checksum.value = crc_to_hex(whole_.checksum());
            break;
        case ChecksumType::BlockCrc32:
            if (block_fill_ > 0) {
                close_block();
            }
            checksum.block_size = block_size_;
            checksum.value = crc_to_hex(block_digests_.checksum());
            break;
    }
    return checksum;
}

std::optional<FileChecksum> compute_checksum(ChecksumType type,
                                             std::uint64_t block_size,
                                             const std::uint8_t* data,
                                             std::size_t size) {
    ChecksumBuilder builder(type, block_size);
    builder.update(data, size);
    return builder.finish();
}

} // namespace dcp::storage
