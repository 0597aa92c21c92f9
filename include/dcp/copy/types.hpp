#pragma once

#include "dcp/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>

namespace dcp::copy {

/**
 * @brief Destination properties that can be carried over from the source
 */
enum class FileAttribute : std::uint8_t {
    Replication = 1 << 0,
    BlockSize = 1 << 1
};

/**
 * @brief Set of FileAttribute flags chosen by the caller
 *
 * Attributes not in the set are taken from the destination backend's
 * defaults.
 */
class CopyAttributes {
public:
    CopyAttributes() = default;
    CopyAttributes(std::initializer_list<FileAttribute> attributes);

    /// Parses preserve letters: 'r' replication, 'b' block size
    static dcp::Result<CopyAttributes> parse(const std::string& letters);

    CopyAttributes& add(FileAttribute attribute) noexcept;

    [[nodiscard]] bool contains(FileAttribute attribute) const noexcept {
        return (bits_ & static_cast<std::uint8_t>(attribute)) != 0;
    }

    [[nodiscard]] bool empty() const noexcept { return bits_ == 0; }

    std::string to_string() const;

    bool operator==(const CopyAttributes& other) const noexcept { return bits_ == other.bits_; }
    bool operator!=(const CopyAttributes& other) const noexcept { return bits_ != other.bits_; }

private:
    std::uint8_t bits_ = 0;
};

enum class ChecksumMode {
    Verify, ///< Compare checksums; an unverifiable pairing fails the copy
    Skip    ///< Only the length check runs
};

/**
 * @brief Per-call copy configuration
 */
struct CopyOptions {
    static constexpr std::int64_t kDefaultBandwidth = 100LL * 1024 * 1024;
    static constexpr std::size_t kDefaultBufferSize = 8 * 1024;

    std::int64_t max_bytes_per_sec = kDefaultBandwidth; ///< <= 0 disables throttling
    std::filesystem::path work_path;                    ///< Staging directory; empty = target's parent
    std::size_t buffer_size = kDefaultBufferSize;
    ChecksumMode checksum_mode = ChecksumMode::Verify;
};

} // namespace dcp::copy
