#pragma once

#include "dcp/storage/backend.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dcp::copy {

enum class ChecksumComparison {
    Equal,
    Mismatch,
    Unverifiable ///< A checksum is missing or the algorithms/block layouts differ
};

const char* to_string(ChecksumComparison comparison) noexcept;

struct ChecksumReport {
    ChecksumComparison outcome = ChecksumComparison::Unverifiable;
    std::optional<storage::FileChecksum> source;
    std::optional<storage::FileChecksum> target;
    std::string detail;
};

/**
 * @brief Compares backend-native checksums of two objects
 *
 * Each backend is asked for its own checksum. Values are only compared
 * when both backends produced the same algorithm over the same block
 * layout; anything else is reported as Unverifiable, never as Equal.
 */
class ChecksumVerifier {
public:
    static ChecksumReport compare(storage::StorageBackend& source_fs,
                                  const std::filesystem::path& source,
                                  storage::StorageBackend& target_fs,
                                  const std::filesystem::path& target);

    /// True only when compare() yields Equal
    static bool verify_equal(storage::StorageBackend& source_fs,
                             const std::filesystem::path& source,
                             storage::StorageBackend& target_fs,
                             const std::filesystem::path& target);
};

} // namespace dcp::copy
