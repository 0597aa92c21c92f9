#pragma once

#include <filesystem>
#include <string>

namespace dcp::copy {

/**
 * @brief Classification of a failed copy attempt
 *
 * Only ReadFailure is transient. Every other kind means this attempt
 * produced a wrong or unpublishable result and must not be downgraded.
 */
enum class CopyErrorKind {
    ReadFailure,      ///< Source could not be opened or read
    WriteFailure,     ///< Destination create/write/close failed
    LengthMismatch,   ///< Bytes on the destination differ from the source length
    ChecksumMismatch, ///< Checksums differ or cannot be compared
    PromotionFailure  ///< Delete-existing, create-parent or rename failed
};

const char* to_string(CopyErrorKind kind) noexcept;

struct CopyError {
    CopyErrorKind kind = CopyErrorKind::WriteFailure;
    std::string step;   ///< Which step failed, e.g. "open-source", "rename"
    std::string cause;  ///< Underlying backend message
    std::filesystem::path source;
    std::filesystem::path target;
    std::filesystem::path temp;

    std::string describe() const;
};

CopyError make_copy_error(CopyErrorKind kind, std::string step, std::string cause);

/// True only for failures a fresh attempt may cure
bool is_retriable(const CopyError& error) noexcept;

} // namespace dcp::copy
