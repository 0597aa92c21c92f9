#pragma once

#include "dcp/copy/errors.hpp"
#include "dcp/copy/task_context.hpp"
#include "dcp/copy/types.hpp"
#include "dcp/core/result.hpp"
#include "dcp/storage/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace dcp::copy {

/**
 * @brief Copies one file between backends through a verified temp file
 *
 * HOW A COPY RUNS:
 * 1. Derive the temp path from the target and the task's attempt id
 * 2. Create the temp file with replication/block size per CopyAttributes
 * 3. Stream the source through a ThrottledReader, reporting progress
 * 4. Check the length, then (for non-empty files) the checksums
 * 5. Promote the temp file to the target
 *
 * The temp file is removed on every exit path if it still exists, so the
 * target is either untouched or holds the verified copy.
 *
 * The engine keeps no state between calls; concurrent calls are safe as
 * long as every task supplies a distinct attempt id.
 */
class StagingCopyEngine {
public:
    static constexpr const char* kTempPrefix = ".dcp.tmp.";

    StagingCopyEngine(storage::StorageBackend& source_fs, storage::StorageBackend& target_fs);

    /// Returns the number of bytes copied and verified
    dcp::Result<std::uint64_t, CopyError> copy(const storage::FileStatus& source,
                                               const std::filesystem::path& target,
                                               const CopyAttributes& attributes,
                                               const CopyOptions& options,
                                               TaskContext& context) const;

    /**
     * @brief Temp file location for @p target
     *
     * Rooted at @p work_path, or at its parent when the target is the work
     * path itself; rooted at the target's parent when no work path is set.
     * Paths are compared lexically, ignoring a trailing separator.
     */
    static std::filesystem::path temp_path(const std::filesystem::path& target,
                                           const std::filesystem::path& work_path,
                                           const std::string& attempt_id);

    /**
     * @brief Publishes @p temp as @p target
     *
     * Deletes an existing target, creates a missing parent, then renames.
     * Not crash-atomic: dying between the delete and the rename leaves the
     * target absent.
     */
    static dcp::Result<void, CopyError> promote(storage::StorageBackend& backend,
                                                const std::filesystem::path& temp,
                                                const std::filesystem::path& target);

private:
    dcp::Result<std::uint64_t, CopyError> copy_to_temp(const storage::FileStatus& source,
                                                       const std::filesystem::path& temp,
                                                       const CopyAttributes& attributes,
                                                       const CopyOptions& options,
                                                       TaskContext& context,
                                                       const std::string& description) const;

    dcp::Result<std::uint64_t, CopyError> copy_bytes(const storage::FileStatus& source,
                                                     storage::OutputStream& out,
                                                     const CopyOptions& options,
                                                     TaskContext& context,
                                                     const std::string& description) const;

    dcp::Result<void, CopyError> compare_lengths(const storage::FileStatus& source,
                                                 const std::filesystem::path& temp,
                                                 std::uint64_t bytes_copied) const;

    dcp::Result<void, CopyError> compare_checksums(const storage::FileStatus& source,
                                                   const std::filesystem::path& temp) const;

    storage::StorageBackend& source_fs_;
    storage::StorageBackend& target_fs_;
};

} // namespace dcp::copy
