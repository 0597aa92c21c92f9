#pragma once

#include "dcp/copy/engine.hpp"
#include "dcp/copy/retry.hpp"

#include <cstdint>

namespace dcp::copy {

enum class CopyAction {
    Copied,
    Skipped ///< Abandoned after a read failure, allowed by skip_read_failures
};

struct CopyOutcome {
    CopyAction action = CopyAction::Copied;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
};

/**
 * @brief Runs the engine under the retry policy and books the counters
 *
 * Only ReadFailure is retried. On success Copy, BytesCopied and
 * BytesExpected are incremented. A final ReadFailure becomes a Skip when
 * @p skip_read_failures is set; every other failure increments Fail and
 * BytesFailed and is returned unchanged.
 */
dcp::Result<CopyOutcome, CopyError> copy_with_retries(const StagingCopyEngine& engine,
                                                      const storage::FileStatus& source,
                                                      const std::filesystem::path& target,
                                                      const CopyAttributes& attributes,
                                                      const CopyOptions& options,
                                                      TaskContext& context,
                                                      const RetryPolicy& policy,
                                                      bool skip_read_failures);

} // namespace dcp::copy
