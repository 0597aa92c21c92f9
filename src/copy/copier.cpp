#include "dcp/copy/copier.hpp"

#include <spdlog/spdlog.h>

namespace dcp::copy {

dcp::Result<CopyOutcome, CopyError> copy_with_retries(const StagingCopyEngine& engine,
                                                      const storage::FileStatus& source,
                                                      const std::filesystem::path& target,
                                                      const CopyAttributes& attributes,
                                                      const CopyOptions& options,
                                                      TaskContext& context,
                                                      const RetryPolicy& policy,
                                                      bool skip_read_failures) {
    std::uint32_t attempts = 0;
    auto result = retry(
        [&] {
            ++attempts;
            return engine.copy(source, target, attributes, options, context);
        },
        [](const CopyError& error) { return is_retriable(error); },
        policy);

    CopyOutcome outcome;
    outcome.attempts = attempts;

    if (result.is_ok()) {
        outcome.action = CopyAction::Copied;
        outcome.bytes = result.value();
        increment_counter_safely(context, Counter::Copy, 1);
        increment_counter_safely(context, Counter::BytesCopied, outcome.bytes);
        increment_counter_safely(context, Counter::BytesExpected, source.length);
        return dcp::OkValue<CopyOutcome>(outcome);
    }

    const CopyError& error = result.error();
    if (skip_read_failures && error.kind == CopyErrorKind::ReadFailure) {
        spdlog::warn("Skipping {} after {} attempt(s): {}", source.path.string(), attempts, error.describe());
        outcome.action = CopyAction::Skipped;
        increment_counter_safely(context, Counter::Skip, 1);
        increment_counter_safely(context, Counter::BytesSkipped, source.length);
        return dcp::OkValue<CopyOutcome>(outcome);
    }

    spdlog::error("Failure in copying {} to {}: {}", source.path.string(), target.string(), error.describe());
    increment_counter_safely(context, Counter::Fail, 1);
    increment_counter_safely(context, Counter::BytesFailed, source.length);
    return dcp::Err<CopyOutcome>(error);
}

} // namespace dcp::copy
