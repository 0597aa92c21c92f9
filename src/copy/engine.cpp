#include "dcp/copy/engine.hpp"

#include "dcp/copy/checksum_verifier.hpp"
#include "dcp/copy/progress.hpp"
#include "dcp/copy/throttled_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace dcp::copy {
namespace fs = std::filesystem;

namespace {

using BytesResult = dcp::Result<std::uint64_t, CopyError>;
using VoidResult = dcp::Result<void, CopyError>;

VoidResult fail(CopyErrorKind kind, std::string step, std::string cause) {
    return dcp::Err<void>(make_copy_error(kind, std::move(step), std::move(cause)));
}

BytesResult fail_bytes(CopyErrorKind kind, std::string step, std::string cause) {
    return dcp::Err<std::uint64_t>(make_copy_error(kind, std::move(step), std::move(cause)));
}

std::int16_t replication_for(const CopyAttributes& attributes,
                             const storage::FileStatus& source,
                             const storage::StorageBackend& target_fs) {
    return attributes.contains(FileAttribute::Replication) ? source.replication
                                                           : target_fs.default_replication();
}

std::uint64_t block_size_for(const CopyAttributes& attributes,
                             const storage::FileStatus& source,
                             const storage::StorageBackend& target_fs) {
    return attributes.contains(FileAttribute::BlockSize) ? source.block_size
                                                         : target_fs.default_block_size();
}

// "/dst/work/" and "/dst/work" name the same directory
fs::path without_trailing_separator(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

// Removes the temp file when the attempt ends, whichever way it ends
class TempFileGuard {
public:
    TempFileGuard(storage::StorageBackend& backend, fs::path temp)
        : backend_(backend), temp_(std::move(temp)) {}

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    ~TempFileGuard() {
        auto present = backend_.exists(temp_);
        if (present.is_error()) {
            spdlog::warn("Could not check temp file {}: {}", temp_.string(), present.error());
            return;
        }
        if (!present.value()) {
            return;
        }
        auto removed = backend_.remove(temp_, false);
        if (removed.is_error()) {
            spdlog::warn("Could not delete temp file {}: {}", temp_.string(), removed.error());
        } else {
            spdlog::debug("Deleted temp file {}", temp_.string());
        }
    }

private:
    storage::StorageBackend& backend_;
    fs::path temp_;
};

} // namespace

StagingCopyEngine::StagingCopyEngine(storage::StorageBackend& source_fs, storage::StorageBackend& target_fs)
    : source_fs_(source_fs), target_fs_(target_fs) {}

fs::path StagingCopyEngine::temp_path(const fs::path& target,
                                      const fs::path& work_path,
                                      const std::string& attempt_id) {
    const fs::path target_dir = without_trailing_separator(target);
    const fs::path work_dir = without_trailing_separator(work_path);
    fs::path root;
    if (work_dir.empty()) {
        root = target_dir.parent_path();
    } else if (target_dir == work_dir) {
        root = work_dir.parent_path();
    } else {
        root = work_dir;
    }
    return root / (std::string(kTempPrefix) + attempt_id);
}

BytesResult StagingCopyEngine::copy(const storage::FileStatus& source,
                                    const fs::path& target,
                                    const CopyAttributes& attributes,
                                    const CopyOptions& options,
                                    TaskContext& context) const {
    const std::string& attempt_id = context.attempt_id();
    if (attempt_id.empty() || attempt_id.find('/') != std::string::npos) {
        auto error = make_copy_error(CopyErrorKind::WriteFailure, "temp-path",
                                     "attempt id must be non-empty and free of '/': '" + attempt_id + "'");
        error.source = source.path;
        error.target = target;
        return dcp::Err<std::uint64_t>(std::move(error));
    }

    const fs::path temp = temp_path(target, options.work_path, attempt_id);
    const std::string description = "Copying " + source.path.string() + " to " + target.string();

    spdlog::debug("{}", description);
    spdlog::info("Creating temp file: {}", temp.string());

    TempFileGuard guard(target_fs_, temp);

    auto annotate = [&](CopyError error) {
        error.source = source.path;
        error.target = target;
        error.temp = temp;
        spdlog::error("Copy failed: {}", error.describe());
        return error;
    };

    auto copied = copy_to_temp(source, temp, attributes, options, context, description);
    if (copied.is_error()) {
        return dcp::Err<std::uint64_t>(annotate(copied.error()));
    }
    const std::uint64_t bytes = copied.value();

    if (auto res = compare_lengths(source, temp, bytes); res.is_error()) {
        return dcp::Err<std::uint64_t>(annotate(res.error()));
    }

    if (bytes > 0 && options.checksum_mode == ChecksumMode::Verify) {
        if (auto res = compare_checksums(source, temp); res.is_error()) {
            return dcp::Err<std::uint64_t>(annotate(res.error()));
        }
    }

    if (auto res = promote(target_fs_, temp, target); res.is_error()) {
        return dcp::Err<std::uint64_t>(annotate(res.error()));
    }

    spdlog::debug("Copied {} bytes from {} to {}", bytes, source.path.string(), target.string());
    return dcp::OkValue<std::uint64_t>(bytes);
}

BytesResult StagingCopyEngine::copy_to_temp(const storage::FileStatus& source,
                                            const fs::path& temp,
                                            const CopyAttributes& attributes,
                                            const CopyOptions& options,
                                            TaskContext& context,
                                            const std::string& description) const {
    const auto replication = replication_for(attributes, source, target_fs_);
    const auto block_size = block_size_for(attributes, source, target_fs_);

    auto created = target_fs_.create(temp, true, options.buffer_size, replication, block_size);
    if (created.is_error()) {
        return fail_bytes(CopyErrorKind::WriteFailure, "create-temp", created.error());
    }
    auto out = created.take_value();

    auto copied = copy_bytes(source, *out, options, context, description);
    auto closed = out->close();
    if (copied.is_error()) {
        if (closed.is_error()) {
            spdlog::warn("Could not close output stream for {}: {}", temp.string(), closed.error());
        }
        return copied;
    }
    if (closed.is_error()) {
        spdlog::error("Could not close output stream for {}: {}", temp.string(), closed.error());
        return fail_bytes(CopyErrorKind::WriteFailure, "close-temp", closed.error());
    }
    return copied;
}

BytesResult StagingCopyEngine::copy_bytes(const storage::FileStatus& source,
                                          storage::OutputStream& out,
                                          const CopyOptions& options,
                                          TaskContext& context,
                                          const std::string& description) const {
    auto opened = source_fs_.open(source.path);
    if (opened.is_error()) {
        return fail_bytes(CopyErrorKind::ReadFailure, "open-source", opened.error());
    }

    ThrottledReader reader(opened.take_value(), options.max_bytes_per_sec);
    ProgressReporter progress(context, description, source.length);
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options.buffer_size, 1));

    std::uint64_t total = 0;
    BytesResult outcome = dcp::OkValue<std::uint64_t>(0);
    while (true) {
        auto read = reader.read(buffer.data(), buffer.size());
        if (read.is_error()) {
            outcome = fail_bytes(CopyErrorKind::ReadFailure, "read-source", read.error());
            break;
        }
        if (read.value() == 0) {
            outcome = dcp::OkValue<std::uint64_t>(total);
            break;
        }
        if (auto written = out.write(buffer.data(), read.value()); written.is_error()) {
            outcome = fail_bytes(CopyErrorKind::WriteFailure, "write-temp", written.error());
            break;
        }
        total += read.value();
        progress.report(total);
    }

    increment_counter_safely(context, Counter::SleepTimeMs,
                             static_cast<std::uint64_t>(reader.total_sleep_time().count()));
    spdlog::info("STATS: {}", reader.to_string());
    return outcome;
}

VoidResult StagingCopyEngine::compare_lengths(const storage::FileStatus& source,
                                              const fs::path& temp,
                                              std::uint64_t bytes_copied) const {
    auto source_status = source_fs_.status(source.path);
    if (source_status.is_error()) {
        return fail(CopyErrorKind::WriteFailure, "verify-length",
                    "cannot stat source: " + source_status.error());
    }
    if (source_status.value().length != bytes_copied) {
        return fail(CopyErrorKind::LengthMismatch, "verify-length",
                    "Mismatch in length of source:" + source.path.string() + " (" +
                        std::to_string(source_status.value().length) + " bytes) and bytes copied (" +
                        std::to_string(bytes_copied) + ")");
    }

    auto temp_status = target_fs_.status(temp);
    if (temp_status.is_error()) {
        return fail(CopyErrorKind::WriteFailure, "verify-length",
                    "cannot stat temp file: " + temp_status.error());
    }
    if (temp_status.value().length != bytes_copied) {
        return fail(CopyErrorKind::LengthMismatch, "verify-length",
                    "Mismatch in length of source:" + source.path.string() + " (" +
                        std::to_string(bytes_copied) + " bytes) and target:" + temp.string() + " (" +
                        std::to_string(temp_status.value().length) + " bytes)");
    }
    return {};
}

VoidResult StagingCopyEngine::compare_checksums(const storage::FileStatus& source,
                                                const fs::path& temp) const {
    auto report = ChecksumVerifier::compare(source_fs_, source.path, target_fs_, temp);
    if (report.outcome == ChecksumComparison::Equal) {
        return {};
    }
    std::string cause = "Check-sum mismatch between " + source.path.string() + " and " + temp.string();
    if (!report.detail.empty()) {
        cause += " (" + report.detail + ")";
    }
    if (report.outcome == ChecksumComparison::Unverifiable) {
        cause += "; preserve block size or skip checksum verification to copy between these backends";
    }
    return fail(CopyErrorKind::ChecksumMismatch, "verify-checksum", std::move(cause));
}

VoidResult StagingCopyEngine::promote(storage::StorageBackend& backend,
                                      const fs::path& temp,
                                      const fs::path& target) {
    const std::string prefix = "Failed to promote tmp-file:" + temp.string() + " to: " + target.string() + ": ";

    auto target_exists = backend.exists(target);
    if (target_exists.is_error()) {
        return fail(CopyErrorKind::PromotionFailure, "delete-existing", prefix + target_exists.error());
    }
    if (target_exists.value()) {
        if (auto removed = backend.remove(target, false); removed.is_error()) {
            return fail(CopyErrorKind::PromotionFailure, "delete-existing", prefix + removed.error());
        }
    }

    const auto parent = target.parent_path();
    if (!parent.empty()) {
        auto parent_exists = backend.exists(parent);
        if (parent_exists.is_error()) {
            return fail(CopyErrorKind::PromotionFailure, "create-parent", prefix + parent_exists.error());
        }
        if (!parent_exists.value()) {
            if (auto made = backend.mkdirs(parent); made.is_error()) {
                return fail(CopyErrorKind::PromotionFailure, "create-parent", prefix + made.error());
            }
        }
    }

    if (auto renamed = backend.rename(temp, target); renamed.is_error()) {
        return fail(CopyErrorKind::PromotionFailure, "rename", prefix + renamed.error());
    }
    return {};
}

} // namespace dcp::copy
